/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <performance.hpp>
#include <jsonutils.hpp>
#include <utils.hpp>

#include <glib.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <type_traits>

using json = nlohmann::json;

namespace {

std::optional<int> parse_int(const std::string &s) {
    int value = 0;
    const char *end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if(ec != std::errc{} || ptr != end) {
        return {};
    }
    return value;
}

std::optional<double> parse_double(const std::string &s) {
    char *end = nullptr;
    const double value = strtod(s.c_str(), &end);
    if(end == s.c_str() || *end != '\0') {
        return {};
    }
    return value;
}

template<typename T, typename F>
std::optional<std::vector<T>> parse_list(const std::string &text, F parse_item) {
    std::vector<T> result;
    for(const auto &item : split_on(text, ',')) {
        auto value = parse_item(item);
        if(!value) {
            return {};
        }
        result.push_back(*value);
    }
    return result;
}

std::string prompt_line(const char *prompt, std::istream &in) {
    printf("%s", prompt);
    fflush(stdout);
    std::string line;
    if(!std::getline(in, line)) {
        line.clear();
    }
    strip(line);
    return line;
}

template<typename T>
std::vector<T> checked_array(const json &data, const char *key) {
    auto it = data.find(key);
    if(it == data.end() || it->is_null()) {
        return {};
    }
    if(!it->is_array()) {
        throw DataError(std::string("Performance entry ") + key + " must be an array.");
    }
    std::vector<T> result;
    for(const auto &v : *it) {
        if constexpr(std::is_integral_v<T>) {
            if(!is_int_value(v)) {
                throw DataError(std::string("Performance entry ") + key +
                                " has a non-integer.");
            }
        } else {
            if(!v.is_number()) {
                throw DataError(std::string("Performance entry ") + key + " has a non-number.");
            }
        }
        result.push_back(v.get<T>());
    }
    return result;
}

} // namespace

std::optional<std::vector<int>> parse_int_list(const std::string &text) {
    return parse_list<int>(text, parse_int);
}

std::optional<std::vector<double>> parse_double_list(const std::string &text) {
    return parse_list<double>(text, parse_double);
}

std::vector<double> normalize_weights(const std::vector<int> &reps, std::vector<double> weights) {
    if(reps.empty()) {
        return {};
    }
    if(weights.size() == 1 && reps.size() > 1) {
        weights.assign(reps.size(), weights.front());
    }
    weights.resize(reps.size(), 0.0);
    return weights;
}

bool is_iso_date(const std::string &text) {
    if(text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    const auto year = parse_int(text.substr(0, 4));
    const auto month = parse_int(text.substr(5, 2));
    const auto day = parse_int(text.substr(8, 2));
    if(!year || !month || !day || *month < 1 || *month > 12 || *day < 1) {
        return false;
    }
    return g_date_valid_dmy(GDateDay(*day), GDateMonth(*month), GDateYear(*year));
}

PerformanceEntry parse_performance_entry(const json &data) {
    PerformanceEntry e;
    e.workout_id = get_int(data, "workout_id");
    e.exercise_id = get_int(data, "exercise_id");
    e.date = get_string(data, "date");
    if(!is_iso_date(e.date)) {
        throw DataError("Performance entry has an invalid date " + e.date + ".");
    }
    e.reps = checked_array<int>(data, "reps");
    e.weights = checked_array<double>(data, "weights");
    return e;
}

json performance_to_json(const PerformanceEntry &e) {
    json j;
    j["workout_id"] = e.workout_id;
    j["exercise_id"] = e.exercise_id;
    j["date"] = e.date;
    j["reps"] = e.reps;
    j["weights"] = e.weights;
    return j;
}

std::vector<PerformanceEntry> load_performance(const std::filesystem::path &path) {
    std::vector<PerformanceEntry> log;
    if(!std::filesystem::exists(path)) {
        return log;
    }
    const auto data = parse_json_file(path);
    if(!data.is_array()) {
        throw DataError(path.string() + " must contain an array of performance entries.");
    }
    for(const auto &e : data) {
        log.emplace_back(parse_performance_entry(e));
    }
    return log;
}

void save_performance(const std::filesystem::path &path,
                      const std::vector<PerformanceEntry> &log) {
    json data = json::array();
    for(const auto &e : log) {
        data.push_back(performance_to_json(e));
    }
    replace_file(path, data.dump(2) + "\n");
}

void append_performance(const std::filesystem::path &path,
                        const std::vector<PerformanceEntry> &entries) {
    auto log = load_performance(path);
    log.insert(log.end(), entries.begin(), entries.end());
    save_performance(path, log);
}

std::vector<PerformanceEntry> record_session(const Workout &w,
                                             const ExerciseCatalog &catalog,
                                             const std::string &date,
                                             std::istream &in) {
    std::vector<PerformanceEntry> rows;
    for(const int ex_id : w.exercises) {
        const Exercise *ex = catalog.find(ex_id);
        const std::string name = ex ? ex->name : "#" + std::to_string(ex_id);
        printf("\nExercise %d: %s\n", ex_id, name.c_str());

        std::optional<std::vector<int>> reps;
        while(!(reps = parse_int_list(prompt_line(
                    "  Reps (comma-separated for sets). Leave blank to mark 'finished earlier': ",
                    in)))) {
            printf("  Enter whole numbers separated by commas.\n");
        }

        std::vector<double> weights;
        if(!reps->empty()) {
            std::optional<std::vector<double>> parsed;
            while(!(parsed = parse_double_list(prompt_line(
                        "  Weights (kg) per set (comma-separated). Leave blank = 0: ", in)))) {
                printf("  Enter numbers separated by commas.\n");
            }
            weights = std::move(*parsed);
        }

        PerformanceEntry e;
        e.workout_id = w.id;
        e.exercise_id = ex_id;
        e.date = date;
        e.weights = normalize_weights(*reps, std::move(weights));
        e.reps = std::move(*reps);
        rows.emplace_back(std::move(e));
    }
    return rows;
}
