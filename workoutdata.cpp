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

#include <workoutdata.hpp>
#include <jsonutils.hpp>
#include <utils.hpp>

using json = nlohmann::json;

namespace {

std::vector<int> extract_intarray(const json &data, const char *entryname) {
    std::vector<int> result;
    auto it = data.find(entryname);
    if(it == data.end() || it->is_null()) {
        return result;
    }
    if(!it->is_array()) {
        throw DataError(std::string(entryname) + " must be an array of integers.");
    }
    for(const auto &e : *it) {
        if(!is_int_value(e)) {
            throw DataError(std::string("Array ") + entryname + " has a non-integer entry.");
        }
        result.push_back(e.get<int>());
    }
    return result;
}

std::optional<RepTarget> parse_reps(const json &data) {
    const auto values = extract_intarray(data, "reps");
    if(values.empty()) {
        return {};
    }
    RepTarget r;
    r.min = values[0];
    if(values.size() > 1) {
        r.max = values[1];
    }
    return r;
}

std::vector<PairDeclaration> parse_pairs(const json &data) {
    std::vector<PairDeclaration> pairs;
    auto it = data.find("paired_sets");
    if(it == data.end() || it->is_null()) {
        return pairs;
    }
    if(!it->is_array()) {
        throw DataError("paired_sets must be an array.");
    }
    for(const auto &p : *it) {
        PairDeclaration decl;
        if(p.is_array()) {
            for(const auto &v : p) {
                if(is_int_value(v)) {
                    decl.push_back(v.get<int>());
                }
            }
        }
        // Malformed declarations are kept so that pairing can skip them.
        pairs.emplace_back(std::move(decl));
    }
    return pairs;
}

} // namespace

std::string RepTarget::text() const {
    std::string t = std::to_string(min);
    if(!max) {
        return t;
    }
    if(to_failure()) {
        return t + "+";
    }
    return t + "-" + std::to_string(*max);
}

std::string Workout::title() const {
    if(!name.empty()) {
        return name;
    }
    return "Workout " + std::to_string(id);
}

void ExerciseCatalog::add(Exercise e) {
    const int id = e.id;
    exercises.insert_or_assign(id, std::move(e));
}

const Exercise *ExerciseCatalog::find(int id) const {
    auto it = exercises.find(id);
    if(it == exercises.end()) {
        return nullptr;
    }
    return &it->second;
}

const Workout *FitnessData::find_workout(int id) const {
    for(const auto &w : workouts) {
        if(w.id == id) {
            return &w;
        }
    }
    return nullptr;
}

std::string describe_exercise(const Exercise &e) {
    std::string desc = "sets=" + std::to_string(e.sets);
    if(e.reps) {
        desc += ", reps=";
        desc += e.reps->text();
    }
    if(e.rest_seconds) {
        desc += ", rest=";
        desc += std::to_string(*e.rest_seconds);
        desc += 's';
    }
    return desc;
}

Exercise parse_exercise(const json &data) {
    Exercise e;
    e.id = get_int(data, "id");
    e.name = get_optional_string(data, "name").value_or("#" + std::to_string(e.id));
    e.sets = get_optional_int(data, "sets").value_or(DEFAULT_SETS);
    if(e.sets <= 0) {
        throw DataError("Exercise " + std::to_string(e.id) + " has a non-positive set count.");
    }
    e.reps = parse_reps(data);
    e.comment = get_optional_string(data, "comment").value_or("");
    strip(e.comment);
    e.rest_seconds = get_optional_int(data, "rest");
    if(e.rest_seconds && *e.rest_seconds < 0) {
        throw DataError("Exercise " + std::to_string(e.id) + " has a negative rest time.");
    }
    return e;
}

Workout parse_workout(const json &data) {
    Workout w;
    w.id = get_int(data, "id");
    w.name = get_optional_string(data, "name").value_or("");
    w.comment = get_optional_string(data, "comment").value_or("");
    w.exercises = extract_intarray(data, "exercises");
    w.paired_sets = parse_pairs(data);
    return w;
}

ExerciseCatalog load_exercises(const std::filesystem::path &path) {
    const auto data = parse_json_file(path);
    if(!data.is_array()) {
        throw DataError(path.string() + " must contain an array of exercises.");
    }
    ExerciseCatalog catalog;
    for(const auto &e : data) {
        catalog.add(parse_exercise(e));
    }
    return catalog;
}

std::vector<Workout> load_workouts(const std::filesystem::path &path) {
    const auto data = parse_json_file(path);
    if(!data.is_array()) {
        throw DataError(path.string() + " must contain an array of workouts.");
    }
    std::vector<Workout> workouts;
    for(const auto &w : data) {
        workouts.emplace_back(parse_workout(w));
    }
    return workouts;
}
