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

#include <config.hpp>
#include <performance.hpp>
#include <progresschart.hpp>
#include <sheetpaginator.hpp>
#include <sheetrenderer.hpp>
#include <supersets.hpp>
#include <utils.hpp>

#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>

namespace {

void print_usage(const char *progname) {
    printf("%s <project.json> sheet [workout-id]\n", progname);
    printf("%s <project.json> record [workout-id]\n", progname);
    printf("%s <project.json> chart\n", progname);
    printf("%s <project.json> list\n", progname);
}

std::optional<int> parse_workout_id(const char *arg) {
    const auto ids = parse_int_list(arg);
    if(!ids || ids->size() != 1) {
        return {};
    }
    return ids->front();
}

std::filesystem::path output_path(const std::filesystem::path &dir,
                                  const Workout &w,
                                  const char *extension) {
    std::string fname = "workout_" + std::to_string(w.id) + "_" + sanitize_name(w.title());
    fname += extension;
    return dir / fname;
}

int generate_sheets(const ProjectConfig &config,
                    const FitnessData &data,
                    std::optional<int> workout_id) {
    std::vector<const Workout *> to_render;
    if(workout_id) {
        if(const Workout *w = data.find_workout(*workout_id)) {
            to_render.push_back(w);
        }
    } else {
        for(const auto &w : data.workouts) {
            to_render.push_back(&w);
        }
    }
    if(to_render.empty()) {
        printf("No workouts to render.\n");
        return 0;
    }
    std::filesystem::create_directories(config.output_dir);
    for(const Workout *w : to_render) {
        const auto sheet = layout_workout(*w, data.exercises, config.sheet);
        const auto ofile = output_path(config.output_dir, *w, ".pdf");
        render_sheet_pdf(sheet, config.sheet, ofile.c_str());
        printf("written %s\n", ofile.c_str());
    }
    return 0;
}

const Workout *choose_workout(const FitnessData &data) {
    if(data.workouts.empty()) {
        printf("No workouts found.\n");
        return nullptr;
    }
    printf("Available workouts:\n");
    for(const auto &w : data.workouts) {
        printf("  %d: %s\n", w.id, w.name.c_str());
    }
    std::string line;
    while(true) {
        printf("Select workout id: ");
        fflush(stdout);
        if(!std::getline(std::cin, line)) {
            return nullptr;
        }
        strip(line);
        if(line.empty()) {
            return nullptr;
        }
        const auto id = parse_workout_id(line.c_str());
        if(!id) {
            printf("Enter a numeric id.\n");
            continue;
        }
        if(const Workout *w = data.find_workout(*id)) {
            return w;
        }
        printf("Unknown workout id.\n");
    }
}

int record_performance(const ProjectConfig &config,
                       const FitnessData &data,
                       std::optional<int> workout_id) {
    // A broken log must be reported before anything is typed in.
    auto log = load_performance(config.performance_file);
    const Workout *w = nullptr;
    if(workout_id) {
        w = data.find_workout(*workout_id);
        if(!w) {
            printf("Workout id %d not found.\n", *workout_id);
            return 1;
        }
    } else {
        w = choose_workout(data);
        if(!w) {
            printf("Aborted.\n");
            return 1;
        }
    }

    const auto today = current_date();
    std::string date;
    while(true) {
        printf("Date (YYYY-MM-DD) [default %s]: ", today.c_str());
        fflush(stdout);
        if(!std::getline(std::cin, date)) {
            date.clear();
        }
        strip(date);
        if(date.empty()) {
            date = today;
        }
        if(is_iso_date(date)) {
            break;
        }
        printf("Not a valid date.\n");
    }

    const auto rows = record_session(*w, data.exercises, date, std::cin);
    if(rows.empty()) {
        printf("No performance recorded.\n");
        return 0;
    }
    log.insert(log.end(), rows.begin(), rows.end());
    save_performance(config.performance_file, log);
    printf("Wrote %d performance rows to %s.\n", int(rows.size()), config.performance_file.c_str());
    return 0;
}

int generate_charts(const ProjectConfig &config, const FitnessData &data) {
    const auto log = load_performance(config.performance_file);
    if(log.empty()) {
        printf("No performance data found.\n");
        return 0;
    }
    const auto chart_dir = config.output_dir / "visualizations";
    std::filesystem::create_directories(chart_dir);
    for(const auto &w : data.workouts) {
        if(!has_records(log, w.id)) {
            continue;
        }
        const auto ofile = output_path(chart_dir, w, ".png");
        render_progress_chart(w, data.exercises, log, ofile);
        printf("written %s\n", ofile.c_str());
    }
    return 0;
}

void print_entry(const Entry &e) {
    const auto meta = e.meta_line();
    printf("%s%s (%d sets)%s%s\n",
           e.is_partner ? "      + " : "    ",
           e.name.c_str(),
           e.sets,
           meta.empty() ? "" : ": ",
           meta.c_str());
}

int list_workouts(const ProjectConfig &config, const FitnessData &data) {
    for(const auto &w : data.workouts) {
        const auto sheet = layout_workout(w, data.exercises, config.sheet);
        printf("%d: %s (%d exercises, %d pages)\n",
               w.id,
               w.title().c_str(),
               int(w.exercises.size()),
               sheet.num_pages());
        if(!w.comment.empty()) {
            printf("    %s\n", w.comment.c_str());
        }
        for(const auto &p : sheet.placements) {
            print_entry(p.entry);
        }
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    if(argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }
    const char *command = argv[2];
    std::optional<int> workout_id;
    if(argc == 4) {
        workout_id = parse_workout_id(argv[3]);
        if(!workout_id) {
            printf("Workout id must be an integer, not %s.\n", argv[3]);
            return 1;
        }
    }
    try {
        const auto config = load_project_json(argv[1]);
        const auto data = load_fitness_data(config);
        if(strcmp(command, "sheet") == 0) {
            return generate_sheets(config, data, workout_id);
        } else if(strcmp(command, "record") == 0) {
            return record_performance(config, data, workout_id);
        } else if(strcmp(command, "chart") == 0 && !workout_id) {
            return generate_charts(config, data);
        } else if(strcmp(command, "list") == 0 && !workout_id) {
            return list_workouts(config, data);
        }
        print_usage(argv[0]);
        return 1;
    } catch(const ConfigError &e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
    } catch(const DataError &e) {
        fprintf(stderr, "Data error: %s\n", e.what());
    } catch(const std::exception &e) {
        fprintf(stderr, "%s\n", e.what());
    }
    return 1;
}
