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

#pragma once

#include <workoutdata.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

struct PerformanceEntry {
    int workout_id = 0;
    int exercise_id = 0;
    std::string date; // YYYY-MM-DD
    std::vector<int> reps;
    std::vector<double> weights; // kg, one per set.
};

// "8, 8,6" -> {8, 8, 6}. Empty optional if any item is not a number.
std::optional<std::vector<int>> parse_int_list(const std::string &text);
std::optional<std::vector<double>> parse_double_list(const std::string &text);

std::vector<double> normalize_weights(const std::vector<int> &reps, std::vector<double> weights);

bool is_iso_date(const std::string &text);

PerformanceEntry parse_performance_entry(const nlohmann::json &data);
nlohmann::json performance_to_json(const PerformanceEntry &e);

// A missing file is an empty log.
std::vector<PerformanceEntry> load_performance(const std::filesystem::path &path);

// Replaces the whole log file. An earlier log survives a failed write.
void save_performance(const std::filesystem::path &path,
                      const std::vector<PerformanceEntry> &log);

void append_performance(const std::filesystem::path &path,
                        const std::vector<PerformanceEntry> &entries);

std::vector<PerformanceEntry> record_session(const Workout &w,
                                             const ExerciseCatalog &catalog,
                                             const std::string &date,
                                             std::istream &in);
