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

#include <sheetpaginator.hpp>
#include <workoutdata.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

struct ProjectConfig {
    // All paths in the project file are relative to this.
    std::filesystem::path top_dir;
    std::filesystem::path exercises_file;
    std::filesystem::path workouts_file;
    std::filesystem::path performance_file;
    std::filesystem::path output_dir;
    SheetGeometry sheet;
};

SheetGeometry parse_sheet_geometry(const nlohmann::json &sheet);

ProjectConfig load_project_json(const std::filesystem::path &path);

FitnessData load_fitness_data(const ProjectConfig &config);
