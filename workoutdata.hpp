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

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

const int DEFAULT_SETS = 3;

struct RepTarget {
    // Stored as max in the data files for "as many as you can".
    static constexpr int TO_FAILURE = -99;

    int min = 0;
    std::optional<int> max;

    bool to_failure() const { return max && *max == TO_FAILURE; }
    std::string text() const;
};

struct Exercise {
    int id = 0;
    std::string name;
    int sets = DEFAULT_SETS;
    std::optional<RepTarget> reps;
    std::string comment;
    std::optional<int> rest_seconds;
};

// Raw pair as written in the workout file. Only the first two values count.
typedef std::vector<int> PairDeclaration;

struct Workout {
    int id = 0;
    std::string name;
    std::string comment;
    std::vector<int> exercises;
    std::vector<PairDeclaration> paired_sets;

    std::string title() const;
};

class ExerciseCatalog {
public:
    void add(Exercise e);

    // Returns nullptr for unknown ids.
    const Exercise *find(int id) const;

    size_t size() const { return exercises.size(); }

private:
    std::unordered_map<int, Exercise> exercises;
};

struct FitnessData {
    ExerciseCatalog exercises;
    std::vector<Workout> workouts;

    const Workout *find_workout(int id) const;
};

std::string describe_exercise(const Exercise &e);

Exercise parse_exercise(const nlohmann::json &data);
Workout parse_workout(const nlohmann::json &data);

ExerciseCatalog load_exercises(const std::filesystem::path &path);
std::vector<Workout> load_workouts(const std::filesystem::path &path);
