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

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Exercise id -> directly paired partners, in the order they were declared.
typedef std::unordered_map<int, std::vector<int>> AdjacencyMap;

struct Block {
    int primary;
    std::vector<int> partners;

    bool is_superset() const { return !partners.empty(); }
};

struct Entry {
    int exercise_id = 0;
    std::string name;
    int sets = DEFAULT_SETS;
    std::string reps_text; // Empty if the exercise has no rep target.
    std::string comment;
    std::optional<int> rest_seconds;
    bool is_partner = false;

    std::string meta_line() const;
};

AdjacencyMap resolve_pairs(const std::vector<PairDeclaration> &declarations);

// Only the primary's direct partners are pulled into its block.
// A partner's own partners start their own blocks later on.
std::vector<Block> sequence_blocks(const std::vector<int> &exercises,
                                   const AdjacencyMap &adjacency);

Entry make_entry(int exercise_id, const ExerciseCatalog &catalog, bool is_partner);

std::vector<Entry> block_entries(const Block &b, const ExerciseCatalog &catalog);
