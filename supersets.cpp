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

#include <supersets.hpp>

#include <algorithm>
#include <unordered_set>

namespace {

void add_partner(AdjacencyMap &adjacency, int from, int to) {
    auto &partners = adjacency[from];
    if(std::find(partners.begin(), partners.end(), to) == partners.end()) {
        partners.push_back(to);
    }
}

} // namespace

std::string Entry::meta_line() const {
    std::string line;
    auto append = [&line](const std::string &part) {
        if(!line.empty()) {
            line += ", ";
        }
        line += part;
    };
    if(!reps_text.empty()) {
        append(reps_text + " reps");
    }
    if(rest_seconds) {
        append(std::to_string(*rest_seconds) + "s rest");
    }
    if(!comment.empty()) {
        append(comment);
    }
    return line;
}

AdjacencyMap resolve_pairs(const std::vector<PairDeclaration> &declarations) {
    AdjacencyMap adjacency;
    for(const auto &decl : declarations) {
        if(decl.size() < 2) {
            continue;
        }
        const int a = decl[0];
        const int b = decl[1];
        if(a == b) {
            continue;
        }
        add_partner(adjacency, a, b);
        add_partner(adjacency, b, a);
    }
    return adjacency;
}

std::vector<Block> sequence_blocks(const std::vector<int> &exercises,
                                   const AdjacencyMap &adjacency) {
    std::vector<Block> blocks;
    const std::unordered_set<int> in_workout(exercises.begin(), exercises.end());
    std::unordered_set<int> rendered;

    for(const int id : exercises) {
        if(rendered.contains(id)) {
            continue;
        }
        Block b{id, {}};
        rendered.insert(id);
        auto it = adjacency.find(id);
        if(it != adjacency.end()) {
            for(const int partner : it->second) {
                if(in_workout.contains(partner) && !rendered.contains(partner)) {
                    b.partners.push_back(partner);
                    rendered.insert(partner);
                }
            }
        }
        blocks.emplace_back(std::move(b));
    }
    return blocks;
}

Entry make_entry(int exercise_id, const ExerciseCatalog &catalog, bool is_partner) {
    Entry e;
    e.exercise_id = exercise_id;
    e.is_partner = is_partner;
    const Exercise *ex = catalog.find(exercise_id);
    if(!ex) {
        e.name = "Exercise #" + std::to_string(exercise_id) + " (missing)";
        return e;
    }
    e.name = ex->name;
    e.sets = ex->sets;
    if(ex->reps) {
        e.reps_text = ex->reps->text();
    }
    e.comment = ex->comment;
    e.rest_seconds = ex->rest_seconds;
    return e;
}

std::vector<Entry> block_entries(const Block &b, const ExerciseCatalog &catalog) {
    std::vector<Entry> entries;
    entries.reserve(1 + b.partners.size());
    entries.emplace_back(make_entry(b.primary, catalog, false));
    for(const int partner : b.partners) {
        entries.emplace_back(make_entry(partner, catalog, true));
    }
    return entries;
}
