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

#include <sheetpaginator.hpp>
#include <supersets.hpp>
#include <utils.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <random>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

bool contains(const std::vector<int> &v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

std::vector<int> entry_order(const std::vector<Block> &blocks) {
    std::vector<int> ids;
    for(const auto &b : blocks) {
        ids.push_back(b.primary);
        ids.insert(ids.end(), b.partners.begin(), b.partners.end());
    }
    return ids;
}

// 200 high page, 20 header, 30 rows, 10 gaps, 40 threshold.
SheetGeometry small_page() {
    SheetGeometry g;
    g.page_height = Length::from_mm(200);
    g.top_margin = Length::zero();
    g.bottom_margin = Length::zero();
    g.header_height = Length::from_mm(20);
    g.primary_row = Length::from_mm(30);
    g.partner_row = Length::from_mm(25);
    g.single_gap = Length::from_mm(10);
    g.superset_gap = Length::from_mm(10);
    g.break_threshold = Length::from_mm(40);
    return g;
}

bool rejects_geometry(const SheetGeometry &g) {
    try {
        validate_geometry(g);
    } catch(const ConfigError &) {
        return true;
    }
    return false;
}

std::vector<Block> singles(int count) {
    std::vector<Block> blocks;
    for(int i = 1; i <= count; ++i) {
        blocks.push_back(Block{i, {}});
    }
    return blocks;
}

ExerciseCatalog sample_catalog() {
    ExerciseCatalog catalog;
    Exercise bench;
    bench.id = 1;
    bench.name = "Bench press";
    bench.sets = 4;
    bench.reps = RepTarget{6, 10};
    bench.rest_seconds = 120;
    catalog.add(bench);
    Exercise row;
    row.id = 2;
    row.name = "Cable row";
    row.reps = RepTarget{10, RepTarget::TO_FAILURE};
    row.comment = "squeeze";
    catalog.add(row);
    return catalog;
}

} // namespace

void test_pairing_symmetric() {
    const auto adj = resolve_pairs({{1, 2}, {2, 3}});
    CHECK(adj.size() == 3);
    CHECK(adj.at(1) == std::vector<int>{2});
    CHECK((adj.at(2) == std::vector<int>{1, 3}));
    CHECK(adj.at(3) == std::vector<int>{2});
    for(const auto &[id, partners] : adj) {
        for(const int p : partners) {
            CHECK(contains(adj.at(p), id));
        }
    }
}

void test_pairing_skips_malformed() {
    const auto adj = resolve_pairs({{}, {5}, {4, 4}});
    CHECK(adj.empty());
}

void test_pairing_idempotent() {
    const auto once = resolve_pairs({{1, 2}});
    const auto repeated = resolve_pairs({{1, 2}, {1, 2}, {2, 1}});
    CHECK(once == repeated);
}

void test_pairing_first_two_values() {
    const auto adj = resolve_pairs({{7, 8, 9}});
    CHECK(adj.at(7) == std::vector<int>{8});
    CHECK(adj.at(8) == std::vector<int>{7});
    CHECK(adj.find(9) == adj.end());
}

void test_sequence_basic() {
    const auto blocks = sequence_blocks({1, 2, 3, 4}, resolve_pairs({{2, 4}}));
    CHECK(blocks.size() == 3);
    CHECK(blocks[0].primary == 1);
    CHECK(blocks[0].partners.empty());
    CHECK(blocks[1].primary == 2);
    CHECK(blocks[1].partners == std::vector<int>{4});
    CHECK(blocks[2].primary == 3);
    CHECK(blocks[2].partners.empty());
    CHECK((entry_order(blocks) == std::vector<int>{1, 2, 4, 3}));
}

void test_sequence_partner_first() {
    const auto blocks = sequence_blocks({4, 1, 2}, resolve_pairs({{2, 4}}));
    CHECK((entry_order(blocks) == std::vector<int>{4, 2, 1}));
    CHECK(blocks[0].is_superset());
    CHECK(!blocks[1].is_superset());
}

void test_sequence_partner_outside_workout() {
    const auto blocks = sequence_blocks({1, 2}, resolve_pairs({{1, 5}}));
    CHECK(blocks.size() == 2);
    CHECK(blocks[0].partners.empty());
}

void test_sequence_one_hop() {
    // 3 is only paired with 2, which was already pulled in by 1.
    const auto blocks = sequence_blocks({1, 2, 3}, resolve_pairs({{1, 2}, {2, 3}}));
    CHECK(blocks.size() == 2);
    CHECK(blocks[0].primary == 1);
    CHECK(blocks[0].partners == std::vector<int>{2});
    CHECK(blocks[1].primary == 3);
    CHECK(blocks[1].partners.empty());
}

void test_sequence_multiple_partners() {
    const auto blocks = sequence_blocks({5, 1, 6, 7}, resolve_pairs({{5, 7}, {6, 5}}));
    CHECK(blocks.size() == 2);
    CHECK((blocks[0].partners == std::vector<int>{7, 6}));
    CHECK(blocks[1].primary == 1);
}

void test_sequence_duplicates() {
    const auto blocks = sequence_blocks({1, 1, 2}, AdjacencyMap{});
    CHECK((entry_order(blocks) == std::vector<int>{1, 2}));
}

void test_sequence_partition_random() {
    std::mt19937 gen(1234);
    for(int round = 0; round < 200; ++round) {
        const int n = int(gen() % 12);
        std::vector<int> exercises;
        for(int i = 0; i < n; ++i) {
            exercises.push_back(i * 3 + 1);
        }
        std::shuffle(exercises.begin(), exercises.end(), gen);
        std::vector<PairDeclaration> pairs;
        const int num_pairs = int(gen() % 6);
        for(int i = 0; i < num_pairs; ++i) {
            // Sometimes refers to ids not in the workout.
            pairs.push_back({int(gen() % 40), int(gen() % 40)});
        }
        const auto adj = resolve_pairs(pairs);
        const auto blocks = sequence_blocks(exercises, adj);
        auto ids = entry_order(blocks);
        CHECK(ids.size() == exercises.size());
        auto sorted_ids = ids;
        auto sorted_exercises = exercises;
        std::sort(sorted_ids.begin(), sorted_ids.end());
        std::sort(sorted_exercises.begin(), sorted_exercises.end());
        CHECK(sorted_ids == sorted_exercises);
        for(const auto &b : blocks) {
            for(const int p : b.partners) {
                CHECK(contains(adj.at(b.primary), p));
            }
        }
        // Blocks appear in order of the first appearance of any member.
        size_t last_first = 0;
        for(const auto &b : blocks) {
            size_t first = exercises.size();
            std::vector<int> members{b.primary};
            members.insert(members.end(), b.partners.begin(), b.partners.end());
            for(const int m : members) {
                const auto pos = size_t(
                    std::find(exercises.begin(), exercises.end(), m) - exercises.begin());
                first = std::min(first, pos);
            }
            CHECK(first >= last_first);
            last_first = first;
        }
    }
}

void test_rep_target_text() {
    CHECK((RepTarget{8, 12}.text() == "8-12"));
    CHECK((RepTarget{10, RepTarget::TO_FAILURE}.text() == "10+"));
    CHECK((RepTarget{5, {}}.text() == "5"));
}

void test_entry_fields() {
    const auto catalog = sample_catalog();
    const auto bench = make_entry(1, catalog, false);
    CHECK(bench.name == "Bench press");
    CHECK(bench.sets == 4);
    CHECK(bench.meta_line() == "6-10 reps, 120s rest");
    CHECK(!bench.is_partner);
    const auto row = make_entry(2, catalog, true);
    CHECK(row.sets == 3);
    CHECK(row.meta_line() == "10+ reps, squeeze");
    CHECK(row.is_partner);
}

void test_missing_exercise() {
    const auto catalog = sample_catalog();
    const auto e = make_entry(99, catalog, false);
    CHECK(e.exercise_id == 99);
    CHECK(e.name == "Exercise #99 (missing)");
    CHECK(e.sets == 3);
    CHECK(e.reps_text.empty());
    CHECK(e.comment.empty());
    CHECK(!e.rest_seconds);
    CHECK(e.meta_line().empty());
}

void test_break_predicate() {
    const auto g = small_page();
    CHECK(!needs_page_break(Length::from_mm(70), Length::from_mm(30), g));
    CHECK(needs_page_break(Length::from_mm(69), Length::from_mm(30), g));
    CHECK(!needs_page_break(Length::from_mm(180), Length::from_mm(30), g));
}

void test_pagination_singles() {
    const auto g = small_page();
    const auto sheet = layout_sheet("Legs", singles(5), ExerciseCatalog{}, g);
    CHECK(sheet.placements.size() == 5);
    const std::vector<int> expected_pages{0, 0, 0, 1, 1};
    const std::vector<double> expected_y{180, 140, 100, 180, 140};
    for(size_t i = 0; i < 5; ++i) {
        CHECK(sheet.placements[i].page == expected_pages[i]);
        CHECK(sheet.placements[i].y.mm() == expected_y[i]);
        CHECK(sheet.placements[i].entry.exercise_id == int(i + 1));
    }
    CHECK(sheet.num_pages() == 2);
    for(int i = 0; i < 2; ++i) {
        CHECK(sheet.headers[i].page == i);
        CHECK(sheet.headers[i].text == "Legs");
        CHECK(sheet.headers[i].y.mm() == 200);
    }
}

void test_pagination_superset_heights() {
    auto g = small_page();
    g.superset_gap = Length::from_mm(15);
    const std::vector<Block> blocks{Block{1, {2}}, Block{3, {}}};
    const auto sheet = layout_sheet("Upper", blocks, ExerciseCatalog{}, g);
    CHECK(sheet.placements.size() == 3);
    CHECK(sheet.placements[0].y.mm() == 180);
    CHECK(!sheet.placements[0].entry.is_partner);
    CHECK(sheet.placements[1].y.mm() == 150);
    CHECK(sheet.placements[1].entry.is_partner);
    CHECK(sheet.placements[2].y.mm() == 110);
    CHECK(sheet.num_pages() == 1);
}

void test_pagination_break_inside_superset() {
    auto g = small_page();
    g.break_threshold = Length::from_mm(50);
    const std::vector<Block> blocks{Block{1, {}}, Block{2, {}}, Block{3, {4}}};
    const auto sheet = layout_sheet("Full body", blocks, ExerciseCatalog{}, g);
    CHECK(sheet.placements.size() == 4);
    CHECK(sheet.placements[2].page == 0);
    CHECK(sheet.placements[2].y.mm() == 100);
    CHECK(sheet.placements[3].page == 1);
    CHECK(sheet.placements[3].y.mm() == 180);
    CHECK(sheet.placements[3].entry.exercise_id == 4);
    CHECK(sheet.num_pages() == 2);
}

void test_pagination_monotonic() {
    SheetGeometry g;
    const auto sheet = layout_sheet("Long", singles(200), ExerciseCatalog{}, g);
    CHECK(sheet.placements.size() == 200);
    int last_page = 0;
    for(const auto &p : sheet.placements) {
        CHECK(p.page >= last_page);
        CHECK(p.y - g.row_height(p.entry) >= g.bottom_margin + g.break_threshold);
        last_page = p.page;
    }
    CHECK(sheet.num_pages() == last_page + 1);
    CHECK(sheet.num_pages() > 1);
}

void test_empty_workout() {
    const auto sheet = layout_sheet("Rest day", {}, ExerciseCatalog{}, small_page());
    CHECK(sheet.placements.empty());
    CHECK(sheet.num_pages() == 1);
}

void test_invalid_geometry() {
    auto g = small_page();
    g.header_height = Length::from_mm(200);
    bool thrown = false;
    try {
        layout_sheet("Broken", singles(1), ExerciseCatalog{}, g);
    } catch(const ConfigError &) {
        thrown = true;
    }
    CHECK(thrown);

    g = small_page();
    g.partner_row = Length::zero();
    CHECK(rejects_geometry(g));

    // 180 - 30 leaves exactly the threshold, which still fits one row.
    g = small_page();
    g.break_threshold = Length::from_mm(150);
    CHECK(!rejects_geometry(g));
    g.break_threshold = Length::from_mm(151);
    CHECK(rejects_geometry(g));

    g = SheetGeometry{};
    g.break_threshold = Length::from_mm(270);
    CHECK(rejects_geometry(g));

    g = small_page();
    g.single_gap = Length::from_mm(-50);
    CHECK(rejects_geometry(g));
    g = small_page();
    g.superset_gap = Length::from_mm(-1);
    CHECK(rejects_geometry(g));
    g = small_page();
    g.bottom_margin = Length::from_mm(-10);
    CHECK(rejects_geometry(g));
    g = small_page();
    g.break_threshold = Length::from_mm(-5);
    CHECK(rejects_geometry(g));
}

void test_layout_workout_missing_partner() {
    Workout w;
    w.id = 3;
    w.exercises = {1, 99, 2};
    w.paired_sets = {{1, 99}, {3}};
    const auto sheet = layout_workout(w, sample_catalog(), small_page());
    CHECK(sheet.title == "Workout 3");
    CHECK(sheet.placements.size() == 3);
    CHECK(sheet.placements[0].entry.name == "Bench press");
    CHECK(sheet.placements[1].entry.name == "Exercise #99 (missing)");
    CHECK(sheet.placements[1].entry.is_partner);
    CHECK(sheet.placements[2].entry.name == "Cable row");
    CHECK(!sheet.placements[2].entry.is_partner);
}

void test_sequencing() {
    test_pairing_symmetric();
    test_pairing_skips_malformed();
    test_pairing_idempotent();
    test_pairing_first_two_values();
    test_sequence_basic();
    test_sequence_partner_first();
    test_sequence_partner_outside_workout();
    test_sequence_one_hop();
    test_sequence_multiple_partners();
    test_sequence_duplicates();
    test_sequence_partition_random();
    test_rep_target_text();
    test_entry_fields();
    test_missing_exercise();
}

void test_pagination() {
    test_break_predicate();
    test_pagination_singles();
    test_pagination_superset_heights();
    test_pagination_break_inside_superset();
    test_pagination_monotonic();
    test_empty_workout();
    test_invalid_geometry();
    test_layout_workout_missing_partner();
}

int main(int, char **) {
    printf("Running sequencing tests.\n");
    test_sequencing();
    printf("Running pagination tests.\n");
    test_pagination();
    return 0;
}
