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
#include <utils.hpp>

#include <algorithm>

namespace {

void require_positive(const Length &l, const char *name) {
    if(!(l > Length::zero())) {
        throw ConfigError(std::string("Sheet ") + name + " must be positive.");
    }
}

void require_non_negative(const Length &l, const char *name) {
    if(l < Length::zero()) {
        throw ConfigError(std::string("Sheet ") + name + " must not be negative.");
    }
}

} // namespace

void validate_geometry(const SheetGeometry &g) {
    require_positive(g.page_width, "page width");
    require_positive(g.page_height, "page height");
    require_positive(g.primary_row, "primary row height");
    require_positive(g.partner_row, "partner row height");
    require_non_negative(g.top_margin, "top margin");
    require_non_negative(g.bottom_margin, "bottom margin");
    require_non_negative(g.left_margin, "left margin");
    require_non_negative(g.header_height, "header height");
    require_non_negative(g.superset_gap, "superset gap");
    require_non_negative(g.single_gap, "single gap");
    require_non_negative(g.break_threshold, "break threshold");
    require_non_negative(g.partner_indent, "partner indent");
    require_non_negative(g.box_offset, "box offset");
    // Every page must have room for at least one row of either kind.
    const Length tallest = std::max(g.primary_row, g.partner_row);
    if(g.first_row() - tallest < g.bottom_margin + g.break_threshold) {
        throw ConfigError("Sheet margins, header and break threshold leave no room for a row.");
    }
}

bool needs_page_break(Length cursor, Length entry_height, const SheetGeometry &g) {
    return cursor - entry_height < g.bottom_margin + g.break_threshold;
}

SheetLayout layout_sheet(const std::string &title,
                         const std::vector<Block> &blocks,
                         const ExerciseCatalog &catalog,
                         const SheetGeometry &g) {
    validate_geometry(g);
    SheetLayout result;
    result.title = title;
    PageState state(g);
    result.headers.emplace_back(PageHeader{state.page, g.page_top(), title});

    for(const auto &b : blocks) {
        for(auto &entry : block_entries(b, catalog)) {
            const Length height = g.row_height(entry);
            if(needs_page_break(state.cursor, height, g)) {
                state.new_page(g);
                result.headers.emplace_back(PageHeader{state.page, g.page_top(), title});
            }
            result.placements.emplace_back(Placement{state.page, state.cursor, std::move(entry)});
            state.cursor -= height;
        }
        state.cursor -= g.gap_after(b);
    }
    return result;
}

SheetLayout layout_workout(const Workout &w,
                           const ExerciseCatalog &catalog,
                           const SheetGeometry &g) {
    const auto adjacency = resolve_pairs(w.paired_sets);
    const auto blocks = sequence_blocks(w.exercises, adjacency);
    return layout_sheet(w.title(), blocks, catalog, g);
}
