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

#include <units.hpp>
#include <supersets.hpp>

#include <string>
#include <vector>

// Vertical positions grow upwards from the bottom edge of the page,
// as in PDF.
struct SheetGeometry {
    Length page_width = Length::from_mm(210);
    Length page_height = Length::from_mm(297);
    Length top_margin = Length::from_mm(12);
    Length bottom_margin = Length::from_mm(12);
    Length left_margin = Length::from_mm(12);
    Length header_height = Length::from_mm(10);
    Length primary_row = Length::from_mm(8);
    Length partner_row = Length::from_mm(7);
    Length superset_gap = Length::from_mm(8);
    Length single_gap = Length::from_mm(7);
    // Minimum space that must remain below an entry.
    Length break_threshold = Length::from_mm(22);
    Length partner_indent = Length::zero();
    Length box_offset = Length::from_mm(50); // From left margin.

    Length page_top() const { return page_height - top_margin; }
    Length first_row() const { return page_top() - header_height; }

    Length row_height(const Entry &e) const { return e.is_partner ? partner_row : primary_row; }
    Length gap_after(const Block &b) const { return b.is_superset() ? superset_gap : single_gap; }
};

struct PageHeader {
    int page;
    Length y;
    std::string text;
};

struct Placement {
    int page;
    Length y;
    Entry entry;
};

struct SheetLayout {
    std::string title;
    std::vector<PageHeader> headers;
    std::vector<Placement> placements;

    int num_pages() const { return int(headers.size()); }
};

struct PageState {
    int page = 0;
    Length cursor;

    explicit PageState(const SheetGeometry &g) : cursor(g.first_row()) {}

    void new_page(const SheetGeometry &g) {
        ++page;
        cursor = g.first_row();
    }
};

// Throws ConfigError on negative or zero sizes, or if a single row
// could not fit on an empty page.
void validate_geometry(const SheetGeometry &g);

bool needs_page_break(Length cursor, Length entry_height, const SheetGeometry &g);

SheetLayout layout_sheet(const std::string &title,
                         const std::vector<Block> &blocks,
                         const ExerciseCatalog &catalog,
                         const SheetGeometry &g);

SheetLayout layout_workout(const Workout &w,
                           const ExerciseCatalog &catalog,
                           const SheetGeometry &g);
