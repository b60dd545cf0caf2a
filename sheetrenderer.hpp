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

#include <sheetcommon.hpp>
#include <sheetpaginator.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

#include <string>

struct SheetFonts {
    FontParameters title = sans_font(14, FontStyle::Bold);
    FontParameters name = sans_font(10, FontStyle::Bold);
    FontParameters meta = sans_font(7);
    FontParameters box_label = sans_font(6);
};

// Draws an already laid out sheet. All positions come from the layout.
class SheetRenderer {
public:
    explicit SheetRenderer(const char *ofname, const SheetGeometry &g, const char *title);
    ~SheetRenderer();

    SheetRenderer(const SheetRenderer &) = delete;
    SheetRenderer &operator=(const SheetRenderer &) = delete;

    void render(const SheetLayout &sheet);

    int page_num() const { return pages; }

private:
    void new_page();
    void render_header(const PageHeader &h);
    void render_entry(const Placement &p);
    void render_set_boxes(Length x, Length top, int sets);

    void render_text(const char *text,
                     const FontParameters &par,
                     Length x,
                     Length y,
                     TextAlignment alignment = TextAlignment::Left);
    void draw_box(Length x, Length y, Length w, Length h);

    // Layout coordinates grow upwards, cairo's downwards.
    double flip(Length y) const { return (geom.page_height - y).pt(); }

    const SheetGeometry &geom;
    SheetFonts fonts;
    int pages = 1;
    cairo_surface_t *surf;
    cairo_t *cr;
    PangoLayout *layout;
};

void render_sheet_pdf(const SheetLayout &sheet, const SheetGeometry &g, const char *ofname);
