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

#include <pango/pangocairo.h>

#include <string>

enum class TextAlignment : int {
    Left,
    Centered,
    Right,
};

enum class FontStyle : int {
    Regular,
    Italic,
    Bold,
    BoldItalic,
};

struct FontParameters {
    std::string name; // Fontconfig name as a string.
    Length size = Length::from_pt(10);
    FontStyle type = FontStyle::Regular;
};

inline FontParameters sans_font(double pointsize, FontStyle style = FontStyle::Regular) {
    return FontParameters{"Sans", Length::from_pt(pointsize), style};
}

// Caller owns the layout, the description is applied and freed here.
inline void setup_pango(PangoLayout *layout, const FontParameters &par) {
    PangoFontDescription *desc = pango_font_description_from_string(par.name.c_str());
    if(par.type == FontStyle::Bold || par.type == FontStyle::BoldItalic) {
        pango_font_description_set_weight(desc, PANGO_WEIGHT_BOLD);
    } else {
        pango_font_description_set_weight(desc, PANGO_WEIGHT_NORMAL);
    }
    if(par.type == FontStyle::Italic || par.type == FontStyle::BoldItalic) {
        pango_font_description_set_style(desc, PANGO_STYLE_ITALIC);
    } else {
        pango_font_description_set_style(desc, PANGO_STYLE_NORMAL);
    }
    pango_font_description_set_absolute_size(desc, par.size.pt() * PANGO_SCALE);
    pango_layout_set_font_description(layout, desc);
    pango_font_description_free(desc);
}

// Draws text so that (x, y) is on the baseline, in cairo device units.
inline void show_text_at_baseline(
    cairo_t *cr, PangoLayout *layout, const char *text, double x, double y, TextAlignment align) {
    pango_layout_set_attributes(layout, nullptr);
    pango_layout_set_text(layout, text, -1);
    // Pango aligns by top, we want alignment by baseline.
    const double baseline = double(pango_layout_get_baseline(layout)) / PANGO_SCALE;
    PangoRectangle r;
    pango_layout_get_extents(layout, nullptr, &r);
    const double w = double(r.width) / PANGO_SCALE;
    switch(align) {
    case TextAlignment::Left:
        break;
    case TextAlignment::Centered:
        x -= w / 2;
        break;
    case TextAlignment::Right:
        x -= w;
        break;
    }
    cairo_move_to(cr, x, y - baseline);
    pango_cairo_update_layout(cr, layout);
    pango_cairo_show_layout(cr, layout);
}
