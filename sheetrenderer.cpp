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

#include <sheetrenderer.hpp>
#include <utils.hpp>

#include <cairo-pdf.h>

namespace {

const Length box_w = Length::from_mm(14);
const Length box_h = Length::from_mm(8);
const Length box_gap = Length::from_mm(4);

// Offsets relative to the placement's row position.
const Length name_raise = Length::from_mm(1);
const Length meta_drop = Length::from_mm(2);
const Length box_raise = Length::from_mm(6);
const Length label_raise = Length::from_mm(1.5);

} // namespace

SheetRenderer::SheetRenderer(const char *ofname, const SheetGeometry &g, const char *title)
    : geom(g) {
    surf = cairo_pdf_surface_create(ofname, geom.page_width.pt(), geom.page_height.pt());
    if(cairo_surface_status(surf) != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surf);
        throw std::runtime_error(std::string("Could not create PDF file ") + ofname + ".");
    }
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_TITLE, title);
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_CREATOR, "workoutsheet");
    cr = cairo_create(surf);
    layout = pango_cairo_create_layout(cr);
    PangoContext *context = pango_layout_get_context(layout);
    pango_context_set_round_glyph_positions(context, FALSE);
}

SheetRenderer::~SheetRenderer() {
    g_object_unref(G_OBJECT(layout));
    cairo_destroy(cr);
    cairo_surface_destroy(surf);
}

void SheetRenderer::render(const SheetLayout &sheet) {
    size_t next = 0;
    for(const auto &header : sheet.headers) {
        while(pages <= header.page) {
            new_page();
        }
        render_header(header);
        while(next < sheet.placements.size() && sheet.placements[next].page == header.page) {
            render_entry(sheet.placements[next]);
            ++next;
        }
    }
}

void SheetRenderer::new_page() {
    cairo_surface_show_page(surf);
    ++pages;
}

void SheetRenderer::render_header(const PageHeader &h) {
    render_text(h.text.c_str(), fonts.title, geom.left_margin, h.y);
}

void SheetRenderer::render_entry(const Placement &p) {
    const auto &e = p.entry;
    const Length x = geom.left_margin + (e.is_partner ? geom.partner_indent : Length::zero());
    render_text(e.name.c_str(), fonts.name, x, p.y + name_raise);
    const auto meta = e.meta_line();
    if(!meta.empty()) {
        render_text(meta.c_str(), fonts.meta, x, p.y - meta_drop);
    }
    render_set_boxes(geom.left_margin + geom.box_offset, p.y + box_raise, e.sets);
}

void SheetRenderer::render_set_boxes(Length x, Length top, int sets) {
    const Length bottom = top - box_h;
    for(int i = 0; i < sets; ++i) {
        draw_box(x, bottom, box_w, box_h);
        render_text(
            "reps", fonts.box_label, x + box_w / 2, bottom + label_raise, TextAlignment::Centered);
        x += box_w;
        draw_box(x, bottom, box_w, box_h);
        render_text(
            "kg", fonts.box_label, x + box_w / 2, bottom + label_raise, TextAlignment::Centered);
        x += box_w + box_gap;
    }
}

void SheetRenderer::render_text(
    const char *text, const FontParameters &par, Length x, Length y, TextAlignment alignment) {
    setup_pango(layout, par);
    cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
    show_text_at_baseline(cr, layout, text, x.pt(), flip(y), alignment);
}

// (x, y) is the lower left corner.
void SheetRenderer::draw_box(Length x, Length y, Length w, Length h) {
    cairo_save(cr);
    cairo_set_line_width(cr, 1.0);
    cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
    cairo_rectangle(cr, x.pt(), flip(y + h), w.pt(), h.pt());
    cairo_stroke(cr);
    cairo_restore(cr);
}

void render_sheet_pdf(const SheetLayout &sheet, const SheetGeometry &g, const char *ofname) {
    SheetRenderer r(ofname, g, sheet.title.c_str());
    r.render(sheet);
}
