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

#include <progresschart.hpp>
#include <utils.hpp>

#include <glib.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>

namespace {

// All chart measures are in pixels.
const int columns = 2;
const double panel_w = 800;
const double panel_h = 300;
const double title_h = 50;
const double plot_left = 70;
const double plot_right = 70;
const double plot_top = 45;
const double plot_bottom = 55;
const int num_ticks = 5;
const size_t max_date_labels = 8;

struct RGB {
    double r, g, b;
};

const RGB reps_color{0.12, 0.47, 0.71};
const RGB weight_color{1.0, 0.5, 0.05};
const RGB grid_color{0.9, 0.9, 0.9};

template<typename T> std::optional<double> mean_of(const std::vector<T> &values) {
    if(values.empty()) {
        return {};
    }
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / values.size();
}

struct Accumulator {
    double reps_sum = 0;
    int reps_count = 0;
    double weight_sum = 0;
    int weight_count = 0;
};

std::vector<double> x_positions(const std::vector<ProgressPoint> &points, double x0, double w) {
    std::vector<double> days;
    for(size_t i = 0; i < points.size(); ++i) {
        const auto &d = points[i].date;
        if(!is_iso_date(d)) {
            days.clear();
            break;
        }
        GDate date;
        g_date_clear(&date, 1);
        g_date_set_dmy(&date,
                       GDateDay(std::stoi(d.substr(8, 2))),
                       GDateMonth(std::stoi(d.substr(5, 2))),
                       GDateYear(std::stoi(d.substr(0, 4))));
        days.push_back(g_date_get_julian(&date));
    }
    if(days.empty()) {
        for(size_t i = 0; i < points.size(); ++i) {
            days.push_back(double(i));
        }
    }
    std::vector<double> xs;
    const double first = days.front();
    const double span = days.back() - first;
    for(const double d : days) {
        xs.push_back(span > 0 ? x0 + w * (d - first) / span : x0 + w / 2);
    }
    return xs;
}

double axis_max(const std::vector<ProgressPoint> &points, bool weights) {
    double m = 0;
    for(const auto &p : points) {
        const auto &v = weights ? p.avg_weight : p.avg_reps;
        if(v) {
            m = std::max(m, *v);
        }
    }
    return std::max(1.0, std::ceil(m * 1.1));
}

std::string tick_label(double value) { return std::to_string(int(std::lround(value))); }

} // namespace

std::vector<ProgressPoint> aggregate_progress(const std::vector<PerformanceEntry> &log,
                                              int workout_id,
                                              int exercise_id) {
    std::map<std::string, Accumulator> by_date;
    for(const auto &e : log) {
        if(e.workout_id != workout_id || e.exercise_id != exercise_id) {
            continue;
        }
        auto &acc = by_date[e.date];
        if(const auto reps = mean_of(e.reps)) {
            acc.reps_sum += *reps;
            ++acc.reps_count;
        }
        if(const auto weight = mean_of(e.weights)) {
            acc.weight_sum += *weight;
            ++acc.weight_count;
        }
    }
    std::vector<ProgressPoint> points;
    for(const auto &[date, acc] : by_date) {
        ProgressPoint p;
        p.date = date;
        if(acc.reps_count > 0) {
            p.avg_reps = acc.reps_sum / acc.reps_count;
        }
        if(acc.weight_count > 0) {
            p.avg_weight = acc.weight_sum / acc.weight_count;
        }
        points.emplace_back(std::move(p));
    }
    return points;
}

bool has_records(const std::vector<PerformanceEntry> &log, int workout_id) {
    return std::any_of(log.begin(), log.end(), [workout_id](const PerformanceEntry &e) {
        return e.workout_id == workout_id;
    });
}

ProgressChart::ProgressChart(int num_panels, const std::string &title) {
    rows = std::max(1, (num_panels + columns - 1) / columns);
    surf = cairo_image_surface_create(
        CAIRO_FORMAT_RGB24, int(columns * panel_w), int(title_h + rows * panel_h));
    if(cairo_surface_status(surf) != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surf);
        throw std::runtime_error("Could not create chart surface.");
    }
    cr = cairo_create(surf);
    layout = pango_cairo_create_layout(cr);
    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_paint(cr);
    draw_text(title,
              sans_font(16, FontStyle::Bold),
              columns * panel_w / 2,
              32,
              TextAlignment::Centered);
}

ProgressChart::~ProgressChart() {
    g_object_unref(G_OBJECT(layout));
    cairo_destroy(cr);
    cairo_surface_destroy(surf);
}

void ProgressChart::draw_text(
    const std::string &text, const FontParameters &par, double x, double y, TextAlignment align) {
    setup_pango(layout, par);
    show_text_at_baseline(cr, layout, text.c_str(), x, y, align);
}

void ProgressChart::draw_panel(int index,
                               const std::string &title,
                               const std::vector<ProgressPoint> &points) {
    const double px = (index % columns) * panel_w;
    const double py = title_h + (index / columns) * panel_h;
    const double x0 = px + plot_left;
    const double y0 = py + plot_top;
    const double w = panel_w - plot_left - plot_right;
    const double h = panel_h - plot_top - plot_bottom;

    cairo_set_source_rgb(cr, 0, 0, 0);
    draw_text(title,
              sans_font(10, FontStyle::Bold),
              px + panel_w / 2,
              py + 20,
              TextAlignment::Centered);

    if(points.empty()) {
        cairo_set_source_rgb(cr, 0, 0, 0);
        draw_text("no data", sans_font(10), x0 + w / 2, y0 + h / 2, TextAlignment::Centered);
        return;
    }

    const double reps_max = axis_max(points, false);
    const double weight_max = axis_max(points, true);

    cairo_save(cr);
    cairo_set_line_width(cr, 1.0);
    for(int i = 0; i <= num_ticks; ++i) {
        const double frac = double(i) / num_ticks;
        const double y = y0 + h - frac * h;
        cairo_set_source_rgb(cr, grid_color.r, grid_color.g, grid_color.b);
        cairo_move_to(cr, x0, y);
        cairo_line_to(cr, x0 + w, y);
        cairo_stroke(cr);
        cairo_set_source_rgb(cr, reps_color.r, reps_color.g, reps_color.b);
        draw_text(tick_label(frac * reps_max), sans_font(8), x0 - 6, y + 3, TextAlignment::Right);
        cairo_set_source_rgb(cr, weight_color.r, weight_color.g, weight_color.b);
        draw_text(tick_label(frac * weight_max), sans_font(8), x0 + w + 6, y + 3);
    }
    cairo_set_source_rgb(cr, 0, 0, 0);
    cairo_rectangle(cr, x0, y0, w, h);
    cairo_stroke(cr);
    cairo_restore(cr);

    const auto xs = x_positions(points, x0, w);
    draw_series(points, xs, false, y0, h, reps_max);
    draw_series(points, xs, true, y0, h, weight_max);

    const size_t step = (points.size() + max_date_labels - 1) / max_date_labels;
    cairo_set_source_rgb(cr, 0, 0, 0);
    for(size_t i = 0; i < points.size(); i += step) {
        draw_text(points[i].date, sans_font(7), xs[i], y0 + h + 16, TextAlignment::Centered);
    }

    cairo_set_source_rgb(cr, reps_color.r, reps_color.g, reps_color.b);
    draw_text("avg reps", sans_font(8), x0 + 4, y0 - 6);
    cairo_set_source_rgb(cr, weight_color.r, weight_color.g, weight_color.b);
    draw_text("avg weight (kg)", sans_font(8), x0 + w - 4, y0 - 6, TextAlignment::Right);
}

void ProgressChart::draw_series(const std::vector<ProgressPoint> &points,
                                const std::vector<double> &xs,
                                bool weights,
                                double y0,
                                double h,
                                double max_value) {
    const RGB &c = weights ? weight_color : reps_color;
    cairo_save(cr);
    cairo_set_source_rgb(cr, c.r, c.g, c.b);
    cairo_set_line_width(cr, 2.0);
    bool started = false;
    for(size_t i = 0; i < points.size(); ++i) {
        const auto &v = weights ? points[i].avg_weight : points[i].avg_reps;
        if(!v) {
            continue;
        }
        const double y = y0 + h - (*v / max_value) * h;
        if(started) {
            cairo_line_to(cr, xs[i], y);
        } else {
            cairo_move_to(cr, xs[i], y);
            started = true;
        }
    }
    cairo_stroke(cr);
    for(size_t i = 0; i < points.size(); ++i) {
        const auto &v = weights ? points[i].avg_weight : points[i].avg_reps;
        if(!v) {
            continue;
        }
        const double y = y0 + h - (*v / max_value) * h;
        if(weights) {
            cairo_rectangle(cr, xs[i] - 3.5, y - 3.5, 7, 7);
        } else {
            cairo_new_sub_path(cr);
            cairo_arc(cr, xs[i], y, 4, 0, 2 * M_PI);
        }
        cairo_fill(cr);
    }
    cairo_restore(cr);
}

void ProgressChart::write_png(const std::filesystem::path &path) {
    cairo_surface_flush(surf);
    const auto status = cairo_surface_write_to_png(surf, path.c_str());
    if(status != CAIRO_STATUS_SUCCESS) {
        throw std::runtime_error("Could not write " + path.string() + ": " +
                                 cairo_status_to_string(status));
    }
}

std::vector<int> chart_exercises(const Workout &w, const std::vector<PerformanceEntry> &log) {
    if(!w.exercises.empty()) {
        return w.exercises;
    }
    std::set<int> logged;
    for(const auto &e : log) {
        if(e.workout_id == w.id) {
            logged.insert(e.exercise_id);
        }
    }
    return std::vector<int>(logged.begin(), logged.end());
}

void render_progress_chart(const Workout &w,
                           const ExerciseCatalog &catalog,
                           const std::vector<PerformanceEntry> &log,
                           const std::filesystem::path &path) {
    const auto exercise_ids = chart_exercises(w, log);
    ProgressChart chart(int(exercise_ids.size()),
                        w.title() + " (id=" + std::to_string(w.id) + ")");
    for(size_t i = 0; i < exercise_ids.size(); ++i) {
        const int ex_id = exercise_ids[i];
        std::string title;
        if(const Exercise *ex = catalog.find(ex_id)) {
            title = ex->name + " (" + describe_exercise(*ex) + ")";
        } else {
            title = "exercise " + std::to_string(ex_id);
        }
        chart.draw_panel(int(i), title, aggregate_progress(log, w.id, ex_id));
    }
    chart.write_png(path);
}
