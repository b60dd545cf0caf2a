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

#include <performance.hpp>
#include <sheetcommon.hpp>
#include <workoutdata.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct ProgressPoint {
    std::string date;
    std::optional<double> avg_reps;
    std::optional<double> avg_weight;
};

// One point per date, sorted by date.
std::vector<ProgressPoint> aggregate_progress(const std::vector<PerformanceEntry> &log,
                                              int workout_id,
                                              int exercise_id);

bool has_records(const std::vector<PerformanceEntry> &log, int workout_id);

// The workout's own exercise list, or the sorted exercise ids logged for
// it when the list is empty.
std::vector<int> chart_exercises(const Workout &w, const std::vector<PerformanceEntry> &log);

class ProgressChart {
public:
    ProgressChart(int num_panels, const std::string &title);
    ~ProgressChart();

    ProgressChart(const ProgressChart &) = delete;
    ProgressChart &operator=(const ProgressChart &) = delete;

    void draw_panel(int index, const std::string &title, const std::vector<ProgressPoint> &points);

    void write_png(const std::filesystem::path &path);

private:
    void draw_text(const std::string &text,
                   const FontParameters &par,
                   double x,
                   double y,
                   TextAlignment align = TextAlignment::Left);
    void draw_series(const std::vector<ProgressPoint> &points,
                     const std::vector<double> &xs,
                     bool weights,
                     double y0,
                     double h,
                     double max_value);

    int rows;
    cairo_surface_t *surf;
    cairo_t *cr;
    PangoLayout *layout;
};

void render_progress_chart(const Workout &w,
                           const ExerciseCatalog &catalog,
                           const std::vector<PerformanceEntry> &log,
                           const std::filesystem::path &path);
