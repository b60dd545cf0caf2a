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

#include <config.hpp>
#include <performance.hpp>
#include <progresschart.hpp>
#include <sheetpaginator.hpp>
#include <sheetrenderer.hpp>
#include <utils.hpp>
#include <workoutdata.hpp>

#include <glib.h>

#include <cstdio>
#include <cstdlib>
#include <sstream>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

using json = nlohmann::json;

namespace {

std::filesystem::path make_tempdir() {
    GError *err = nullptr;
    gchar *dir = g_dir_make_tmp("workoutsheet-XXXXXX", &err);
    if(!dir) {
        printf("Could not create temporary directory: %s\n", err->message);
        g_error_free(err);
        std::abort();
    }
    std::filesystem::path p(dir);
    g_free(dir);
    return p;
}

template<typename E, typename F> bool throws(F f) {
    try {
        f();
    } catch(const E &) {
        return true;
    }
    return false;
}

PerformanceEntry perf(int workout, int exercise, const char *date,
                      std::vector<int> reps, std::vector<double> weights) {
    return PerformanceEntry{workout, exercise, date, std::move(reps), std::move(weights)};
}

} // namespace

void test_exercise_defaults() {
    const auto e = parse_exercise(json::parse(R"({"id": 5, "name": "Squat"})"));
    CHECK(e.id == 5);
    CHECK(e.name == "Squat");
    CHECK(e.sets == 3);
    CHECK(!e.reps);
    CHECK(e.comment.empty());
    CHECK(!e.rest_seconds);
}

void test_exercise_full() {
    const auto e = parse_exercise(json::parse(
        R"({"id": 1, "name": "Bench", "sets": 4, "reps": [6, -99], "comment": "  pause  ",
            "rest": 120})"));
    CHECK(e.sets == 4);
    CHECK(e.reps);
    CHECK(e.reps->to_failure());
    CHECK(e.reps->text() == "6+");
    CHECK(e.comment == "pause");
    CHECK(e.rest_seconds == 120);
    CHECK(describe_exercise(e) == "sets=4, reps=6+, rest=120s");
}

void test_exercise_invalid() {
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"name": "No id"})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": 1, "sets": 0})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": 1, "rest": -5})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": 1, "reps": "8"})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": 4294967297})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": 2147483648})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": -2147483649})")); }));
    CHECK(throws<DataError>([] { parse_exercise(json::parse(R"({"id": 1, "reps": [8.5]})")); }));
    CHECK(parse_exercise(json::parse(R"({"id": 2147483647})")).id == 2147483647);
    CHECK(parse_exercise(json::parse(R"({"id": -2147483648})")).id == -2147483647 - 1);
}

void test_workout_pairs() {
    const auto w = parse_workout(json::parse(
        R"({"id": 2, "name": "Push", "exercises": [1, 2, 3, 4, 5],
            "paired_sets": [[1, 2], [3], "x", [4, "a", 5], null]})"));
    CHECK(w.id == 2);
    CHECK(w.title() == "Push");
    CHECK(w.exercises.size() == 5);
    CHECK(w.paired_sets.size() == 5);
    CHECK((w.paired_sets[0] == PairDeclaration{1, 2}));
    CHECK(w.paired_sets[1] == PairDeclaration{3});
    CHECK(w.paired_sets[2].empty());
    CHECK((w.paired_sets[3] == PairDeclaration{4, 5}));
    CHECK(w.paired_sets[4].empty());

    const auto big = parse_workout(json::parse(
        R"({"id": 3, "exercises": [1, 2], "paired_sets": [[1, 4294967298, 2]]})"));
    CHECK((big.paired_sets[0] == PairDeclaration{1, 2}));
    CHECK(throws<DataError>(
        [] { parse_workout(json::parse(R"({"id": 3, "exercises": [1, 5000000000]})")); }));
}

void test_project_loading() {
    const auto dir = make_tempdir();
    write_file(dir / "ex.json",
               R"([{"id": 1, "name": "Deadlift", "reps": [3, 5]},
                   {"id": 2, "name": "Pull-up", "reps": [5, -99], "rest": 90}])");
    write_file(dir / "workouts.json",
               R"([{"id": 10, "name": "Pull day", "exercises": [1, 2, 7],
                    "paired_sets": [[2, 7]]}])");
    write_file(dir / "project.json",
               R"({"exercises": "ex.json", "output_dir": "out",
                   "sheet": {"margins": {"left": 20}, "rows": {"partner": 6.5}}})");

    const auto config = load_project_json(dir / "project.json");
    CHECK(config.exercises_file == dir / "ex.json");
    CHECK(config.workouts_file == dir / "workouts.json");
    CHECK(config.performance_file == dir / "performance.json");
    CHECK(config.output_dir == dir / "out");
    CHECK(config.sheet.left_margin.mm() == 20);
    CHECK(config.sheet.partner_row.mm() == 6.5);
    CHECK(config.sheet.primary_row.mm() == 8);
    CHECK(config.sheet.page_height.mm() == 297);

    const auto data = load_fitness_data(config);
    CHECK(data.exercises.size() == 2);
    CHECK(data.exercises.find(2)->rest_seconds == 90);
    CHECK(data.exercises.find(7) == nullptr);
    CHECK(data.workouts.size() == 1);
    CHECK(data.find_workout(10));
    CHECK(!data.find_workout(11));

    write_file(dir / "bad.json", R"({"sheet": {"rows": {"header": 400}}})");
    CHECK(throws<ConfigError>([&] { load_project_json(dir / "bad.json"); }));
    write_file(dir / "broken.json", "{ not json");
    CHECK(throws<ConfigError>([&] { load_project_json(dir / "broken.json"); }));
    CHECK(throws<DataError>([&] { load_exercises(dir / "missing.json"); }));

    std::filesystem::remove_all(dir);
}

void test_list_parsing() {
    CHECK((parse_int_list("8, 8,6") == std::vector<int>{8, 8, 6}));
    CHECK(parse_int_list("")->empty());
    CHECK(parse_int_list(" , ")->empty());
    CHECK(!parse_int_list("8,x"));
    CHECK(!parse_int_list("8.5"));
    CHECK((parse_double_list("52.5, 50") == std::vector<double>{52.5, 50}));
    CHECK(!parse_double_list("heavy"));
}

void test_weight_normalization() {
    CHECK((normalize_weights({8, 8, 8}, {50}) == std::vector<double>{50, 50, 50}));
    CHECK((normalize_weights({8, 8}, {50, 60, 70}) == std::vector<double>{50, 60}));
    CHECK((normalize_weights({8, 8, 8}, {50, 60}) == std::vector<double>{50, 60, 0}));
    CHECK((normalize_weights({8, 8}, {}) == std::vector<double>{0, 0}));
    CHECK(normalize_weights({}, {50}).empty());
}

void test_dates() {
    CHECK(is_iso_date("2024-02-29"));
    CHECK(!is_iso_date("2023-02-29"));
    CHECK(!is_iso_date("2024-13-01"));
    CHECK(!is_iso_date("24-01-01"));
    CHECK(!is_iso_date("2024/01/01"));
    CHECK(is_iso_date(current_date()));
}

void test_record_session() {
    ExerciseCatalog catalog;
    catalog.add(Exercise{1, "Squat", 3, RepTarget{5, {}}, "", {}});
    Workout w;
    w.id = 4;
    w.exercises = {1, 2, 3};
    std::istringstream input("8,8,6\n"
                             "50\n"
                             "\n"
                             "x\n"
                             "10,10\n"
                             "40, 42.5, 45\n");
    const auto rows = record_session(w, catalog, "2024-05-01", input);
    CHECK(rows.size() == 3);
    CHECK(rows[0].workout_id == 4);
    CHECK(rows[0].exercise_id == 1);
    CHECK(rows[0].date == "2024-05-01");
    CHECK((rows[0].reps == std::vector<int>{8, 8, 6}));
    CHECK((rows[0].weights == std::vector<double>{50, 50, 50}));
    CHECK(rows[1].reps.empty());
    CHECK(rows[1].weights.empty());
    CHECK((rows[2].reps == std::vector<int>{10, 10}));
    CHECK((rows[2].weights == std::vector<double>{40, 42.5}));
}

void test_performance_log() {
    const auto dir = make_tempdir();
    const auto logfile = dir / "performance.json";
    CHECK(load_performance(logfile).empty());
    append_performance(logfile, {perf(1, 2, "2024-01-01", {8, 8}, {20, 20})});
    append_performance(logfile, {perf(1, 3, "2024-01-02", {}, {})});
    const auto log = load_performance(logfile);
    CHECK(log.size() == 2);
    CHECK(log[0].exercise_id == 2);
    CHECK((log[0].weights == std::vector<double>{20, 20}));
    CHECK(log[1].date == "2024-01-02");
    CHECK(log[1].reps.empty());

    auto tmpfile = logfile;
    tmpfile += ".tmp";
    CHECK(!std::filesystem::exists(tmpfile));

    // A write that cannot complete leaves the earlier log in place.
    std::filesystem::create_directory(tmpfile);
    CHECK(throws<DataError>(
        [&] { append_performance(logfile, {perf(1, 4, "2024-01-03", {5}, {80})}); }));
    CHECK(load_performance(logfile).size() == 2);

    write_file(logfile,
               R"([{"workout_id": 1, "exercise_id": 2, "date": "2024-01-01", "reps": [8.5]}])");
    CHECK(throws<DataError>([&] { load_performance(logfile); }));
    write_file(logfile, R"([{"workout_id": 1, "exercise_id": 2, "date": "yesterday"}])");
    CHECK(throws<DataError>([&] { load_performance(logfile); }));
    std::filesystem::remove_all(dir);
}

void test_progress_aggregation() {
    const std::vector<PerformanceEntry> log{
        perf(1, 1, "2024-01-02", {10, 8}, {50, 50}),
        perf(1, 1, "2024-01-01", {8}, {}),
        perf(1, 1, "2024-01-02", {6}, {60}),
        perf(1, 2, "2024-01-01", {12}, {30}),
        perf(2, 1, "2024-01-03", {1}, {100}),
        perf(1, 1, "2024-01-04", {}, {}),
    };
    const auto points = aggregate_progress(log, 1, 1);
    CHECK(points.size() == 3);
    CHECK(points[0].date == "2024-01-01");
    CHECK(points[0].avg_reps == 8.0);
    CHECK(!points[0].avg_weight);
    CHECK(points[1].date == "2024-01-02");
    CHECK(points[1].avg_reps == 7.5);
    CHECK(points[1].avg_weight == 55.0);
    CHECK(points[2].date == "2024-01-04");
    CHECK(!points[2].avg_reps);
    CHECK(!points[2].avg_weight);

    CHECK(aggregate_progress(log, 3, 1).empty());
    CHECK(has_records(log, 2));
    CHECK(!has_records(log, 3));
}

void test_chart_exercises() {
    const std::vector<PerformanceEntry> log{
        perf(1, 7, "2024-01-01", {5}, {100}),
        perf(1, 3, "2024-01-01", {8}, {40}),
        perf(2, 9, "2024-01-01", {8}, {40}),
        perf(1, 7, "2024-01-02", {5}, {105}),
    };
    Workout listed;
    listed.id = 1;
    listed.exercises = {4, 3};
    CHECK((chart_exercises(listed, log) == std::vector<int>{4, 3}));
    Workout unlisted;
    unlisted.id = 1;
    CHECK((chart_exercises(unlisted, log) == std::vector<int>{3, 7}));
    unlisted.id = 5;
    CHECK(chart_exercises(unlisted, log).empty());
}

void test_sheet_rendering() {
    const auto dir = make_tempdir();
    ExerciseCatalog catalog;
    catalog.add(Exercise{1, "Squat", 5, RepTarget{5, {}}, "low bar", 180});
    std::vector<Block> blocks;
    for(int i = 1; i <= 40; ++i) {
        blocks.push_back(Block{i, {}});
    }
    blocks.push_back(Block{41, {42, 43}});
    SheetGeometry g;
    const auto sheet = layout_sheet("Long day", blocks, catalog, g);
    CHECK(sheet.num_pages() > 1);

    const auto ofile = dir / "sheet.pdf";
    int pages = 0;
    {
        SheetRenderer renderer(ofile.c_str(), g, sheet.title.c_str());
        renderer.render(sheet);
        pages = renderer.page_num();
    }
    CHECK(pages == sheet.num_pages());
    CHECK(std::filesystem::exists(ofile));
    CHECK(std::filesystem::file_size(ofile) > 0);

    const auto empty_file = dir / "empty.pdf";
    render_sheet_pdf(layout_sheet("Rest day", {}, catalog, g), g, empty_file.c_str());
    CHECK(std::filesystem::file_size(empty_file) > 0);
    std::filesystem::remove_all(dir);
}

void test_chart_rendering() {
    const auto dir = make_tempdir();
    ExerciseCatalog catalog;
    catalog.add(Exercise{1, "Squat", 3, RepTarget{5, {}}, "", {}});
    const std::vector<PerformanceEntry> log{
        perf(1, 1, "2024-01-01", {5, 5, 5}, {100}),
        perf(1, 1, "2024-01-08", {5, 5, 4}, {105}),
        perf(1, 2, "2024-01-01", {12}, {}),
    };
    Workout w;
    w.id = 1;
    w.name = "Legs";
    const auto ofile = dir / "chart.png";
    render_progress_chart(w, catalog, log, ofile);
    CHECK(std::filesystem::exists(ofile));
    CHECK(std::filesystem::file_size(ofile) > 0);
    std::filesystem::remove_all(dir);
}

void test_sanitize() {
    CHECK(sanitize_name("Push day #1 (heavy)") == "Push_day_1_heavy");
    CHECK(sanitize_name("__legs__") == "legs");
    CHECK(sanitize_name("Upper-A_2") == "Upper-A_2");
    CHECK(sanitize_name("!!!").empty());
}

void test_loading() {
    test_exercise_defaults();
    test_exercise_full();
    test_exercise_invalid();
    test_workout_pairs();
    test_project_loading();
}

void test_performance() {
    test_list_parsing();
    test_weight_normalization();
    test_dates();
    test_record_session();
    test_performance_log();
    test_progress_aggregation();
    test_chart_exercises();
    test_sanitize();
}

void test_rendering() {
    test_sheet_rendering();
    test_chart_rendering();
}

int main(int, char **) {
    printf("Running loading tests.\n");
    test_loading();
    printf("Running performance tests.\n");
    test_performance();
    printf("Running rendering tests.\n");
    test_rendering();
    return 0;
}
