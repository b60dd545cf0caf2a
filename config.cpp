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
#include <jsonutils.hpp>
#include <utils.hpp>

using json = nlohmann::json;

namespace {

const json empty_object = json::object();

const json &subobject(const json &data, const char *key) {
    auto it = data.find(key);
    if(it == data.end() || it->is_null()) {
        return empty_object;
    }
    if(!it->is_object()) {
        throw ConfigError(std::string("Sheet entry ") + key + " must be an object.");
    }
    return *it;
}

void read_mm(Length &target, const json &data, const char *key) {
    const auto value = get_optional_double(data, key);
    if(value) {
        target = Length::from_mm(*value);
    }
}

std::filesystem::path
relative_path(const ProjectConfig &c, const json &data, const char *key, const char *fallback) {
    return c.top_dir / get_optional_string(data, key).value_or(fallback);
}

} // namespace

SheetGeometry parse_sheet_geometry(const json &sheet) {
    SheetGeometry g;
    if(!sheet.is_object()) {
        throw ConfigError("Sheet settings must be an object.");
    }
    const auto &page = subobject(sheet, "page");
    read_mm(g.page_width, page, "width");
    read_mm(g.page_height, page, "height");

    const auto &margins = subobject(sheet, "margins");
    read_mm(g.top_margin, margins, "top");
    read_mm(g.bottom_margin, margins, "bottom");
    read_mm(g.left_margin, margins, "left");

    const auto &rows = subobject(sheet, "rows");
    read_mm(g.header_height, rows, "header");
    read_mm(g.primary_row, rows, "primary");
    read_mm(g.partner_row, rows, "partner");
    read_mm(g.superset_gap, rows, "superset_gap");
    read_mm(g.single_gap, rows, "single_gap");
    read_mm(g.break_threshold, rows, "break_threshold");
    read_mm(g.partner_indent, rows, "partner_indent");
    read_mm(g.box_offset, rows, "box_offset");

    validate_geometry(g);
    return g;
}

ProjectConfig load_project_json(const std::filesystem::path &path) {
    ProjectConfig c;
    c.top_dir = path.parent_path();
    try {
        const json data = parse_json_file(path);
        if(!data.is_object()) {
            throw ConfigError(path.string() + " must contain a JSON object.");
        }
        c.exercises_file = relative_path(c, data, "exercises", "exercises.json");
        c.workouts_file = relative_path(c, data, "workouts", "workouts.json");
        c.performance_file = relative_path(c, data, "performance", "performance.json");
        c.output_dir = relative_path(c, data, "output_dir", "output");
        auto sheet = data.find("sheet");
        if(sheet != data.end()) {
            c.sheet = parse_sheet_geometry(*sheet);
        }
    } catch(const DataError &e) {
        throw ConfigError(e.what());
    }
    return c;
}

FitnessData load_fitness_data(const ProjectConfig &config) {
    FitnessData d;
    d.exercises = load_exercises(config.exercises_file);
    d.workouts = load_workouts(config.workouts_file);
    return d;
}
