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

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

// True for JSON integers that fit in an int.
bool is_int_value(const nlohmann::json &value);

// All of these throw DataError on missing keys or wrong types.

nlohmann::json parse_json_file(const std::filesystem::path &path);

std::string get_string(const nlohmann::json &data, const char *key);
double get_double(const nlohmann::json &data, const char *key);
int get_int(const nlohmann::json &data, const char *key);

// Missing and null values give an empty optional.
std::optional<std::string> get_optional_string(const nlohmann::json &data, const char *key);
std::optional<double> get_optional_double(const nlohmann::json &data, const char *key);
std::optional<int> get_optional_int(const nlohmann::json &data, const char *key);
