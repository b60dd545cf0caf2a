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

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Bad project file or sheet geometry. Nothing can be produced.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad exercise, workout or performance data.
class DataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void strip(std::string &s);

std::vector<std::string> split_on(std::string_view in_text, char separator);

std::string read_file(const std::filesystem::path &p);

void write_file(const std::filesystem::path &p, const std::string &contents);

// Writes to a sibling temporary file and renames it over p, so p is
// either the old or the new contents.
void replace_file(const std::filesystem::path &p, const std::string &contents);

bool is_valid_utf8(const std::string &s);

std::string sanitize_name(const std::string &name);

std::string current_date();
