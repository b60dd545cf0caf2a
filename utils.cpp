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

#include <utils.hpp>
#include <glib.h>

#include <fstream>
#include <sstream>
#include <time.h>

namespace {

bool is_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

} // namespace

void strip(std::string &s) {
    while(!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' ||
                         s.back() == '\r')) {
        s.pop_back();
    }
    size_t first = 0;
    while(first < s.size() && (s[first] == ' ' || s[first] == '\t' || s[first] == '\n' ||
                               s[first] == '\r')) {
        ++first;
    }
    s.erase(0, first);
}

std::vector<std::string> split_on(std::string_view in_text, char separator) {
    std::string val;
    std::vector<std::string> parts;
    std::stringstream sstream{std::string(in_text)};
    while(std::getline(sstream, val, separator)) {
        strip(val);
        if(!val.empty()) {
            parts.push_back(val);
        }
    }
    return parts;
}

std::string read_file(const std::filesystem::path &p) {
    std::ifstream input(p, std::ios::binary);
    if(input.fail()) {
        throw DataError("Could not open file " + p.string() + ".");
    }
    std::stringstream buf;
    buf << input.rdbuf();
    std::string contents = buf.str();
    if(!is_valid_utf8(contents)) {
        throw DataError("Invalid UTF-8 in " + p.string() + ".");
    }
    return contents;
}

void write_file(const std::filesystem::path &p, const std::string &contents) {
    std::ofstream ofile(p, std::ios::binary | std::ios::trunc);
    if(ofile.fail()) {
        throw DataError("Could not open file " + p.string() + " for writing.");
    }
    ofile << contents;
    ofile.close();
    if(ofile.fail()) {
        throw DataError("Could not write file " + p.string() + ".");
    }
}

void replace_file(const std::filesystem::path &p, const std::string &contents) {
    auto tmp = p;
    tmp += ".tmp";
    std::error_code ec;
    try {
        write_file(tmp, contents);
    } catch(const DataError &) {
        std::filesystem::remove(tmp, ec);
        throw;
    }
    std::filesystem::rename(tmp, p, ec);
    if(ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw DataError("Could not replace " + p.string() + ": " + ec.message());
    }
}

bool is_valid_utf8(const std::string &s) {
    return g_utf8_validate(s.c_str(), s.length(), nullptr);
}

std::string sanitize_name(const std::string &name) {
    std::string result;
    result.reserve(name.size());
    bool in_run = false;
    for(const char c : name) {
        if(is_name_char(c)) {
            result.push_back(c);
            in_run = false;
        } else if(!in_run) {
            result.push_back('_');
            in_run = true;
        }
    }
    while(!result.empty() && result.back() == '_') {
        result.pop_back();
    }
    size_t first = 0;
    while(first < result.size() && result[first] == '_') {
        ++first;
    }
    result.erase(0, first);
    return result;
}

std::string current_date() {
    char buf[200];
    time_t t;
    struct tm *tmp;
    t = time(NULL);
    tmp = localtime(&t);
    if(tmp == NULL) {
        throw std::runtime_error("Could not determine local time.");
    }

    if(strftime(buf, 200, "%Y-%m-%d", tmp) == 0) {
        throw std::runtime_error("Could not format current date.");
    }
    return std::string{buf};
}
