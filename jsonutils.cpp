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

#include <jsonutils.hpp>
#include <utils.hpp>

#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace {

const json *lookup(const json &data, const char *key) {
    if(!data.is_object()) {
        throw DataError(std::string("Expected an object when looking up ") + key + ".");
    }
    auto it = data.find(key);
    if(it == data.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

const json &require(const json &data, const char *key) {
    const json *value = lookup(data, key);
    if(!value) {
        throw DataError(std::string("Missing required key ") + key + ".");
    }
    return *value;
}

std::string checked_string(const json &value, const char *key) {
    if(!value.is_string()) {
        throw DataError(std::string("Element ") + key + " is not a string.");
    }
    auto s = value.get<std::string>();
    if(!is_valid_utf8(s)) {
        throw DataError(std::string("Element ") + key + " is not valid UTF-8.");
    }
    return s;
}

double checked_double(const json &value, const char *key) {
    if(!value.is_number()) {
        throw DataError(std::string("Element ") + key + " is not a number.");
    }
    return value.get<double>();
}

int checked_int(const json &value, const char *key) {
    if(!is_int_value(value)) {
        throw DataError(std::string("Element ") + key + " is not an integer in range.");
    }
    return value.get<int>();
}

} // namespace

bool is_int_value(const json &value) {
    if(value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= std::uint64_t(std::numeric_limits<int>::max());
    }
    if(value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    }
    return false;
}

json parse_json_file(const std::filesystem::path &path) {
    const auto contents = read_file(path);
    try {
        return json::parse(contents);
    } catch(const json::parse_error &e) {
        throw DataError("Could not parse " + path.string() + ": " + e.what());
    }
}

std::string get_string(const json &data, const char *key) {
    return checked_string(require(data, key), key);
}

double get_double(const json &data, const char *key) {
    return checked_double(require(data, key), key);
}

int get_int(const json &data, const char *key) { return checked_int(require(data, key), key); }

std::optional<std::string> get_optional_string(const json &data, const char *key) {
    const json *value = lookup(data, key);
    if(!value) {
        return {};
    }
    return checked_string(*value, key);
}

std::optional<double> get_optional_double(const json &data, const char *key) {
    const json *value = lookup(data, key);
    if(!value) {
        return {};
    }
    return checked_double(*value, key);
}

std::optional<int> get_optional_int(const json &data, const char *key) {
    const json *value = lookup(data, key);
    if(!value) {
        return {};
    }
    return checked_int(*value, key);
}
