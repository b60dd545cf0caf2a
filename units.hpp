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

#include <compare>

inline double mm2pt(const double x) { return x * 2.8346456693; }
inline double pt2mm(const double x) { return x / 2.8346456693; }

// Stored in millimeters so that whole-millimeter sheet geometry
// adds up exactly.
class Length {
private:
    explicit Length(double d) : v_mm(d){};

public:
    double v_mm = 0.0;

    static Length from_mm(double val) { return Length(val); }
    static Length from_pt(double val) { return Length(pt2mm(val)); }

    Length() : v_mm(0.0) {}
    Length(const Length &d) = default;

    static Length zero() { return Length{0.0}; }

    Length operator-() const { return Length{-v_mm}; }

    Length &operator=(const Length &p) = default;

    Length &operator+=(const Length &p) {
        v_mm += p.v_mm;
        return *this;
    }

    Length &operator-=(const Length &o) {
        v_mm -= o.v_mm;
        return *this;
    }

    Length operator+(const Length &o) const { return Length{v_mm + o.v_mm}; }
    Length operator-(const Length &o) const { return Length{v_mm - o.v_mm}; }
    Length operator*(const double o) const { return Length{v_mm * o}; }
    Length operator/(const double o) const { return Length{v_mm / o}; }

    std::partial_ordering operator<=>(const Length &o) const { return v_mm <=> o.v_mm; }
    bool operator==(const Length &o) const { return v_mm == o.v_mm; }

    double pt() const { return mm2pt(v_mm); }
    double mm() const { return v_mm; }
};

inline Length operator*(const double d, const Length l) { return l * d; }
