// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <string>

namespace jn {

// Arbitrary precision decimal number.
//
// The value is (-1)^negative * unscaled * 10^-scale, where unscaled is
// a string of decimal digits without leading zeros and scale is never
// negative. Trailing zeros are significant, so 1.5 and 1.50 are
// different representations of the same quantity.
class Decimal
{
  public:
    Decimal() : negative_(false), digits_("0"), scale_(0)
    {
    }

    // Accepts [+-]?(digits[.digits*]|.digits)([eE][+-]?digits)? and
    // throws CoercionError for anything else.
    static Decimal parse(const std::string& text);
    static bool tryParse(const std::string& text, Decimal* out);

    static Decimal fromLong(long long value);

    // Uses the shortest digit string that reads back as `value`.
    // Throws CoercionError for infinities and NaN.
    static Decimal fromDouble(double value);

    // Plain notation, never an exponent: "-0.0015", "1200", "1.50".
    std::string toString() const;
    double toDouble() const;

    bool isNegative() const
    {
        return negative_;
    }

    bool isZero() const
    {
        return digits_ == "0";
    }

    int scale() const
    {
        return scale_;
    }

    const std::string& unscaled() const
    {
        return digits_;
    }

    bool operator==(const Decimal& other) const
    {
        return negative_ == other.negative_ && scale_ == other.scale_ &&
               digits_ == other.digits_;
    }

    bool operator!=(const Decimal& other) const
    {
        return !(*this == other);
    }

  private:
    Decimal(bool negative, std::string digits, int scale);

    bool negative_;
    std::string digits_;
    int scale_;
};

} // namespace jn
