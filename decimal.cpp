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

#include "decimal.h"
#include "error.h"

#include <cmath>
#include <utility>

#include "double-conversion/double-to-string.h"
#include "double-conversion/string-to-double.h"

namespace jn {

// Exponents beyond this would only ever describe absurdly long digit
// strings, so they are rejected rather than materialized.
static const int kMaxExponent = 9999;

static const double_conversion::StringToDoubleConverter kDecimalToDouble(
  double_conversion::StringToDoubleConverter::NO_FLAGS,
  0.0,
  0.0,
  "Infinity",
  "NaN");

static bool
IsDigit(char c)
{
    return '0' <= c && c <= '9';
}

Decimal::Decimal(bool negative, std::string digits, int scale)
  : negative_(negative), digits_(std::move(digits)), scale_(scale)
{
    size_t zeros = digits_.find_first_not_of('0');
    if (zeros == std::string::npos)
        digits_ = "0";
    else if (zeros)
        digits_.erase(0, zeros);
    if (digits_ == "0")
        negative_ = false;
}

bool
Decimal::tryParse(const std::string& text, Decimal* out)
{
    size_t i = 0, n = text.size();
    bool negative = false;
    if (i < n && (text[i] == '+' || text[i] == '-'))
        negative = text[i++] == '-';
    std::string digits;
    int fraction = 0;
    while (i < n && IsDigit(text[i]))
        digits += text[i++];
    bool whole = !digits.empty();
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && IsDigit(text[i])) {
            digits += text[i++];
            ++fraction;
        }
        if (!whole && !fraction)
            return false;
    } else if (!whole) {
        return false;
    }
    long exponent = 0;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool minus = false;
        if (i < n && (text[i] == '+' || text[i] == '-'))
            minus = text[i++] == '-';
        if (i == n || !IsDigit(text[i]))
            return false;
        for (; i < n && IsDigit(text[i]); ++i) {
            exponent = exponent * 10 + (text[i] - '0');
            if (exponent > kMaxExponent)
                return false;
        }
        if (minus)
            exponent = -exponent;
    }
    if (i != n)
        return false;
    long scale = fraction - exponent;
    if (scale < 0) {
        digits.append(static_cast<size_t>(-scale), '0');
        scale = 0;
    }
    *out = Decimal(negative, std::move(digits), static_cast<int>(scale));
    return true;
}

Decimal
Decimal::parse(const std::string& text)
{
    Decimal result;
    if (!tryParse(text, &result))
        throw CoercionError("not a decimal number: \"" + text + "\"",
                            "Decimal");
    return result;
}

Decimal
Decimal::fromLong(long long value)
{
    unsigned long long magnitude =
      value < 0 ? 0 - (unsigned long long)value : (unsigned long long)value;
    return Decimal(value < 0, std::to_string(magnitude), 0);
}

Decimal
Decimal::fromDouble(double value)
{
    if (!std::isfinite(value))
        throw CoercionError("non-finite number has no decimal form",
                            "Decimal");
    char buf[double_conversion::DoubleToStringConverter::kBase10MaximalLength +
             1];
    bool sign;
    int length, point;
    double_conversion::DoubleToStringConverter::DoubleToAscii(
      value,
      double_conversion::DoubleToStringConverter::SHORTEST,
      0,
      buf,
      sizeof(buf),
      &sign,
      &length,
      &point);
    // buf holds the digits d1..dn of 0.d1..dn * 10^point
    std::string digits(buf, length);
    int scale = length - point;
    if (scale < 0) {
        digits.append(-scale, '0');
        scale = 0;
    }
    return Decimal(sign, std::move(digits), scale);
}

std::string
Decimal::toString() const
{
    std::string s;
    if (negative_)
        s += '-';
    if (!scale_)
        return s + digits_;
    std::string padded = digits_;
    if (padded.size() <= static_cast<size_t>(scale_))
        padded.insert(0, scale_ + 1 - padded.size(), '0');
    s.append(padded, 0, padded.size() - scale_);
    s += '.';
    s.append(padded, padded.size() - scale_, std::string::npos);
    return s;
}

double
Decimal::toDouble() const
{
    std::string s = negative_ ? "-" + digits_ : digits_;
    if (scale_)
        s += "e-" + std::to_string(scale_);
    int processed;
    return kDecimalToDouble.StringToDouble(s.data(), s.size(), &processed);
}

} // namespace jn
