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

#include "error.h"
#include "node.h"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

#include "double-conversion/double-to-string.h"
#include "double-conversion/string-to-double.h"

namespace jn {

static const double_conversion::StringToDoubleConverter kStringToDouble(
  double_conversion::StringToDoubleConverter::NO_FLAGS,
  0.0,
  std::numeric_limits<double>::quiet_NaN(),
  "Infinity",
  "NaN");

static const double_conversion::DoubleToStringConverter kDoubleToString(
  double_conversion::DoubleToStringConverter::UNIQUE_ZERO |
    double_conversion::DoubleToStringConverter::EMIT_POSITIVE_EXPONENT_SIGN,
  "Infinity",
  "NaN",
  'e',
  -6,
  21,
  6,
  0);

// RFC 4648 alphabet; -1 for anything else, -2 for the pad character.
alignas(signed char) static const signed char kBase64ToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, 62, -1, -1, -1, 63, // 0x20
    52, 53, 54, 55, 56, 57, 58, 59, 60, 61, -1, -1, -1, -2, -1, -1, // 0x30
    -1, 0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  10, 11, 12, 13, 14, // 0x40
    15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, -1, -1, -1, -1, -1, // 0x50
    -1, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40, // 0x60
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

[[noreturn]] static void
Fail(const Value& value, const char* target)
{
    std::string message = "cannot convert ";
    message += Value::TypeToString(value.getType());
    if (value.isString())
        message += " \"" + value.getString() + "\"";
    message += " to ";
    message += target;
    throw CoercionError(message, target);
}

static bool
EqualsIgnoreCase(const std::string& s, const char* word)
{
    size_t i = 0;
    for (; word[i]; ++i) {
        if (i == s.size())
            return false;
        char c = s[i];
        if ('A' <= c && c <= 'Z')
            c += 'a' - 'A';
        if (c != word[i])
            return false;
    }
    return i == s.size();
}

// Accepts [+-]?[0-9]+ only, then lets strtoll do the range check.
static bool
StringToLong(const std::string& s, long long* out)
{
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
        ++i;
    if (i == s.size())
        return false;
    for (; i < s.size(); ++i)
        if (s[i] < '0' || s[i] > '9')
            return false;
    errno = 0;
    long long x = strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE)
        return false;
    *out = x;
    return true;
}

static bool
StringToDouble(const std::string& s, double* out)
{
    if (s.empty())
        return false;
    int processed = 0;
    double x = kStringToDouble.StringToDouble(
      s.data(), static_cast<int>(s.size()), &processed);
    if (processed != static_cast<int>(s.size()))
        return false;
    *out = x;
    return true;
}

// Truncates toward zero. False when not finite or outside [lo, hi].
static bool
DoubleToLong(double d, long long lo, long long hi, long long* out)
{
    if (!std::isfinite(d))
        return false;
    d = std::trunc(d);
    // 2^63 is the first double past LLONG_MAX.
    if (d < static_cast<double>(lo) || d >= 9223372036854775808.0)
        return false;
    long long x = static_cast<long long>(d);
    if (x > hi)
        return false;
    *out = x;
    return true;
}

static bool
DecodeBase64(const std::string& s, std::string* out)
{
    if (s.size() % 4)
        return false;
    std::string b;
    b.reserve(s.size() / 4 * 3);
    for (size_t i = 0; i < s.size(); i += 4) {
        int x[4];
        for (int k = 0; k < 4; ++k)
            x[k] = kBase64ToInt[s[i + k] & 255];
        bool last = i + 4 == s.size();
        if (x[0] < 0 || x[1] < 0)
            return false;
        if (x[2] == -2) {
            // xx== carries one byte; its unused bits must be zero
            if (!last || x[3] != -2 || (x[1] & 15))
                return false;
            b += static_cast<char>(x[0] << 2 | x[1] >> 4);
        } else if (x[3] == -2) {
            if (!last || x[2] < 0 || (x[2] & 3))
                return false;
            b += static_cast<char>(x[0] << 2 | x[1] >> 4);
            b += static_cast<char>((x[1] & 15) << 4 | x[2] >> 2);
        } else {
            if (x[2] < 0 || x[3] < 0)
                return false;
            b += static_cast<char>(x[0] << 2 | x[1] >> 4);
            b += static_cast<char>((x[1] & 15) << 4 | x[2] >> 2);
            b += static_cast<char>((x[2] & 3) << 6 | x[3]);
        }
    }
    *out = std::move(b);
    return true;
}

const Value&
Node::scalar(const char* target) const
{
    if (!isScalar())
        throw TypeMismatch(std::string("cannot convert ") +
                           Value::TypeToString(value_->getType()) + " to " +
                           target);
    return *value_;
}

std::optional<std::string>
Node::getBlobValue() const
{
    const Value& v = scalar("Blob");
    if (v.isNull())
        return std::nullopt;
    std::string bytes;
    if (!v.isString() || !DecodeBase64(v.getString(), &bytes))
        Fail(v, "Blob");
    return bytes;
}

std::optional<bool>
Node::getBooleanValue() const
{
    const Value& v = scalar("Boolean");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Bool:
            return v.getBool();
        case Value::String:
            if (EqualsIgnoreCase(v.getString(), "true"))
                return true;
            if (EqualsIgnoreCase(v.getString(), "false"))
                return false;
            break;
        default:
            break;
    }
    Fail(v, "Boolean");
}

std::optional<DateTime>
Node::getDateTimeValue() const
{
    const Value& v = scalar("DateTime");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long: {
            DateTime dt;
            if (DateTime::tryFromEpochMillis(v.getLong(), &dt))
                return dt;
            break;
        }
        case Value::String: {
            DateTime dt;
            if (DateTime::tryParse(v.getString(), &dt))
                return dt;
            break;
        }
        default:
            break;
    }
    Fail(v, "DateTime");
}

std::optional<Date>
Node::getDateValue() const
{
    const Value& v = scalar("Date");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long: {
            DateTime dt;
            if (DateTime::tryFromEpochMillis(v.getLong(), &dt))
                return dt.date();
            break;
        }
        case Value::String: {
            // a date-time string contributes its UTC calendar date
            DateTime dt;
            if (DateTime::tryParse(v.getString(), &dt))
                return dt.date();
            break;
        }
        default:
            break;
    }
    Fail(v, "Date");
}

std::optional<Decimal>
Node::getDecimalValue() const
{
    const Value& v = scalar("Decimal");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long:
            return Decimal::fromLong(v.getLong());
        case Value::Double:
            if (std::isfinite(v.getDouble()))
                return Decimal::fromDouble(v.getDouble());
            break;
        case Value::String: {
            Decimal d;
            if (Decimal::tryParse(v.getString(), &d))
                return d;
            break;
        }
        default:
            break;
    }
    Fail(v, "Decimal");
}

std::optional<double>
Node::getDoubleValue() const
{
    const Value& v = scalar("Double");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long:
        case Value::Double:
            return v.getNumber();
        case Value::String: {
            double d;
            if (StringToDouble(v.getString(), &d))
                return d;
            break;
        }
        default:
            break;
    }
    Fail(v, "Double");
}

std::optional<Identifier>
Node::getIdValue() const
{
    const Value& v = scalar("Identifier");
    if (v.isNull())
        return std::nullopt;
    if (!v.isString())
        Fail(v, "Identifier");
    return Identifier::parse(v.getString());
}

std::optional<int32_t>
Node::getIntegerValue() const
{
    const Value& v = scalar("Integer");
    long long x;
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long:
            x = v.getLong();
            if (x >= INT32_MIN && x <= INT32_MAX)
                return static_cast<int32_t>(x);
            break;
        case Value::Double:
            if (DoubleToLong(v.getDouble(), INT32_MIN, INT32_MAX, &x))
                return static_cast<int32_t>(x);
            break;
        case Value::String:
            if (StringToLong(v.getString(), &x) && x >= INT32_MIN &&
                x <= INT32_MAX)
                return static_cast<int32_t>(x);
            break;
        default:
            break;
    }
    Fail(v, "Integer");
}

std::optional<int64_t>
Node::getLongValue() const
{
    const Value& v = scalar("Long");
    long long x;
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long:
            return v.getLong();
        case Value::Double:
            if (DoubleToLong(v.getDouble(), INT64_MIN, INT64_MAX, &x))
                return x;
            break;
        case Value::String:
            if (StringToLong(v.getString(), &x))
                return x;
            break;
        default:
            break;
    }
    Fail(v, "Long");
}

std::optional<std::string>
Node::getStringValue() const
{
    const Value& v = scalar("String");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Bool:
            return std::string(v.getBool() ? "true" : "false");
        case Value::Long:
            return std::to_string(v.getLong());
        case Value::Double: {
            char buf[128];
            double_conversion::StringBuilder db(buf, 128);
            kDoubleToString.ToShortest(v.getDouble(), &db);
            db.Finalize();
            return std::string(buf);
        }
        case Value::String:
            return v.getString();
        default:
            throw std::logic_error("Unhandled scalar type.");
    }
}

std::optional<Time>
Node::getTimeValue() const
{
    const Value& v = scalar("Time");
    switch (v.getType()) {
        case Value::Null:
            return std::nullopt;
        case Value::Long: {
            DateTime dt;
            if (DateTime::tryFromEpochMillis(v.getLong(), &dt))
                return dt.time();
            break;
        }
        case Value::String: {
            const std::string& s = v.getString();
            // shortest date-time is YYYY-MM-DD plus a time
            if (s.size() > 10) {
                DateTime dt;
                if (DateTime::tryParse(s, &dt))
                    return dt.time();
            }
            return Time::parse(s);
        }
        default:
            break;
    }
    Fail(v, "Time");
}

} // namespace jn
