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

#include "value.h"

#include <climits>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

#include "double-conversion/string-to-double.h"

#define ASCII 0
#define C0 1
#define DQUOTE 2
#define BACKSLASH 3
#define UTF8_2 4
#define UTF8_3 5
#define UTF8_4 6
#define C1 7
#define UTF8_3_E0 8
#define UTF8_3_ED 9
#define UTF8_4_F0 10
#define BADUTF8 11
#define EVILUTF8 12

#define IsCont(c) (0200 == (0300 & (c)))
#define IsSurrogate(wc) ((0xf800 & (wc)) == 0xd800)
#define IsHighSurrogate(wc) (((wc) & 0xfc00) == 0xd800)
#define IsLowSurrogate(wc) (((wc) & 0xfc00) == 0xdc00)
#define MergeUtf16(hi, lo) ((((hi) - 0xD800) << 10) + ((lo) - 0xDC00) + 0x10000)

namespace jn {

static const char kJsonStr[256] = {
    1,  1,  1,  1,  1,  1,  1,  1, // 0000 ascii (0)
    1,  1,  1,  1,  1,  1,  1,  1, // 0010
    1,  1,  1,  1,  1,  1,  1,  1, // 0020 c0 (1)
    1,  1,  1,  1,  1,  1,  1,  1, // 0030
    0,  0,  2,  0,  0,  0,  0,  0, // 0040 dquote (2)
    0,  0,  0,  0,  0,  0,  0,  0, // 0050
    0,  0,  0,  0,  0,  0,  0,  0, // 0060
    0,  0,  0,  0,  0,  0,  0,  0, // 0070
    0,  0,  0,  0,  0,  0,  0,  0, // 0100
    0,  0,  0,  0,  0,  0,  0,  0, // 0110
    0,  0,  0,  0,  0,  0,  0,  0, // 0120
    0,  0,  0,  0,  3,  0,  0,  0, // 0130 backslash (3)
    0,  0,  0,  0,  0,  0,  0,  0, // 0140
    0,  0,  0,  0,  0,  0,  0,  0, // 0150
    0,  0,  0,  0,  0,  0,  0,  0, // 0160
    0,  0,  0,  0,  0,  0,  0,  0, // 0170
    7,  7,  7,  7,  7,  7,  7,  7, // 0200 c1 (7)
    7,  7,  7,  7,  7,  7,  7,  7, // 0210
    7,  7,  7,  7,  7,  7,  7,  7, // 0220
    7,  7,  7,  7,  7,  7,  7,  7, // 0230
    11, 11, 11, 11, 11, 11, 11, 11, // 0240 stray continuation (11)
    11, 11, 11, 11, 11, 11, 11, 11, // 0250
    11, 11, 11, 11, 11, 11, 11, 11, // 0260
    11, 11, 11, 11, 11, 11, 11, 11, // 0270
    12, 12, 4,  4,  4,  4,  4,  4, // 0300 utf8-2 (4)
    4,  4,  4,  4,  4,  4,  4,  4, // 0310
    4,  4,  4,  4,  4,  4,  4,  4, // 0320 utf8-2
    4,  4,  4,  4,  4,  4,  4,  4, // 0330
    8,  5,  5,  5,  5,  5,  5,  5, // 0340 utf8-3 (5)
    5,  5,  5,  5,  5,  9,  5,  5, // 0350
    10, 6,  6,  6,  6,  11, 11, 11, // 0360 utf8-4 (6)
    11, 11, 11, 11, 11, 11, 11, 11, // 0370
};

alignas(signed char) static const signed char kHexToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0x30
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x40
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x50
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x60
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

static const double_conversion::StringToDoubleConverter kJsonToDouble(
  double_conversion::StringToDoubleConverter::ALLOW_CASE_INSENSITIVITY |
    double_conversion::StringToDoubleConverter::ALLOW_LEADING_SPACES |
    double_conversion::StringToDoubleConverter::ALLOW_TRAILING_JUNK |
    double_conversion::StringToDoubleConverter::ALLOW_TRAILING_SPACES,
  0.0,
  1.0,
  "Infinity",
  "NaN");

static bool
IsDigit(int c)
{
    return '0' <= c && c <= '9';
}

// Characters that may begin a JSON value. Used to tell a missing
// separator apart from plain garbage.
static bool
StartsValue(int c)
{
    switch (c) {
        case '"':
        case '[':
        case '{':
        case '-':
        case 't':
        case 'f':
        case 'n':
            return true;
        default:
            return IsDigit(c);
    }
}

static int
ReadHex4(const char* p)
{
    int A, B, C, D;
    if ((A = kHexToInt[p[0] & 255]) == -1 || (B = kHexToInt[p[1] & 255]) == -1 ||
        (C = kHexToInt[p[2] & 255]) == -1 || (D = kHexToInt[p[3] & 255]) == -1)
        return -1;
    return A << 12 | B << 8 | C << 4 | D;
}

static void
AppendUtf8(std::string& b, unsigned c)
{
    if (c <= 0x7f) {
        b += static_cast<char>(c);
    } else if (c <= 0x7ff) {
        b += static_cast<char>(0300 | (c >> 6));
        b += static_cast<char>(0200 | (c & 077));
    } else if (c <= 0xffff) {
        if (IsSurrogate(c))
            c = 0xfffd;
        b += static_cast<char>(0340 | (c >> 12));
        b += static_cast<char>(0200 | ((c >> 6) & 077));
        b += static_cast<char>(0200 | (c & 077));
    } else {
        b += static_cast<char>(0360 | (c >> 18));
        b += static_cast<char>(0200 | ((c >> 12) & 077));
        b += static_cast<char>(0200 | ((c >> 6) & 077));
        b += static_cast<char>(0200 | (c & 077));
    }
}

// Converts an optionally negative run of decimal digits. Returns false
// when the magnitude does not fit in a long long.
static bool
DigitsToLong(const char* p, const char* e, long long* out)
{
    bool negative = p < e && *p == '-';
    if (negative)
        ++p;
    unsigned long long limit =
      negative ? (unsigned long long)LLONG_MAX + 1 : (unsigned long long)LLONG_MAX;
    unsigned long long x = 0;
    for (; p < e; ++p) {
        unsigned d = *p - '0';
        if (x > (limit - d) / 10)
            return false;
        x = x * 10 + d;
    }
    if (negative && x)
        *out = -(long long)(x - 1) - 1;
    else
        *out = (long long)x;
    return true;
}

namespace {

class Decoder
{
  public:
    Decoder(const char* p, const char* e) : p_(p), e_(e)
    {
    }

    Value::Status document(Value& out);

  private:
    const char* p_;
    const char* e_;

    void skipSpace();
    Value::Status value(Value& out, int depth);
    Value::Status literal(Value& out);
    Value::Status number(Value& out);
    Value::Status string(std::string& b);
    Value::Status escape(std::string& b);
    Value::Status multibyte(int c, std::string& b);
    Value::Status array(Value& out, int depth);
    Value::Status object(Value& out, int depth);
    Value::Status separator(int close, Value::Status wrong_close);
};

void
Decoder::skipSpace()
{
    while (p_ < e_ &&
           (*p_ == ' ' || *p_ == '\n' || *p_ == '\r' || *p_ == '\t'))
        ++p_;
}

Value::Status
Decoder::document(Value& out)
{
    skipSpace();
    if (p_ == e_)
        return Value::absent_value;
    Value::Status status = value(out, Value::kMaxDepth);
    if (status != Value::success)
        return status;
    skipSpace();
    if (p_ != e_)
        return Value::trailing_content;
    return Value::success;
}

Value::Status
Decoder::value(Value& out, int depth)
{
    if (!depth)
        return Value::depth_exceeded;
    skipSpace();
    if (p_ == e_)
        return Value::unexpected_eof;
    switch (*p_ & 255) {
        case '{':
            return object(out, depth);
        case '[':
            return array(out, depth);
        case '"': {
            std::string b;
            Value::Status status = string(b);
            if (status == Value::success)
                out = Value(std::move(b));
            return status;
        }
        case 't':
        case 'f':
        case 'n':
            return literal(out);
        case ']':
            return Value::unexpected_end_of_array;
        case '}':
            return Value::unexpected_end_of_object;
        case ',':
            return Value::unexpected_comma;
        case ':':
            return Value::unexpected_colon;
        default:
            if (*p_ == '-' || IsDigit(*p_))
                return number(out);
            return Value::illegal_character;
    }
}

Value::Status
Decoder::literal(Value& out)
{
    size_t n = e_ - p_;
    if (n >= 4 && !memcmp(p_, "null", 4)) {
        out = Value();
        p_ += 4;
    } else if (n >= 4 && !memcmp(p_, "true", 4)) {
        out = Value(true);
        p_ += 4;
    } else if (n >= 5 && !memcmp(p_, "false", 5)) {
        out = Value(false);
        p_ += 5;
    } else {
        return Value::illegal_character;
    }
    return Value::success;
}

Value::Status
Decoder::number(Value& out)
{
    const char* a = p_;
    bool integral = true;
    if (*p_ == '-') {
        ++p_;
        if (p_ == e_ || !IsDigit(*p_))
            return Value::bad_negative;
    }
    if (*p_ == '0') {
        ++p_;
        if (p_ < e_ && IsDigit(*p_))
            return Value::unexpected_octal;
    } else {
        while (p_ < e_ && IsDigit(*p_))
            ++p_;
    }
    if (p_ < e_ && *p_ == '.') {
        ++p_;
        if (p_ == e_ || !IsDigit(*p_))
            return Value::bad_double;
        while (p_ < e_ && IsDigit(*p_))
            ++p_;
        integral = false;
    }
    if (p_ < e_ && (*p_ == 'e' || *p_ == 'E')) {
        ++p_;
        if (p_ < e_ && (*p_ == '+' || *p_ == '-'))
            ++p_;
        if (p_ == e_ || !IsDigit(*p_))
            return Value::bad_exponent;
        while (p_ < e_ && IsDigit(*p_))
            ++p_;
        integral = false;
    }
    if (integral) {
        long long x;
        if (DigitsToLong(a, p_, &x)) {
            out = Value(x);
            return Value::success;
        }
    }
    int processed;
    double d = kJsonToDouble.StringToDouble(a, p_ - a, &processed);
    if (processed != p_ - a)
        return Value::bad_double;
    out = Value(d);
    return Value::success;
}

Value::Status
Decoder::string(std::string& b)
{
    ++p_;
    for (;;) {
        if (p_ >= e_)
            return Value::unexpected_end_of_string;
        int c = *p_++ & 255;
        switch (kJsonStr[c]) {
            case ASCII:
                b += static_cast<char>(c);
                break;
            case DQUOTE:
                return Value::success;
            case BACKSLASH: {
                Value::Status status = escape(b);
                if (status != Value::success)
                    return status;
                break;
            }
            case C0:
                return Value::non_del_c0_control_code_in_string;
            case C1:
                return Value::c1_control_code_in_string;
            case EVILUTF8:
                if (p_ < e_ && IsCont(*p_))
                    return Value::overlong_ascii;
                return Value::illegal_utf8_character;
            case BADUTF8:
                return Value::illegal_utf8_character;
            default: {
                Value::Status status = multibyte(c, b);
                if (status != Value::success)
                    return status;
                break;
            }
        }
    }
}

Value::Status
Decoder::escape(std::string& b)
{
    if (p_ >= e_)
        return Value::unexpected_end_of_string;
    int c = *p_++ & 255;
    switch (c) {
        case '"':
        case '/':
        case '\\':
            b += static_cast<char>(c);
            return Value::success;
        case 'b':
            b += '\b';
            return Value::success;
        case 'f':
            b += '\f';
            return Value::success;
        case 'n':
            b += '\n';
            return Value::success;
        case 'r':
            b += '\r';
            return Value::success;
        case 't':
            b += '\t';
            return Value::success;
        case 'x': {
            int A, B;
            if (e_ - p_ < 2 || (A = kHexToInt[p_[0] & 255]) == -1 ||
                (B = kHexToInt[p_[1] & 255]) == -1)
                return Value::invalid_hex_escape;
            c = A << 4 | B;
            if (!(0x20 <= c && c <= 0x7E))
                return Value::hex_escape_not_printable;
            p_ += 2;
            b += static_cast<char>(c);
            return Value::success;
        }
        case 'u': {
            if (e_ - p_ < 4 || (c = ReadHex4(p_)) == -1)
                return Value::invalid_unicode_escape;
            if (!IsSurrogate(c)) {
                p_ += 4;
                AppendUtf8(b, c);
                return Value::success;
            }
            int u;
            if (IsHighSurrogate(c) && e_ - p_ >= 10 && p_[4] == '\\' &&
                p_[5] == 'u' && (u = ReadHex4(p_ + 6)) != -1 &&
                IsLowSurrogate(u)) {
                p_ += 10;
                AppendUtf8(b, MergeUtf16(c, u));
                return Value::success;
            }
            // Echo unpaired surrogates instead of corrupting UTF-8; the
            // hex digits are copied as ordinary characters afterwards.
            b += "\\u";
            return Value::success;
        }
        default:
            return Value::invalid_escape_character;
    }
}

// Validates one multi-byte UTF-8 sequence whose lead byte `c` has
// already been consumed, and copies it through unchanged.
Value::Status
Decoder::multibyte(int c, std::string& b)
{
    const char* lead = p_ - 1;
    int n;
    switch (kJsonStr[c]) {
        case UTF8_2:
            if (p_ < e_ && IsCont(p_[0])) {
                n = 1;
                break;
            }
            return Value::malformed_utf8;
        case UTF8_3_E0:
            if (e_ - p_ >= 2 && (p_[0] & 255) < 0240 && IsCont(p_[0]) &&
                IsCont(p_[1]))
                return Value::overlong_utf8_0x7ff;
            // fallthrough
        case UTF8_3:
            if (e_ - p_ >= 2 && IsCont(p_[0]) && IsCont(p_[1])) {
                n = 2;
                break;
            }
            return Value::malformed_utf8;
        case UTF8_3_ED:
            if (e_ - p_ >= 2 && IsCont(p_[0]) && IsCont(p_[1])) {
                if ((p_[0] & 255) >= 0240)
                    return Value::utf16_surrogate_in_utf8;
                n = 2;
                break;
            }
            return Value::malformed_utf8;
        case UTF8_4_F0:
            if (e_ - p_ >= 3 && (p_[0] & 255) < 0220 && IsCont(p_[0]) &&
                IsCont(p_[1]) && IsCont(p_[2]))
                return Value::overlong_utf8_0xffff;
            // fallthrough
        case UTF8_4:
            if (e_ - p_ >= 3 && IsCont(p_[0]) && IsCont(p_[1]) &&
                IsCont(p_[2])) {
                uint_least32_t x = (uint_least32_t)(c & 7) << 18 |
                                   (uint_least32_t)(p_[0] & 077) << 12 |
                                   (uint_least32_t)(p_[1] & 077) << 6 |
                                   (uint_least32_t)(p_[2] & 077);
                if (x > 0x10FFFF)
                    return Value::utf8_exceeds_utf16_range;
                n = 3;
                break;
            }
            return Value::malformed_utf8;
        default:
            throw std::logic_error(
              "Unhandled character category during string parsing.");
    }
    p_ += n;
    b.append(lead, n + 1);
    return Value::success;
}

// Consumes whatever follows an array element or object member.
// Returns success after a comma, absent_value after the closing
// bracket, or the error describing the unexpected character.
Value::Status
Decoder::separator(int close, Value::Status wrong_close)
{
    skipSpace();
    if (p_ == e_)
        return Value::unexpected_eof;
    int c = *p_ & 255;
    if (c == ',') {
        ++p_;
        return Value::success;
    }
    if (c == close) {
        ++p_;
        return Value::absent_value;
    }
    if (c == ']' || c == '}')
        return wrong_close;
    if (c == ':')
        return Value::unexpected_colon;
    if (StartsValue(c))
        return Value::missing_comma;
    return Value::illegal_character;
}

Value::Status
Decoder::array(Value& out, int depth)
{
    Value::ArrayType elements;
    ++p_;
    skipSpace();
    if (p_ < e_ && *p_ == ']') {
        ++p_;
        out = Value(std::move(elements));
        return Value::success;
    }
    for (;;) {
        Value element;
        Value::Status status = value(element, depth - 1);
        if (status != Value::success)
            return status;
        elements.emplace_back(std::move(element));
        status = separator(']', Value::unexpected_end_of_object);
        if (status == Value::absent_value)
            break;
        if (status != Value::success)
            return status;
    }
    out = Value(std::move(elements));
    return Value::success;
}

Value::Status
Decoder::object(Value& out, int depth)
{
    Value::ObjectType members;
    std::unordered_set<std::string> seen;
    ++p_;
    skipSpace();
    if (p_ < e_ && *p_ == '}') {
        ++p_;
        out = Value(std::move(members));
        return Value::success;
    }
    for (;;) {
        skipSpace();
        if (p_ == e_)
            return Value::unexpected_eof;
        int c = *p_ & 255;
        if (c != '"') {
            switch (c) {
                case '}':
                    return Value::unexpected_end_of_object;
                case ']':
                    return Value::unexpected_end_of_array;
                case ',':
                    return Value::unexpected_comma;
                case ':':
                    return Value::unexpected_colon;
                default:
                    if (StartsValue(c))
                        return Value::object_key_must_be_string;
                    return Value::illegal_character;
            }
        }
        std::string key;
        Value::Status status = string(key);
        if (status != Value::success)
            return status;
        skipSpace();
        if (p_ == e_)
            return Value::unexpected_eof;
        c = *p_ & 255;
        if (c != ':') {
            if (c == ',')
                return Value::unexpected_comma;
            if (c == '}')
                return Value::object_missing_value;
            if (StartsValue(c))
                return Value::missing_colon;
            return Value::illegal_character;
        }
        ++p_;
        Value member;
        status = value(member, depth - 1);
        if (status == Value::unexpected_end_of_object)
            return Value::object_missing_value;
        if (status != Value::success)
            return status;
        // Later duplicates are dropped so the first occurrence wins.
        if (seen.insert(key).second)
            members.emplace_back(std::move(key), std::move(member));
        status = separator('}', Value::unexpected_end_of_array);
        if (status == Value::absent_value)
            break;
        if (status == Value::missing_comma && *p_ != '"')
            return Value::object_key_must_be_string;
        if (status != Value::success)
            return status;
    }
    out = Value(std::move(members));
    return Value::success;
}

} // namespace

Value::Value(unsigned long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Value::Value(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Value::Value(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Value::Value(const std::string& value) : type_(String), string_value(value)
{
}

Value::Value(std::string&& value) : type_(String), string_value(std::move(value))
{
}

Value::Value(ArrayType&& value) : type_(Array), array_value(std::move(value))
{
}

Value::Value(ObjectType&& value) : type_(Object), object_value(std::move(value))
{
}

Value::~Value()
{
    if (type_ >= String)
        clear();
}

void
Value::clear()
{
    switch (type_) {
        case String:
            string_value.~basic_string();
            break;
        case Array:
            array_value.~vector();
            break;
        case Object:
            object_value.~vector();
            break;
        default:
            break;
    }
    type_ = Null;
}

void
Value::copyFrom(const Value& other)
{
    type_ = other.type_;
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(other.string_value);
            break;
        case Array:
            new (&array_value) ArrayType(other.array_value);
            break;
        case Object:
            new (&object_value) ObjectType(other.object_value);
            break;
        default:
            throw std::logic_error("Unhandled JSON type.");
    }
}

void
Value::moveFrom(Value&& other)
{
    type_ = other.type_;
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case Array:
            new (&array_value) ArrayType(std::move(other.array_value));
            break;
        case Object:
            new (&object_value) ObjectType(std::move(other.object_value));
            break;
        default:
            break;
    }
    other.clear();
}

Value::Value(const Value& other) : type_(Null)
{
    copyFrom(other);
}

Value::Value(Value&& other) noexcept : type_(Null)
{
    moveFrom(std::move(other));
}

Value&
Value::operator=(const Value& other)
{
    if (this != &other) {
        Value copy(other);
        clear();
        moveFrom(std::move(copy));
    }
    return *this;
}

Value&
Value::operator=(Value&& other) noexcept
{
    if (this != &other) {
        clear();
        moveFrom(std::move(other));
    }
    return *this;
}

bool
Value::getBool() const
{
    if (type_ != Bool)
        throw std::logic_error("JSON value is not a bool.");
    return bool_value;
}

double
Value::getNumber() const
{
    switch (type_) {
        case Long:
            return long_value;
        case Double:
            return double_value;
        default:
            throw std::logic_error("JSON value is not a number.");
    }
}

long long
Value::getLong() const
{
    if (type_ != Long)
        throw std::logic_error("JSON value is not a long.");
    return long_value;
}

double
Value::getDouble() const
{
    if (type_ != Double)
        throw std::logic_error("JSON value is not a floating-point number.");
    return double_value;
}

const std::string&
Value::getString() const
{
    if (type_ != String)
        throw std::logic_error("JSON value is not a string.");
    return string_value;
}

const Value::ArrayType&
Value::getArray() const
{
    if (type_ != Array)
        throw std::logic_error("JSON value is not an array.");
    return array_value;
}

const Value::ObjectType&
Value::getObject() const
{
    if (type_ != Object)
        throw std::logic_error("JSON value is not an object.");
    return object_value;
}

// Linear in the member count. Members live in a vector to keep
// document order and first-wins duplicates; objects in typical records
// are small enough that a side index costs more than it saves.
const Value*
Value::find(const std::string& key) const
{
    if (type_ != Object)
        return nullptr;
    for (const Member& member : object_value)
        if (member.first == key)
            return &member.second;
    return nullptr;
}

bool
Value::contains(const std::string& key) const
{
    return find(key) != nullptr;
}

bool
Value::operator==(const Value& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_) {
        case Null:
            return true;
        case Bool:
            return bool_value == other.bool_value;
        case Long:
            return long_value == other.long_value;
        case Double:
            return double_value == other.double_value;
        case String:
            return string_value == other.string_value;
        case Array:
            return array_value == other.array_value;
        case Object:
            return object_value == other.object_value;
        default:
            throw std::logic_error("Unhandled JSON type.");
    }
}

std::pair<Value::Status, Value>
Value::parse(const std::string& s)
{
    std::pair<Status, Value> res;
    Value value;
    Decoder decoder(s.data(), s.data() + s.size());
    res.first = decoder.document(value);
    if (res.first == success)
        res.second = std::move(value);
    return res;
}

const char*
Value::TypeToString(Value::Type type)
{
    switch (type) {
        case Null:
            return "null";
        case Bool:
            return "bool";
        case Long:
            return "long";
        case Double:
            return "double";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
        default:
            throw std::logic_error("Unhandled JSON type.");
    }
}

const char*
Value::StatusToString(Value::Status status)
{
    switch (status) {
        case success:
            return "success";
        case bad_double:
            return "bad_double";
        case absent_value:
            return "absent_value";
        case bad_negative:
            return "bad_negative";
        case bad_exponent:
            return "bad_exponent";
        case missing_comma:
            return "missing_comma";
        case missing_colon:
            return "missing_colon";
        case malformed_utf8:
            return "malformed_utf8";
        case depth_exceeded:
            return "depth_exceeded";
        case unexpected_eof:
            return "unexpected_eof";
        case overlong_ascii:
            return "overlong_ascii";
        case unexpected_comma:
            return "unexpected_comma";
        case unexpected_colon:
            return "unexpected_colon";
        case unexpected_octal:
            return "unexpected_octal";
        case trailing_content:
            return "trailing_content";
        case illegal_character:
            return "illegal_character";
        case invalid_hex_escape:
            return "invalid_hex_escape";
        case overlong_utf8_0x7ff:
            return "overlong_utf8_0x7ff";
        case overlong_utf8_0xffff:
            return "overlong_utf8_0xffff";
        case object_missing_value:
            return "object_missing_value";
        case illegal_utf8_character:
            return "illegal_utf8_character";
        case invalid_unicode_escape:
            return "invalid_unicode_escape";
        case utf16_surrogate_in_utf8:
            return "utf16_surrogate_in_utf8";
        case unexpected_end_of_array:
            return "unexpected_end_of_array";
        case hex_escape_not_printable:
            return "hex_escape_not_printable";
        case invalid_escape_character:
            return "invalid_escape_character";
        case utf8_exceeds_utf16_range:
            return "utf8_exceeds_utf16_range";
        case unexpected_end_of_string:
            return "unexpected_end_of_string";
        case unexpected_end_of_object:
            return "unexpected_end_of_object";
        case object_key_must_be_string:
            return "object_key_must_be_string";
        case c1_control_code_in_string:
            return "c1_control_code_in_string";
        case non_del_c0_control_code_in_string:
            return "non_del_c0_control_code_in_string";
        default:
            throw std::logic_error("Unhandled decoder status value.");
    }
}

} // namespace jn
