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
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jn {

// Untyped JSON tree produced by the decoder.
//
// A Value is a tagged union over the seven JSON kinds. Objects keep
// their members in source order. Once built, a Value only exposes
// const accessors; the tree is never modified in place.
class Value
{
  public:
    enum Type
    {
        Null,
        Bool,
        Long,
        Double,
        String,
        Array,
        Object
    };

    enum Status
    {
        success,
        bad_double,
        absent_value,
        bad_negative,
        bad_exponent,
        missing_comma,
        missing_colon,
        malformed_utf8,
        depth_exceeded,
        unexpected_eof,
        overlong_ascii,
        unexpected_comma,
        unexpected_colon,
        unexpected_octal,
        trailing_content,
        illegal_character,
        invalid_hex_escape,
        overlong_utf8_0x7ff,
        overlong_utf8_0xffff,
        object_missing_value,
        illegal_utf8_character,
        invalid_unicode_escape,
        utf16_surrogate_in_utf8,
        unexpected_end_of_array,
        hex_escape_not_printable,
        invalid_escape_character,
        utf8_exceeds_utf16_range,
        unexpected_end_of_string,
        unexpected_end_of_object,
        object_key_must_be_string,
        c1_control_code_in_string,
        non_del_c0_control_code_in_string,
    };

    using ArrayType = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using ObjectType = std::vector<Member>;

    // Maximum nesting of arrays and objects accepted by parse().
    static constexpr int kMaxDepth = 20;

  private:
    Type type_;
    union
    {
        bool bool_value;
        long long long_value;
        double double_value;
        std::string string_value;
        ArrayType array_value;
        ObjectType object_value;
    };

  public:
    static const char* StatusToString(Status);
    static const char* TypeToString(Type);
    static std::pair<Status, Value> parse(const std::string&);

    Value(const Value&);
    Value(Value&&) noexcept;
    Value(unsigned long);
    Value(unsigned long long);
    Value(const char*);
    Value(const std::string&);
    Value(std::string&&);
    Value(ArrayType&&);
    Value(ObjectType&&);
    ~Value();

    Value(const std::nullptr_t = nullptr) : type_(Null)
    {
    }

    Value(bool value) : type_(Bool), bool_value(value)
    {
    }

    Value(int value) : type_(Long), long_value(value)
    {
    }

    Value(unsigned value) : type_(Long), long_value(value)
    {
    }

    Value(long value) : type_(Long), long_value(value)
    {
    }

    Value(long long value) : type_(Long), long_value(value)
    {
    }

    Value(double value) : type_(Double), double_value(value)
    {
    }

    Value(const ArrayType& value) : Value(ArrayType(value))
    {
    }

    Value(const ObjectType& value) : Value(ObjectType(value))
    {
    }

    Value& operator=(const Value&);
    Value& operator=(Value&&) noexcept;

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isNumber() const
    {
        return isLong() || isDouble();
    }

    bool isLong() const
    {
        return type_ == Long;
    }

    bool isDouble() const
    {
        return type_ == Double;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    double getNumber() const;
    long long getLong() const;
    double getDouble() const;
    const std::string& getString() const;
    const ArrayType& getArray() const;
    const ObjectType& getObject() const;

    // Returns the first member named `key`, or nullptr when this is not
    // an object or has no such member.
    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const;

    bool operator==(const Value&) const;
    bool operator!=(const Value& other) const
    {
        return !(*this == other);
    }

  private:
    void clear();
    void copyFrom(const Value&);
    void moveFrom(Value&&);
};

} // namespace jn
