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
#include "datetime.h"
#include "decimal.h"
#include "identifier.h"
#include "value.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jn {

class Path;

enum class Shape
{
    Object,
    Array,
    Scalar
};

const char* ShapeToString(Shape);

// Read-only handle on one position of a decoded JSON document.
//
// Every Node shares ownership of the whole document it came from, so
// children stay valid after the root Node is gone. Nodes are cheap to
// copy and never modify the tree.
class Node
{
  public:
    // Members of an object in document order.
    using Map = std::vector<std::pair<std::string, Node>>;

    // Decodes `text` once and wraps the result. Throws DecodeError.
    static Node parse(const std::string& text);

    // Wraps a null.
    Node();
    explicit Node(Value value);
    explicit Node(std::shared_ptr<const Value> root);

    Shape shape() const noexcept;

    bool isObject() const noexcept
    {
        return shape() == Shape::Object;
    }

    bool isArray() const noexcept
    {
        return shape() == Shape::Array;
    }

    bool isScalar() const noexcept
    {
        return shape() == Shape::Scalar;
    }

    // Throws TypeMismatch unless isObject().
    Map asMap() const;

    // Throws TypeMismatch unless isArray().
    std::vector<Node> asList() const;

    // Member or element count. Throws TypeMismatch for scalars.
    size_t size() const;

    const Value& value() const
    {
        return *value_;
    }

    const Value& getValue() const
    {
        return *value_;
    }

    // Shorthand for resolve(*this, path).
    Node get(const std::string& path) const;
    Node get(const Path& path) const;

    // Coercions. Each throws TypeMismatch for objects and arrays, throws
    // CoercionError when the scalar cannot be converted, and returns an
    // empty optional when the scalar is null.
    std::optional<std::string> getBlobValue() const;
    std::optional<bool> getBooleanValue() const;
    std::optional<DateTime> getDateTimeValue() const;
    std::optional<Date> getDateValue() const;
    std::optional<Decimal> getDecimalValue() const;
    std::optional<double> getDoubleValue() const;
    std::optional<Identifier> getIdValue() const;
    std::optional<int32_t> getIntegerValue() const;
    std::optional<int64_t> getLongValue() const;
    std::optional<std::string> getStringValue() const;
    std::optional<Time> getTimeValue() const;

    bool operator==(const Node& other) const
    {
        return *value_ == *other.value_;
    }

    bool operator!=(const Node& other) const
    {
        return !(*this == other);
    }

  private:
    friend Node resolve(const Node&, const Path&);

    // Child handle that keeps `owner` alive while pointing at `value`.
    Node(const std::shared_ptr<const Value>& owner, const Value* value)
      : value_(owner, value)
    {
    }

    const Value& scalar(const char* target) const;

    std::shared_ptr<const Value> value_;
};

} // namespace jn
