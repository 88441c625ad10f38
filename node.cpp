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

#include "node.h"
#include "error.h"
#include "path.h"

#include <stdexcept>

namespace jn {

const char*
ShapeToString(Shape shape)
{
    switch (shape) {
        case Shape::Object:
            return "object";
        case Shape::Array:
            return "array";
        case Shape::Scalar:
            return "scalar";
        default:
            throw std::logic_error("Unhandled node shape.");
    }
}

Node
Node::parse(const std::string& text)
{
    std::pair<Value::Status, Value> res = Value::parse(text);
    if (res.first != Value::success)
        throw DecodeError(res.first);
    return Node(std::move(res.second));
}

Node::Node() : value_(std::make_shared<Value>())
{
}

Node::Node(Value value) : value_(std::make_shared<Value>(std::move(value)))
{
}

Node::Node(std::shared_ptr<const Value> root) : value_(std::move(root))
{
    if (!value_)
        throw std::invalid_argument("Node needs a value to wrap.");
}

Shape
Node::shape() const noexcept
{
    switch (value_->getType()) {
        case Value::Object:
            return Shape::Object;
        case Value::Array:
            return Shape::Array;
        default:
            return Shape::Scalar;
    }
}

Node::Map
Node::asMap() const
{
    if (!value_->isObject())
        throw TypeMismatch(std::string("expected object but found ") +
                           Value::TypeToString(value_->getType()));
    Map map;
    const Value::ObjectType& members = value_->getObject();
    map.reserve(members.size());
    for (const Value::Member& member : members)
        map.emplace_back(member.first, Node(value_, &member.second));
    return map;
}

std::vector<Node>
Node::asList() const
{
    if (!value_->isArray())
        throw TypeMismatch(std::string("expected array but found ") +
                           Value::TypeToString(value_->getType()));
    std::vector<Node> list;
    const Value::ArrayType& elements = value_->getArray();
    list.reserve(elements.size());
    for (const Value& element : elements)
        list.push_back(Node(value_, &element));
    return list;
}

size_t
Node::size() const
{
    switch (value_->getType()) {
        case Value::Object:
            return value_->getObject().size();
        case Value::Array:
            return value_->getArray().size();
        default:
            throw TypeMismatch(std::string("a ") +
                               Value::TypeToString(value_->getType()) +
                               " has no size");
    }
}

Node
Node::get(const std::string& path) const
{
    return resolve(*this, path);
}

Node
Node::get(const Path& path) const
{
    return resolve(*this, path);
}

} // namespace jn
