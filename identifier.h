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

namespace jn {

// Opaque record identifier.
//
// Identifiers are 15 case-sensitive alphanumeric characters, or 18
// where the last three encode which of the first fifteen are upper
// case. Nothing else about them is interpreted.
class Identifier
{
  public:
    // Throws CoercionError unless isValid(text).
    static Identifier parse(const std::string& text);
    static bool isValid(const std::string& text);

    // Checksum suffix for the first fifteen characters of `text`.
    static std::string suffix(const std::string& text);

    const std::string& str() const
    {
        return id_;
    }

    size_t size() const
    {
        return id_.size();
    }

    bool operator==(const Identifier& other) const
    {
        return id_ == other.id_;
    }

    bool operator!=(const Identifier& other) const
    {
        return id_ != other.id_;
    }

  private:
    explicit Identifier(const std::string& id) : id_(id)
    {
    }

    std::string id_;
};

} // namespace jn
