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
#include "node.h"

#include <cstddef>
#include <string>
#include <vector>

namespace jn {

struct PathStep
{
    enum class Kind
    {
        Key,
        Index
    };

    Kind kind = Kind::Key;
    std::string key;
    long long index = 0;

    // The token this step was parsed from, e.g. "name" or "[1]".
    std::string toString() const;

    bool operator==(const PathStep& other) const
    {
        return kind == other.kind && key == other.key && index == other.index;
    }
};

// Dot separated navigation path such as "menu.popup.menuitem.[1].value".
//
// Each token between periods is either a literal object key or an
// array index written as its own token in square brackets. Keys are
// matched case-sensitively and cannot contain a period. An index glued
// onto a key ("menuitem[0]") is rejected rather than guessed at.
class Path
{
  public:
    Path()
    {
    }

    // Throws PathSyntaxError for an empty string, an empty token or a
    // glued index. Index digits too large for a long long saturate.
    static Path parse(const std::string& text);

    const std::vector<PathStep>& steps() const
    {
        return steps_;
    }

    size_t size() const
    {
        return steps_.size();
    }

    bool empty() const
    {
        return steps_.empty();
    }

    // Tokens joined by periods. The first `count` steps only, if given.
    std::string toString(size_t count = static_cast<size_t>(-1)) const;

    bool operator==(const Path& other) const
    {
        return steps_ == other.steps_;
    }

  private:
    std::vector<PathStep> steps_;
};

// Walks `path` from `start`. An empty Path returns `start`.
//
// Throws TypeMismatch when a key step meets a non-object or an index
// step meets a non-array, KeyNotFound for a missing key, and
// IndexOutOfBounds for an index outside the array.
Node resolve(const Node& start, const Path& path);

// Parses `path` (memoized per thread) and resolves it. Also throws
// PathSyntaxError.
Node resolve(const Node& start, const std::string& path);

} // namespace jn
