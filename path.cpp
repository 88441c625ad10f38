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

#include "path.h"
#include "error.h"

#include <climits>
#include <cstdint>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace jn {

static const char kPathDelimiter = '.';

namespace {

class PathParser
{
  public:
    explicit PathParser(const std::string& input) : input_(input), pos_(0)
    {
    }

    std::vector<PathStep> parse();

  private:
    const std::string& input_;
    size_t pos_;

    PathStep parseToken(size_t end);
    bool parseIndex(size_t begin, size_t end, long long& value) const;
    [[noreturn]] void error(const std::string& message) const;
};

[[noreturn]] void
PathParser::error(const std::string& message) const
{
    std::ostringstream oss;
    oss << "path syntax error at position " << pos_ << ": " << message;
    throw PathSyntaxError(oss.str());
}

std::vector<PathStep>
PathParser::parse()
{
    if (input_.empty())
        error("empty path");
    std::vector<PathStep> steps;
    for (;;) {
        size_t end = input_.find(kPathDelimiter, pos_);
        if (end == std::string::npos)
            end = input_.size();
        steps.emplace_back(parseToken(end));
        if (end == input_.size())
            break;
        pos_ = end + 1;
    }
    return steps;
}

// Accepts the digits of an index token, optionally negative. Values
// beyond the range of long long saturate; they are out of bounds for
// any array anyway.
bool
PathParser::parseIndex(size_t begin, size_t end, long long& value) const
{
    bool negative = begin < end && input_[begin] == '-';
    if (negative)
        ++begin;
    if (begin == end)
        return false;
    long long x = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = input_[i];
        if (c < '0' || c > '9')
            return false;
        if (x > (LLONG_MAX - (c - '0')) / 10)
            x = LLONG_MAX;
        else
            x = x * 10 + (c - '0');
    }
    value = negative ? -x : x;
    return true;
}

PathStep
PathParser::parseToken(size_t end)
{
    if (end == pos_)
        error(pos_ == input_.size() ? "path ends with a period"
                                    : "empty token between periods");
    PathStep step;
    if (input_[end - 1] == ']') {
        size_t open = input_.rfind('[', end - 1);
        if (open != std::string::npos && open >= pos_ &&
            parseIndex(open + 1, end - 1, step.index)) {
            if (open != pos_) {
                std::string key = input_.substr(pos_, open - pos_);
                pos_ = open;
                error("index must be its own token (write \"" + key + "." +
                      input_.substr(open, end - open) + "\")");
            }
            step.kind = PathStep::Kind::Index;
            return step;
        }
    }
    step.kind = PathStep::Kind::Key;
    step.key = input_.substr(pos_, end - pos_);
    return step;
}

class PathCache
{
  public:
    const Path& get(const std::string& expression)
    {
        const uint64_t now = ++clock_;
        auto it = cache_.find(expression);
        if (it != cache_.end()) {
            it->second.lastUsedTick = now;
            return it->second.path;
        }
        CacheEntry entry;
        entry.path = Path::parse(expression);
        entry.lastUsedTick = now;
        auto [insertedIt, inserted] = cache_.emplace(expression, std::move(entry));
        (void)inserted;
        if (cache_.size() > kMaxEntries)
            evictOldest();
        return insertedIt->second.path;
    }

  private:
    struct CacheEntry
    {
        Path path;
        uint64_t lastUsedTick = 0;
    };

    static constexpr size_t kMaxEntries = 64;

    std::unordered_map<std::string, CacheEntry> cache_;
    uint64_t clock_ = 0;

    void evictOldest()
    {
        auto oldestIt = cache_.end();
        for (auto it = cache_.begin(); it != cache_.end(); ++it) {
            if (oldestIt == cache_.end() ||
                it->second.lastUsedTick < oldestIt->second.lastUsedTick)
                oldestIt = it;
        }
        if (oldestIt != cache_.end())
            cache_.erase(oldestIt);
    }
};

inline PathCache&
getThreadLocalCache()
{
    thread_local PathCache cache;
    return cache;
}

} // namespace

std::string
PathStep::toString() const
{
    if (kind == Kind::Index)
        return "[" + std::to_string(index) + "]";
    return key;
}

Path
Path::parse(const std::string& text)
{
    Path path;
    PathParser parser(text);
    path.steps_ = parser.parse();
    return path;
}

std::string
Path::toString(size_t count) const
{
    std::string s;
    for (size_t i = 0; i < steps_.size() && i < count; ++i) {
        if (i)
            s += kPathDelimiter;
        s += steps_[i].toString();
    }
    return s;
}

// Describes where step `i` was applied, for error messages.
static std::string
Where(const Path& path, size_t i)
{
    if (!i)
        return "at root";
    return "at \"" + path.toString(i) + "\"";
}

Node
resolve(const Node& start, const Path& path)
{
    const Value* current = start.value_.get();
    const std::vector<PathStep>& steps = path.steps();
    for (size_t i = 0; i < steps.size(); ++i) {
        const PathStep& step = steps[i];
        if (step.kind == PathStep::Kind::Key) {
            if (!current->isObject())
                throw TypeMismatch("cannot look up key \"" + step.key +
                                   "\" in " +
                                   Value::TypeToString(current->getType()) +
                                   " " + Where(path, i));
            const Value* next = current->find(step.key);
            if (!next)
                throw KeyNotFound("key \"" + step.key + "\" not found " +
                                    Where(path, i),
                                  step.key);
            current = next;
        } else {
            if (!current->isArray())
                throw TypeMismatch("cannot apply index " + step.toString() +
                                   " to " +
                                   Value::TypeToString(current->getType()) +
                                   " " + Where(path, i));
            const Value::ArrayType& elements = current->getArray();
            if (step.index < 0 ||
                static_cast<unsigned long long>(step.index) >= elements.size())
                throw IndexOutOfBounds("index " + step.toString() +
                                         " out of bounds for array of length " +
                                         std::to_string(elements.size()) +
                                         " " + Where(path, i),
                                       step.index,
                                       elements.size());
            current = &elements[step.index];
        }
    }
    return Node(start.value_, current);
}

Node
resolve(const Node& start, const std::string& path)
{
    return resolve(start, getThreadLocalCache().get(path));
}

} // namespace jn
