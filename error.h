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
#include "value.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jn {

// Base class of everything thrown by navigation and coercion.
class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& message) : std::runtime_error(message)
    {
    }
};

// The text handed to Node::parse() is not valid JSON.
class DecodeError : public Error
{
  public:
    explicit DecodeError(Value::Status status)
      : Error(std::string("JSON decode failed: ") +
              Value::StatusToString(status))
      , status_(status)
    {
    }

    Value::Status status() const
    {
        return status_;
    }

  private:
    Value::Status status_;
};

// Malformed path string: empty, an empty token, or an index glued onto
// a key.
class PathSyntaxError : public Error
{
  public:
    explicit PathSyntaxError(const std::string& message) : Error(message)
    {
    }
};

// An operation expected an object, array or scalar and got something
// else.
class TypeMismatch : public Error
{
  public:
    explicit TypeMismatch(const std::string& message) : Error(message)
    {
    }
};

class KeyNotFound : public Error
{
  public:
    KeyNotFound(const std::string& message, const std::string& key)
      : Error(message), key_(key)
    {
    }

    const std::string& key() const
    {
        return key_;
    }

  private:
    std::string key_;
};

class IndexOutOfBounds : public Error
{
  public:
    IndexOutOfBounds(const std::string& message, long long index, size_t size)
      : Error(message), index_(index), size_(size)
    {
    }

    long long index() const
    {
        return index_;
    }

    size_t size() const
    {
        return size_;
    }

  private:
    long long index_;
    size_t size_;
};

// A scalar could not be converted to the requested type.
class CoercionError : public Error
{
  public:
    CoercionError(const std::string& message, const char* target)
      : Error(message), target_(target)
    {
    }

    const char* target() const
    {
        return target_;
    }

  private:
    const char* target_;
};

} // namespace jn
