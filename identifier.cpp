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

#include "identifier.h"
#include "error.h"

namespace jn {

static const char kSuffixAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ012345";

static bool
IsAlnum(char c)
{
    return ('0' <= c && c <= '9') || ('a' <= c && c <= 'z') ||
           ('A' <= c && c <= 'Z');
}

std::string
Identifier::suffix(const std::string& text)
{
    std::string s;
    for (size_t chunk = 0; chunk < 3; ++chunk) {
        int bits = 0;
        for (size_t i = 0; i < 5; ++i) {
            size_t k = chunk * 5 + i;
            if (k < text.size() && 'A' <= text[k] && text[k] <= 'Z')
                bits |= 1 << i;
        }
        s += kSuffixAlphabet[bits];
    }
    return s;
}

bool
Identifier::isValid(const std::string& text)
{
    if (text.size() != 15 && text.size() != 18)
        return false;
    for (char c : text)
        if (!IsAlnum(c))
            return false;
    if (text.size() == 18)
        return text.compare(15, 3, suffix(text)) == 0;
    return true;
}

Identifier
Identifier::parse(const std::string& text)
{
    if (!isValid(text))
        throw CoercionError("not an identifier: \"" + text + "\"",
                            "Identifier");
    return Identifier(text);
}

} // namespace jn
