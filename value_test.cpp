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
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define STRING(sl) std::string(sl, sizeof(sl) - 1)

using jn::Value;

static const char kHuge[] = R"([
    "JSON Test Pattern pass1",
    {"object with 1 member":["array with 1 element"]},
    {},
    [],
    -42,
    true,
    false,
    null,
    {
        "integer": 1234567890,
        "real": -9876.543210,
        "e": 0.123456789e-12,
        "E": 1.234567890E+34,
        "":  23456789012E66,
        "zero": 0,
        "one": 1,
        "space": " ",
        "quote": "\"",
        "backslash": "\\",
        "controls": "\b\f\n\r\t",
        "slash": "/ & \/",
        "alpha": "abcdefghijklmnopqrstuvwyz",
        "ALPHA": "ABCDEFGHIJKLMNOPQRSTUVWYZ",
        "digit": "0123456789",
        "0123456789": "digit",
        "special": "`1~!@#$%^&*()_+-={':[,]}|;.</>?",
        "hex": "\u0123\u4567\u89AB\uCDEF\uabcd\uef4A",
        "true": true,
        "false": false,
        "null": null,
        "array":[  ],
        "object":{  },
        "address": "50 St. James Street",
        "url": "http://www.JSON.org/",
        "comment": "// /* <!-- --",
        "# -- --> */": " ",
        " s p a c e d " :[1,2 , 3

,

4 , 5        ,          6           ,7        ],"compact":[1,2,3,4,5,6,7],
        "jsontext": "{\"object with 1 member\":[\"array with 1 element\"]}",
        "quotes": "&#34; \u0022 %22 0x22 034 &#x22;",
        "\/\\\"\uCAFE\uBABE\uAB98\uFCDE\ubcda\uef4A\b\f\n\r\t`1~!@#$%^&*()_+-=[]{}|;:',./<>?"
: "A key can be any string"
    },
    0.5 ,98.6
,
99.44
,

1066,
1e1,
0.1e1,
1e-1,
1e00,2e+00,2e-00
,"rosebud"])";

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

void
construct_test()
{
    Value obj(Value::ObjectType{
      { "name", Value("widget") },
      { "tags", Value(Value::ArrayType{ Value(1), Value(2.5), Value() }) },
    });
    if (!obj.isObject() || obj.getObject().size() != 2)
        exit(1);
    const Value* tags = obj.find("tags");
    if (!tags || !tags->isArray() || tags->getArray().size() != 3)
        exit(2);
    if (!tags->getArray()[0].isLong() || tags->getArray()[0].getLong() != 1)
        exit(3);
    if (!tags->getArray()[1].isDouble() || !tags->getArray()[1].isNumber())
        exit(4);
    if (!tags->getArray()[2].isNull())
        exit(5);
    if (obj.find("missing") || !obj.contains("name"))
        exit(6);
    if (Value(1).find("name"))
        exit(7);
    Value copy = obj;
    if (copy != obj)
        exit(8);
    Value moved = std::move(copy);
    if (moved != obj || !copy.isNull())
        exit(9);
}

void
equality_test()
{
    if (Value(1) == Value(1.0))
        exit(20);
    if (Value("a") != Value(std::string("a")))
        exit(21);
    if (Value(Value::ArrayType{ Value(1), Value(2) }) ==
        Value(Value::ArrayType{ Value(2), Value(1) }))
        exit(22);
    if (Value(Value::ObjectType{ { "a", Value(1) }, { "b", Value(2) } }) ==
        Value(Value::ObjectType{ { "b", Value(2) }, { "a", Value(1) } }))
        exit(23);
    if (Value() != Value(nullptr))
        exit(24);
    if (Value((const char*)nullptr) != Value())
        exit(25);
}

void
accessor_test()
{
    bool threw = false;
    try {
        Value("x").getLong();
    } catch (const std::logic_error&) {
        threw = true;
    }
    if (!threw)
        exit(30);
    threw = false;
    try {
        Value(true).getObject();
    } catch (const std::logic_error&) {
        threw = true;
    }
    if (!threw)
        exit(31);
    if (Value(3).getNumber() != 3.0 || Value(0.25).getNumber() != 0.25)
        exit(32);
    if (std::string(Value::TypeToString(Value::Object)) != "object")
        exit(33);
    if (std::string(Value::StatusToString(Value::missing_comma)) !=
        "missing_comma")
        exit(34);
}

void
parse_test()
{
    std::pair<Value::Status, Value> res =
      Value::parse("{ \"content\":[[[0,10,20,3.14,40]]]}");
    if (res.first != Value::success)
        exit(40);
    const Value* content = res.second.find("content");
    if (!content || !content->isArray())
        exit(41);
    const Value& inner = content->getArray()[0].getArray()[0];
    if (inner.getArray().size() != 5 || inner.getArray()[3].getDouble() != 3.14)
        exit(42);
    res = Value::parse("{\"b\": 1, \"a\": 2, \"c\": 3}");
    if (res.first != Value::success)
        exit(43);
    const Value::ObjectType& members = res.second.getObject();
    if (members[0].first != "b" || members[1].first != "a" ||
        members[2].first != "c")
        exit(44);
}

void
duplicate_key_test()
{
    std::pair<Value::Status, Value> res =
      Value::parse(R"({"a": 1, "b": 2, "a": 3})");
    if (res.first != Value::success)
        exit(50);
    if (res.second.getObject().size() != 2)
        exit(51);
    if (res.second.find("a")->getLong() != 1)
        exit(52);
}

void
number_test()
{
    std::pair<Value::Status, Value> res =
      Value::parse("[9223372036854775807, -9223372036854775808, "
                   "9223372036854775808, -0, 1e5, 123.456e-789, 1.5e+9999]");
    if (res.first != Value::success)
        exit(60);
    const Value::ArrayType& a = res.second.getArray();
    if (!a[0].isLong() || a[0].getLong() != 9223372036854775807LL)
        exit(61);
    if (!a[1].isLong() || a[1].getLong() != -9223372036854775807LL - 1)
        exit(62);
    if (!a[2].isDouble() || a[2].getDouble() != 9223372036854775808.0)
        exit(63);
    if (!a[3].isLong() || a[3].getLong() != 0)
        exit(64);
    if (!a[4].isDouble() || a[4].getDouble() != 100000)
        exit(65);
    if (!a[5].isDouble() || a[5].getDouble() != 0)
        exit(66);
    if (!a[6].isDouble() || !std::isinf(a[6].getDouble()))
        exit(67);
}

static const struct
{
    std::string json;
    std::string want;
} kStrings[] = {
    { R"("\u0020")", " " },
    { R"("\u00e9")", "\xc3\xa9" },
    { R"("\uD834\uDD1E")", "\xf0\x9d\x84\x9e" },
    { R"("\x41\x7e")", "A~" },
    { R"("\/\b\f\n\r\t")", "/\b\f\n\r\t" },
    { "\"\xe2\x82\xac\"", "\xe2\x82\xac" },

    // unpaired surrogates come through as the escape text
    { R"("\uDFAA")", "\\uDFAA" },
    { R"("\ud800abc")", "\\ud800abc" },
    { R"("\uD800\uD800\n")", "\\uD800\\uD800\n" },
};

void
string_test()
{
    for (size_t i = 0; i < ARRAYLEN(kStrings); ++i) {
        std::pair<Value::Status, Value> res = Value::parse(kStrings[i].json);
        if (res.first != Value::success) {
            printf("error: Value::parse returned Value::%s for %s\n",
                   Value::StatusToString(res.first),
                   kStrings[i].json.c_str());
            exit(70);
        }
        if (!res.second.isString() ||
            res.second.getString() != kStrings[i].want) {
            printf("error: Value::parse(%s) decoded the wrong string\n",
                   kStrings[i].json.c_str());
            exit(71);
        }
    }
}

// https://github.com/nst/JSONTestSuite/
static const struct
{
    Value::Status error;
    std::string json;
} kJsonTestSuite[] = {
    { Value::absent_value, "" },
    { Value::absent_value, " \n\t " },
    { Value::trailing_content, "[] []" },
    { Value::illegal_character, "[nan]" },
    { Value::bad_negative, "[-nan]" },
    { Value::illegal_character, "[+NaN]" },
    { Value::trailing_content,
      "{\"Extra value after close\": true} \"misplaced quoted value\"" },
    { Value::illegal_character, "{\"Illegal expression\": 1 + 2}" },
    { Value::illegal_character, "{\"Illegal invocation\": alert()}" },
    { Value::unexpected_octal, "{\"Numbers cannot have leading zeroes\": 013}" },
    { Value::illegal_character, "{\"Numbers cannot be hex\": 0x14}" },
    { Value::hex_escape_not_printable, "[\"Illegal backslash escape: \\x15\"]" },
    { Value::invalid_hex_escape, "[\"\\xZZ\"]" },
    { Value::invalid_unicode_escape, "[\"\\u12G4\"]" },
    { Value::illegal_character, "[\\naked]" },
    { Value::invalid_escape_character, "[\"Illegal backslash escape: \\017\"]" },
    { Value::depth_exceeded,
      "[[[[[[[[[[[[[[[[[[[[\"Too deep\"]]]]]]]]]]]]]]]]]]]]" },
    { Value::missing_colon, "{\"Missing colon\" null}" },
    { Value::unexpected_colon, "{\"Double colon\":: null}" },
    { Value::unexpected_comma, "{\"Comma instead of colon\", null}" },
    { Value::unexpected_colon, "[\"Colon instead of comma\": false]" },
    { Value::illegal_character, "[\"Bad value\", truth]" },
    { Value::illegal_character, "[\'single quote\']" },
    { Value::non_del_c0_control_code_in_string,
      "[\"\ttab\tcharacter\tin\tstring\t\"]" },
    { Value::invalid_escape_character,
      "[\"tab\\   character\\   in\\  string\\  \"]" },
    { Value::non_del_c0_control_code_in_string, "[\"line\nbreak\"]" },
    { Value::invalid_escape_character, "[\"line\\\nbreak\"]" },
    { Value::bad_exponent, "[0e]" },
    { Value::unexpected_eof, "[\"Unclosed array\"" },
    { Value::unexpected_end_of_string, "[\"Unclosed string" },
    { Value::bad_exponent, "[0e+]" },
    { Value::bad_exponent, "[0e+-1]" },
    { Value::unexpected_eof, "{\"Comma instead if closing brace\": true," },
    { Value::unexpected_end_of_object, "[\"mismatch\"}" },
    { Value::unexpected_end_of_array, "{\"mismatch\": 1]" },
    { Value::illegal_character, "{unquoted_key: \"keys must be quoted\"}" },
    { Value::unexpected_end_of_array, "[\"extra comma\",]" },
    { Value::unexpected_comma, "[\"double extra comma\",,]" },
    { Value::unexpected_comma, "[   , \"<-- missing value\"]" },
    { Value::trailing_content, "[\"Comma after the close\"]," },
    { Value::trailing_content, "[\"Extra close\"]]" },
    { Value::unexpected_end_of_object, "{\"Extra comma\": true,}" },
    { Value::object_missing_value, "{\"a\"}" },
    { Value::object_missing_value, "{\"a\":}" },
    { Value::unexpected_eof, " {\"a\" " },
    { Value::unexpected_eof, " {\"a\": " },
    { Value::unexpected_colon, " {:\"b\" " },
    { Value::illegal_character, " {\"a\" b} " },
    { Value::illegal_character, " {key: 'value'} " },
    { Value::object_key_must_be_string, " {\"a\":\"a\" 123} " },
    { Value::missing_comma, " {\"a\":\"a\" \"b\":1} " },
    { Value::illegal_character, " \x7b\xf0\x9f\x87\xa8\xf0\x9f\x87\xad\x7d " },
    { Value::object_key_must_be_string, " {[: \"x\"} " },
    { Value::illegal_character, " [1.8011670033376514H-308] " },
    { Value::illegal_character, " [1.2a-3] " },
    { Value::illegal_character, " [.123] " },
    { Value::bad_exponent, " [1e\xe5] " },
    { Value::bad_exponent, " [1ea] " },
    { Value::illegal_character, " [-1x] " },
    { Value::bad_negative, " [-.123] " },
    { Value::bad_negative, " [-foo] " },
    { Value::bad_negative, " [-Infinity] " },
    { Value::illegal_character, " \x5b\x30\xe5\x5d " },
    { Value::illegal_character, " \x5b\x31\x65\x31\xe5\x5d " },
    { Value::illegal_character, " \x5b\x31\x32\x33\xe5\x5d " },
    { Value::missing_comma,
      " \x5b\x2d\x31\x32\x33\x2e\x31\x32\x33\x66\x6f\x6f\x5d " },
    { Value::illegal_character, " [Infinity] " },
    { Value::illegal_character, " [0x42] " },
    { Value::illegal_character, " [1+2] " },
    { Value::illegal_character, " \x5b\xef\xbc\x91\x5d " },
    { Value::illegal_character, " [NaN] " },
    { Value::bad_double, " [9.e+] " },
    { Value::bad_exponent, " [1eE2] " },
    { Value::bad_exponent, " [1.0e-] " },
    { Value::bad_exponent, " [0E+] " },
    { Value::bad_exponent, " [0.3e] " },
    { Value::illegal_character, " [0.1.2] " },
    { Value::illegal_character, " [.2e-3] " },
    { Value::illegal_character, " [+1] " },
    { Value::illegal_character, " [tru] " },
    { Value::illegal_character, " [nul] " },
    { Value::illegal_character, " [fals] " },
    { Value::unexpected_eof, " [{} " },
    { Value::unexpected_eof, "\n[1,\n1\n,1  " },
    { Value::unexpected_eof, " [1, " },
    { Value::illegal_character, " [* " },
    { Value::non_del_c0_control_code_in_string,
      " \x5b\x22\x0b\x61\x22\x5c\x66\x5d " },
    { Value::unexpected_colon, " [1:2] " },
    { Value::illegal_character, " \x5b\xff\x5d " },
    { Value::unexpected_colon, " [\"\": 1] " },
    { Value::illegal_character, STRING("\x00") },
    { Value::unexpected_octal, " [012] " },
    { Value::unexpected_octal, " [-01] " },
    { Value::missing_comma, " [1 000.0] " },
    { Value::bad_negative, " [- 1] " },
    { Value::bad_negative, " [-] " },
    { Value::illegal_utf8_character, " {\"\xb9\":\"0\",} " },
    { Value::unexpected_colon, " {\"x\"::\"b\"} " },
    { Value::unexpected_end_of_array, " [1,] " },
    { Value::unexpected_comma, " [1,,2] " },
    { Value::missing_comma, " [ 3[ 4]] " },
    { Value::missing_comma, " [1 true] " },
    { Value::missing_comma, " [\"a\" \"b\"] " },
    { Value::bad_double, " [1.] " },
    { Value::bad_double, " [2.e3] " },
    { Value::bad_double, " [-2.] " },
    { Value::illegal_character, " \xef\xbb\xbf{} " },
    { Value::illegal_character, STRING(" [\x00\"\x00\xe9\x00\"\x00]\x00 ") },
    { Value::malformed_utf8, " [\"\xe0\xff\"] " },
    { Value::illegal_utf8_character, " [\"\xfc\x80\x80\x80\x80\x80\"] " },
    { Value::overlong_ascii, " [\"\xc0\xaf\"] " },
    { Value::overlong_utf8_0x7ff, " [\"\xe0\x80\xaf\"] " },
    { Value::overlong_utf8_0xffff, " [\"\xf0\x80\x80\xaf\"] " },
    { Value::utf16_surrogate_in_utf8, " [\"\xed\xa0\x80\"] " },
    { Value::utf8_exceeds_utf16_range, " [\"\xf4\xbf\xbf\xbf\"] " },
    { Value::c1_control_code_in_string, " [\"\x81\"] " },
    { Value::malformed_utf8, " [\"\xe9\"] " },
    { Value::illegal_utf8_character, " [\"\xff\"] " },
    { Value::success, kHuge },
    { Value::success,
      R"([[[[[[[[[[[[[[[[[[["Not too deep"]]]]]]]]]]]]]]]]]]])" },
    { Value::success, R"({
    "JSON Test Pattern pass3": {
        "The outermost value": "must be an object or array.",
        "In this test": "It is an object."
    }
}
)" },
    { Value::success, " 42 " },
    { Value::success, "\"lonely string\"" },
    { Value::success, "null" },
};

void
json_test_suite()
{
    for (size_t i = 0; i < ARRAYLEN(kJsonTestSuite); ++i) {
        std::pair<Value::Status, Value> res =
          Value::parse(kJsonTestSuite[i].json);
        if (res.first != kJsonTestSuite[i].error) {
            printf("error: Value::parse returned Value::%s but wanted "
                   "Value::%s: %s\n",
                   Value::StatusToString(res.first),
                   Value::StatusToString(kJsonTestSuite[i].error),
                   kJsonTestSuite[i].json.c_str());
            exit(80);
        }
        if (res.first != Value::success && !res.second.isNull())
            exit(81);
    }
}

void
afl_regression()
{
    Value::parse("[{\"\":1,3:14,]\n");
    Value::parse("[\n"
                 "\n"
                 "3E14,\n"
                 "{\"!\":4,733:4,[\n"
                 "\n"
                 "3EL%,3E14,\n"
                 "{][1][1,,]");
    Value::parse("[\n"
                 "null,\n"
                 "1,\n"
                 "3.14,\n"
                 "{\"a\": \"b\",\n"
                 "3:14,ull}\n"
                 "]");
    Value::parse("[\n"
                 "\n"
                 "3E14,\n"
                 "{\"a!!:!!!!!!!!!!!!!!!\":4, \n"
                 "\n"
                 "3E1:4, \n"
                 "\n"
                 "3E1,,\n"
                 ",,\n"
                 "3[\n"
                 "\n"
                 "]");
}

int
main()
{
    construct_test();
    equality_test();
    accessor_test();
    parse_test();
    duplicate_key_test();
    number_test();
    string_test();
    json_test_suite();
    afl_regression();

    BENCH(2000, 1, parse_test());
    BENCH(2000, 1, string_test());
    BENCH(2000, 1, json_test_suite());
}
