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

#include "jnav.h"
#include "tools/logger.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

const int kExitSuccess = 0;
const int kExitFailure = 1;
const int kExitUsage = 2;

const char kRootPath[] = "$";

const char* const kTypes[] = {
    "string", "boolean", "integer", "long",  "double", "decimal", "date",
    "time",   "datetime", "id",     "blob",  "shape",  "keys",    "length",
};

struct Options
{
    std::string file;
    std::string type = "string";
    std::string path;
    jn::LogLevel log_level = jn::LogLevel::Warn;
    bool help = false;
};

void
printUsage(std::ostream& out)
{
    out << "usage: jnq [--file PATH] [--type TYPE] "
           "[--log-level <debug|info|warn|error>] PATH_EXPR\n"
        << "\n"
        << "Reads a JSON document from PATH or stdin, walks PATH_EXPR and\n"
        << "prints the value found there. PATH_EXPR is a dotted path such\n"
        << "as menu.popup.menuitem.[1].value, or $ for the document root.\n"
        << "\n"
        << "TYPE is one of string (default), boolean, integer, long,\n"
        << "double, decimal, date, time, datetime, id, blob, shape, keys,\n"
        << "length. A null prints as null.\n";
}

bool
parseOptions(const std::vector<std::string_view>& args,
             Options& options,
             std::string& error)
{
    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view token = args[i];
        if (token == "-h" || token == "--help") {
            options.help = true;
            continue;
        }
        if (token == "--file" || token == "--type" || token == "--log-level") {
            if (i + 1 >= args.size()) {
                error = "missing value for " + std::string(token);
                return false;
            }
            std::string_view value = args[++i];
            if (token == "--file")
                options.file = std::string(value);
            else if (token == "--type")
                options.type = std::string(value);
            else if (!jn::ParseLogLevel(value, options.log_level, error))
                return false;
            continue;
        }
        if (token.size() > 1 && token.front() == '-') {
            error = "unknown option: " + std::string(token);
            return false;
        }
        if (!options.path.empty()) {
            error = "jnq accepts exactly 1 path expression";
            return false;
        }
        options.path = std::string(token);
    }
    if (options.help)
        return true;
    if (options.path.empty()) {
        error = "missing path expression";
        return false;
    }
    for (const char* type : kTypes)
        if (options.type == type)
            return true;
    error = "unknown --type: " + options.type;
    return false;
}

bool
readDocument(const Options& options, std::string& text, std::string& error)
{
    if (options.file.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin),
                    std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(options.file, std::ios::binary);
    if (!in) {
        error = "unable to open " + options.file;
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    text = oss.str();
    return true;
}

template<typename T, typename F>
void
printOptional(std::ostream& out, const std::optional<T>& value, F format)
{
    if (value)
        out << format(*value) << '\n';
    else
        out << "null\n";
}

void
printAs(const jn::Node& node, const std::string& type, std::ostream& out)
{
    if (type == "string") {
        printOptional(out, node.getStringValue(), [](const std::string& s) {
            return s;
        });
    } else if (type == "boolean") {
        printOptional(out, node.getBooleanValue(), [](bool b) {
            return b ? "true" : "false";
        });
    } else if (type == "integer") {
        printOptional(out, node.getIntegerValue(), [](int32_t x) {
            return std::to_string(x);
        });
    } else if (type == "long") {
        printOptional(out, node.getLongValue(), [](int64_t x) {
            return std::to_string(x);
        });
    } else if (type == "double") {
        printOptional(out, node.getDoubleValue(), [](double d) {
            return *jn::Node(jn::Value(d)).getStringValue();
        });
    } else if (type == "decimal") {
        printOptional(out, node.getDecimalValue(), [](const jn::Decimal& d) {
            return d.toString();
        });
    } else if (type == "date") {
        printOptional(out, node.getDateValue(), [](const jn::Date& d) {
            return d.toString();
        });
    } else if (type == "time") {
        printOptional(out, node.getTimeValue(), [](const jn::Time& t) {
            return t.toString();
        });
    } else if (type == "datetime") {
        printOptional(out, node.getDateTimeValue(), [](const jn::DateTime& t) {
            return t.toString();
        });
    } else if (type == "id") {
        printOptional(out, node.getIdValue(), [](const jn::Identifier& id) {
            return id.str();
        });
    } else if (type == "blob") {
        std::optional<std::string> bytes = node.getBlobValue();
        if (bytes)
            out.write(bytes->data(), bytes->size());
        else
            out << "null\n";
    } else if (type == "shape") {
        out << jn::ShapeToString(node.shape()) << '\n';
    } else if (type == "keys") {
        for (const auto& member : node.asMap())
            out << member.first << '\n';
    } else if (type == "length") {
        out << node.size() << '\n';
    } else {
        throw std::logic_error("Unhandled output type.");
    }
}

} // namespace

int
main(int argc, char* argv[])
{
    jn::Logger logger;
    Options options;
    std::string error;
    std::vector<std::string_view> args(argv + 1, argv + argc);
    if (!parseOptions(args, options, error)) {
        logger.error(error);
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (options.help) {
        printUsage(std::cout);
        return kExitSuccess;
    }
    logger.setMinLevel(options.log_level);

    std::string text;
    if (!readDocument(options, text, error)) {
        logger.error(error, { { "file", options.file } });
        return kExitUsage;
    }
    logger.debug("read document",
                 { { "file", options.file.empty() ? "-" : options.file },
                   { "bytes", std::to_string(text.size()) } });

    jn::Node root;
    try {
        root = jn::Node::parse(text);
    } catch (const jn::DecodeError& e) {
        logger.error("document is not valid JSON",
                     { { "status", jn::Value::StatusToString(e.status()) } });
        return kExitUsage;
    }

    try {
        jn::Node node = options.path == kRootPath
                          ? root
                          : jn::resolve(root, options.path);
        logger.debug("resolved path",
                     { { "path", options.path },
                       { "shape", jn::ShapeToString(node.shape()) } });
        printAs(node, options.type, std::cout);
    } catch (const jn::PathSyntaxError& e) {
        logger.error(e.what(), { { "path", options.path } });
        return kExitUsage;
    } catch (const jn::Error& e) {
        logger.error(e.what(),
                     { { "path", options.path }, { "type", options.type } });
        return kExitFailure;
    }
    return kExitSuccess;
}
