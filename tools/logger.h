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
#include <cctype>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace jn {

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

struct LogField
{
    std::string_view key;
    std::string_view value;
};

inline const char*
LogLevelToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "INFO";
    }
}

// Accepts debug, info, warn (or warning) and error in any case.
inline bool
ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error)
{
    std::string s;
    for (char c : raw)
        s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "debug") {
        level = LogLevel::Debug;
    } else if (s == "info") {
        level = LogLevel::Info;
    } else if (s == "warn" || s == "warning") {
        level = LogLevel::Warn;
    } else if (s == "error") {
        level = LogLevel::Error;
    } else {
        error = "invalid --log-level '" + std::string(raw) +
                "' (expected debug|info|warn|error)";
        return false;
    }
    return true;
}

// Writes one `ts_utc=... level=... msg="..." key="value"` line per
// event to a stream, stderr by default.
class Logger
{
  public:
    explicit Logger(LogLevel min_level = LogLevel::Warn,
                    std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out)
    {
    }

    void setMinLevel(LogLevel level)
    {
        min_level_ = level;
    }

    bool shouldLog(LogLevel level) const
    {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    void log(LogLevel level,
             std::string_view message,
             std::initializer_list<LogField> fields = {})
    {
        if (!shouldLog(level))
            return;
        *out_ << "ts_utc=" << timestamp(std::chrono::system_clock::now())
              << " level=" << LogLevelToString(level)
              << " msg=" << quote(message);
        for (const LogField& field : fields)
            *out_ << ' ' << field.key << '=' << quote(field.value);
        *out_ << '\n';
        out_->flush();
    }

    void debug(std::string_view message,
               std::initializer_list<LogField> fields = {})
    {
        log(LogLevel::Debug, message, fields);
    }

    void info(std::string_view message,
              std::initializer_list<LogField> fields = {})
    {
        log(LogLevel::Info, message, fields);
    }

    void warn(std::string_view message,
              std::initializer_list<LogField> fields = {})
    {
        log(LogLevel::Warn, message, fields);
    }

    void error(std::string_view message,
               std::initializer_list<LogField> fields = {})
    {
        log(LogLevel::Error, message, fields);
    }

  private:
    static std::string timestamp(std::chrono::system_clock::time_point now)
    {
        long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                             now.time_since_epoch())
                             .count();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        std::tm utc{};
        if (!gmtime_r(&seconds, &utc))
            return "";
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << (millis % 1000 + 1000) % 1000
            << 'Z';
        return oss.str();
    }

    static std::string quote(std::string_view raw)
    {
        std::string s = "\"";
        for (char c : raw) {
            switch (c) {
                case '\\':
                    s += "\\\\";
                    break;
                case '"':
                    s += "\\\"";
                    break;
                case '\n':
                    s += "\\n";
                    break;
                case '\r':
                    s += "\\r";
                    break;
                case '\t':
                    s += "\\t";
                    break;
                default:
                    s += c;
                    break;
            }
        }
        s += '"';
        return s;
    }

    LogLevel min_level_;
    std::ostream* out_;
};

} // namespace jn
