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
#include <string>

namespace jn {

// Calendar date in the proleptic Gregorian calendar.
class Date
{
  public:
    Date() : year_(1970), month_(1), day_(1)
    {
    }

    // Throws std::out_of_range unless the fields name a real day.
    Date(int year, int month, int day);

    // Strict YYYY-MM-DD. Throws CoercionError otherwise.
    static Date parse(const std::string& text);
    static Date fromEpochDays(long long days);

    long long toEpochDays() const;

    int year() const
    {
        return year_;
    }

    int month() const
    {
        return month_;
    }

    int day() const
    {
        return day_;
    }

    std::string toString() const;

    bool operator==(const Date& other) const
    {
        return year_ == other.year_ && month_ == other.month_ &&
               day_ == other.day_;
    }

    bool operator!=(const Date& other) const
    {
        return !(*this == other);
    }

    bool operator<(const Date& other) const
    {
        return toEpochDays() < other.toEpochDays();
    }

  private:
    int year_;
    int month_;
    int day_;
};

// Wall clock time of day with millisecond precision, always UTC.
class Time
{
  public:
    static constexpr int kMillisPerDay = 86400000;

    Time() : millis_(0)
    {
    }

    // Throws std::out_of_range unless every field is in range.
    Time(int hour, int minute, int second, int millisecond = 0);

    // Strict HH:MM:SS[.f{1,3}][Z]. Throws CoercionError otherwise.
    static Time parse(const std::string& text);
    static Time fromMillisOfDay(int millis);

    int toMillisOfDay() const
    {
        return millis_;
    }

    int hour() const
    {
        return millis_ / 3600000;
    }

    int minute() const
    {
        return millis_ / 60000 % 60;
    }

    int second() const
    {
        return millis_ / 1000 % 60;
    }

    int millisecond() const
    {
        return millis_ % 1000;
    }

    // HH:MM:SS.mmmZ
    std::string toString() const;

    bool operator==(const Time& other) const
    {
        return millis_ == other.millis_;
    }

    bool operator!=(const Time& other) const
    {
        return millis_ != other.millis_;
    }

    bool operator<(const Time& other) const
    {
        return millis_ < other.millis_;
    }

  private:
    int millis_;
};

// Instant on the UTC time line with millisecond precision.
class DateTime
{
  public:
    DateTime() : millis_(0)
    {
    }

    // Accepts YYYY-MM-DD (midnight UTC) or
    // YYYY-MM-DD(T| )HH:MM:SS[.f{1,3}][Z|(+|-)HH:MM|(+|-)HHMM], where a
    // missing zone means UTC. Throws CoercionError otherwise, including
    // when an offset moves the instant outside years 0000 through 9999.
    static DateTime parse(const std::string& text);
    static bool tryParse(const std::string& text, DateTime* out);

    // First and last instants of years 0000 through 9999.
    static constexpr long long kMinEpochMillis = -62167219200000LL;
    static constexpr long long kMaxEpochMillis = 253402300799999LL;

    // Throws std::out_of_range outside [kMinEpochMillis, kMaxEpochMillis].
    static DateTime fromEpochMillis(long long millis);
    static bool tryFromEpochMillis(long long millis, DateTime* out);
    static DateTime of(const Date& date, const Time& time);

    long long epochMillis() const
    {
        return millis_;
    }

    Date date() const;
    Time time() const;

    // YYYY-MM-DDTHH:MM:SS.mmmZ
    std::string toString() const;

    bool operator==(const DateTime& other) const
    {
        return millis_ == other.millis_;
    }

    bool operator!=(const DateTime& other) const
    {
        return millis_ != other.millis_;
    }

    bool operator<(const DateTime& other) const
    {
        return millis_ < other.millis_;
    }

  private:
    long long millis_;
};

} // namespace jn
