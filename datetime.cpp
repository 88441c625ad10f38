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

#include "datetime.h"
#include "error.h"

#include <cstdio>
#include <stdexcept>

namespace jn {

static const long long kMillisPerDay = Time::kMillisPerDay;

static bool
IsLeapYear(long long y)
{
    return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

static int
DaysInMonth(long long y, int m)
{
    static const int kDays[12] = { 31, 28, 31, 30, 31, 30,
                                   31, 31, 30, 31, 30, 31 };
    if (m == 2 && IsLeapYear(y))
        return 29;
    return kDays[m - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar. The year
// is shifted to start in March so the leap day falls at the end.
static long long
DaysFromCivil(long long y, int m, int d)
{
    y -= m <= 2;
    long long era = (y >= 0 ? y : y - 399) / 400;
    long long yoe = y - era * 400;
    long long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static void
CivilFromDays(long long z, long long* y, int* m, int* d)
{
    z += 719468;
    long long era = (z >= 0 ? z : z - 146096) / 146097;
    long long doe = z - era * 146097;
    long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long long mp = (5 * doy + 2) / 153;
    *d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    *m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    *y = yoe + era * 400 + (*m <= 2);
}

// Reads exactly `n` decimal digits at s[*i].
static bool
ReadDigits(const std::string& s, size_t* i, int n, int* out)
{
    if (s.size() - *i < static_cast<size_t>(n))
        return false;
    int x = 0;
    for (int k = 0; k < n; ++k) {
        char c = s[*i + k];
        if (c < '0' || c > '9')
            return false;
        x = x * 10 + (c - '0');
    }
    *i += n;
    *out = x;
    return true;
}

static bool
Expect(const std::string& s, size_t* i, char c)
{
    if (*i < s.size() && s[*i] == c) {
        ++*i;
        return true;
    }
    return false;
}

static bool
ScanDate(const std::string& s, size_t* i, long long* days)
{
    int y, m, d;
    if (!ReadDigits(s, i, 4, &y) || !Expect(s, i, '-') ||
        !ReadDigits(s, i, 2, &m) || !Expect(s, i, '-') ||
        !ReadDigits(s, i, 2, &d))
        return false;
    if (m < 1 || m > 12 || d < 1 || d > DaysInMonth(y, m))
        return false;
    *days = DaysFromCivil(y, m, d);
    return true;
}

// HH:MM:SS with up to three fractional digits.
static bool
ScanTime(const std::string& s, size_t* i, int* millis)
{
    int h, m, sec, frac = 0;
    if (!ReadDigits(s, i, 2, &h) || !Expect(s, i, ':') ||
        !ReadDigits(s, i, 2, &m) || !Expect(s, i, ':') ||
        !ReadDigits(s, i, 2, &sec))
        return false;
    if (h > 23 || m > 59 || sec > 59)
        return false;
    if (Expect(s, i, '.')) {
        int n = 0;
        while (*i < s.size() && '0' <= s[*i] && s[*i] <= '9') {
            if (++n > 3)
                return false;
            frac = frac * 10 + (s[(*i)++] - '0');
        }
        if (!n)
            return false;
        for (; n < 3; ++n)
            frac *= 10;
    }
    *millis = ((h * 60 + m) * 60 + sec) * 1000 + frac;
    return true;
}

// Z, +HH:MM, -HH:MM, +HHMM or -HHMM; nothing at all means UTC.
static bool
ScanZone(const std::string& s, size_t* i, long long* offset_millis)
{
    *offset_millis = 0;
    if (*i == s.size())
        return true;
    if (Expect(s, i, 'Z'))
        return true;
    int sign;
    if (Expect(s, i, '+'))
        sign = 1;
    else if (Expect(s, i, '-'))
        sign = -1;
    else
        return false;
    int h, m;
    if (!ReadDigits(s, i, 2, &h))
        return false;
    Expect(s, i, ':');
    if (!ReadDigits(s, i, 2, &m))
        return false;
    if (h > 23 || m > 59)
        return false;
    *offset_millis = sign * (h * 60LL + m) * 60000;
    return true;
}

Date::Date(int year, int month, int day) : year_(year), month_(month), day_(day)
{
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month))
        throw std::out_of_range("invalid calendar date");
}

Date
Date::parse(const std::string& text)
{
    size_t i = 0;
    long long days;
    if (!ScanDate(text, &i, &days) || i != text.size())
        throw CoercionError("not a date: \"" + text + "\"", "Date");
    return fromEpochDays(days);
}

Date
Date::fromEpochDays(long long days)
{
    long long y;
    int m, d;
    CivilFromDays(days, &y, &m, &d);
    Date date;
    date.year_ = static_cast<int>(y);
    date.month_ = m;
    date.day_ = d;
    return date;
}

long long
Date::toEpochDays() const
{
    return DaysFromCivil(year_, month_, day_);
}

std::string
Date::toString() const
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_, month_, day_);
    return buf;
}

Time::Time(int hour, int minute, int second, int millisecond)
{
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 ||
        second > 59 || millisecond < 0 || millisecond > 999)
        throw std::out_of_range("invalid time of day");
    millis_ = ((hour * 60 + minute) * 60 + second) * 1000 + millisecond;
}

Time
Time::parse(const std::string& text)
{
    size_t i = 0;
    int millis;
    if (!ScanTime(text, &i, &millis))
        throw CoercionError("not a time: \"" + text + "\"", "Time");
    Expect(text, &i, 'Z');
    if (i != text.size())
        throw CoercionError("not a time: \"" + text + "\"", "Time");
    return fromMillisOfDay(millis);
}

Time
Time::fromMillisOfDay(int millis)
{
    if (millis < 0 || millis >= kMillisPerDay)
        throw std::out_of_range("millisecond of day out of range");
    Time time;
    time.millis_ = millis;
    return time;
}

std::string
Time::toString() const
{
    char buf[32];
    snprintf(buf,
             sizeof(buf),
             "%02d:%02d:%02d.%03dZ",
             hour(),
             minute(),
             second(),
             millisecond());
    return buf;
}

bool
DateTime::tryParse(const std::string& text, DateTime* out)
{
    size_t i = 0;
    long long days;
    if (!ScanDate(text, &i, &days))
        return false;
    if (i == text.size()) {
        out->millis_ = days * kMillisPerDay;
        return true;
    }
    if (!Expect(text, &i, 'T') && !Expect(text, &i, ' '))
        return false;
    int millis;
    long long offset;
    if (!ScanTime(text, &i, &millis) || !ScanZone(text, &i, &offset) ||
        i != text.size())
        return false;
    return tryFromEpochMillis(days * kMillisPerDay + millis - offset, out);
}

DateTime
DateTime::parse(const std::string& text)
{
    DateTime result;
    if (!tryParse(text, &result))
        throw CoercionError("not a date-time: \"" + text + "\"", "DateTime");
    return result;
}

DateTime
DateTime::fromEpochMillis(long long millis)
{
    DateTime result;
    if (!tryFromEpochMillis(millis, &result))
        throw std::out_of_range("epoch millis outside years 0000-9999");
    return result;
}

bool
DateTime::tryFromEpochMillis(long long millis, DateTime* out)
{
    if (millis < kMinEpochMillis || millis > kMaxEpochMillis)
        return false;
    out->millis_ = millis;
    return true;
}

DateTime
DateTime::of(const Date& date, const Time& time)
{
    return fromEpochMillis(date.toEpochDays() * kMillisPerDay +
                           time.toMillisOfDay());
}

Date
DateTime::date() const
{
    long long days = millis_ / kMillisPerDay;
    if (millis_ % kMillisPerDay < 0)
        --days;
    return Date::fromEpochDays(days);
}

Time
DateTime::time() const
{
    long long rem = millis_ % kMillisPerDay;
    if (rem < 0)
        rem += kMillisPerDay;
    return Time::fromMillisOfDay(static_cast<int>(rem));
}

std::string
DateTime::toString() const
{
    Date d = date();
    Time t = time();
    char buf[64];
    snprintf(buf,
             sizeof(buf),
             "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             d.year(),
             d.month(),
             d.day(),
             t.hour(),
             t.minute(),
             t.second(),
             t.millisecond());
    return buf;
}

} // namespace jn
