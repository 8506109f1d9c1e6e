/**
 * Copyright (c) 2026, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file time_util.cc
 */

#include <sstream>

#include "time_util.hh"

#include "config.h"

namespace logpane {

time_us
current_time_us()
{
    return std::chrono::duration_cast<time_us>(
        std::chrono::system_clock::now().time_since_epoch());
}

ssize_t
strftime_rfc3339(char* buffer, size_t buffer_size, time_us tim, char sep)
{
    if (buffer_size < 24) {
        return -1;
    }

    auto day = to_utc_day(tim);
    auto ymd = date::year_month_day{day};
    auto tod = date::make_time(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            date::sys_time<time_us>{tim} - day));
    int year = (int) ymd.year();
    auto month = (unsigned) ymd.month();
    auto mday = (unsigned) ymd.day();
    auto hour = tod.hours().count();
    auto min = tod.minutes().count();
    auto sec = tod.seconds().count();
    auto millis = tod.subseconds().count();
    int index = 0;

    buffer[index++] = '0' + ((year / 1000) % 10);
    buffer[index++] = '0' + ((year / 100) % 10);
    buffer[index++] = '0' + ((year / 10) % 10);
    buffer[index++] = '0' + ((year / 1) % 10);
    buffer[index++] = '-';
    buffer[index++] = '0' + ((month / 10) % 10);
    buffer[index++] = '0' + ((month / 1) % 10);
    buffer[index++] = '-';
    buffer[index++] = '0' + ((mday / 10) % 10);
    buffer[index++] = '0' + ((mday / 1) % 10);
    buffer[index++] = sep;
    buffer[index++] = '0' + ((hour / 10) % 10);
    buffer[index++] = '0' + ((hour / 1) % 10);
    buffer[index++] = ':';
    buffer[index++] = '0' + ((min / 10) % 10);
    buffer[index++] = '0' + ((min / 1) % 10);
    buffer[index++] = ':';
    buffer[index++] = '0' + ((sec / 10) % 10);
    buffer[index++] = '0' + ((sec / 1) % 10);
    buffer[index++] = '.';
    buffer[index++] = '0' + ((millis / 100) % 10);
    buffer[index++] = '0' + ((millis / 10) % 10);
    buffer[index++] = '0' + ((millis / 1) % 10);
    buffer[index] = '\0';

    return index;
}

std::string
to_rfc3339_string(time_us tim, char sep)
{
    char buf[64];

    strftime_rfc3339(buf, sizeof(buf), tim, sep);

    return buf;
}

std::string
to_day_string(date::sys_days day)
{
    return date::format("%F", day);
}

std::optional<time_us>
parse_utc_time(const std::string& str)
{
    static const char* FORMATS[] = {
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%M:%S",
        "%Y/%m/%d %H:%M:%S",
    };

    for (const auto* fmt : FORMATS) {
        std::istringstream in{str};
        date::sys_time<time_us> tp;

        in >> date::parse(fmt, tp);
        if (in.fail()) {
            continue;
        }
        if (in.peek() == 'Z') {
            in.get();
        }
        if (in.peek() != std::char_traits<char>::eof()) {
            continue;
        }

        return tp.time_since_epoch();
    }

    return std::nullopt;
}

}  // namespace logpane
