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
 * @file time_util.hh
 */

#ifndef logpane_time_util_hh
#define logpane_time_util_hh

#include <chrono>
#include <optional>
#include <string>

#include <sys/time.h>

#include "date/date.h"

namespace logpane {

/** Instants are kept as microseconds since the UNIX epoch in UTC. */
using time_us = std::chrono::microseconds;

time_us current_time_us();

inline std::chrono::milliseconds
to_mstime(time_us tim)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tim);
}

/**
 * @return The UTC calendar day containing the given instant.
 */
inline date::sys_days
to_utc_day(time_us tim)
{
    return date::floor<date::days>(date::sys_time<time_us>{tim});
}

ssize_t strftime_rfc3339(char* buffer,
                         size_t buffer_size,
                         time_us tim,
                         char sep = ' ');

std::string to_rfc3339_string(time_us tim, char sep = ' ');

std::string to_day_string(date::sys_days day);

/**
 * Parse a UTC timestamp in one of the forms "YYYY-MM-DD HH:MM:SS",
 * "YYYY-MM-DDTHH:MM:SS[.fff][Z]" or "YYYY/MM/DD HH:MM:SS".
 */
std::optional<time_us> parse_utc_time(const std::string& str);

}  // namespace logpane

#endif
