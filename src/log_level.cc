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
 * @file log_level.cc
 */

#include "log_level.hh"

#include <ctype.h>
#include <string.h>
#include <strings.h>

#include "config.h"

const std::array<const char*, LEVEL__MAX> level_names = {
    "unknown",
    "debug",
    "info",
    "warning",
    "error",
    "fatal",
};

log_level_t
abbrev2level(const char* levelstr, ssize_t len)
{
    if (len == -1) {
        len = strlen(levelstr);
    }

    if (len == 0 || levelstr[0] == '\0') {
        return LEVEL_UNKNOWN;
    }

    switch (toupper(levelstr[0])) {
        case 'D':
        case 'T':
        case 'V':
            return LEVEL_DEBUG;
        case 'I':
        case 'N':
            return LEVEL_INFO;
        case 'W':
            return LEVEL_WARNING;
        case 'E':
            return LEVEL_ERROR;
        case 'C':
            return LEVEL_FATAL;
        case 'F':
            if (len >= 2 && toupper(levelstr[1]) == 'A') {
                return LEVEL_FATAL;
            }
            return LEVEL_UNKNOWN;
        default:
            return LEVEL_UNKNOWN;
    }
}

std::optional<log_level_t>
string2level(std::string_view levelstr)
{
    for (int lpc = 0; lpc < LEVEL__MAX; lpc++) {
        if (levelstr.length() == strlen(level_names[lpc])
            && strncasecmp(levelstr.data(), level_names[lpc], levelstr.length())
                == 0)
        {
            return (log_level_t) lpc;
        }
    }
    if (levelstr.length() == 4 && strncasecmp(levelstr.data(), "warn", 4) == 0)
    {
        return LEVEL_WARNING;
    }

    return std::nullopt;
}
