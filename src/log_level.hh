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
 * @file log_level.hh
 */

#ifndef logpane_log_level_hh
#define logpane_log_level_hh

#include <array>
#include <optional>
#include <string_view>

#include <sys/types.h>

#include "base/log_level_enum.hh"

extern const std::array<const char*, LEVEL__MAX> level_names;

constexpr size_t MAX_LEVEL_NAME_LEN = 7;

/**
 * Map a level token, such as "ERR", "Warning" or "I", to a level.  Only the
 * first character is significant except for distinguishing "FATAL" from
 * other 'F' words.
 */
log_level_t abbrev2level(const char* levelstr, ssize_t len = -1);

/**
 * Map a full level name, case-insensitively, to a level.
 */
std::optional<log_level_t> string2level(std::string_view levelstr);

/**
 * Levels that are not known count as "info" in filters and charts.
 */
inline log_level_t
effective_level(log_level_t level)
{
    return level == LEVEL_UNKNOWN ? LEVEL_INFO : level;
}

#endif
