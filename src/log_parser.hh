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
 * @file log_parser.hh
 */

#ifndef logpane_log_parser_hh
#define logpane_log_parser_hh

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "log_entry.hh"

namespace logpane {

/**
 * Parser for the workflow log format:
 *
 *   YYYY/MM/DD HH:MM:SS [task] message
 *   YYYY/MM/DD HH:MM:SS [task retry-N] message
 *   YYYY/MM/DD HH:MM:SS [task][osmo] message
 *
 * Timestamps are UTC.  Lines that do not follow the format are kept as
 * "dump" entries stamped with the time they were parsed.
 */
class log_line_parser {
public:
    using clock_func = std::function<time_us()>;

    explicit log_line_parser(clock_func clock = current_time_us)
        : lp_clock(std::move(clock))
    {
    }

    /**
     * @return The parsed entry or nullopt if the line is blank.
     */
    std::optional<log_entry> parse_line(std::string_view line);

    /**
     * Parse newline-separated text, skipping blank lines.  The entries are
     * returned in the order of the input.
     */
    entry_batch parse_batch(std::string_view text);

    void reset_ids() { this->lp_id_counter = 0; }

private:
    log_entry parse_dump_line(std::string_view line);

    std::string next_id(const char* prefix, time_us tim);

    clock_func lp_clock;
    uint64_t lp_id_counter{0};
};

/**
 * Detect a leading level token, like "ERROR" or "[WARN]", in a message.
 */
log_level_t detect_level(std::string_view msg);

}  // namespace logpane

#endif
