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
 * @file log_parser.cc
 */

#include <algorithm>
#include <charconv>

#include "log_parser.hh"

#include <ctype.h>

#include "base/lp_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace logpane {

static const auto& TIMESTAMP_RE()
{
    static const auto retval = pcre2pp::code::from_const(
        R"(^(\d{4})/(\d{2})/(\d{2}) (\d{2}):(\d{2}):(\d{2}) ?)");

    return retval;
}

static const auto& TASK_RE()
{
    static const auto retval
        = pcre2pp::code::from_const(R"(^\[([^\]\s]+)(?:\s+retry-(\d+))?\])");

    return retval;
}

static const auto& LEVEL_RE()
{
    static const auto retval = pcre2pp::code::from_const(
        R"(^\s*\[?(DEBUG|INFO|WARN(?:ING)?|ERROR|FATAL|CRITICAL)\]?(?::|\s|$))");

    return retval;
}

static constexpr std::string_view OSMO_MARKER = "[osmo]";

template<typename T>
static T
to_number(std::string_view sv)
{
    T retval{};

    std::from_chars(sv.data(), sv.data() + sv.size(), retval);

    return retval;
}

log_level_t
detect_level(std::string_view msg)
{
    auto md = LEVEL_RE().find_in(msg);

    if (!md) {
        return LEVEL_UNKNOWN;
    }

    auto token = md.value()[1].value();

    return abbrev2level(token.data(), token.size());
}

std::string
log_line_parser::next_id(const char* prefix, time_us tim)
{
    this->lp_id_counter += 1;

    return fmt::format(FMT_STRING("{}{}-{}"),
                       prefix,
                       to_mstime(tim).count(),
                       this->lp_id_counter);
}

log_entry
log_line_parser::parse_dump_line(std::string_view line)
{
    log_entry retval;

    retval.le_time = this->lp_clock();
    retval.le_id = this->next_id("dump-", retval.le_time);
    retval.le_message = std::string(line);
    scrub_ansi_string(retval.le_message);
    retval.le_level = detect_level(retval.le_message);
    retval.le_labels.ll_io_type = io_type_t::IOT_STDOUT;
    retval.le_labels.ll_source = source_type_t::ST_USER;

    return retval;
}

std::optional<log_entry>
log_line_parser::parse_line(std::string_view line)
{
    if (trim(line).empty()) {
        return std::nullopt;
    }

    if (!isdigit((unsigned char) line[0])) {
        return this->parse_dump_line(line);
    }

    auto ts_md = TIMESTAMP_RE().find_in(line);
    if (!ts_md) {
        return this->parse_dump_line(line);
    }

    const auto& ts = ts_md.value();
    auto ymd = date::year{to_number<int>(ts[1].value())}
        / date::month{to_number<unsigned>(ts[2].value())}
        / date::day{to_number<unsigned>(ts[3].value())};
    auto hours = to_number<int>(ts[4].value());
    auto mins = to_number<int>(ts[5].value());
    auto secs = to_number<int>(ts[6].value());

    if (!ymd.ok() || hours > 23 || mins > 59 || secs > 60) {
        log_debug("invalid timestamp in line: %.*s",
                  (int) std::min(line.size(), (size_t) 32),
                  line.data());
        return this->parse_dump_line(line);
    }

    auto after_ts = ts.remaining();
    auto task_md = TASK_RE().find_in(after_ts);
    if (!task_md) {
        return this->parse_dump_line(line);
    }

    log_entry retval;

    retval.le_time = date::sys_days{ymd}.time_since_epoch()
        + std::chrono::hours{hours} + std::chrono::minutes{mins}
        + std::chrono::seconds{secs};
    retval.le_id = this->next_id("", retval.le_time);

    const auto& task = task_md.value();
    retval.le_labels.ll_task = std::string(task[1].value());
    retval.le_labels.ll_retry
        = task[2] ? to_number<int>(task[2].value()) : 0;

    auto rest = task.remaining();
    auto is_osmo = startswith(rest, OSMO_MARKER);
    if (is_osmo) {
        rest.remove_prefix(OSMO_MARKER.size());
    }

    retval.le_message = std::string(rest);
    scrub_ansi_string(retval.le_message);
    retval.le_level = detect_level(retval.le_message);
    retval.le_labels.ll_io_type
        = is_osmo ? io_type_t::IOT_OSMO_CTRL : io_type_t::IOT_STDOUT;
    retval.le_labels.ll_source
        = is_osmo ? source_type_t::ST_OSMO : source_type_t::ST_USER;

    return retval;
}

entry_batch
log_line_parser::parse_batch(std::string_view text)
{
    entry_batch retval;

    for (const auto& line : split_lines(text)) {
        auto le_opt = this->parse_line(line);

        if (le_opt) {
            retval.emplace_back(std::move(le_opt.value()));
        }
    }

    log_debug("parsed %zu entries from %zu bytes", retval.size(), text.size());

    return retval;
}

}  // namespace logpane
