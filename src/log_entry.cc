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
 * @file log_entry.cc
 */

#include <iterator>

#include "log_entry.hh"

#include "fmt/format.h"
#include "config.h"

namespace logpane {

static const struct {
    io_type_t iot;
    const char* name;
} IO_TYPE_NAMES[] = {
    {io_type_t::IOT_STDOUT, "stdout"},
    {io_type_t::IOT_STDERR, "stderr"},
    {io_type_t::IOT_OSMO_CTRL, "osmo_ctrl"},
    {io_type_t::IOT_DOWNLOAD, "download"},
    {io_type_t::IOT_UPLOAD, "upload"},
};

const char*
io_type_name(io_type_t iot)
{
    for (const auto& iotn : IO_TYPE_NAMES) {
        if (iotn.iot == iot) {
            return iotn.name;
        }
    }

    return "unknown";
}

std::optional<io_type_t>
string2io_type(std::string_view str)
{
    for (const auto& iotn : IO_TYPE_NAMES) {
        if (str == iotn.name) {
            return iotn.iot;
        }
    }

    return std::nullopt;
}

const char*
source_type_name(source_type_t st)
{
    switch (st) {
        case source_type_t::ST_USER:
            return "user";
        case source_type_t::ST_OSMO:
            return "osmo";
    }

    return "unknown";
}

std::optional<source_type_t>
string2source_type(std::string_view str)
{
    if (str == "user") {
        return source_type_t::ST_USER;
    }
    if (str == "osmo") {
        return source_type_t::ST_OSMO;
    }

    return std::nullopt;
}

std::string
to_display_line(const log_entry& le)
{
    std::string retval = to_rfc3339_string(le.le_time);

    if (le.le_labels.ll_task) {
        if (le.le_labels.ll_retry.value_or(0) > 0) {
            fmt::format_to(std::back_inserter(retval),
                           FMT_STRING(" [{} retry-{}]"),
                           le.le_labels.ll_task.value(),
                           le.le_labels.ll_retry.value());
        } else {
            fmt::format_to(std::back_inserter(retval),
                           FMT_STRING(" [{}]"),
                           le.le_labels.ll_task.value());
        }
    }
    if (le.le_level != LEVEL_UNKNOWN) {
        fmt::format_to(std::back_inserter(retval),
                       FMT_STRING(" {:>{}}"),
                       level_names[le.le_level],
                       MAX_LEVEL_NAME_LEN);
    }
    retval.push_back(' ');
    retval.append(le.le_message);

    return retval;
}

}  // namespace logpane
