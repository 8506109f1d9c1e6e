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
 * @file log_entry.hh
 */

#ifndef logpane_log_entry_hh
#define logpane_log_entry_hh

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "base/time_util.hh"
#include "log_level.hh"

namespace logpane {

enum class io_type_t {
    IOT_STDOUT,
    IOT_STDERR,
    IOT_OSMO_CTRL,
    IOT_DOWNLOAD,
    IOT_UPLOAD,
};

enum class source_type_t {
    ST_USER,
    ST_OSMO,
};

const char* io_type_name(io_type_t iot);
std::optional<io_type_t> string2io_type(std::string_view str);

const char* source_type_name(source_type_t st);
std::optional<source_type_t> string2source_type(std::string_view str);

struct log_labels {
    std::optional<std::string> ll_task;
    std::optional<int> ll_retry;
    std::optional<source_type_t> ll_source;
    std::optional<io_type_t> ll_io_type;
};

/**
 * A single log message.  Entries are immutable once they are handed to the
 * entry store; they are identified by le_id and ordered by le_time.
 */
struct log_entry {
    std::string le_id;
    time_us le_time{0};
    log_level_t le_level{LEVEL_UNKNOWN};
    std::string le_message;
    log_labels le_labels;
};

using entry_batch = std::vector<log_entry>;
using shared_batch = std::shared_ptr<const entry_batch>;

inline shared_batch
make_batch(entry_batch entries)
{
    return std::make_shared<const entry_batch>(std::move(entries));
}

/**
 * Render the entry as a single line of text with its timestamp, task and
 * level.
 */
std::string to_display_line(const log_entry& le);

}  // namespace logpane

#endif
