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
 * @file flat_index.cc
 */

#include <algorithm>
#include <iterator>

#include "flat_index.hh"

#include "base/lp_log.hh"
#include "config.h"

namespace logpane {

const char*
rebuild_result_name(rebuild_result rr)
{
    switch (rr) {
        case rebuild_result::rr_no_change:
            return "no-change";
        case rebuild_result::rr_appended_lines:
            return "appended-lines";
        case rebuild_result::rr_full_rebuild:
            return "full-rebuild";
    }

    return "unknown";
}

std::vector<flat_item>
flatten_entries(const entry_snapshot& snap)
{
    std::vector<flat_item> retval;
    std::optional<date::sys_days> last_date;
    size_t index = 0;

    retval.reserve(snap.size());
    for (const auto& le : snap) {
        auto day = to_utc_day(le.le_time);

        if (!last_date || day != last_date.value()) {
            retval.emplace_back(separator_item{day, index});
            last_date = day;
        }
        retval.emplace_back(entry_item{index});
        index += 1;
    }

    return retval;
}

void
flat_index::clear()
{
    this->fi_items.clear();
    this->fi_separator_rows.clear();
    this->fi_entry_rows.clear();
    this->fi_last_date = std::nullopt;
    this->fi_entry_count = 0;
}

void
flat_index::append_entries(const entry_snapshot& snap, size_t start)
{
    for (size_t lpc = start; lpc < snap.size(); lpc++) {
        auto day = to_utc_day(snap[lpc].le_time);

        if (!this->fi_last_date || day != this->fi_last_date.value()) {
            this->fi_separator_rows.emplace_back(this->fi_items.size());
            this->fi_items.emplace_back(separator_item{day, lpc});
            this->fi_last_date = day;
        }
        this->fi_entry_rows.emplace_back(this->fi_items.size());
        this->fi_items.emplace_back(entry_item{lpc});
    }
    this->fi_entry_count = snap.size();
}

rebuild_result
flat_index::rebuild(const entry_snapshot& snap)
{
    if (!this->fi_built || snap.generation() != this->fi_generation
        || snap.size() < this->fi_entry_count)
    {
        if (this->fi_built && snap.generation() == this->fi_generation) {
            log_warning("entry count shrank from %zu to %zu without a reset",
                        this->fi_entry_count,
                        snap.size());
        }

        this->clear();
        this->fi_items.reserve(snap.size() + snap.size() / 16 + 1);
        this->fi_entry_rows.reserve(snap.size());
        this->append_entries(snap, 0);
        this->fi_generation = snap.generation();
        this->fi_built = true;

        log_debug("flat index rebuilt: generation=%llu entries=%zu rows=%zu",
                  (unsigned long long) this->fi_generation,
                  this->fi_entry_count,
                  this->fi_items.size());
        return rebuild_result::rr_full_rebuild;
    }

    if (snap.size() == this->fi_entry_count) {
        return rebuild_result::rr_no_change;
    }

    auto old_count = this->fi_entry_count;
    this->append_entries(snap, old_count);

    log_trace("flat index appended %zu entries", snap.size() - old_count);

    return rebuild_result::rr_appended_lines;
}

std::optional<size_t>
flat_index::entry_for_row(size_t row) const
{
    if (row >= this->fi_items.size()) {
        return std::nullopt;
    }

    return this->fi_items[row].match(
        [](const entry_item& ei) -> std::optional<size_t> {
            return ei.ei_entry_index;
        },
        [](const separator_item& si) -> std::optional<size_t> {
            return si.si_entry_index;
        });
}

std::optional<size_t>
flat_index::row_for_entry(size_t entry_index) const
{
    if (entry_index >= this->fi_entry_rows.size()) {
        return std::nullopt;
    }

    return this->fi_entry_rows[entry_index];
}

std::optional<size_t>
flat_index::separator_for_row(size_t row) const
{
    if (row >= this->fi_items.size() || this->fi_separator_rows.empty()) {
        return std::nullopt;
    }

    auto iter = std::upper_bound(
        this->fi_separator_rows.begin(), this->fi_separator_rows.end(), row);
    if (iter == this->fi_separator_rows.begin()) {
        return std::nullopt;
    }

    return *std::prev(iter);
}

}  // namespace logpane
