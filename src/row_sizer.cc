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
 * @file row_sizer.cc
 */

#include <algorithm>

#include "row_sizer.hh"

#include "base/lp_log.hh"
#include "config.h"

namespace logpane {

int64_t
row_sizer::estimate_size(size_t row) const
{
    if (row >= this->rs_index.size()) {
        return this->rs_config.c_row_height;
    }

    return this->rs_index[row].match(
        [this](const entry_item& ei) {
            if (!this->rs_expanded.empty()
                && ei.ei_entry_index < this->rs_snapshot.size()
                && this->is_expanded(
                    this->rs_snapshot[ei.ei_entry_index].le_id))
            {
                return this->rs_config.c_expanded_row_height;
            }
            return this->rs_config.c_row_height;
        },
        [this](const separator_item&) {
            return this->rs_config.c_separator_height;
        });
}

void
row_sizer::rows_rebuilt(rebuild_result rr)
{
    if (rr != rebuild_result::rr_full_rebuild) {
        return;
    }

    this->rs_invalidation_count += 1;
    if (this->rs_host != nullptr) {
        this->rs_host->invalidate_measurements();
    }
}

bool
row_sizer::toggle_expanded(size_t row)
{
    if (row >= this->rs_index.size()) {
        return false;
    }

    const auto& item = this->rs_index[row];
    if (!item.is<entry_item>()) {
        return false;
    }

    auto entry_index = item.get<entry_item>().ei_entry_index;
    if (entry_index >= this->rs_snapshot.size()) {
        return false;
    }

    const auto& id = this->rs_snapshot[entry_index].le_id;
    bool retval;

    if (this->rs_expanded.erase(id) > 0) {
        retval = false;
    } else {
        this->rs_expanded.emplace(id);
        retval = true;
    }

    if (this->rs_host != nullptr) {
        this->rs_host->invalidate_measurements_from(row);
    }

    return retval;
}

void
offset_cache::invalidate_measurements()
{
    this->oc_offsets.clear();
}

void
offset_cache::invalidate_measurements_from(size_t row)
{
    if (row + 1 < this->oc_offsets.size()) {
        this->oc_offsets.resize(row + 1);
    }
}

void
offset_cache::extend_to(size_t row)
{
    if (this->oc_offsets.empty()) {
        this->oc_offsets.emplace_back(0);
    }
    while (this->oc_offsets.size() <= row) {
        auto last_row = this->oc_offsets.size() - 1;

        this->oc_offsets.emplace_back(this->oc_offsets.back()
                                      + this->oc_size_func(last_row));
    }
}

int64_t
offset_cache::offset_for_row(size_t row)
{
    this->extend_to(row);

    return this->oc_offsets[row];
}

int64_t
offset_cache::total_size(size_t row_count)
{
    return this->offset_for_row(row_count);
}

offset_cache::visible_range
offset_cache::visible_rows(int64_t scroll_offset,
                           int64_t height,
                           size_t row_count,
                           size_t overscan)
{
    visible_range retval;

    if (row_count == 0 || height <= 0) {
        return retval;
    }

    this->extend_to(row_count);

    auto begin = this->oc_offsets.begin();
    auto end = begin + row_count + 1;
    auto first = std::upper_bound(begin, end, scroll_offset);
    size_t start_row = first == begin ? 0 : (first - begin) - 1;
    auto last = std::lower_bound(begin, end, scroll_offset + height);
    size_t end_row = std::min((size_t) (last - begin), row_count);

    if (start_row >= row_count) {
        start_row = row_count - 1;
    }
    retval.vr_start = start_row > overscan ? start_row - overscan : 0;
    retval.vr_end = std::min(row_count, end_row + overscan);

    return retval;
}

}  // namespace logpane
