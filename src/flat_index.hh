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
 * @file flat_index.hh
 */

#ifndef logpane_flat_index_hh
#define logpane_flat_index_hh

#include <cstdint>
#include <optional>
#include <vector>

#include "date/date.h"
#include "entry_store.hh"
#include "mapbox/variant.hpp"

namespace logpane {

struct entry_item {
    size_t ei_entry_index;

    bool operator==(const entry_item& other) const
    {
        return this->ei_entry_index == other.ei_entry_index;
    }
};

/**
 * Marks the start of a new UTC day.  The separator precedes the entry at
 * si_entry_index, which is the first entry of that day.
 */
struct separator_item {
    date::sys_days si_date;
    size_t si_entry_index;

    bool operator==(const separator_item& other) const
    {
        return this->si_date == other.si_date
            && this->si_entry_index == other.si_entry_index;
    }
};

using flat_item = mapbox::util::variant<entry_item, separator_item>;

enum class rebuild_result {
    rr_no_change,
    rr_appended_lines,
    rr_full_rebuild,
};

const char* rebuild_result_name(rebuild_result rr);

/**
 * Flatten all of the entries in one pass.
 */
std::vector<flat_item> flatten_entries(const entry_snapshot& snap);

/**
 * The flattened, renderable form of the entry sequence: entries with a date
 * separator wherever the UTC day changes.
 *
 * The index remembers the generation and size of the snapshot it was built
 * from.  When the next snapshot has the same generation and more entries,
 * only the new suffix is processed.  A different generation means the
 * entries were replaced and the whole index is rebuilt.
 */
class flat_index {
public:
    rebuild_result rebuild(const entry_snapshot& snap);

    size_t size() const { return this->fi_items.size(); }

    bool empty() const { return this->fi_items.empty(); }

    const flat_item& operator[](size_t row) const
    {
        return this->fi_items[row];
    }

    const std::vector<flat_item>& get_items() const { return this->fi_items; }

    uint64_t get_generation() const { return this->fi_generation; }

    size_t get_entry_count() const { return this->fi_entry_count; }

    /**
     * @return The entry displayed at the given row or, for a separator, the
     *   entry that follows it.
     */
    std::optional<size_t> entry_for_row(size_t row) const;

    std::optional<size_t> row_for_entry(size_t entry_index) const;

    /**
     * @return The row of the separator heading the day that contains the
     *   given row, used for a sticky date header.
     */
    std::optional<size_t> separator_for_row(size_t row) const;

    const std::vector<size_t>& get_separator_rows() const
    {
        return this->fi_separator_rows;
    }

private:
    void clear();

    void append_entries(const entry_snapshot& snap, size_t start);

    std::vector<flat_item> fi_items;
    std::vector<size_t> fi_separator_rows;
    std::vector<size_t> fi_entry_rows;
    std::optional<date::sys_days> fi_last_date;
    size_t fi_entry_count{0};
    uint64_t fi_generation{0};
    bool fi_built{false};
};

}  // namespace logpane

#endif
