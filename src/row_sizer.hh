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
 * @file row_sizer.hh
 */

#ifndef logpane_row_sizer_hh
#define logpane_row_sizer_hh

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "entry_store.hh"
#include "flat_index.hh"
#include "flat_view.cfg.hh"

namespace logpane {

/**
 * The windowed-rendering host.  It decides which rows are visible and may
 * cache row positions keyed by flat index; those caches must be dropped
 * when the rows are replaced.
 */
class view_host {
public:
    virtual ~view_host() = default;

    virtual void invalidate_measurements() = 0;

    /**
     * Rows before the given one kept their size, only the rest need to be
     * measured again.
     */
    virtual void invalidate_measurements_from(size_t row)
    {
        this->invalidate_measurements();
    }
};

/**
 * Supplies the static size estimate for each flattened row and keeps the
 * host's measurement cache consistent with the flat index.
 */
class row_sizer {
public:
    row_sizer(const flat_index& fi, const flat_view::config& cfg)
        : rs_index(fi), rs_config(cfg)
    {
    }

    void set_host(view_host* host) { this->rs_host = host; }

    void set_snapshot(entry_snapshot snap)
    {
        this->rs_snapshot = std::move(snap);
    }

    int64_t estimate_size(size_t row) const;

    /**
     * Called after the flat index was rebuilt.  Only a full rebuild makes
     * the host drop its cached positions.
     */
    void rows_rebuilt(rebuild_result rr);

    bool is_expanded(const std::string& id) const
    {
        return this->rs_expanded.count(id) > 0;
    }

    /**
     * Toggle the expanded state of the entry shown at the given row.
     *
     * @return True if the row is now expanded.
     */
    bool toggle_expanded(size_t row);

    size_t get_invalidation_count() const
    {
        return this->rs_invalidation_count;
    }

private:
    const flat_index& rs_index;
    const flat_view::config& rs_config;
    entry_snapshot rs_snapshot;
    std::unordered_set<std::string> rs_expanded;
    view_host* rs_host{nullptr};
    size_t rs_invalidation_count{0};
};

/**
 * A host that keeps running row offsets, computed lazily from a size
 * function, and answers which rows are visible for a scroll position.
 */
class offset_cache : public view_host {
public:
    using size_func = std::function<int64_t(size_t)>;

    struct visible_range {
        size_t vr_start{0};
        size_t vr_end{0};

        bool empty() const { return this->vr_start >= this->vr_end; }
    };

    explicit offset_cache(size_func sf) : oc_size_func(std::move(sf)) {}

    void invalidate_measurements() override;

    void invalidate_measurements_from(size_t row) override;

    int64_t offset_for_row(size_t row);

    int64_t total_size(size_t row_count);

    /**
     * @return The rows overlapping [scroll_offset, scroll_offset + height),
     *   widened by the given overscan on each side.
     */
    visible_range visible_rows(int64_t scroll_offset,
                               int64_t height,
                               size_t row_count,
                               size_t overscan = 0);

    size_t get_cached_rows() const { return this->oc_offsets.size(); }

private:
    void extend_to(size_t row);

    size_func oc_size_func;
    /** oc_offsets[N] is the offset of the start of row N. */
    std::vector<int64_t> oc_offsets;
};

}  // namespace logpane

#endif
