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
 * @file hist_source.hh
 */

#ifndef logpane_hist_source_hh
#define logpane_hist_source_hh

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "base/enum_util.hh"
#include "entry_store.hh"
#include "log_level.hh"

namespace logpane {

struct hist_params {
    size_t hp_num_buckets{50};
    time_us hp_display_start{0};
    time_us hp_display_end{0};
    std::optional<time_us> hp_effective_start;
    std::optional<time_us> hp_effective_end;
};

struct hist_bucket {
    time_us hb_start{0};
    std::array<size_t, LEVEL__MAX> hb_counts{};
    size_t hb_total{0};
    bool hb_in_effective_range{false};

    size_t count_for(log_level_t level) const
    {
        return this->hb_counts[level];
    }

    bool empty() const { return this->hb_total == 0; }
};

/**
 * Count the entries in each time bucket of the display range.  Entries with
 * a time outside of [display start, display end) are not counted.  Entries
 * without a level are counted as "info".
 */
std::vector<hist_bucket> compute_histogram(const entry_snapshot& snap,
                                           const hist_params& params);

/**
 * Derive a display range that covers all of the entries, using buckets of
 * at least the given minimum width that are aligned to that width.
 */
hist_params auto_hist_params(const entry_snapshot& snap,
                             size_t num_buckets,
                             std::chrono::microseconds min_width);

/**
 * The histogram of the entries for the current range, along with a text
 * rendering of it.
 */
class hist_source {
public:
    void set_params(const hist_params& params) { this->hs_params = params; }

    const hist_params& get_params() const { return this->hs_params; }

    void compute(const entry_snapshot& snap);

    /**
     * Count the entries appended to the snapshot since the last compute()
     * or append().  A snapshot from a new generation is computed in full.
     */
    void append(const entry_snapshot& snap);

    const std::vector<hist_bucket>& get_buckets() const
    {
        return this->hs_buckets;
    }

    size_t get_total() const;

    std::chrono::microseconds get_bucket_width() const;

    std::optional<size_t> row_for_time(time_us tim) const;

    std::optional<time_us> time_for_row(size_t row) const;

    /**
     * Render one line per bucket with the bucket time, the per-level counts
     * and a bar scaled to the largest bucket.  Buckets outside of the
     * effective range are prefixed with a dash.
     */
    std::vector<std::string> render_rows(size_t bar_width = 20) const;

private:
    hist_params hs_params;
    std::vector<hist_bucket> hs_buckets;
    uint64_t hs_generation{0};
    size_t hs_entry_count{0};
};

}  // namespace logpane

#endif
