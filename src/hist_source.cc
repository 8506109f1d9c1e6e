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
 * @file hist_source.cc
 */

#include <algorithm>
#include <chrono>
#include <iterator>

#include "hist_source.hh"

#include "base/lp_log.hh"
#include "base/math_util.hh"
#include "base/time_util.hh"
#include "config.h"
#include "fmt/format.h"

using namespace std::chrono_literals;

namespace logpane {

/**
 * Bucket starts are rounded up and entry offsets are rounded down so that
 * an entry always lands in the bucket whose start precedes it.
 */
static time_us
bucket_start_for(const hist_params& params, size_t index)
{
    const auto range = (params.hp_display_end - params.hp_display_start).count();
    const auto num_buckets = (int64_t) params.hp_num_buckets;

    return params.hp_display_start
        + time_us{(range * (int64_t) index + num_buckets - 1) / num_buckets};
}

static std::optional<size_t>
bucket_index_for(const hist_params& params, time_us tim)
{
    if (params.hp_num_buckets == 0 || tim < params.hp_display_start
        || tim >= params.hp_display_end)
    {
        return std::nullopt;
    }

    const auto range = (params.hp_display_end - params.hp_display_start).count();
    const auto offset = (tim - params.hp_display_start).count();

    return std::min<size_t>(
        offset * (int64_t) params.hp_num_buckets / range,
        params.hp_num_buckets - 1);
}

static void
count_entry(std::vector<hist_bucket>& buckets,
            const hist_params& params,
            const log_entry& le)
{
    auto index = bucket_index_for(params, le.le_time);

    if (!index) {
        return;
    }

    auto& bucket = buckets[index.value()];
    bucket.hb_counts[effective_level(le.le_level)] += 1;
    bucket.hb_total += 1;
}

std::vector<hist_bucket>
compute_histogram(const entry_snapshot& snap, const hist_params& params)
{
    std::vector<hist_bucket> retval;

    if (params.hp_num_buckets == 0
        || params.hp_display_end <= params.hp_display_start)
    {
        return retval;
    }

    retval.resize(params.hp_num_buckets);
    for (size_t lpc = 0; lpc < retval.size(); lpc++) {
        auto& bucket = retval[lpc];
        auto bucket_start = bucket_start_for(params, lpc);
        auto bucket_end = bucket_start_for(params, lpc + 1);

        bucket.hb_start = bucket_start;
        bucket.hb_in_effective_range
            = (!params.hp_effective_start
               || bucket_start >= params.hp_effective_start.value())
            && (!params.hp_effective_end
                || bucket_end <= params.hp_effective_end.value());
    }

    for (const auto& le : snap) {
        count_entry(retval, params, le);
    }

    return retval;
}

hist_params
auto_hist_params(const entry_snapshot& snap,
                 size_t num_buckets,
                 std::chrono::microseconds min_width)
{
    hist_params retval;

    if (snap.empty() || num_buckets == 0) {
        return retval;
    }

    auto min_time = snap[0].le_time;
    auto max_time = min_time;
    for (const auto& le : snap) {
        min_time = std::min(min_time, le.le_time);
        max_time = std::max(max_time, le.le_time);
    }

    auto width = min_width;
    auto range = max_time - min_time;
    if (range.count() > 0) {
        auto per_bucket = time_us{(range.count() + (int64_t) num_buckets - 1)
                                  / (int64_t) num_buckets};
        width = std::max(width, per_bucket);
    }

    auto first = rounddown(min_time.count(), width.count());
    auto last = rounddown(max_time.count(), width.count());

    retval.hp_display_start = time_us{first};
    retval.hp_display_end = time_us{last} + width;
    retval.hp_num_buckets = (last - first) / width.count() + 1;

    return retval;
}

void
hist_source::compute(const entry_snapshot& snap)
{
    this->hs_buckets = compute_histogram(snap, this->hs_params);
    this->hs_generation = snap.generation();
    this->hs_entry_count = snap.size();

    log_trace("histogram computed: buckets=%zu total=%zu",
              this->hs_buckets.size(),
              this->get_total());
}

void
hist_source::append(const entry_snapshot& snap)
{
    if (snap.generation() != this->hs_generation
        || snap.size() < this->hs_entry_count)
    {
        this->compute(snap);
        return;
    }

    if (!this->hs_buckets.empty()) {
        for (auto lpc = this->hs_entry_count; lpc < snap.size(); lpc++) {
            count_entry(this->hs_buckets, this->hs_params, snap[lpc]);
        }
    }

    log_trace("histogram appended: %zu entries",
              snap.size() - this->hs_entry_count);
    this->hs_entry_count = snap.size();
}

size_t
hist_source::get_total() const
{
    size_t retval = 0;

    for (const auto& bucket : this->hs_buckets) {
        retval += bucket.hb_total;
    }

    return retval;
}

std::chrono::microseconds
hist_source::get_bucket_width() const
{
    if (this->hs_params.hp_num_buckets == 0) {
        return 0us;
    }

    return (this->hs_params.hp_display_end - this->hs_params.hp_display_start)
        / (int64_t) this->hs_params.hp_num_buckets;
}

std::optional<size_t>
hist_source::row_for_time(time_us tim) const
{
    if (this->hs_buckets.empty()) {
        return std::nullopt;
    }

    return bucket_index_for(this->hs_params, tim);
}

std::optional<time_us>
hist_source::time_for_row(size_t row) const
{
    if (row >= this->hs_buckets.size()) {
        return std::nullopt;
    }

    return this->hs_buckets[row].hb_start;
}

std::vector<std::string>
hist_source::render_rows(size_t bar_width) const
{
    std::vector<std::string> retval;
    size_t max_total = 0;

    for (const auto& bucket : this->hs_buckets) {
        max_total = std::max(max_total, bucket.hb_total);
    }

    for (const auto& bucket : this->hs_buckets) {
        std::string value_out;

        value_out.push_back(bucket.hb_in_effective_range ? ' ' : '-');
        value_out.append(date::format(
            "%a %b %d %H:%M:%S %Y ",
            date::floor<std::chrono::seconds>(
                date::sys_time<time_us>{bucket.hb_start})));
        fmt::format_to(std::back_inserter(value_out),
                       FMT_STRING(" {:6} errors  {:6} warnings  {:6} total "),
                       bucket.count_for(LEVEL_ERROR)
                           + bucket.count_for(LEVEL_FATAL),
                       bucket.count_for(LEVEL_WARNING),
                       bucket.hb_total);

        size_t bar_len = 0;
        if (max_total > 0) {
            bar_len = (bucket.hb_total * bar_width + max_total - 1) / max_total;
        }
        value_out.append(bar_len, '#');

        retval.emplace_back(std::move(value_out));
    }

    return retval;
}

}  // namespace logpane
