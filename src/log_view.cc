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
 * @file log_view.cc
 */

#include <algorithm>

#include "log_view.hh"

#include "base/lp_log.hh"
#include "config.h"

namespace logpane {

log_view::log_view(const flat_view::config& fv_cfg,
                   const timeline::config& tl_cfg,
                   time_us now)
    : lv_sizer(lv_index, fv_cfg), lv_selection(lv_store),
      lv_drag(lv_selection, lv_index), lv_timeline(tl_cfg, now),
      lv_timeline_config(tl_cfg), lv_flat_view_config(fv_cfg),
      lv_batch(make_batch({}))
{
    this->lv_store.add_listener(this);
    this->lv_timeline.set_listener(this);
}

log_view::~log_view()
{
    this->lv_store.remove_listener(this);
    this->lv_timeline.set_listener(nullptr);
}

void
log_view::set_batch(entry_batch entries)
{
    this->lv_raw_batch = std::move(entries);
    this->lv_batch = this->lv_filter.apply(this->lv_raw_batch);
    this->merge();
}

void
log_view::append_live(std::vector<log_entry> entries)
{
    for (auto& le : entries) {
        if (this->lv_filter.matches(le)) {
            this->lv_live.emplace_back(le);
        }
        this->lv_raw_live.emplace_back(std::move(le));
    }

    const auto max_live = this->lv_flat_view_config.c_max_live_entries;
    if (this->lv_raw_live.size() > max_live) {
        // trim to three quarters of the limit so this does not happen on
        // every append
        auto keep = std::max<size_t>(1, max_live - max_live / 4);
        auto excess = this->lv_raw_live.size() - keep;

        log_info("dropping the oldest %zu live entries", excess);
        this->lv_raw_live.erase(this->lv_raw_live.begin(),
                                this->lv_raw_live.begin() + excess);
        this->lv_live = this->filter_live();
        // a new batch identity makes the store start over
        this->lv_batch = this->lv_filter.apply(this->lv_raw_batch);
    }
    this->merge();
}

Result<void, std::string>
log_view::set_filter(const log_filter& lf)
{
    auto compile_res = compiled_filter::compile(lf);
    if (compile_res.isErr()) {
        return Err(compile_res.unwrapErr());
    }

    this->lv_filter = compile_res.unwrap();
    this->lv_batch = this->lv_filter.apply(this->lv_raw_batch);
    this->lv_live = this->filter_live();
    this->merge();

    return Ok();
}

std::vector<field_facet>
log_view::get_facets(std::vector<facet_field_t> fields) const
{
    facet_counter fc(std::move(fields));

    for (const auto& le : this->lv_raw_batch) {
        fc.add(le);
    }
    for (const auto& le : this->lv_raw_live) {
        fc.add(le);
    }

    return fc.finish();
}

void
log_view::entries_received(std::vector<log_entry> entries)
{
    this->append_live(std::move(entries));
}

void
log_view::stream_state_changed(const stream_state& state)
{
    this->lv_stream_state = state;
    if (this->lv_listener != nullptr) {
        this->lv_listener->stream_state_changed(*this);
    }
}

void
log_view::merge()
{
    this->lv_store.merge(this->lv_batch, this->lv_live);
}

void
log_view::entries_merged(const entry_snapshot& snapshot,
                         merge_result_t result)
{
    auto rr = this->lv_index.rebuild(snapshot);

    log_debug("entries merged: %s; rows %s (%zu)",
              merge_result_name(result),
              rebuild_result_name(rr),
              this->lv_index.size());

    this->lv_sizer.set_snapshot(snapshot);
    this->lv_sizer.rows_rebuilt(rr);
    if (result == merge_result_t::MR_APPENDED) {
        this->lv_hist.append(snapshot);
    } else {
        this->update_histogram(snapshot);
    }

    if (this->lv_listener != nullptr) {
        this->lv_listener->view_changed(*this, rr);
    }
}

void
log_view::range_committed(const timeline_state& ts)
{
    this->update_histogram(this->lv_store.snapshot());
    if (this->lv_listener != nullptr) {
        this->lv_listener->range_committed(*this);
    }
}

void
log_view::pending_changed(const timeline_state& ts)
{
    this->update_histogram(this->lv_store.snapshot());
    if (this->lv_listener != nullptr) {
        this->lv_listener->view_changed(*this, rebuild_result::rr_no_change);
    }
}

void
log_view::update_histogram(const entry_snapshot& snap)
{
    const auto& tr = this->lv_timeline.get_range();
    hist_params hp;

    hp.hp_num_buckets = this->lv_timeline_config.c_histogram_buckets;
    hp.hp_display_start = tr.tr_display_start;
    hp.hp_display_end = tr.tr_display_end;
    if (this->lv_timeline.is_editing()) {
        hp.hp_effective_start = tr.tr_pending_start;
        hp.hp_effective_end = tr.tr_pending_end;
    } else {
        hp.hp_effective_start = tr.tr_effective_start;
        hp.hp_effective_end = tr.tr_effective_end;
    }
    this->lv_hist.set_params(hp);
    this->lv_hist.compute(snap);
}

std::vector<log_entry>
log_view::filter_live() const
{
    std::vector<log_entry> retval;

    for (const auto& le : this->lv_raw_live) {
        if (this->lv_filter.matches(le)) {
            retval.emplace_back(le);
        }
    }

    return retval;
}

}  // namespace logpane
