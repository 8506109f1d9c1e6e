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
 * @file log_view.hh
 */

#ifndef logpane_log_view_hh
#define logpane_log_view_hh

#include <optional>
#include <string>
#include <vector>

#include "entry_store.hh"
#include "flat_index.hh"
#include "flat_view.cfg.hh"
#include "hist_source.hh"
#include "live_tail.hh"
#include "log_filter.hh"
#include "result.h"
#include "row_sizer.hh"
#include "selection_model.hh"
#include "stream_reconnector.hh"
#include "timeline.cfg.hh"
#include "timeline_state.hh"

namespace logpane {

/**
 * The state of one log pane: the combined entries, their flattened rows,
 * the selection, the histogram and the time range.  Every mutation happens
 * on the thread that owns the view; live results arrive through the
 * live_tail consumer interface.
 */
class log_view
    : private entry_store::listener
    , private timeline_state::listener
    , public live_tail::consumer {
public:
    class listener {
    public:
        virtual ~listener() = default;

        /** The rows or the histogram changed. */
        virtual void view_changed(const log_view& lv, rebuild_result rr) = 0;

        /** A new time range was committed and the batch should be fetched. */
        virtual void range_committed(const log_view& lv) {}

        virtual void stream_state_changed(const log_view& lv) {}
    };

    log_view(const flat_view::config& fv_cfg,
             const timeline::config& tl_cfg,
             time_us now);

    ~log_view() override;

    void set_listener(listener* l) { this->lv_listener = l; }

    /** Replace the historical entries, which resets the view. */
    void set_batch(entry_batch entries);

    /**
     * Add entries delivered by the live subscription.  Once there are more
     * live entries than the configured limit, the oldest are dropped and
     * the view is reset.
     */
    void append_live(std::vector<log_entry> entries);

    /**
     * Change the filter.  The current entries are filtered again, which
     * resets the view.  On error the previous filter stays in effect.
     */
    Result<void, std::string> set_filter(const log_filter& lf);

    const log_filter& get_filter() const
    {
        return this->lv_filter.get_filter();
    }

    /** @return The facets of the unfiltered entries. */
    std::vector<field_facet> get_facets(
        std::vector<facet_field_t> fields) const;

    entry_snapshot snapshot() const { return this->lv_store.snapshot(); }

    const entry_store& get_store() const { return this->lv_store; }

    const flat_index& get_flat_index() const { return this->lv_index; }

    row_sizer& get_row_sizer() { return this->lv_sizer; }

    selection_model& get_selection() { return this->lv_selection; }

    drag_gesture& get_drag_gesture() { return this->lv_drag; }

    const hist_source& get_histogram() const { return this->lv_hist; }

    timeline_state& get_timeline() { return this->lv_timeline; }

    const stream_state& get_stream_state() const
    {
        return this->lv_stream_state;
    }

    void entries_received(std::vector<log_entry> entries) override;

    void stream_state_changed(const stream_state& state) override;

private:
    void entries_merged(const entry_snapshot& snapshot,
                        merge_result_t result) override;

    void range_committed(const timeline_state& ts) override;

    void pending_changed(const timeline_state& ts) override;

    void merge();

    void update_histogram(const entry_snapshot& snap);

    std::vector<log_entry> filter_live() const;

    entry_store lv_store;
    flat_index lv_index;
    row_sizer lv_sizer;
    selection_model lv_selection;
    drag_gesture lv_drag;
    hist_source lv_hist;
    timeline_state lv_timeline;
    const timeline::config& lv_timeline_config;
    const flat_view::config& lv_flat_view_config;
    compiled_filter lv_filter;

    entry_batch lv_raw_batch;
    std::vector<log_entry> lv_raw_live;
    shared_batch lv_batch;
    std::vector<log_entry> lv_live;
    stream_state lv_stream_state;
    listener* lv_listener{nullptr};
};

}  // namespace logpane

#endif
