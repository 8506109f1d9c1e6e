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
 * @file test_log_view.cc
 */

#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "log_view.hh"

using namespace logpane;
using namespace std::chrono_literals;

namespace {

struct view_recorder : log_view::listener {
    void view_changed(const log_view& lv, rebuild_result rr) override
    {
        this->vr_results.emplace_back(rr);
    }

    void range_committed(const log_view& lv) override
    {
        this->vr_committed += 1;
    }

    void stream_state_changed(const log_view& lv) override
    {
        this->vr_stream_changes += 1;
    }

    std::vector<rebuild_result> vr_results;
    int vr_committed{0};
    int vr_stream_changes{0};
};

struct view_fixture {
    view_fixture() : vf_view(this->vf_flat_config, this->vf_timeline_config, NOW)
    {
        this->vf_view.set_listener(&this->vf_recorder);
        this->vf_view.get_timeline().set_entity_bounds(
            utc(2024, 1, 1, 23, 0, 0), utc(2024, 1, 2, 1, 0, 0), NOW);
    }

    static const time_us NOW;

    flat_view::config vf_flat_config;
    timeline::config vf_timeline_config;
    view_recorder vf_recorder;
    log_view vf_view;
};

const time_us view_fixture::NOW = utc(2024, 1, 2, 12, 0, 0);

entry_batch
history()
{
    return {
        make_entry("h1", utc(2024, 1, 1, 23, 30, 0)),
        make_entry("h2", utc(2024, 1, 2, 0, 30, 0)),
    };
}

}  // namespace

TEST_CASE("log_view batch and live entries")
{
    view_fixture vf;
    auto& lv = vf.vf_view;

    lv.set_batch(history());
    REQUIRE(vf.vf_recorder.vr_results.size() == 1);
    CHECK(vf.vf_recorder.vr_results[0] == rebuild_result::rr_full_rebuild);
    CHECK(lv.get_flat_index().size() == 4);
    CHECK(lv.get_histogram().get_total() == 2);
    CHECK(lv.get_histogram().get_buckets().size()
          == vf.vf_timeline_config.c_histogram_buckets);

    lv.append_live({
        make_entry("l1", utc(2024, 1, 2, 0, 45, 0), LEVEL_ERROR),
        make_entry("l2", utc(2024, 1, 2, 0, 50, 0)),
    });
    REQUIRE(vf.vf_recorder.vr_results.size() == 2);
    CHECK(vf.vf_recorder.vr_results[1] == rebuild_result::rr_appended_lines);
    CHECK(lv.snapshot().size() == 4);
    CHECK(lv.get_flat_index().size() == 6);
    CHECK(lv.get_histogram().get_total() == 4);
    CHECK(lv.get_row_sizer().get_invalidation_count() == 1);

    // a duplicate of the history is dropped
    lv.append_live({make_entry("h2", utc(2024, 1, 2, 0, 30, 0))});
    CHECK(vf.vf_recorder.vr_results.size() == 2);
    CHECK(lv.snapshot().size() == 4);
}

TEST_CASE("log_view filtering resets the view")
{
    view_fixture vf;
    auto& lv = vf.vf_view;

    lv.set_batch(history());
    lv.append_live({
        make_entry("l1", utc(2024, 1, 2, 0, 45, 0), LEVEL_ERROR),
        make_entry("l2", utc(2024, 1, 2, 0, 50, 0)),
    });

    REQUIRE(lv.get_selection().pointer_down(1));

    log_filter lf;
    lf.lf_levels = {LEVEL_ERROR};
    REQUIRE(lv.set_filter(lf).isOk());
    CHECK(vf.vf_recorder.vr_results.back() == rebuild_result::rr_full_rebuild);
    CHECK(lv.snapshot().size() == 1);
    CHECK(lv.snapshot()[0].le_id == "l1");
    CHECK_FALSE(lv.get_selection().current_selection().has_value());
    CHECK(lv.get_row_sizer().get_invalidation_count() == 2);

    // later live entries go through the same filter
    lv.append_live({
        make_entry("l3", utc(2024, 1, 2, 0, 55, 0), LEVEL_INFO),
        make_entry("l4", utc(2024, 1, 2, 0, 56, 0), LEVEL_ERROR),
    });
    CHECK(lv.snapshot().size() == 2);

    log_filter bad;
    bad.lf_search = "[";
    bad.lf_search_regex = true;
    CHECK(lv.set_filter(bad).isErr());
    CHECK(lv.get_filter().lf_levels.count(LEVEL_ERROR) == 1);
    CHECK(lv.snapshot().size() == 2);

    auto facets = lv.get_facets({facet_field_t::FF_LEVEL});
    REQUIRE(facets.size() == 1);
    REQUIRE(facets[0].ff_values.size() == 2);
    CHECK(facets[0].ff_values[0].fv_value == "info");
    CHECK(facets[0].ff_values[0].fv_count == 4);
    CHECK(facets[0].ff_values[1].fv_value == "error");
    CHECK(facets[0].ff_values[1].fv_count == 2);

    REQUIRE(lv.set_filter(log_filter{}).isOk());
    CHECK(lv.snapshot().size() == 6);
}

TEST_CASE("log_view follows timeline edits")
{
    view_fixture vf;
    auto& lv = vf.vf_view;
    auto& ts = lv.get_timeline();

    lv.set_batch(history());
    auto changes = vf.vf_recorder.vr_results.size();

    ts.propose_range(utc(2024, 1, 2, 0, 0, 0), std::nullopt, view_fixture::NOW);
    REQUIRE(vf.vf_recorder.vr_results.size() == changes + 1);
    CHECK(vf.vf_recorder.vr_results.back() == rebuild_result::rr_no_change);
    CHECK(lv.get_histogram().get_params().hp_effective_start.value()
          == utc(2024, 1, 2, 0, 0, 0));
    CHECK(vf.vf_recorder.vr_committed == 0);

    REQUIRE(ts.apply(view_fixture::NOW));
    CHECK(vf.vf_recorder.vr_committed == 1);
    CHECK(lv.get_histogram().get_params().hp_effective_start.value()
          == utc(2024, 1, 2, 0, 0, 0));
    // the display window no longer reaches back to the first entry
    CHECK(lv.get_histogram().get_total() == 1);

    const auto& buckets = lv.get_histogram().get_buckets();
    CHECK_FALSE(buckets.front().hb_in_effective_range);
    CHECK(buckets.back().hb_in_effective_range);
}

TEST_CASE("log_view consumes a live tail")
{
    view_fixture vf;
    auto& lv = vf.vf_view;
    live_tail::consumer& cons = lv;
    stream_state state;

    lv.set_batch(history());
    state.ss_phase = stream_phase_t::SP_STREAMING;
    cons.stream_state_changed(state);
    CHECK(vf.vf_recorder.vr_stream_changes == 1);
    CHECK(lv.get_stream_state().ss_phase == stream_phase_t::SP_STREAMING);

    cons.entries_received({make_entry("l1", utc(2024, 1, 2, 0, 45, 0))});
    CHECK(lv.snapshot().size() == 3);
    CHECK(vf.vf_recorder.vr_results.back()
          == rebuild_result::rr_appended_lines);
}

TEST_CASE("log_view keeps the live entries bounded")
{
    view_fixture vf;
    auto& lv = vf.vf_view;

    vf.vf_flat_config.c_max_live_entries = 4;
    lv.set_batch(history());
    lv.append_live({
        make_entry("l1", utc(2024, 1, 2, 0, 41, 0)),
        make_entry("l2", utc(2024, 1, 2, 0, 42, 0)),
    });
    CHECK(vf.vf_recorder.vr_results.back()
          == rebuild_result::rr_appended_lines);
    CHECK(lv.get_histogram().get_total() == 4);

    lv.append_live({
        make_entry("l3", utc(2024, 1, 2, 0, 43, 0)),
        make_entry("l4", utc(2024, 1, 2, 0, 44, 0)),
        make_entry("l5", utc(2024, 1, 2, 0, 45, 0), LEVEL_ERROR),
    });
    CHECK(vf.vf_recorder.vr_results.back() == rebuild_result::rr_full_rebuild);

    auto snap = lv.snapshot();
    REQUIRE(snap.size() == 5);
    CHECK(snap[0].le_id == "h1");
    CHECK(snap[1].le_id == "h2");
    CHECK(snap[2].le_id == "l3");
    CHECK(snap[4].le_id == "l5");
    CHECK(lv.get_histogram().get_total() == 5);

    // below the limit again, so the next append is incremental
    lv.append_live({make_entry("l6", utc(2024, 1, 2, 0, 46, 0))});
    CHECK(vf.vf_recorder.vr_results.back()
          == rebuild_result::rr_appended_lines);
    CHECK(lv.snapshot().size() == 6);
    CHECK(lv.get_histogram().get_total() == 6);
}
