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
 * @file test_timeline_state.cc
 */

#include <chrono>

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "timeline_state.hh"

using namespace logpane;
using namespace std::chrono_literals;

namespace {

struct timeline_recorder : timeline_state::listener {
    void range_committed(const timeline_state& ts) override
    {
        this->tr_committed += 1;
        this->tr_last_start = ts.get_range().tr_effective_start;
        this->tr_last_end = ts.get_range().tr_effective_end;
    }

    void pending_changed(const timeline_state& ts) override
    {
        this->tr_pending += 1;
    }

    int tr_committed{0};
    int tr_pending{0};
    std::optional<time_us> tr_last_start;
    std::optional<time_us> tr_last_end;
};

}  // namespace

TEST_CASE("is_valid_range")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);

    CHECK(is_valid_range(cfg, std::nullopt, std::nullopt, now));
    CHECK(is_valid_range(cfg, now - 1h, std::nullopt, now));
    CHECK(is_valid_range(cfg, std::nullopt, now - 1h, now));
    CHECK(is_valid_range(cfg, now - 1h, now, now));
    CHECK(is_valid_range(cfg, now - 1min, now, now));
    CHECK_FALSE(is_valid_range(cfg, now - 59s, now, now));
    CHECK_FALSE(is_valid_range(cfg, now, now - 1h, now));
    CHECK_FALSE(is_valid_range(cfg, now, now, now));
    CHECK(is_valid_range(cfg, now - 1h, now + 60s, now));
    CHECK_FALSE(is_valid_range(cfg, now - 1h, now + 61s, now));
}

TEST_CASE("is_end_time_now")
{
    auto now = utc(2024, 1, 2, 12, 0, 0);

    CHECK(is_end_time_now(std::nullopt, now, 60s));
    CHECK(is_end_time_now(now - 30s, now, 60s));
    CHECK(is_end_time_now(now + 30s, now, 60s));
    CHECK_FALSE(is_end_time_now(now - 2min, now, 60s));
}

TEST_CASE("range presets by name")
{
    CHECK(range_preset_from_name("6h").value() == range_preset_t::RP_6H);
    CHECK(range_preset_from_name("all").value() == range_preset_t::RP_ALL);
    CHECK_FALSE(range_preset_from_name("2h").has_value());
    CHECK(std::string(range_preset_name(range_preset_t::RP_15M)) == "15m");
    CHECK(range_preset_duration(range_preset_t::RP_24H) == 24h);
    CHECK(range_preset_duration(range_preset_t::RP_ALL) == 0us);
}

TEST_CASE("timeline_state commits an open-ended range")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 10, 10, 0);
    timeline_state ts(cfg, now);
    timeline_recorder rec;

    ts.set_listener(&rec);
    ts.set_entity_bounds(utc(2024, 1, 2, 10, 0, 0), std::nullopt, now);

    ts.propose_range(utc(2024, 1, 2, 10, 5, 0), std::nullopt, now);
    CHECK(ts.is_editing());
    CHECK(rec.tr_pending == 1);
    CHECK(ts.get_range().tr_pending_start.value() == utc(2024, 1, 2, 10, 5, 0));
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 4, 30));
    CHECK(ts.get_range().tr_display_end == utc(2024, 1, 2, 10, 10, 30));
    CHECK_FALSE(ts.get_range().tr_effective_start.has_value());

    REQUIRE(ts.apply(now));
    CHECK_FALSE(ts.is_editing());
    CHECK(rec.tr_committed == 1);
    CHECK(rec.tr_last_start.value() == utc(2024, 1, 2, 10, 5, 0));
    CHECK_FALSE(rec.tr_last_end.has_value());
    CHECK_FALSE(ts.get_range().tr_pending_start.has_value());
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 4, 30));
    CHECK(ts.active_preset(now) == range_preset_t::RP_5M);

    auto op = ts.get_overlay_positions();
    REQUIRE(op.has_value());
    CHECK(op->op_left_width == doctest::Approx(100.0 * 30.0 / 360.0));
    CHECK(op->op_right_start == doctest::Approx(100.0));
    CHECK(op->op_right_width == doctest::Approx(0.0));

    // nothing left to apply
    CHECK_FALSE(ts.apply(now));
    CHECK(rec.tr_committed == 1);
}

TEST_CASE("timeline_state discards invalid proposals")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);
    timeline_recorder rec;

    ts.set_listener(&rec);
    ts.set_entity_bounds(utc(2024, 1, 2, 10, 0, 0),
                         utc(2024, 1, 2, 11, 0, 0),
                         now);
    auto committed = ts.get_range();

    SUBCASE("too short")
    {
        ts.propose_range(utc(2024, 1, 2, 10, 5, 0),
                         utc(2024, 1, 2, 10, 5, 30),
                         now);
    }
    SUBCASE("reversed")
    {
        ts.propose_range(utc(2024, 1, 2, 10, 30, 0),
                         utc(2024, 1, 2, 10, 0, 0),
                         now);
    }
    SUBCASE("in the future")
    {
        ts.propose_range(utc(2024, 1, 2, 11, 0, 0), now + 5min, now);
    }

    CHECK_FALSE(ts.apply(now));
    CHECK_FALSE(ts.is_editing());
    CHECK(rec.tr_committed == 0);
    CHECK(rec.tr_pending == 2);
    CHECK(ts.get_range().tr_display_start == committed.tr_display_start);
    CHECK(ts.get_range().tr_display_end == committed.tr_display_end);
    CHECK_FALSE(ts.get_range().tr_effective_start.has_value());
    CHECK_FALSE(ts.get_range().tr_pending_start.has_value());
}

TEST_CASE("timeline_state::cancel restores the committed display")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);

    ts.set_entity_bounds(utc(2024, 1, 2, 10, 0, 0),
                         utc(2024, 1, 2, 11, 0, 0),
                         now);
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 9, 55, 30));
    CHECK(ts.get_range().tr_display_end == utc(2024, 1, 2, 11, 4, 30));

    ts.propose_range(utc(2024, 1, 2, 10, 30, 0),
                     utc(2024, 1, 2, 10, 40, 0),
                     now);
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 29, 15));
    ts.cancel();
    CHECK_FALSE(ts.is_editing());
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 9, 55, 30));
    CHECK(ts.get_range().tr_display_end == utc(2024, 1, 2, 11, 4, 30));
}

TEST_CASE("timeline_state re-pads a display that lost the effective range")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);

    ts.set_entity_bounds(utc(2024, 1, 2, 10, 0, 0),
                         utc(2024, 1, 2, 11, 0, 0),
                         now);
    ts.propose_range(utc(2024, 1, 2, 10, 30, 0),
                     utc(2024, 1, 2, 10, 40, 0),
                     now);
    REQUIRE(ts.apply(now));

    ts.propose_display(utc(2024, 1, 2, 10, 35, 0), utc(2024, 1, 2, 10, 50, 0));
    CHECK(ts.get_range().tr_pending_start.value()
          == utc(2024, 1, 2, 10, 30, 0));
    REQUIRE(ts.apply(now));
    CHECK(ts.get_range().tr_effective_start.value()
          == utc(2024, 1, 2, 10, 30, 0));
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 29, 15));
    CHECK(ts.get_range().tr_display_end == utc(2024, 1, 2, 10, 40, 45));
}

TEST_CASE("timeline_state presets")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);
    timeline_recorder rec;

    ts.set_listener(&rec);
    ts.set_entity_bounds(utc(2024, 1, 1, 0, 0, 0), std::nullopt, now);

    CHECK(ts.active_preset(now) == range_preset_t::RP_ALL);

    REQUIRE(ts.apply_preset(range_preset_t::RP_1H, now));
    CHECK(rec.tr_committed == 1);
    CHECK(rec.tr_pending == 0);
    CHECK(ts.get_range().tr_effective_start.value() == now - 1h);
    CHECK_FALSE(ts.get_range().tr_effective_end.has_value());
    CHECK(ts.active_preset(now) == range_preset_t::RP_1H);
    CHECK(ts.active_preset(now + 5s) == range_preset_t::RP_1H);
    CHECK(ts.active_preset(now + 5min) == range_preset_t::RP_CUSTOM);

    CHECK_FALSE(ts.apply_preset(range_preset_t::RP_CUSTOM, now));
    CHECK(rec.tr_committed == 1);

    REQUIRE(ts.apply_preset(range_preset_t::RP_ALL, now));
    CHECK_FALSE(ts.get_range().tr_effective_start.has_value());
    CHECK(ts.active_preset(now) == range_preset_t::RP_ALL);

    ts.propose_range(now - 2h, now - 1h, now);
    REQUIRE(ts.apply(now));
    CHECK(ts.active_preset(now) == range_preset_t::RP_CUSTOM);
}

TEST_CASE("timeline_state zoom")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);

    // the default hour before now, padded by 4.5 minutes on both sides
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 55, 30));
    CHECK(ts.get_range().tr_display_end == utc(2024, 1, 2, 12, 4, 30));

    REQUIRE(ts.zoom_in());
    CHECK(ts.is_editing());
    auto zoomed = ts.get_range();
    CHECK(zoomed.tr_display_end - zoomed.tr_display_start == 3312s);
    CHECK(zoomed.tr_display_start + 1656s == utc(2024, 1, 2, 11, 30, 0));

    REQUIRE(ts.zoom_out());
    auto unzoomed = ts.get_range();
    CHECK(unzoomed.tr_display_end - unzoomed.tr_display_start == 4140s);

    ts.propose_display(now - 70s, now);
    CHECK_FALSE(ts.zoom_in());

    ts.propose_display(now - 24h * 29, now);
    CHECK_FALSE(ts.zoom_out());
}

TEST_CASE("timeline_state pan is bounded by the entity")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);

    ts.set_entity_bounds(utc(2024, 1, 2, 10, 0, 0),
                         utc(2024, 1, 2, 11, 0, 0),
                         now);

    CHECK_FALSE(ts.pan(0.5, now));
    CHECK_FALSE(ts.pan(-0.5, now));
    CHECK_FALSE(ts.pan(0.0, now));

    REQUIRE(ts.zoom_in());
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 2, 24));

    REQUIRE(ts.pan(0.5, now));
    CHECK(ts.get_range().tr_display_end == utc(2024, 1, 2, 11, 4, 30));
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 9, 18));
    CHECK_FALSE(ts.pan(0.5, now));

    REQUIRE(ts.pan(-1.0, now));
    CHECK(ts.get_range().tr_display_start == utc(2024, 1, 2, 10, 0, 0));
    CHECK_FALSE(ts.pan(-0.1, now));
}

TEST_CASE("timeline_state pan of a running entity")
{
    timeline::config cfg;
    auto now = utc(2024, 1, 2, 12, 0, 0);
    timeline_state ts(cfg, now);

    ts.set_entity_bounds(utc(2024, 1, 2, 11, 0, 0), std::nullopt, now);
    REQUIRE(ts.zoom_in());
    REQUIRE(ts.pan(1.0, now));
    CHECK(ts.get_range().tr_display_end == now + 60s);
}
