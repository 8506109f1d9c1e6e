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
 * @file timeline_state.cc
 */

#include <algorithm>
#include <array>
#include <cmath>

#include "timeline_state.hh"

#include "base/lp_log.hh"
#include "base/math_util.hh"
#include "config.h"

using namespace std::chrono_literals;

namespace logpane {

namespace {

struct preset_info {
    range_preset_t pi_preset;
    const char* pi_name;
    std::chrono::microseconds pi_duration;
};

const std::array<preset_info, 7> PRESETS = {{
    {range_preset_t::RP_ALL, "all", 0us},
    {range_preset_t::RP_5M, "5m", 5min},
    {range_preset_t::RP_15M, "15m", 15min},
    {range_preset_t::RP_1H, "1h", 1h},
    {range_preset_t::RP_6H, "6h", 6h},
    {range_preset_t::RP_24H, "24h", 24h},
    {range_preset_t::RP_CUSTOM, "custom", 0us},
}};

std::string
to_bound_string(std::optional<time_us> tim, const char* open_name)
{
    if (!tim) {
        return open_name;
    }

    return to_rfc3339_string(tim.value());
}

std::chrono::microseconds
scale(std::chrono::microseconds dur, double factor)
{
    return std::chrono::microseconds{
        (int64_t) std::llround((double) dur.count() * factor)};
}

}  // namespace

const char*
range_preset_name(range_preset_t rp)
{
    for (const auto& pi : PRESETS) {
        if (pi.pi_preset == rp) {
            return pi.pi_name;
        }
    }

    return "custom";
}

std::optional<range_preset_t>
range_preset_from_name(const std::string& name)
{
    for (const auto& pi : PRESETS) {
        if (name == pi.pi_name) {
            return pi.pi_preset;
        }
    }

    return std::nullopt;
}

std::chrono::microseconds
range_preset_duration(range_preset_t rp)
{
    for (const auto& pi : PRESETS) {
        if (pi.pi_preset == rp) {
            return pi.pi_duration;
        }
    }

    return 0us;
}

bool
is_end_time_now(std::optional<time_us> end,
                time_us now,
                std::chrono::microseconds threshold)
{
    if (!end) {
        return true;
    }

    return abs_diff(now, end.value()) < threshold;
}

bool
is_valid_range(const timeline::config& cfg,
               std::optional<time_us> start,
               std::optional<time_us> end,
               time_us now)
{
    if (!start || !end) {
        return true;
    }

    if (start.value() >= end.value()) {
        return false;
    }
    if (end.value() - start.value() < cfg.c_min_range) {
        return false;
    }
    if (end.value() > now + cfg.c_future_tolerance) {
        return false;
    }

    return true;
}

timeline_state::timeline_state(const timeline::config& cfg, time_us now)
    : ts_config(cfg)
{
    auto disp = this->padded_display(std::nullopt, std::nullopt, now);

    this->ts_range.tr_display_start = disp.first;
    this->ts_range.tr_display_end = disp.second;
    this->ts_committed_display_start = disp.first;
    this->ts_committed_display_end = disp.second;
}

std::pair<time_us, time_us>
timeline_state::padded_display(std::optional<time_us> start,
                               std::optional<time_us> end,
                               time_us now) const
{
    auto fallback_start
        = this->ts_entity_start.value_or(now - this->ts_config.c_default_duration);
    auto fallback_end = this->ts_entity_end.value_or(now);
    auto range_start = start.value_or(fallback_start);
    auto range_end = std::max(range_start, end.value_or(fallback_end));
    auto padding = std::max(
        scale(range_end - range_start, this->ts_config.c_padding_ratio),
        this->ts_config.c_min_padding);

    return {range_start - padding, range_end + padding};
}

std::pair<time_us, time_us>
timeline_state::pan_boundaries(time_us now) const
{
    require(this->ts_entity_start);

    auto entity_start = this->ts_entity_start.value();
    if (this->ts_entity_end) {
        auto entity_end = this->ts_entity_end.value();
        auto padding = std::max(
            scale(entity_end - entity_start, this->ts_config.c_padding_ratio),
            this->ts_config.c_min_padding);

        return {entity_start, entity_end + padding};
    }

    return {entity_start, now + 60s};
}

void
timeline_state::set_entity_bounds(time_us start,
                                  std::optional<time_us> end,
                                  time_us now)
{
    this->ts_entity_start = start;
    this->ts_entity_end = end;

    if (!this->ts_editing) {
        auto disp = this->padded_display(this->ts_range.tr_effective_start,
                                         this->ts_range.tr_effective_end,
                                         now);

        this->ts_range.tr_display_start = disp.first;
        this->ts_range.tr_display_end = disp.second;
        this->ts_committed_display_start = disp.first;
        this->ts_committed_display_end = disp.second;
    }
}

void
timeline_state::propose_range(std::optional<time_us> start,
                              std::optional<time_us> end,
                              time_us now)
{
    auto disp = this->padded_display(start, end, now);

    this->ts_editing = true;
    this->ts_range.tr_pending_start = start;
    this->ts_range.tr_pending_end = end;
    this->ts_range.tr_display_start = disp.first;
    this->ts_range.tr_display_end = disp.second;
    this->notify_pending();
}

void
timeline_state::propose_display(time_us start, time_us end)
{
    require_lt(start.count(), end.count());

    if (!this->ts_editing) {
        this->ts_editing = true;
        this->ts_range.tr_pending_start = this->ts_range.tr_effective_start;
        this->ts_range.tr_pending_end = this->ts_range.tr_effective_end;
    }
    this->ts_range.tr_display_start = start;
    this->ts_range.tr_display_end = end;
    this->notify_pending();
}

bool
timeline_state::apply(time_us now)
{
    if (!this->ts_editing) {
        return false;
    }

    auto& tr = this->ts_range;
    if (!is_valid_range(
            this->ts_config, tr.tr_pending_start, tr.tr_pending_end, now))
    {
        log_debug("discarding invalid range: %s - %s",
                  to_bound_string(tr.tr_pending_start, "<all>").c_str(),
                  to_bound_string(tr.tr_pending_end, "<now>").c_str());
        this->cancel();
        return false;
    }

    tr.tr_effective_start = tr.tr_pending_start;
    tr.tr_effective_end = tr.tr_pending_end;
    tr.tr_pending_start = std::nullopt;
    tr.tr_pending_end = std::nullopt;
    this->ts_editing = false;

    if ((tr.tr_effective_start
         && tr.tr_effective_start.value() < tr.tr_display_start)
        || (tr.tr_effective_end
            && tr.tr_effective_end.value() > tr.tr_display_end))
    {
        auto disp = this->padded_display(
            tr.tr_effective_start, tr.tr_effective_end, now);

        tr.tr_display_start = disp.first;
        tr.tr_display_end = disp.second;
    }
    this->ts_committed_display_start = tr.tr_display_start;
    this->ts_committed_display_end = tr.tr_display_end;

    log_info("committed time range: %s - %s",
             to_bound_string(tr.tr_effective_start, "<all>").c_str(),
             to_bound_string(tr.tr_effective_end, "<now>").c_str());

    if (this->ts_listener != nullptr) {
        this->ts_listener->range_committed(*this);
    }

    return true;
}

void
timeline_state::cancel()
{
    if (!this->ts_editing) {
        return;
    }

    this->ts_editing = false;
    this->ts_range.tr_pending_start = std::nullopt;
    this->ts_range.tr_pending_end = std::nullopt;
    this->ts_range.tr_display_start = this->ts_committed_display_start;
    this->ts_range.tr_display_end = this->ts_committed_display_end;
    this->notify_pending();
}

bool
timeline_state::apply_preset(range_preset_t rp, time_us now)
{
    std::optional<time_us> start;

    switch (rp) {
        case range_preset_t::RP_ALL:
            break;
        case range_preset_t::RP_CUSTOM:
            return false;
        default:
            start = now - range_preset_duration(rp);
            break;
    }

    auto disp = this->padded_display(start, std::nullopt, now);

    this->ts_editing = true;
    this->ts_range.tr_pending_start = start;
    this->ts_range.tr_pending_end = std::nullopt;
    this->ts_range.tr_display_start = disp.first;
    this->ts_range.tr_display_end = disp.second;

    return this->apply(now);
}

bool
timeline_state::zoom_in()
{
    auto start = this->ts_range.tr_display_start;
    auto range = this->ts_range.tr_display_end - start;
    auto new_range = scale(range, this->ts_config.c_zoom_in_factor);

    if (new_range < this->ts_config.c_min_range) {
        log_debug("zoom in refused, range would be too small");
        return false;
    }

    auto center = start + range / 2;
    this->propose_display(center - new_range / 2,
                          center - new_range / 2 + new_range);

    return true;
}

bool
timeline_state::zoom_out()
{
    auto start = this->ts_range.tr_display_start;
    auto range = this->ts_range.tr_display_end - start;
    auto new_range = scale(range, this->ts_config.c_zoom_out_factor);

    if (new_range > this->ts_config.c_max_range) {
        log_debug("zoom out refused, range would be too large");
        return false;
    }

    auto center = start + range / 2;
    this->propose_display(center - new_range / 2,
                          center - new_range / 2 + new_range);

    return true;
}

bool
timeline_state::pan(double fraction, time_us now)
{
    auto start = this->ts_range.tr_display_start;
    auto end = this->ts_range.tr_display_end;
    auto range = end - start;
    auto delta = scale(range, fraction);

    if (delta == 0us) {
        return false;
    }

    if (this->ts_entity_start) {
        auto bounds = this->pan_boundaries(now);

        if (delta > 0us) {
            auto max_shift = bounds.second - end;

            if (max_shift <= 0us) {
                return false;
            }
            delta = std::min(delta, max_shift);
        } else {
            // the entity start may not move right of the left overlay edge
            auto anchor = this->current_effective_start().value_or(start);
            if (anchor < start) {
                anchor = start;
            }
            auto min_shift = bounds.first - anchor;

            if (min_shift >= 0us) {
                return false;
            }
            delta = std::max(delta, min_shift);
        }
    }

    this->propose_display(start + delta, end + delta);

    return true;
}

std::optional<time_us>
timeline_state::current_effective_start() const
{
    const auto& tr = this->ts_range;
    auto retval = this->ts_editing ? tr.tr_pending_start : tr.tr_effective_start;

    if (!retval) {
        retval = this->ts_entity_start;
    }

    return retval;
}

std::optional<time_us>
timeline_state::current_effective_end() const
{
    const auto& tr = this->ts_range;
    auto retval = this->ts_editing ? tr.tr_pending_end : tr.tr_effective_end;

    if (!retval) {
        retval = this->ts_entity_end;
    }

    return retval;
}

std::optional<overlay_positions>
timeline_state::get_overlay_positions() const
{
    const auto& tr = this->ts_range;
    auto display_range
        = (double) (tr.tr_display_end - tr.tr_display_start).count();

    if (display_range <= 0.0) {
        return std::nullopt;
    }

    auto eff_start = this->current_effective_start().value_or(
        tr.tr_display_start);
    auto eff_end = this->current_effective_end().value_or(tr.tr_display_end);
    auto left_width
        = (double) (eff_start - tr.tr_display_start).count() / display_range
        * 100.0;
    auto right_start
        = (double) (eff_end - tr.tr_display_start).count() / display_range
        * 100.0;
    overlay_positions retval;

    retval.op_left_width = std::max(0.0, left_width);
    retval.op_right_start = std::max(0.0, std::min(100.0, right_start));
    retval.op_right_width = std::max(0.0, 100.0 - right_start);

    return retval;
}

range_preset_t
timeline_state::active_preset(time_us now) const
{
    const auto& tr = this->ts_range;

    if (!tr.tr_effective_start && !tr.tr_effective_end) {
        return range_preset_t::RP_ALL;
    }

    if (tr.tr_effective_start && !tr.tr_effective_end) {
        auto diff = now - tr.tr_effective_start.value();

        for (const auto& pi : PRESETS) {
            if (pi.pi_duration == 0us) {
                continue;
            }

            if (abs_diff(diff, pi.pi_duration)
                < this->ts_config.c_preset_tolerance)
            {
                return pi.pi_preset;
            }
        }
    }

    return range_preset_t::RP_CUSTOM;
}

void
timeline_state::notify_pending()
{
    if (this->ts_listener != nullptr) {
        this->ts_listener->pending_changed(*this);
    }
}

}  // namespace logpane
