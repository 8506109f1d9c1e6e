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
 * @file timeline_state.hh
 */

#ifndef logpane_timeline_state_hh
#define logpane_timeline_state_hh

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "base/time_util.hh"
#include "timeline.cfg.hh"

namespace logpane {

/**
 * The time window of the histogram.  The display bounds are the padded
 * window that is drawn, the effective bounds are the committed filter and
 * the pending bounds are an edit that was not applied yet.  An unset
 * effective bound is open: "all time" for the start, "now" for the end.
 */
struct time_range {
    time_us tr_display_start{0};
    time_us tr_display_end{0};
    std::optional<time_us> tr_effective_start;
    std::optional<time_us> tr_effective_end;
    std::optional<time_us> tr_pending_start;
    std::optional<time_us> tr_pending_end;
};

enum class range_preset_t {
    RP_ALL,
    RP_5M,
    RP_15M,
    RP_1H,
    RP_6H,
    RP_24H,
    RP_CUSTOM,
};

const char* range_preset_name(range_preset_t rp);

std::optional<range_preset_t> range_preset_from_name(const std::string& name);

/** @return The look-back duration of the preset, zero for all and custom. */
std::chrono::microseconds range_preset_duration(range_preset_t rp);

/** The dimming overlays, as percentages of the display width. */
struct overlay_positions {
    double op_left_width{0.0};
    double op_right_start{100.0};
    double op_right_width{0.0};
};

bool is_end_time_now(std::optional<time_us> end,
                     time_us now,
                     std::chrono::microseconds threshold);

/**
 * Check a proposed effective range.  Both bounds unset means all time and
 * one unset bound is open-ended; both are valid.  Otherwise the start must
 * precede the end by at least the minimum range and the end may not lie
 * further than the future tolerance past now.
 */
bool is_valid_range(const timeline::config& cfg,
                    std::optional<time_us> start,
                    std::optional<time_us> end,
                    time_us now);

/**
 * Owns the display, effective and pending ranges of the timeline and the
 * apply/cancel protocol for interactive edits.
 */
class timeline_state {
public:
    class listener {
    public:
        virtual ~listener() = default;

        /** The effective range was committed, the data should be fetched. */
        virtual void range_committed(const timeline_state& ts) = 0;

        /** The pending edit changed, for live previews. */
        virtual void pending_changed(const timeline_state& ts) {}
    };

    timeline_state(const timeline::config& cfg, time_us now);

    void set_listener(listener* l) { this->ts_listener = l; }

    const time_range& get_range() const { return this->ts_range; }

    bool is_editing() const { return this->ts_editing; }

    /**
     * Set the lifecycle bounds of the entity whose logs are shown.  An
     * unset end means the entity is still running.
     */
    void set_entity_bounds(time_us start,
                           std::optional<time_us> end,
                           time_us now);

    /**
     * Propose new effective bounds.  The display window follows the
     * proposal, padded on both sides.
     */
    void propose_range(std::optional<time_us> start,
                       std::optional<time_us> end,
                       time_us now);

    /**
     * Propose a new display window for a pan or zoom.  The effective
     * bounds are frozen at their current values.
     */
    void propose_display(time_us start, time_us end);

    /**
     * Commit the pending edit.  An invalid proposal is discarded as if
     * cancel() had been called.
     *
     * @return True if a new effective range was committed.
     */
    bool apply(time_us now);

    void cancel();

    /** Select a preset and commit it without an editing phase. */
    bool apply_preset(range_preset_t rp, time_us now);

    /** @return False if the zoom would go below the minimum range. */
    bool zoom_in();

    /** @return False if the zoom would go above the maximum range. */
    bool zoom_out();

    /**
     * Shift the display window by the given fraction of its width.
     *
     * @return False if the pan was blocked by the entity bounds.
     */
    bool pan(double fraction, time_us now);

    /**
     * @return The overlay positions for the current display window and
     *   effective range, or nullopt if the display window is empty.
     */
    std::optional<overlay_positions> get_overlay_positions() const;

    range_preset_t active_preset(time_us now) const;

    /** @return The committed start, or the entity start if unset. */
    std::optional<time_us> current_effective_start() const;

    /** @return The committed end, or the entity end if unset. */
    std::optional<time_us> current_effective_end() const;

private:
    std::pair<time_us, time_us> padded_display(std::optional<time_us> start,
                                               std::optional<time_us> end,
                                               time_us now) const;

    std::pair<time_us, time_us> pan_boundaries(time_us now) const;

    void notify_pending();

    const timeline::config& ts_config;
    time_range ts_range;
    bool ts_editing{false};
    time_us ts_committed_display_start{0};
    time_us ts_committed_display_end{0};
    std::optional<time_us> ts_entity_start;
    std::optional<time_us> ts_entity_end;
    listener* ts_listener{nullptr};
};

}  // namespace logpane

#endif
