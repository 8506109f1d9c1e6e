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
 * @file timeline.cfg.hh
 */

#ifndef logpane_timeline_cfg_hh
#define logpane_timeline_cfg_hh

#include <chrono>
#include <cstddef>

namespace logpane {
namespace timeline {

struct config {
    double c_padding_ratio{0.075};
    std::chrono::microseconds c_min_padding{std::chrono::seconds(30)};
    std::chrono::microseconds c_min_range{std::chrono::seconds(60)};
    std::chrono::microseconds c_max_range{std::chrono::hours(24 * 30)};
    /** How far past "now" a committed end time may lie. */
    std::chrono::microseconds c_future_tolerance{std::chrono::seconds(60)};
    /** End times closer than this to "now" are shown as "now". */
    std::chrono::microseconds c_now_threshold{std::chrono::seconds(60)};
    std::chrono::microseconds c_preset_tolerance{std::chrono::seconds(10)};
    std::chrono::microseconds c_default_duration{std::chrono::hours(1)};
    double c_zoom_in_factor{0.8};
    double c_zoom_out_factor{1.25};
    size_t c_histogram_buckets{50};
};

}  // namespace timeline
}  // namespace logpane

#endif
