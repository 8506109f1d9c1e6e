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
 * @file live_tail.cc
 */

#include <iterator>

#include "live_tail.hh"

#include "base/lp_log.hh"
#include "config.h"

using namespace std::chrono_literals;

namespace logpane {

stream_state
live_tail::pending_state::reported_state() const
{
    auto retval = this->ps_state;

    if (this->ps_paused && retval.ss_phase == stream_phase_t::SP_STREAMING) {
        retval.ss_phase = stream_phase_t::SP_PAUSED;
    }

    return retval;
}

void
live_tail::pending_state::trim(std::deque<log_entry>& entries, size_t max)
{
    while (entries.size() > max) {
        entries.pop_front();
        this->ps_trimmed += 1;
    }
}

std::vector<log_entry>
live_tail::pending_state::take_entries()
{
    std::vector<log_entry> retval(
        std::make_move_iterator(this->ps_entries.begin()),
        std::make_move_iterator(this->ps_entries.end()));

    this->ps_entries.clear();
    return retval;
}

live_tail::live_tail(const stream::config& cfg,
                     std::shared_ptr<live_subscription> sub,
                     isc::msg_port& consumer_port,
                     consumer& cons)
    : isc::service<live_tail>(sub->get_name()), lt_config(cfg),
      lt_subscription(sub), lt_consumer_port(consumer_port),
      lt_consumer(cons),
      lt_cancelled(std::make_shared<std::atomic<bool>>(false)),
      lt_pending(std::make_shared<safe_pending_state>()),
      lt_reconnector(cfg, *sub, *this)
{
}

void
live_tail::cancel()
{
    *this->lt_cancelled = true;
    this->lt_abort.abort();
}

void
live_tail::restart()
{
    this->send([](live_tail& lt) {
        if (lt.lt_abort.is_aborted()) {
            return;
        }
        lt.lt_reconnector.restart();
        lt.lt_done = false;
    });
}

void
live_tail::pause()
{
    stream_state state;

    {
        safe::WriteAccess<safe_pending_state> pending(*this->lt_pending);

        if (pending->ps_paused) {
            return;
        }
        pending->ps_paused = true;
        state = pending->reported_state();
    }

    log_info("%s: paused", this->s_name.c_str());
    this->post_state(state);
}

void
live_tail::resume()
{
    std::optional<uint64_t> drain_epoch;
    stream_state state;

    {
        safe::WriteAccess<safe_pending_state> pending(*this->lt_pending);

        if (!pending->ps_paused) {
            return;
        }
        pending->ps_paused = false;
        for (auto& le : pending->ps_paused_entries) {
            pending->ps_entries.emplace_back(std::move(le));
        }
        pending->ps_paused_entries.clear();
        pending->trim(pending->ps_entries, this->lt_config.c_max_buffer);
        if (!pending->ps_entries.empty() && !pending->ps_drain_scheduled) {
            pending->ps_drain_scheduled = true;
            drain_epoch = pending->ps_epoch;
        }
        state = pending->reported_state();
    }

    log_info("%s: resumed", this->s_name.c_str());
    if (drain_epoch) {
        this->post_drain(drain_epoch.value());
    }
    this->post_state(state);
}

bool
live_tail::is_paused() const
{
    safe::ReadAccess<safe_pending_state> pending(*this->lt_pending);

    return pending->ps_paused;
}

size_t
live_tail::get_paused_count() const
{
    safe::ReadAccess<safe_pending_state> pending(*this->lt_pending);

    return pending->ps_paused_entries.size();
}

size_t
live_tail::get_trimmed_count() const
{
    safe::ReadAccess<safe_pending_state> pending(*this->lt_pending);

    return pending->ps_trimmed;
}

void
live_tail::loop_body()
{
    if (this->lt_done || this->lt_abort.is_aborted()) {
        return;
    }

    this->lt_reconnector.run(this->lt_abort);
    this->lt_done = true;
}

void
live_tail::stopping()
{
    this->lt_abort.abort();
}

std::chrono::milliseconds
live_tail::compute_timeout(time_us current_time) const
{
    if (this->lt_done) {
        return 1s;
    }

    return 0ms;
}

void
live_tail::stream_state_changed(const stream_state& state)
{
    std::vector<log_entry> entries;
    stream_state reported;

    log_debug("%s: stream is %s (retry %u)",
              this->s_name.c_str(),
              stream_phase_name(state.ss_phase),
              state.ss_retry_attempt);

    {
        safe::WriteAccess<safe_pending_state> pending(*this->lt_pending);

        // entries received before the change are delivered ahead of it
        entries = pending->take_entries();
        pending->ps_epoch += 1;
        pending->ps_drain_scheduled = false;
        pending->ps_state = state;
        reported = pending->reported_state();
    }

    if (!entries.empty()) {
        this->post_entries(std::move(entries));
    }
    this->post_state(reported);
}

void
live_tail::entry_received(log_entry&& le)
{
    std::optional<uint64_t> drain_epoch;

    {
        safe::WriteAccess<safe_pending_state> pending(*this->lt_pending);

        if (pending->ps_paused) {
            pending->ps_paused_entries.emplace_back(std::move(le));
            pending->trim(pending->ps_paused_entries,
                          this->lt_config.c_max_buffer);
            return;
        }

        pending->ps_entries.emplace_back(std::move(le));
        pending->trim(pending->ps_entries, this->lt_config.c_max_buffer);
        if (!pending->ps_drain_scheduled) {
            pending->ps_drain_scheduled = true;
            drain_epoch = pending->ps_epoch;
        }
    }

    if (drain_epoch) {
        this->post_drain(drain_epoch.value());
    }
}

void
live_tail::post_entries(std::vector<log_entry> entries)
{
    auto shared_entries
        = std::make_shared<std::vector<log_entry>>(std::move(entries));

    this->post([shared_entries](consumer& cons) {
        cons.entries_received(std::move(*shared_entries));
    });
}

void
live_tail::post_drain(uint64_t epoch)
{
    auto pending = this->lt_pending;

    this->post([pending, epoch](consumer& cons) {
        std::vector<log_entry> entries;

        {
            safe::WriteAccess<safe_pending_state> ps(*pending);

            if (ps->ps_epoch != epoch) {
                return;
            }
            entries = ps->take_entries();
            ps->ps_drain_scheduled = false;
        }

        if (!entries.empty()) {
            cons.entries_received(std::move(entries));
        }
    });
}

void
live_tail::post_state(const stream_state& state)
{
    this->post([state](consumer& cons) { cons.stream_state_changed(state); });
}

}  // namespace logpane
