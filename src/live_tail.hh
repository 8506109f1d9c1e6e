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
 * @file live_tail.hh
 */

#ifndef logpane_live_tail_hh
#define logpane_live_tail_hh

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "base/isc.hh"
#include "safe/safe.h"
#include "stream_reconnector.hh"

namespace logpane {

/**
 * Runs a live subscription on a service thread and hands the results to a
 * consumer through the consumer's message port.  After cancel() is called
 * on the consumer's thread, no further results reach the consumer.
 *
 * Entries are coalesced: the first entry received after a delivery posts a
 * single message that hands the consumer everything received by the time
 * the consumer gets to it.  While paused, entries are kept back and handed
 * over on resume.  Both buffers keep at most the configured number of the
 * newest entries.
 */
class live_tail
    : public isc::service<live_tail>
    , private stream_reconnector::listener {
public:
    /** Called on the consumer's thread while it processes its port. */
    class consumer {
    public:
        virtual ~consumer() = default;

        virtual void entries_received(std::vector<log_entry> entries) = 0;

        virtual void stream_state_changed(const stream_state& state) = 0;
    };

    live_tail(const stream::config& cfg,
              std::shared_ptr<live_subscription> sub,
              isc::msg_port& consumer_port,
              consumer& cons);

    /** Stop delivering results to the consumer and abort the stream. */
    void cancel();

    /** Leave the terminal error state and connect again. */
    void restart();

    /** Keep the connection open, but hold new entries back. */
    void pause();

    /** Hand over the held back entries and continue delivering. */
    void resume();

    bool is_cancelled() const { return *this->lt_cancelled; }

    bool is_paused() const;

    /** @return The number of entries held back while paused. */
    size_t get_paused_count() const;

    /** @return The number of entries dropped to stay within the buffer. */
    size_t get_trimmed_count() const;

protected:
    void loop_body() override;

    void stopping() override;

    std::chrono::milliseconds compute_timeout(
        time_us current_time) const override;

private:
    struct pending_state {
        std::deque<log_entry> ps_entries;
        std::deque<log_entry> ps_paused_entries;
        /** Bumped whenever the entries are handed over out of band. */
        uint64_t ps_epoch{0};
        bool ps_drain_scheduled{false};
        bool ps_paused{false};
        stream_state ps_state;
        size_t ps_trimmed{0};

        stream_state reported_state() const;

        void trim(std::deque<log_entry>& entries, size_t max);

        std::vector<log_entry> take_entries();
    };
    using safe_pending_state = safe::Safe<pending_state>;

    void stream_state_changed(const stream_state& state) override;

    void entry_received(log_entry&& le) override;

    void post_entries(std::vector<log_entry> entries);

    void post_drain(uint64_t epoch);

    void post_state(const stream_state& state);

    template<typename F>
    void post(F func)
    {
        auto cancelled = this->lt_cancelled;
        auto* cons = &this->lt_consumer;

        this->lt_consumer_port.send({
            [cancelled, cons, func = std::move(func)]() {
                if (*cancelled) {
                    log_debug("discarding result of cancelled live tail");
                    return;
                }
                func(*cons);
            },
        });
    }

    const stream::config& lt_config;
    std::shared_ptr<live_subscription> lt_subscription;
    isc::msg_port& lt_consumer_port;
    consumer& lt_consumer;
    std::shared_ptr<std::atomic<bool>> lt_cancelled;
    std::shared_ptr<safe_pending_state> lt_pending;
    abort_signal lt_abort;
    stream_reconnector lt_reconnector;
    bool lt_done{false};
};

}  // namespace logpane

#endif
