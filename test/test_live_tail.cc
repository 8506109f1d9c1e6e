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
 * @file test_live_tail.cc
 */

#include <algorithm>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "live_tail.hh"

using namespace logpane;
using namespace std::chrono_literals;

namespace {

/**
 * Connects, delivers its entries and then either ends the stream or
 * waits to be aborted.
 */
class canned_subscription : public live_subscription {
public:
    canned_subscription(std::vector<log_entry> entries, bool hold_open)
        : cs_entries(std::move(entries)), cs_hold_open(hold_open)
    {
    }

    std::string get_name() const override { return "canned"; }

    Result<void, stream_error> run(const abort_signal& sig,
                                   entry_sink& sink) override
    {
        sink.connected();
        for (const auto& le : this->cs_entries) {
            auto copy = le;

            sink.push(std::move(copy));
        }
        sink.caught_up();

        if (!this->cs_hold_open) {
            return Ok();
        }

        while (sig.wait_for(10ms)) {
        }
        return Err(stream_error::aborted());
    }

private:
    std::vector<log_entry> cs_entries;
    bool cs_hold_open;
};

/**
 * Pushes its entries one at a time and never reports that it caught up,
 * like a tail that keeps waiting for more data.
 */
class trickle_subscription : public live_subscription {
public:
    explicit trickle_subscription(std::vector<log_entry> entries)
        : ts_entries(std::move(entries))
    {
    }

    std::string get_name() const override { return "trickle"; }

    Result<void, stream_error> run(const abort_signal& sig,
                                   entry_sink& sink) override
    {
        sink.connected();
        for (const auto& le : this->ts_entries) {
            if (!sig.wait_for(2ms)) {
                return Err(stream_error::aborted());
            }

            auto copy = le;

            sink.push(std::move(copy));
        }

        while (sig.wait_for(10ms)) {
        }
        return Err(stream_error::aborted());
    }

private:
    std::vector<log_entry> ts_entries;
};

/** Pushes whatever the test feeds it while the stream is open. */
class fed_subscription : public live_subscription {
public:
    std::string get_name() const override { return "fed"; }

    void feed(std::vector<log_entry> entries)
    {
        std::lock_guard<std::mutex> lg(this->fs_mutex);

        for (auto& le : entries) {
            this->fs_queue.emplace_back(std::move(le));
        }
    }

    Result<void, stream_error> run(const abort_signal& sig,
                                   entry_sink& sink) override
    {
        sink.connected();
        while (sig.wait_for(1ms)) {
            std::deque<log_entry> batch;

            {
                std::lock_guard<std::mutex> lg(this->fs_mutex);

                batch.swap(this->fs_queue);
            }
            for (auto& le : batch) {
                sink.push(std::move(le));
            }
        }
        return Err(stream_error::aborted());
    }

private:
    std::mutex fs_mutex;
    std::deque<log_entry> fs_queue;
};

struct tail_consumer : live_tail::consumer {
    void entries_received(std::vector<log_entry> entries) override
    {
        for (auto& le : entries) {
            this->tc_ids.emplace_back(le.le_id);
        }
    }

    void stream_state_changed(const stream_state& state) override
    {
        this->tc_phases.emplace_back(state.ss_phase);
    }

    bool has_phase(stream_phase_t phase) const
    {
        return std::find(this->tc_phases.begin(), this->tc_phases.end(), phase)
            != this->tc_phases.end();
    }

    std::vector<std::string> tc_ids;
    std::vector<stream_phase_t> tc_phases;
};

std::vector<log_entry>
three_entries()
{
    return {
        make_entry("1", utc(2024, 1, 2, 10, 0, 0)),
        make_entry("2", utc(2024, 1, 2, 10, 0, 1)),
        make_entry("3", utc(2024, 1, 2, 10, 0, 2)),
    };
}

}  // namespace

TEST_CASE("live_tail delivers entries to the consumer port")
{
    stream::config cfg;
    isc::msg_port port;
    tail_consumer cons;
    auto sub = std::make_shared<canned_subscription>(three_entries(), false);
    auto tail = std::make_shared<live_tail>(cfg, sub, port, cons);

    {
        isc::supervisor sup({tail});
        auto deadline = std::chrono::steady_clock::now() + 10s;

        while (!cons.has_phase(stream_phase_t::SP_COMPLETE)
               && std::chrono::steady_clock::now() < deadline)
        {
            port.process_for(10ms);
        }
    }
    port.process_pending();

    CHECK(cons.tc_ids == std::vector<std::string>{"1", "2", "3"});
    REQUIRE(cons.tc_phases.size() == 3);
    CHECK(cons.tc_phases[0] == stream_phase_t::SP_CONNECTING);
    CHECK(cons.tc_phases[1] == stream_phase_t::SP_STREAMING);
    CHECK(cons.tc_phases[2] == stream_phase_t::SP_COMPLETE);
    CHECK_FALSE(tail->is_cancelled());
}

TEST_CASE("live_tail discards results after cancel")
{
    stream::config cfg;
    isc::msg_port port;
    tail_consumer cons;
    auto sub = std::make_shared<canned_subscription>(three_entries(), true);
    auto tail = std::make_shared<live_tail>(cfg, sub, port, cons);

    {
        isc::supervisor sup({tail});
        auto deadline = std::chrono::steady_clock::now() + 10s;

        // connecting, streaming and one message for the entries
        while (port.size() < 3 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(port.size() >= 3);

        tail->cancel();
        CHECK(tail->is_cancelled());
    }

    CHECK(port.process_pending() >= 3);
    CHECK(cons.tc_ids.empty());
    CHECK(cons.tc_phases.empty());
}

TEST_CASE("live_tail delivers entries before the stream catches up")
{
    stream::config cfg;
    isc::msg_port port;
    tail_consumer cons;
    auto sub = std::make_shared<trickle_subscription>(three_entries());
    auto tail = std::make_shared<live_tail>(cfg, sub, port, cons);

    {
        isc::supervisor sup({tail});
        auto deadline = std::chrono::steady_clock::now() + 10s;

        while (cons.tc_ids.size() < 3
               && std::chrono::steady_clock::now() < deadline)
        {
            port.process_for(10ms);
        }

        CHECK(cons.tc_ids == std::vector<std::string>{"1", "2", "3"});
        CHECK(cons.has_phase(stream_phase_t::SP_STREAMING));
        CHECK_FALSE(cons.has_phase(stream_phase_t::SP_COMPLETE));

        tail->cancel();
    }
    port.process_pending();
}

TEST_CASE("live_tail holds entries back while paused")
{
    stream::config cfg;
    isc::msg_port port;
    tail_consumer cons;

    cfg.c_max_buffer = 2;

    auto sub = std::make_shared<fed_subscription>();
    auto tail = std::make_shared<live_tail>(cfg, sub, port, cons);

    {
        isc::supervisor sup({tail});
        auto deadline = std::chrono::steady_clock::now() + 10s;

        while (!cons.has_phase(stream_phase_t::SP_STREAMING)
               && std::chrono::steady_clock::now() < deadline)
        {
            port.process_for(10ms);
        }
        REQUIRE(cons.has_phase(stream_phase_t::SP_STREAMING));

        tail->pause();
        port.process_pending();
        CHECK(tail->is_paused());
        CHECK(cons.tc_phases.back() == stream_phase_t::SP_PAUSED);

        sub->feed(three_entries());
        while (tail->get_trimmed_count() < 1
               && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(1ms);
        }
        port.process_pending();

        CHECK(cons.tc_ids.empty());
        CHECK(tail->get_paused_count() == 2);
        CHECK(tail->get_trimmed_count() == 1);

        tail->resume();
        port.process_pending();

        CHECK_FALSE(tail->is_paused());
        CHECK(tail->get_paused_count() == 0);
        CHECK(cons.tc_ids == std::vector<std::string>{"2", "3"});
        CHECK(cons.tc_phases.back() == stream_phase_t::SP_STREAMING);

        tail->cancel();
    }
    port.process_pending();
}
