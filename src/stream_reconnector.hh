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
 * @file stream_reconnector.hh
 */

#ifndef logpane_stream_reconnector_hh
#define logpane_stream_reconnector_hh

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include <sys/types.h>

#include "log_entry.hh"
#include "log_parser.hh"
#include "result.h"
#include "stream.cfg.hh"

namespace logpane {

/**
 * A cancellation flag that can also be waited on.  Once aborted it stays
 * aborted until reset().
 */
class abort_signal {
public:
    void abort();

    bool is_aborted() const;

    void reset();

    /**
     * Wait for the given duration or until the signal is aborted.
     *
     * @return True if the full duration elapsed.
     */
    bool wait_for(std::chrono::microseconds dur) const;

private:
    mutable std::mutex as_mutex;
    mutable std::condition_variable as_cond;
    bool as_aborted{false};
};

/** @return False if the signal aborted before the delay elapsed. */
bool abortable_delay(const abort_signal& sig, std::chrono::microseconds delay);

enum class stream_error_kind_t {
    SEK_NETWORK,
    SEK_HTTP,
    SEK_PROTOCOL,
    SEK_ABORTED,
    SEK_APPLICATION,
};

const char* stream_error_kind_name(stream_error_kind_t kind);

struct stream_error {
    stream_error_kind_t se_kind{stream_error_kind_t::SEK_APPLICATION};
    std::optional<int> se_status;
    std::string se_message;
    /** Application errors are fatal unless marked retryable. */
    bool se_retryable{false};

    static stream_error network(std::string msg);

    static stream_error http(int status, std::string msg);

    static stream_error protocol(std::string msg);

    static stream_error aborted();

    static stream_error application(std::string msg, bool retryable = false);

    /**
     * Network and protocol errors, 5xx responses and messages that mention
     * a reset or a protocol failure are transient.  Aborts, 4xx responses
     * and other application errors are fatal.
     */
    bool is_transient() const;

    std::string to_string() const;
};

/**
 * @return The delay before the retry with the given zero-based index:
 *   min(base * 2^attempt, max) with the configured jitter applied.
 */
std::chrono::microseconds retry_delay(const stream::config& cfg,
                                      uint32_t attempt,
                                      std::mt19937& rng);

/** Receives the output of a live subscription. */
class entry_sink {
public:
    virtual ~entry_sink() = default;

    /** The connection was established. */
    virtual void connected() = 0;

    virtual void push(log_entry&& le) = 0;

    /** Everything available from the source so far was pushed. */
    virtual void caught_up() {}
};

/**
 * A cancellable source of live log entries.
 */
class live_subscription {
public:
    virtual ~live_subscription() = default;

    virtual std::string get_name() const = 0;

    /**
     * Deliver entries to the sink until the stream ends or fails.  The
     * call must return soon after the signal is aborted, with an aborted
     * error.
     *
     * @return Ok if the stream ended normally.
     */
    virtual Result<void, stream_error> run(const abort_signal& sig,
                                           entry_sink& sink)
        = 0;
};

/**
 * A subscription that follows a file that is being appended to, like
 * "tail -F".  Reading starts at the given offset, typically the amount of
 * the file that was already loaded, and a reconnect resumes after the last
 * complete line.  A truncated file is reported as a protocol error so the
 * reconnector reads it again from the start.
 */
class file_tail_subscription : public live_subscription {
public:
    file_tail_subscription(std::string path,
                           const stream::config& cfg,
                           bool follow = true,
                           off_t start_offset = 0)
        : fts_path(std::move(path)), fts_config(cfg), fts_follow(follow),
          fts_offset(start_offset)
    {
    }

    std::string get_name() const override { return this->fts_path; }

    Result<void, stream_error> run(const abort_signal& sig,
                                   entry_sink& sink) override;

    /** @return The offset just past the last complete line read. */
    off_t get_offset() const { return this->fts_offset; }

private:
    std::string fts_path;
    const stream::config& fts_config;
    bool fts_follow;
    off_t fts_offset;
    log_line_parser fts_parser;
};

enum class stream_phase_t {
    SP_IDLE,
    SP_CONNECTING,
    SP_STREAMING,
    /** Streaming, but entries are held back from the consumer. */
    SP_PAUSED,
    SP_RECONNECTING,
    SP_COMPLETE,
    SP_ERROR,
};

const char* stream_phase_name(stream_phase_t phase);

struct stream_state {
    stream_phase_t ss_phase{stream_phase_t::SP_IDLE};
    uint32_t ss_retry_attempt{0};
    std::optional<stream_error> ss_error;
};

/**
 * Keeps a live subscription running across transient failures, with an
 * exponential backoff between attempts.  After too many consecutive
 * failures the state becomes terminal until restart() is called.
 */
class stream_reconnector : private entry_sink {
public:
    class listener {
    public:
        virtual ~listener() = default;

        virtual void stream_state_changed(const stream_state& state) = 0;

        virtual void entry_received(log_entry&& le) = 0;

        virtual void stream_caught_up() {}
    };

    using delay_func = std::function<bool(const abort_signal&,
                                          std::chrono::microseconds)>;

    stream_reconnector(const stream::config& cfg,
                       live_subscription& sub,
                       listener& l,
                       delay_func df = abortable_delay);

    /**
     * Run the subscription, reconnecting as needed, until it completes,
     * fails terminally or the signal is aborted.  Nothing is done while
     * the state is terminal.
     */
    const stream_state& run(const abort_signal& sig);

    /** Leave the terminal state and clear the retry counter. */
    void restart();

    const stream_state& get_state() const { return this->sr_state; }

    void seed(uint32_t value) { this->sr_rng.seed(value); }

    /** @return The number of replayed entries dropped after reconnecting. */
    size_t get_dropped_count() const { return this->sr_dropped; }

private:
    void connected() override;

    void push(log_entry&& le) override;

    void caught_up() override { this->sr_listener.stream_caught_up(); }

    void set_phase(stream_phase_t phase);

    const stream::config& sr_config;
    live_subscription& sr_subscription;
    listener& sr_listener;
    delay_func sr_delay_func;
    std::mt19937 sr_rng{std::random_device{}()};
    stream_state sr_state;

    std::optional<time_us> sr_last_time;
    /** The number of accepted entries with a time equal to sr_last_time. */
    size_t sr_last_time_count{0};
    /** The number of entries at sr_last_time to skip after a reconnect. */
    size_t sr_replay_skip{0};
    bool sr_resuming{false};
    size_t sr_dropped{0};
};

}  // namespace logpane

#endif
