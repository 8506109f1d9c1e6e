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
 * @file stream_reconnector.cc
 */

#include <algorithm>
#include <cmath>

#include "stream_reconnector.hh"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

#include "base/auto_mem.hh"
#include "base/lp_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace logpane {

void
abort_signal::abort()
{
    std::lock_guard<std::mutex> lk(this->as_mutex);

    this->as_aborted = true;
    this->as_cond.notify_all();
}

bool
abort_signal::is_aborted() const
{
    std::lock_guard<std::mutex> lk(this->as_mutex);

    return this->as_aborted;
}

void
abort_signal::reset()
{
    std::lock_guard<std::mutex> lk(this->as_mutex);

    this->as_aborted = false;
}

bool
abort_signal::wait_for(std::chrono::microseconds dur) const
{
    std::unique_lock<std::mutex> lk(this->as_mutex);

    return !this->as_cond.wait_for(
        lk, dur, [this]() { return this->as_aborted; });
}

bool
abortable_delay(const abort_signal& sig, std::chrono::microseconds delay)
{
    return sig.wait_for(delay);
}

const char*
stream_error_kind_name(stream_error_kind_t kind)
{
    switch (kind) {
        case stream_error_kind_t::SEK_NETWORK:
            return "network";
        case stream_error_kind_t::SEK_HTTP:
            return "http";
        case stream_error_kind_t::SEK_PROTOCOL:
            return "protocol";
        case stream_error_kind_t::SEK_ABORTED:
            return "aborted";
        case stream_error_kind_t::SEK_APPLICATION:
            return "application";
    }

    return "unknown";
}

stream_error
stream_error::network(std::string msg)
{
    stream_error retval;

    retval.se_kind = stream_error_kind_t::SEK_NETWORK;
    retval.se_message = std::move(msg);
    return retval;
}

stream_error
stream_error::http(int status, std::string msg)
{
    stream_error retval;

    retval.se_kind = stream_error_kind_t::SEK_HTTP;
    retval.se_status = status;
    retval.se_message = std::move(msg);
    return retval;
}

stream_error
stream_error::protocol(std::string msg)
{
    stream_error retval;

    retval.se_kind = stream_error_kind_t::SEK_PROTOCOL;
    retval.se_message = std::move(msg);
    return retval;
}

stream_error
stream_error::aborted()
{
    stream_error retval;

    retval.se_kind = stream_error_kind_t::SEK_ABORTED;
    retval.se_message = "stream aborted";
    return retval;
}

stream_error
stream_error::application(std::string msg, bool retryable)
{
    stream_error retval;

    retval.se_kind = stream_error_kind_t::SEK_APPLICATION;
    retval.se_message = std::move(msg);
    retval.se_retryable = retryable;
    return retval;
}

bool
stream_error::is_transient() const
{
    static const auto TRANSIENT_RE = pcre2pp::code::from_const(
        R"((?:ECONNRESET|EPIPE|ETIMEDOUT|GOAWAY|connection (?:reset|closed|refused)|protocol error|timed out|unexpected EOF))",
        PCRE2_CASELESS);

    switch (this->se_kind) {
        case stream_error_kind_t::SEK_NETWORK:
        case stream_error_kind_t::SEK_PROTOCOL:
            return true;
        case stream_error_kind_t::SEK_ABORTED:
            return false;
        case stream_error_kind_t::SEK_HTTP:
            return this->se_status && this->se_status.value() >= 500
                && this->se_status.value() < 600;
        case stream_error_kind_t::SEK_APPLICATION:
            return this->se_retryable
                || TRANSIENT_RE.matches(this->se_message);
    }

    return false;
}

std::string
stream_error::to_string() const
{
    if (this->se_status) {
        return fmt::format(FMT_STRING("{} error {}: {}"),
                           stream_error_kind_name(this->se_kind),
                           this->se_status.value(),
                           this->se_message);
    }

    return fmt::format(FMT_STRING("{} error: {}"),
                       stream_error_kind_name(this->se_kind),
                       this->se_message);
}

std::chrono::microseconds
retry_delay(const stream::config& cfg, uint32_t attempt, std::mt19937& rng)
{
    auto clamped = std::min<uint32_t>(attempt, 30u);
    auto scaled = cfg.c_retry_base * (int64_t{1} << clamped);
    auto bounded = std::min(scaled, cfg.c_retry_max);
    std::uniform_real_distribution<double> jitter(1.0 - cfg.c_retry_jitter,
                                                  1.0 + cfg.c_retry_jitter);

    return std::chrono::microseconds{
        (int64_t) std::llround((double) bounded.count() * jitter(rng))};
}

Result<void, stream_error>
file_tail_subscription::run(const abort_signal& sig, entry_sink& sink)
{
    auto_mem<FILE> file(fclose);

    file = fopen(this->fts_path.c_str(), "r");
    if (file == nullptr) {
        auto errnum = errno;
        auto msg = fmt::format(FMT_STRING("unable to open {} -- {}"),
                               this->fts_path,
                               strerror(errnum));

        if (errnum == ENOENT) {
            return Err(stream_error::application(msg));
        }
        return Err(stream_error::network(msg));
    }

    if (this->fts_offset > 0) {
        struct stat st;

        if (fstat(fileno(file), &st) == 0 && st.st_size < this->fts_offset) {
            log_info("%s: file is shorter than the read offset, starting over",
                     this->fts_path.c_str());
            this->fts_offset = 0;
        } else if (fseeko(file, this->fts_offset, SEEK_SET) != 0) {
            return Err(stream_error::network(
                fmt::format(FMT_STRING("unable to seek in {} -- {}"),
                            this->fts_path,
                            strerror(errno))));
        }
    }

    log_info("following file: %s (offset %lld)",
             this->fts_path.c_str(),
             (long long) this->fts_offset);
    sink.connected();

    std::string partial;
    auto_mem<char> line;
    size_t line_max_size = 0;

    while (true) {
        if (sig.is_aborted()) {
            return Err(stream_error::aborted());
        }

        auto line_size = getline(line.out(), &line_max_size, file);
        if (line_size > 0) {
            partial.append(line.in(), line_size);
            if (partial.back() != '\n') {
                continue;
            }

            partial.pop_back();
            auto le = this->fts_parser.parse_line(partial);
            if (le) {
                sink.push(std::move(le.value()));
            }
            partial.clear();
            this->fts_offset = ftello(file);
            continue;
        }

        if (ferror(file)) {
            return Err(stream_error::network(
                fmt::format(FMT_STRING("unable to read {} -- {}"),
                            this->fts_path,
                            strerror(errno))));
        }
        clearerr(file);

        if (!this->fts_follow) {
            if (!partial.empty()) {
                auto le = this->fts_parser.parse_line(partial);
                if (le) {
                    sink.push(std::move(le.value()));
                }
                this->fts_offset = ftello(file);
            }
            return Ok();
        }

        sink.caught_up();

        struct stat st;
        if (fstat(fileno(file), &st) == 0 && st.st_size < ftello(file)) {
            this->fts_offset = 0;
            return Err(stream_error::protocol(fmt::format(
                FMT_STRING("file was truncated: {}"), this->fts_path)));
        }

        if (!sig.wait_for(this->fts_config.c_poll_interval)) {
            return Err(stream_error::aborted());
        }
    }
}

const char*
stream_phase_name(stream_phase_t phase)
{
    switch (phase) {
        case stream_phase_t::SP_IDLE:
            return "idle";
        case stream_phase_t::SP_CONNECTING:
            return "connecting";
        case stream_phase_t::SP_STREAMING:
            return "streaming";
        case stream_phase_t::SP_PAUSED:
            return "paused";
        case stream_phase_t::SP_RECONNECTING:
            return "reconnecting";
        case stream_phase_t::SP_COMPLETE:
            return "complete";
        case stream_phase_t::SP_ERROR:
            return "error";
    }

    return "unknown";
}

stream_reconnector::stream_reconnector(const stream::config& cfg,
                                       live_subscription& sub,
                                       listener& l,
                                       delay_func df)
    : sr_config(cfg), sr_subscription(sub), sr_listener(l),
      sr_delay_func(std::move(df))
{
}

const stream_state&
stream_reconnector::run(const abort_signal& sig)
{
    if (this->sr_state.ss_phase == stream_phase_t::SP_ERROR) {
        log_warning("%s: not running stream in the error state",
                    this->sr_subscription.get_name().c_str());
        return this->sr_state;
    }

    this->sr_state.ss_retry_attempt = 0;
    this->sr_state.ss_error = std::nullopt;
    while (true) {
        if (sig.is_aborted()) {
            this->set_phase(stream_phase_t::SP_IDLE);
            break;
        }

        if (this->sr_last_time) {
            this->sr_resuming = true;
            this->sr_replay_skip = this->sr_last_time_count;
        }
        this->set_phase(stream_phase_t::SP_CONNECTING);

        auto res = this->sr_subscription.run(sig, *this);
        if (res.isOk()) {
            log_info("%s: stream completed",
                     this->sr_subscription.get_name().c_str());
            this->set_phase(stream_phase_t::SP_COMPLETE);
            break;
        }

        auto err = res.unwrapErr();
        if (err.se_kind == stream_error_kind_t::SEK_ABORTED
            || sig.is_aborted())
        {
            this->set_phase(stream_phase_t::SP_IDLE);
            break;
        }

        if (err.is_transient()
            && this->sr_state.ss_retry_attempt < this->sr_config.c_max_retries)
        {
            this->sr_state.ss_retry_attempt += 1;

            auto delay = retry_delay(
                this->sr_config, this->sr_state.ss_retry_attempt - 1, this->sr_rng);
            log_info("%s: %s; retry %u in %lld ms",
                     this->sr_subscription.get_name().c_str(),
                     err.to_string().c_str(),
                     this->sr_state.ss_retry_attempt,
                     (long long) to_mstime(delay).count());
            this->set_phase(stream_phase_t::SP_RECONNECTING);
            if (!this->sr_delay_func(sig, delay)) {
                this->set_phase(stream_phase_t::SP_IDLE);
                break;
            }
            continue;
        }

        log_error("%s: stream failed -- %s",
                  this->sr_subscription.get_name().c_str(),
                  err.to_string().c_str());
        this->sr_state.ss_error = std::move(err);
        this->set_phase(stream_phase_t::SP_ERROR);
        break;
    }

    return this->sr_state;
}

void
stream_reconnector::restart()
{
    this->sr_state.ss_retry_attempt = 0;
    this->sr_state.ss_error = std::nullopt;
    this->set_phase(stream_phase_t::SP_IDLE);
}

void
stream_reconnector::connected()
{
    this->sr_state.ss_retry_attempt = 0;
    this->set_phase(stream_phase_t::SP_STREAMING);
}

void
stream_reconnector::push(log_entry&& le)
{
    if (this->sr_resuming) {
        if (le.le_time < this->sr_last_time.value()) {
            this->sr_dropped += 1;
            return;
        }
        if (le.le_time == this->sr_last_time.value()
            && this->sr_replay_skip > 0)
        {
            this->sr_replay_skip -= 1;
            this->sr_dropped += 1;
            return;
        }
        this->sr_resuming = false;
    }

    if (this->sr_last_time && this->sr_last_time.value() == le.le_time) {
        this->sr_last_time_count += 1;
    } else {
        this->sr_last_time = le.le_time;
        this->sr_last_time_count = 1;
    }

    this->sr_listener.entry_received(std::move(le));
}

void
stream_reconnector::set_phase(stream_phase_t phase)
{
    this->sr_state.ss_phase = phase;
    this->sr_listener.stream_state_changed(this->sr_state);
}

}  // namespace logpane
