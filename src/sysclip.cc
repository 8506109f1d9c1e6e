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
 * @file sysclip.cc
 */

#include <algorithm>
#include <optional>

#include "sysclip.hh"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include "base/injector.hh"
#include "base/lp_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "libbase64.h"
#include "sysclip.cfg.hh"

#define ANSI_OSC "\x1b]"

namespace sysclip {

static std::optional<clipboard>
get_commands()
{
    const auto& cfg = injector::get<const config&>();

    for (const auto& pair : cfg.c_clipboard_impls) {
        const auto full_cmd = fmt::format(FMT_STRING("{} > /dev/null 2>&1"),
                                          pair.second.c_test_command);

        log_debug("testing clipboard impl %s using: %s",
                  pair.first.c_str(),
                  full_cmd.c_str());
        if (system(full_cmd.c_str()) == 0) {
            log_info("detected clipboard: %s", pair.first.c_str());
            return pair.second;
        }
    }

    return std::nullopt;
}

static ssize_t
write_fully(int fd, const char* buf, size_t len)
{
    size_t off = 0;

    while (off < len) {
        auto rc = write(fd, &buf[off], len - off);

        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_error("OSC 52 write failed -- %s", strerror(errno));
            return -1;
        }
        off += rc;
    }

    return off;
}

static Result<void, std::string>
osc52_write(const std::string& text)
{
    static const char ANSI_OSC_COPY_TO_CLIP[] = ANSI_OSC "52;c;";
    const auto fd = injector::get<const config&>().c_osc52_fd;

    log_debug("writing %zu bytes of clipboard data using OSC 52", text.size());

    std::string seq = ANSI_OSC_COPY_TO_CLIP;
    base64_state b64state{};
    base64_stream_encode_init(&b64state, 0);

    size_t off = 0;
    while (true) {
        char out_buffer[2048];
        size_t outlen = 0;
        const auto len = std::min<size_t>(1024, text.size() - off);

        if (len == 0) {
            base64_stream_encode_final(&b64state, out_buffer, &outlen);
            seq.append(out_buffer, outlen);
            break;
        }

        base64_stream_encode(
            &b64state, &text[off], len, out_buffer, &outlen);
        seq.append(out_buffer, outlen);
        off += len;
    }
    seq.push_back('\a');

    if (write_fully(fd, seq.data(), seq.size()) < 0) {
        return Err(fmt::format(FMT_STRING("failed to write OSC 52 sequence: {}"),
                               strerror(errno)));
    }

    return Ok();
}

Result<void, std::string>
copy_text(const std::string& text)
{
    const auto clip_opt = get_commands();

    std::string cmd;

    if (clip_opt) {
        cmd = clip_opt.value().c_write_command;
        if (cmd.empty()) {
            log_info("configured clipboard does not support writing");
        }
    } else {
        log_info("unable to detect clipboard");
    }

    if (cmd.empty()) {
        log_info("  ... falling back to OSC 52");
        return osc52_write(text);
    }

    cmd = fmt::format(FMT_STRING("{} > /dev/null 2>&1"), cmd);

    log_debug("trying detected clipboard command: %s", cmd.c_str());
    auto* file = popen(cmd.c_str(), "w");
    if (file == nullptr) {
        return Err(fmt::format(FMT_STRING("failed to open clipboard: {} -- {}"),
                               cmd,
                               strerror(errno)));
    }

    const auto written = fwrite(text.data(), 1, text.size(), file);
    const auto write_errno = errno;
    const auto status = pclose(file);

    if (written != text.size()) {
        return Err(fmt::format(FMT_STRING("failed to write to clipboard: {}"),
                               strerror(write_errno)));
    }
    if (status == -1) {
        return Err(fmt::format(FMT_STRING("failed to close clipboard: {}"),
                               strerror(errno)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        log_error("clipboard command failed with status %d", status);
        return Err(fmt::format(
            FMT_STRING("clipboard command failed: {} (status {})"),
            clip_opt.value().c_write_command,
            WIFEXITED(status) ? WEXITSTATUS(status) : status));
    }

    log_info("copied %zu bytes to the clipboard", text.size());

    return Ok();
}

}  // namespace sysclip
