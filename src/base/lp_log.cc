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
 * @file lp_log.cc
 */

#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <sys/param.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <time.h>
#include <unistd.h>

#include "config.h"

#ifdef HAVE_EXECINFO_H
#    include <execinfo.h>
#endif

#include <mutex>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "enum_util.hh"
#include "lp_log.hh"

static constexpr size_t BUFFER_SIZE = 256 * 1024;
static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> logpane_log_file;
logpane_log_level_t logpane_log_level = logpane_log_level_t::DEBUG;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
logpane_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

struct thid {
    static uint32_t COUNTER;

    thid() noexcept : t_id(COUNTER++) {}

    uint32_t t_id;
};

uint32_t thid::COUNTER = 0;

thread_local thid current_thid;

static struct {
    size_t lr_length;
    off_t lr_frag_start;
    off_t lr_frag_end;
    char lr_data[BUFFER_SIZE];
} log_ring = {0, BUFFER_SIZE, 0, {}};

static const char* LEVEL_NAMES[] = {
    "T",
    "D",
    "I",
    "W",
    "E",
};

/**
 * Reserve space for one line at the end of the ring.  When the ring is full,
 * the older half becomes a "fragment" that is trimmed to a line boundary and
 * the writer starts over at the beginning of the buffer.
 */
static char*
log_alloc()
{
    off_t data_end = log_ring.lr_length + MAX_LOG_LINE_SIZE;

    if (data_end >= (off_t) BUFFER_SIZE) {
        const auto* new_start = (const char*) memchr(
            &log_ring.lr_data[MAX_LOG_LINE_SIZE],
            '\n',
            log_ring.lr_length - MAX_LOG_LINE_SIZE);

        if (new_start == nullptr) {
            log_ring.lr_frag_start = BUFFER_SIZE;
            log_ring.lr_frag_end = 0;
        } else {
            log_ring.lr_frag_start = (new_start - log_ring.lr_data) + 1;
            log_ring.lr_frag_end = log_ring.lr_length;
        }
        log_ring.lr_length = 0;
        data_end = MAX_LOG_LINE_SIZE;
    }
    if (data_end >= log_ring.lr_frag_start
        && log_ring.lr_frag_start < log_ring.lr_frag_end)
    {
        const char* new_start = nullptr;

        if (data_end < log_ring.lr_frag_end) {
            new_start = (const char*) memchr(&log_ring.lr_data[data_end],
                                             '\n',
                                             log_ring.lr_frag_end - data_end);
        }
        if (new_start == nullptr) {
            log_ring.lr_frag_start = BUFFER_SIZE;
            log_ring.lr_frag_end = 0;
        } else {
            log_ring.lr_frag_start = (new_start - log_ring.lr_data) + 1;
        }
    }

    return &log_ring.lr_data[log_ring.lr_length];
}

std::optional<logpane_log_level_t>
string2log_level(const char* str)
{
    static const struct {
        const char* name;
        logpane_log_level_t level;
    } NAMES[] = {
        {"trace", logpane_log_level_t::TRACE},
        {"debug", logpane_log_level_t::DEBUG},
        {"info", logpane_log_level_t::INFO},
        {"warning", logpane_log_level_t::WARNING},
        {"error", logpane_log_level_t::ERROR},
    };

    for (const auto& name : NAMES) {
        if (strcasecmp(name.name, str) == 0) {
            return name.level;
        }
    }

    return std::nullopt;
}

void
log_argv(int argc, char* argv[])
{
    const char* log_path = getenv("LOGPANE_LOG_PATH");

    if (log_path != nullptr) {
        auto* file = fopen(log_path, "ae");

        if (file != nullptr) {
            logpane_log_file = file;
        }
    }

    const char* level_str = getenv("LOGPANE_LOG_LEVEL");
    if (level_str != nullptr) {
        auto level_opt = string2log_level(level_str);

        if (level_opt) {
            logpane_log_level = level_opt.value();
        }
    }

    log_info("argv[%d] =", argc);
    for (int lpc = 0; lpc < argc; lpc++) {
        log_info("    [%d] = %s", lpc, argv[lpc]);
    }
}

void
log_host_info()
{
    char cwd[MAXPATHLEN];
    char jittarget[128];
    struct utsname un;
    uint32_t pcre_jit;

    uname(&un);
    pcre2_config(PCRE2_CONFIG_JIT, &pcre_jit);
    pcre2_config(PCRE2_CONFIG_JITTARGET, jittarget);

    log_info("uname:");
    log_info("  sysname=%s", un.sysname);
    log_info("  machine=%s", un.machine);
    log_info("  release=%s", un.release);
    log_info("PCRE:");
    log_info("  jit=%d", pcre_jit);
    log_info("  jittarget=%s", jittarget);
    log_info("Environment:");
    log_info("  HOME=%s", getenv("HOME"));
    log_info("  TERM=%s", getenv("TERM"));
    log_info("  TZ=%s", getenv("TZ"));
    log_info("Process:");
    log_info("  pid=%d", getpid());
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        log_info("  ERROR: getcwd failed");
    } else {
        log_info("  cwd=%s", cwd);
    }
    log_info("Executable:");
    log_info("  version=%s", VCS_PACKAGE_STRING);
}

void
log_msg(logpane_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    struct timeval curr_time;
    struct tm localtm;
    ssize_t prefix_size;
    va_list args;
    ssize_t rc;

    if (level < logpane_log_level) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*logpane_log_mutex());

    {
        // get the base name of the file.  NB: can't use basename() since it
        // can modify its argument
        const char* last_slash = src_file;

        for (int lpc = 0; src_file[lpc]; lpc++) {
            if (src_file[lpc] == '/' || src_file[lpc] == '\\') {
                last_slash = &src_file[lpc + 1];
            }
        }

        src_file = last_slash;
    }

    va_start(args, fmt);
    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    auto* line = log_alloc();
    auto gmtoff = std::abs(localtm.tm_gmtoff) / 60;
    prefix_size
        = snprintf(line,
                   MAX_LOG_LINE_SIZE,
                   "%4d-%02d-%02dT%02d:%02d:%02d.%03d%c%02d:%02d %s t%u %s:%d ",
                   localtm.tm_year + 1900,
                   localtm.tm_mon + 1,
                   localtm.tm_mday,
                   localtm.tm_hour,
                   localtm.tm_min,
                   localtm.tm_sec,
                   (int) (curr_time.tv_usec / 1000),
                   localtm.tm_gmtoff < 0 ? '-' : '+',
                   (int) gmtoff / 60,
                   (int) gmtoff % 60,
                   LEVEL_NAMES[logpane::enums::to_underlying(level)],
                   current_thid.t_id,
                   src_file,
                   line_number);
    rc = vsnprintf(
        &line[prefix_size], MAX_LOG_LINE_SIZE - prefix_size, fmt, args);
    if (rc >= (ssize_t) (MAX_LOG_LINE_SIZE - prefix_size)) {
        rc = MAX_LOG_LINE_SIZE - prefix_size - 1;
    }
    line[prefix_size + rc] = '\n';
    log_ring.lr_length += prefix_size + rc + 1;
    if (logpane_log_file) {
        fwrite(line, 1, prefix_size + rc + 1, logpane_log_file.value());
        fflush(logpane_log_file.value());
    }
    va_end(args);
}

void
log_write_ring_to(int fd)
{
    if (log_ring.lr_frag_start < (off_t) BUFFER_SIZE) {
        (void) !write(fd,
                      &log_ring.lr_data[log_ring.lr_frag_start],
                      log_ring.lr_frag_end - log_ring.lr_frag_start);
    }
    (void) !write(fd, log_ring.lr_data, log_ring.lr_length);
}

static void
fatal_signal(int sig, siginfo_t* info, void* ctx)
{
    static const char HEADER[] = "\n==== logpane debug log ====\n";

    log_error("Received signal: %d", sig);

    (void) !write(STDERR_FILENO, HEADER, sizeof(HEADER) - 1);
    log_write_ring_to(STDERR_FILENO);
#ifdef HAVE_EXECINFO_H
    {
        void* frames[64];
        auto frame_count = backtrace(frames, 64);

        backtrace_symbols_fd(frames, frame_count, STDERR_FILENO);
    }
#endif

    _exit(1);
}

void
log_install_handlers()
{
    const int sigs[] = {
        SIGABRT,
        SIGSEGV,
        SIGBUS,
        SIGILL,
        SIGFPE,
    };

    for (const auto sig : sigs) {
        struct sigaction sa;

        memset(&sa, 0, sizeof(sa));
        sa.sa_flags = SA_SIGINFO | SA_NODEFER | SA_RESETHAND;
        sigfillset(&sa.sa_mask);
        sigdelset(&sa.sa_mask, sig);
        sa.sa_sigaction = fatal_signal;

        sigaction(sig, &sa, nullptr);
    }
}

void
log_abort()
{
    raise(SIGABRT);
    _exit(1);
}
