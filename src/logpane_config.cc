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
 * @file logpane_config.cc
 */

#include <chrono>
#include <fstream>
#include <functional>
#include <sstream>

#include "logpane_config.hh"

#include "base/auto_mem.hh"
#include "base/injector.bind.hh"
#include "base/lp_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "sysclip.hh"
#include "yajl/yajl_tree.h"

using namespace std::chrono_literals;

struct _logpane_config logpane_config;

static auto fvc = injector::bind<logpane::flat_view::config>::to_instance(
    &logpane_config.lc_flat_view);

static auto tlc = injector::bind<logpane::timeline::config>::to_instance(
    &logpane_config.lc_timeline);

static auto stc = injector::bind<logpane::stream::config>::to_instance(
    &logpane_config.lc_stream);

static auto scc
    = injector::bind<sysclip::config>::to_instance(&logpane_config.lc_sysclip);

static bool DEFAULTS_LOADED = []() {
    logpane::reset_config(logpane_config);
    return true;
}();

namespace logpane {

namespace {

using value_handler = std::function<Result<void, std::string>(
    const std::string& path, yajl_val val, _logpane_config& cfg)>;

struct config_handler {
    const char* ch_path;
    value_handler ch_handler;
};

template<typename T>
Result<void, std::string>
read_number(const std::string& path, yajl_val val, T& dst)
{
    if (!YAJL_IS_NUMBER(val)) {
        return Err(fmt::format(FMT_STRING("{}: expecting a number"), path));
    }

    auto num = YAJL_GET_DOUBLE(val);
    if (num < 0) {
        return Err(fmt::format(
            FMT_STRING("{}: expecting a positive number, found {}"), path, num));
    }

    dst = static_cast<T>(num);
    return Ok();
}

/** Durations are given in milliseconds. */
Result<void, std::string>
read_millis(const std::string& path,
            yajl_val val,
            std::chrono::microseconds& dst)
{
    double millis = 0;
    auto res = read_number(path, val, millis);

    if (res.isErr()) {
        return res;
    }

    dst = std::chrono::microseconds{(int64_t) (millis * 1000.0)};
    return Ok();
}

#define NUMBER_OPTION(path, member) \
    config_handler \
    { \
        path, [](const std::string& p, yajl_val val, _logpane_config& cfg) { \
            return read_number(p, val, cfg.member); \
        } \
    }

#define MILLIS_OPTION(path, member) \
    config_handler \
    { \
        path, [](const std::string& p, yajl_val val, _logpane_config& cfg) { \
            return read_millis(p, val, cfg.member); \
        } \
    }

const std::vector<config_handler>&
get_handlers()
{
    static const std::vector<config_handler> retval = {
        NUMBER_OPTION("/ui/flat-view/row-height", lc_flat_view.c_row_height),
        NUMBER_OPTION("/ui/flat-view/expanded-row-height",
                      lc_flat_view.c_expanded_row_height),
        NUMBER_OPTION("/ui/flat-view/separator-height",
                      lc_flat_view.c_separator_height),
        NUMBER_OPTION("/ui/flat-view/overscan", lc_flat_view.c_overscan),
        NUMBER_OPTION("/ui/flat-view/max-live-entries",
                      lc_flat_view.c_max_live_entries),

        NUMBER_OPTION("/timeline/padding-ratio", lc_timeline.c_padding_ratio),
        MILLIS_OPTION("/timeline/min-padding-ms", lc_timeline.c_min_padding),
        MILLIS_OPTION("/timeline/min-range-ms", lc_timeline.c_min_range),
        MILLIS_OPTION("/timeline/max-range-ms", lc_timeline.c_max_range),
        MILLIS_OPTION("/timeline/future-tolerance-ms",
                      lc_timeline.c_future_tolerance),
        MILLIS_OPTION("/timeline/now-threshold-ms",
                      lc_timeline.c_now_threshold),
        MILLIS_OPTION("/timeline/preset-tolerance-ms",
                      lc_timeline.c_preset_tolerance),
        MILLIS_OPTION("/timeline/default-duration-ms",
                      lc_timeline.c_default_duration),
        NUMBER_OPTION("/timeline/zoom-in-factor",
                      lc_timeline.c_zoom_in_factor),
        NUMBER_OPTION("/timeline/zoom-out-factor",
                      lc_timeline.c_zoom_out_factor),
        NUMBER_OPTION("/timeline/histogram-buckets",
                      lc_timeline.c_histogram_buckets),

        MILLIS_OPTION("/stream/retry-base-ms", lc_stream.c_retry_base),
        MILLIS_OPTION("/stream/retry-max-ms", lc_stream.c_retry_max),
        NUMBER_OPTION("/stream/retry-jitter", lc_stream.c_retry_jitter),
        NUMBER_OPTION("/stream/max-retries", lc_stream.c_max_retries),
        MILLIS_OPTION("/stream/poll-interval-ms", lc_stream.c_poll_interval),
        NUMBER_OPTION("/stream/max-buffer", lc_stream.c_max_buffer),

        NUMBER_OPTION("/tuning/clipboard/osc52-fd", lc_sysclip.c_osc52_fd),
    };

    return retval;
}

Result<void, std::string>
read_string(const std::string& path, yajl_val val, std::string& dst)
{
    if (!YAJL_IS_STRING(val)) {
        return Err(fmt::format(FMT_STRING("{}: expecting a string"), path));
    }

    dst = YAJL_GET_STRING(val);
    return Ok();
}

Result<void, std::string>
read_clipboard_impls(const std::string& path,
                     yajl_val val,
                     _logpane_config& cfg,
                     config_load_result& clr)
{
    if (!YAJL_IS_OBJECT(val)) {
        return Err(fmt::format(FMT_STRING("{}: expecting an object"), path));
    }

    for (size_t lpc = 0; lpc < val->u.object.len; lpc++) {
        const std::string name = val->u.object.keys[lpc];
        auto impl_val = val->u.object.values[lpc];
        auto impl_path = fmt::format(FMT_STRING("{}/{}"), path, name);
        auto& impl = cfg.lc_sysclip.c_clipboard_impls[name];

        if (!YAJL_IS_OBJECT(impl_val)) {
            return Err(
                fmt::format(FMT_STRING("{}: expecting an object"), impl_path));
        }

        for (size_t lpc2 = 0; lpc2 < impl_val->u.object.len; lpc2++) {
            const std::string key = impl_val->u.object.keys[lpc2];
            auto field_path = fmt::format(FMT_STRING("{}/{}"), impl_path, key);
            auto field_val = impl_val->u.object.values[lpc2];
            if (key != "test" && key != "write") {
                clr.clr_warnings.emplace_back(fmt::format(
                    FMT_STRING("unknown configuration option: {}"),
                    field_path));
                continue;
            }

            auto& dst = key == "test" ? impl.c_test_command
                                      : impl.c_write_command;
            auto res = read_string(field_path, field_val, dst);
            if (res.isErr()) {
                return res;
            }
        }

        if (impl.c_write_command.empty()) {
            return Err(fmt::format(FMT_STRING("{}/write: a command is required"),
                                   impl_path));
        }
    }

    return Ok();
}

Result<void, std::string>
walk_config(const std::string& path,
            yajl_val val,
            _logpane_config& cfg,
            config_load_result& clr)
{
    if (path == "/tuning/clipboard/impls") {
        return read_clipboard_impls(path, val, cfg, clr);
    }

    if (YAJL_IS_OBJECT(val)) {
        for (size_t lpc = 0; lpc < val->u.object.len; lpc++) {
            auto child_path = fmt::format(
                FMT_STRING("{}/{}"), path, val->u.object.keys[lpc]);
            auto res
                = walk_config(child_path, val->u.object.values[lpc], cfg, clr);

            if (res.isErr()) {
                return res;
            }
        }
        return Ok();
    }

    for (const auto& handler : get_handlers()) {
        if (path == handler.ch_path) {
            return handler.ch_handler(path, val, cfg);
        }
    }

    clr.clr_warnings.emplace_back(
        fmt::format(FMT_STRING("unknown configuration option: {}"), path));
    return Ok();
}

Result<void, std::string>
validate_config(const _logpane_config& cfg)
{
    if (cfg.lc_timeline.c_zoom_in_factor <= 0.0
        || cfg.lc_timeline.c_zoom_in_factor >= 1.0)
    {
        return Err(std::string(
            "/timeline/zoom-in-factor: expecting a value between 0 and 1"));
    }
    if (cfg.lc_timeline.c_zoom_out_factor <= 1.0) {
        return Err(std::string(
            "/timeline/zoom-out-factor: expecting a value greater than 1"));
    }
    if (cfg.lc_timeline.c_histogram_buckets == 0) {
        return Err(std::string(
            "/timeline/histogram-buckets: expecting at least one bucket"));
    }
    if (cfg.lc_flat_view.c_max_live_entries == 0) {
        return Err(std::string(
            "/ui/flat-view/max-live-entries: expecting at least one entry"));
    }
    if (cfg.lc_stream.c_max_buffer == 0) {
        return Err(
            std::string("/stream/max-buffer: expecting at least one entry"));
    }
    if (cfg.lc_stream.c_retry_jitter >= 1.0) {
        return Err(
            std::string("/stream/retry-jitter: expecting a value below 1"));
    }
    if (cfg.lc_stream.c_retry_base > cfg.lc_stream.c_retry_max) {
        return Err(std::string(
            "/stream/retry-base-ms: must not be larger than retry-max-ms"));
    }

    return Ok();
}

}  // namespace

void
reset_config(_logpane_config& cfg)
{
    cfg = _logpane_config{};

    auto& impls = cfg.lc_sysclip.c_clipboard_impls;
    impls["MacOS"] = {"command -v pbcopy", "pbcopy"};
    impls["NeoVim"] = {"command -v win32yank.exe",
                       "win32yank.exe -i --crlf"};
    impls["Wayland"] = {"test -n \"$WAYLAND_DISPLAY\" && command -v wl-copy",
                        "wl-copy --foreground --type text/plain"};
    impls["Windows"] = {"command -v clip.exe", "clip.exe"};
    impls["X11-xclip"] = {"test -n \"$DISPLAY\" && command -v xclip",
                          "xclip -i -selection clipboard"};
    impls["X11-xsel"] = {"test -n \"$DISPLAY\" && command -v xsel",
                         "xsel --nodetach -i -b"};
    impls["tmux"] = {"test -n \"$TMUX\" && command -v tmux", TMUX_COPY_COMMAND};
}

Result<config_load_result, std::string>
load_config_from_string(const std::string& src,
                        const std::string& json,
                        _logpane_config& cfg)
{
    char errbuf[1024];
    auto_mem<yajl_val_s> root(yajl_tree_free);
    config_load_result retval;

    root = yajl_tree_parse(json.c_str(), errbuf, sizeof(errbuf));
    if (root == nullptr) {
        return Err(fmt::format(FMT_STRING("{}: invalid JSON -- {}"),
                               src,
                               trim(errbuf)));
    }

    if (!YAJL_IS_OBJECT(root.in())) {
        return Err(fmt::format(
            FMT_STRING("{}: expecting an object at the top level"), src));
    }

    auto walk_res = walk_config("", root.in(), cfg, retval);
    if (walk_res.isErr()) {
        return Err(fmt::format(
            FMT_STRING("{}: {}"), src, walk_res.unwrapErr()));
    }

    auto valid_res = validate_config(cfg);
    if (valid_res.isErr()) {
        return Err(fmt::format(
            FMT_STRING("{}: {}"), src, valid_res.unwrapErr()));
    }

    for (const auto& warning : retval.clr_warnings) {
        log_warning("%s: %s", src.c_str(), warning.c_str());
    }

    return Ok(std::move(retval));
}

Result<config_load_result, std::string>
load_config_file(const std::string& path, _logpane_config& cfg)
{
    std::ifstream in(path);

    if (!in) {
        return Err(fmt::format(
            FMT_STRING("unable to open configuration file: {}"), path));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    log_info("loading configuration from: %s", path.c_str());
    return load_config_from_string(path, buffer.str(), cfg);
}

}  // namespace logpane
