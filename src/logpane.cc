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
 * @file logpane.cc
 */

#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <signal.h>
#include <stdlib.h>

#include "CLI/CLI.hpp"
#include "base/injector.hh"
#include "base/isc.hh"
#include "base/lp_log.hh"
#include "base/time_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "live_tail.hh"
#include "log_filter.hh"
#include "log_parser.hh"
#include "log_view.hh"
#include "logpane_config.hh"
#include "stream_reconnector.hh"

using namespace std::chrono_literals;

static volatile sig_atomic_t looping = 1;

static void
sigint(int sig)
{
    looping = 0;
}

namespace {

class row_printer : public logpane::log_view::listener {
public:
    void view_changed(const logpane::log_view& lv,
                      logpane::rebuild_result rr) override
    {
        const auto& fi = lv.get_flat_index();

        if (rr == logpane::rebuild_result::rr_full_rebuild) {
            this->rp_printed = 0;
        }
        if (this->rp_printed >= fi.size()) {
            return;
        }

        auto snap = lv.snapshot();
        for (; this->rp_printed < fi.size(); this->rp_printed++) {
            fi[this->rp_printed].match(
                [&snap](const logpane::entry_item& ei) {
                    fmt::print(FMT_STRING("{}\n"),
                               logpane::to_display_line(
                                   snap[ei.ei_entry_index]));
                },
                [](const logpane::separator_item& si) {
                    fmt::print(FMT_STRING("---- {} ----\n"),
                               logpane::to_day_string(si.si_date));
                });
        }
        fflush(stdout);
    }

    void stream_state_changed(const logpane::log_view& lv) override
    {
        const auto& state = lv.get_stream_state();

        if (state.ss_phase == logpane::stream_phase_t::SP_RECONNECTING) {
            fmt::print(stderr,
                       FMT_STRING("info: reconnecting (attempt {})\n"),
                       state.ss_retry_attempt);
        } else if (state.ss_phase == logpane::stream_phase_t::SP_ERROR) {
            fmt::print(stderr,
                       FMT_STRING("error: {}\n"),
                       state.ss_error ? state.ss_error->to_string()
                                      : std::string("stream failed"));
            this->rp_failed = true;
        }
    }

    bool rp_failed{false};

private:
    size_t rp_printed{0};
};

std::optional<logpane::time_us>
parse_time_arg(const std::string& name, const std::string& value)
{
    if (value.empty() || value == "now") {
        return std::nullopt;
    }

    auto retval = logpane::parse_utc_time(value);
    if (!retval) {
        throw CLI::ValidationError(
            name, fmt::format(FMT_STRING("invalid time: {}"), value));
    }

    return retval;
}

}  // namespace

int
main(int argc, char* argv[])
{
    std::string config_path;
    std::string log_path;
    std::string start_arg;
    std::string end_arg;
    std::string preset_arg;
    std::vector<std::string> level_args;
    std::vector<std::string> task_args;
    std::string search_arg;
    bool search_regex = false;
    bool follow = false;
    bool no_histogram = false;
    size_t num_buckets = 0;

    CLI::App app{"A viewer for workflow logs"};

    app.add_option("file", log_path, "The log file to view")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "A JSON configuration file")
        ->type_name("FILE")
        ->check(CLI::ExistingFile);
    app.add_option("-n,--buckets", num_buckets, "The number of histogram bars");
    app.add_option("-s,--start", start_arg, "The start of the time range");
    app.add_option("-e,--end", end_arg, "The end of the time range");
    app.add_option("-p,--preset", preset_arg, "all, 5m, 15m, 1h, 6h or 24h");
    app.add_option("-l,--level", level_args, "Only show the given levels");
    app.add_option("-t,--task", task_args, "Only show the given tasks");
    app.add_option("-g,--grep", search_arg, "Only show matching messages");
    app.add_flag("-r,--regex", search_regex, "Treat the search as a regex");
    app.add_flag("-f,--follow", follow, "Follow the file as it grows");
    app.add_flag("-H,--no-histogram", no_histogram, "Do not show the histogram");
    app.set_version_flag("-V,--version", VCS_PACKAGE_STRING);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    log_argv(argc, argv);
    log_host_info();
    log_install_handlers();
    (void) signal(SIGPIPE, SIG_IGN);

    if (!config_path.empty()) {
        auto load_res = logpane::load_config_file(config_path, logpane_config);

        if (load_res.isErr()) {
            fmt::print(stderr, FMT_STRING("error: {}\n"), load_res.unwrapErr());
            return EXIT_FAILURE;
        }
        for (const auto& warning : load_res.unwrap().clr_warnings) {
            fmt::print(stderr, FMT_STRING("warning: {}\n"), warning);
        }
    }
    if (num_buckets > 0) {
        logpane_config.lc_timeline.c_histogram_buckets = num_buckets;
    }

    std::ifstream in(log_path);
    if (!in) {
        fmt::print(stderr, FMT_STRING("error: unable to open {}\n"), log_path);
        return EXIT_FAILURE;
    }
    std::stringstream content;
    content << in.rdbuf();

    const auto text = content.str();
    logpane::log_line_parser parser;
    auto batch = parser.parse_batch(text);
    auto now = logpane::current_time_us();
    const auto& stream_cfg = injector::get<const logpane::stream::config&>();
    logpane::log_view lv(injector::get<const logpane::flat_view::config&>(),
                         injector::get<const logpane::timeline::config&>(),
                         now);
    row_printer printer;
    auto& timeline = lv.get_timeline();

    if (!batch.empty()) {
        auto first = batch.front().le_time;
        auto last = first;

        for (const auto& le : batch) {
            first = std::min(first, le.le_time);
            last = std::max(last, le.le_time);
        }
        timeline.set_entity_bounds(
            first,
            follow ? std::nullopt : std::make_optional(last),
            now);
    }

    try {
        if (!preset_arg.empty()) {
            auto preset = logpane::range_preset_from_name(preset_arg);

            if (!preset || preset.value() == logpane::range_preset_t::RP_CUSTOM)
            {
                fmt::print(stderr,
                           FMT_STRING("error: unknown preset: {}\n"),
                           preset_arg);
                return EXIT_FAILURE;
            }
            timeline.apply_preset(preset.value(), now);
        } else if (!start_arg.empty() || !end_arg.empty()) {
            timeline.propose_range(parse_time_arg("--start", start_arg),
                                   parse_time_arg("--end", end_arg),
                                   now);
            if (!timeline.apply(now)) {
                fmt::print(stderr, FMT_STRING("error: invalid time range\n"));
                return EXIT_FAILURE;
            }
        }
    } catch (const CLI::ValidationError& e) {
        fmt::print(stderr, FMT_STRING("error: {}\n"), e.what());
        return EXIT_FAILURE;
    }

    logpane::log_filter lf;
    for (const auto& level_str : level_args) {
        auto level = logpane::string2level(level_str);

        if (!level) {
            fmt::print(
                stderr, FMT_STRING("error: unknown level: {}\n"), level_str);
            return EXIT_FAILURE;
        }
        lf.lf_levels.insert(level.value());
    }
    lf.lf_tasks.insert(task_args.begin(), task_args.end());
    lf.lf_search = search_arg;
    lf.lf_search_regex = search_regex;
    lf.lf_start = timeline.get_range().tr_effective_start;
    lf.lf_end = timeline.get_range().tr_effective_end;

    auto filter_res = lv.set_filter(lf);
    if (filter_res.isErr()) {
        fmt::print(stderr, FMT_STRING("error: {}\n"), filter_res.unwrapErr());
        return EXIT_FAILURE;
    }

    lv.set_listener(&printer);
    lv.set_batch(std::move(batch));

    if (!no_histogram) {
        fmt::print(FMT_STRING("\n"));
        for (const auto& row : lv.get_histogram().render_rows()) {
            fmt::print(FMT_STRING("{}\n"), row);
        }
        fflush(stdout);
    }

    if (!follow) {
        return EXIT_SUCCESS;
    }

    isc::msg_port port;
    // only follow what was appended after the batch was read
    auto sub = std::make_shared<logpane::file_tail_subscription>(
        log_path, stream_cfg, true, (off_t) text.size());
    auto tail
        = std::make_shared<logpane::live_tail>(stream_cfg, sub, port, lv);

    signal(SIGINT, sigint);
    signal(SIGTERM, sigint);
    {
        isc::supervisor sup({tail});

        while (looping && !printer.rp_failed) {
            port.process_for(100ms);
        }
        tail->cancel();
    }

    return printer.rp_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
