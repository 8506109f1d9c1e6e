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
 * @file logpane_config.hh
 */

#ifndef logpane_config_hh
#define logpane_config_hh

#include <string>
#include <vector>

#include "flat_view.cfg.hh"
#include "result.h"
#include "stream.cfg.hh"
#include "sysclip.cfg.hh"
#include "timeline.cfg.hh"

struct _logpane_config {
    logpane::flat_view::config lc_flat_view;
    logpane::timeline::config lc_timeline;
    logpane::stream::config lc_stream;
    sysclip::config lc_sysclip;
};

extern struct _logpane_config logpane_config;

namespace logpane {

struct config_load_result {
    /** Options that were not recognized and ignored. */
    std::vector<std::string> clr_warnings;
};

/** Reset the configuration to the built-in defaults. */
void reset_config(_logpane_config& cfg);

/**
 * Apply the settings in a JSON document to the configuration.  Unknown
 * options are reported as warnings.  Values of the wrong type or out of
 * range are errors and leave the configuration partially updated.
 */
Result<config_load_result, std::string> load_config_from_string(
    const std::string& src, const std::string& json, _logpane_config& cfg);

Result<config_load_result, std::string> load_config_file(
    const std::string& path, _logpane_config& cfg);

}  // namespace logpane

#endif
