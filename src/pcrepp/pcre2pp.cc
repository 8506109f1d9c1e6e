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
 * @file pcre2pp.cc
 */

#include "pcre2pp.hh"

#include "base/lp_log.hh"
#include "config.h"

namespace logpane {
namespace pcre2pp {

Result<code, compile_error>
code::from(const std::string& pattern, int options)
{
    compile_error ce;
    auto_mem<pcre2_code> co(pcre2_code_free);

    options |= PCRE2_UTF;
    co = pcre2_compile((PCRE2_SPTR) pattern.data(),
                       pattern.length(),
                       options,
                       &ce.ce_code,
                       &ce.ce_offset,
                       nullptr);

    if (co == nullptr) {
        ce.ce_pattern = pattern;
        return Err(ce);
    }

    auto jit_rc = pcre2_jit_compile(co, PCRE2_JIT_COMPLETE);
    if (jit_rc < 0) {
        log_debug("JIT not available for pattern: %s", pattern.c_str());
    }

    return Ok(code{std::move(co), pattern});
}

std::optional<match_data>
code::find_in(std::string_view in, uint32_t options) const
{
    auto_mem<pcre2_match_data> md(pcre2_match_data_free);

    md = pcre2_match_data_create_from_pattern(this->p_code.in(), nullptr);
    if (md.in() == nullptr) {
        log_error("unable to allocate match data for: %s",
                  this->p_pattern.c_str());
        return std::nullopt;
    }

    match_data retval{std::move(md)};
    auto rc = pcre2_match(this->p_code.in(),
                          (PCRE2_SPTR) in.data(),
                          in.length(),
                          0,
                          options,
                          retval.md_data.in(),
                          nullptr);

    if (rc > 0) {
        retval.md_input = in;
        retval.md_capture_end = rc;
        return std::move(retval);
    }

    if (rc != PCRE2_ERROR_NOMATCH) {
        unsigned char buffer[1024];

        pcre2_get_error_message(rc, buffer, sizeof(buffer));
        log_error("match failed for pattern %s -- %s",
                  this->p_pattern.c_str(),
                  (const char*) buffer);
    }

    return std::nullopt;
}

std::string
compile_error::get_message() const
{
    unsigned char buffer[1024];

    pcre2_get_error_message(this->ce_code, buffer, sizeof(buffer));

    return {(const char*) buffer};
}

}  // namespace pcre2pp
}  // namespace logpane
