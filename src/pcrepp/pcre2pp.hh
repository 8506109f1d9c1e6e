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
 * @file pcre2pp.hh
 */

#ifndef logpane_pcre2pp_hh
#define logpane_pcre2pp_hh

#define PCRE2_CODE_UNIT_WIDTH 8

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pcre2.h>

#include "base/auto_mem.hh"
#include "result.h"

namespace logpane {
namespace pcre2pp {

class code;

class match_data {
public:
    std::optional<std::string_view> operator[](size_t index) const
    {
        if (index >= this->md_capture_end) {
            return std::nullopt;
        }

        auto start = this->md_ovector[(index * 2)];
        auto stop = this->md_ovector[(index * 2) + 1];
        if (start == PCRE2_UNSET || stop == PCRE2_UNSET) {
            return std::nullopt;
        }

        return this->md_input.substr(start, stop - start);
    }

    size_t get_count() const { return this->md_capture_end; }

    /** @return The text following the whole match. */
    std::string_view remaining() const
    {
        return this->md_input.substr(this->md_ovector[1]);
    }

private:
    friend code;

    explicit match_data(auto_mem<pcre2_match_data> dat)
        : md_data(std::move(dat)),
          md_ovector(pcre2_get_ovector_pointer(this->md_data.in()))
    {
    }

    auto_mem<pcre2_match_data> md_data;
    std::string_view md_input;
    PCRE2_SIZE* md_ovector{nullptr};
    size_t md_capture_end{0};
};

struct compile_error {
    std::string ce_pattern;
    int ce_code{0};
    size_t ce_offset{0};

    std::string get_message() const;
};

class code {
public:
    static Result<code, compile_error> from(const std::string& pattern,
                                            int options = 0);

    template<std::size_t N>
    static code from_const(const char (&str)[N], int options = 0)
    {
        auto res = from(std::string(str, N - 1), options);

        if (res.isErr()) {
            fprintf(stderr, "failed to compile constant regex: %s\n", str);
            fprintf(stderr, "  %s\n", res.unwrapErr().get_message().c_str());
        }

        return res.unwrap();
    }

    const std::string& get_pattern() const { return this->p_pattern; }

    /**
     * Search for the pattern in the given input.
     *
     * @return The captures for the first match, or nullopt if there is no
     *   match.  Match errors are logged and treated as no match.
     */
    std::optional<match_data> find_in(std::string_view in,
                                      uint32_t options = 0) const;

    bool matches(std::string_view in, uint32_t options = 0) const
    {
        return this->find_in(in, options).has_value();
    }

    std::shared_ptr<code> to_shared() &&
    {
        return std::make_shared<code>(std::move(this->p_code),
                                      std::move(this->p_pattern));
    }

    code(auto_mem<pcre2_code> co, std::string pattern)
        : p_code(std::move(co)), p_pattern(std::move(pattern))
    {
    }

private:
    auto_mem<pcre2_code> p_code;
    std::string p_pattern;
};

}  // namespace pcre2pp
}  // namespace logpane

#endif
