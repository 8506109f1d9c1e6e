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
 * @file string_util.cc
 */

#include <algorithm>

#include "string_util.hh"

#include <ctype.h>

#include "config.h"

void
scrub_ansi_string(std::string& str)
{
    size_t out = 0;

    for (size_t in = 0; in < str.size();) {
        if (str[in] == '\x1b' && in + 1 < str.size() && str[in + 1] == '[') {
            auto end = in + 2;

            while (end < str.size()
                   && (isdigit((unsigned char) str[end]) || str[end] == ';'))
            {
                end += 1;
            }
            if (end < str.size() && str[end] == 'm') {
                in = end + 1;
                continue;
            }
        }
        str[out++] = str[in++];
    }
    str.resize(out);
}

std::string_view
trim(std::string_view str)
{
    while (!str.empty() && isspace((unsigned char) str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && isspace((unsigned char) str.back())) {
        str.remove_suffix(1);
    }

    return str;
}

std::string
tolower(std::string_view str)
{
    std::string retval(str);

    std::transform(retval.begin(), retval.end(), retval.begin(), [](char ch) {
        return (char) ::tolower((unsigned char) ch);
    });

    return retval;
}

bool
icontains(std::string_view haystack, std::string_view lower_needle)
{
    if (lower_needle.empty()) {
        return true;
    }

    auto iter = std::search(
        haystack.begin(),
        haystack.end(),
        lower_needle.begin(),
        lower_needle.end(),
        [](char lhs, char rhs) {
            return ::tolower((unsigned char) lhs) == (unsigned char) rhs;
        });

    return iter != haystack.end();
}

std::vector<std::string_view>
split_lines(std::string_view str)
{
    std::vector<std::string_view> retval;

    while (!str.empty()) {
        auto eol = str.find('\n');

        if (eol == std::string_view::npos) {
            retval.emplace_back(str);
            break;
        }

        auto line = str.substr(0, eol);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        retval.emplace_back(line);
        str.remove_prefix(eol + 1);
    }

    return retval;
}
