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
 * @file test_sysclip.cc
 */

#include <string>

#include <unistd.h>

#include "base/injector.bind.hh"
#include "config.h"
#include "doctest/doctest.h"
#include "sysclip.cfg.hh"
#include "sysclip.hh"

static std::string
read_available(int fd)
{
    std::string retval;
    char buffer[256];

    while (true) {
        auto rc = read(fd, buffer, sizeof(buffer));
        if (rc <= 0) {
            break;
        }
        retval.append(buffer, rc);
    }

    return retval;
}

TEST_CASE("copy_text falls back to OSC 52")
{
    int fds[2];

    REQUIRE(pipe(fds) == 0);

    sysclip::config local;
    local.c_osc52_fd = fds[1];
    {
        auto lifetime
            = injector::bind<sysclip::config>::to_scoped_instance(&local);

        auto res = sysclip::copy_text("hello");
        CHECK(res.isOk());
    }
    close(fds[1]);

    CHECK(read_available(fds[0]) == "\x1b]52;c;aGVsbG8=\a");
    close(fds[0]);
}

TEST_CASE("copy_text reports a closed OSC 52 descriptor")
{
    int fds[2];

    REQUIRE(pipe(fds) == 0);
    close(fds[0]);
    close(fds[1]);

    sysclip::config local;
    local.c_osc52_fd = fds[1];
    auto lifetime = injector::bind<sysclip::config>::to_scoped_instance(&local);

    auto res = sysclip::copy_text("hello");
    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().find("OSC 52") != std::string::npos);
}

TEST_CASE("copy_text uses the detected command")
{
    sysclip::config local;
    local.c_clipboard_impls["works"] = {"true", "cat > /dev/null"};
    auto lifetime = injector::bind<sysclip::config>::to_scoped_instance(&local);

    auto res = sysclip::copy_text("hello");
    CHECK(res.isOk());
}

TEST_CASE("copy_text reports a failing clipboard command")
{
    sysclip::config local;
    local.c_clipboard_impls["broken"] = {"true", "cat > /dev/null; false"};
    auto lifetime = injector::bind<sysclip::config>::to_scoped_instance(&local);

    auto res = sysclip::copy_text("hello");
    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().find("clipboard command failed") != std::string::npos);
    CHECK(res.unwrapErr().find("status 1") != std::string::npos);
}

TEST_CASE("copy_text skips implementations whose test fails")
{
    int fds[2];

    REQUIRE(pipe(fds) == 0);

    sysclip::config local;
    local.c_clipboard_impls["missing"] = {"false", "cat > /dev/null"};
    local.c_osc52_fd = fds[1];
    {
        auto lifetime
            = injector::bind<sysclip::config>::to_scoped_instance(&local);

        CHECK(sysclip::copy_text("").isOk());
    }
    close(fds[1]);

    CHECK(read_available(fds[0]) == "\x1b]52;c;\a");
    close(fds[0]);
}
