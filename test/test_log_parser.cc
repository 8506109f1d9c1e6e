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
 * @file test_log_parser.cc
 */

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "log_parser.hh"

using namespace logpane;

static time_us
fixed_clock()
{
    return utc(2024, 3, 1, 12, 0, 0);
}

TEST_CASE("log_line_parser::parse_line basic")
{
    log_line_parser parser(fixed_clock);

    auto le = parser.parse_line("2024/01/02 10:00:00 [train] hello");
    REQUIRE(le.has_value());
    CHECK(le->le_time == utc(2024, 1, 2, 10, 0, 0));
    CHECK(le->le_message == " hello");
    CHECK(le->le_labels.ll_task.value() == "train");
    CHECK(le->le_labels.ll_retry.value() == 0);
    CHECK(le->le_labels.ll_source.value() == source_type_t::ST_USER);
    CHECK(le->le_labels.ll_io_type.value() == io_type_t::IOT_STDOUT);
    CHECK(le->le_id == "1704189600000-1");
    CHECK(le->le_level == LEVEL_UNKNOWN);
}

TEST_CASE("log_line_parser::parse_line retry and osmo")
{
    log_line_parser parser(fixed_clock);

    auto retry = parser.parse_line("2024/01/02 10:00:01 [train retry-2] again");
    REQUIRE(retry.has_value());
    CHECK(retry->le_labels.ll_task.value() == "train");
    CHECK(retry->le_labels.ll_retry.value() == 2);

    auto osmo = parser.parse_line(
        "2024/01/02 10:00:02 [train][osmo] Downloading inputs");
    REQUIRE(osmo.has_value());
    CHECK(osmo->le_message == " Downloading inputs");
    CHECK(osmo->le_labels.ll_source.value() == source_type_t::ST_OSMO);
    CHECK(osmo->le_labels.ll_io_type.value() == io_type_t::IOT_OSMO_CTRL);
    CHECK(osmo->le_id == "1704189602000-2");
}

TEST_CASE("log_line_parser::parse_line ansi")
{
    log_line_parser parser(fixed_clock);

    auto le = parser.parse_line(
        "2024/01/02 10:00:00 [train] \x1b[1;31mERROR\x1b[0m: disk full");
    REQUIRE(le.has_value());
    CHECK(le->le_message == " ERROR: disk full");
    CHECK(le->le_level == LEVEL_ERROR);
}

TEST_CASE("log_line_parser::parse_line dump lines")
{
    log_line_parser parser(fixed_clock);

    CHECK_FALSE(parser.parse_line("").has_value());
    CHECK_FALSE(parser.parse_line("   ").has_value());

    auto plain = parser.parse_line("Traceback (most recent call last):");
    REQUIRE(plain.has_value());
    CHECK(plain->le_time == fixed_clock());
    CHECK(plain->le_id.find("dump-") == 0);
    CHECK_FALSE(plain->le_labels.ll_task.has_value());
    CHECK(plain->le_message == "Traceback (most recent call last):");

    auto bad_date = parser.parse_line("2024/13/40 10:00:00 [train] hello");
    REQUIRE(bad_date.has_value());
    CHECK(bad_date->le_id.find("dump-") == 0);

    auto no_task = parser.parse_line("2024/01/02 10:00:00 hello");
    REQUIRE(no_task.has_value());
    CHECK(no_task->le_id.find("dump-") == 0);
}

TEST_CASE("detect_level")
{
    CHECK(detect_level("ERROR: boom") == LEVEL_ERROR);
    CHECK(detect_level(" [WARN] low disk") == LEVEL_WARNING);
    CHECK(detect_level("WARNING something") == LEVEL_WARNING);
    CHECK(detect_level("DEBUG") == LEVEL_DEBUG);
    CHECK(detect_level("FATAL: out of memory") == LEVEL_FATAL);
    CHECK(detect_level(" INFO step 1") == LEVEL_INFO);
    CHECK(detect_level("INFORMATION") == LEVEL_UNKNOWN);
    CHECK(detect_level("error in lowercase") == LEVEL_UNKNOWN);
}

TEST_CASE("log_line_parser::parse_batch")
{
    log_line_parser parser(fixed_clock);

    auto batch = parser.parse_batch(
        "2024/01/02 10:00:00 [a] one\r\n"
        "\n"
        "2024/01/02 10:00:01 [b] two\n"
        "continued\n");

    REQUIRE(batch.size() == 3);
    CHECK(batch[0].le_message == " one");
    CHECK(batch[1].le_labels.ll_task.value() == "b");
    CHECK(batch[2].le_message == "continued");
}
