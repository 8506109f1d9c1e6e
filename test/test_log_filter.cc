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
 * @file test_log_filter.cc
 */

#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "log_filter.hh"

using namespace logpane;

namespace {

log_entry
task_entry(const std::string& id,
           const std::string& task,
           log_level_t level,
           const std::string& msg = "")
{
    auto retval = make_entry(id, utc(2024, 1, 2, 10, 0, 0), level, msg);

    retval.le_labels.ll_task = task;
    retval.le_labels.ll_retry = 0;
    retval.le_labels.ll_source = source_type_t::ST_USER;

    return retval;
}

compiled_filter
compile_ok(log_filter lf)
{
    auto res = compiled_filter::compile(std::move(lf));

    REQUIRE(res.isOk());
    return res.unwrap();
}

}  // namespace

TEST_CASE("compiled_filter ORs values within a field")
{
    log_filter lf;

    lf.lf_levels = {LEVEL_ERROR, LEVEL_WARNING};

    auto cf = compile_ok(lf);
    CHECK(cf.matches(task_entry("1", "a", LEVEL_ERROR)));
    CHECK(cf.matches(task_entry("2", "a", LEVEL_WARNING)));
    CHECK_FALSE(cf.matches(task_entry("3", "a", LEVEL_INFO)));
}

TEST_CASE("compiled_filter ANDs across fields")
{
    log_filter lf;

    lf.lf_levels = {LEVEL_ERROR};
    lf.lf_tasks = {"train", "eval"};

    auto cf = compile_ok(lf);
    CHECK(cf.matches(task_entry("1", "train", LEVEL_ERROR)));
    CHECK(cf.matches(task_entry("2", "eval", LEVEL_ERROR)));
    CHECK_FALSE(cf.matches(task_entry("3", "train", LEVEL_INFO)));
    CHECK_FALSE(cf.matches(task_entry("4", "prep", LEVEL_ERROR)));

    auto no_task = make_entry("5", utc(2024, 1, 2), LEVEL_ERROR);
    CHECK_FALSE(cf.matches(no_task));
}

TEST_CASE("compiled_filter treats an unknown level as info")
{
    log_filter lf;

    lf.lf_levels = {LEVEL_INFO};

    auto cf = compile_ok(lf);
    CHECK(cf.matches(task_entry("1", "a", LEVEL_UNKNOWN)));
}

TEST_CASE("compiled_filter time bounds are inclusive")
{
    log_filter lf;

    lf.lf_start = utc(2024, 1, 2, 10, 0, 0);
    lf.lf_end = utc(2024, 1, 2, 11, 0, 0);

    auto cf = compile_ok(lf);
    CHECK(cf.matches(make_entry("1", utc(2024, 1, 2, 10, 0, 0))));
    CHECK(cf.matches(make_entry("2", utc(2024, 1, 2, 11, 0, 0))));
    CHECK_FALSE(cf.matches(make_entry("3", utc(2024, 1, 2, 9, 59, 59))));
    CHECK_FALSE(cf.matches(make_entry("4", utc(2024, 1, 2, 11, 0, 1))));
}

TEST_CASE("compiled_filter text search")
{
    SUBCASE("substring is case-insensitive")
    {
        log_filter lf;

        lf.lf_search = "CUDA Error";

        auto cf = compile_ok(lf);
        CHECK(cf.matches(
            task_entry("1", "a", LEVEL_ERROR, "fatal: cuda error 700")));
        CHECK_FALSE(cf.matches(task_entry("2", "a", LEVEL_ERROR, "all ok")));
    }

    SUBCASE("regex")
    {
        log_filter lf;

        lf.lf_search = R"(step \d+/\d+)";
        lf.lf_search_regex = true;

        auto cf = compile_ok(lf);
        CHECK(cf.matches(task_entry("1", "a", LEVEL_INFO, "Step 10/200")));
        CHECK_FALSE(cf.matches(task_entry("2", "a", LEVEL_INFO, "step x/y")));
    }

    SUBCASE("bad regex")
    {
        log_filter lf;

        lf.lf_search = "foo(";
        lf.lf_search_regex = true;

        auto res = compiled_filter::compile(lf);
        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().find("invalid search pattern at offset 4")
              == 0);
    }
}

TEST_CASE("compiled_filter::apply always makes a new batch")
{
    entry_batch batch = {
        task_entry("1", "a", LEVEL_INFO),
        task_entry("2", "b", LEVEL_ERROR),
    };

    compiled_filter empty;
    auto all1 = empty.apply(batch);
    auto all2 = empty.apply(batch);
    CHECK(all1->size() == 2);
    CHECK(all1 != all2);

    log_filter lf;
    lf.lf_tasks = {"b"};
    auto only_b = compile_ok(lf).apply(batch);
    REQUIRE(only_b->size() == 1);
    CHECK((*only_b)[0].le_id == "2");
}

TEST_CASE("compute_facets")
{
    std::vector<log_entry> entries = {
        task_entry("1", "train", LEVEL_INFO),
        task_entry("2", "eval", LEVEL_ERROR),
        task_entry("3", "train", LEVEL_UNKNOWN),
        task_entry("4", "prep", LEVEL_WARNING),
        make_entry("5", utc(2024, 1, 2), LEVEL_INFO),
    };

    auto facets = compute_facets(
        entries, {facet_field_t::FF_LEVEL, facet_field_t::FF_TASK});
    REQUIRE(facets.size() == 2);

    const auto& levels = facets[0];
    CHECK(levels.ff_field == facet_field_t::FF_LEVEL);
    REQUIRE(levels.ff_values.size() == 3);
    CHECK(levels.ff_values[0].fv_value == "info");
    CHECK(levels.ff_values[0].fv_count == 3);
    CHECK(levels.ff_values[1].fv_value == "error");
    CHECK(levels.ff_values[2].fv_value == "warning");

    const auto& tasks = facets[1];
    REQUIRE(tasks.ff_values.size() == 3);
    CHECK(tasks.ff_values[0].fv_value == "train");
    CHECK(tasks.ff_values[0].fv_count == 2);
    CHECK(tasks.ff_values[1].fv_value == "eval");
    CHECK(tasks.ff_values[2].fv_value == "prep");
}
