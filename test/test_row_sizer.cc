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
 * @file test_row_sizer.cc
 */

#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "row_sizer.hh"

using namespace logpane;

namespace {

struct counting_host : view_host {
    void invalidate_measurements() override { this->ch_full += 1; }

    void invalidate_measurements_from(size_t row) override
    {
        this->ch_partial.emplace_back(row);
    }

    size_t ch_full{0};
    std::vector<size_t> ch_partial;
};

struct sizer_fixture {
    sizer_fixture() : sf_sizer(this->sf_index, this->sf_config)
    {
        this->sf_sizer.set_host(&this->sf_host);
    }

    void merge(const shared_batch& batch, const std::vector<log_entry>& live)
    {
        this->sf_store.merge(batch, live);

        auto snap = this->sf_store.snapshot();
        auto rr = this->sf_index.rebuild(snap);

        this->sf_sizer.set_snapshot(snap);
        this->sf_sizer.rows_rebuilt(rr);
    }

    entry_store sf_store;
    flat_index sf_index;
    flat_view::config sf_config;
    counting_host sf_host;
    row_sizer sf_sizer;
};

}  // namespace

TEST_CASE("row_sizer estimates by row kind")
{
    sizer_fixture sf;

    sf.merge(make_batch({
                 make_entry("1", utc(2024, 1, 1, 10, 0, 0)),
                 make_entry("2", utc(2024, 1, 1, 11, 0, 0)),
             }),
             {});

    CHECK(sf.sf_sizer.estimate_size(0) == sf.sf_config.c_separator_height);
    CHECK(sf.sf_sizer.estimate_size(1) == sf.sf_config.c_row_height);
    CHECK(sf.sf_sizer.estimate_size(2) == sf.sf_config.c_row_height);
    CHECK(sf.sf_sizer.estimate_size(99) == sf.sf_config.c_row_height);
}

TEST_CASE("row_sizer invalidates only on a full rebuild")
{
    sizer_fixture sf;
    auto batch = make_batch({make_entry("1", utc(2024, 1, 1, 10, 0, 0))});
    std::vector<log_entry> live;

    sf.merge(batch, live);
    CHECK(sf.sf_host.ch_full == 1);

    live.emplace_back(make_entry("2", utc(2024, 1, 1, 10, 0, 1)));
    sf.merge(batch, live);
    live.emplace_back(make_entry("3", utc(2024, 1, 2, 10, 0, 1)));
    sf.merge(batch, live);
    CHECK(sf.sf_host.ch_full == 1);
    CHECK(sf.sf_sizer.get_invalidation_count() == 1);

    sf.merge(make_batch({make_entry("1", utc(2024, 1, 1, 10, 0, 0))}), live);
    CHECK(sf.sf_host.ch_full == 2);
    CHECK(sf.sf_sizer.get_invalidation_count() == 2);
}

TEST_CASE("row_sizer::toggle_expanded")
{
    sizer_fixture sf;

    sf.merge(make_batch({
                 make_entry("1", utc(2024, 1, 1, 10, 0, 0)),
                 make_entry("2", utc(2024, 1, 1, 11, 0, 0)),
             }),
             {});

    CHECK_FALSE(sf.sf_sizer.toggle_expanded(0));
    CHECK(sf.sf_host.ch_partial.empty());

    CHECK(sf.sf_sizer.toggle_expanded(2));
    CHECK(sf.sf_sizer.is_expanded("2"));
    CHECK(sf.sf_sizer.estimate_size(2)
          == sf.sf_config.c_expanded_row_height);
    CHECK(sf.sf_sizer.estimate_size(1) == sf.sf_config.c_row_height);
    CHECK(sf.sf_host.ch_partial == std::vector<size_t>{2});

    CHECK_FALSE(sf.sf_sizer.toggle_expanded(2));
    CHECK(sf.sf_sizer.estimate_size(2) == sf.sf_config.c_row_height);
    CHECK_FALSE(sf.sf_sizer.toggle_expanded(7));
}

TEST_CASE("offset_cache visible rows")
{
    std::vector<int64_t> sizes = {10, 20, 10, 10, 50};
    offset_cache oc([&sizes](size_t row) { return sizes[row]; });

    CHECK(oc.offset_for_row(0) == 0);
    CHECK(oc.offset_for_row(2) == 30);
    CHECK(oc.total_size(sizes.size()) == 100);

    auto vr = oc.visible_rows(25, 20, sizes.size());
    CHECK(vr.vr_start == 1);
    CHECK(vr.vr_end == 4);

    auto top = oc.visible_rows(0, 10, sizes.size());
    CHECK(top.vr_start == 0);
    CHECK(top.vr_end == 1);

    auto wide = oc.visible_rows(25, 20, sizes.size(), 2);
    CHECK(wide.vr_start == 0);
    CHECK(wide.vr_end == 5);

    CHECK(oc.visible_rows(0, 0, sizes.size()).empty());
    CHECK(oc.visible_rows(0, 10, 0).empty());
}

TEST_CASE("offset_cache invalidation")
{
    std::vector<int64_t> sizes = {10, 10, 10, 10};
    offset_cache oc([&sizes](size_t row) { return sizes[row]; });

    CHECK(oc.total_size(4) == 40);

    sizes[2] = 30;
    oc.invalidate_measurements_from(2);
    CHECK(oc.offset_for_row(2) == 20);
    CHECK(oc.total_size(4) == 60);

    sizes[0] = 0;
    oc.invalidate_measurements();
    CHECK(oc.get_cached_rows() == 0);
    CHECK(oc.total_size(4) == 50);
}
