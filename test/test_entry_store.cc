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
 * @file test_entry_store.cc
 */

#include <string>
#include <vector>

#include "config.h"
#include "doctest/doctest.h"
#include "entry_fixtures.hh"
#include "entry_store.hh"

using namespace logpane;

namespace {

struct merge_recorder : entry_store::listener {
    void entries_merged(const entry_snapshot& snapshot,
                        merge_result_t result) override
    {
        this->mr_results.emplace_back(result);
        this->mr_sizes.emplace_back(snapshot.size());
    }

    std::vector<merge_result_t> mr_results;
    std::vector<size_t> mr_sizes;
};

std::vector<std::string>
ids_of(const entry_snapshot& snap)
{
    std::vector<std::string> retval;

    for (const auto& le : snap) {
        retval.emplace_back(le.le_id);
    }

    return retval;
}

}  // namespace

TEST_CASE("entry_store drops live duplicates of the batch")
{
    entry_store store;
    auto e1 = make_entry("e1", utc(2024, 1, 2, 10, 0, 0));
    auto e2 = make_entry("e2", utc(2024, 1, 2, 10, 1, 0));
    auto e3 = make_entry("e3", utc(2024, 1, 2, 10, 2, 0));
    auto batch = make_batch({e1, e2});
    std::vector<log_entry> live = {e2, e3};

    CHECK(store.merge(batch, live) == merge_result_t::MR_RESET);

    auto snap = store.snapshot();
    CHECK(ids_of(snap) == std::vector<std::string>{"e1", "e2", "e3"});
    CHECK(store.get_batch_max_time().value() == e2.le_time);
}

TEST_CASE("entry_store merge is idempotent")
{
    entry_store store;
    auto batch = make_batch({
        make_entry("e1", utc(2024, 1, 2, 10, 0, 0)),
        make_entry("e2", utc(2024, 1, 2, 10, 1, 0)),
    });
    std::vector<log_entry> live = {
        make_entry("e3", utc(2024, 1, 2, 10, 2, 0)),
    };

    store.merge(batch, live);
    auto first_size = store.size();
    CHECK(store.merge(batch, live) == merge_result_t::MR_NO_CHANGE);
    CHECK(store.size() == first_size);
    CHECK(store.get_generation() == 1);
}

TEST_CASE("entry_store appends only new live entries")
{
    entry_store store;
    merge_recorder rec;
    auto batch = make_batch({make_entry("e1", utc(2024, 1, 2, 10, 0, 0))});
    std::vector<log_entry> live;

    store.add_listener(&rec);
    store.merge(batch, live);

    live.emplace_back(make_entry("e2", utc(2024, 1, 2, 10, 0, 5)));
    CHECK(store.merge(batch, live) == merge_result_t::MR_APPENDED);
    live.emplace_back(make_entry("e3", utc(2024, 1, 2, 10, 0, 6)));
    live.emplace_back(make_entry("e4", utc(2024, 1, 2, 10, 0, 7)));
    CHECK(store.merge(batch, live) == merge_result_t::MR_APPENDED);
    CHECK(store.size() == 4);
    CHECK(store.get_generation() == 1);

    CHECK(rec.mr_results
          == std::vector<merge_result_t>{merge_result_t::MR_RESET,
                                         merge_result_t::MR_APPENDED,
                                         merge_result_t::MR_APPENDED});
    CHECK(rec.mr_sizes == std::vector<size_t>{1, 2, 4});
    store.remove_listener(&rec);
}

TEST_CASE("entry_store resets on a new batch identity")
{
    entry_store store;
    auto e1 = make_entry("e1", utc(2024, 1, 2, 10, 0, 0));
    auto e2 = make_entry("e2", utc(2024, 1, 2, 10, 5, 0));
    std::vector<log_entry> live = {e2};

    store.merge(make_batch({e1}), live);
    CHECK(store.size() == 2);
    CHECK(store.get_generation() == 1);

    // the same contents in a different batch object is a fresh query
    auto refetched = make_batch({e1, e2});
    CHECK(store.merge(refetched, live) == merge_result_t::MR_RESET);
    CHECK(store.get_generation() == 2);
    CHECK(ids_of(store.snapshot()) == std::vector<std::string>{"e1", "e2"});
}

TEST_CASE("entry_store resets when the live sequence shrinks")
{
    entry_store store;
    auto batch = make_batch({make_entry("e1", utc(2024, 1, 2, 10, 0, 0))});
    std::vector<log_entry> live = {
        make_entry("e2", utc(2024, 1, 2, 10, 0, 1)),
        make_entry("e3", utc(2024, 1, 2, 10, 0, 2)),
    };

    store.merge(batch, live);
    live.pop_back();
    CHECK(store.merge(batch, live) == merge_result_t::MR_RESET);
    CHECK(store.size() == 2);
    CHECK(store.get_generation() == 2);
}

TEST_CASE("entry_store drops live entries not newer than the batch")
{
    entry_store store;
    auto batch = make_batch({make_entry("e1", utc(2024, 1, 2, 10, 0, 0))});
    std::vector<log_entry> live = {
        make_entry("late", utc(2024, 1, 2, 9, 59, 0)),
        make_entry("same", utc(2024, 1, 2, 10, 0, 0)),
        make_entry("new", utc(2024, 1, 2, 10, 0, 1)),
    };

    store.merge(batch, live);
    CHECK(ids_of(store.snapshot()) == std::vector<std::string>{"e1", "new"});
}

TEST_CASE("entry_snapshot is immutable")
{
    entry_store store;
    auto batch = make_batch({make_entry("e1", utc(2024, 1, 2, 10, 0, 0))});
    std::vector<log_entry> live;

    store.merge(batch, live);
    auto before = store.snapshot();

    for (int lpc = 0; lpc < 3000; lpc++) {
        live.emplace_back(make_entry("l" + std::to_string(lpc),
                                     utc(2024, 1, 2, 11, 0, 0)
                                         + std::chrono::seconds{lpc}));
    }
    store.merge(batch, live);
    auto after = store.snapshot();

    CHECK(before.size() == 1);
    CHECK(before[0].le_id == "e1");
    CHECK(after.size() == 3001);
    CHECK(after[1].le_id == "l0");
    CHECK(after[1025].le_id == "l1024");
    CHECK(after[3000].le_id == "l2999");
    CHECK(after.generation() == before.generation());
}
