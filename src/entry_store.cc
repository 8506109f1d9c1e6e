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
 * @file entry_store.cc
 */

#include <algorithm>

#include "entry_store.hh"

#include "base/lp_log.hh"
#include "config.h"

namespace logpane {

const char*
merge_result_name(merge_result_t mr)
{
    switch (mr) {
        case merge_result_t::MR_NO_CHANGE:
            return "no-change";
        case merge_result_t::MR_APPENDED:
            return "appended";
        case merge_result_t::MR_RESET:
            return "reset";
    }

    return "unknown";
}

const log_entry&
entry_snapshot::operator[](size_t index) const
{
    require_lt(index, this->es_size);

    if (index < this->es_batch_size) {
        return (*this->es_batch)[index];
    }

    index -= this->es_batch_size;

    const auto& chunk = this->es_live_chunks[index / entry_chunk::CHUNK_SIZE];
    return chunk->ec_body[index % entry_chunk::CHUNK_SIZE];
}

void
entry_store::append_live(const log_entry& le)
{
    if (this->es_live_chunks.empty() || this->es_live_chunks.back()->full()) {
        this->es_live_chunks.emplace_back(std::make_shared<entry_chunk>());
    }
    this->es_live_chunks.back()->ec_body.emplace_back(le);
    this->es_live_size += 1;
}

merge_result_t
entry_store::merge(const shared_batch& batch,
                   const std::vector<log_entry>& live_appends)
{
    auto retval = merge_result_t::MR_NO_CHANGE;

    if (!this->es_seen_batch || batch != this->es_batch
        || live_appends.size() < this->es_live_cursor)
    {
        if (this->es_seen_batch && batch == this->es_batch) {
            log_info("live sequence shrank from %zu to %zu, resetting",
                     this->es_live_cursor,
                     live_appends.size());
        }

        this->es_seen_batch = true;
        this->es_batch = batch;
        this->es_batch_size = batch ? batch->size() : 0;
        this->es_batch_max_time = std::nullopt;
        if (batch) {
            for (const auto& le : *batch) {
                if (!this->es_batch_max_time
                    || le.le_time > this->es_batch_max_time.value())
                {
                    this->es_batch_max_time = le.le_time;
                }
            }
        }
        this->es_live_chunks.clear();
        this->es_live_size = 0;
        this->es_live_cursor = 0;
        this->es_generation += 1;
        retval = merge_result_t::MR_RESET;

        log_debug("entry store reset: generation=%llu batch=%zu",
                  (unsigned long long) this->es_generation,
                  this->es_batch_size);
    }

    size_t appended = 0;
    for (; this->es_live_cursor < live_appends.size(); this->es_live_cursor++)
    {
        const auto& le = live_appends[this->es_live_cursor];

        if (this->es_batch_max_time
            && le.le_time <= this->es_batch_max_time.value())
        {
            log_trace("dropping live entry %s covered by batch",
                      le.le_id.c_str());
            continue;
        }

        this->append_live(le);
        appended += 1;
    }

    if (appended > 0 && retval == merge_result_t::MR_NO_CHANGE) {
        retval = merge_result_t::MR_APPENDED;
    }

    if (retval != merge_result_t::MR_NO_CHANGE) {
        auto snap = this->snapshot();

        for (auto* l : this->es_listeners) {
            l->entries_merged(snap, retval);
        }
    }

    return retval;
}

entry_snapshot
entry_store::snapshot() const
{
    entry_snapshot retval;

    retval.es_batch = this->es_batch;
    retval.es_batch_size = this->es_batch_size;
    retval.es_live_chunks.assign(this->es_live_chunks.begin(),
                                 this->es_live_chunks.end());
    retval.es_size = this->es_batch_size + this->es_live_size;
    retval.es_generation = this->es_generation;

    return retval;
}

void
entry_store::add_listener(listener* l)
{
    this->es_listeners.emplace_back(l);
}

void
entry_store::remove_listener(listener* l)
{
    this->es_listeners.erase(
        std::remove(this->es_listeners.begin(), this->es_listeners.end(), l),
        this->es_listeners.end());
}

}  // namespace logpane
