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
 * @file entry_store.hh
 */

#ifndef logpane_entry_store_hh
#define logpane_entry_store_hh

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

#include "log_entry.hh"

namespace logpane {

enum class merge_result_t {
    MR_NO_CHANGE,
    MR_APPENDED,
    MR_RESET,
};

const char* merge_result_name(merge_result_t mr);

/**
 * Live entries are kept in fixed-capacity chunks so that appending never
 * moves an entry that a snapshot may still be reading.
 */
struct entry_chunk {
    static constexpr size_t CHUNK_SIZE = 1024;

    entry_chunk() { this->ec_body.reserve(CHUNK_SIZE); }

    bool full() const { return this->ec_body.size() == CHUNK_SIZE; }

    std::vector<log_entry> ec_body;
};

/**
 * An immutable view of the combined entry sequence at one point in time.
 * Later merges never change what an existing snapshot reports.
 */
class entry_snapshot {
public:
    entry_snapshot() = default;

    size_t size() const { return this->es_size; }

    bool empty() const { return this->es_size == 0; }

    /** The reset generation of the store when the snapshot was taken. */
    uint64_t generation() const { return this->es_generation; }

    const log_entry& operator[](size_t index) const;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = log_entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const log_entry*;
        using reference = const log_entry&;

        iterator(const entry_snapshot* es, size_t index)
            : i_snapshot(es), i_index(index)
        {
        }

        reference operator*() const
        {
            return (*this->i_snapshot)[this->i_index];
        }

        pointer operator->() const { return &(**this); }

        iterator& operator++()
        {
            this->i_index += 1;
            return *this;
        }

        bool operator==(const iterator& other) const
        {
            return this->i_index == other.i_index;
        }

        bool operator!=(const iterator& other) const
        {
            return this->i_index != other.i_index;
        }

    private:
        const entry_snapshot* i_snapshot;
        size_t i_index;
    };

    iterator begin() const { return {this, 0}; }

    iterator end() const { return {this, this->es_size}; }

private:
    friend class entry_store;

    shared_batch es_batch;
    std::vector<std::shared_ptr<const entry_chunk>> es_live_chunks;
    size_t es_batch_size{0};
    size_t es_size{0};
    uint64_t es_generation{0};
};

/**
 * Combines a batch of historical entries with entries delivered by a live
 * subscription.
 *
 * The batch is tracked by identity: passing a different batch object
 * replaces the combined sequence and bumps the reset generation.  With the
 * same batch, only the live entries that were not seen before and that are
 * newer than every entry in the batch are appended.
 */
class entry_store {
public:
    class listener {
    public:
        virtual ~listener() = default;

        virtual void entries_merged(const entry_snapshot& snapshot,
                                    merge_result_t result)
            = 0;
    };

    merge_result_t merge(const shared_batch& batch,
                         const std::vector<log_entry>& live_appends);

    entry_snapshot snapshot() const;

    uint64_t get_generation() const { return this->es_generation; }

    size_t size() const { return this->es_batch_size + this->es_live_size; }

    std::optional<time_us> get_batch_max_time() const
    {
        return this->es_batch_max_time;
    }

    void add_listener(listener* l);

    void remove_listener(listener* l);

private:
    void append_live(const log_entry& le);

    std::vector<listener*> es_listeners;
    bool es_seen_batch{false};
    shared_batch es_batch;
    size_t es_batch_size{0};
    std::optional<time_us> es_batch_max_time;
    std::vector<std::shared_ptr<entry_chunk>> es_live_chunks;
    size_t es_live_size{0};
    size_t es_live_cursor{0};
    uint64_t es_generation{0};
};

}  // namespace logpane

#endif
