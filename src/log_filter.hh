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
 * @file log_filter.hh
 */

#ifndef logpane_log_filter_hh
#define logpane_log_filter_hh

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "log_entry.hh"
#include "pcrepp/pcre2pp.hh"
#include "result.h"

namespace logpane {

/**
 * The criteria for selecting entries.  Values within one field are OR'd
 * together, the fields themselves are AND'd.  An empty field does not
 * constrain the result.
 */
struct log_filter {
    std::set<log_level_t> lf_levels;
    std::set<std::string> lf_tasks;
    std::set<int> lf_retries;
    std::set<source_type_t> lf_sources;
    std::string lf_search;
    bool lf_search_regex{false};
    std::optional<time_us> lf_start;
    std::optional<time_us> lf_end;

    bool empty() const
    {
        return this->lf_levels.empty() && this->lf_tasks.empty()
            && this->lf_retries.empty() && this->lf_sources.empty()
            && this->lf_search.empty() && !this->lf_start && !this->lf_end;
    }
};

class compiled_filter {
public:
    /**
     * Prepare the filter for matching.  Fails if the search is a regular
     * expression that does not compile.
     */
    static Result<compiled_filter, std::string> compile(log_filter lf);

    compiled_filter() = default;

    bool matches(const log_entry& le) const;

    /**
     * Apply the filter to a batch.  The result is always a new batch object
     * so that the entry store treats a filter change as a reset.
     */
    shared_batch apply(const entry_batch& batch) const;

    const log_filter& get_filter() const { return this->cf_filter; }

private:
    log_filter cf_filter;
    std::string cf_lower_search;
    std::shared_ptr<pcre2pp::code> cf_regex;
};

enum class facet_field_t {
    FF_LEVEL,
    FF_TASK,
    FF_RETRY,
    FF_SOURCE,
    FF_IO_TYPE,
};

const char* facet_field_name(facet_field_t ff);

struct facet_value {
    std::string fv_value;
    size_t fv_count{0};
};

struct field_facet {
    facet_field_t ff_field;
    std::vector<facet_value> ff_values;
};

/**
 * Accumulates per-field value counts.  Entries without a value for a field
 * are not counted for that field.
 */
class facet_counter {
public:
    explicit facet_counter(std::vector<facet_field_t> fields);

    void add(const log_entry& le);

    /**
     * @return The facets with values sorted by descending count and then by
     *   value.
     */
    std::vector<field_facet> finish() const;

private:
    std::vector<facet_field_t> fc_fields;
    std::vector<std::vector<facet_value>> fc_counts;
};

template<typename C>
std::vector<field_facet>
compute_facets(const C& entries, std::vector<facet_field_t> fields)
{
    facet_counter fc(std::move(fields));

    for (const auto& le : entries) {
        fc.add(le);
    }

    return fc.finish();
}

}  // namespace logpane

#endif
