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
 * @file log_filter.cc
 */

#include <algorithm>
#include <iterator>

#include "log_filter.hh"

#include "base/lp_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace logpane {

Result<compiled_filter, std::string>
compiled_filter::compile(log_filter lf)
{
    compiled_filter retval;

    if (!lf.lf_search.empty()) {
        if (lf.lf_search_regex) {
            auto code_res
                = pcre2pp::code::from(lf.lf_search, PCRE2_CASELESS);

            if (code_res.isErr()) {
                auto ce = code_res.unwrapErr();

                return Err(fmt::format(
                    FMT_STRING("invalid search pattern at offset {}: {}"),
                    ce.ce_offset,
                    ce.get_message()));
            }
            retval.cf_regex = code_res.unwrap().to_shared();
        } else {
            retval.cf_lower_search = tolower(lf.lf_search);
        }
    }
    retval.cf_filter = std::move(lf);

    return Ok(std::move(retval));
}

bool
compiled_filter::matches(const log_entry& le) const
{
    const auto& lf = this->cf_filter;
    const auto& labels = le.le_labels;

    if (!lf.lf_levels.empty()
        && lf.lf_levels.count(effective_level(le.le_level)) == 0)
    {
        return false;
    }
    if (!lf.lf_tasks.empty()
        && (!labels.ll_task || lf.lf_tasks.count(labels.ll_task.value()) == 0))
    {
        return false;
    }
    if (!lf.lf_retries.empty()
        && (!labels.ll_retry
            || lf.lf_retries.count(labels.ll_retry.value()) == 0))
    {
        return false;
    }
    if (!lf.lf_sources.empty()
        && (!labels.ll_source
            || lf.lf_sources.count(labels.ll_source.value()) == 0))
    {
        return false;
    }
    if (lf.lf_start && le.le_time < lf.lf_start.value()) {
        return false;
    }
    if (lf.lf_end && le.le_time > lf.lf_end.value()) {
        return false;
    }
    if (this->cf_regex) {
        return this->cf_regex->matches(le.le_message);
    }
    if (!this->cf_lower_search.empty()) {
        return icontains(le.le_message, this->cf_lower_search);
    }

    return true;
}

shared_batch
compiled_filter::apply(const entry_batch& batch) const
{
    entry_batch retval;

    if (this->cf_filter.empty()) {
        retval = batch;
    } else {
        std::copy_if(batch.begin(),
                     batch.end(),
                     std::back_inserter(retval),
                     [this](const auto& le) { return this->matches(le); });
    }

    log_debug("filter kept %zu of %zu entries", retval.size(), batch.size());

    return make_batch(std::move(retval));
}

const char*
facet_field_name(facet_field_t ff)
{
    switch (ff) {
        case facet_field_t::FF_LEVEL:
            return "level";
        case facet_field_t::FF_TASK:
            return "task";
        case facet_field_t::FF_RETRY:
            return "retry";
        case facet_field_t::FF_SOURCE:
            return "source";
        case facet_field_t::FF_IO_TYPE:
            return "io_type";
    }

    return "unknown";
}

facet_counter::facet_counter(std::vector<facet_field_t> fields)
    : fc_fields(std::move(fields)), fc_counts(this->fc_fields.size())
{
}

static std::optional<std::string>
value_for_field(const log_entry& le, facet_field_t ff)
{
    const auto& labels = le.le_labels;

    switch (ff) {
        case facet_field_t::FF_LEVEL:
            return std::string(level_names[effective_level(le.le_level)]);
        case facet_field_t::FF_TASK:
            return labels.ll_task;
        case facet_field_t::FF_RETRY:
            if (labels.ll_retry) {
                return std::to_string(labels.ll_retry.value());
            }
            break;
        case facet_field_t::FF_SOURCE:
            if (labels.ll_source) {
                return std::string(source_type_name(labels.ll_source.value()));
            }
            break;
        case facet_field_t::FF_IO_TYPE:
            if (labels.ll_io_type) {
                return std::string(io_type_name(labels.ll_io_type.value()));
            }
            break;
    }

    return std::nullopt;
}

void
facet_counter::add(const log_entry& le)
{
    for (size_t lpc = 0; lpc < this->fc_fields.size(); lpc++) {
        auto value = value_for_field(le, this->fc_fields[lpc]);

        if (!value || value->empty()) {
            continue;
        }

        auto& counts = this->fc_counts[lpc];
        auto iter = std::find_if(
            counts.begin(), counts.end(), [&value](const auto& fv) {
                return fv.fv_value == value.value();
            });
        if (iter == counts.end()) {
            counts.emplace_back(facet_value{value.value(), 1});
        } else {
            iter->fv_count += 1;
        }
    }
}

std::vector<field_facet>
facet_counter::finish() const
{
    std::vector<field_facet> retval;

    for (size_t lpc = 0; lpc < this->fc_fields.size(); lpc++) {
        field_facet ff{this->fc_fields[lpc], this->fc_counts[lpc]};

        std::sort(ff.ff_values.begin(),
                  ff.ff_values.end(),
                  [](const auto& lhs, const auto& rhs) {
                      if (lhs.fv_count != rhs.fv_count) {
                          return lhs.fv_count > rhs.fv_count;
                      }
                      return lhs.fv_value < rhs.fv_value;
                  });
        retval.emplace_back(std::move(ff));
    }

    return retval;
}

}  // namespace logpane
