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
 * @file selection_model.cc
 */

#include <algorithm>

#include "selection_model.hh"

#include "base/lp_log.hh"
#include "config.h"
#include "sysclip.hh"

namespace logpane {

std::optional<selection_range>
selection_model::current_selection() const
{
    if (!this->sm_range
        || this->sm_range->sr_epoch != this->sm_store.get_generation())
    {
        return std::nullopt;
    }

    return this->sm_range;
}

bool
selection_model::pointer_down(size_t index)
{
    if (index >= this->sm_store.size()) {
        log_debug("ignoring press outside of entries: %zu", index);
        return false;
    }

    this->sm_range = selection_range{
        index,
        index,
        this->sm_store.get_generation(),
    };

    return true;
}

bool
selection_model::pointer_drag_to(size_t index)
{
    if (!this->current_selection() || this->sm_store.size() == 0) {
        return false;
    }

    this->sm_range->sr_focus = std::min(index, this->sm_store.size() - 1);

    return true;
}

bool
selection_model::shift_click(size_t index)
{
    if (index >= this->sm_store.size()) {
        return false;
    }

    if (!this->current_selection()) {
        return this->pointer_down(index);
    }

    this->sm_range->sr_focus = index;

    return true;
}

std::optional<std::string>
selection_model::copy_selection() const
{
    auto sel = this->current_selection();

    if (!sel) {
        return std::nullopt;
    }

    auto snap = this->sm_store.snapshot();
    auto bounds = sel->normalized();
    std::string retval;

    for (auto lpc = bounds.first; lpc <= bounds.second && lpc < snap.size();
         lpc++)
    {
        if (lpc > bounds.first) {
            retval.push_back('\n');
        }
        retval.append(snap[lpc].le_message);
    }

    return retval;
}

Result<void, std::string>
selection_model::copy_to_clipboard() const
{
    auto text = this->copy_selection();

    if (!text) {
        return Ok();
    }

    return sysclip::copy_text(text.value());
}

std::optional<size_t>
drag_gesture::entry_for_row(size_t row) const
{
    if (this->dg_index.empty()) {
        return std::nullopt;
    }

    return this->dg_index.entry_for_row(
        std::min(row, this->dg_index.size() - 1));
}

void
drag_gesture::handle_event(const pointer_event& pe)
{
    switch (pe.pe_state) {
        case pointer_state_t::PS_PRESSED: {
            if (pe.pe_row >= this->dg_index.size()
                || !this->dg_index[pe.pe_row].is<entry_item>())
            {
                return;
            }

            auto index
                = this->dg_index[pe.pe_row].get<entry_item>().ei_entry_index;
            auto handled = pe.pe_shift
                ? this->dg_selection.shift_click(index)
                : this->dg_selection.pointer_down(index);
            if (handled) {
                this->dg_state = state_t::DS_DRAGGING;
            }
            break;
        }
        case pointer_state_t::PS_DRAGGED:
        case pointer_state_t::PS_RELEASED: {
            if (this->dg_state != state_t::DS_DRAGGING) {
                return;
            }

            auto index = this->entry_for_row(pe.pe_row);
            if (index) {
                this->dg_selection.pointer_drag_to(index.value());
            }
            if (pe.pe_state == pointer_state_t::PS_RELEASED) {
                this->dg_state = state_t::DS_RELEASED;
            }
            break;
        }
    }
}

}  // namespace logpane
