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
 * @file selection_model.hh
 */

#ifndef logpane_selection_model_hh
#define logpane_selection_model_hh

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "entry_store.hh"
#include "flat_index.hh"
#include "result.h"

namespace logpane {

/**
 * A contiguous range of entries, addressed by their index in the entry
 * sequence.  The range is only meaningful while sr_epoch matches the
 * store's reset generation.
 */
struct selection_range {
    size_t sr_anchor{0};
    size_t sr_focus{0};
    uint64_t sr_epoch{0};

    /** @return The inclusive bounds of the range. */
    std::pair<size_t, size_t> normalized() const
    {
        return std::minmax(this->sr_anchor, this->sr_focus);
    }

    bool contains(size_t index) const
    {
        auto bounds = this->normalized();

        return bounds.first <= index && index <= bounds.second;
    }
};

/**
 * Terminal-style selection: a press sets the anchor, dragging or a
 * shift-click moves the focus.  A reset of the entry store voids the
 * selection without any explicit clearing.
 */
class selection_model {
public:
    explicit selection_model(const entry_store& store) : sm_store(store) {}

    bool pointer_down(size_t index);

    bool pointer_drag_to(size_t index);

    bool shift_click(size_t index);

    std::optional<selection_range> current_selection() const;

    void clear() { this->sm_range = std::nullopt; }

    /**
     * @return The messages of the selected entries joined with newlines, or
     *   nullopt if there is no selection.
     */
    std::optional<std::string> copy_selection() const;

    /**
     * Send the selected text to the system clipboard.  Nothing is done if
     * there is no selection.
     */
    Result<void, std::string> copy_to_clipboard() const;

private:
    const entry_store& sm_store;
    std::optional<selection_range> sm_range;
};

enum class pointer_state_t {
    PS_PRESSED,
    PS_DRAGGED,
    PS_RELEASED,
};

struct pointer_event {
    pointer_state_t pe_state;
    size_t pe_row;
    bool pe_shift{false};
};

/**
 * Translates pointer events on flattened rows into selection updates.
 */
class drag_gesture {
public:
    enum class state_t {
        DS_IDLE,
        DS_DRAGGING,
        DS_RELEASED,
    };

    drag_gesture(selection_model& sm, const flat_index& fi)
        : dg_selection(sm), dg_index(fi)
    {
    }

    void handle_event(const pointer_event& pe);

    state_t get_state() const { return this->dg_state; }

private:
    std::optional<size_t> entry_for_row(size_t row) const;

    selection_model& dg_selection;
    const flat_index& dg_index;
    state_t dg_state{state_t::DS_IDLE};
};

}  // namespace logpane

#endif
