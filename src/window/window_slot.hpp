#pragma once

#include "window/window_proc_cell.hpp"

#include <Windows.h>

// The per-window slot is `GWLP_USERDATA`. Only the dispatch trampoline writes
// it: once when binding on `WM_NCCREATE`, once when clearing on `WM_NCDESTROY`.
// Windows whose class routes through `dispatch_window_event` must not have
// their user data changed by anything else.

namespace hb::window
{
    // Stores `cell` in the slot of `hwnd`. The slot must be empty.
    void bind_slot(HWND hwnd, WindowProcCell& cell) noexcept;

    // Returns the bound cell, or nullptr when the slot is empty.
    [[nodiscard]] WindowProcCell* read_slot(HWND hwnd) noexcept;

    // Empties the slot and returns the cell it held (or nullptr). The slot's
    // reference moves to the caller, who must release it.
    [[nodiscard]] WindowProcCell* take_slot(HWND hwnd) noexcept;
}
