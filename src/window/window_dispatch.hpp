#pragma once

#include <Windows.h>

namespace hb::window
{
    // First message of every window; carries `CREATESTRUCTW::lpCreateParams`.
    inline constexpr UINT k_creation_event = WM_NCCREATE;

    // Last message of every window.
    inline constexpr UINT k_teardown_event = WM_NCDESTROY;

    // The `WNDPROC` installed by `register_window_class`.
    //
    // Binds the cell passed through `CreateWindowExW` on `k_creation_event`,
    // forwards every message to the bound `IWindowProc` while holding a
    // temporary reference, and drops the slot's reference after
    // `k_teardown_event`. Messages for a window with an empty slot go straight
    // to `DefWindowProcW`.
    //
    // Only the payload of the `create_window` call in progress on this thread
    // is bound. A window of the class created directly with `CreateWindowExW`
    // stays unbound whatever its `lpParam` points to.
    LRESULT CALLBACK dispatch_window_event(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) noexcept;
}
