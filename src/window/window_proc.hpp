#pragma once

#include <Windows.h>

#include <optional>

namespace hb::window
{
    // Application-side window procedure.
    //
    // One instance is attached to exactly one window by `create_window` and is
    // destroyed after that window's final message (`WM_NCDESTROY`) has been
    // processed. Calls arrive only on the thread that created the window, but
    // they can be reentrant: `DestroyWindow`, `SendMessageW` and modal dialogs
    // issued from inside `handle_event` dispatch nested messages to this same
    // instance before the outer call returns. The instance stays alive for the
    // whole outer call even if the nested calls tear the window down.
    class IWindowProc
    {
    public:
        virtual ~IWindowProc() = default;

        // Returning `std::nullopt` hands the message to `DefWindowProcW`.
        [[nodiscard]] virtual std::optional<LRESULT> handle_event(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) = 0;
    };
}
