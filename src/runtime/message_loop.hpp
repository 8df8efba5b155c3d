#pragma once

#include "core/exception.hpp"

#include <Windows.h>

#include <expected>

namespace hb::runtime
{
    // Blocking `GetMessageW` / `TranslateMessage` / `DispatchMessageW` loop for
    // the calling thread. Returns the `WM_QUIT` exit code.
    //
    // When `accelerators` is non-null every message is first offered to
    // `TranslateAcceleratorW`; messages it consumes are not dispatched.
    //
    // This loop is not always in control: while a window is being moved or
    // resized, or a modal dialog is open, the system runs its own loop and
    // dispatches through the same window procedures. To wake this thread from
    // another one, post a message to one of its windows (`PostMessageW`)
    // rather than touching window state directly.
    [[nodiscard]] std::expected<int, core::Win32Error> run_message_loop(HACCEL accelerators = nullptr) noexcept;

    // Posts `WM_QUIT` to the calling thread's queue.
    void post_quit(int exit_code) noexcept;
}
