#pragma once

#include "window/window_class.hpp"
#include "window/window_error.hpp"
#include "window/window_proc.hpp"

#include <Windows.h>

#include <expected>
#include <memory>
#include <string>

namespace hb::logging
{
    class Logger;
}

namespace hb::window
{
    // Parameters for `CreateWindowExW` other than the class and the proc.
    struct WindowConfig final
    {
        // `WS_EX_*` flags.
        DWORD ex_style{ 0 };

        // Window name; empty passes nullptr.
        std::wstring title;

        // `WS_*` flags.
        DWORD style{ 0 };

        // Raw pixels, relative to the primary monitor. `CW_USEDEFAULT` lets
        // the system choose (per axis).
        int x{ CW_USEDEFAULT };
        int y{ CW_USEDEFAULT };
        int width{ CW_USEDEFAULT };
        int height{ CW_USEDEFAULT };

        // `HWND_MESSAGE` creates a message-only window.
        HWND parent{};
        HMENU menu{};

        // nullptr means the executable's module.
        HINSTANCE instance{};
    };

    // Creates a window of `window_class` driven by `proc`.
    //
    // On success the proc belongs to the window: it receives every message from
    // `WM_NCCREATE` through `WM_NCDESTROY` and is destroyed after the latter.
    // On failure the proc has already been destroyed when this returns.
    // `window_class` must have been registered through `register_window_class`
    // (directly or by name); other classes are rejected. `logger`, if given,
    // must outlive the window.
    [[nodiscard]] std::expected<HWND, WindowError> create_window(
        std::unique_ptr<IWindowProc> proc,
        const WindowClass& window_class,
        const WindowConfig& config,
        logging::Logger* logger = nullptr) noexcept;
}
