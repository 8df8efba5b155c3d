#pragma once

#include "core/exception.hpp"
#include "window/window_error.hpp"

#include <Windows.h>

#include <expected>
#include <string>

namespace hb::logging
{
    class Logger;
}

namespace hb::window
{
    // Attributes for `RegisterClassExW`. The window procedure is always
    // `dispatch_window_event`; everything else passes through unchanged.
    struct WindowClassConfig final
    {
        // Must be unique within `instance`; duplicates fail registration.
        std::wstring class_name;

        // `CS_*` flags.
        UINT style{ 0 };

        // `cbWndExtra`. Dialog classes need `DLGWINDOWEXTRA`.
        int window_extra_bytes{ 0 };

        // nullptr means the executable's module.
        HINSTANCE instance{};

        HICON icon{};
        HICON small_icon{};
        HCURSOR cursor{};
        HBRUSH background{};

        // Resource name of the class menu; empty for none.
        std::wstring menu_name;
    };

    // A registered window class, referred to by atom or by name.
    class WindowClass final
    {
    public:
        [[nodiscard]] static WindowClass from_atom(ATOM atom) noexcept;

        // For a class that is already registered, by this library or otherwise.
        [[nodiscard]] static WindowClass from_name(std::wstring class_name);

        // The value for the `lpClassName` parameter of `CreateWindowExW`.
        [[nodiscard]] LPCWSTR as_class_name() const noexcept;

        [[nodiscard]] bool is_atom() const noexcept;
        [[nodiscard]] ATOM atom() const noexcept;
        [[nodiscard]] const std::wstring& name() const noexcept;

    private:
        WindowClass() noexcept = default;

        ATOM _atom{ 0 };
        std::wstring _name;
    };

    // Registers `config` with `dispatch_window_event` as its window procedure.
    // The class is never unregistered implicitly; its lifetime is normally the
    // whole process.
    [[nodiscard]] std::expected<WindowClass, WindowError> register_window_class(
        const WindowClassConfig& config,
        logging::Logger* logger = nullptr) noexcept;

    // All windows of the class must already be destroyed.
    [[nodiscard]] std::expected<void, core::Win32Error> unregister_window_class(
        const WindowClass& window_class,
        HINSTANCE instance = nullptr) noexcept;
}
