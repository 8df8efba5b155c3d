#pragma once

#include "core/exception.hpp"

#include <string_view>

namespace hb::window
{
    enum class WindowErrorKind
    {
        class_registration_failed,
        window_creation_failed,
    };

    struct WindowError final
    {
        WindowErrorKind kind{ WindowErrorKind::window_creation_failed };
        core::Win32Error win32_error{ core::Win32Error::success };
    };

    [[nodiscard]] constexpr std::wstring_view to_string(const WindowErrorKind kind) noexcept
    {
        switch (kind)
        {
        case WindowErrorKind::class_registration_failed:
            return L"RegisterClass failed";
        case WindowErrorKind::window_creation_failed:
            return L"CreateWindow failed";
        default:
            return L"unknown window error";
        }
    }
}
