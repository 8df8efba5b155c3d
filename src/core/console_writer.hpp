#pragma once

#include <Windows.h>

#include <cwchar>
#include <string_view>

namespace hb::core
{
    // Writes one line to stderr. Used for failures that happen before (or
    // instead of) logger setup, so it must not depend on `logging`.
    inline void write_console_line(const std::wstring_view message) noexcept
    {
        const HANDLE stream = ::GetStdHandle(STD_ERROR_HANDLE);
        if (stream == nullptr || stream == INVALID_HANDLE_VALUE)
        {
            return;
        }

        DWORD written = 0;
        DWORD mode = 0;
        if (::GetConsoleMode(stream, &mode) != FALSE)
        {
            ::WriteConsoleW(stream, message.data(), static_cast<DWORD>(message.size()), &written, nullptr);
            ::WriteConsoleW(stream, L"\r\n", 2, &written, nullptr);
            return;
        }

        ::WriteFile(stream, message.data(), static_cast<DWORD>(message.size() * sizeof(wchar_t)), &written, nullptr);
        ::WriteFile(stream, L"\r\n", static_cast<DWORD>(2 * sizeof(wchar_t)), &written, nullptr);
    }

    // `write_console_line` plus the debugger output. A GUI-subsystem process
    // usually has no stderr, so top-level failures go to both.
    inline void report_failure_line(const std::wstring_view message) noexcept
    {
        wchar_t buffer[1024]{};
        _snwprintf_s(
            buffer,
            _TRUNCATE,
            L"[hwnd_bridge] %.*ls\n",
            static_cast<int>(message.size()),
            message.data());
        ::OutputDebugStringW(buffer);
        write_console_line(message);
    }
}
