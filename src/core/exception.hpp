#pragma once

#include <Windows.h>

namespace hb::core
{
    // Strongly typed Win32 error codes. Values come straight from
    // `GetLastError`; only the success value is named here.
    enum class Win32Error : DWORD
    {
        success = ERROR_SUCCESS,
    };

    [[nodiscard]] constexpr DWORD to_dword(const Win32Error error) noexcept
    {
        return static_cast<DWORD>(error);
    }

    [[nodiscard]] constexpr Win32Error from_dword(const DWORD error) noexcept
    {
        return static_cast<Win32Error>(error);
    }

    // Captures `GetLastError` for an API that reported failure. Some user32
    // paths fail without setting an error; those map to `ERROR_GEN_FAILURE`
    // so a failure is never reported as `success`.
    [[nodiscard]] inline Win32Error last_error_or_generic() noexcept
    {
        const DWORD error = ::GetLastError();
        return from_dword(error == ERROR_SUCCESS ? ERROR_GEN_FAILURE : error);
    }
}
