#pragma once

#include <Windows.h>

#include <cwchar>

namespace hb::core
{
    inline void fail_fast_assert(const wchar_t* expression, const wchar_t* file, const unsigned line) noexcept
    {
        wchar_t buffer[768]{};
        _snwprintf_s(
            buffer,
            _TRUNCATE,
            L"[hwnd_bridge] invariant violated: %ls (%ls:%u)\n",
            expression,
            file,
            line);
        ::OutputDebugStringW(buffer);
        __fastfail(FAST_FAIL_FATAL_APP_EXIT);
    }
}

#define HB_WIDEN_INNER(value) L##value
#define HB_WIDEN(value) HB_WIDEN_INNER(value)
#define HB_ASSERT(expr) ((expr) ? static_cast<void>(0) : ::hb::core::fail_fast_assert(HB_WIDEN(#expr), HB_WIDEN(__FILE__), __LINE__))
