#pragma once

#include <Windows.h>

#include <optional>
#include <string>
#include <string_view>

namespace hb::core
{
    // `name` must be null-terminated (all call sites pass literals).
    [[nodiscard]] inline std::optional<std::wstring> read_environment(const std::wstring_view name)
    {
        const DWORD required = ::GetEnvironmentVariableW(name.data(), nullptr, 0);
        if (required == 0)
        {
            return std::nullopt;
        }

        std::wstring value(required, L'\0');
        const DWORD written = ::GetEnvironmentVariableW(name.data(), value.data(), required);
        if (written == 0 || written >= required)
        {
            return std::nullopt;
        }

        value.resize(written);
        return value;
    }

    [[nodiscard]] inline std::wstring append_path_component(std::wstring base, const std::wstring_view component)
    {
        if (!base.empty())
        {
            const wchar_t tail = base.back();
            if (tail != L'\\' && tail != L'/')
            {
                base.push_back(L'\\');
            }
        }

        base.append(component);
        return base;
    }
}
