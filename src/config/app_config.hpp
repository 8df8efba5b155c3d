#pragma once

#include "logging/log_level.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace hb::config
{
    struct ConfigError final
    {
        std::wstring message;
        DWORD win32_error{ ERROR_SUCCESS };
    };

    struct AppConfig final
    {
        hb::logging::LogLevel minimum_log_level{ hb::logging::LogLevel::info };
        bool enable_debug_sink{ true };
        bool enable_file_logging{ false };

        // Empty selects `%TEMP%\hwnd_bridge`.
        std::wstring log_directory_path;

        std::wstring class_name{ L"hwnd_bridge_demo" };
        std::wstring window_title{ L"hwnd_bridge example" };
        int window_width{ CW_USEDEFAULT };
        int window_height{ CW_USEDEFAULT };
    };

    // Sources, later ones winning:
    // 1. the file named by `HWND_BRIDGE_CONFIG`, otherwise `%USERPROFILE%\.hwnd_bridge`
    //    when it exists;
    // 2. `HWND_BRIDGE_*` environment variables.
    class ConfigLoader final
    {
    public:
        [[nodiscard]] static std::expected<AppConfig, ConfigError> load() noexcept;

        // `key=value` lines; `#` and `;` start comment lines. Unknown keys are
        // ignored, malformed lines are an error.
        [[nodiscard]] static std::expected<AppConfig, ConfigError> parse_text(std::wstring_view text) noexcept;
    };
}
