#include "config/app_config.hpp"

#include "core/environment.hpp"
#include "core/unique_handle.hpp"
#include "serialization/fast_number.hpp"

#include <Windows.h>

#include <algorithm>
#include <new>
#include <optional>
#include <vector>

namespace hb::config
{
    namespace
    {
        constexpr std::wstring_view kConfigPathEnv = L"HWND_BRIDGE_CONFIG";
        constexpr std::wstring_view kLogLevelEnv = L"HWND_BRIDGE_LOG_LEVEL";
        constexpr std::wstring_view kDebugSinkEnv = L"HWND_BRIDGE_DEBUG_SINK";
        constexpr std::wstring_view kFileLoggingEnv = L"HWND_BRIDGE_ENABLE_FILE_LOGGING";
        constexpr std::wstring_view kLogDirEnv = L"HWND_BRIDGE_LOG_DIR";
        constexpr std::wstring_view kClassNameEnv = L"HWND_BRIDGE_CLASS_NAME";
        constexpr std::wstring_view kWindowTitleEnv = L"HWND_BRIDGE_WINDOW_TITLE";
        constexpr std::wstring_view kWindowWidthEnv = L"HWND_BRIDGE_WINDOW_WIDTH";
        constexpr std::wstring_view kWindowHeightEnv = L"HWND_BRIDGE_WINDOW_HEIGHT";

        constexpr std::wstring_view kUserConfigFileName = L".hwnd_bridge";
        constexpr LONGLONG kMaxConfigFileBytes = 1024 * 1024;

        [[nodiscard]] std::wstring trim(const std::wstring_view value)
        {
            const auto not_space = [](const wchar_t ch) {
                return ch != L' ' && ch != L'\t' && ch != L'\r' && ch != L'\n';
            };

            const auto begin_it = std::find_if(value.begin(), value.end(), not_space);
            if (begin_it == value.end())
            {
                return {};
            }

            const auto end_it = std::find_if(value.rbegin(), value.rend(), not_space).base();
            return std::wstring(begin_it, end_it);
        }

        [[nodiscard]] hb::logging::LogLevel parse_log_level(const std::wstring_view text)
        {
            if (text == L"trace")
            {
                return hb::logging::LogLevel::trace;
            }
            if (text == L"debug")
            {
                return hb::logging::LogLevel::debug;
            }
            if (text == L"warning")
            {
                return hb::logging::LogLevel::warning;
            }
            if (text == L"error")
            {
                return hb::logging::LogLevel::error;
            }
            return hb::logging::LogLevel::info;
        }

        [[nodiscard]] bool parse_bool(const std::wstring_view text)
        {
            return text == L"1" || text == L"true" || text == L"TRUE" || text == L"on" || text == L"ON";
        }

        // Window extents: a positive pixel count, or `default` for `CW_USEDEFAULT`.
        [[nodiscard]] int parse_extent_or_default(const std::wstring_view text, const int fallback)
        {
            if (text == L"default")
            {
                return CW_USEDEFAULT;
            }

            const auto parsed = serialization::parse_i32(text);
            if (!parsed || *parsed <= 0)
            {
                return fallback;
            }
            return *parsed;
        }

        [[nodiscard]] std::expected<std::wstring, ConfigError> decode_config_bytes(const std::vector<char>& bytes)
        {
            if (bytes.size() >= 2 &&
                static_cast<unsigned char>(bytes[0]) == 0xFF &&
                static_cast<unsigned char>(bytes[1]) == 0xFE)
            {
                const size_t wchar_count = (bytes.size() - 2) / sizeof(wchar_t);
                const auto* start = reinterpret_cast<const wchar_t*>(bytes.data() + 2);
                return std::wstring(start, start + wchar_count);
            }

            size_t offset = 0;
            if (bytes.size() >= 3 &&
                static_cast<unsigned char>(bytes[0]) == 0xEF &&
                static_cast<unsigned char>(bytes[1]) == 0xBB &&
                static_cast<unsigned char>(bytes[2]) == 0xBF)
            {
                offset = 3;
            }
            if (bytes.size() == offset)
            {
                return std::wstring{};
            }

            const char* const utf8 = bytes.data() + offset;
            const int utf8_length = static_cast<int>(bytes.size() - offset);
            const int wide_length = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8, utf8_length, nullptr, 0);
            if (wide_length <= 0)
            {
                return std::unexpected(ConfigError{
                    .message = L"Config is not UTF-8/UTF-16LE text",
                    .win32_error = ::GetLastError(),
                });
            }

            std::wstring wide(static_cast<size_t>(wide_length), L'\0');
            if (::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8, utf8_length, wide.data(), wide_length) != wide_length)
            {
                return std::unexpected(ConfigError{
                    .message = L"Failed to convert config file text",
                    .win32_error = ::GetLastError(),
                });
            }
            return wide;
        }

        [[nodiscard]] std::expected<std::wstring, ConfigError> read_config_file(const std::wstring& path)
        {
            core::UniqueHandle file(::CreateFileW(
                path.c_str(),
                GENERIC_READ,
                FILE_SHARE_READ,
                nullptr,
                OPEN_EXISTING,
                FILE_ATTRIBUTE_NORMAL,
                nullptr));
            if (!file.valid())
            {
                return std::unexpected(ConfigError{
                    .message = L"CreateFileW failed for config path",
                    .win32_error = ::GetLastError(),
                });
            }

            LARGE_INTEGER file_size{};
            if (::GetFileSizeEx(file.get(), &file_size) == FALSE)
            {
                return std::unexpected(ConfigError{
                    .message = L"GetFileSizeEx failed for config path",
                    .win32_error = ::GetLastError(),
                });
            }

            if (file_size.QuadPart < 0 || file_size.QuadPart > kMaxConfigFileBytes)
            {
                return std::unexpected(ConfigError{
                    .message = L"Config file size is invalid",
                    .win32_error = ERROR_FILE_TOO_LARGE,
                });
            }

            const DWORD bytes_to_read = static_cast<DWORD>(file_size.QuadPart);
            std::vector<char> bytes(bytes_to_read);
            if (bytes_to_read > 0)
            {
                DWORD bytes_read = 0;
                if (::ReadFile(file.get(), bytes.data(), bytes_to_read, &bytes_read, nullptr) == FALSE || bytes_read != bytes_to_read)
                {
                    return std::unexpected(ConfigError{
                        .message = L"ReadFile failed for config path",
                        .win32_error = ::GetLastError(),
                    });
                }
            }

            return decode_config_bytes(bytes);
        }

        // Explicit path first; the per-user file only when it actually exists.
        [[nodiscard]] std::optional<std::wstring> resolve_config_path()
        {
            if (auto explicit_path = core::read_environment(kConfigPathEnv); explicit_path && !explicit_path->empty())
            {
                return explicit_path;
            }

            const auto profile = core::read_environment(L"USERPROFILE");
            if (!profile || profile->empty())
            {
                return std::nullopt;
            }

            std::wstring candidate = core::append_path_component(*profile, kUserConfigFileName);
            const DWORD attributes = ::GetFileAttributesW(candidate.c_str());
            if (attributes == INVALID_FILE_ATTRIBUTES || (attributes & FILE_ATTRIBUTE_DIRECTORY) != 0)
            {
                return std::nullopt;
            }
            return candidate;
        }

        void apply_key_value(AppConfig& config, const std::wstring_view raw_key, const std::wstring_view raw_value)
        {
            const std::wstring key = trim(raw_key);
            std::wstring value = trim(raw_value);

            if (key == L"log_level")
            {
                config.minimum_log_level = parse_log_level(value);
            }
            else if (key == L"debug_sink")
            {
                config.enable_debug_sink = parse_bool(value);
            }
            else if (key == L"enable_file_logging")
            {
                config.enable_file_logging = parse_bool(value);
            }
            else if (key == L"log_dir")
            {
                config.log_directory_path = std::move(value);
            }
            else if (key == L"class_name")
            {
                if (!value.empty())
                {
                    config.class_name = std::move(value);
                }
            }
            else if (key == L"window_title")
            {
                config.window_title = std::move(value);
            }
            else if (key == L"window_width")
            {
                config.window_width = parse_extent_or_default(value, config.window_width);
            }
            else if (key == L"window_height")
            {
                config.window_height = parse_extent_or_default(value, config.window_height);
            }
        }

        void apply_environment_overrides(AppConfig& config)
        {
            struct Override final
            {
                std::wstring_view env;
                std::wstring_view key;
            };

            static constexpr Override overrides[] = {
                { kLogLevelEnv, L"log_level" },
                { kDebugSinkEnv, L"debug_sink" },
                { kFileLoggingEnv, L"enable_file_logging" },
                { kLogDirEnv, L"log_dir" },
                { kClassNameEnv, L"class_name" },
                { kWindowTitleEnv, L"window_title" },
                { kWindowWidthEnv, L"window_width" },
                { kWindowHeightEnv, L"window_height" },
            };

            for (const auto& entry : overrides)
            {
                if (const auto value = core::read_environment(entry.env))
                {
                    apply_key_value(config, entry.key, *value);
                }
            }
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::load() noexcept
    {
        try
        {
            AppConfig config{};
            if (const auto config_path = resolve_config_path())
            {
                auto file_text = read_config_file(*config_path);
                if (!file_text)
                {
                    return std::unexpected(file_text.error());
                }

                auto parsed = parse_text(file_text.value());
                if (!parsed)
                {
                    return std::unexpected(parsed.error());
                }
                config = std::move(parsed.value());
            }

            apply_environment_overrides(config);
            return config;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ConfigError{
                .message = L"Out of memory while loading config",
                .win32_error = ERROR_OUTOFMEMORY,
            });
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::parse_text(const std::wstring_view text) noexcept
    {
        try
        {
            AppConfig config{};
            size_t begin = 0;
            while (begin < text.size())
            {
                size_t end = text.find(L'\n', begin);
                if (end == std::wstring_view::npos)
                {
                    end = text.size();
                }

                const std::wstring line = trim(text.substr(begin, end - begin));
                if (!line.empty() && !line.starts_with(L"#") && !line.starts_with(L";"))
                {
                    const size_t equals_index = line.find(L'=');
                    if (equals_index == std::wstring::npos)
                    {
                        return std::unexpected(ConfigError{
                            .message = L"Invalid config line (missing '=')",
                            .win32_error = ERROR_BAD_FORMAT,
                        });
                    }

                    const std::wstring_view line_view(line);
                    apply_key_value(config, line_view.substr(0, equals_index), line_view.substr(equals_index + 1));
                }

                begin = end + 1;
            }

            return config;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ConfigError{
                .message = L"Out of memory while parsing config",
                .win32_error = ERROR_OUTOFMEMORY,
            });
        }
    }
}
