#pragma once

#include "core/unique_handle.hpp"
#include "logging/log_level.hpp"

#include <Windows.h>

#include <atomic>
#include <expected>
#include <format>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace hb::logging
{
    class ILogSink
    {
    public:
        virtual ~ILogSink() = default;
        virtual void write(std::wstring_view line) noexcept = 0;
    };

    class DebugOutputSink final : public ILogSink
    {
    public:
        void write(std::wstring_view line) noexcept override;
    };

    class FileLogSink final : public ILogSink
    {
    public:
        [[nodiscard]] static std::expected<std::shared_ptr<FileLogSink>, DWORD> create(const std::wstring& path) noexcept;

        // `<directory>\hwnd_bridge_<pid>_<process start FILETIME>.log`; the
        // directory is created when missing.
        [[nodiscard]] static std::expected<std::wstring, DWORD> resolve_log_path(std::wstring directory_path) noexcept;

        // `%TEMP%\hwnd_bridge\...` (falls back to `%TMP%`).
        [[nodiscard]] static std::expected<std::wstring, DWORD> resolve_default_log_path() noexcept;

        void write(std::wstring_view line) noexcept override;

    private:
        explicit FileLogSink(core::UniqueHandle file_handle) noexcept;

        core::UniqueHandle _file_handle;
        bool _utf8_bom_written{ false };
    };

    class Logger final
    {
    public:
        explicit Logger(LogLevel minimum_level);

        void add_sink(std::shared_ptr<ILogSink> sink);
        void set_minimum_level(LogLevel level) noexcept;
        [[nodiscard]] LogLevel minimum_level() const noexcept;
        [[nodiscard]] bool enabled(LogLevel level) const noexcept;

        // Never throws: a line that cannot be formatted or allocated is dropped
        // and noted on the debugger output. Safe to call from a `WNDPROC`.
        template<typename... Args>
        void log(const LogLevel level, const std::wformat_string<Args...> format_text, Args&&... args) noexcept
        {
            if (!enabled(level))
            {
                return;
            }

            try
            {
                const std::wstring body = std::format(format_text, std::forward<Args>(args)...);
                log_preformatted(level, body);
            }
            catch (const std::bad_alloc&)
            {
                report_dropped_line();
            }
            catch (const std::format_error&)
            {
                report_dropped_line();
            }
        }

        void log_preformatted(LogLevel level, std::wstring_view body) noexcept;

    private:
        static void report_dropped_line() noexcept;
        static std::wstring_view level_to_string(LogLevel level) noexcept;
        static std::wstring build_timestamped_line(LogLevel level, std::wstring_view body);

        std::atomic<LogLevel> _minimum_level;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };
}
