#include "logging/logger.hpp"

#include "core/assert.hpp"
#include "core/environment.hpp"

#include <new>
#include <optional>
#include <vector>

namespace hb::logging
{
    namespace
    {
        constexpr std::wstring_view k_log_directory_name = L"hwnd_bridge";
        constexpr std::wstring_view k_log_file_prefix = L"hwnd_bridge_";

        [[nodiscard]] std::expected<ULONGLONG, DWORD> query_process_start_time() noexcept
        {
            FILETIME creation_time{};
            FILETIME exit_time{};
            FILETIME kernel_time{};
            FILETIME user_time{};
            if (::GetProcessTimes(::GetCurrentProcess(), &creation_time, &exit_time, &kernel_time, &user_time) == FALSE)
            {
                return std::unexpected(::GetLastError());
            }

            ULARGE_INTEGER value{};
            value.LowPart = creation_time.dwLowDateTime;
            value.HighPart = creation_time.dwHighDateTime;
            return value.QuadPart;
        }

        [[nodiscard]] std::expected<void, DWORD> ensure_directory_exists(const std::wstring& path) noexcept
        {
            if (::CreateDirectoryW(path.c_str(), nullptr) != FALSE)
            {
                return {};
            }

            const DWORD error = ::GetLastError();
            if (error != ERROR_ALREADY_EXISTS)
            {
                return std::unexpected(error);
            }

            const DWORD attributes = ::GetFileAttributesW(path.c_str());
            if (attributes == INVALID_FILE_ATTRIBUTES)
            {
                return std::unexpected(::GetLastError());
            }
            if ((attributes & FILE_ATTRIBUTE_DIRECTORY) == 0)
            {
                return std::unexpected(ERROR_DIRECTORY);
            }

            return {};
        }

        [[nodiscard]] std::vector<char> to_utf8(const std::wstring_view text)
        {
            const int required = ::WideCharToMultiByte(
                CP_UTF8,
                0,
                text.data(),
                static_cast<int>(text.size()),
                nullptr,
                0,
                nullptr,
                nullptr);
            if (required <= 0)
            {
                return {};
            }

            std::vector<char> utf8(static_cast<size_t>(required));
            const int converted = ::WideCharToMultiByte(
                CP_UTF8,
                0,
                text.data(),
                static_cast<int>(text.size()),
                utf8.data(),
                required,
                nullptr,
                nullptr);
            if (converted != required)
            {
                return {};
            }
            return utf8;
        }
    }

    void DebugOutputSink::write(const std::wstring_view line) noexcept
    {
        try
        {
            std::wstring with_newline{ line };
            with_newline.push_back(L'\n');
            ::OutputDebugStringW(with_newline.c_str());
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[hwnd_bridge] log line dropped (out of memory)\n");
        }
    }

    FileLogSink::FileLogSink(core::UniqueHandle file_handle) noexcept :
        _file_handle(std::move(file_handle))
    {
    }

    std::expected<std::shared_ptr<FileLogSink>, DWORD> FileLogSink::create(const std::wstring& path) noexcept
    {
        core::UniqueHandle file(::CreateFileW(
            path.c_str(),
            FILE_APPEND_DATA,
            FILE_SHARE_READ,
            nullptr,
            OPEN_ALWAYS,
            FILE_ATTRIBUTE_NORMAL,
            nullptr));
        if (!file.valid())
        {
            return std::unexpected(::GetLastError());
        }

        try
        {
            return std::shared_ptr<FileLogSink>(new FileLogSink(std::move(file)));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::resolve_log_path(std::wstring directory_path) noexcept
    {
        if (directory_path.empty())
        {
            return std::unexpected(static_cast<DWORD>(ERROR_INVALID_PARAMETER));
        }

        if (auto ensured = ensure_directory_exists(directory_path); !ensured)
        {
            return std::unexpected(ensured.error());
        }

        const auto start_time = query_process_start_time();
        if (!start_time)
        {
            return std::unexpected(start_time.error());
        }

        try
        {
            std::wstring file_name(k_log_file_prefix);
            file_name.append(std::to_wstring(::GetCurrentProcessId()));
            file_name.push_back(L'_');
            file_name.append(std::to_wstring(*start_time));
            file_name.append(L".log");
            return core::append_path_component(std::move(directory_path), file_name);
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::resolve_default_log_path() noexcept
    {
        try
        {
            std::optional<std::wstring> temp_root = core::read_environment(L"TEMP");
            if (!temp_root || temp_root->empty())
            {
                temp_root = core::read_environment(L"TMP");
            }
            if (!temp_root || temp_root->empty())
            {
                return std::unexpected(static_cast<DWORD>(ERROR_ENVVAR_NOT_FOUND));
            }

            return resolve_log_path(core::append_path_component(std::move(*temp_root), k_log_directory_name));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    void FileLogSink::write(const std::wstring_view line) noexcept
    {
        if (!_file_handle.valid())
        {
            return;
        }

        DWORD written = 0;
        if (!_utf8_bom_written)
        {
            LARGE_INTEGER position{};
            if (::SetFilePointerEx(_file_handle.get(), {}, &position, FILE_CURRENT) != FALSE && position.QuadPart == 0)
            {
                static constexpr unsigned char utf8_bom[] = { 0xEF, 0xBB, 0xBF };
                ::WriteFile(_file_handle.get(), utf8_bom, static_cast<DWORD>(sizeof(utf8_bom)), &written, nullptr);
            }
            _utf8_bom_written = true;
        }

        try
        {
            std::wstring payload(line);
            payload.append(L"\r\n");

            const std::vector<char> utf8 = to_utf8(payload);
            if (utf8.empty())
            {
                return;
            }

            ::WriteFile(_file_handle.get(), utf8.data(), static_cast<DWORD>(utf8.size()), &written, nullptr);
        }
        catch (const std::bad_alloc&)
        {
            // The line is lost; the sink stays usable.
        }
    }

    Logger::Logger(const LogLevel minimum_level) :
        _minimum_level(minimum_level)
    {
    }

    void Logger::add_sink(std::shared_ptr<ILogSink> sink)
    {
        HB_ASSERT(sink != nullptr);
        _sinks.push_back(std::move(sink));
    }

    void Logger::set_minimum_level(const LogLevel level) noexcept
    {
        _minimum_level.store(level, std::memory_order_relaxed);
    }

    LogLevel Logger::minimum_level() const noexcept
    {
        return _minimum_level.load(std::memory_order_relaxed);
    }

    bool Logger::enabled(const LogLevel level) const noexcept
    {
        return level >= _minimum_level.load(std::memory_order_relaxed);
    }

    void Logger::log_preformatted(const LogLevel level, const std::wstring_view body) noexcept
    {
        if (!enabled(level))
        {
            return;
        }

        try
        {
            const std::wstring line = build_timestamped_line(level, body);
            for (const auto& sink : _sinks)
            {
                sink->write(line);
            }
        }
        catch (const std::bad_alloc&)
        {
            report_dropped_line();
        }
    }

    void Logger::report_dropped_line() noexcept
    {
        ::OutputDebugStringW(L"[hwnd_bridge] log line dropped (out of memory or bad format)\n");
    }

    std::wstring_view Logger::level_to_string(const LogLevel level) noexcept
    {
        switch (level)
        {
        case LogLevel::trace:
            return L"TRACE";
        case LogLevel::debug:
            return L"DEBUG";
        case LogLevel::info:
            return L"INFO";
        case LogLevel::warning:
            return L"WARN";
        case LogLevel::error:
            return L"ERROR";
        default:
            return L"UNKNOWN";
        }
    }

    std::wstring Logger::build_timestamped_line(const LogLevel level, const std::wstring_view body)
    {
        SYSTEMTIME system_time{};
        ::GetLocalTime(&system_time);

        return std::format(
            L"{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] {}",
            system_time.wYear,
            system_time.wMonth,
            system_time.wDay,
            system_time.wHour,
            system_time.wMinute,
            system_time.wSecond,
            system_time.wMilliseconds,
            level_to_string(level),
            body);
    }
}
