#include "app/application.hpp"

#include "app/demo_window_class.hpp"
#include "app/demo_window_proc.hpp"
#include "config/app_config.hpp"
#include "core/console_writer.hpp"
#include "logging/logger.hpp"
#include "runtime/message_loop.hpp"
#include "window/window_builder.hpp"
#include "window/window_class.hpp"

#include <Windows.h>

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace hb::app
{
    namespace
    {
        void configure_logging(logging::Logger& logger, const config::AppConfig& config)
        {
            if (config.enable_debug_sink)
            {
                logger.add_sink(std::make_shared<logging::DebugOutputSink>());
            }
            if (!config.enable_file_logging)
            {
                return;
            }

            const std::expected<std::wstring, DWORD> resolved_path = config.log_directory_path.empty()
                ? logging::FileLogSink::resolve_default_log_path()
                : logging::FileLogSink::resolve_log_path(config.log_directory_path);
            if (!resolved_path)
            {
                logger.log(
                    logging::LogLevel::warning,
                    L"File logging disabled; path resolution failed with error={}",
                    resolved_path.error());
                return;
            }

            auto file_sink = logging::FileLogSink::create(resolved_path.value());
            if (!file_sink)
            {
                logger.log(logging::LogLevel::warning, L"File logging disabled; CreateFileW error={}", file_sink.error());
                return;
            }

            logger.add_sink(file_sink.value());
            logger.log(logging::LogLevel::info, L"File logging enabled at {}", resolved_path.value());
        }

        void report_window_error(logging::Logger& logger, const window::WindowError& error)
        {
            std::wstring message(window::to_string(error.kind));
            logger.log(logging::LogLevel::error, L"{} (error={})", message, core::to_dword(error.win32_error));
            core::report_failure_line(message);
        }
    }

    int Application::run()
    {
        auto config_result = config::ConfigLoader::load();
        if (!config_result)
        {
            std::wstring error_message(L"Failed to load configuration: ");
            error_message.append(config_result.error().message);
            core::report_failure_line(error_message);
            return static_cast<int>(ERROR_BAD_CONFIGURATION);
        }

        const config::AppConfig config = std::move(config_result.value());

        logging::Logger logger(config.minimum_log_level);
        configure_logging(logger, config);
        logger.log(logging::LogLevel::info, L"hwnd_bridge demo starting (pid={})", ::GetCurrentProcessId());

        const auto window_class = register_demo_window_class(config.class_name, logger);
        if (!window_class)
        {
            report_window_error(logger, window_class.error());
            return static_cast<int>(core::to_dword(window_class.error().win32_error));
        }

        window::WindowConfig window_config{};
        window_config.title = config.window_title;
        window_config.style = WS_OVERLAPPEDWINDOW;
        window_config.width = config.window_width;
        window_config.height = config.window_height;

        const auto hwnd = window::create_window(std::make_unique<DemoWindowProc>(logger), *window_class, window_config, &logger);
        if (!hwnd)
        {
            report_window_error(logger, hwnd.error());
            return static_cast<int>(core::to_dword(hwnd.error().win32_error));
        }

        ::ShowWindow(*hwnd, SW_SHOWNORMAL);
        ::UpdateWindow(*hwnd);

        const auto exit_code = runtime::run_message_loop();
        if (!exit_code)
        {
            logger.log(logging::LogLevel::error, L"GetMessageW failed (error={})", core::to_dword(exit_code.error()));
            return static_cast<int>(core::to_dword(exit_code.error()));
        }

        logger.log(logging::LogLevel::info, L"Message loop exited with code {}", *exit_code);
        return *exit_code;
    }
}
