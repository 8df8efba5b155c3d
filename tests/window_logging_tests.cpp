#include "logging/logger.hpp"
#include "window/window_builder.hpp"
#include "window/window_class.hpp"

#include "window_test_support.hpp"

#include <Windows.h>

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    using hb_tests::EventLog;
    using hb_tests::RecordingWindowProc;
    using hb_tests::ScopedWindowClass;

    class CapturingSink final : public hb::logging::ILogSink
    {
    public:
        void write(const std::wstring_view line) noexcept override
        {
            lines.emplace_back(line);
        }

        // Index of the first line containing `fragment`, or -1.
        [[nodiscard]] std::ptrdiff_t find(const std::wstring_view fragment) const
        {
            for (std::size_t i = 0; i < lines.size(); ++i)
            {
                if (lines[i].find(fragment) != std::wstring::npos)
                {
                    return static_cast<std::ptrdiff_t>(i);
                }
            }
            return -1;
        }

        std::vector<std::wstring> lines;
    };

    struct CapturingLogger final
    {
        std::shared_ptr<CapturingSink> sink{ std::make_shared<CapturingSink>() };
        hb::logging::Logger logger{ hb::logging::LogLevel::trace };

        CapturingLogger()
        {
            logger.add_sink(sink);
        }
    };

    void dump_lines(const CapturingSink& sink)
    {
        for (const auto& line : sink.lines)
        {
            fwprintf(stderr, L"[DETAIL] %ls\n", line.c_str());
        }
    }

    bool test_window_lifetime_is_traced_in_order()
    {
        ScopedWindowClass window_class(L"logging_lifetime");
        if (!window_class.valid())
        {
            return false;
        }

        CapturingLogger capture;
        EventLog log;
        const auto hwnd = hb::window::create_window(
            std::make_unique<RecordingWindowProc>(log),
            window_class.get(),
            hb_tests::message_only_config(),
            &capture.logger);
        if (!hwnd)
        {
            return false;
        }

        (void)::DestroyWindow(*hwnd);

        const CapturingSink& sink = *capture.sink;
        const std::ptrdiff_t bound = sink.find(L"[TRACE] Bound window proc to hwnd=");
        const std::ptrdiff_t created = sink.find(L"[DEBUG] Created window hwnd=");
        const std::ptrdiff_t released = sink.find(L"[TRACE] Released window proc slot for hwnd=");
        const std::ptrdiff_t destroyed = sink.find(L"[TRACE] Window proc destroyed (last window hwnd=");

        const bool ordered = bound >= 0 && created > bound && released > created && destroyed > released;
        const bool last_reference = released >= 0 &&
                                    sink.lines[static_cast<std::size_t>(released)].find(L"(remaining references=0)") != std::wstring::npos;
        if (!ordered || !last_reference)
        {
            dump_lines(sink);
            return false;
        }
        return log.destructions == 1;
    }

    bool test_failed_creation_logs_warning()
    {
        CapturingLogger capture;
        EventLog log;
        const auto hwnd = hb::window::create_window(
            std::make_unique<RecordingWindowProc>(log),
            hb::window::WindowClass::from_name(hb_tests::unique_class_name(L"logging_unregistered")),
            hb_tests::message_only_config(),
            &capture.logger);
        if (hwnd)
        {
            (void)::DestroyWindow(*hwnd);
            return false;
        }

        const CapturingSink& sink = *capture.sink;
        const std::ptrdiff_t destroyed = sink.find(L"[TRACE] Window proc destroyed");
        const std::ptrdiff_t warned = sink.find(L"[WARN] CreateWindowExW failed (error=");
        if (destroyed < 0 || warned <= destroyed || sink.find(L"Bound window proc") >= 0)
        {
            dump_lines(sink);
            return false;
        }
        return log.destructions == 1;
    }

    bool test_registration_is_logged()
    {
        CapturingLogger capture;
        hb::window::WindowClassConfig config{};
        config.class_name = hb_tests::unique_class_name(L"logging_register");

        const auto first = hb::window::register_window_class(config, &capture.logger);
        if (!first)
        {
            return false;
        }
        const auto second = hb::window::register_window_class(config, &capture.logger);
        (void)hb::window::unregister_window_class(*first);

        const CapturingSink& sink = *capture.sink;
        const std::wstring registered = L"[DEBUG] Registered window class '" + config.class_name + L"'";
        const std::wstring duplicate = L"[WARN] RegisterClassExW failed for class '" + config.class_name +
                                       L"' (error=" + std::to_wstring(ERROR_CLASS_ALREADY_EXISTS) + L")";
        if (second || sink.find(registered) < 0 || sink.find(duplicate) < 0)
        {
            dump_lines(sink);
            return false;
        }
        return true;
    }

    bool test_filtered_logger_stays_silent()
    {
        ScopedWindowClass window_class(L"logging_filtered");
        if (!window_class.valid())
        {
            return false;
        }

        CapturingLogger capture;
        capture.logger.set_minimum_level(hb::logging::LogLevel::warning);
        EventLog log;
        const auto hwnd = hb::window::create_window(
            std::make_unique<RecordingWindowProc>(log),
            window_class.get(),
            hb_tests::message_only_config(),
            &capture.logger);
        if (!hwnd)
        {
            return false;
        }

        (void)::DestroyWindow(*hwnd);
        return capture.sink->lines.empty() && log.destructions == 1;
    }
}

bool run_window_logging_tests()
{
    return test_window_lifetime_is_traced_in_order() &&
           test_failed_creation_logs_warning() &&
           test_registration_is_logged() &&
           test_filtered_logger_stays_silent();
}
