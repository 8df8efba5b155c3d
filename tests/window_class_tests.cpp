#include "window/window_class.hpp"
#include "window/window_slot.hpp"

#include "window_test_support.hpp"

#include <Windows.h>

#include <memory>

namespace
{
    using hb::window::WindowErrorKind;
    using hb_tests::EventLog;
    using hb_tests::RecordingWindowProc;

    bool test_register_returns_atom()
    {
        hb::window::WindowClassConfig config{};
        config.class_name = hb_tests::unique_class_name(L"class_atom");
        const auto registered = hb::window::register_window_class(config);
        if (!registered)
        {
            return false;
        }

        WNDCLASSEXW info{};
        info.cbSize = sizeof(info);
        const bool routed = ::GetClassInfoExW(::GetModuleHandleW(nullptr), config.class_name.c_str(), &info) != FALSE &&
                            info.lpfnWndProc == &hb::window::dispatch_window_event;

        const bool ok = registered->is_atom() && registered->atom() != 0 && routed;
        return hb::window::unregister_window_class(*registered).has_value() && ok;
    }

    bool test_duplicate_registration_fails()
    {
        hb::window::WindowClassConfig config{};
        config.class_name = hb_tests::unique_class_name(L"class_duplicate");
        const auto first = hb::window::register_window_class(config);
        if (!first)
        {
            return false;
        }

        const auto second = hb::window::register_window_class(config);
        const bool ok = !second &&
                        second.error().kind == WindowErrorKind::class_registration_failed &&
                        second.error().win32_error == hb::core::from_dword(ERROR_CLASS_ALREADY_EXISTS);

        return hb::window::unregister_window_class(*first).has_value() && ok;
    }

    bool test_unregister_twice_fails()
    {
        hb::window::WindowClassConfig config{};
        config.class_name = hb_tests::unique_class_name(L"class_unregister");
        const auto registered = hb::window::register_window_class(config);
        if (!registered)
        {
            return false;
        }

        if (!hb::window::unregister_window_class(*registered))
        {
            return false;
        }

        const auto again = hb::window::unregister_window_class(*registered);
        return !again && again.error() != hb::core::Win32Error::success;
    }

    bool test_class_by_name_creates_bound_window()
    {
        hb::window::WindowClassConfig config{};
        config.class_name = hb_tests::unique_class_name(L"class_by_name");
        const auto registered = hb::window::register_window_class(config);
        if (!registered)
        {
            return false;
        }

        const auto by_name = hb::window::WindowClass::from_name(config.class_name);
        if (by_name.is_atom() || by_name.name() != config.class_name || by_name.as_class_name() != by_name.name().c_str())
        {
            (void)hb::window::unregister_window_class(*registered);
            return false;
        }

        EventLog log;
        const auto hwnd = hb::window::create_window(
            std::make_unique<RecordingWindowProc>(log),
            by_name,
            hb_tests::message_only_config());

        bool ok = hwnd.has_value();
        if (hwnd)
        {
            ok = hb::window::read_slot(*hwnd) != nullptr;
            (void)::DestroyWindow(*hwnd);
        }

        return hb::window::unregister_window_class(by_name).has_value() && ok && log.destructions == 1;
    }

    bool test_error_kind_descriptions()
    {
        return hb::window::to_string(WindowErrorKind::class_registration_failed) == L"RegisterClass failed" &&
               hb::window::to_string(WindowErrorKind::window_creation_failed) == L"CreateWindow failed";
    }
}

bool run_window_class_tests()
{
    return test_register_returns_atom() &&
           test_duplicate_registration_fails() &&
           test_unregister_twice_fails() &&
           test_class_by_name_creates_bound_window() &&
           test_error_kind_descriptions();
}
