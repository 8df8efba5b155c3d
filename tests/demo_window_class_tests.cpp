#include "app/demo_window_class.hpp"
#include "logging/logger.hpp"

#include "window_test_support.hpp"

#include <Windows.h>

namespace
{
    [[nodiscard]] DWORD gdi_object_count() noexcept
    {
        return ::GetGuiResources(::GetCurrentProcess(), GR_GDIOBJECTS);
    }

    bool test_demo_class_has_white_background()
    {
        hb::logging::Logger logger(hb::logging::LogLevel::error);
        const std::wstring class_name = hb_tests::unique_class_name(L"demo_class");
        const auto registered = hb::app::register_demo_window_class(class_name, logger);
        if (!registered)
        {
            return false;
        }

        WNDCLASSEXW info{};
        info.cbSize = sizeof(info);
        const bool found = ::GetClassInfoExW(::GetModuleHandleW(nullptr), class_name.c_str(), &info) != FALSE;

        LOGBRUSH brush{};
        const bool white = found &&
                           info.hbrBackground != nullptr &&
                           ::GetObjectW(info.hbrBackground, sizeof(brush), &brush) == sizeof(brush) &&
                           brush.lbStyle == BS_SOLID &&
                           brush.lbColor == RGB(0xff, 0xff, 0xff) &&
                           info.hCursor != nullptr &&
                           info.hIcon != nullptr;

        return hb::window::unregister_window_class(*registered).has_value() && white;
    }

    bool test_failed_registration_frees_brush()
    {
        hb::logging::Logger logger(hb::logging::LogLevel::error);
        const std::wstring class_name = hb_tests::unique_class_name(L"demo_class_duplicate");
        const auto first = hb::app::register_demo_window_class(class_name, logger);
        if (!first)
        {
            return false;
        }

        const DWORD before = gdi_object_count();
        const auto second = hb::app::register_demo_window_class(class_name, logger);
        const DWORD after = gdi_object_count();

        const bool ok = !second &&
                        second.error().kind == hb::window::WindowErrorKind::class_registration_failed &&
                        before != 0 &&
                        after == before;

        return hb::window::unregister_window_class(*first).has_value() && ok;
    }
}

bool run_demo_window_class_tests()
{
    return test_demo_class_has_white_background() &&
           test_failed_registration_frees_brush();
}
