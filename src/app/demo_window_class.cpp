#include "app/demo_window_class.hpp"

#include "logging/logger.hpp"

#include <Windows.h>

#include <new>

namespace hb::app
{
    std::expected<window::WindowClass, window::WindowError> register_demo_window_class(
        const std::wstring& class_name,
        logging::Logger& logger) noexcept
    {
        window::WindowClassConfig class_config{};
        try
        {
            class_config.class_name = class_name;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(window::WindowError{
                .kind = window::WindowErrorKind::class_registration_failed,
                .win32_error = core::from_dword(ERROR_OUTOFMEMORY),
            });
        }

        class_config.icon = ::LoadIconW(nullptr, IDI_APPLICATION);
        class_config.cursor = ::LoadCursorW(nullptr, IDC_ARROW);
        class_config.background = ::CreateSolidBrush(RGB(0xff, 0xff, 0xff));

        auto registered = window::register_window_class(class_config, &logger);
        if (!registered && class_config.background != nullptr)
        {
            (void)::DeleteObject(class_config.background);
        }
        return registered;
    }
}
