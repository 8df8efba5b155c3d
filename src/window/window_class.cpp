#include "window/window_class.hpp"

#include "logging/logger.hpp"
#include "window/window_dispatch.hpp"

namespace hb::window
{
    namespace
    {
        [[nodiscard]] HINSTANCE resolve_instance(const HINSTANCE instance) noexcept
        {
            return instance != nullptr ? instance : ::GetModuleHandleW(nullptr);
        }

        [[nodiscard]] LPCWSTR pointer_or_null(const std::wstring& text) noexcept
        {
            return text.empty() ? nullptr : text.c_str();
        }
    }

    WindowClass WindowClass::from_atom(const ATOM atom) noexcept
    {
        WindowClass result;
        result._atom = atom;
        return result;
    }

    WindowClass WindowClass::from_name(std::wstring class_name)
    {
        WindowClass result;
        result._name = std::move(class_name);
        return result;
    }

    LPCWSTR WindowClass::as_class_name() const noexcept
    {
        if (is_atom())
        {
            return MAKEINTATOM(_atom);
        }
        return _name.c_str();
    }

    bool WindowClass::is_atom() const noexcept
    {
        return _atom != 0;
    }

    ATOM WindowClass::atom() const noexcept
    {
        return _atom;
    }

    const std::wstring& WindowClass::name() const noexcept
    {
        return _name;
    }

    std::expected<WindowClass, WindowError> register_window_class(const WindowClassConfig& config, logging::Logger* const logger) noexcept
    {
        WNDCLASSEXW wc{};
        wc.cbSize = sizeof(wc);
        wc.style = config.style;
        wc.lpfnWndProc = &dispatch_window_event;
        wc.cbClsExtra = 0;
        wc.cbWndExtra = config.window_extra_bytes;
        wc.hInstance = resolve_instance(config.instance);
        wc.hIcon = config.icon;
        wc.hCursor = config.cursor;
        wc.hbrBackground = config.background;
        wc.lpszMenuName = pointer_or_null(config.menu_name);
        wc.lpszClassName = config.class_name.c_str();
        wc.hIconSm = config.small_icon;

        const ATOM atom = ::RegisterClassExW(&wc);
        if (atom == 0)
        {
            const WindowError error{
                .kind = WindowErrorKind::class_registration_failed,
                .win32_error = core::last_error_or_generic(),
            };
            if (logger != nullptr)
            {
                logger->log(
                    logging::LogLevel::warning,
                    L"RegisterClassExW failed for class '{}' (error={})",
                    config.class_name,
                    core::to_dword(error.win32_error));
            }
            return std::unexpected(error);
        }

        if (logger != nullptr)
        {
            logger->log(logging::LogLevel::debug, L"Registered window class '{}' (atom={})", config.class_name, atom);
        }
        return WindowClass::from_atom(atom);
    }

    std::expected<void, core::Win32Error> unregister_window_class(const WindowClass& window_class, const HINSTANCE instance) noexcept
    {
        if (::UnregisterClassW(window_class.as_class_name(), resolve_instance(instance)) == FALSE)
        {
            return std::unexpected(core::last_error_or_generic());
        }
        return {};
    }
}
