#include "app/demo_window_proc.hpp"

#include "logging/logger.hpp"
#include "runtime/message_loop.hpp"

namespace hb::app
{
    namespace
    {
        [[nodiscard]] std::wstring_view keyboard_message_name(const UINT msg) noexcept
        {
            switch (msg)
            {
            case WM_KEYDOWN:
                return L"WM_KEYDOWN";
            case WM_KEYUP:
                return L"WM_KEYUP";
            case WM_SYSKEYDOWN:
                return L"WM_SYSKEYDOWN";
            case WM_SYSKEYUP:
                return L"WM_SYSKEYUP";
            case WM_CHAR:
                return L"WM_CHAR";
            case WM_SYSCHAR:
                return L"WM_SYSCHAR";
            case WM_INPUTLANGCHANGE:
                return L"WM_INPUTLANGCHANGE";
            default:
                return {};
            }
        }
    }

    DemoWindowProc::DemoWindowProc(logging::Logger& logger) noexcept :
        _logger(logger)
    {
    }

    std::optional<LRESULT> DemoWindowProc::handle_event(const HWND /*hwnd*/, const UINT msg, const WPARAM wparam, const LPARAM lparam)
    {
        if (msg == WM_DESTROY)
        {
            _logger.log(logging::LogLevel::info, L"Main window destroyed; leaving message loop");
            runtime::post_quit(0);
            return 0;
        }

        if (const auto name = keyboard_message_name(msg); !name.empty())
        {
            _logger.log(
                logging::LogLevel::debug,
                L"{} wparam=0x{:X} lparam=0x{:X}",
                name,
                static_cast<unsigned long long>(wparam),
                static_cast<unsigned long long>(lparam));
        }

        return std::nullopt;
    }
}
