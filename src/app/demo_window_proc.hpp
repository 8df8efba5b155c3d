#pragma once

#include "window/window_proc.hpp"

#include <Windows.h>

#include <optional>

namespace hb::logging
{
    class Logger;
}

namespace hb::app
{
    // Ends the message loop when its window is destroyed and traces keyboard
    // traffic. Everything else falls through to `DefWindowProcW`.
    class DemoWindowProc final : public window::IWindowProc
    {
    public:
        explicit DemoWindowProc(logging::Logger& logger) noexcept;

        [[nodiscard]] std::optional<LRESULT> handle_event(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) override;

    private:
        logging::Logger& _logger;
    };
}
