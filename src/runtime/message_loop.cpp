#include "runtime/message_loop.hpp"

namespace hb::runtime
{
    std::expected<int, core::Win32Error> run_message_loop(const HACCEL accelerators) noexcept
    {
        MSG msg{};
        while (true)
        {
            const BOOL result = ::GetMessageW(&msg, nullptr, 0, 0);
            if (result == 0)
            {
                break;
            }
            if (result == -1)
            {
                return std::unexpected(core::last_error_or_generic());
            }

            if (accelerators != nullptr && ::TranslateAcceleratorW(msg.hwnd, accelerators, &msg) != 0)
            {
                continue;
            }

            ::TranslateMessage(&msg);
            ::DispatchMessageW(&msg);
        }

        return static_cast<int>(msg.wParam);
    }

    void post_quit(const int exit_code) noexcept
    {
        ::PostQuitMessage(exit_code);
    }
}
