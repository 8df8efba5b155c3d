#include "window/window_dispatch.hpp"

#include "logging/logger.hpp"
#include "window/creation_context.hpp"
#include "window/window_proc_cell.hpp"
#include "window/window_slot.hpp"

#include <optional>

namespace hb::window
{
    namespace
    {
        void bind_creation_payload(const HWND hwnd, const LPARAM lparam) noexcept
        {
            const auto* create = reinterpret_cast<const CREATESTRUCTW*>(lparam);
            WindowProcCell* const cell = create != nullptr ? CreationContext::claim(create->lpCreateParams) : nullptr;
            if (cell == nullptr)
            {
                // Created with our class but not through `create_window`.
                return;
            }

            bind_slot(hwnd, *cell);
            if (auto* logger = cell->logger())
            {
                logger->log(logging::LogLevel::trace, L"Bound window proc to hwnd={}", static_cast<const void*>(hwnd));
            }
        }

        void release_slot(const HWND hwnd) noexcept
        {
            WindowProcCell* const cell = take_slot(hwnd);
            if (cell == nullptr)
            {
                return;
            }

            if (auto* logger = cell->logger())
            {
                logger->log(
                    logging::LogLevel::trace,
                    L"Released window proc slot for hwnd={} (remaining references={})",
                    static_cast<const void*>(hwnd),
                    cell->use_count() - 1);
            }
            cell->release();
        }
    }

    LRESULT CALLBACK dispatch_window_event(const HWND hwnd, const UINT msg, const WPARAM wparam, const LPARAM lparam) noexcept
    {
        if (msg == k_creation_event)
        {
            bind_creation_payload(hwnd, lparam);
        }

        WindowProcCell* const cell = read_slot(hwnd);
        if (cell == nullptr)
        {
            return ::DefWindowProcW(hwnd, msg, wparam, lparam);
        }

        std::optional<LRESULT> result;
        {
            // The proc may destroy its own window (and so run the teardown
            // below in a nested call) before returning. This frame's reference
            // keeps it alive until the call is over. `cell` must not be used
            // once the frame is gone.
            const RetainedWindowProc frame(*cell);
            result = frame->handle_event(hwnd, msg, wparam, lparam);
        }

        if (msg == k_teardown_event)
        {
            release_slot(hwnd);
        }

        if (result)
        {
            return *result;
        }
        return ::DefWindowProcW(hwnd, msg, wparam, lparam);
    }
}
