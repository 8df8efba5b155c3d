#include "window/window_builder.hpp"

#include "logging/logger.hpp"
#include "window/creation_context.hpp"
#include "window/window_proc_cell.hpp"

#include <new>

namespace hb::window
{
    namespace
    {
        [[nodiscard]] std::unexpected<WindowError> creation_failed(const core::Win32Error error, logging::Logger* const logger) noexcept
        {
            if (logger != nullptr)
            {
                logger->log(logging::LogLevel::warning, L"CreateWindowExW failed (error={})", core::to_dword(error));
            }
            return std::unexpected(WindowError{
                .kind = WindowErrorKind::window_creation_failed,
                .win32_error = error,
            });
        }
    }

    std::expected<HWND, WindowError> create_window(
        std::unique_ptr<IWindowProc> proc,
        const WindowClass& window_class,
        const WindowConfig& config,
        logging::Logger* const logger) noexcept
    {
        WindowProcCell* cell = nullptr;
        try
        {
            cell = WindowProcCell::create(std::move(proc), logger);
        }
        catch (const std::bad_alloc&)
        {
            return creation_failed(core::from_dword(ERROR_OUTOFMEMORY), logger);
        }

        // `cell` starts with the reference destined for the window's slot. The
        // guard is a second one so the cell can still be inspected after
        // `CreateWindowExW`, whatever the creation messages did to the slot.
        const RetainedWindowProc guard(*cell);

        HWND hwnd = nullptr;
        core::Win32Error create_error = core::Win32Error::success;
        {
            const CreationContext creation(*cell);
            hwnd = ::CreateWindowExW(
                config.ex_style,
                window_class.as_class_name(),
                config.title.empty() ? nullptr : config.title.c_str(),
                config.style,
                config.x,
                config.y,
                config.width,
                config.height,
                config.parent,
                config.menu,
                config.instance != nullptr ? config.instance : ::GetModuleHandleW(nullptr),
                cell->into_raw());
            if (hwnd == nullptr)
            {
                create_error = core::last_error_or_generic();
            }
        }

        if (hwnd == nullptr)
        {
            // No creation message at all (`never_bound`), or the window died
            // between `WM_NCCREATE` and `WM_NCDESTROY` without the latter
            // (`bound`): the slot's reference is still ours. After a delivered
            // `WM_NCDESTROY` (`unbound`) the trampoline has released it already.
            if (cell->slot_state() != SlotState::unbound)
            {
                cell->release();
            }
            return creation_failed(create_error, logger);
        }

        if (cell->slot_state() == SlotState::never_bound)
        {
            // The class does not route through `dispatch_window_event`, so the
            // proc could never be reached or released.
            ::DestroyWindow(hwnd);
            cell->release();
            return creation_failed(core::from_dword(ERROR_INVALID_PARAMETER), logger);
        }

        if (logger != nullptr)
        {
            logger->log(logging::LogLevel::debug, L"Created window hwnd={}", static_cast<const void*>(hwnd));
        }
        return hwnd;
    }
}
