#include "window/window_proc_cell.hpp"

#include "core/assert.hpp"
#include "logging/logger.hpp"

#include <utility>

namespace hb::window
{
    WindowProcCell::WindowProcCell(std::unique_ptr<IWindowProc> proc, logging::Logger* const logger) noexcept :
        _proc(std::move(proc)),
        _logger(logger)
    {
    }

    WindowProcCell::~WindowProcCell() noexcept = default;

    WindowProcCell* WindowProcCell::create(std::unique_ptr<IWindowProc> proc, logging::Logger* const logger)
    {
        HB_ASSERT(proc != nullptr);
        return new WindowProcCell(std::move(proc), logger);
    }

    WindowProcCell* WindowProcCell::retain() noexcept
    {
        HB_ASSERT(_count > 0);
        ++_count;
        return this;
    }

    void WindowProcCell::release() noexcept
    {
        HB_ASSERT(_count > 0);
        if (--_count != 0)
        {
            return;
        }

        if (_logger != nullptr)
        {
            _logger->log(logging::LogLevel::trace, L"Window proc destroyed (last window hwnd={})", static_cast<const void*>(_bound_window));
        }
        delete this;
    }

    void* WindowProcCell::into_raw() noexcept
    {
        return this;
    }

    WindowProcCell* WindowProcCell::from_raw(void* const raw) noexcept
    {
        return static_cast<WindowProcCell*>(raw);
    }

    IWindowProc& WindowProcCell::proc() const noexcept
    {
        return *_proc;
    }

    std::size_t WindowProcCell::use_count() const noexcept
    {
        return _count;
    }

    logging::Logger* WindowProcCell::logger() const noexcept
    {
        return _logger;
    }

    SlotState WindowProcCell::slot_state() const noexcept
    {
        return _slot_state;
    }

    HWND WindowProcCell::bound_window() const noexcept
    {
        return _bound_window;
    }

    void WindowProcCell::mark_bound(const HWND hwnd) noexcept
    {
        HB_ASSERT(_slot_state == SlotState::never_bound);
        _slot_state = SlotState::bound;
        _bound_window = hwnd;
    }

    void WindowProcCell::mark_unbound() noexcept
    {
        HB_ASSERT(_slot_state == SlotState::bound);
        _slot_state = SlotState::unbound;
    }
}
