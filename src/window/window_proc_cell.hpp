#pragma once

#include "window/window_proc.hpp"

#include <Windows.h>

#include <cstddef>
#include <memory>

namespace hb::logging
{
    class Logger;
}

namespace hb::window
{
    enum class SlotState
    {
        never_bound,
        bound,
        unbound,
    };

    // Reference-counted holder of one `IWindowProc`.
    //
    // The count is the number of live references:
    //   1 for the window's `GWLP_USERDATA` slot (from creation until the cell
    //     is bound, that reference is in transit through `CreateWindowExW`),
    // + 1 for every dispatch frame currently executing the proc,
    // + 1 while `create_window` is waiting on `CreateWindowExW`.
    // The proc and the cell are destroyed by the `release` that drops the count
    // to zero. The count is not atomic; only the window's thread touches it.
    class WindowProcCell final
    {
    public:
        // Starts with a count of one (the slot's reference).
        [[nodiscard]] static WindowProcCell* create(std::unique_ptr<IWindowProc> proc, logging::Logger* logger = nullptr);

        WindowProcCell(const WindowProcCell&) = delete;
        WindowProcCell& operator=(const WindowProcCell&) = delete;
        WindowProcCell(WindowProcCell&&) = delete;
        WindowProcCell& operator=(WindowProcCell&&) = delete;

        WindowProcCell* retain() noexcept;
        void release() noexcept;

        // Ownership transfer across the Win32 boundary. `into_raw` hands out
        // the creation reference as an opaque pointer; `from_raw` recovers the
        // cell without touching the count.
        [[nodiscard]] void* into_raw() noexcept;
        [[nodiscard]] static WindowProcCell* from_raw(void* raw) noexcept;

        [[nodiscard]] IWindowProc& proc() const noexcept;
        [[nodiscard]] std::size_t use_count() const noexcept;
        [[nodiscard]] logging::Logger* logger() const noexcept;

        [[nodiscard]] SlotState slot_state() const noexcept;
        [[nodiscard]] HWND bound_window() const noexcept;
        void mark_bound(HWND hwnd) noexcept;
        void mark_unbound() noexcept;

    private:
        WindowProcCell(std::unique_ptr<IWindowProc> proc, logging::Logger* logger) noexcept;
        ~WindowProcCell() noexcept;

        std::unique_ptr<IWindowProc> _proc;
        logging::Logger* _logger{};
        std::size_t _count{ 1 };
        SlotState _slot_state{ SlotState::never_bound };
        HWND _bound_window{};
    };

    // Scoped extra reference: retains on construction, releases on destruction.
    class RetainedWindowProc final
    {
    public:
        explicit RetainedWindowProc(WindowProcCell& cell) noexcept :
            _cell(cell.retain())
        {
        }

        ~RetainedWindowProc() noexcept
        {
            _cell->release();
        }

        RetainedWindowProc(const RetainedWindowProc&) = delete;
        RetainedWindowProc& operator=(const RetainedWindowProc&) = delete;

        [[nodiscard]] WindowProcCell& cell() const noexcept
        {
            return *_cell;
        }

        [[nodiscard]] IWindowProc* operator->() const noexcept
        {
            return &_cell->proc();
        }

    private:
        WindowProcCell* _cell;
    };
}
