#include "window/window_slot.hpp"

#include "core/assert.hpp"

namespace hb::window
{
    void bind_slot(const HWND hwnd, WindowProcCell& cell) noexcept
    {
        HB_ASSERT(read_slot(hwnd) == nullptr);
        ::SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(cell.into_raw()));
        cell.mark_bound(hwnd);
    }

    WindowProcCell* read_slot(const HWND hwnd) noexcept
    {
        return WindowProcCell::from_raw(reinterpret_cast<void*>(::GetWindowLongPtrW(hwnd, GWLP_USERDATA)));
    }

    WindowProcCell* take_slot(const HWND hwnd) noexcept
    {
        WindowProcCell* const cell = read_slot(hwnd);
        if (cell == nullptr)
        {
            return nullptr;
        }

        ::SetWindowLongPtrW(hwnd, GWLP_USERDATA, 0);
        cell->mark_unbound();
        return cell;
    }
}
