#include "window/creation_context.hpp"

namespace hb::window
{
    namespace
    {
        thread_local WindowProcCell* t_pending_cell = nullptr;
    }

    CreationContext::CreationContext(WindowProcCell& cell) noexcept :
        _previous(t_pending_cell)
    {
        t_pending_cell = &cell;
    }

    CreationContext::~CreationContext() noexcept
    {
        t_pending_cell = _previous;
    }

    WindowProcCell* CreationContext::claim(void* const raw) noexcept
    {
        if (raw == nullptr || t_pending_cell == nullptr || raw != t_pending_cell->into_raw())
        {
            return nullptr;
        }

        WindowProcCell* const cell = WindowProcCell::from_raw(raw);
        t_pending_cell = nullptr;
        return cell;
    }
}
