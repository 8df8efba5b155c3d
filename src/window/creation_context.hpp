#pragma once

#include "window/window_proc_cell.hpp"

namespace hb::window
{
    // Marks `cell` as the payload `create_window` is passing through
    // `CreateWindowExW` on this thread. The trampoline binds a creation
    // payload only when it is the marked cell, so windows of the class created
    // with some other `lpParam` (an `MDICREATESTRUCTW`, an application
    // pointer) are left unbound instead of being misread as a cell.
    //
    // Scopes nest: a proc that creates another window from inside its own
    // creation messages gets its own context, and the outer one is restored
    // afterwards.
    class CreationContext final
    {
    public:
        explicit CreationContext(WindowProcCell& cell) noexcept;
        ~CreationContext() noexcept;

        CreationContext(const CreationContext&) = delete;
        CreationContext& operator=(const CreationContext&) = delete;

        // Returns the cell when `raw` is the pending payload and clears it, so
        // the payload binds at most once. Returns nullptr otherwise.
        [[nodiscard]] static WindowProcCell* claim(void* raw) noexcept;

    private:
        WindowProcCell* _previous;
    };
}
