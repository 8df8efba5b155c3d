#pragma once

#include <Windows.h>

namespace hb::core
{
    // Owning kernel HANDLE (files for the log sink and config reader).
    class UniqueHandle final
    {
    public:
        UniqueHandle() noexcept = default;

        explicit UniqueHandle(HANDLE value) noexcept :
            _value(value)
        {
        }

        ~UniqueHandle() noexcept
        {
            reset();
        }

        UniqueHandle(const UniqueHandle&) = delete;
        UniqueHandle& operator=(const UniqueHandle&) = delete;

        UniqueHandle(UniqueHandle&& other) noexcept :
            _value(other.release())
        {
        }

        UniqueHandle& operator=(UniqueHandle&& other) noexcept
        {
            if (this != &other)
            {
                reset(other.release());
            }
            return *this;
        }

        [[nodiscard]] HANDLE get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] bool valid() const noexcept
        {
            return _value != nullptr && _value != INVALID_HANDLE_VALUE;
        }

        HANDLE release() noexcept
        {
            HANDLE detached = _value;
            _value = nullptr;
            return detached;
        }

        void reset(HANDLE replacement = nullptr) noexcept
        {
            if (valid())
            {
                ::CloseHandle(_value);
            }
            _value = replacement;
        }

    private:
        HANDLE _value{ nullptr };
    };
}
