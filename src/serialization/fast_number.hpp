#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

namespace hb::serialization
{
    enum class NumberErrorCode
    {
        empty_input,
        invalid_character,
        overflow,
        underflow,
    };

    struct NumberError final
    {
        NumberErrorCode code{ NumberErrorCode::invalid_character };
    };

    // Decimal only, optional leading sign, no surrounding whitespace.
    [[nodiscard]] std::expected<std::int32_t, NumberError> parse_i32(std::wstring_view text) noexcept;
}
