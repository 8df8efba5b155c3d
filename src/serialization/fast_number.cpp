#include "serialization/fast_number.hpp"

#include <limits>

namespace hb::serialization
{
    namespace
    {
        [[nodiscard]] constexpr NumberError make_error(const NumberErrorCode code) noexcept
        {
            return NumberError{ .code = code };
        }

        struct SignedDigits final
        {
            bool negative{ false };
            std::wstring_view digits;
        };

        [[nodiscard]] std::expected<SignedDigits, NumberError> split_sign(const std::wstring_view text) noexcept
        {
            if (text.empty())
            {
                return std::unexpected(make_error(NumberErrorCode::empty_input));
            }

            SignedDigits result{ .negative = false, .digits = text };
            if (text.front() == L'+' || text.front() == L'-')
            {
                result.negative = text.front() == L'-';
                result.digits = text.substr(1);
            }

            if (result.digits.empty())
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }
            return result;
        }

        // Accumulates decimal digits, failing once the magnitude exceeds `limit`.
        [[nodiscard]] std::expected<std::uint64_t, NumberError> accumulate(
            const std::wstring_view digits,
            const std::uint64_t limit,
            const NumberErrorCode limit_error) noexcept
        {
            std::uint64_t accumulator = 0;
            for (const wchar_t ch : digits)
            {
                if (ch < L'0' || ch > L'9')
                {
                    return std::unexpected(make_error(NumberErrorCode::invalid_character));
                }

                accumulator = accumulator * 10 + static_cast<std::uint64_t>(ch - L'0');
                if (accumulator > limit)
                {
                    return std::unexpected(make_error(limit_error));
                }
            }
            return accumulator;
        }
    }

    std::expected<std::int32_t, NumberError> parse_i32(const std::wstring_view text) noexcept
    {
        const auto split = split_sign(text);
        if (!split)
        {
            return std::unexpected(split.error());
        }

        constexpr std::uint64_t k_max = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
        const auto magnitude = split->negative
            ? accumulate(split->digits, k_max + 1, NumberErrorCode::underflow)
            : accumulate(split->digits, k_max, NumberErrorCode::overflow);
        if (!magnitude)
        {
            return std::unexpected(magnitude.error());
        }

        if (!split->negative)
        {
            return static_cast<std::int32_t>(*magnitude);
        }
        if (*magnitude == k_max + 1)
        {
            return std::numeric_limits<std::int32_t>::min();
        }
        return -static_cast<std::int32_t>(*magnitude);
    }
}
