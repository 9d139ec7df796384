/// @file Utf8.hpp
/// @brief Strict UTF-8 validation and scalar counting, usable in constant expressions.
#pragma once

#include <BOUND/Primitives.hpp>

#include <string_view>

namespace BOUND::Text::Utf8
{
    [[nodiscard]] constexpr bool IsContinuation(UInt8 byte) noexcept
    {
        return (byte & 0xC0u) == 0x80u;
    }

    /// @brief Length of the sequence introduced by `lead`, or 0 if `lead` cannot start one.
    [[nodiscard]] constexpr UIntSize SequenceLength(UInt8 lead) noexcept
    {
        if (lead < 0x80u)
            return 1;
        if (lead >= 0xC2u && lead <= 0xDFu)
            return 2;
        if (lead >= 0xE0u && lead <= 0xEFu)
            return 3;
        if (lead >= 0xF0u && lead <= 0xF4u)
            return 4;
        return 0;
    }

    /// @brief Byte offset of the first ill-formed sequence, or `text.size()` when the whole input is valid.
    ///
    /// Rejects overlong encodings, UTF-16 surrogates (U+D800..U+DFFF), code points above U+10FFFF
    /// and truncated sequences.
    [[nodiscard]] constexpr UIntSize ValidPrefixLength(std::string_view text) noexcept
    {
        const UIntSize size = text.size();
        UIntSize       i    = 0;
        while (i < size)
        {
            const auto     lead   = static_cast<UInt8>(text[i]);
            const UIntSize length = SequenceLength(lead);
            if (length == 0 || i + length > size)
                return i;
            if (length == 1)
            {
                ++i;
                continue;
            }

            const auto second = static_cast<UInt8>(text[i + 1]);
            UInt8      low    = 0x80u;
            UInt8      high   = 0xBFu;
            if (lead == 0xE0u)
                low = 0xA0u;
            else if (lead == 0xEDu)
                high = 0x9Fu;
            else if (lead == 0xF0u)
                low = 0x90u;
            else if (lead == 0xF4u)
                high = 0x8Fu;
            if (second < low || second > high)
                return i;

            for (UIntSize k = 2; k < length; ++k)
            {
                if (!IsContinuation(static_cast<UInt8>(text[i + k])))
                    return i;
            }
            i += length;
        }
        return size;
    }

    [[nodiscard]] constexpr bool IsValid(std::string_view text) noexcept
    {
        return ValidPrefixLength(text) == text.size();
    }

    /// @brief Number of Unicode scalar values in well-formed UTF-8 text.
    /// @note Counts lead bytes only; the result is meaningless for ill-formed input.
    [[nodiscard]] constexpr UIntSize CountScalars(std::string_view text) noexcept
    {
        UIntSize count = 0;
        for (const char c: text)
        {
            if (!IsContinuation(static_cast<UInt8>(c)))
                ++count;
        }
        return count;
    }
}// namespace BOUND::Text::Utf8
