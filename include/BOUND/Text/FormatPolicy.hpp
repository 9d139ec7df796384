/// @file FormatPolicy.hpp
/// @brief Content predicates applied to text before it is admitted into a bounded string.
///
/// Format policies express structural constraints: encoding, character classes, absence of
/// control characters. Semantic checks (is this a resolvable domain, an RFC 5322 address)
/// belong in a parser layered on top of an already bounded string.
#pragma once

#include <BOUND/Primitives.hpp>

#include <concepts>
#include <string_view>

namespace BOUND::Text
{
    template<class P>
    concept FormatPolicyConcept =
            requires(std::string_view text) {
                { P::Accepts(text) } -> std::same_as<bool>;
            };

    /// @brief Accepts every well-formed text.
    struct AllowAll
    {
        [[nodiscard]] static constexpr bool Accepts(std::string_view) noexcept { return true; }
    };

    /// @brief Accepts text whose bytes are all below 0x80.
    struct AsciiOnly
    {
        [[nodiscard]] static constexpr bool Accepts(std::string_view text) noexcept
        {
            for (const char c: text)
            {
                if (static_cast<UInt8>(c) >= 0x80u)
                    return false;
            }
            return true;
        }
    };

    /// @brief Accepts `[A-Za-z0-9]*`.
    struct AsciiAlphanumeric
    {
        [[nodiscard]] static constexpr bool IsAlphanumeric(char c) noexcept
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        }

        [[nodiscard]] static constexpr bool Accepts(std::string_view text) noexcept
        {
            for (const char c: text)
            {
                if (!IsAlphanumeric(c))
                    return false;
            }
            return true;
        }
    };

    /// @brief Rejects C0 control characters and DEL.
    struct NoControlCharacters
    {
        [[nodiscard]] static constexpr bool Accepts(std::string_view text) noexcept
        {
            for (const char c: text)
            {
                const auto byte = static_cast<UInt8>(c);
                if (byte < 0x20u || byte == 0x7Fu)
                    return false;
            }
            return true;
        }
    };

    /// @brief Caps the byte size independently of the container's logical bounds.
    template<UIntSize Limit>
    struct MaxBytes
    {
        [[nodiscard]] static constexpr bool Accepts(std::string_view text) noexcept
        {
            return text.size() <= Limit;
        }
    };

    /// @brief Conjunction of format policies, evaluated left to right.
    template<FormatPolicyConcept... Policies>
    struct AllOf
    {
        [[nodiscard]] static constexpr bool Accepts(std::string_view text) noexcept
        {
            return (Policies::Accepts(text) && ...);
        }
    };

    static_assert(FormatPolicyConcept<AllowAll>);
    static_assert(FormatPolicyConcept<AllOf<AsciiAlphanumeric, MaxBytes<128>>>);
}// namespace BOUND::Text
