/// @file LengthPolicy.hpp
/// @brief Policies computing the logical length of validated text.
#pragma once

#include <BOUND/Primitives.hpp>
#include <BOUND/Text/Utf8.hpp>

#include <concepts>
#include <limits>
#include <string_view>

namespace BOUND::Text
{
    /// @brief A length policy maps well-formed UTF-8 text to its logical length and
    ///        bounds the number of bytes a text of a given logical length may occupy.
    template<class P>
    concept LengthPolicyConcept =
            requires(std::string_view text, UIntSize logical) {
                { P::LogicalLength(text) } -> std::same_as<UIntSize>;
                { P::MaxBytesFor(logical) } -> std::same_as<UIntSize>;
            };

    /// @brief Logical length is the byte count.
    struct Bytes
    {
        [[nodiscard]] static constexpr UIntSize LogicalLength(std::string_view text) noexcept
        {
            return text.size();
        }

        [[nodiscard]] static constexpr UIntSize MaxBytesFor(UIntSize logical) noexcept
        {
            return logical;
        }
    };

    /// @brief Logical length is the number of Unicode scalar values (code points, not grapheme clusters).
    struct Scalars
    {
        static constexpr UIntSize MaxSequenceBytes = 4;

        [[nodiscard]] static constexpr UIntSize LogicalLength(std::string_view text) noexcept
        {
            return Utf8::CountScalars(text);
        }

        [[nodiscard]] static constexpr UIntSize MaxBytesFor(UIntSize logical) noexcept
        {
            constexpr UIntSize limit = std::numeric_limits<UIntSize>::max() / MaxSequenceBytes;
            return logical > limit ? std::numeric_limits<UIntSize>::max() : logical * MaxSequenceBytes;
        }
    };

    static_assert(LengthPolicyConcept<Bytes>);
    static_assert(LengthPolicyConcept<Scalars>);
}// namespace BOUND::Text
