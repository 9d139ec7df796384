/// @file BoundedStringError.hpp
/// @brief Error codes for bounded string construction and mutation.
#pragma once

#include <expected>
#include <string_view>
#include <system_error>

#include <BOUND/Defines.hpp>
#include <BOUND/Primitives.hpp>

namespace BOUND::Text
{
    /// @brief Why a text was refused. Shared by construction, assignment and mutation.
    enum class BoundedStringError : UInt8
    {
        TooShort,
        TooLong,
        TooManyBytes,
        InvalidContent,
        MutationFailed,
    };

    [[nodiscard]] constexpr std::string_view ToString(BoundedStringError error) noexcept
    {
        switch (error)
        {
            case BoundedStringError::TooShort: return "TooShort";
            case BoundedStringError::TooLong: return "TooLong";
            case BoundedStringError::TooManyBytes: return "TooManyBytes";
            case BoundedStringError::InvalidContent: return "InvalidContent";
            case BoundedStringError::MutationFailed: return "MutationFailed";
        }
        Unreachable();
    }

    [[nodiscard]] BOUND_CORE_API const std::error_category& BoundedStringCategory() noexcept;

    [[nodiscard]] inline std::error_code MakeErrorCode(BoundedStringError error) noexcept
    {
        return std::error_code(static_cast<int>(error) + 1, BoundedStringCategory());
    }

    template<typename T>
    using BoundedExpected = std::expected<T, BoundedStringError>;
}// namespace BOUND::Text

template<>
struct std::is_error_code_enum<BOUND::Text::BoundedStringError> : std::true_type
{
};

namespace BOUND::Text
{
    [[nodiscard]] inline std::error_code make_error_code(BoundedStringError error) noexcept
    {
        return MakeErrorCode(error);
    }
}// namespace BOUND::Text
