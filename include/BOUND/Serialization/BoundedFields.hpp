/// @file BoundedFields.hpp
/// @brief Binding decoded JSON fields to bounded string types, and writing them back.
#pragma once

#include <BOUND/Primitives.hpp>
#include <BOUND/Serialization/JSON/JsonFields.hpp>
#include <BOUND/Text/BoundedStringError.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace BOUND::Serialization
{
    /// @brief Why a field could not be bound. Mirrors the usual deserializer vocabulary.
    enum class FieldErrorCode : UInt8
    {
        MissingField,
        InvalidLength,
        InvalidValue,
    };

    [[nodiscard]] constexpr std::string_view ToString(FieldErrorCode code) noexcept
    {
        switch (code)
        {
            case FieldErrorCode::MissingField: return "MissingField";
            case FieldErrorCode::InvalidLength: return "InvalidLength";
            case FieldErrorCode::InvalidValue: return "InvalidValue";
        }
        return "Unknown";
    }

    struct FieldError
    {
        FieldErrorCode                         code {FieldErrorCode::InvalidValue};
        std::string                            key {};
        std::optional<Text::BoundedStringError> cause {};
    };

    [[nodiscard]] constexpr FieldErrorCode ToFieldErrorCode(Text::BoundedStringError error) noexcept
    {
        switch (error)
        {
            case Text::BoundedStringError::TooShort:
            case Text::BoundedStringError::TooLong:
            case Text::BoundedStringError::TooManyBytes:
                return FieldErrorCode::InvalidLength;
            case Text::BoundedStringError::InvalidContent:
            case Text::BoundedStringError::MutationFailed:
                return FieldErrorCode::InvalidValue;
        }
        return FieldErrorCode::InvalidValue;
    }

    template<typename T>
    using FieldExpected = std::expected<T, FieldError>;

    /// @brief Validates the decoded value of `key` as a `T` (any BoundedString instantiation).
    template<class T>
    [[nodiscard]] FieldExpected<T> BindField(const JsonFields& fields, std::string_view key)
    {
        const std::string* value = fields.Find(key);
        if (!value)
            return std::unexpected(FieldError {FieldErrorCode::MissingField, std::string(key), std::nullopt});

        auto bound = T::Create(*value);
        if (!bound)
            return std::unexpected(FieldError {ToFieldErrorCode(bound.error()), std::string(key), bound.error()});
        return std::move(*bound);
    }

    /// @brief Quoted JSON string of an already validated value.
    template<class T>
    [[nodiscard]] std::string ToJson(const T& value)
    {
        std::string out;
        out.reserve(value.ByteLength() + 2);
        WriteJsonString(out, value.View());
        return out;
    }
}// namespace BOUND::Serialization
