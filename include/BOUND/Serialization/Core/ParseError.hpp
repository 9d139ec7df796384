#pragma once

#include <BOUND/Primitives.hpp>

#include <string>
#include <string_view>

namespace BOUND::Serialization
{
    /// @brief Structural reasons a text document could not be read.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidToken,
        InvalidStringEscape,
        InvalidUnicodeEscape,
        InvalidUtf8,
        UnsupportedValue,
        DuplicateKey,
        TooManyFields,
        InputTooLarge,
        TrailingCharacters,
    };

    [[nodiscard]] constexpr std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None: return "None";
            case ParseErrorCode::UnexpectedEnd: return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter: return "UnexpectedCharacter";
            case ParseErrorCode::InvalidToken: return "InvalidToken";
            case ParseErrorCode::InvalidStringEscape: return "InvalidStringEscape";
            case ParseErrorCode::InvalidUnicodeEscape: return "InvalidUnicodeEscape";
            case ParseErrorCode::InvalidUtf8: return "InvalidUtf8";
            case ParseErrorCode::UnsupportedValue: return "UnsupportedValue";
            case ParseErrorCode::DuplicateKey: return "DuplicateKey";
            case ParseErrorCode::TooManyFields: return "TooManyFields";
            case ParseErrorCode::InputTooLarge: return "InputTooLarge";
            case ParseErrorCode::TrailingCharacters: return "TrailingCharacters";
        }
        return "Unknown";
    }

    /// @brief Byte offset and optional line/column position for parse errors.
    struct ParseLocation
    {
        UIntSize offset {0};
        UIntSize line {0};
        UIntSize column {0};
    };

    /// @brief Parsing error payload with code, location, and message.
    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::None};
        ParseLocation  location {};
        std::string    message {};
    };
}// namespace BOUND::Serialization
