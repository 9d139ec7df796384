#include <BOUND/Serialization/JSON/JsonFields.hpp>

#include <BOUND/Serialization/Core/InputCursor.hpp>
#include <BOUND/Text/Utf8.hpp>

namespace BOUND::Serialization
{
    namespace
    {
        struct FieldParseContext
        {
            InputCursor cursor;
        };

        [[nodiscard]] ParseError MakeError(const FieldParseContext& ctx, ParseErrorCode code, const char* message)
        {
            ParseError err;
            err.code     = code;
            err.location = ctx.cursor.Location();
            err.message  = message;
            return err;
        }

        [[nodiscard]] std::unexpected<ParseError> Fail(const FieldParseContext& ctx, ParseErrorCode code, const char* message)
        {
            return std::unexpected(MakeError(ctx, code, message));
        }

        [[nodiscard]] bool IsHexDigit(char c) noexcept
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        [[nodiscard]] UInt32 HexValue(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return static_cast<UInt32>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<UInt32>(c - 'a' + 10);
            return static_cast<UInt32>(c - 'A' + 10);
        }

        // Reads the four hex digits following "\u". The cursor is left after them.
        bool ReadHex4(InputCursor& cursor, UInt32& out) noexcept
        {
            out = 0;
            for (int i = 0; i < 4; ++i)
            {
                const char c = cursor.Peek();
                if (cursor.IsEof() || !IsHexDigit(c))
                    return false;
                out = (out << 4) | HexValue(c);
                cursor.Advance();
            }
            return true;
        }

        void AppendUtf8(std::string& out, UInt32 codepoint)
        {
            if (codepoint <= 0x7F)
            {
                out.push_back(static_cast<char>(codepoint));
            }
            else if (codepoint <= 0x7FF)
            {
                out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
            else if (codepoint <= 0xFFFF)
            {
                out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
        }

        std::expected<void, ParseError> ParseUnicodeEscape(FieldParseContext& ctx, std::string& out)
        {
            UInt32 codepoint = 0;
            if (!ReadHex4(ctx.cursor, codepoint))
                return Fail(ctx, ParseErrorCode::InvalidUnicodeEscape, "Invalid unicode escape");

            if (codepoint >= 0xDC00 && codepoint <= 0xDFFF)
                return Fail(ctx, ParseErrorCode::InvalidUnicodeEscape, "Unpaired low surrogate");

            if (codepoint >= 0xD800 && codepoint <= 0xDBFF)
            {
                if (ctx.cursor.Peek() != '\\' || ctx.cursor.Peek(1) != 'u')
                    return Fail(ctx, ParseErrorCode::InvalidUnicodeEscape, "Missing low surrogate");
                ctx.cursor.Advance(2);
                UInt32 low = 0;
                if (!ReadHex4(ctx.cursor, low))
                    return Fail(ctx, ParseErrorCode::InvalidUnicodeEscape, "Invalid surrogate escape");
                if (low < 0xDC00 || low > 0xDFFF)
                    return Fail(ctx, ParseErrorCode::InvalidUnicodeEscape, "Invalid surrogate pair");
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
            }

            AppendUtf8(out, codepoint);
            return {};
        }

        std::expected<std::string, ParseError> ParseString(FieldParseContext& ctx)
        {
            if (!ctx.cursor.Consume('"'))
                return Fail(ctx, ParseErrorCode::InvalidToken, "Expected string");

            const ParseLocation start = ctx.cursor.Location();
            std::string         out;
            while (true)
            {
                if (ctx.cursor.IsEof())
                    return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated string");

                const char c = ctx.cursor.Peek();
                if (c == '"')
                {
                    ctx.cursor.Advance();
                    break;
                }
                if (static_cast<UInt8>(c) < 0x20)
                    return Fail(ctx, ParseErrorCode::InvalidToken, "Control character in string");
                if (c != '\\')
                {
                    out.push_back(c);
                    ctx.cursor.Advance();
                    continue;
                }

                ctx.cursor.Advance();
                if (ctx.cursor.IsEof())
                    return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated escape");
                const char esc = ctx.cursor.Peek();
                ctx.cursor.Advance();
                switch (esc)
                {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        auto escaped = ParseUnicodeEscape(ctx, out);
                        if (!escaped)
                            return std::unexpected(std::move(escaped).error());
                        break;
                    }
                    default:
                        return Fail(ctx, ParseErrorCode::InvalidStringEscape, "Invalid escape");
                }
            }

            const UIntSize validPrefix = Text::Utf8::ValidPrefixLength(out);
            if (validPrefix != out.size())
            {
                ParseError err;
                err.code     = ParseErrorCode::InvalidUtf8;
                err.location = start;
                err.message  = "String is not valid UTF-8";
                return std::unexpected(std::move(err));
            }
            return out;
        }

        // Value position holding something other than a string.
        std::expected<void, ParseError> RejectNonString(FieldParseContext& ctx)
        {
            const char c = ctx.cursor.Peek();
            if (ctx.cursor.IsEof())
                return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Expected value");
            if (c == '{' || c == '[' || c == 't' || c == 'f' || c == 'n' || c == '-' || (c >= '0' && c <= '9'))
                return Fail(ctx, ParseErrorCode::UnsupportedValue, "Only string values are supported");
            return Fail(ctx, ParseErrorCode::InvalidToken, "Invalid value");
        }
    }// namespace

    std::expected<JsonFields, ParseError> JsonFields::Parse(std::string_view input, const JsonFieldOptions& options)
    {
        FieldParseContext ctx {InputCursor {input, options.trackLocation}};
        if (input.size() > options.maxInputBytes)
            return Fail(ctx, ParseErrorCode::InputTooLarge, "Input exceeds the configured size limit");

        JsonFields fields;
        ctx.cursor.SkipWhitespace();
        if (!ctx.cursor.Consume('{'))
        {
            if (ctx.cursor.IsEof())
                return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Expected '{'");
            return Fail(ctx, ParseErrorCode::UnexpectedCharacter, "Expected '{'");
        }

        ctx.cursor.SkipWhitespace();
        if (!ctx.cursor.Consume('}'))
        {
            while (true)
            {
                ctx.cursor.SkipWhitespace();
                const ParseLocation keyLocation = ctx.cursor.Location();
                if (ctx.cursor.IsEof())
                    return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Expected key");
                auto key = ParseString(ctx);
                if (!key)
                    return std::unexpected(std::move(key).error());

                ctx.cursor.SkipWhitespace();
                if (!ctx.cursor.Consume(':'))
                {
                    if (ctx.cursor.IsEof())
                        return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Expected ':'");
                    return Fail(ctx, ParseErrorCode::UnexpectedCharacter, "Expected ':'");
                }

                ctx.cursor.SkipWhitespace();
                if (ctx.cursor.Peek() != '"' || ctx.cursor.IsEof())
                {
                    auto rejected = RejectNonString(ctx);
                    return std::unexpected(std::move(rejected).error());
                }
                auto value = ParseString(ctx);
                if (!value)
                    return std::unexpected(std::move(value).error());

                if (fields.Contains(*key))
                {
                    ParseError err;
                    err.code     = ParseErrorCode::DuplicateKey;
                    err.location = keyLocation;
                    err.message  = "Duplicate key '" + *key + "'";
                    return std::unexpected(std::move(err));
                }
                if (fields.Size() >= options.maxFields)
                    return Fail(ctx, ParseErrorCode::TooManyFields, "Too many fields");
                fields.m_fields.emplace_back(std::move(*key), std::move(*value));

                ctx.cursor.SkipWhitespace();
                if (ctx.cursor.Consume(','))
                {
                    ctx.cursor.SkipWhitespace();
                    if (ctx.cursor.Peek() == '}')
                        return Fail(ctx, ParseErrorCode::InvalidToken, "Trailing comma in object");
                    continue;
                }
                if (ctx.cursor.Consume('}'))
                    break;
                if (ctx.cursor.IsEof())
                    return Fail(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated object");
                return Fail(ctx, ParseErrorCode::UnexpectedCharacter, "Expected ',' or '}'");
            }
        }

        ctx.cursor.SkipWhitespace();
        if (!ctx.cursor.IsEof())
            return Fail(ctx, ParseErrorCode::TrailingCharacters, "Unexpected characters after object");
        return fields;
    }

    const std::string* JsonFields::Find(std::string_view key) const noexcept
    {
        for (const auto& field: m_fields)
        {
            if (field.first == key)
                return &field.second;
        }
        return nullptr;
    }

    void JsonFields::Set(std::string key, std::string value)
    {
        for (auto& field: m_fields)
        {
            if (field.first == key)
            {
                field.second = std::move(value);
                return;
            }
        }
        m_fields.emplace_back(std::move(key), std::move(value));
    }

    std::string JsonFields::ToJson() const
    {
        std::string out;
        out.push_back('{');
        bool first = true;
        for (const auto& [key, value]: m_fields)
        {
            if (!first)
                out.push_back(',');
            first = false;
            WriteJsonString(out, key);
            out.push_back(':');
            WriteJsonString(out, value);
        }
        out.push_back('}');
        return out;
    }

    void WriteJsonString(std::string& out, std::string_view text)
    {
        static constexpr char kHex[] = "0123456789abcdef";

        out.push_back('"');
        for (const char c: text)
        {
            switch (c)
            {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<UInt8>(c) < 0x20)
                    {
                        const auto byte = static_cast<UInt8>(c);
                        out += "\\u00";
                        out.push_back(kHex[byte >> 4]);
                        out.push_back(kHex[byte & 0x0F]);
                    }
                    else
                    {
                        out.push_back(c);
                    }
                    break;
            }
        }
        out.push_back('"');
    }
}// namespace BOUND::Serialization
