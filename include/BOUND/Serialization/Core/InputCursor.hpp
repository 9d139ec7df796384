#pragma once

#include <BOUND/Primitives.hpp>
#include <BOUND/Serialization/Core/ParseError.hpp>

#include <string_view>

namespace BOUND::Serialization
{
    /// @brief Forward-only cursor over a text buffer with optional line/column tracking.
    class InputCursor
    {
    public:
        explicit InputCursor(std::string_view data, bool trackLocation = false) noexcept
            : m_data(data), m_trackLocation(trackLocation)
        {
            if (m_trackLocation)
            {
                m_line   = 1;
                m_column = 1;
            }
        }

        [[nodiscard]] bool IsEof() const noexcept { return m_offset >= m_data.size(); }

        [[nodiscard]] char Peek(UIntSize ahead = 0) const noexcept
        {
            const UIntSize at = m_offset + ahead;
            return at < m_data.size() ? m_data[at] : '\0';
        }

        [[nodiscard]] UIntSize Remaining() const noexcept { return m_data.size() - m_offset; }

        void Advance(UIntSize count = 1) noexcept
        {
            while (count-- > 0 && m_offset < m_data.size())
            {
                const char c = m_data[m_offset++];
                if (!m_trackLocation)
                    continue;
                if (c == '\n')
                {
                    ++m_line;
                    m_column = 1;
                }
                else if (c != '\r')
                {
                    ++m_column;
                }
            }
        }

        /// Advances past `expected` if it is the next character.
        [[nodiscard]] bool Consume(char expected) noexcept
        {
            if (Peek() != expected || IsEof())
                return false;
            Advance();
            return true;
        }

        void SkipWhitespace() noexcept
        {
            while (!IsEof())
            {
                const char c = Peek();
                if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
                    return;
                Advance();
            }
        }

        [[nodiscard]] UIntSize Offset() const noexcept { return m_offset; }

        [[nodiscard]] ParseLocation Location() const noexcept
        {
            return ParseLocation {m_offset, m_line, m_column};
        }

    private:
        std::string_view m_data {};
        bool             m_trackLocation {false};
        UIntSize         m_offset {0};
        UIntSize         m_line {0};
        UIntSize         m_column {0};
    };
}// namespace BOUND::Serialization
