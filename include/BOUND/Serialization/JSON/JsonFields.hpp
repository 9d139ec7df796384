#pragma once

#include <BOUND/Defines.hpp>
#include <BOUND/Primitives.hpp>
#include <BOUND/Serialization/Core/ParseError.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace BOUND::Serialization
{
    /// @brief Limits applied while reading a field object.
    struct JsonFieldOptions
    {
        bool     trackLocation {true};
        UIntSize maxFields {64};
        UIntSize maxInputBytes {64 * 1024};
    };

    /// @brief A flat JSON object whose values are all strings, e.g. `{"username":"Alice","token":"a1b2"}`.
    ///
    /// This is the plain-text intermediate form: values are decoded JSON strings and carry no
    /// bounds. Binding them to bounded types happens afterwards (see BoundedFields.hpp), so
    /// structural errors are always reported before validation errors.
    class BOUND_CORE_API JsonFields
    {
    public:
        using Field = std::pair<std::string, std::string>;

        JsonFields() = default;

        static std::expected<JsonFields, ParseError> Parse(std::string_view input, const JsonFieldOptions& options = {});

        /// @return Decoded value for `key`, or nullptr when absent.
        [[nodiscard]] const std::string* Find(std::string_view key) const noexcept;

        [[nodiscard]] bool Contains(std::string_view key) const noexcept { return Find(key) != nullptr; }

        /// Inserts or replaces a field; insertion order is kept.
        void Set(std::string key, std::string value);

        [[nodiscard]] UIntSize Size() const noexcept { return m_fields.size(); }
        [[nodiscard]] bool     Empty() const noexcept { return m_fields.empty(); }

        [[nodiscard]] auto begin() const noexcept { return m_fields.begin(); }
        [[nodiscard]] auto end() const noexcept { return m_fields.end(); }

        /// Compact JSON object text; `Parse(ToJson())` yields the same fields.
        [[nodiscard]] std::string ToJson() const;

    private:
        std::vector<Field> m_fields;
    };

    /// @brief Appends `text` to `out` as a quoted JSON string literal.
    BOUND_CORE_API void WriteJsonString(std::string& out, std::string_view text);
}// namespace BOUND::Serialization
