#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace vetter
{
    enum class ValueKind
    {
        Null,
        Boolean,
        Integer,
        Float,
        String
    };

    class Value
    {
    public:
        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool boolean)
            : m_data(boolean)
        {
        }
        /// Any integral type except bool; unsigned values above INT64_MAX wrap.
        template <typename Integer,
                  std::enable_if_t<std::is_integral_v<Integer> && !std::is_same_v<Integer, bool>, int> = 0>
        Value(Integer integer)
            : m_data(static_cast<std::int64_t>(integer))
        {
        }
        Value(double number)
            : m_data(number)
        {
        }
        Value(const char* text)
            : m_data(std::string{text})
        {
        }
        Value(std::string text)
            : m_data(std::move(text))
        {
        }

        [[nodiscard]] ValueKind kind() const noexcept
        {
            return static_cast<ValueKind>(m_data.index());
        }

        [[nodiscard]] bool isNull() const noexcept
        {
            return kind() == ValueKind::Null;
        }

        [[nodiscard]] bool isBoolean() const noexcept
        {
            return kind() == ValueKind::Boolean;
        }

        [[nodiscard]] bool isInteger() const noexcept
        {
            return kind() == ValueKind::Integer;
        }

        [[nodiscard]] bool isFloat() const noexcept
        {
            return kind() == ValueKind::Float;
        }

        [[nodiscard]] bool isString() const noexcept
        {
            return kind() == ValueKind::String;
        }

        [[nodiscard]] bool asBoolean() const
        {
            return std::get<bool>(m_data);
        }

        [[nodiscard]] std::int64_t asInteger() const
        {
            return std::get<std::int64_t>(m_data);
        }

        [[nodiscard]] double asFloat() const
        {
            return std::get<double>(m_data);
        }

        [[nodiscard]] const std::string& asString() const
        {
            return std::get<std::string>(m_data);
        }

        /// Human-readable rendering used in error reasons and plan dumps.
        [[nodiscard]] std::string describe() const;

        friend bool operator==(const Value& left, const Value& right)
        {
            return left.m_data == right.m_data;
        }

        friend bool operator!=(const Value& left, const Value& right)
        {
            return !(left == right);
        }

    private:
        std::variant<std::monostate, bool, std::int64_t, double, std::string> m_data;
    };

    using NamedArguments = std::unordered_map<std::string, Value>;
    using PositionalArguments = std::vector<Value>;

    [[nodiscard]] std::string_view valueKindName(ValueKind kind) noexcept;

    /// [+-]digits[.digits][e[+-]digits] with no surrounding whitespace. Hex, inf and nan are not decimal.
    [[nodiscard]] bool isDecimalNumberLiteral(std::string_view text);

    /// Parses a command-line literal: null, true/false, integer, float, otherwise string.
    /// A literal wrapped in double quotes is always a string.
    [[nodiscard]] Value parseLiteral(std::string_view text);
} // namespace vetter
