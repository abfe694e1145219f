#include "value.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace vetter
{
    namespace
    {
        bool isIntegerLiteral(std::string_view text)
        {
            std::size_t index = 0;
            if (!text.empty() && (text[0] == '-' || text[0] == '+'))
            {
                index = 1;
            }
            if (index >= text.size())
            {
                return false;
            }
            for (; index < text.size(); ++index)
            {
                if (text[index] < '0' || text[index] > '9')
                {
                    return false;
                }
            }
            return true;
        }

        std::size_t skipDigits(std::string_view text, std::size_t index)
        {
            while (index < text.size() && text[index] >= '0' && text[index] <= '9')
            {
                ++index;
            }
            return index;
        }
    } // namespace

    bool isDecimalNumberLiteral(std::string_view text)
    {
        std::size_t index = 0;
        if (index < text.size() && (text[index] == '-' || text[index] == '+'))
        {
            ++index;
        }

        const std::size_t integerEnd = skipDigits(text, index);
        bool hasDigits = integerEnd > index;
        index = integerEnd;

        if (index < text.size() && text[index] == '.')
        {
            const std::size_t fractionEnd = skipDigits(text, index + 1);
            hasDigits = hasDigits || fractionEnd > index + 1;
            index = fractionEnd;
        }
        if (!hasDigits)
        {
            return false;
        }

        if (index < text.size() && (text[index] == 'e' || text[index] == 'E'))
        {
            ++index;
            if (index < text.size() && (text[index] == '-' || text[index] == '+'))
            {
                ++index;
            }
            const std::size_t exponentEnd = skipDigits(text, index);
            if (exponentEnd == index)
            {
                return false;
            }
            index = exponentEnd;
        }

        return index == text.size();
    }

    std::string Value::describe() const
    {
        switch (kind())
        {
        case ValueKind::Null:
            return "null";
        case ValueKind::Boolean:
            return asBoolean() ? "true" : "false";
        case ValueKind::Integer:
            return std::to_string(asInteger());
        case ValueKind::Float:
        {
            std::ostringstream stream;
            stream << asFloat();
            return stream.str();
        }
        case ValueKind::String:
            return "\"" + asString() + "\"";
        }
        return {};
    }

    std::string_view valueKindName(ValueKind kind) noexcept
    {
        switch (kind)
        {
        case ValueKind::Null:
            return "null";
        case ValueKind::Boolean:
            return "boolean";
        case ValueKind::Integer:
            return "integer";
        case ValueKind::Float:
            return "float";
        case ValueKind::String:
            return "string";
        }
        return "unknown";
    }

    Value parseLiteral(std::string_view text)
    {
        if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
        {
            return Value{std::string{text.substr(1, text.size() - 2)}};
        }

        if (text == "null")
        {
            return Value{};
        }
        if (text == "true")
        {
            return Value{true};
        }
        if (text == "false")
        {
            return Value{false};
        }

        const std::string buffer{text};
        if (isIntegerLiteral(text))
        {
            errno = 0;
            char* end = nullptr;
            const long long parsed = std::strtoll(buffer.c_str(), &end, 10);
            if (errno == 0 && end == buffer.c_str() + buffer.size())
            {
                return Value{static_cast<std::int64_t>(parsed)};
            }
            return Value{buffer};
        }

        if (isDecimalNumberLiteral(text))
        {
            errno = 0;
            char* end = nullptr;
            const double parsed = std::strtod(buffer.c_str(), &end);
            if (errno == 0 && end == buffer.c_str() + buffer.size())
            {
                return Value{parsed};
            }
        }

        return Value{buffer};
    }
} // namespace vetter
