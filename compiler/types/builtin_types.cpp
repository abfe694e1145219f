#include "builtin_types.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace vetter::types
{
    namespace
    {
        std::string substituteArgument(std::string_view pattern, std::string_view argumentReference)
        {
            constexpr std::string_view placeholder = "$ARG";

            std::string result;
            result.reserve(pattern.size() + argumentReference.size());
            std::size_t index = 0;
            while (index < pattern.size())
            {
                if (pattern.compare(index, placeholder.size(), placeholder) == 0)
                {
                    result.append(argumentReference);
                    index += placeholder.size();
                    continue;
                }
                result.push_back(pattern[index]);
                ++index;
            }
            return result;
        }

        bool isDigitString(std::string_view text)
        {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](char ch) {
                return ch >= '0' && ch <= '9';
            });
        }

        bool isIntegralFloat(double number)
        {
            return std::isfinite(number) && std::floor(number) == number;
        }

        bool acceptAny(const Value&, const void*)
        {
            return true;
        }

        bool acceptDefined(const Value& value, const void*)
        {
            return !value.isNull();
        }

        bool acceptBoolean(const Value& value, const void*)
        {
            return value.isBoolean();
        }

        bool acceptInteger(const Value& value, const void*)
        {
            switch (value.kind())
            {
            case ValueKind::Integer:
                return true;
            case ValueKind::Float:
                return isIntegralFloat(value.asFloat());
            case ValueKind::String:
            {
                std::string_view text = value.asString();
                if (!text.empty() && text.front() == '-')
                {
                    text.remove_prefix(1);
                }
                return isDigitString(text);
            }
            default:
                return false;
            }
        }

        bool acceptPositiveInteger(const Value& value, const void*)
        {
            switch (value.kind())
            {
            case ValueKind::Integer:
                return value.asInteger() > 0;
            case ValueKind::Float:
                return isIntegralFloat(value.asFloat()) && value.asFloat() > 0.0;
            case ValueKind::String:
            {
                const std::string& text = value.asString();
                return isDigitString(text) && text.find_first_not_of('0') != std::string::npos;
            }
            default:
                return false;
            }
        }

        bool acceptNumber(const Value& value, const void*)
        {
            switch (value.kind())
            {
            case ValueKind::Integer:
            case ValueKind::Float:
                return true;
            case ValueKind::String:
            {
                const std::string& text = value.asString();
                if (!isDecimalNumberLiteral(text))
                {
                    return false;
                }
                errno = 0;
                char* end = nullptr;
                const double parsed = std::strtod(text.c_str(), &end);
                return errno == 0 && end == text.c_str() + text.size() && std::isfinite(parsed);
            }
            default:
                return false;
            }
        }

        bool acceptString(const Value& value, const void*)
        {
            return value.isString();
        }

        bool acceptNonEmptyString(const Value& value, const void*)
        {
            return value.isString() && !value.asString().empty();
        }

        /// Capability whose check and inline predicate share one function.
        class InlineType final : public TypeCapability
        {
        public:
            InlineType(std::string_view name, InlinePredicate predicate, std::string_view expectation, std::string_view pattern)
                : m_name(name)
                , m_predicate(predicate)
                , m_expectation(expectation)
                , m_pattern(pattern)
            {
            }

            [[nodiscard]] std::string_view name() const noexcept override
            {
                return m_name;
            }

            [[nodiscard]] CheckResult check(const Value& value) const override
            {
                if (m_predicate(value, nullptr))
                {
                    return CheckResult::accept();
                }
                return CheckResult::reject(value.describe() + " is not " + std::string{m_expectation});
            }

            [[nodiscard]] std::optional<InlineCheck> emitInlineCheck(std::string_view argumentReference) const override
            {
                InlineCheck inlineCheck;
                inlineCheck.predicate = m_predicate;
                inlineCheck.fragment = substituteArgument(m_pattern, argumentReference);
                return inlineCheck;
            }

        private:
            std::string_view m_name;
            InlinePredicate m_predicate;
            std::string_view m_expectation;
            std::string_view m_pattern;
        };

        class EnumType final : public TypeCapability
        {
        public:
            EnumType(std::string name, std::vector<std::string> choices)
                : m_name(std::move(name))
                , m_choices(std::move(choices))
            {
            }

            [[nodiscard]] std::string_view name() const noexcept override
            {
                return m_name;
            }

            [[nodiscard]] CheckResult check(const Value& value) const override
            {
                if (accepts(value, this))
                {
                    return CheckResult::accept();
                }
                return CheckResult::reject(value.describe() + " is not one of " + joinedChoices());
            }

            [[nodiscard]] std::optional<InlineCheck> emitInlineCheck(std::string_view argumentReference) const override
            {
                InlineCheck inlineCheck;
                inlineCheck.predicate = &EnumType::accepts;
                inlineCheck.context = this;
                inlineCheck.fragment = "is_string(" + std::string{argumentReference} + ") && " + std::string{argumentReference}
                    + " in " + joinedChoices();
                return inlineCheck;
            }

        private:
            static bool accepts(const Value& value, const void* context)
            {
                if (!value.isString())
                {
                    return false;
                }
                const auto* self = static_cast<const EnumType*>(context);
                return std::find(self->m_choices.begin(), self->m_choices.end(), value.asString()) != self->m_choices.end();
            }

            std::string joinedChoices() const
            {
                std::string result = "{";
                for (std::size_t index = 0; index < m_choices.size(); ++index)
                {
                    if (index > 0)
                    {
                        result += ", ";
                    }
                    result += "\"" + m_choices[index] + "\"";
                }
                result.push_back('}');
                return result;
            }

            std::string m_name;
            std::vector<std::string> m_choices;
        };

        class PredicateType final : public TypeCapability
        {
        public:
            PredicateType(std::string name, std::function<bool(const Value&)> predicate, std::string expectation)
                : m_name(std::move(name))
                , m_predicate(std::move(predicate))
                , m_expectation(std::move(expectation))
            {
            }

            [[nodiscard]] std::string_view name() const noexcept override
            {
                return m_name;
            }

            [[nodiscard]] CheckResult check(const Value& value) const override
            {
                if (m_predicate && m_predicate(value))
                {
                    return CheckResult::accept();
                }
                return CheckResult::reject(value.describe() + " is not " + m_expectation);
            }

        private:
            std::string m_name;
            std::function<bool(const Value&)> m_predicate;
            std::string m_expectation;
        };

        TypeCapabilityPtr makeInline(std::string_view name, InlinePredicate predicate, std::string_view expectation, std::string_view pattern)
        {
            return std::make_shared<const InlineType>(name, predicate, expectation, pattern);
        }
    } // namespace

    TypeCapabilityPtr anyType()
    {
        static const TypeCapabilityPtr type = makeInline("any", &acceptAny, "anything", "true");
        return type;
    }

    TypeCapabilityPtr definedType()
    {
        static const TypeCapabilityPtr type = makeInline("defined", &acceptDefined, "a defined value", "!is_null($ARG)");
        return type;
    }

    TypeCapabilityPtr booleanType()
    {
        static const TypeCapabilityPtr type = makeInline("boolean", &acceptBoolean, "a boolean", "is_boolean($ARG)");
        return type;
    }

    TypeCapabilityPtr integerType()
    {
        static const TypeCapabilityPtr type = makeInline("integer", &acceptInteger, "an integer", "is_integral($ARG)");
        return type;
    }

    TypeCapabilityPtr positiveIntegerType()
    {
        static const TypeCapabilityPtr type = makeInline("positive-integer", &acceptPositiveInteger, "a positive integer",
                                                         "is_integral($ARG) && $ARG > 0");
        return type;
    }

    TypeCapabilityPtr numberType()
    {
        static const TypeCapabilityPtr type = makeInline("number", &acceptNumber, "a number", "is_numeric($ARG)");
        return type;
    }

    TypeCapabilityPtr stringType()
    {
        static const TypeCapabilityPtr type = makeInline("string", &acceptString, "a string", "is_string($ARG)");
        return type;
    }

    TypeCapabilityPtr nonEmptyStringType()
    {
        static const TypeCapabilityPtr type = makeInline("non-empty-string", &acceptNonEmptyString, "a non-empty string",
                                                         "is_string($ARG) && length($ARG) > 0");
        return type;
    }

    TypeCapabilityPtr makeEnumType(std::string name, std::vector<std::string> choices)
    {
        return std::make_shared<const EnumType>(std::move(name), std::move(choices));
    }

    TypeCapabilityPtr makePredicateType(std::string name, std::function<bool(const Value&)> predicate, std::string expectation)
    {
        return std::make_shared<const PredicateType>(std::move(name), std::move(predicate), std::move(expectation));
    }

    TypeCapabilityPtr builtinTypeByName(std::string_view name)
    {
        using Factory = TypeCapabilityPtr (*)();
        static const std::array<std::pair<std::string_view, Factory>, 8> table{{
            {"any", &anyType},
            {"defined", &definedType},
            {"boolean", &booleanType},
            {"integer", &integerType},
            {"positive-integer", &positiveIntegerType},
            {"number", &numberType},
            {"string", &stringType},
            {"non-empty-string", &nonEmptyStringType},
        }};

        for (const auto& entry : table)
        {
            if (entry.first == name)
            {
                return entry.second();
            }
        }
        return nullptr;
    }

    std::vector<std::string_view> builtinTypeNames()
    {
        return {"any", "defined", "boolean", "integer", "positive-integer", "number", "string", "non-empty-string"};
    }
} // namespace vetter::types
