#include "routine.hpp"

#include <utility>

namespace vetter::codegen
{
    ValidationError missingRequired(const std::string& validatorName, const std::string& parameterName)
    {
        return makeValidationError(ValidationErrorKind::MissingRequiredParameter, validatorName, parameterName,
                                   "a value is required but none was supplied");
    }

    ValidationError typeMismatch(const std::string& validatorName, const std::string& parameterName, std::string reason)
    {
        return makeValidationError(ValidationErrorKind::TypeMismatch, validatorName, parameterName, std::move(reason));
    }

    ValidationError defaultMismatch(const std::string& validatorName, const std::string& parameterName, const std::string& reason)
    {
        return makeValidationError(ValidationErrorKind::TypeMismatch, validatorName, parameterName,
                                   "default factory produced a rejected value: " + reason);
    }

    ValidationError unknownParameters(const std::string& validatorName, const std::vector<std::string>& sortedKeys)
    {
        std::string reason = "not declared (undeclared parameters: ";
        for (std::size_t index = 0; index < sortedKeys.size(); ++index)
        {
            if (index > 0)
            {
                reason += ", ";
            }
            reason += sortedKeys[index];
        }
        reason += ')';
        return makeValidationError(ValidationErrorKind::UnknownParameter, validatorName, sortedKeys.front(), std::move(reason));
    }

    ValidationError tooManyArguments(const std::string& validatorName, std::size_t received, std::size_t declared)
    {
        return makeValidationError(ValidationErrorKind::TooManyArguments, validatorName, extraPositionName(declared),
                                   "got " + std::to_string(received) + " positional values but at most "
                                       + std::to_string(declared) + " are declared");
    }

    std::string extraPositionName(std::size_t index)
    {
        return "#" + std::to_string(index);
    }
} // namespace vetter::codegen
