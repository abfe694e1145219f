#include "validation_error.hpp"

#include <utility>

namespace vetter
{
    std::string_view errorKindName(ValidationErrorKind kind) noexcept
    {
        switch (kind)
        {
        case ValidationErrorKind::MissingRequiredParameter:
            return "MissingRequiredParameter";
        case ValidationErrorKind::UnknownParameter:
            return "UnknownParameter";
        case ValidationErrorKind::TypeMismatch:
            return "TypeMismatch";
        case ValidationErrorKind::ArgumentShapeMismatch:
            return "ArgumentShapeMismatch";
        case ValidationErrorKind::TooManyArguments:
            return "TooManyArguments";
        }
        return "Unknown";
    }

    std::string_view errorKindCode(ValidationErrorKind kind) noexcept
    {
        switch (kind)
        {
        case ValidationErrorKind::MissingRequiredParameter:
            return "VETTER-E3000";
        case ValidationErrorKind::UnknownParameter:
            return "VETTER-E3001";
        case ValidationErrorKind::TypeMismatch:
            return "VETTER-E3002";
        case ValidationErrorKind::ArgumentShapeMismatch:
            return "VETTER-E3003";
        case ValidationErrorKind::TooManyArguments:
            return "VETTER-E3004";
        }
        return "VETTER-E3999";
    }

    ValidationError makeValidationError(ValidationErrorKind kind,
                                        const std::string& validatorName,
                                        std::string parameterName,
                                        std::string reason)
    {
        ValidationError error;
        error.kind = kind;
        error.code = std::string{errorKindCode(kind)};
        error.validatorName = validatorName;
        error.parameterName = std::move(parameterName);
        error.reason = std::move(reason);
        return error;
    }

    std::string ValidationError::render() const
    {
        std::string text = code;
        text += ' ';
        text += errorKindName(kind);
        text += ": ";
        if (!validatorName.empty())
        {
            text += "validator '" + validatorName + "' ";
        }
        if (!parameterName.empty())
        {
            text += "parameter '" + parameterName + "': ";
        }
        text += reason;
        text += '.';
        return text;
    }
} // namespace vetter
