#pragma once

#include "validated_values.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vetter
{
    enum class ValidationErrorKind
    {
        MissingRequiredParameter,
        UnknownParameter,
        TypeMismatch,
        ArgumentShapeMismatch,
        TooManyArguments
    };

    struct ValidationError
    {
        ValidationErrorKind kind{ValidationErrorKind::TypeMismatch};
        std::string code;
        std::string validatorName;
        /// Offending parameter; extra positional values are named "#<index>".
        std::string parameterName;
        std::string reason;

        /// "VETTER-E3002 TypeMismatch: ..." form, as printed by the driver.
        [[nodiscard]] std::string render() const;

        friend bool operator==(const ValidationError& left, const ValidationError& right)
        {
            return left.kind == right.kind && left.code == right.code && left.validatorName == right.validatorName
                && left.parameterName == right.parameterName && left.reason == right.reason;
        }
    };

    [[nodiscard]] std::string_view errorKindName(ValidationErrorKind kind) noexcept;
    [[nodiscard]] std::string_view errorKindCode(ValidationErrorKind kind) noexcept;

    [[nodiscard]] ValidationError makeValidationError(ValidationErrorKind kind,
                                                      const std::string& validatorName,
                                                      std::string parameterName,
                                                      std::string reason);

    /// Either values or an error, never both.
    struct ValidationResult
    {
        std::optional<ValidatedValues> values;
        std::optional<ValidationError> error;

        [[nodiscard]] bool ok() const noexcept
        {
            return values.has_value();
        }

        [[nodiscard]] static ValidationResult success(ValidatedValues values)
        {
            ValidationResult result;
            result.values = std::move(values);
            return result;
        }

        [[nodiscard]] static ValidationResult failure(ValidationError error)
        {
            ValidationResult result;
            result.error = std::move(error);
            return result;
        }
    };
} // namespace vetter
