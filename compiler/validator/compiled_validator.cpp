#include "compiled_validator.hpp"

#include <utility>

namespace vetter
{
    CompiledValidator::CompiledValidator(CompilationPlan plan, std::unique_ptr<const codegen::Routine> routine)
        : m_plan(std::move(plan))
        , m_routine(std::move(routine))
    {
    }

    ValidationResult CompiledValidator::validate(const NamedArguments& arguments) const
    {
        if (m_plan.sourceMode != SourceMode::Named)
        {
            return shapeMismatch(SourceMode::Named);
        }
        return m_routine->run(arguments);
    }

    ValidationResult CompiledValidator::validate(const PositionalArguments& arguments) const
    {
        if (m_plan.sourceMode != SourceMode::Positional)
        {
            return shapeMismatch(SourceMode::Positional);
        }
        return m_routine->run(arguments);
    }

    ValidationResult CompiledValidator::shapeMismatch(SourceMode received) const
    {
        std::string reason = "expected ";
        reason += sourceModeName(m_plan.sourceMode);
        reason += " arguments but received ";
        reason += sourceModeName(received);
        reason += " arguments";
        return ValidationResult::failure(
            makeValidationError(ValidationErrorKind::ArgumentShapeMismatch, m_plan.validatorName, {}, std::move(reason)));
    }
} // namespace vetter
