#pragma once

#include "../common/diagnostic.hpp"
#include "../planner/compilation_plan.hpp"
#include "../validator/compiled_validator.hpp"

#include <vector>

namespace vetter
{
    /// Turns a verified plan into a CompiledValidator using the strategy the plan records.
    class ValidatorBuilder
    {
    public:
        explicit ValidatorBuilder(CompilationPlan plan);

        [[nodiscard]] CompiledValidatorPtr build();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        CompilationPlan m_plan;
        std::vector<Diagnostic> m_diagnostics;
    };

    struct CompileOutcome
    {
        CompiledValidatorPtr validator;
        std::vector<Diagnostic> diagnostics;

        [[nodiscard]] bool ok() const noexcept
        {
            return validator != nullptr;
        }
    };

    /// Plans and builds in one go. Never returns a validator together with diagnostics.
    [[nodiscard]] CompileOutcome compileValidator(ParameterSpecSetPtr specSet, const ValidatorOptions& options);
} // namespace vetter
