#include "builder.hpp"

#include "../planner/planner.hpp"
#include "../planner/verifier.hpp"
#include "routine.hpp"

#include <utility>

namespace vetter
{
    ValidatorBuilder::ValidatorBuilder(CompilationPlan plan)
        : m_plan(std::move(plan))
    {
    }

    CompiledValidatorPtr ValidatorBuilder::build()
    {
        m_diagnostics.clear();

        if (!verify(m_plan))
        {
            m_diagnostics.push_back(Diagnostic{
                "VETTER-E2100",
                "PlanVerificationFailed: plan for validator '" + m_plan.validatorName + "' violates its structural invariants.",
                {}});
            return nullptr;
        }

        std::unique_ptr<const codegen::Routine> routine = m_plan.strategy == ExecutionStrategy::FastPath
            ? codegen::makeFastRoutine(m_plan)
            : codegen::makeGenericRoutine(m_plan);

        return std::make_shared<const CompiledValidator>(m_plan, std::move(routine));
    }

    const std::vector<Diagnostic>& ValidatorBuilder::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    CompileOutcome compileValidator(ParameterSpecSetPtr specSet, const ValidatorOptions& options)
    {
        CompileOutcome outcome;

        Planner planner{std::move(specSet), options};
        std::optional<CompilationPlan> plan = planner.plan();
        if (!plan.has_value())
        {
            outcome.diagnostics = planner.diagnostics();
            return outcome;
        }

        ValidatorBuilder builder{std::move(*plan)};
        outcome.validator = builder.build();
        if (!outcome.validator)
        {
            outcome.diagnostics = builder.diagnostics();
        }
        return outcome;
    }
} // namespace vetter
