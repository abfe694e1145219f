#include "planner.hpp"

#include <algorithm>
#include <utility>

namespace vetter
{
    Planner::Planner(ParameterSpecSetPtr specSet, ValidatorOptions options)
        : m_specSet(std::move(specSet))
        , m_options(std::move(options))
    {
    }

    std::optional<CompilationPlan> Planner::plan()
    {
        m_diagnostics.clear();

        if (!m_specSet)
        {
            emitError("VETTER-E2000", "MissingSpecSet: no bound parameter set was supplied.", {});
            return std::nullopt;
        }

        checkPositionalOrdering();
        checkExtraValuesShape();
        if (!m_diagnostics.empty())
        {
            return std::nullopt;
        }

        CompilationPlan plan;
        plan.specSet = m_specSet;
        plan.sourceMode = m_options.sourceMode;
        plan.outputMode = m_options.outputMode;
        plan.strict = m_options.strict;
        plan.validatorName = m_options.name;
        plan.extraValues = m_options.extraValues;

        plan.steps.reserve(m_specSet->size());
        for (const auto& parameter : *m_specSet)
        {
            plan.steps.push_back(planStep(parameter));
        }

        if (plan.extraValues)
        {
            plan.extraInlineCheck = plan.extraValues->emitInlineCheck("args[extra]");
        }

        // One strategy for the whole plan: a single non-inlinable check forces the generic path.
        const bool everyStepInlines = std::all_of(plan.steps.begin(), plan.steps.end(), [](const PlanStep& step) {
            return step.inlineCheck.has_value() && step.inlineCheck->predicate != nullptr;
        });
        const bool extrasInline = !plan.extraValues
            || (plan.extraInlineCheck.has_value() && plan.extraInlineCheck->predicate != nullptr);
        plan.strategy = (everyStepInlines && extrasInline) ? ExecutionStrategy::FastPath : ExecutionStrategy::GenericFallback;

        return plan;
    }

    const std::vector<Diagnostic>& Planner::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Planner::emitError(const std::string& code, const std::string& message, const std::string& parameterName)
    {
        m_diagnostics.push_back(Diagnostic{code, message, parameterName});
    }

    void Planner::checkPositionalOrdering()
    {
        if (m_options.sourceMode != SourceMode::Positional)
        {
            return;
        }

        const ParameterSpec* firstOptional = nullptr;
        for (const auto& parameter : *m_specSet)
        {
            if (!parameter.required)
            {
                if (firstOptional == nullptr)
                {
                    firstOptional = &parameter;
                }
                continue;
            }

            if (firstOptional != nullptr)
            {
                emitError("VETTER-E2001",
                          "RequiredAfterOptional: positional parameter '" + parameter.name
                              + "' is required but follows optional parameter '" + firstOptional->name + "'.",
                          parameter.name);
            }
        }
    }

    void Planner::checkExtraValuesShape()
    {
        if (!m_options.extraValues)
        {
            return;
        }

        const bool namedToList = m_options.sourceMode == SourceMode::Named && m_options.outputMode == OutputMode::OrderedList;
        const bool positionalToMap = m_options.sourceMode == SourceMode::Positional && m_options.outputMode == OutputMode::Mapped;
        if (namedToList || positionalToMap)
        {
            emitError("VETTER-E2002",
                      "ExtraValuesShapeMismatch: extra values cannot be kept with " + std::string{sourceModeName(m_options.sourceMode)}
                          + " input and " + std::string{outputModeName(m_options.outputMode)} + " output.",
                      {});
        }
    }

    PlanStep Planner::planStep(const ParameterSpec& parameter) const
    {
        PlanStep step;
        step.parameter = &parameter;
        step.index = parameter.position;
        if (m_options.sourceMode == SourceMode::Named)
        {
            step.fetch = FetchKind::ByKey;
            step.key = parameter.name;
        }
        else
        {
            step.fetch = FetchKind::ByIndex;
        }

        step.required = parameter.required;
        if (parameter.hasDefault())
        {
            step.defaultHandling = parameter.defaultValue->isFactory() ? DefaultHandling::Factory : DefaultHandling::Constant;
        }

        step.type = parameter.type.get();
        if (step.type != nullptr)
        {
            step.inlineCheck = step.type->emitInlineCheck(argumentReference(parameter));
        }
        return step;
    }

    std::string Planner::argumentReference(const ParameterSpec& parameter) const
    {
        if (m_options.sourceMode == SourceMode::Named)
        {
            return "args[\"" + parameter.name + "\"]";
        }
        return "args[" + std::to_string(parameter.position) + "]";
    }
} // namespace vetter
