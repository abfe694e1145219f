#include "verifier.hpp"

#include <algorithm>

namespace vetter
{
    namespace
    {
        bool hasInlinePredicate(const std::optional<InlineCheck>& inlineCheck)
        {
            return inlineCheck.has_value() && inlineCheck->predicate != nullptr;
        }

        DefaultHandling expectedDefaultHandling(const ParameterSpec& parameter)
        {
            if (!parameter.hasDefault())
            {
                return DefaultHandling::None;
            }
            return parameter.defaultValue->isFactory() ? DefaultHandling::Factory : DefaultHandling::Constant;
        }

        bool stepMatchesParameter(const CompilationPlan& plan, const PlanStep& step, const ParameterSpec& parameter)
        {
            if (step.parameter != &parameter || step.index != parameter.position)
            {
                return false;
            }

            if (plan.sourceMode == SourceMode::Named)
            {
                if (step.fetch != FetchKind::ByKey || step.key != parameter.name)
                {
                    return false;
                }
            }
            else if (step.fetch != FetchKind::ByIndex)
            {
                return false;
            }

            if (step.type == nullptr || step.type != parameter.type.get())
            {
                return false;
            }

            if (step.required != parameter.required)
            {
                return false;
            }

            return step.defaultHandling == expectedDefaultHandling(parameter);
        }

        bool requiredFollowsOptional(const CompilationPlan& plan)
        {
            bool seenOptional = false;
            for (const auto& step : plan.steps)
            {
                if (!step.required)
                {
                    seenOptional = true;
                }
                else if (seenOptional)
                {
                    return true;
                }
            }
            return false;
        }
    } // namespace

    bool verify(const CompilationPlan& plan)
    {
        if (!plan.specSet)
        {
            return false;
        }

        if (plan.steps.size() != plan.specSet->size())
        {
            return false;
        }

        for (std::size_t index = 0; index < plan.steps.size(); ++index)
        {
            if (!stepMatchesParameter(plan, plan.steps[index], plan.specSet->at(index)))
            {
                return false;
            }
        }

        if (plan.sourceMode == SourceMode::Positional && requiredFollowsOptional(plan))
        {
            return false;
        }

        if (plan.extraValues)
        {
            if (plan.sourceMode == SourceMode::Named && plan.outputMode == OutputMode::OrderedList)
            {
                return false;
            }
            if (plan.sourceMode == SourceMode::Positional && plan.outputMode == OutputMode::Mapped)
            {
                return false;
            }
        }

        if (plan.strategy == ExecutionStrategy::FastPath)
        {
            const bool stepsInline = std::all_of(plan.steps.begin(), plan.steps.end(), [](const PlanStep& step) {
                return hasInlinePredicate(step.inlineCheck);
            });
            if (!stepsInline)
            {
                return false;
            }
            if (plan.extraValues && !hasInlinePredicate(plan.extraInlineCheck))
            {
                return false;
            }
        }

        return true;
    }
} // namespace vetter
