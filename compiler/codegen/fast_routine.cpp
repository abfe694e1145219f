#include "routine.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace vetter::codegen
{
    namespace
    {
        /// One parameter of the specialized routine, flattened so execution needs no plan lookups.
        struct FastStep
        {
            InlinePredicate predicate{nullptr};
            const void* context{nullptr};
            const TypeCapability* type{nullptr};
            const std::string* name{nullptr};
            std::size_t index{0};
            bool required{true};
            DefaultHandling defaultHandling{DefaultHandling::None};
            const DefaultValue* defaultValue{nullptr};
        };

        class FastRoutine final : public Routine
        {
        public:
            explicit FastRoutine(const CompilationPlan& plan)
                : m_specSet(plan.specSet)
                , m_validatorName(plan.validatorName)
                , m_outputMode(plan.outputMode)
                , m_strict(plan.strict)
                , m_extraValues(plan.extraValues)
            {
                m_steps.reserve(plan.steps.size());
                for (const auto& planStep : plan.steps)
                {
                    FastStep step;
                    step.predicate = planStep.inlineCheck->predicate;
                    step.context = planStep.inlineCheck->context;
                    step.type = planStep.type;
                    step.name = &planStep.parameter->name;
                    step.index = planStep.index;
                    step.required = planStep.required;
                    step.defaultHandling = planStep.defaultHandling;
                    if (planStep.parameter->hasDefault())
                    {
                        step.defaultValue = &*planStep.parameter->defaultValue;
                    }
                    m_steps.push_back(step);
                    m_declaredNames.insert(planStep.parameter->name);
                }

                if (plan.extraValues && plan.extraInlineCheck.has_value())
                {
                    m_extraPredicate = plan.extraInlineCheck->predicate;
                    m_extraContext = plan.extraInlineCheck->context;
                }
            }

            [[nodiscard]] ExecutionStrategy strategy() const noexcept override
            {
                return ExecutionStrategy::FastPath;
            }

            [[nodiscard]] ValidationResult run(const NamedArguments& arguments) const override
            {
                std::vector<std::string> extraKeys;
                if (!arguments.empty() && (m_strict || m_extraValues))
                {
                    for (const auto& entry : arguments)
                    {
                        if (m_declaredNames.find(entry.first) == m_declaredNames.end())
                        {
                            extraKeys.push_back(entry.first);
                        }
                    }
                    std::sort(extraKeys.begin(), extraKeys.end());
                    if (!extraKeys.empty() && !m_extraValues)
                    {
                        return ValidationResult::failure(unknownParameters(m_validatorName, extraKeys));
                    }
                }

                ValidatedValues values;
                values.shape = m_outputMode;
                if (m_outputMode == OutputMode::OrderedList)
                {
                    values.ordered.reserve(m_steps.size());
                }

                for (const auto& step : m_steps)
                {
                    const auto it = arguments.find(*step.name);
                    const Value* raw = it == arguments.end() ? nullptr : &it->second;
                    if (auto error = applyStep(step, raw, values))
                    {
                        return ValidationResult::failure(std::move(*error));
                    }
                }

                for (const auto& key : extraKeys)
                {
                    const Value& raw = arguments.at(key);
                    if (!m_extraPredicate(raw, m_extraContext))
                    {
                        return ValidationResult::failure(typeMismatch(m_validatorName, key, m_extraValues->check(raw).reason));
                    }
                    values.mapped.emplace(key, raw);
                }

                return ValidationResult::success(std::move(values));
            }

            [[nodiscard]] ValidationResult run(const PositionalArguments& arguments) const override
            {
                const std::size_t declared = m_steps.size();
                if (arguments.size() > declared && m_strict && !m_extraValues)
                {
                    return ValidationResult::failure(tooManyArguments(m_validatorName, arguments.size(), declared));
                }

                ValidatedValues values;
                values.shape = m_outputMode;
                if (m_outputMode == OutputMode::OrderedList)
                {
                    values.ordered.reserve(std::max(declared, arguments.size()));
                }

                for (const auto& step : m_steps)
                {
                    const Value* raw = step.index < arguments.size() ? &arguments[step.index] : nullptr;
                    if (auto error = applyStep(step, raw, values))
                    {
                        return ValidationResult::failure(std::move(*error));
                    }
                }

                if (m_extraValues)
                {
                    for (std::size_t index = declared; index < arguments.size(); ++index)
                    {
                        const Value& raw = arguments[index];
                        if (!m_extraPredicate(raw, m_extraContext))
                        {
                            return ValidationResult::failure(
                                typeMismatch(m_validatorName, extraPositionName(index), m_extraValues->check(raw).reason));
                        }
                        values.ordered.push_back(raw);
                    }
                }

                return ValidationResult::success(std::move(values));
            }

        private:
            std::optional<ValidationError> applyStep(const FastStep& step, const Value* raw, ValidatedValues& values) const
            {
                if (raw != nullptr)
                {
                    if (!step.predicate(*raw, step.context))
                    {
                        // Only a rejected value pays for the capability's explanation.
                        return typeMismatch(m_validatorName, *step.name, step.type->check(*raw).reason);
                    }
                    store(step, *raw, values);
                    return std::nullopt;
                }

                switch (step.defaultHandling)
                {
                case DefaultHandling::Constant:
                    store(step, step.defaultValue->constantValue(), values);
                    return std::nullopt;
                case DefaultHandling::Factory:
                {
                    Value produced = step.defaultValue->produce();
                    if (!step.predicate(produced, step.context))
                    {
                        return defaultMismatch(m_validatorName, *step.name, step.type->check(produced).reason);
                    }
                    store(step, std::move(produced), values);
                    return std::nullopt;
                }
                case DefaultHandling::None:
                    break;
                }

                if (step.required)
                {
                    return missingRequired(m_validatorName, *step.name);
                }

                if (m_outputMode == OutputMode::OrderedList)
                {
                    values.ordered.emplace_back();
                }
                return std::nullopt;
            }

            void store(const FastStep& step, Value value, ValidatedValues& values) const
            {
                if (m_outputMode == OutputMode::Mapped)
                {
                    values.mapped.emplace(*step.name, std::move(value));
                }
                else
                {
                    values.ordered.push_back(std::move(value));
                }
            }

        private:
            ParameterSpecSetPtr m_specSet;
            std::string m_validatorName;
            OutputMode m_outputMode;
            bool m_strict;
            TypeCapabilityPtr m_extraValues;
            InlinePredicate m_extraPredicate{nullptr};
            const void* m_extraContext{nullptr};
            std::vector<FastStep> m_steps;
            std::unordered_set<std::string> m_declaredNames;
        };
    } // namespace

    std::unique_ptr<const Routine> makeFastRoutine(const CompilationPlan& plan)
    {
        return std::make_unique<const FastRoutine>(plan);
    }
} // namespace vetter::codegen
