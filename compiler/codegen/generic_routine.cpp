#include "routine.hpp"

#include <algorithm>
#include <utility>

namespace vetter::codegen
{
    namespace
    {
        /// Interprets the plan step by step, calling each capability's check().
        class GenericRoutine final : public Routine
        {
        public:
            explicit GenericRoutine(CompilationPlan plan)
                : m_plan(std::move(plan))
            {
            }

            [[nodiscard]] ExecutionStrategy strategy() const noexcept override
            {
                return ExecutionStrategy::GenericFallback;
            }

            [[nodiscard]] ValidationResult run(const NamedArguments& arguments) const override
            {
                std::vector<std::string> extraKeys;
                if (m_plan.strict || m_plan.extraValues)
                {
                    for (const auto& entry : arguments)
                    {
                        if (m_plan.specSet->find(entry.first) == nullptr)
                        {
                            extraKeys.push_back(entry.first);
                        }
                    }
                    std::sort(extraKeys.begin(), extraKeys.end());
                    if (!extraKeys.empty() && !m_plan.extraValues)
                    {
                        return ValidationResult::failure(unknownParameters(m_plan.validatorName, extraKeys));
                    }
                }

                ValidatedValues values;
                values.shape = m_plan.outputMode;
                for (const auto& step : m_plan.steps)
                {
                    const auto it = arguments.find(step.key);
                    const Value* raw = it == arguments.end() ? nullptr : &it->second;
                    if (auto error = applyStep(step, raw, values))
                    {
                        return ValidationResult::failure(std::move(*error));
                    }
                }

                for (const auto& key : extraKeys)
                {
                    const Value& raw = arguments.at(key);
                    const CheckResult result = m_plan.extraValues->check(raw);
                    if (!result.valid)
                    {
                        return ValidationResult::failure(typeMismatch(m_plan.validatorName, key, result.reason));
                    }
                    values.mapped.emplace(key, raw);
                }

                return ValidationResult::success(std::move(values));
            }

            [[nodiscard]] ValidationResult run(const PositionalArguments& arguments) const override
            {
                const std::size_t declared = m_plan.steps.size();
                if (arguments.size() > declared && m_plan.strict && !m_plan.extraValues)
                {
                    return ValidationResult::failure(tooManyArguments(m_plan.validatorName, arguments.size(), declared));
                }

                ValidatedValues values;
                values.shape = m_plan.outputMode;
                for (const auto& step : m_plan.steps)
                {
                    const Value* raw = step.index < arguments.size() ? &arguments[step.index] : nullptr;
                    if (auto error = applyStep(step, raw, values))
                    {
                        return ValidationResult::failure(std::move(*error));
                    }
                }

                if (m_plan.extraValues)
                {
                    for (std::size_t index = declared; index < arguments.size(); ++index)
                    {
                        const CheckResult result = m_plan.extraValues->check(arguments[index]);
                        if (!result.valid)
                        {
                            return ValidationResult::failure(
                                typeMismatch(m_plan.validatorName, extraPositionName(index), result.reason));
                        }
                        values.ordered.push_back(arguments[index]);
                    }
                }

                return ValidationResult::success(std::move(values));
            }

        private:
            std::optional<ValidationError> applyStep(const PlanStep& step, const Value* raw, ValidatedValues& values) const
            {
                const ParameterSpec& parameter = *step.parameter;

                if (raw != nullptr)
                {
                    CheckResult result = step.type->check(*raw);
                    if (!result.valid)
                    {
                        return typeMismatch(m_plan.validatorName, parameter.name, std::move(result.reason));
                    }
                    store(parameter, *raw, values);
                    return std::nullopt;
                }

                if (step.defaultHandling != DefaultHandling::None)
                {
                    Value produced = parameter.defaultValue->produce();
                    // Constant defaults were checked when the spec set was bound.
                    if (step.defaultHandling == DefaultHandling::Factory)
                    {
                        const CheckResult result = step.type->check(produced);
                        if (!result.valid)
                        {
                            return defaultMismatch(m_plan.validatorName, parameter.name, result.reason);
                        }
                    }
                    store(parameter, std::move(produced), values);
                    return std::nullopt;
                }

                if (step.required)
                {
                    return missingRequired(m_plan.validatorName, parameter.name);
                }

                if (m_plan.outputMode == OutputMode::OrderedList)
                {
                    values.ordered.emplace_back();
                }
                return std::nullopt;
            }

            void store(const ParameterSpec& parameter, Value value, ValidatedValues& values) const
            {
                if (m_plan.outputMode == OutputMode::Mapped)
                {
                    values.mapped.emplace(parameter.name, std::move(value));
                }
                else
                {
                    values.ordered.push_back(std::move(value));
                }
            }

        private:
            CompilationPlan m_plan;
        };
    } // namespace

    std::unique_ptr<const Routine> makeGenericRoutine(const CompilationPlan& plan)
    {
        return std::make_unique<const GenericRoutine>(plan);
    }
} // namespace vetter::codegen
