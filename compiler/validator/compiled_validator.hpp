#pragma once

#include "../codegen/routine.hpp"
#include "../planner/compilation_plan.hpp"
#include "validation_error.hpp"

#include <memory>
#include <string>

namespace vetter
{
    /**
     * Immutable result of compiling one spec set under one set of options.
     * validate() is a pure function of its input and may be called concurrently.
     */
    class CompiledValidator
    {
    public:
        CompiledValidator(CompilationPlan plan, std::unique_ptr<const codegen::Routine> routine);

        CompiledValidator(const CompiledValidator&) = delete;
        CompiledValidator& operator=(const CompiledValidator&) = delete;

        [[nodiscard]] ValidationResult validate(const NamedArguments& arguments) const;
        [[nodiscard]] ValidationResult validate(const PositionalArguments& arguments) const;

        [[nodiscard]] const CompilationPlan& plan() const noexcept
        {
            return m_plan;
        }

        [[nodiscard]] ExecutionStrategy strategy() const noexcept
        {
            return m_routine->strategy();
        }

        [[nodiscard]] const std::string& name() const noexcept
        {
            return m_plan.validatorName;
        }

        [[nodiscard]] SourceMode sourceMode() const noexcept
        {
            return m_plan.sourceMode;
        }

        [[nodiscard]] OutputMode outputMode() const noexcept
        {
            return m_plan.outputMode;
        }

    private:
        ValidationResult shapeMismatch(SourceMode received) const;

        CompilationPlan m_plan;
        std::unique_ptr<const codegen::Routine> m_routine;
    };

    using CompiledValidatorPtr = std::shared_ptr<const CompiledValidator>;
} // namespace vetter
