#pragma once

#include "../common/diagnostic.hpp"
#include "compilation_plan.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vetter
{
    class Planner
    {
    public:
        Planner(ParameterSpecSetPtr specSet, ValidatorOptions options);

        [[nodiscard]] std::optional<CompilationPlan> plan();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        void emitError(const std::string& code, const std::string& message, const std::string& parameterName);
        void checkPositionalOrdering();
        void checkExtraValuesShape();
        PlanStep planStep(const ParameterSpec& parameter) const;
        std::string argumentReference(const ParameterSpec& parameter) const;

    private:
        ParameterSpecSetPtr m_specSet;
        ValidatorOptions m_options;
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace vetter
