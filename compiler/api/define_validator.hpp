#pragma once

#include "../codegen/builder.hpp"
#include "../planner/compilation_plan.hpp"
#include "../spec/parameter_spec.hpp"

#include <vector>

namespace vetter
{
    /**
     * Bind the declarations, then compile them through the process-wide cache
     * (or privately when options.useCache is false).
     * Binding diagnostics come back in the outcome just like planning ones.
     */
    [[nodiscard]] CompileOutcome defineValidator(std::vector<ParameterDeclaration> declarations, const ValidatorOptions& options);

    [[nodiscard]] CompileOutcome defineValidator(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options);
} // namespace vetter
