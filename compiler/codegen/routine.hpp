#pragma once

#include "../common/value.hpp"
#include "../planner/compilation_plan.hpp"
#include "../validator/validation_error.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace vetter::codegen
{
    /// Executable body of a compiled validator. Input shape has already been matched to the source mode.
    class Routine
    {
    public:
        virtual ~Routine() = default;

        [[nodiscard]] virtual ExecutionStrategy strategy() const noexcept = 0;
        [[nodiscard]] virtual ValidationResult run(const NamedArguments& arguments) const = 0;
        [[nodiscard]] virtual ValidationResult run(const PositionalArguments& arguments) const = 0;
    };

    [[nodiscard]] std::unique_ptr<const Routine> makeFastRoutine(const CompilationPlan& plan);
    [[nodiscard]] std::unique_ptr<const Routine> makeGenericRoutine(const CompilationPlan& plan);

    // Error construction shared by both routines so their reports are identical.
    [[nodiscard]] ValidationError missingRequired(const std::string& validatorName, const std::string& parameterName);
    [[nodiscard]] ValidationError typeMismatch(const std::string& validatorName, const std::string& parameterName, std::string reason);
    [[nodiscard]] ValidationError defaultMismatch(const std::string& validatorName, const std::string& parameterName, const std::string& reason);
    /// sortedKeys must be non-empty; the first key is reported as the offending parameter.
    [[nodiscard]] ValidationError unknownParameters(const std::string& validatorName, const std::vector<std::string>& sortedKeys);
    [[nodiscard]] ValidationError tooManyArguments(const std::string& validatorName, std::size_t received, std::size_t declared);
    [[nodiscard]] std::string extraPositionName(std::size_t index);
} // namespace vetter::codegen
