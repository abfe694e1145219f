#pragma once

#include "../spec/parameter_spec.hpp"
#include "../types/type_capability.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vetter
{
    enum class SourceMode
    {
        Named,
        Positional
    };

    enum class OutputMode
    {
        Mapped,
        OrderedList
    };

    enum class ExecutionStrategy
    {
        FastPath,
        GenericFallback
    };

    enum class FetchKind
    {
        ByKey,
        ByIndex
    };

    enum class DefaultHandling
    {
        None,
        Constant,
        Factory
    };

    struct ValidatorOptions
    {
        OutputMode outputMode{OutputMode::Mapped};
        SourceMode sourceMode{SourceMode::Named};
        bool strict{true};
        /// Reported in error messages; empty means anonymous.
        std::string name;
        /// When set, undeclared keys or surplus positional values are checked against it and kept.
        TypeCapabilityPtr extraValues;
        bool useCache{true};
    };

    struct PlanStep
    {
        const ParameterSpec* parameter{nullptr};
        FetchKind fetch{FetchKind::ByKey};
        std::string key;
        std::size_t index{0};
        bool required{true};
        DefaultHandling defaultHandling{DefaultHandling::None};
        const TypeCapability* type{nullptr};
        std::optional<InlineCheck> inlineCheck;
    };

    struct CompilationPlan
    {
        ParameterSpecSetPtr specSet;
        SourceMode sourceMode{SourceMode::Named};
        OutputMode outputMode{OutputMode::Mapped};
        bool strict{true};
        std::string validatorName;
        TypeCapabilityPtr extraValues;
        std::optional<InlineCheck> extraInlineCheck;
        ExecutionStrategy strategy{ExecutionStrategy::GenericFallback};
        std::vector<PlanStep> steps;
    };

    [[nodiscard]] std::string_view sourceModeName(SourceMode mode) noexcept;
    [[nodiscard]] std::string_view outputModeName(OutputMode mode) noexcept;
    [[nodiscard]] std::string_view strategyName(ExecutionStrategy strategy) noexcept;
} // namespace vetter
