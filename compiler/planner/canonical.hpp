#pragma once

#include "compilation_plan.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace vetter
{
    /// Cache key: identifies capability and factory instances, so it is only meaningful within one process.
    std::string canonicalDescriptor(const ParameterSpecSet& specSet, const ValidatorOptions& options);

    /// Stable text of a plan, independent of object addresses.
    std::string canonicalPrint(const CompilationPlan& plan);
    std::uint64_t canonicalHash(const CompilationPlan& plan);

    std::uint64_t fnv1aHash(std::string_view text);
}
