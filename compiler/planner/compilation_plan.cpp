#include "compilation_plan.hpp"

namespace vetter
{
    std::string_view sourceModeName(SourceMode mode) noexcept
    {
        switch (mode)
        {
        case SourceMode::Named:
            return "named";
        case SourceMode::Positional:
            return "positional";
        }
        return "unknown";
    }

    std::string_view outputModeName(OutputMode mode) noexcept
    {
        switch (mode)
        {
        case OutputMode::Mapped:
            return "mapped";
        case OutputMode::OrderedList:
            return "ordered-list";
        }
        return "unknown";
    }

    std::string_view strategyName(ExecutionStrategy strategy) noexcept
    {
        switch (strategy)
        {
        case ExecutionStrategy::FastPath:
            return "fast-path";
        case ExecutionStrategy::GenericFallback:
            return "generic-fallback";
        }
        return "unknown";
    }
} // namespace vetter
