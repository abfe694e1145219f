#pragma once

#include "../common/value.hpp"
#include "../planner/compilation_plan.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vetter
{
    /// Result of a successful validation in the validator's declared output shape.
    struct ValidatedValues
    {
        OutputMode shape{OutputMode::Mapped};
        /// Filled for mapped output. Absent optional parameters without a default have no entry.
        std::map<std::string, Value> mapped;
        /// Filled for ordered-list output, in declaration order; extra values follow.
        std::vector<Value> ordered;

        [[nodiscard]] bool contains(std::string_view name) const
        {
            return mapped.find(std::string{name}) != mapped.end();
        }

        [[nodiscard]] const Value* find(std::string_view name) const
        {
            const auto it = mapped.find(std::string{name});
            return it == mapped.end() ? nullptr : &it->second;
        }

        [[nodiscard]] std::size_t size() const noexcept
        {
            return shape == OutputMode::Mapped ? mapped.size() : ordered.size();
        }

        friend bool operator==(const ValidatedValues& left, const ValidatedValues& right)
        {
            return left.shape == right.shape && left.mapped == right.mapped && left.ordered == right.ordered;
        }

        friend bool operator!=(const ValidatedValues& left, const ValidatedValues& right)
        {
            return !(left == right);
        }
    };
} // namespace vetter
