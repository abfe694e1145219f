#pragma once

#include "type_capability.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace vetter::types
{
    [[nodiscard]] TypeCapabilityPtr anyType();
    [[nodiscard]] TypeCapabilityPtr definedType();
    [[nodiscard]] TypeCapabilityPtr booleanType();
    [[nodiscard]] TypeCapabilityPtr integerType();
    [[nodiscard]] TypeCapabilityPtr positiveIntegerType();
    [[nodiscard]] TypeCapabilityPtr numberType();
    [[nodiscard]] TypeCapabilityPtr stringType();
    [[nodiscard]] TypeCapabilityPtr nonEmptyStringType();

    /// String restricted to a fixed set of choices. Supports inline emission.
    [[nodiscard]] TypeCapabilityPtr makeEnumType(std::string name, std::vector<std::string> choices);

    /// Wraps an arbitrary callable. Has no inline form, so validators using it take the generic path.
    [[nodiscard]] TypeCapabilityPtr makePredicateType(std::string name,
                                                      std::function<bool(const Value&)> predicate,
                                                      std::string expectation);

    /// Resolves the dashed names used on the command line ("positive-integer", ...). Null when unknown.
    [[nodiscard]] TypeCapabilityPtr builtinTypeByName(std::string_view name);

    [[nodiscard]] std::vector<std::string_view> builtinTypeNames();
} // namespace vetter::types
