#pragma once

#include <string>

namespace vetter
{
    /// A compile-time problem found while binding, planning or building a validator.
    struct Diagnostic
    {
        std::string code;
        std::string message;
        std::string parameterName;

        [[nodiscard]] std::string render() const
        {
            return code + ' ' + message;
        }
    };
} // namespace vetter
