#pragma once

#include "../common/diagnostic.hpp"
#include "parameter_spec.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace vetter
{
    class SpecBinder
    {
    public:
        explicit SpecBinder(std::vector<ParameterDeclaration> declarations);

        /// Returns null when any declaration is invalid; see diagnostics().
        [[nodiscard]] ParameterSpecSetPtr bind();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        void emitError(const std::string& code, const std::string& message, const std::string& parameterName);
        void checkName(const ParameterDeclaration& declaration);
        void checkDefault(const ParameterDeclaration& declaration);
        ParameterSpec convertDeclaration(const ParameterDeclaration& declaration, std::size_t position) const;

    private:
        std::vector<ParameterDeclaration> m_declarations;
        std::vector<Diagnostic> m_diagnostics;
        std::unordered_set<std::string> m_seenNames;
    };
} // namespace vetter
