#include "define_validator.hpp"

#include "../cache/validator_cache.hpp"
#include "../spec/spec_binder.hpp"

#include <utility>

namespace vetter
{
    CompileOutcome defineValidator(std::vector<ParameterDeclaration> declarations, const ValidatorOptions& options)
    {
        SpecBinder binder{std::move(declarations)};
        ParameterSpecSetPtr specSet = binder.bind();
        if (!specSet)
        {
            CompileOutcome outcome;
            outcome.diagnostics = binder.diagnostics();
            return outcome;
        }

        return defineValidator(specSet, options);
    }

    CompileOutcome defineValidator(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options)
    {
        if (!options.useCache)
        {
            return compileValidator(specSet, options);
        }
        return getOrCompile(specSet, options);
    }
} // namespace vetter
