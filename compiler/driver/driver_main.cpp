#include "../api/define_validator.hpp"
#include "../common/value.hpp"
#include "../planner/canonical.hpp"
#include "../planner/printer.hpp"
#include "../types/builtin_types.hpp"
#include "command_line.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef VETTER_BUILD_PROFILE
#define VETTER_BUILD_PROFILE "local"
#endif

namespace vetter
{
    void printHelp()
    {
        std::cout << "vetter-check - compile a parameter spec and validate one argument list\n"
                  << "Usage: vetter-check [options] <argument>...\n\n"
                  << "Options:\n"
                  << "  --help                    Show this help text and exit.\n"
                  << "  --version                 Show version information and exit.\n"
                  << "  --param=<name>:<type>[:optional][:default=<literal>]\n"
                  << "                            Declare a parameter (repeatable, declaration order matters).\n"
                  << "  --mode=<named|positional> Select how arguments are supplied. Default: named.\n"
                  << "  --output=<mapped|list>    Select the result shape. Default: mapped.\n"
                  << "  --no-strict               Ignore undeclared keys or surplus values.\n"
                  << "  --extra-type=<type>       Keep undeclared keys or surplus values of this type.\n"
                  << "  --name=<validator>        Name used in error messages.\n"
                  << "  --dump-plan               Print the compiled validation plan.\n"
                  << "  --show-descriptor-hash    Print the canonical plan hash.\n\n"
                  << "Arguments are key=<literal> in named mode and <literal> in positional mode.\n"
                  << "Literals: null, true, false, integers, floats, otherwise strings (\"...\" forces a string).\n"
                  << "Types:";
        for (const auto typeName : types::builtinTypeNames())
        {
            std::cout << ' ' << typeName;
        }
        std::cout << '\n';
    }

    void printVersion()
    {
        std::cout << "vetter-check (build profile: " << VETTER_BUILD_PROFILE << ")\n";
    }

    std::optional<std::vector<ParameterDeclaration>> buildDeclarations(const CommandLineOptions& options)
    {
        std::vector<ParameterDeclaration> declarations;
        declarations.reserve(options.parameters.size());

        for (const auto& parameter : options.parameters)
        {
            TypeCapabilityPtr type = types::builtinTypeByName(parameter.typeName);
            if (!type)
            {
                std::cerr << "VETTER-E4010 UnknownType: parameter '" << parameter.name << "' uses unknown type '"
                          << parameter.typeName << "'.\n";
                return std::nullopt;
            }

            ParameterDeclaration declaration;
            declaration.name = parameter.name;
            declaration.type = std::move(type);
            declaration.required = !parameter.optional;
            if (parameter.defaultLiteral.has_value())
            {
                declaration.defaultValue = DefaultValue::constant(parseLiteral(*parameter.defaultLiteral));
            }
            declarations.push_back(std::move(declaration));
        }

        return declarations;
    }

    std::optional<ValidatorOptions> buildValidatorOptions(const CommandLineOptions& options)
    {
        ValidatorOptions validatorOptions;
        validatorOptions.sourceMode = options.sourceMode == "positional" ? SourceMode::Positional : SourceMode::Named;
        validatorOptions.outputMode = options.outputMode == "list" ? OutputMode::OrderedList : OutputMode::Mapped;
        validatorOptions.strict = options.strict;
        validatorOptions.name = options.validatorName;

        if (options.extraType.has_value())
        {
            validatorOptions.extraValues = types::builtinTypeByName(*options.extraType);
            if (!validatorOptions.extraValues)
            {
                std::cerr << "VETTER-E4010 UnknownType: --extra-type uses unknown type '" << *options.extraType << "'.\n";
                return std::nullopt;
            }
        }

        return validatorOptions;
    }

    std::optional<NamedArguments> parseNamedArguments(const std::vector<std::string>& arguments)
    {
        NamedArguments named;
        for (const auto& argument : arguments)
        {
            const auto separator = argument.find('=');
            if (separator == std::string::npos || separator == 0)
            {
                std::cerr << "VETTER-E4011 MalformedArgument: '" << argument << "' must look like key=value in named mode.\n";
                return std::nullopt;
            }

            std::string key = argument.substr(0, separator);
            if (named.find(key) != named.end())
            {
                std::cerr << "VETTER-E4012 DuplicateArgument: key '" << key << "' was supplied more than once.\n";
                return std::nullopt;
            }
            named.emplace(std::move(key), parseLiteral(std::string_view{argument}.substr(separator + 1)));
        }
        return named;
    }

    void printValues(const ValidatedValues& values)
    {
        if (values.shape == OutputMode::Mapped)
        {
            for (const auto& entry : values.mapped)
            {
                std::cout << "  " << entry.first << " = " << entry.second.describe() << '\n';
            }
            return;
        }

        for (std::size_t index = 0; index < values.ordered.size(); ++index)
        {
            std::cout << "  [" << index << "] " << values.ordered[index].describe() << '\n';
        }
    }

    int run(const CommandLineOptions& options)
    {
        auto declarations = buildDeclarations(options);
        auto validatorOptions = buildValidatorOptions(options);
        if (!declarations.has_value() || !validatorOptions.has_value())
        {
            return 2;
        }

        std::cout << "[information] Compiling validator"
                  << (options.validatorName.empty() ? std::string{} : " '" + options.validatorName + "'") << ".\n";
        std::cout << "  parameters: " << declarations->size() << "\n";
        std::cout << "  source: " << sourceModeName(validatorOptions->sourceMode) << "\n";
        std::cout << "  output: " << outputModeName(validatorOptions->outputMode) << "\n";

        const CompileOutcome outcome = defineValidator(std::move(*declarations), *validatorOptions);
        if (!outcome.ok())
        {
            std::cerr << "VETTER-E4020 CompilationFailed: validator could not be compiled.\n";
            for (const auto& diagnostic : outcome.diagnostics)
            {
                std::cerr << diagnostic.render() << '\n';
            }
            return 1;
        }

        const CompiledValidator& validator = *outcome.validator;
        std::cout << "[notice] Compiled " << validator.plan().steps.size() << " parameter checks using "
                  << strategyName(validator.strategy()) << " strategy.\n";

        if (options.dumpPlan)
        {
            std::cout << "[debug] Plan dump:\n";
            print(validator.plan(), std::cout);
        }
        if (options.showDescriptorHash)
        {
            std::cout << "[debug] Plan canonical hash: 0x" << std::hex << canonicalHash(validator.plan()) << std::dec << '\n';
        }

        ValidationResult result;
        if (validator.sourceMode() == SourceMode::Named)
        {
            auto named = parseNamedArguments(options.arguments);
            if (!named.has_value())
            {
                return 2;
            }
            result = validator.validate(*named);
        }
        else
        {
            PositionalArguments positional;
            positional.reserve(options.arguments.size());
            for (const auto& argument : options.arguments)
            {
                positional.push_back(parseLiteral(argument));
            }
            result = validator.validate(positional);
        }

        if (!result.ok())
        {
            std::cerr << result.error->render() << '\n';
            return 1;
        }

        std::cout << "[notice] Validation succeeded (" << result.values->size() << " values).\n";
        printValues(*result.values);
        return 0;
    }
} // namespace vetter

int main(int argc, char** argv)
{
    vetter::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);
    if (!options.has_value())
    {
        return 2;
    }

    if (options->showHelp)
    {
        vetter::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        vetter::printVersion();
        return 0;
    }

    return vetter::run(*options);
}
