#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vetter
{
    struct ParameterOption
    {
        std::string name;
        std::string typeName;
        bool optional{false};
        std::optional<std::string> defaultLiteral;
    };

    struct CommandLineOptions
    {
        std::vector<ParameterOption> parameters;
        std::vector<std::string> arguments;
        std::string sourceMode{"named"};
        std::string outputMode{"mapped"};
        std::string validatorName;
        std::optional<std::string> extraType;
        bool strict{true};
        bool dumpPlan{false};
        bool showDescriptorHash{false};
        bool showHelp{false};
        bool showVersion{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument.rfind("--param=", 0) == 0)
                {
                    constexpr std::string_view paramOpt = "--param=";
                    auto parameter = parseParameter(argument.substr(paramOpt.size()));
                    if (!parameter.has_value())
                    {
                        return std::nullopt;
                    }
                    options.parameters.push_back(std::move(*parameter));
                    continue;
                }

                if (argument == "--param")
                {
                    if (index + 1 >= argc)
                    {
                        std::cerr << "VETTER-E4000 MissingParameterDeclaration: expected declaration after --param option.\n";
                        return std::nullopt;
                    }
                    auto parameter = parseParameter(argv[++index]);
                    if (!parameter.has_value())
                    {
                        return std::nullopt;
                    }
                    options.parameters.push_back(std::move(*parameter));
                    continue;
                }

                if (argument.rfind("--mode=", 0) == 0)
                {
                    options.sourceMode = std::string{argument.substr(7)};
                    if (options.sourceMode != "named" && options.sourceMode != "positional")
                    {
                        std::cerr << "VETTER-E4002 UnknownSourceMode: '" << options.sourceMode
                                  << "' is not one of named, positional.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--output=", 0) == 0)
                {
                    options.outputMode = std::string{argument.substr(9)};
                    if (options.outputMode != "mapped" && options.outputMode != "list")
                    {
                        std::cerr << "VETTER-E4003 UnknownOutputMode: '" << options.outputMode
                                  << "' is not one of mapped, list.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--extra-type=", 0) == 0)
                {
                    options.extraType = std::string{argument.substr(13)};
                    continue;
                }

                if (argument.rfind("--name=", 0) == 0)
                {
                    options.validatorName = std::string{argument.substr(7)};
                    continue;
                }

                if (argument == "--no-strict")
                {
                    options.strict = false;
                    continue;
                }

                if (argument == "--strict")
                {
                    options.strict = true;
                    continue;
                }

                if (argument == "--dump-plan")
                {
                    options.dumpPlan = true;
                    continue;
                }

                if (argument == "--show-descriptor-hash")
                {
                    options.showDescriptorHash = true;
                    continue;
                }

                if (argument == "--")
                {
                    for (++index; index < argc; ++index)
                    {
                        options.arguments.emplace_back(argv[index]);
                    }
                    break;
                }

                if (argument.rfind("--", 0) == 0)
                {
                    std::cerr << "VETTER-E4001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.arguments.emplace_back(argument);
            }

            return options;
        }

    private:
        /// name:type[:optional][:default=<literal>]; the default literal extends to the end.
        static std::optional<ParameterOption> parseParameter(std::string_view text)
        {
            ParameterOption parameter;
            bool explicitlyRequired = false;

            const auto nameEnd = text.find(':');
            if (nameEnd == std::string_view::npos || nameEnd == 0)
            {
                std::cerr << "VETTER-E4004 MalformedParameter: '" << text << "' must look like name:type[:optional][:default=value].\n";
                return std::nullopt;
            }
            parameter.name = std::string{text.substr(0, nameEnd)};

            std::string_view rest = text.substr(nameEnd + 1);
            const auto typeEnd = rest.find(':');
            parameter.typeName = std::string{rest.substr(0, typeEnd)};
            if (parameter.typeName.empty())
            {
                std::cerr << "VETTER-E4004 MalformedParameter: '" << text << "' is missing a type name.\n";
                return std::nullopt;
            }

            rest = typeEnd == std::string_view::npos ? std::string_view{} : rest.substr(typeEnd + 1);
            while (!rest.empty())
            {
                constexpr std::string_view defaultPrefix = "default=";
                if (rest.rfind(defaultPrefix, 0) == 0)
                {
                    parameter.defaultLiteral = std::string{rest.substr(defaultPrefix.size())};
                    parameter.optional = !explicitlyRequired;
                    break;
                }

                const auto flagEnd = rest.find(':');
                const std::string_view flag = rest.substr(0, flagEnd);
                if (flag == "optional")
                {
                    parameter.optional = true;
                }
                else if (flag == "required")
                {
                    explicitlyRequired = true;
                    parameter.optional = false;
                }
                else
                {
                    std::cerr << "VETTER-E4004 MalformedParameter: unknown flag '" << flag << "' in '" << text << "'.\n";
                    return std::nullopt;
                }
                rest = flagEnd == std::string_view::npos ? std::string_view{} : rest.substr(flagEnd + 1);
            }

            return parameter;
        }
    };
} // namespace vetter
