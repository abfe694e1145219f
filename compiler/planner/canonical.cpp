#include "canonical.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace vetter
{
    namespace
    {
        std::string describeCapability(const TypeCapability* type, bool withIdentity)
        {
            if (type == nullptr)
            {
                return "<none>";
            }

            std::ostringstream stream;
            stream << type->name();
            if (withIdentity)
            {
                stream << '@' << static_cast<const void*>(type);
            }
            return stream.str();
        }

        std::string describeDefault(const std::optional<DefaultValue>& defaultValue, bool withIdentity)
        {
            if (!defaultValue.has_value())
            {
                return "none";
            }
            if (defaultValue->isFactory())
            {
                return withIdentity ? "factory#" + std::to_string(defaultValue->factoryId()) : std::string{"factory"};
            }
            const Value& value = defaultValue->constantValue();
            if (value.isFloat())
            {
                std::ostringstream stream;
                stream << "const float " << std::setprecision(std::numeric_limits<double>::max_digits10) << value.asFloat();
                return stream.str();
            }
            const std::string text = value.describe();
            return "const " + std::string{valueKindName(value.kind())} + ' ' + std::to_string(text.size()) + ':' + text;
        }

        std::string describeParameter(const ParameterSpec& parameter, bool withIdentity)
        {
            std::ostringstream stream;
            stream << parameter.position << ' ' << parameter.name.size() << ':' << parameter.name;
            stream << " type " << describeCapability(parameter.type.get(), withIdentity);
            stream << (parameter.required ? " required" : " optional");
            stream << " default " << describeDefault(parameter.defaultValue, withIdentity);
            return stream.str();
        }
    } // namespace

    std::string canonicalDescriptor(const ParameterSpecSet& specSet, const ValidatorOptions& options)
    {
        std::ostringstream stream;
        stream << "source " << sourceModeName(options.sourceMode) << '\n';
        stream << "output " << outputModeName(options.outputMode) << '\n';
        stream << "strict " << (options.strict ? 1 : 0) << '\n';
        stream << "name " << options.name.size() << ':' << options.name << '\n';
        stream << "extra " << describeCapability(options.extraValues.get(), true) << '\n';
        for (const auto& parameter : specSet)
        {
            stream << "param " << describeParameter(parameter, true) << '\n';
        }
        return stream.str();
    }

    std::string canonicalPrint(const CompilationPlan& plan)
    {
        std::ostringstream stream;
        stream << "validator " << plan.validatorName << '\n';
        stream << "source " << sourceModeName(plan.sourceMode) << '\n';
        stream << "output " << outputModeName(plan.outputMode) << '\n';
        stream << "strict " << (plan.strict ? 1 : 0) << '\n';
        stream << "strategy " << strategyName(plan.strategy) << '\n';
        stream << "extra " << describeCapability(plan.extraValues.get(), false) << '\n';

        for (const auto& step : plan.steps)
        {
            if (step.parameter == nullptr)
            {
                stream << "step <unbound>\n";
                continue;
            }
            stream << "step " << describeParameter(*step.parameter, false);
            stream << (step.fetch == FetchKind::ByKey ? " key " + step.key : " index " + std::to_string(step.index));
            stream << (step.inlineCheck.has_value() ? " inline" : " generic") << '\n';
        }

        return stream.str();
    }

    std::uint64_t canonicalHash(const CompilationPlan& plan)
    {
        return fnv1aHash(canonicalPrint(plan));
    }

    std::uint64_t fnv1aHash(std::string_view text)
    {
        constexpr std::uint64_t offset = 1469598103934665603ull;
        constexpr std::uint64_t prime = 1099511628211ull;

        std::uint64_t hash = offset;
        for (unsigned char c : text)
        {
            hash ^= static_cast<std::uint64_t>(c);
            hash *= prime;
        }
        return hash;
    }
} // namespace vetter
