#include "parameter_spec.hpp"

#include <atomic>
#include <utility>

namespace vetter
{
    namespace
    {
        std::uint64_t nextFactoryId()
        {
            static std::atomic<std::uint64_t> counter{0};
            return ++counter;
        }
    } // namespace

    DefaultValue DefaultValue::constant(Value value)
    {
        DefaultValue result;
        result.m_value = std::move(value);
        return result;
    }

    DefaultValue DefaultValue::fromFactory(Factory factory)
    {
        DefaultValue result;
        result.m_factory = std::make_shared<const Factory>(std::move(factory));
        result.m_factoryId = nextFactoryId();
        return result;
    }

    ParameterDeclaration requiredParameter(std::string name, TypeCapabilityPtr type)
    {
        ParameterDeclaration declaration;
        declaration.name = std::move(name);
        declaration.type = std::move(type);
        declaration.required = true;
        return declaration;
    }

    ParameterDeclaration optionalParameter(std::string name, TypeCapabilityPtr type)
    {
        ParameterDeclaration declaration;
        declaration.name = std::move(name);
        declaration.type = std::move(type);
        declaration.required = false;
        return declaration;
    }

    ParameterDeclaration defaultedParameter(std::string name, TypeCapabilityPtr type, Value defaultValue)
    {
        ParameterDeclaration declaration = optionalParameter(std::move(name), std::move(type));
        declaration.defaultValue = DefaultValue::constant(std::move(defaultValue));
        return declaration;
    }

    ParameterDeclaration defaultedParameter(std::string name, TypeCapabilityPtr type, DefaultValue::Factory factory)
    {
        ParameterDeclaration declaration = optionalParameter(std::move(name), std::move(type));
        declaration.defaultValue = DefaultValue::fromFactory(std::move(factory));
        return declaration;
    }

    ParameterSpecSet::ParameterSpecSet(BinderKey, std::vector<ParameterSpec> parameters)
        : m_parameters(std::move(parameters))
    {
        m_positionsByName.reserve(m_parameters.size());
        for (const auto& parameter : m_parameters)
        {
            m_positionsByName.emplace(parameter.name, parameter.position);
        }
    }

    const ParameterSpec* ParameterSpecSet::find(std::string_view name) const
    {
        const auto it = m_positionsByName.find(std::string{name});
        if (it == m_positionsByName.end())
        {
            return nullptr;
        }
        return &m_parameters[it->second];
    }
} // namespace vetter
