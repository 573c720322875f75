/**
 * @file ToolRegistry.cpp
 * @brief Implementation of the tool registry
 */

#include "ToolRegistry.h"
#include "../exceptions.h"

#include <cmath>
#include <limits>
#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    namespace
    {
        std::vector<double> numberList(ParameterSpec const & spec,
                                       json const & value,
                                       size_t minCount,
                                       size_t maxCount)
        {
            if (!value.is_array() || value.size() < minCount || value.size() > maxCount)
            {
                auto const expected = minCount == maxCount
                                        ? fmt::format("{}", minCount)
                                        : fmt::format("{} to {}", minCount, maxCount);
                throw ValidationError(fmt::format(
                  "parameter '{}' must be an array of {} numbers", spec.name, expected));
            }

            std::vector<double> numbers;
            numbers.reserve(value.size());
            for (auto const & component : value)
            {
                if (!component.is_number())
                {
                    throw ValidationError(
                      fmt::format("parameter '{}' must contain only numbers", spec.name));
                }
                numbers.push_back(component.get<double>());
            }
            return numbers;
        }

        ValidationError typeMismatch(ParameterSpec const & spec, json const & value)
        {
            return ValidationError(fmt::format("parameter '{}' must be of type {}, got {}",
                                               spec.name,
                                               toString(spec.type),
                                               value.type_name()));
        }
    }

    std::string toString(SemanticType type)
    {
        switch (type)
        {
        case SemanticType::String:
            return "string";
        case SemanticType::Number:
            return "number";
        case SemanticType::Integer:
            return "integer";
        case SemanticType::Boolean:
            return "boolean";
        case SemanticType::Vector3:
            return "vector3";
        case SemanticType::Color:
            return "color";
        case SemanticType::Object:
            return "object";
        case SemanticType::Array:
            return "array";
        }
        return "unknown";
    }

    json toJson(ArgumentValue const & value)
    {
        return std::visit(
          [](auto const & v) -> json
          {
              using T = std::decay_t<decltype(v)>;
              if constexpr (std::is_same_v<T, Vector3>)
              {
                  return json::array({v.x, v.y, v.z});
              }
              else if constexpr (std::is_same_v<T, Color>)
              {
                  return json::array({v.r, v.g, v.b, v.a});
              }
              else
              {
                  return json(v);
              }
          },
          value);
    }

    json toJson(ArgumentSet const & arguments)
    {
        json result = json::object();
        for (auto const & [name, value] : arguments)
        {
            result[name] = toJson(value);
        }
        return result;
    }

    ArgumentValue coerceArgument(ParameterSpec const & spec, json const & value)
    {
        switch (spec.type)
        {
        case SemanticType::String:
            if (!value.is_string())
            {
                throw typeMismatch(spec, value);
            }
            return value.get<std::string>();

        case SemanticType::Number:
            if (!value.is_number())
            {
                throw typeMismatch(spec, value);
            }
            return value.get<double>();

        case SemanticType::Integer:
            if (value.is_number_unsigned())
            {
                if (value.get<uint64_t>() >
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                {
                    throw typeMismatch(spec, value);
                }
                return static_cast<int64_t>(value.get<uint64_t>());
            }
            if (value.is_number_integer())
            {
                return value.get<int64_t>();
            }
            if (value.is_number_float())
            {
                // 2^63 is exactly representable, every double below it fits int64_t
                constexpr double upperBound = 9223372036854775808.0;
                auto const number = value.get<double>();
                if (std::isfinite(number) && std::trunc(number) == number &&
                    number >= -upperBound && number < upperBound)
                {
                    return static_cast<int64_t>(number);
                }
            }
            throw typeMismatch(spec, value);

        case SemanticType::Boolean:
            if (!value.is_boolean())
            {
                throw typeMismatch(spec, value);
            }
            return value.get<bool>();

        case SemanticType::Vector3:
        {
            auto const components = numberList(spec, value, 3, 3);
            return Vector3{components[0], components[1], components[2]};
        }

        case SemanticType::Color:
        {
            auto const components = numberList(spec, value, 3, 4);
            for (auto const component : components)
            {
                if (component < 0. || component > 1.)
                {
                    throw ValidationError(fmt::format(
                      "parameter '{}' color components must be within [0, 1]", spec.name));
                }
            }
            return Color{components[0],
                         components[1],
                         components[2],
                         components.size() == 4 ? components[3] : 1.};
        }

        case SemanticType::Object:
            if (!value.is_object())
            {
                throw typeMismatch(spec, value);
            }
            return ArgumentValue{std::in_place_type<json>, value};

        case SemanticType::Array:
            if (!value.is_array())
            {
                throw typeMismatch(spec, value);
            }
            return ArgumentValue{std::in_place_type<json>, value};
        }
        throw typeMismatch(spec, value);
    }

    ToolRegistry::ToolRegistry(events::SharedLogger logger)
        : m_logger(std::move(logger))
    {
    }

    void ToolRegistry::registerTool(ToolDescriptor descriptor)
    {
        if (m_sealed)
        {
            throw ScenemcpException(
              fmt::format("Cannot register tool '{}' after startup", descriptor.name));
        }
        if (m_index.contains(descriptor.name))
        {
            throw DuplicateToolError(descriptor.name);
        }
        if (descriptor.handler.empty())
        {
            descriptor.handler = descriptor.name;
        }

        m_index[descriptor.name] = m_tools.size();
        m_tools.push_back(std::move(descriptor));
    }

    ToolDescriptor const & ToolRegistry::resolve(std::string const & name) const
    {
        auto const iter = m_index.find(name);
        if (iter == m_index.end())
        {
            throw ToolNotFoundError(name);
        }
        return m_tools[iter->second];
    }

    bool ToolRegistry::contains(std::string const & name) const
    {
        return m_index.contains(name);
    }

    ArgumentSet ToolRegistry::validate(ToolDescriptor const & descriptor,
                                       json const & arguments) const
    {
        if (!arguments.is_null() && !arguments.is_object())
        {
            throw ValidationError(
              fmt::format("arguments of '{}' must be an object, got {}",
                          descriptor.name,
                          arguments.type_name()));
        }

        ArgumentSet normalized;
        for (auto const & spec : descriptor.parameters)
        {
            bool const present = arguments.is_object() && arguments.contains(spec.name) &&
                                 !arguments.at(spec.name).is_null();
            if (present)
            {
                normalized.emplace(spec.name, coerceArgument(spec, arguments.at(spec.name)));
            }
            else if (spec.required)
            {
                throw ValidationError(fmt::format(
                  "missing required parameter '{}' for tool '{}'", spec.name, descriptor.name));
            }
            else if (spec.defaultValue)
            {
                normalized.emplace(spec.name, coerceArgument(spec, *spec.defaultValue));
            }
        }

        if (arguments.is_object())
        {
            for (auto const & [name, value] : arguments.items())
            {
                if (!normalized.contains(name) && m_logger)
                {
                    m_logger->logWarning(fmt::format(
                      "Ignoring unknown argument '{}' for tool '{}'", name, descriptor.name));
                }
            }
        }

        return normalized;
    }

    json ToolRegistry::inputSchema(ToolDescriptor const & descriptor)
    {
        json properties = json::object();
        json required = json::array();

        for (auto const & spec : descriptor.parameters)
        {
            json property;
            switch (spec.type)
            {
            case SemanticType::Vector3:
                property = {{"type", "array"},
                            {"items", {{"type", "number"}}},
                            {"minItems", 3},
                            {"maxItems", 3}};
                break;
            case SemanticType::Color:
                property = {{"type", "array"},
                            {"items", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}}},
                            {"minItems", 3},
                            {"maxItems", 4}};
                break;
            default:
                property = {{"type", toString(spec.type)}};
                break;
            }

            if (!spec.description.empty())
            {
                property["description"] = spec.description;
            }
            if (spec.defaultValue)
            {
                property["default"] = *spec.defaultValue;
            }
            if (spec.required)
            {
                required.push_back(spec.name);
            }
            properties[spec.name] = std::move(property);
        }

        json schema = {{"type", "object"}, {"properties", properties}};
        if (!required.empty())
        {
            schema["required"] = required;
        }
        return schema;
    }
}
