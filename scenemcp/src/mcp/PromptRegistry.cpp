#include "PromptRegistry.h"
#include "../exceptions.h"

#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    namespace
    {
        void replaceAll(std::string & text, std::string const & from, std::string const & to)
        {
            size_t position = 0;
            while ((position = text.find(from, position)) != std::string::npos)
            {
                text.replace(position, from.size(), to);
                position += to.size();
            }
        }

        json describeArguments(PromptDescriptor const & descriptor)
        {
            json arguments = json::array();
            for (auto const & argument : descriptor.arguments)
            {
                arguments.push_back({{"name", argument.name},
                                     {"description", argument.description},
                                     {"required", argument.required}});
            }
            return arguments;
        }
    }

    void PromptRegistry::registerPrompt(PromptDescriptor descriptor)
    {
        if (m_index.contains(descriptor.name))
        {
            throw ScenemcpException(
              fmt::format("Prompt '{}' is already registered", descriptor.name));
        }
        m_index[descriptor.name] = m_prompts.size();
        m_prompts.push_back(std::move(descriptor));
    }

    json PromptRegistry::list() const
    {
        json prompts = json::array();
        for (auto const & descriptor : m_prompts)
        {
            prompts.push_back({{"name", descriptor.name},
                               {"description", descriptor.description},
                               {"arguments", describeArguments(descriptor)}});
        }
        return {{"prompts", prompts}};
    }

    json PromptRegistry::get(std::string const & name, json const & arguments) const
    {
        auto const iter = m_index.find(name);
        if (iter == m_index.end())
        {
            throw PromptNotFoundError(name);
        }
        auto const & descriptor = m_prompts[iter->second];

        std::string text = descriptor.text;
        for (auto const & argument : descriptor.arguments)
        {
            bool const present = arguments.is_object() && arguments.contains(argument.name) &&
                                 !arguments.at(argument.name).is_null();
            if (!present)
            {
                if (argument.required)
                {
                    throw ValidationError(fmt::format(
                      "missing required argument '{}' for prompt '{}'", argument.name, name));
                }
                replaceAll(text, "{{" + argument.name + "}}", argument.defaultValue);
                continue;
            }

            // MCP prompt arguments are strings
            auto const & value = arguments.at(argument.name);
            if (!value.is_string())
            {
                throw ValidationError(
                  fmt::format("prompt argument '{}' must be a string", argument.name));
            }
            replaceAll(text, "{{" + argument.name + "}}", value.get<std::string>());
        }

        return {{"description", descriptor.description},
                {"messages",
                 json::array({{{"role", "user"},
                               {"content", {{"type", "text"}, {"text", text}}}}})}};
    }
}
