/**
 * @file PromptRegistry.h
 * @brief Prompt templates served by prompts/list and prompts/get
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace scenemcp::mcp
{
    struct PromptArgument
    {
        std::string name;
        std::string description;
        bool required{false};
        std::string defaultValue;
    };

    /**
     * @brief A named user message template
     *
     * Occurrences of {{argument}} in the text are replaced by the argument value when the
     * prompt is requested, or by the default value of an absent optional argument.
     */
    struct PromptDescriptor
    {
        std::string name;
        std::string description;
        std::vector<PromptArgument> arguments;
        std::string text;
    };

    class PromptRegistry
    {
      public:
        /// @throws ScenemcpException if a prompt with the same name exists
        void registerPrompt(PromptDescriptor descriptor);

        /// Result of prompts/list
        [[nodiscard]] nlohmann::json list() const;

        /**
         * @brief Result of prompts/get
         * @throws PromptNotFoundError if no prompt with this name is registered
         * @throws ValidationError if a required argument is missing or not a string
         */
        [[nodiscard]] nlohmann::json get(std::string const & name,
                                         nlohmann::json const & arguments) const;

        [[nodiscard]] size_t size() const
        {
            return m_prompts.size();
        }

      private:
        std::vector<PromptDescriptor> m_prompts;
        std::unordered_map<std::string, size_t> m_index;
    };
}
