/**
 * @file ResourceRegistry.h
 * @brief Read-only resources served by resources/list and resources/read
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace scenemcp::mcp
{
    /**
     * @brief A resource whose content is the result of a tool call without arguments
     *
     * Reading the resource goes through the dispatcher like any other tool call, so it
     * shares the worker queue and timeout.
     */
    struct ResourceDescriptor
    {
        std::string uri;
        std::string name;
        std::string description;
        std::string mimeType{"text/plain"};
        std::string tool;
    };

    class ResourceRegistry
    {
      public:
        /// @throws ScenemcpException if a resource with the same uri exists
        void registerResource(ResourceDescriptor descriptor);

        /// @throws ResourceNotFoundError if no resource with this uri is registered
        [[nodiscard]] ResourceDescriptor const & resolve(std::string const & uri) const;

        /// Result of resources/list
        [[nodiscard]] nlohmann::json list() const;

        [[nodiscard]] size_t size() const
        {
            return m_resources.size();
        }

      private:
        std::vector<ResourceDescriptor> m_resources;
        std::unordered_map<std::string, size_t> m_index;
    };

    /// Result of resources/read for a tool result
    nlohmann::json resourceContents(ResourceDescriptor const & descriptor,
                                    nlohmann::json const & value);
}
