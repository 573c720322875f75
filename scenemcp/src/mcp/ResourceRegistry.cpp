#include "ResourceRegistry.h"
#include "../exceptions.h"

#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    void ResourceRegistry::registerResource(ResourceDescriptor descriptor)
    {
        if (m_index.contains(descriptor.uri))
        {
            throw ScenemcpException(
              fmt::format("Resource '{}' is already registered", descriptor.uri));
        }
        m_index[descriptor.uri] = m_resources.size();
        m_resources.push_back(std::move(descriptor));
    }

    ResourceDescriptor const & ResourceRegistry::resolve(std::string const & uri) const
    {
        auto const iter = m_index.find(uri);
        if (iter == m_index.end())
        {
            throw ResourceNotFoundError(uri);
        }
        return m_resources[iter->second];
    }

    json ResourceRegistry::list() const
    {
        json resources = json::array();
        for (auto const & descriptor : m_resources)
        {
            resources.push_back({{"uri", descriptor.uri},
                                 {"name", descriptor.name},
                                 {"description", descriptor.description},
                                 {"mimeType", descriptor.mimeType}});
        }
        return {{"resources", resources}};
    }

    json resourceContents(ResourceDescriptor const & descriptor, json const & value)
    {
        return {{"contents",
                 json::array({{{"uri", descriptor.uri},
                               {"mimeType", descriptor.mimeType},
                               {"text", value.is_string() ? value.get<std::string>()
                                                          : value.dump()}}})}};
    }
}
