#include "exceptions.h"
#include <fmt/format.h>

namespace scenemcp
{
    ScenemcpException::ScenemcpException(std::string msg)
        : std::runtime_error(msg)
    {
    }

    DuplicateToolError::DuplicateToolError(std::string const & toolName)
        : ScenemcpException(fmt::format("Tool '{}' is already registered", toolName))
    {
    }

    ToolNotFoundError::ToolNotFoundError(std::string const & toolName)
        : ScenemcpException(fmt::format("Unknown tool: {}", toolName))
    {
    }

    PromptNotFoundError::PromptNotFoundError(std::string const & promptName)
        : ScenemcpException(fmt::format("Prompt not found: {}", promptName))
    {
    }

    ResourceNotFoundError::ResourceNotFoundError(std::string const & uri)
        : ScenemcpException(fmt::format("Resource not found: {}", uri))
    {
    }
}
