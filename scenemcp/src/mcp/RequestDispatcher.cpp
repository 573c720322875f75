#include "RequestDispatcher.h"
#include "../exceptions.h"
#include "ToolExecutor.h"
#include "ToolRegistry.h"

#include <fmt/format.h>

namespace scenemcp::mcp
{
    RequestDispatcher::RequestDispatcher(ToolRegistry const & registry,
                                         ToolExecutor & executor,
                                         std::chrono::milliseconds timeout,
                                         events::SharedLogger logger)
        : m_registry(registry)
        , m_executor(executor)
        , m_timeout(timeout)
        , m_logger(std::move(logger))
    {
    }

    ToolResponse RequestDispatcher::handle(ToolRequest const & request)
    {
        ToolResponse response{request.id, ToolSuccess{}};

        ToolDescriptor const * descriptor = nullptr;
        try
        {
            descriptor = &m_registry.resolve(request.toolName);
        }
        catch (ToolNotFoundError const & e)
        {
            response.outcome = makeFailure(ErrorCode::UnknownTool, e.what());
            return response;
        }

        ToolCall call{request.id,
                      descriptor->handler,
                      {},
                      request.acceptedAt + m_timeout,
                      request.cancelled};
        try
        {
            call.arguments = m_registry.validate(*descriptor, request.arguments);
        }
        catch (ValidationError const & e)
        {
            response.outcome = makeFailure(ErrorCode::InvalidArguments, e.what());
            return response;
        }

        ++m_forwarded;
        try
        {
            response.outcome = m_executor.invoke(call);
        }
        catch (std::exception const & e)
        {
            if (m_logger)
            {
                m_logger->logError(
                  fmt::format("Tool '{}' failed unexpectedly: {}", request.toolName, e.what()));
            }
            response.outcome = makeFailure(ErrorCode::InternalError, e.what());
        }

        if (m_logger)
        {
            if (auto const * failure = std::get_if<ToolFailure>(&response.outcome))
            {
                m_logger->logWarning(fmt::format(
                  "Tool '{}' failed: {} ({})", request.toolName, failure->message, failure->code));
            }
            else
            {
                m_logger->logInfo(fmt::format("Tool '{}' completed", request.toolName));
            }
        }
        return response;
    }
}
