/**
 * @file MCPServer.cpp
 * @brief Implementation of the MCP server core
 */

#include "MCPServer.h"
#include "../exceptions.h"
#include "../scopeguard.h"
#include "PromptRegistry.h"
#include "RequestDispatcher.h"
#include "ResourceRegistry.h"
#include "ToolRegistry.h"

#include <algorithm>
#include <array>
#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    namespace
    {
        constexpr std::array SUPPORTED_PROTOCOL_VERSIONS{"2024-11-05", "2025-03-26"};

        std::string sessionKey(json const & id)
        {
            return id.dump();
        }
    }

    CancellationFlag Session::track(json const & id)
    {
        auto flag = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.emplace(sessionKey(id), flag);
        return flag;
    }

    void Session::release(json const & id, CancellationFlag const & flag)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto [first, last] = m_inFlight.equal_range(sessionKey(id));
        for (auto iter = first; iter != last; ++iter)
        {
            if (iter->second == flag)
            {
                m_inFlight.erase(iter);
                return;
            }
        }
    }

    bool Session::cancel(json const & id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto [first, last] = m_inFlight.equal_range(sessionKey(id));
        bool found = false;
        for (auto iter = first; iter != last; ++iter)
        {
            iter->second->store(true);
            found = true;
        }
        return found;
    }

    void Session::cancelAll()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto & [key, flag] : m_inFlight)
        {
            flag->store(true);
        }
    }

    size_t Session::inFlight() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inFlight.size();
    }

    MCPServer::MCPServer(RequestDispatcher & dispatcher, events::SharedLogger logger)
        : m_dispatcher(dispatcher)
        , m_logger(std::move(logger))
    {
    }

    std::optional<json> MCPServer::handleFrame(std::string const & text, Session & session)
    {
        json frame;
        try
        {
            frame = parseFrame(text);
        }
        catch (TransportDecodeError const & e)
        {
            if (m_logger)
            {
                m_logger->logWarning(fmt::format("Rejected frame: {}", e.what()));
            }
            return encodeError(EnvelopeStyle::JsonRpc,
                               nullptr,
                               makeFailure(ErrorCode::TransportDecodeError, e.what()));
        }
        return processMessage(frame, session);
    }

    std::optional<json> MCPServer::processMessage(json const & frame, Session & session)
    {
        Message message;
        try
        {
            message = decodeMessage(frame);
        }
        catch (TransportDecodeError const & e)
        {
            if (m_logger)
            {
                m_logger->logWarning(fmt::format("Rejected frame: {}", e.what()));
            }
            auto const style = frame.is_object() && frame.contains("tool") &&
                                   !frame.contains("method")
                                 ? EnvelopeStyle::Compact
                                 : EnvelopeStyle::JsonRpc;
            return encodeError(
              style, recoverId(frame), makeFailure(ErrorCode::TransportDecodeError, e.what()));
        }

        try
        {
            if (message.isNotification())
            {
                handleNotification(message, session);
                return std::nullopt;
            }

            if (!m_accepting)
            {
                return createErrorResponse(
                  message, ErrorCode::ServerStopping, "Server is shutting down");
            }

            if (message.method == "initialize")
            {
                return handleInitialize(message);
            }
            if (message.method == "ping")
            {
                return encodeResult(message, json::object());
            }
            if (message.method == "tools/list")
            {
                return handleListTools(message);
            }
            if (message.method == "tools/call")
            {
                return handleCallTool(message, session);
            }
            if (message.method == "prompts/list" && m_prompts)
            {
                return encodeResult(message, m_prompts->list());
            }
            if (message.method == "prompts/get" && m_prompts)
            {
                return handleGetPrompt(message);
            }
            if (message.method == "resources/list" && m_resources)
            {
                return encodeResult(message, m_resources->list());
            }
            if (message.method == "resources/read" && m_resources)
            {
                return handleReadResource(message, session);
            }
            return createErrorResponse(
              message, ErrorCode::MethodNotFound, "Method not found: " + message.method);
        }
        catch (std::exception const & e)
        {
            if (m_logger)
            {
                m_logger->logError(
                  fmt::format("Internal error handling '{}': {}", message.method, e.what()));
            }
            return createErrorResponse(
              message, ErrorCode::InternalError, "Internal error: " + std::string(e.what()));
        }
    }

    ToolResponse MCPServer::submit(ToolRequest request)
    {
        {
            std::lock_guard<std::mutex> lock(m_idleMutex);
            ++m_inFlight;
        }
        scope_guard const done(
          [this]()
          {
              {
                  std::lock_guard<std::mutex> lock(m_idleMutex);
                  --m_inFlight;
              }
              m_idleCondition.notify_all();
          });

        if (!m_accepting)
        {
            return {request.id, makeFailure(ErrorCode::ServerStopping, "Server is shutting down")};
        }
        return m_dispatcher.handle(request);
    }

    void MCPServer::stopAccepting()
    {
        m_accepting = false;
    }

    bool MCPServer::waitForIdle(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_idleMutex);
        return m_idleCondition.wait_for(lock, timeout, [this]() { return m_inFlight == 0; });
    }

    size_t MCPServer::inFlightCount() const
    {
        std::lock_guard<std::mutex> lock(m_idleMutex);
        return m_inFlight;
    }

    size_t MCPServer::toolCount() const
    {
        return m_dispatcher.registry().size();
    }

    json MCPServer::handleInitialize(Message const & message) const
    {
        std::string version = LATEST_PROTOCOL_VERSION;
        if (message.params.contains("protocolVersion") &&
            message.params["protocolVersion"].is_string())
        {
            auto const requested = message.params["protocolVersion"].get<std::string>();
            if (std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(),
                          SUPPORTED_PROTOCOL_VERSIONS.end(),
                          requested) != SUPPORTED_PROTOCOL_VERSIONS.end())
            {
                version = requested;
            }
        }

        if (m_logger)
        {
            m_logger->logInfo(fmt::format("Client initialized with protocol {}", version));
        }

        json capabilities = {{"tools", {{"listChanged", false}}}};
        if (m_prompts)
        {
            capabilities["prompts"] = {{"listChanged", false}};
        }
        if (m_resources)
        {
            capabilities["resources"] = {{"subscribe", false}, {"listChanged", false}};
        }

        return encodeResult(
          message,
          {{"protocolVersion", version},
           {"capabilities", capabilities},
           {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}}}});
    }

    json MCPServer::handleListTools(Message const & message) const
    {
        json tools = json::array();
        for (auto const & descriptor : m_dispatcher.registry().tools())
        {
            tools.push_back({{"name", descriptor.name},
                             {"description", descriptor.description},
                             {"inputSchema", ToolRegistry::inputSchema(descriptor)}});
        }
        return encodeResult(message, {{"tools", tools}});
    }

    std::optional<json> MCPServer::handleCallTool(Message const & message, Session & session)
    {
        if (!message.params.contains("name") || !message.params["name"].is_string())
        {
            return createErrorResponse(
              message, ErrorCode::InvalidArguments, "Invalid params - missing tool name");
        }

        ToolRequest request;
        request.toolName = message.params["name"].get<std::string>();
        request.arguments = message.params.value("arguments", json::object());

        auto const response = submitTracked(message, std::move(request), session);
        if (!response)
        {
            return std::nullopt;
        }
        return encodeToolResponse(message, *response);
    }

    std::optional<ToolResponse>
    MCPServer::submitTracked(Message const & message, ToolRequest request, Session & session)
    {
        request.id = message.id;
        request.cancelled = session.track(message.id);

        auto const flag = request.cancelled;
        scope_guard const untrack([&session, &message, &flag]()
                                  { session.release(message.id, flag); });

        auto response = submit(std::move(request));
        if (flag->load())
        {
            if (m_logger)
            {
                m_logger->logInfo(
                  fmt::format("Dropping response of cancelled request {}", message.id.dump()));
            }
            return std::nullopt;
        }
        return response;
    }

    json MCPServer::handleGetPrompt(Message const & message) const
    {
        if (!message.params.contains("name") || !message.params["name"].is_string())
        {
            return createErrorResponse(
              message, ErrorCode::InvalidArguments, "Invalid params - missing prompt name");
        }

        try
        {
            return encodeResult(message,
                                m_prompts->get(message.params["name"].get<std::string>(),
                                               message.params.value("arguments", json::object())));
        }
        catch (PromptNotFoundError const & e)
        {
            return createErrorResponse(message, ErrorCode::UnknownPrompt, e.what());
        }
        catch (ValidationError const & e)
        {
            return createErrorResponse(message, ErrorCode::InvalidArguments, e.what());
        }
    }

    std::optional<json> MCPServer::handleReadResource(Message const & message, Session & session)
    {
        if (!message.params.contains("uri") || !message.params["uri"].is_string())
        {
            return createErrorResponse(
              message, ErrorCode::InvalidArguments, "Invalid params - missing resource uri");
        }

        ResourceDescriptor const * descriptor = nullptr;
        try
        {
            descriptor = &m_resources->resolve(message.params["uri"].get<std::string>());
        }
        catch (ResourceNotFoundError const & e)
        {
            return createErrorResponse(message, ErrorCode::UnknownResource, e.what());
        }

        ToolRequest request;
        request.toolName = descriptor->tool;
        auto const response = submitTracked(message, std::move(request), session);
        if (!response)
        {
            return std::nullopt;
        }
        if (auto const * failure = std::get_if<ToolFailure>(&response->outcome))
        {
            return encodeError(message.style, message.id, *failure);
        }
        return encodeResult(
          message, resourceContents(*descriptor, std::get<ToolSuccess>(response->outcome).value));
    }

    void MCPServer::handleNotification(Message const & message, Session & session)
    {
        if (message.method == "notifications/cancelled")
        {
            if (message.params.contains("requestId"))
            {
                auto const & requestId = message.params["requestId"];
                bool const found = session.cancel(requestId);
                if (m_logger)
                {
                    m_logger->logInfo(fmt::format("Cancel request {}{}",
                                                  requestId.dump(),
                                                  found ? "" : " (not in flight)"));
                }
            }
            return;
        }

        if (message.method == "notifications/initialized")
        {
            if (m_logger)
            {
                m_logger->logInfo("Client finished initialization");
            }
            return;
        }

        if (m_logger)
        {
            m_logger->logWarning(fmt::format("Ignoring notification '{}'", message.method));
        }
    }

    json MCPServer::createErrorResponse(Message const & message,
                                        ErrorCode code,
                                        std::string text) const
    {
        return encodeError(message.style, message.id, makeFailure(code, std::move(text)));
    }
}
