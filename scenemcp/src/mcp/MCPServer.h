/**
 * @file MCPServer.h
 * @brief Model Context Protocol request handling shared by all transports
 */

#pragma once

#include "../EventLogger.h"
#include "Protocol.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace scenemcp::mcp
{
    class PromptRegistry;
    class RequestDispatcher;
    class ResourceRegistry;

    /**
     * @brief In-flight requests of one transport channel
     *
     * A stdio session lives as long as the input stream, an HTTP session as long as a
     * single request. Closing a session cancels everything still tracked by it.
     */
    class Session
    {
      public:
        CancellationFlag track(nlohmann::json const & id);

        void release(nlohmann::json const & id, CancellationFlag const & flag);

        /// @return true if a request with this id was in flight
        bool cancel(nlohmann::json const & id);

        void cancelAll();

        [[nodiscard]] size_t inFlight() const;

      private:
        mutable std::mutex m_mutex;
        std::unordered_multimap<std::string, CancellationFlag> m_inFlight;
    };

    /**
     * @brief MCP server core implementing initialize, ping, tools, prompts and resources
     *
     * Transports hand raw frames to handleFrame() and write back whatever it returns.
     * Tool calls and resource reads go through submit(), the single entry point into the
     * dispatcher. The prompts and resources capabilities are advertised only when their
     * registry has been attached before the first request.
     */
    class MCPServer
    {
      public:
        explicit MCPServer(RequestDispatcher & dispatcher, events::SharedLogger logger = {});

        void setPrompts(PromptRegistry const & prompts)
        {
            m_prompts = &prompts;
        }

        void setResources(ResourceRegistry const & resources)
        {
            m_resources = &resources;
        }

        /**
         * @brief Decode and process one frame
         * @return The response frame, or nothing for notifications and cancelled requests
         */
        std::optional<nlohmann::json> handleFrame(std::string const & text, Session & session);

        /// Process an already parsed frame
        std::optional<nlohmann::json> processMessage(nlohmann::json const & frame,
                                                     Session & session);

        /// Dispatch a tool request, rejecting it once the server stopped accepting
        ToolResponse submit(ToolRequest request);

        /// Reject all further requests with ServerStopping
        void stopAccepting();

        [[nodiscard]] bool isAccepting() const
        {
            return m_accepting;
        }

        /// @return true if no tool call is in flight before the timeout expired
        bool waitForIdle(std::chrono::milliseconds timeout);

        [[nodiscard]] size_t inFlightCount() const;

        [[nodiscard]] size_t toolCount() const;

      private:
        nlohmann::json handleInitialize(Message const & message) const;
        nlohmann::json handleListTools(Message const & message) const;
        std::optional<nlohmann::json> handleCallTool(Message const & message, Session & session);
        nlohmann::json handleGetPrompt(Message const & message) const;
        std::optional<nlohmann::json> handleReadResource(Message const & message,
                                                         Session & session);
        /// Submit under the session's cancellation tracking, nothing if the request was cancelled
        std::optional<ToolResponse>
        submitTracked(Message const & message, ToolRequest request, Session & session);
        void handleNotification(Message const & message, Session & session);

        nlohmann::json
        createErrorResponse(Message const & message, ErrorCode code, std::string text) const;

        RequestDispatcher & m_dispatcher;
        events::SharedLogger m_logger;
        PromptRegistry const * m_prompts{nullptr};
        ResourceRegistry const * m_resources{nullptr};
        std::atomic<bool> m_accepting{true};

        mutable std::mutex m_idleMutex;
        std::condition_variable m_idleCondition;
        size_t m_inFlight{0};
    };
}
