#pragma once

#include "EventLogger.h"
#include "ServerConfig.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <unistd.h>

namespace scenemcp
{
    namespace mcp
    {
        class ToolRegistry;
        class PromptRegistry;
        class ResourceRegistry;
        class RequestDispatcher;
        class MCPServer;
        class StdioTransport;
        class HttpTransport;
    }

    namespace worker
    {
        class WorkerBridge;
        struct WorkerBridgeOptions;
    }

    enum class LifecycleState
    {
        Starting,
        Running,
        Stopping,
        Stopped
    };

    std::string toString(LifecycleState state);

    /// Bridge settings derived from the server configuration
    worker::WorkerBridgeOptions bridgeOptions(ServerConfig const & config);

    /**
     * @brief Owns the server components and drives the Starting -> Running -> Stopping ->
     * Stopped lifecycle
     *
     * The worker process is not started by start(); the bridge launches it on the first
     * tool call. stop() may be called any number of times.
     */
    class Supervisor
    {
      public:
        /**
         * @param stdioOutput Stream receiving protocol frames in stdio mode
         * @param stdioInputFd Descriptor the stdio transport reads requests from
         */
        Supervisor(ServerConfig config,
                   events::SharedLogger logger,
                   std::ostream & stdioOutput,
                   int stdioInputFd = STDIN_FILENO);

        ~Supervisor();

        Supervisor(Supervisor const &) = delete;
        Supervisor & operator=(Supervisor const &) = delete;

        /**
         * @brief Build the components and start the configured transport
         * @throws ScenemcpException if the transport cannot be started
         */
        void start();

        /// Graceful, bounded shutdown; a no-op once stopped
        void stop();

        /// Ask the owner to stop, e.g. when stdin closed; safe from any thread
        void requestStop();

        /// @return true once a stop was requested or the server stopped
        bool waitForShutdown(std::chrono::milliseconds timeout);

        [[nodiscard]] LifecycleState state() const;

        /// Body of the health endpoint
        [[nodiscard]] nlohmann::json health() const;

        /// Bound HTTP port, 0 in stdio mode
        [[nodiscard]] int httpPort() const;

        [[nodiscard]] ServerConfig const & config() const
        {
            return m_config;
        }

        [[nodiscard]] mcp::MCPServer * server()
        {
            return m_server.get();
        }

        [[nodiscard]] worker::WorkerBridge * bridge()
        {
            return m_bridge.get();
        }

      private:
        void setState(LifecycleState state);
        void releaseComponents();

        ServerConfig m_config;
        events::SharedLogger m_logger;
        std::ostream & m_stdioOutput;
        int m_stdioInputFd;

        std::unique_ptr<mcp::ToolRegistry> m_registry;
        std::unique_ptr<mcp::PromptRegistry> m_prompts;
        std::unique_ptr<mcp::ResourceRegistry> m_resources;
        std::unique_ptr<worker::WorkerBridge> m_bridge;
        std::unique_ptr<mcp::RequestDispatcher> m_dispatcher;
        std::unique_ptr<mcp::MCPServer> m_server;
        std::unique_ptr<mcp::StdioTransport> m_stdioTransport;
        std::unique_ptr<mcp::HttpTransport> m_httpTransport;

        mutable std::mutex m_stateMutex;
        LifecycleState m_state{LifecycleState::Stopped};
        bool m_started{false};
        bool m_stopRequested{false};
        std::condition_variable m_stopCondition;

        std::mutex m_lifecycleMutex;
    };
}
