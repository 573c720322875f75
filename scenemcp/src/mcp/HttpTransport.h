/**
 * @file HttpTransport.h
 * @brief MCP over HTTP: POST /mcp for requests, GET /health for liveness, GET /sse for
 *        clients that attach through server-sent events
 */

#pragma once

#include "../EventLogger.h"
#include "MCPServer.h"

#include <atomic>
#include <functional>
#include <httplib.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace scenemcp::mcp
{
    /// Produces the body of GET /health
    using HealthProvider = std::function<nlohmann::json()>;

    /// HTTP status for a response frame; nothing means a notification (202)
    int httpStatusFor(std::optional<nlohmann::json> const & response);

    class HttpTransport
    {
      public:
        HttpTransport(MCPServer & server,
                      HealthProvider healthProvider,
                      events::SharedLogger logger = {});

        ~HttpTransport();

        HttpTransport(HttpTransport const &) = delete;
        HttpTransport & operator=(HttpTransport const &) = delete;

        /**
         * @brief Bind and start serving on a background thread
         * @param port Port to listen on, 0 picks a free port
         * @return false if the address could not be bound
         */
        bool start(std::string const & host, int port);

        /// Idempotent
        void stop();

        [[nodiscard]] bool isRunning() const
        {
            return m_running;
        }

        /// Bound port, or 0 if not running
        [[nodiscard]] int getPort() const
        {
            return m_port;
        }

      private:
        void setupRoutes();
        void handleMCP(httplib::Request const & req, httplib::Response & res);
        void handleEventStream(httplib::Request const & req, httplib::Response & res);
        [[nodiscard]] nlohmann::json serverInfo() const;

        MCPServer & m_server;
        HealthProvider m_healthProvider;
        events::SharedLogger m_logger;

        std::unique_ptr<httplib::Server> m_httpServer;
        std::thread m_serverThread;
        std::atomic<bool> m_running{false};
        std::atomic<int> m_port{0};
        std::string m_host;
    };
}
