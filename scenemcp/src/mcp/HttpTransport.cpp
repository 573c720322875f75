/**
 * @file HttpTransport.cpp
 * @brief Implementation of the HTTP transport
 */

#include "HttpTransport.h"

#include <chrono>
#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    namespace
    {
        constexpr auto JSON_CONTENT = "application/json";
        constexpr auto EVENT_STREAM_CONTENT = "text/event-stream";
        constexpr auto KEEP_ALIVE_INTERVAL = std::chrono::seconds(15);
        constexpr auto STREAM_POLL_INTERVAL = std::chrono::milliseconds(100);

        std::string sseEvent(std::string const & name, json const & data)
        {
            return fmt::format("event: {}\ndata: {}\n\n", name, data.dump());
        }
    }

    int httpStatusFor(std::optional<json> const & response)
    {
        if (!response)
        {
            return 202;
        }
        if (!response->contains("error"))
        {
            return 200;
        }

        auto const code = stableErrorCode(*response);
        if (code == toString(ErrorCode::TransportDecodeError))
        {
            return 400;
        }
        if (code == toString(ErrorCode::InternalError))
        {
            return 500;
        }
        if (code == toString(ErrorCode::ServerStopping))
        {
            return 503;
        }
        return 200;
    }

    HttpTransport::HttpTransport(MCPServer & server,
                                 HealthProvider healthProvider,
                                 events::SharedLogger logger)
        : m_server(server)
        , m_healthProvider(std::move(healthProvider))
        , m_logger(std::move(logger))
        , m_httpServer(std::make_unique<httplib::Server>())
    {
        setupRoutes();
    }

    HttpTransport::~HttpTransport()
    {
        stop();
    }

    bool HttpTransport::start(std::string const & host, int port)
    {
        if (m_running)
        {
            return false;
        }

        if (port == 0)
        {
            int const bound = m_httpServer->bind_to_any_port(host);
            if (bound <= 0)
            {
                if (m_logger)
                {
                    m_logger->logError(fmt::format("Failed to bind MCP server on {}", host));
                }
                return false;
            }
            m_port = bound;
        }
        else
        {
            if (!m_httpServer->bind_to_port(host, port))
            {
                if (m_logger)
                {
                    m_logger->logError(
                      fmt::format("Failed to bind MCP server on {}:{}", host, port));
                }
                return false;
            }
            m_port = port;
        }

        m_host = host;
        m_running = true;
        m_serverThread = std::thread(
          [this]()
          {
              if (!m_httpServer->listen_after_bind() && m_logger)
              {
                  m_logger->logError("MCP HTTP server stopped unexpectedly");
              }
          });

        // The socket is bound already, wait until the accept loop runs
        for (int i = 0; i < 100 && !m_httpServer->is_running(); ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (m_logger)
        {
            m_logger->logInfo(
              fmt::format("MCP server listening on http://{}:{}/mcp", host, m_port.load()));
        }
        return true;
    }

    void HttpTransport::stop()
    {
        if (!m_running.exchange(false))
        {
            return;
        }

        m_httpServer->stop();
        if (m_serverThread.joinable())
        {
            m_serverThread.join();
        }
        m_port = 0;

        if (m_logger)
        {
            m_logger->logInfo("MCP HTTP server stopped");
        }
    }

    void HttpTransport::setupRoutes()
    {
        // Enable CORS for web-based MCP clients
        m_httpServer->set_default_headers(
          {{"Access-Control-Allow-Origin", "*"},
           {"Access-Control-Allow-Methods", "POST, GET, OPTIONS"},
           {"Access-Control-Allow-Headers", "Content-Type"}});

        m_httpServer->Options("/.*", [](httplib::Request const &, httplib::Response &) {});

        m_httpServer->Post("/mcp",
                           [this](httplib::Request const & req, httplib::Response & res)
                           { handleMCP(req, res); });
        m_httpServer->Post("/",
                           [this](httplib::Request const & req, httplib::Response & res)
                           { handleMCP(req, res); });

        m_httpServer->Get("/",
                          [this](httplib::Request const & req, httplib::Response & res)
                          {
                              if (req.get_header_value("Accept").find(EVENT_STREAM_CONTENT) !=
                                  std::string::npos)
                              {
                                  handleEventStream(req, res);
                                  return;
                              }
                              res.status = 200;
                              res.set_content(serverInfo().dump(), JSON_CONTENT);
                          });
        m_httpServer->Get("/sse",
                          [this](httplib::Request const & req, httplib::Response & res)
                          { handleEventStream(req, res); });
        m_httpServer->Get("/events",
                          [this](httplib::Request const & req, httplib::Response & res)
                          { handleEventStream(req, res); });

        // Liveness of the server process, independent of the worker
        m_httpServer->Get("/health",
                          [this](httplib::Request const &, httplib::Response & res)
                          {
                              json health = m_healthProvider ? m_healthProvider()
                                                             : json{{"status", "ok"}};
                              res.status = 200;
                              res.set_content(health.dump(), JSON_CONTENT);
                          });

        m_httpServer->set_error_handler(
          [](httplib::Request const & req, httplib::Response & res)
          {
              if (res.status == 404 && res.body.empty())
              {
                  json const body = {{"error", "Not found"}, {"path", req.path}};
                  res.set_content(body.dump(), JSON_CONTENT);
              }
          });
    }

    void HttpTransport::handleMCP(httplib::Request const & req, httplib::Response & res)
    {
        // Each HTTP request is its own session
        Session session;
        auto const response = m_server.handleFrame(req.body, session);

        res.status = httpStatusFor(response);
        if (response)
        {
            res.set_content(response->dump(), JSON_CONTENT);
        }
    }

    json HttpTransport::serverInfo() const
    {
        return {{"name", SERVER_NAME},
                {"version", SERVER_VERSION},
                {"protocolVersion", LATEST_PROTOCOL_VERSION},
                {"transport", "http"},
                {"tools_count", m_server.toolCount()},
                {"endpoints", {{"mcp", "/mcp"}, {"health", "/health"}, {"sse", "/sse"}}}};
    }

    void HttpTransport::handleEventStream(httplib::Request const & req, httplib::Response & res)
    {
        auto host = req.get_header_value("Host");
        if (host.empty())
        {
            host = fmt::format("{}:{}", m_host, m_port.load());
        }
        auto const endpoint = fmt::format("http://{}/mcp", host);

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
          EVENT_STREAM_CONTENT,
          [this, endpoint, greeted = false, lastWrite = std::chrono::steady_clock::now()](
            size_t, httplib::DataSink & sink) mutable
          {
              if (!greeted)
              {
                  greeted = true;
                  auto const greeting = sseEvent("message", {{"type", "connection_ack"}}) +
                                        sseEvent("endpoint", {{"uri", endpoint}});
                  return sink.write(greeting.data(), greeting.size());
              }

              // Requests are answered on POST /mcp, the stream only keeps the client attached
              while (m_running && sink.is_writable())
              {
                  std::this_thread::sleep_for(STREAM_POLL_INTERVAL);
                  if (std::chrono::steady_clock::now() - lastWrite >= KEEP_ALIVE_INTERVAL)
                  {
                      lastWrite = std::chrono::steady_clock::now();
                      std::string const ping = ": keep-alive\n\n";
                      return sink.write(ping.data(), ping.size());
                  }
              }
              sink.done();
              return true;
          });
    }
}
