#include "Supervisor.h"
#include "exceptions.h"
#include "mcp/HttpTransport.h"
#include "mcp/MCPServer.h"
#include "mcp/PromptRegistry.h"
#include "mcp/RequestDispatcher.h"
#include "mcp/ResourceRegistry.h"
#include "mcp/SceneTools.h"
#include "mcp/StdioTransport.h"
#include "mcp/ToolRegistry.h"
#include "worker/WorkerBridge.h"

#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp
{
    std::string toString(LifecycleState state)
    {
        switch (state)
        {
        case LifecycleState::Starting:
            return "starting";
        case LifecycleState::Running:
            return "running";
        case LifecycleState::Stopping:
            return "stopping";
        case LifecycleState::Stopped:
            return "stopped";
        }
        return "unknown";
    }

    worker::WorkerBridgeOptions bridgeOptions(ServerConfig const & config)
    {
        worker::WorkerBridgeOptions options;
        options.command = config.workerCommand;
        options.args = config.workerArgs;
        options.startTimeout = config.workerStartTimeout;
        options.shutdownGrace = config.shutdownGrace;
        options.failureThreshold = config.restartFailureThreshold;
        options.failureWindow = config.restartFailureWindow;
        options.cooldown = config.restartCooldown;
        return options;
    }

    Supervisor::Supervisor(ServerConfig config,
                           events::SharedLogger logger,
                           std::ostream & stdioOutput,
                           int stdioInputFd)
        : m_config(std::move(config))
        , m_logger(std::move(logger))
        , m_stdioOutput(stdioOutput)
        , m_stdioInputFd(stdioInputFd)
    {
    }

    Supervisor::~Supervisor()
    {
        stop();
    }

    void Supervisor::start()
    {
        std::lock_guard<std::mutex> lifecycleLock(m_lifecycleMutex);
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_started)
            {
                return;
            }
            m_started = true;
            m_state = LifecycleState::Starting;
        }

        m_registry = std::make_unique<mcp::ToolRegistry>(m_logger);
        mcp::registerSceneTools(*m_registry);
        m_registry->seal();

        m_bridge = std::make_unique<worker::WorkerBridge>(bridgeOptions(m_config), m_logger);
        m_dispatcher = std::make_unique<mcp::RequestDispatcher>(
          *m_registry, *m_bridge, m_config.timeout, m_logger);
        m_prompts = std::make_unique<mcp::PromptRegistry>();
        mcp::registerScenePrompts(*m_prompts);
        m_resources = std::make_unique<mcp::ResourceRegistry>();
        mcp::registerSceneResources(*m_resources);

        m_server = std::make_unique<mcp::MCPServer>(*m_dispatcher, m_logger);
        m_server->setPrompts(*m_prompts);
        m_server->setResources(*m_resources);

        if (m_config.transport == TransportMode::Stdio)
        {
            m_stdioTransport = std::make_unique<mcp::StdioTransport>(
              *m_server, m_stdioInputFd, m_stdioOutput, m_logger);
            m_stdioTransport->start([this]() { requestStop(); });
        }
        else
        {
            m_httpTransport = std::make_unique<mcp::HttpTransport>(
              *m_server, [this]() { return health(); }, m_logger);
            if (!m_httpTransport->start(m_config.host, m_config.port))
            {
                releaseComponents();
                setState(LifecycleState::Stopped);
                throw ScenemcpException(fmt::format(
                  "Failed to start MCP server on {}:{}", m_config.host, m_config.port));
            }
        }

        setState(LifecycleState::Running);
        if (m_logger)
        {
            m_logger->logInfo(fmt::format("scenemcp server running ({} transport, {} tools)",
                                          toString(m_config.transport),
                                          m_registry->size()));
        }
    }

    void Supervisor::stop()
    {
        std::lock_guard<std::mutex> lifecycleLock(m_lifecycleMutex);
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state == LifecycleState::Stopped)
            {
                m_stopRequested = true;
                m_stopCondition.notify_all();
                return;
            }
            m_state = LifecycleState::Stopping;
        }

        if (m_logger)
        {
            m_logger->logInfo("Stopping scenemcp server");
        }

        if (m_server)
        {
            m_server->stopAccepting();
            if (!m_server->waitForIdle(m_config.shutdownGrace) && m_logger)
            {
                m_logger->logWarning(fmt::format("{} requests still in flight at shutdown",
                                                 m_server->inFlightCount()));
            }
        }

        releaseComponents();
        setState(LifecycleState::Stopped);

        if (m_logger)
        {
            m_logger->logInfo("scenemcp server stopped");
            m_logger->flush();
        }
        requestStop();
    }

    void Supervisor::releaseComponents()
    {
        // The bridge goes first so blocked requests complete before transports drain
        if (m_bridge)
        {
            m_bridge->shutdown();
        }
        if (m_httpTransport)
        {
            m_httpTransport->stop();
        }
        if (m_stdioTransport)
        {
            m_stdioTransport->stop();
        }

        m_httpTransport.reset();
        m_stdioTransport.reset();
        m_server.reset();
        m_dispatcher.reset();
        m_bridge.reset();
        m_resources.reset();
        m_prompts.reset();
        m_registry.reset();
    }

    void Supervisor::requestStop()
    {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_stopRequested = true;
        }
        m_stopCondition.notify_all();
    }

    bool Supervisor::waitForShutdown(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_stateMutex);
        return m_stopCondition.wait_for(lock, timeout, [this]() { return m_stopRequested; });
    }

    LifecycleState Supervisor::state() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_state;
    }

    void Supervisor::setState(LifecycleState state)
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = state;
    }

    json Supervisor::health() const
    {
        auto const currentState = state();
        json health = {{"server", mcp::SERVER_NAME},
                       {"version", mcp::SERVER_VERSION},
                       {"state", toString(currentState)},
                       {"tools_count", m_registry ? m_registry->size() : 0}};

        bool degraded = false;
        if (m_bridge)
        {
            auto const workerStatus = m_bridge->status();
            degraded = workerStatus.degraded;
            health["worker"] = {{"state", worker::toString(workerStatus.state)},
                                {"pid", workerStatus.pid},
                                {"starts", workerStatus.starts},
                                {"degraded", workerStatus.degraded},
                                {"completed", workerStatus.completed},
                                {"queued", workerStatus.queued}};
        }

        if (currentState == LifecycleState::Stopping || currentState == LifecycleState::Stopped)
        {
            health["status"] = "stopping";
        }
        else
        {
            health["status"] = degraded ? "degraded" : "ok";
        }
        return health;
    }

    int Supervisor::httpPort() const
    {
        return m_httpTransport ? m_httpTransport->getPort() : 0;
    }
}
