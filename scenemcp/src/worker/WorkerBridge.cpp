/**
 * @file WorkerBridge.cpp
 * @brief Implementation of the worker bridge
 */

#include "WorkerBridge.h"
#include "../exceptions.h"
#include "WorkerProcess.h"

#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace scenemcp::worker
{
    namespace
    {
        constexpr std::chrono::milliseconds WAIT_SLICE{50};
        constexpr auto CANCELLED_CODE = "Cancelled";
        constexpr int CANCELLED_RPC_CODE = -32800;
    }

    std::string toString(WorkerState state)
    {
        switch (state)
        {
        case WorkerState::Starting:
            return "starting";
        case WorkerState::Ready:
            return "ready";
        case WorkerState::Busy:
            return "busy";
        case WorkerState::Crashed:
            return "crashed";
        case WorkerState::Stopped:
            return "stopped";
        }
        return "unknown";
    }

    WorkerBridge::WorkerBridge(WorkerBridgeOptions options, events::SharedLogger logger)
        : m_options(std::move(options))
        , m_logger(std::move(logger))
    {
        m_coordinator = std::thread([this]() { coordinatorLoop(); });
    }

    WorkerBridge::~WorkerBridge()
    {
        shutdown();
    }

    mcp::ToolOutcome WorkerBridge::invoke(mcp::ToolCall const & call)
    {
        {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            if (m_status.degraded &&
                std::chrono::steady_clock::now() - m_degradedSince < m_options.cooldown)
            {
                return mcp::makeFailure(
                  mcp::ErrorCode::WorkerStartError,
                  fmt::format("Worker failed to start {} times, retrying after cooldown",
                              m_status.consecutiveFailures));
            }
        }

        auto pending = std::make_shared<PendingCall>();
        pending->call = call;
        auto future = pending->promise.get_future();
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (m_shuttingDown)
            {
                return mcp::makeFailure(mcp::ErrorCode::ServerStopping,
                                        "Worker bridge is shutting down");
            }
            m_queue.push_back(pending);
            std::lock_guard<std::mutex> statusLock(m_statusMutex);
            m_status.queued = m_queue.size();
        }
        m_queueCondition.notify_one();

        while (true)
        {
            auto const now = std::chrono::steady_clock::now();
            if (now >= call.deadline)
            {
                pending->abandoned = true;
                return mcp::makeFailure(mcp::ErrorCode::TimeoutError,
                                        fmt::format("Tool '{}' timed out", call.handler));
            }
            if (call.cancelled && call.cancelled->load())
            {
                pending->abandoned = true;
                return mcp::ToolFailure{
                  CANCELLED_CODE, "Request was cancelled", CANCELLED_RPC_CODE};
            }
            if (future.wait_until(std::min(call.deadline, now + WAIT_SLICE)) ==
                std::future_status::ready)
            {
                return future.get();
            }
        }
    }

    void WorkerBridge::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_shuttingDown = true;
        }
        m_stopRequested = true;
        m_queueCondition.notify_all();

        if (m_coordinator.joinable())
        {
            m_coordinator.join();
        }
    }

    WorkerStatus WorkerBridge::status() const
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        return m_status;
    }

    void WorkerBridge::coordinatorLoop()
    {
        while (true)
        {
            std::shared_ptr<PendingCall> pending;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_queueCondition.wait(lock,
                                      [this]() { return m_shuttingDown || !m_queue.empty(); });
                if (m_shuttingDown)
                {
                    break;
                }
                pending = m_queue.front();
                m_queue.pop_front();
                std::lock_guard<std::mutex> statusLock(m_statusMutex);
                m_status.queued = m_queue.size();
            }

            auto const & call = pending->call;
            if (pending->abandoned || (call.cancelled && call.cancelled->load()) ||
                std::chrono::steady_clock::now() >= call.deadline)
            {
                pending->promise.set_value(mcp::ToolFailure{
                  CANCELLED_CODE, "Request was abandoned before execution", CANCELLED_RPC_CODE});
                continue;
            }

            try
            {
                pending->promise.set_value(execute(call));
            }
            catch (std::exception const & e)
            {
                if (m_logger)
                {
                    m_logger->logError(fmt::format("Worker call failed: {}", e.what()));
                }
                pending->promise.set_value(
                  mcp::makeFailure(mcp::ErrorCode::InternalError, e.what()));
            }
        }

        std::deque<std::shared_ptr<PendingCall>> remaining;
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            remaining.swap(m_queue);
        }
        for (auto & pending : remaining)
        {
            pending->promise.set_value(
              mcp::makeFailure(mcp::ErrorCode::ServerStopping, "Worker bridge is shutting down"));
        }

        stopWorker(WorkerState::Stopped);
    }

    mcp::ToolOutcome WorkerBridge::execute(mcp::ToolCall const & call)
    {
        try
        {
            ensureWorker();
        }
        catch (WorkerStartError const & e)
        {
            return mcp::makeFailure(mcp::ErrorCode::WorkerStartError, e.what());
        }

        auto const callId = ++m_nextCallId;
        json const request = {
          {"id", callId}, {"tool", call.handler}, {"arguments", mcp::toJson(call.arguments)}};

        try
        {
            setState(WorkerState::Busy);
            m_process->writeLine(request.dump());

            while (true)
            {
                auto line = m_process->readLine(call.deadline, &m_stopRequested);
                if (!line)
                {
                    if (m_stopRequested)
                    {
                        stopWorker(WorkerState::Stopped);
                        return mcp::makeFailure(mcp::ErrorCode::ServerStopping,
                                                "Call aborted by shutdown");
                    }

                    throw WorkerTimeoutError(fmt::format("tool '{}'", call.handler));
                }

                json const reply = json::parse(*line, nullptr, false);
                if (reply.is_discarded() || !reply.is_object())
                {
                    if (m_logger)
                    {
                        m_logger->logWarning(fmt::format("Discarding malformed worker output: {}",
                                                         line->substr(0, 200)));
                    }
                    continue;
                }
                if (!reply.contains("id") || reply["id"] != callId)
                {
                    if (m_logger)
                    {
                        m_logger->logWarning(fmt::format(
                          "Discarding stale worker reply {}",
                          reply.contains("id") ? reply["id"].dump() : std::string{"without id"}));
                    }
                    continue;
                }

                setState(WorkerState::Ready);
                {
                    std::lock_guard<std::mutex> lock(m_statusMutex);
                    ++m_status.completed;
                }

                if (reply.contains("success"))
                {
                    return mcp::ToolSuccess{reply["success"]};
                }
                if (reply.contains("failure"))
                {
                    auto const & failure = reply["failure"];
                    if (failure.is_object())
                    {
                        return mcp::ToolFailure{failure.value("code", std::string{"ToolError"}),
                                                failure.value("message", std::string{}),
                                                mcp::WORKER_FAILURE_RPC_CODE};
                    }
                    return mcp::ToolFailure{
                      "ToolError", failure.dump(), mcp::WORKER_FAILURE_RPC_CODE};
                }
                return mcp::makeFailure(mcp::ErrorCode::InternalError,
                                        "Worker reply carries neither success nor failure");
            }
        }
        catch (WorkerCrashedError const & e)
        {
            if (m_logger)
            {
                m_logger->logError(e.what());
            }
            stopWorker(WorkerState::Crashed);
            return mcp::makeFailure(mcp::ErrorCode::WorkerCrashedError, e.what());
        }
        catch (WorkerTimeoutError const & e)
        {
            if (m_logger)
            {
                m_logger->logWarning(fmt::format("{}, terminating worker", e.what()));
            }
            stopWorker(WorkerState::Crashed);
            return mcp::makeFailure(mcp::ErrorCode::TimeoutError, e.what());
        }
        catch (json::exception const & e)
        {
            setState(WorkerState::Ready);
            return mcp::makeFailure(mcp::ErrorCode::InternalError,
                                    fmt::format("Malformed worker reply: {}", e.what()));
        }
    }

    void WorkerBridge::ensureWorker()
    {
        if (m_process && m_process->isAlive())
        {
            return;
        }

        if (m_process)
        {
            if (m_logger)
            {
                m_logger->logWarning("Worker process exited while idle, restarting");
            }
            stopWorker(WorkerState::Crashed);
        }

        {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            if (m_status.degraded &&
                std::chrono::steady_clock::now() - m_degradedSince < m_options.cooldown)
            {
                throw WorkerStartError("worker is degraded, waiting for cooldown");
            }
        }

        try
        {
            startWorker();
        }
        catch (WorkerStartError const & e)
        {
            if (m_logger)
            {
                m_logger->logError(e.what());
            }
            stopWorker(WorkerState::Crashed);
            recordStartFailure();
            throw;
        }

        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_status.consecutiveFailures = 0;
        m_status.degraded = false;
    }

    void WorkerBridge::startWorker()
    {
        setState(WorkerState::Starting);
        m_process = std::make_unique<WorkerProcess>();
        m_process->spawn(m_options.command, m_options.args);
        {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            m_status.pid = m_process->pid();
            ++m_status.starts;
        }

        auto const deadline = std::chrono::steady_clock::now() + m_options.startTimeout;
        while (true)
        {
            std::optional<std::string> line;
            try
            {
                line = m_process->readLine(deadline, &m_stopRequested);
            }
            catch (WorkerCrashedError const & e)
            {
                throw WorkerStartError(fmt::format("worker exited during startup ({})", e.what()));
            }

            if (!line)
            {
                throw WorkerStartError(
                  fmt::format("no ready message within {} ms", m_options.startTimeout.count()));
            }

            json const handshake = json::parse(*line, nullptr, false);
            if (!handshake.is_discarded() && handshake.is_object() &&
                handshake.contains("ready") && handshake["ready"] == true)
            {
                if (m_logger)
                {
                    m_logger->logInfo(fmt::format(
                      "Worker '{}' ready (pid {})", m_options.command, m_process->pid()));
                }
                setState(WorkerState::Ready);
                return;
            }

            if (m_logger)
            {
                m_logger->logWarning(
                  fmt::format("Ignoring worker output before ready: {}", line->substr(0, 200)));
            }
        }
    }

    void WorkerBridge::stopWorker(WorkerState finalState)
    {
        if (m_process)
        {
            auto const pid = m_process->pid();
            bool const graceful = m_process->terminate(m_options.shutdownGrace);
            if (m_logger && pid > 0)
            {
                m_logger->logInfo(fmt::format(
                  "Worker {} {}", pid, graceful ? "stopped" : "killed after grace period"));
            }
            m_process.reset();
        }

        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_status.state = finalState;
        m_status.pid = -1;
    }

    void WorkerBridge::recordStartFailure()
    {
        auto const now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(m_statusMutex);

        if (m_status.consecutiveFailures == 0 || now - m_firstFailureAt > m_options.failureWindow)
        {
            // A new window starts from a clean slate
            m_firstFailureAt = now;
            m_status.consecutiveFailures = 1;
            m_status.degraded = false;
        }
        else
        {
            ++m_status.consecutiveFailures;
        }

        if (m_status.consecutiveFailures >= m_options.failureThreshold)
        {
            if (!m_status.degraded && m_logger)
            {
                m_logger->logError(fmt::format("Worker failed to start {} times, marking degraded",
                                               m_status.consecutiveFailures));
            }
            m_status.degraded = true;
            m_degradedSince = now;
        }
    }

    void WorkerBridge::setState(WorkerState state)
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_status.state = state;
    }
}
