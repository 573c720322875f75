/**
 * @file WorkerBridge.h
 * @brief Serialized access to the single scene worker process
 */

#pragma once

#include "../EventLogger.h"
#include "../mcp/ToolExecutor.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace scenemcp::worker
{
    class WorkerProcess;

    enum class WorkerState
    {
        Starting,
        Ready,
        Busy,
        Crashed,
        Stopped
    };

    std::string toString(WorkerState state);

    struct WorkerBridgeOptions
    {
        std::string command{"scenemcp-worker"};
        std::vector<std::string> args;
        std::chrono::milliseconds startTimeout{10000};
        std::chrono::milliseconds shutdownGrace{5000};
        uint32_t failureThreshold{3};
        std::chrono::milliseconds failureWindow{60000};
        std::chrono::milliseconds cooldown{30000};
    };

    /// Snapshot of the worker handle
    struct WorkerStatus
    {
        WorkerState state{WorkerState::Stopped};
        pid_t pid{-1};
        uint64_t starts{0};
        uint32_t consecutiveFailures{0};
        bool degraded{false};
        uint64_t completed{0};
        size_t queued{0};
    };

    /**
     * @brief Executes tool calls on one lazily started worker process
     *
     * A single coordinator thread owns the worker process. Callers enqueue their call
     * and wait for the result until their deadline; calls are forwarded strictly one at
     * a time in the order they were accepted. A call that exceeds its deadline kills the
     * worker, the next call starts a fresh one. Repeated start failures mark the bridge
     * degraded; calls then fail fast until the cooldown elapsed.
     */
    class WorkerBridge : public mcp::ToolExecutor
    {
      public:
        explicit WorkerBridge(WorkerBridgeOptions options, events::SharedLogger logger = {});
        ~WorkerBridge() override;

        WorkerBridge(WorkerBridge const &) = delete;
        WorkerBridge & operator=(WorkerBridge const &) = delete;

        mcp::ToolOutcome invoke(mcp::ToolCall const & call) override;

        /// Fail queued calls, terminate the worker and stop the coordinator; idempotent
        void shutdown();

        [[nodiscard]] WorkerStatus status() const;

        [[nodiscard]] WorkerBridgeOptions const & options() const
        {
            return m_options;
        }

      private:
        struct PendingCall
        {
            mcp::ToolCall call;
            std::promise<mcp::ToolOutcome> promise;
            std::atomic<bool> abandoned{false};
        };

        void coordinatorLoop();
        mcp::ToolOutcome execute(mcp::ToolCall const & call);
        void ensureWorker();
        void startWorker();
        void stopWorker(WorkerState finalState);
        void recordStartFailure();
        void setState(WorkerState state);

        WorkerBridgeOptions m_options;
        events::SharedLogger m_logger;

        std::mutex m_queueMutex;
        std::condition_variable m_queueCondition;
        std::deque<std::shared_ptr<PendingCall>> m_queue;
        bool m_shuttingDown{false};
        std::atomic<bool> m_stopRequested{false};
        std::thread m_coordinator;

        // Owned by the coordinator thread
        std::unique_ptr<WorkerProcess> m_process;
        uint64_t m_nextCallId{0};
        std::chrono::steady_clock::time_point m_firstFailureAt;
        std::chrono::steady_clock::time_point m_degradedSince;

        mutable std::mutex m_statusMutex;
        WorkerStatus m_status;
    };
}
