/**
 * @file StdioTransport.h
 * @brief Newline-delimited MCP transport over a file descriptor and an output stream
 */

#pragma once

#include "../EventLogger.h"
#include "MCPServer.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace httplib
{
    class ThreadPool;
}

namespace scenemcp::mcp
{
    /**
     * @brief Reads request lines from an input descriptor and writes response lines
     *
     * Requests are processed concurrently so a client may pipeline them; notifications
     * are handled on the reader thread so a cancellation is never queued behind the
     * request it cancels. Only response frames are written to the output stream.
     *
     * At end of input every request read so far is answered before onEndOfInput runs.
     */
    class StdioTransport
    {
      public:
        static constexpr size_t DEFAULT_THREAD_COUNT{4};

        StdioTransport(MCPServer & server,
                       int inputFd,
                       std::ostream & output,
                       events::SharedLogger logger = {},
                       size_t threadCount = DEFAULT_THREAD_COUNT);

        ~StdioTransport();

        StdioTransport(StdioTransport const &) = delete;
        StdioTransport & operator=(StdioTransport const &) = delete;

        /**
         * @brief Start the reader thread
         * @param onEndOfInput Invoked once when the input reaches end of file
         * @return false if already running
         */
        bool start(std::function<void()> onEndOfInput = {});

        /// Stop reading and wait for queued requests to finish; idempotent
        void stop();

        [[nodiscard]] bool isRunning() const
        {
            return m_running;
        }

        [[nodiscard]] Session & session()
        {
            return m_session;
        }

      private:
        void readLoop();
        void handleLine(std::string line);
        void writeFrame(nlohmann::json const & frame);
        void waitForPendingLines();

        MCPServer & m_server;
        int m_inputFd;
        std::ostream & m_output;
        events::SharedLogger m_logger;
        size_t m_threadCount;

        Session m_session;
        std::unique_ptr<httplib::ThreadPool> m_pool;
        std::thread m_readerThread;
        std::function<void()> m_onEndOfInput;
        std::atomic<bool> m_running{false};
        std::mutex m_outputMutex;
        std::mutex m_lifecycleMutex;

        std::mutex m_pendingMutex;
        std::condition_variable m_pendingCondition;
        size_t m_pendingLines{0};
    };
}
