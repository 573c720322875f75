/**
 * @file RequestDispatcher.h
 * @brief Resolves, validates and executes tool requests
 */

#pragma once

#include "../EventLogger.h"
#include "Protocol.h"

#include <atomic>
#include <chrono>

namespace scenemcp::mcp
{
    class ToolRegistry;
    class ToolExecutor;

    /**
     * @brief Turns a ToolRequest into exactly one ToolResponse
     *
     * Unknown tools and invalid arguments are answered without contacting the executor.
     * Executor errors are mapped to failures, nothing is thrown to the caller.
     */
    class RequestDispatcher
    {
      public:
        RequestDispatcher(ToolRegistry const & registry,
                          ToolExecutor & executor,
                          std::chrono::milliseconds timeout,
                          events::SharedLogger logger = {});

        [[nodiscard]] ToolResponse handle(ToolRequest const & request);

        [[nodiscard]] ToolRegistry const & registry() const
        {
            return m_registry;
        }

        [[nodiscard]] std::chrono::milliseconds timeout() const
        {
            return m_timeout;
        }

        /// Number of calls forwarded to the executor
        [[nodiscard]] size_t forwardedCount() const
        {
            return m_forwarded;
        }

      private:
        ToolRegistry const & m_registry;
        ToolExecutor & m_executor;
        std::chrono::milliseconds m_timeout;
        events::SharedLogger m_logger;
        std::atomic<size_t> m_forwarded{0};
    };
}
