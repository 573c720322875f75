#pragma once

#include "Protocol.h"
#include "ToolRegistry.h"

#include <chrono>
#include <string>

namespace scenemcp::mcp
{
    /// A validated call handed to the executor
    struct ToolCall
    {
        nlohmann::json requestId;
        std::string handler;
        ArgumentSet arguments;
        std::chrono::steady_clock::time_point deadline;
        CancellationFlag cancelled;
    };

    /**
     * @brief Executes validated tool calls
     *
     * Implementations report every failure through the returned outcome and must return
     * no later than the call's deadline.
     */
    class ToolExecutor
    {
      public:
        virtual ~ToolExecutor() = default;

        virtual ToolOutcome invoke(ToolCall const & call) = 0;
    };
}
