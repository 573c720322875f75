/**
 * @file Protocol.h
 * @brief Request/response types, error codes and the MCP frame codec
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace scenemcp::mcp
{
    constexpr auto SERVER_NAME = "scenemcp";
    constexpr auto SERVER_VERSION = "1.0.0";
    constexpr auto LATEST_PROTOCOL_VERSION = "2025-03-26";

    /// Stable error codes surfaced to clients
    enum class ErrorCode
    {
        UnknownTool,
        InvalidArguments,
        WorkerStartError,
        WorkerCrashedError,
        TimeoutError,
        TransportDecodeError,
        InternalError,
        MethodNotFound,
        ServerStopping,
        UnknownPrompt,
        UnknownResource
    };

    std::string toString(ErrorCode code);

    /// JSON-RPC numeric code reported alongside the stable code
    int rpcCode(ErrorCode code);

    /// Numeric code for failures reported by the worker itself
    constexpr int WORKER_FAILURE_RPC_CODE = -32000;

    struct ToolSuccess
    {
        nlohmann::json value;
    };

    struct ToolFailure
    {
        std::string code;
        std::string message;
        int rpcCode{WORKER_FAILURE_RPC_CODE};
    };

    ToolFailure makeFailure(ErrorCode code, std::string message);

    using ToolOutcome = std::variant<ToolSuccess, ToolFailure>;

    using CancellationFlag = std::shared_ptr<std::atomic<bool>>;

    struct ToolRequest
    {
        nlohmann::json id;
        std::string toolName;
        nlohmann::json arguments = nlohmann::json::object();
        std::chrono::steady_clock::time_point acceptedAt{std::chrono::steady_clock::now()};
        CancellationFlag cancelled;

        [[nodiscard]] bool isCancelled() const
        {
            return cancelled && cancelled->load();
        }
    };

    struct ToolResponse
    {
        nlohmann::json id;
        ToolOutcome outcome;

        [[nodiscard]] bool isSuccess() const
        {
            return std::holds_alternative<ToolSuccess>(outcome);
        }
    };

    enum class EnvelopeStyle
    {
        JsonRpc, ///< {"jsonrpc":"2.0","id":..,"method":..,"params":..}
        Compact  ///< {"id":..,"tool":..,"args":..}
    };

    /// A decoded inbound frame; compact tool calls are mapped onto tools/call
    struct Message
    {
        EnvelopeStyle style{EnvelopeStyle::JsonRpc};
        nlohmann::json id;
        bool hasId{false};
        std::string method;
        nlohmann::json params = nlohmann::json::object();

        [[nodiscard]] bool isNotification() const
        {
            return !hasId;
        }
    };

    /// @throws TransportDecodeError if text is not a JSON object
    nlohmann::json parseFrame(std::string const & text);

    /// @throws TransportDecodeError if the object is neither a JSON-RPC nor a compact frame
    Message decodeMessage(nlohmann::json const & frame);

    /// Best-effort id of a frame that failed to decode
    nlohmann::json recoverId(nlohmann::json const & frame);

    nlohmann::json encodeResult(Message const & message, nlohmann::json result);

    nlohmann::json
    encodeError(EnvelopeStyle style, nlohmann::json const & id, ToolFailure const & failure);

    /// Stable error code of an error frame in either envelope style, empty for results
    std::string stableErrorCode(nlohmann::json const & frame);

    /// Response frame for a tool call, in the envelope style of the originating message
    nlohmann::json encodeToolResponse(Message const & message, ToolResponse const & response);

    /// MCP content form of a successful tool call
    nlohmann::json toolCallResult(nlohmann::json const & value);
}
