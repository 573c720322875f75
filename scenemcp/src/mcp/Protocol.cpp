/**
 * @file Protocol.cpp
 * @brief MCP frame codec
 */

#include "Protocol.h"
#include "../exceptions.h"

#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    std::string toString(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::UnknownTool:
            return "UnknownTool";
        case ErrorCode::InvalidArguments:
            return "InvalidArguments";
        case ErrorCode::WorkerStartError:
            return "WorkerStartError";
        case ErrorCode::WorkerCrashedError:
            return "WorkerCrashedError";
        case ErrorCode::TimeoutError:
            return "TimeoutError";
        case ErrorCode::TransportDecodeError:
            return "TransportDecodeError";
        case ErrorCode::InternalError:
            return "InternalError";
        case ErrorCode::MethodNotFound:
            return "MethodNotFound";
        case ErrorCode::ServerStopping:
            return "ServerStopping";
        case ErrorCode::UnknownPrompt:
            return "UnknownPrompt";
        case ErrorCode::UnknownResource:
            return "UnknownResource";
        }
        return "InternalError";
    }

    int rpcCode(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::UnknownTool:
        case ErrorCode::InvalidArguments:
        case ErrorCode::UnknownPrompt:
        case ErrorCode::UnknownResource:
            return -32602;
        case ErrorCode::WorkerStartError:
            return -32001;
        case ErrorCode::WorkerCrashedError:
            return -32002;
        case ErrorCode::TimeoutError:
            return -32003;
        case ErrorCode::ServerStopping:
            return -32004;
        case ErrorCode::TransportDecodeError:
            return -32700;
        case ErrorCode::MethodNotFound:
            return -32601;
        case ErrorCode::InternalError:
            return -32603;
        }
        return -32603;
    }

    ToolFailure makeFailure(ErrorCode code, std::string message)
    {
        return {toString(code), std::move(message), rpcCode(code)};
    }

    json parseFrame(std::string const & text)
    {
        json frame = json::parse(text, nullptr, false);
        if (frame.is_discarded())
        {
            throw TransportDecodeError("invalid JSON");
        }
        if (!frame.is_object())
        {
            throw TransportDecodeError(
              fmt::format("expected a JSON object, got {}", frame.type_name()));
        }
        return frame;
    }

    json recoverId(json const & frame)
    {
        if (frame.is_object() && frame.contains("id"))
        {
            auto const & id = frame["id"];
            if (id.is_string() || id.is_number() || id.is_null())
            {
                return id;
            }
        }
        return nullptr;
    }

    Message decodeMessage(json const & frame)
    {
        if (!frame.is_object())
        {
            throw TransportDecodeError("expected a JSON object");
        }

        Message message;
        if (frame.contains("id"))
        {
            auto const & id = frame["id"];
            if (!id.is_string() && !id.is_number() && !id.is_null())
            {
                throw TransportDecodeError("id must be a string, a number or null");
            }
            message.id = id;
            message.hasId = true;
        }

        if (frame.contains("method"))
        {
            if (frame.contains("jsonrpc") && frame["jsonrpc"] != "2.0")
            {
                throw TransportDecodeError("unsupported jsonrpc version");
            }
            if (!frame["method"].is_string())
            {
                throw TransportDecodeError("method must be a string");
            }

            message.style = EnvelopeStyle::JsonRpc;
            message.method = frame["method"].get<std::string>();
            if (frame.contains("params") && !frame["params"].is_null())
            {
                if (!frame["params"].is_object())
                {
                    throw TransportDecodeError("params must be an object");
                }
                message.params = frame["params"];
            }
            return message;
        }

        if (frame.contains("tool"))
        {
            if (!frame["tool"].is_string())
            {
                throw TransportDecodeError("tool must be a string");
            }

            message.style = EnvelopeStyle::Compact;
            message.method = "tools/call";
            // Compact frames are requests even without an id, the response carries id null
            message.hasId = true;
            json arguments = json::object();
            if (frame.contains("args"))
            {
                arguments = frame["args"];
            }
            else if (frame.contains("arguments"))
            {
                arguments = frame["arguments"];
            }
            message.params = {{"name", frame["tool"]}, {"arguments", arguments}};
            return message;
        }

        throw TransportDecodeError("missing method or tool");
    }

    json toolCallResult(json const & value)
    {
        json result = {{"content",
                        json::array({{{"type", "text"},
                                      {"text", value.is_string() ? value.get<std::string>()
                                                                 : value.dump()}}})},
                       {"isError", false}};
        if (value.is_object())
        {
            result["structuredContent"] = value;
        }
        return result;
    }

    json encodeResult(Message const & message, json result)
    {
        if (message.style == EnvelopeStyle::Compact)
        {
            return {{"id", message.id}, {"result", std::move(result)}};
        }
        return {{"jsonrpc", "2.0"}, {"id", message.id}, {"result", std::move(result)}};
    }

    json encodeError(EnvelopeStyle style, json const & id, ToolFailure const & failure)
    {
        if (style == EnvelopeStyle::Compact)
        {
            return {{"id", id}, {"error", {{"code", failure.code}, {"message", failure.message}}}};
        }

        // JSON-RPC requires an integer code, the stable name travels in data
        json error = {{"code", failure.rpcCode},
                      {"message", failure.message},
                      {"data", {{"code", failure.code}}}};
        return {{"jsonrpc", "2.0"}, {"id", id}, {"error", std::move(error)}};
    }

    std::string stableErrorCode(json const & frame)
    {
        if (!frame.is_object() || !frame.contains("error") || !frame["error"].is_object())
        {
            return {};
        }

        auto const & error = frame["error"];
        if (error.contains("code") && error["code"].is_string())
        {
            return error["code"].get<std::string>();
        }
        if (error.contains("data") && error["data"].is_object())
        {
            return error["data"].value("code", std::string{});
        }
        return {};
    }

    json encodeToolResponse(Message const & message, ToolResponse const & response)
    {
        if (auto const * failure = std::get_if<ToolFailure>(&response.outcome))
        {
            return encodeError(message.style, response.id, *failure);
        }

        auto const & value = std::get<ToolSuccess>(response.outcome).value;
        if (message.style == EnvelopeStyle::Compact)
        {
            return encodeResult(message, value);
        }
        return encodeResult(message, toolCallResult(value));
    }
}
