#include "exceptions.h"
#include "mcp/Protocol.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace scenemcp::tests
{
    using json = nlohmann::json;
    using namespace scenemcp::mcp;

    TEST(Protocol, DecodeMessage_JsonRpcRequest_KeepsIdMethodAndParams)
    {
        // Act
        auto const message = decodeMessage(
          {{"jsonrpc", "2.0"}, {"id", "a-1"}, {"method", "tools/list"}, {"params", {{"x", 1}}}});

        // Assert
        EXPECT_EQ(message.style, EnvelopeStyle::JsonRpc);
        EXPECT_TRUE(message.hasId);
        EXPECT_EQ(message.id, "a-1");
        EXPECT_EQ(message.method, "tools/list");
        EXPECT_EQ(message.params["x"], 1);
    }

    TEST(Protocol, DecodeMessage_WithoutId_IsNotification)
    {
        auto const message = decodeMessage({{"jsonrpc", "2.0"}, {"method", "ping"}});
        EXPECT_TRUE(message.isNotification());
    }

    TEST(Protocol, DecodeMessage_CompactFrame_MapsToToolsCall)
    {
        // Act
        auto const message =
          decodeMessage({{"id", 7}, {"tool", "create_cube"}, {"args", {{"size", 3}}}});

        // Assert
        EXPECT_EQ(message.style, EnvelopeStyle::Compact);
        EXPECT_EQ(message.method, "tools/call");
        EXPECT_EQ(message.params["name"], "create_cube");
        EXPECT_EQ(message.params["arguments"]["size"], 3);
    }

    TEST(Protocol, DecodeMessage_CompactFrameWithoutId_IsStillARequest)
    {
        auto const message = decodeMessage({{"tool", "reset_scene"}});
        EXPECT_FALSE(message.isNotification());
        EXPECT_TRUE(message.id.is_null());
    }

    TEST(Protocol, DecodeMessage_InvalidShapes_Throw)
    {
        EXPECT_THROW(decodeMessage(json::array()), TransportDecodeError);
        EXPECT_THROW(decodeMessage({{"id", 1}}), TransportDecodeError);
        EXPECT_THROW(decodeMessage({{"id", {{"nested", true}}}, {"method", "ping"}}),
                     TransportDecodeError);
        EXPECT_THROW(decodeMessage({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}}),
                     TransportDecodeError);
        EXPECT_THROW(decodeMessage({{"id", 1}, {"method", "tools/call"}, {"params", {1, 2}}}),
                     TransportDecodeError);
        EXPECT_THROW(decodeMessage({{"id", 1}, {"tool", 5}}), TransportDecodeError);
    }

    TEST(Protocol, ParseFrame_RejectsInvalidJsonAndNonObjects)
    {
        EXPECT_THROW(parseFrame("{"), TransportDecodeError);
        EXPECT_THROW(parseFrame("[1,2]"), TransportDecodeError);
        EXPECT_NO_THROW(parseFrame(R"({"id":1})"));
    }

    TEST(Protocol, RecoverId_ReturnsNullForUnusableIds)
    {
        EXPECT_EQ(recoverId({{"id", 4}}), 4);
        EXPECT_TRUE(recoverId({{"id", json::array()}}).is_null());
        EXPECT_TRUE(recoverId(json::array()).is_null());
    }

    TEST(Protocol, EncodeError_JsonRpc_UsesIntegerCodeWithStableCodeInData)
    {
        // Act
        auto const frame = encodeError(
          EnvelopeStyle::JsonRpc, 3, makeFailure(ErrorCode::TimeoutError, "Tool timed out"));

        // Assert
        EXPECT_EQ(frame["jsonrpc"], "2.0");
        EXPECT_EQ(frame["id"], 3);
        EXPECT_EQ(frame["error"]["code"], -32003);
        EXPECT_EQ(frame["error"]["message"], "Tool timed out");
        EXPECT_EQ(frame["error"]["data"]["code"], "TimeoutError");
    }

    TEST(Protocol, EncodeError_WorkerFailure_KeepsWorkerCodeInData)
    {
        // Act
        auto const frame =
          encodeError(EnvelopeStyle::JsonRpc, 4, ToolFailure{"ObjectNotFound", "missing"});

        // Assert
        EXPECT_EQ(frame["error"]["code"], WORKER_FAILURE_RPC_CODE);
        EXPECT_EQ(stableErrorCode(frame), "ObjectNotFound");
    }

    TEST(Protocol, StableErrorCode_ReadsBothEnvelopeStyles)
    {
        auto const failure = makeFailure(ErrorCode::UnknownTool, "Unknown tool: x");

        EXPECT_EQ(stableErrorCode(encodeError(EnvelopeStyle::JsonRpc, 1, failure)), "UnknownTool");
        EXPECT_EQ(stableErrorCode(encodeError(EnvelopeStyle::Compact, 1, failure)), "UnknownTool");
        EXPECT_EQ(stableErrorCode({{"id", 1}, {"result", "ok"}}), "");
    }

    TEST(Protocol, EncodeError_Compact_HasOnlyCodeAndMessage)
    {
        // Act
        auto const frame = encodeError(
          EnvelopeStyle::Compact, "c", makeFailure(ErrorCode::UnknownTool, "Unknown tool: x"));

        // Assert
        EXPECT_FALSE(frame.contains("jsonrpc"));
        EXPECT_EQ(frame["error"], (json{{"code", "UnknownTool"}, {"message", "Unknown tool: x"}}));
    }

    TEST(Protocol, RpcCode_MatchesJsonRpcConventions)
    {
        EXPECT_EQ(rpcCode(ErrorCode::UnknownTool), -32602);
        EXPECT_EQ(rpcCode(ErrorCode::InvalidArguments), -32602);
        EXPECT_EQ(rpcCode(ErrorCode::MethodNotFound), -32601);
        EXPECT_EQ(rpcCode(ErrorCode::TransportDecodeError), -32700);
        EXPECT_EQ(rpcCode(ErrorCode::InternalError), -32603);
    }

    TEST(Protocol, ToolCallResult_StringValue_IsTextContentOnly)
    {
        // Act
        auto const result = toolCallResult("Reset scene - cleared all objects");

        // Assert
        EXPECT_EQ(result["content"][0]["type"], "text");
        EXPECT_EQ(result["content"][0]["text"], "Reset scene - cleared all objects");
        EXPECT_EQ(result["isError"], false);
        EXPECT_FALSE(result.contains("structuredContent"));
    }

    TEST(Protocol, ToolCallResult_ArrayValue_IsSerializedText)
    {
        auto const result = toolCallResult(json::array({1, 2}));
        EXPECT_EQ(result["content"][0]["text"], "[1,2]");
        EXPECT_FALSE(result.contains("structuredContent"));
    }
}
