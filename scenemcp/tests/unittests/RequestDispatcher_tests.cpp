#include "MockToolExecutor.h"
#include "mcp/RequestDispatcher.h"
#include "mcp/SceneTools.h"
#include "mcp/ToolRegistry.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace scenemcp::tests
{
    using json = nlohmann::json;
    using namespace scenemcp::mcp;
    using ::testing::_;
    using ::testing::Return;
    using ::testing::Throw;

    class RequestDispatcherTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            registerSceneTools(m_registry);
            m_registry.seal();
            m_dispatcher = std::make_unique<RequestDispatcher>(
              m_registry, m_executor, std::chrono::milliseconds(1000));
        }

        static ToolRequest request(std::string tool, json arguments = json::object())
        {
            ToolRequest result;
            result.id = "1";
            result.toolName = std::move(tool);
            result.arguments = std::move(arguments);
            return result;
        }

        ToolRegistry m_registry;
        ::testing::StrictMock<MockToolExecutor> m_executor;
        std::unique_ptr<RequestDispatcher> m_dispatcher;
    };

    TEST_F(RequestDispatcherTest, Handle_UnknownTool_ReturnsUnknownToolWithoutInvokingWorker)
    {
        // Arrange
        EXPECT_CALL(m_executor, invoke(_)).Times(0);

        // Act
        auto const response = m_dispatcher->handle(request("create_cone"));

        // Assert
        EXPECT_EQ(response.id, "1");
        ASSERT_FALSE(response.isSuccess());
        auto const & failure = std::get<ToolFailure>(response.outcome);
        EXPECT_EQ(failure.code, "UnknownTool");
        EXPECT_EQ(failure.rpcCode, -32602);
        EXPECT_EQ(m_dispatcher->forwardedCount(), 0u);
    }

    TEST_F(RequestDispatcherTest, Handle_MissingRequiredArgument_ReturnsInvalidArguments)
    {
        // Arrange
        EXPECT_CALL(m_executor, invoke(_)).Times(0);

        // Act
        auto const response = m_dispatcher->handle(request("set_material"));

        // Assert
        ASSERT_FALSE(response.isSuccess());
        EXPECT_EQ(std::get<ToolFailure>(response.outcome).code, "InvalidArguments");
        EXPECT_EQ(m_dispatcher->forwardedCount(), 0u);
    }

    TEST_F(RequestDispatcherTest, Handle_ValidRequest_ForwardsNormalizedArguments)
    {
        // Arrange
        ToolCall captured;
        EXPECT_CALL(m_executor, invoke(_))
          .WillOnce(
            [&captured](ToolCall const & call) -> ToolOutcome
            {
                captured = call;
                return ToolSuccess{"Created cube 'Cube' at [0, 0, 0] with size 2"};
            });
        auto const before = std::chrono::steady_clock::now();

        // Act
        auto const response = m_dispatcher->handle(
          request("create_cube", {{"name", "Cube"}, {"location", {0, 0, 0}}, {"size", 2.0}}));

        // Assert
        ASSERT_TRUE(response.isSuccess());
        EXPECT_EQ(std::get<ToolSuccess>(response.outcome).value,
                  "Created cube 'Cube' at [0, 0, 0] with size 2");
        EXPECT_EQ(captured.handler, "create_cube");
        EXPECT_EQ(captured.requestId, "1");
        EXPECT_EQ(toJson(captured.arguments),
                  json({{"name", "Cube"}, {"location", {0.0, 0.0, 0.0}}, {"size", 2.0}}));
        EXPECT_GE(captured.deadline, before + std::chrono::milliseconds(1000));
        EXPECT_EQ(m_dispatcher->forwardedCount(), 1u);
    }

    TEST_F(RequestDispatcherTest, Handle_DeadlineIsAcceptTimePlusTimeout)
    {
        // Arrange
        auto req = request("reset_scene");
        req.acceptedAt = std::chrono::steady_clock::now() - std::chrono::milliseconds(400);
        std::chrono::steady_clock::time_point deadline;
        EXPECT_CALL(m_executor, invoke(_))
          .WillOnce(
            [&deadline](ToolCall const & call) -> ToolOutcome
            {
                deadline = call.deadline;
                return ToolSuccess{"Reset scene - cleared all objects"};
            });

        // Act
        auto const response = m_dispatcher->handle(req);

        // Assert
        EXPECT_TRUE(response.isSuccess());
        EXPECT_EQ(deadline, req.acceptedAt + std::chrono::milliseconds(1000));
    }

    TEST_F(RequestDispatcherTest, Handle_ExecutorFailure_IsPassedThrough)
    {
        // Arrange
        EXPECT_CALL(m_executor, invoke(_))
          .WillOnce(Return(ToolOutcome{makeFailure(ErrorCode::TimeoutError, "timed out")}));

        // Act
        auto const response = m_dispatcher->handle(request("get_scene_info"));

        // Assert
        ASSERT_FALSE(response.isSuccess());
        EXPECT_EQ(std::get<ToolFailure>(response.outcome).code, "TimeoutError");
        EXPECT_EQ(std::get<ToolFailure>(response.outcome).rpcCode, -32003);
    }

    TEST_F(RequestDispatcherTest, Handle_ExecutorThrows_ReturnsInternalError)
    {
        // Arrange
        EXPECT_CALL(m_executor, invoke(_)).WillOnce(Throw(std::runtime_error("broken pipe")));

        // Act
        auto const response = m_dispatcher->handle(request("get_scene_info"));

        // Assert
        ASSERT_FALSE(response.isSuccess());
        auto const & failure = std::get<ToolFailure>(response.outcome);
        EXPECT_EQ(failure.code, "InternalError");
        EXPECT_EQ(failure.message, "broken pipe");
    }
}
