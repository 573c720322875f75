#include "MockToolExecutor.h"
#include "mcp/MCPServer.h"
#include "mcp/RequestDispatcher.h"
#include "mcp/SceneTools.h"
#include "mcp/StdioTransport.h"
#include "mcp/ToolRegistry.h"

#include <algorithm>
#include <condition_variable>
#include <future>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <streambuf>
#include <thread>
#include <unistd.h>

namespace scenemcp::tests
{
    using json = nlohmann::json;
    using namespace scenemcp::mcp;
    using ::testing::_;
    using ::testing::NiceMock;
    using ::testing::Return;

    /// Unbuffered stream buffer collecting output lines, safe to read while being written
    class LineSink : public std::streambuf
    {
      public:
        std::vector<std::string> waitForLines(size_t count, std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait_for(lock, timeout, [&]() { return completeLines() >= count; });
            return lines();
        }

        std::vector<std::string> snapshot()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return lines();
        }

      protected:
        int_type overflow(int_type ch) override
        {
            if (ch != traits_type::eof())
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_data.push_back(static_cast<char>(ch));
                m_condition.notify_all();
            }
            return ch;
        }

        std::streamsize xsputn(char const * s, std::streamsize n) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_data.append(s, static_cast<size_t>(n));
            m_condition.notify_all();
            return n;
        }

      private:
        size_t completeLines() const
        {
            return static_cast<size_t>(std::count(m_data.begin(), m_data.end(), '\n'));
        }

        std::vector<std::string> lines() const
        {
            std::vector<std::string> result;
            size_t start = 0;
            size_t newline = 0;
            while ((newline = m_data.find('\n', start)) != std::string::npos)
            {
                result.push_back(m_data.substr(start, newline - start));
                start = newline + 1;
            }
            return result;
        }

        std::mutex m_mutex;
        std::condition_variable m_condition;
        std::string m_data;
    };

    class StdioTransportTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            registerSceneTools(m_registry);
            m_registry.seal();
            m_dispatcher = std::make_unique<RequestDispatcher>(
              m_registry, m_executor, std::chrono::milliseconds(2000));
            m_server = std::make_unique<MCPServer>(*m_dispatcher);

            ASSERT_EQ(::pipe(m_pipe), 0);
            m_output = std::make_unique<std::ostream>(&m_sink);
            m_transport = std::make_unique<StdioTransport>(*m_server, m_pipe[0], *m_output);
        }

        void TearDown() override
        {
            m_transport->stop();
            m_transport.reset();
            closeInput();
            ::close(m_pipe[0]);
        }

        void send(std::string const & text)
        {
            ASSERT_EQ(::write(m_pipe[1], text.data(), text.size()),
                      static_cast<ssize_t>(text.size()));
        }

        void closeInput()
        {
            if (m_pipe[1] >= 0)
            {
                ::close(m_pipe[1]);
                m_pipe[1] = -1;
            }
        }

        ToolRegistry m_registry;
        NiceMock<MockToolExecutor> m_executor;
        std::unique_ptr<RequestDispatcher> m_dispatcher;
        std::unique_ptr<MCPServer> m_server;
        int m_pipe[2] = {-1, -1};
        LineSink m_sink;
        std::unique_ptr<std::ostream> m_output;
        std::unique_ptr<StdioTransport> m_transport;
    };

    TEST_F(StdioTransportTest, PipelinedRequests_EachAnsweredOnceWithOnlyProtocolFrames)
    {
        // Arrange
        ASSERT_TRUE(m_transport->start());

        // Act
        send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
             "\n"
             R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
             "\n"
             R"({"jsonrpc":"2.0","id":3,"method":"ping"})"
             "\n");
        auto const lines = m_sink.waitForLines(3, std::chrono::seconds(5));

        // Assert
        ASSERT_EQ(lines.size(), 3u);
        std::set<int> ids;
        for (auto const & line : lines)
        {
            auto const frame = json::parse(line, nullptr, false);
            ASSERT_FALSE(frame.is_discarded()) << line;
            EXPECT_EQ(frame["jsonrpc"], "2.0");
            EXPECT_TRUE(frame.contains("result"));
            ids.insert(frame["id"].get<int>());
        }
        EXPECT_EQ(ids, (std::set<int>{1, 2, 3}));
    }

    TEST_F(StdioTransportTest, MalformedLine_ReportsDecodeErrorAndKeepsReading)
    {
        // Arrange
        ASSERT_TRUE(m_transport->start());

        // Act
        send("this is not json\n");
        auto const first = m_sink.waitForLines(1, std::chrono::seconds(5));
        send(R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
             "\n");
        auto const lines = m_sink.waitForLines(2, std::chrono::seconds(5));

        // Assert
        ASSERT_EQ(first.size(), 1u);
        auto const error = json::parse(first[0]);
        EXPECT_TRUE(error["id"].is_null());
        EXPECT_EQ(error["error"]["data"]["code"], "TransportDecodeError");

        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(json::parse(lines[1])["id"], 2);
        EXPECT_TRUE(m_transport->isRunning());
    }

    TEST_F(StdioTransportTest, NotificationsAndBlankLines_ProduceNoOutput)
    {
        // Arrange
        ASSERT_TRUE(m_transport->start());

        // Act
        send("\n   \n");
        send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
             "\r\n");
        send(R"({"jsonrpc":"2.0","id":"last","method":"ping"})"
             "\n");
        auto const lines = m_sink.waitForLines(1, std::chrono::seconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Assert
        ASSERT_EQ(m_sink.snapshot().size(), 1u);
        EXPECT_EQ(json::parse(lines[0])["id"], "last");
    }

    TEST_F(StdioTransportTest, ToolCall_CompactEnvelope_WritesCompactResponse)
    {
        // Arrange
        EXPECT_CALL(m_executor, invoke(_))
          .WillOnce(Return(ToolOutcome{ToolSuccess{"Created cube 'Cube' at [0, 0, 0] with size 2"}}));
        ASSERT_TRUE(m_transport->start());

        // Act
        send(R"({"id":"1","tool":"create_cube","args":{"name":"Cube","location":[0,0,0],"size":2.0}})"
             "\n");
        auto const lines = m_sink.waitForLines(1, std::chrono::seconds(5));

        // Assert
        ASSERT_EQ(lines.size(), 1u);
        EXPECT_EQ(json::parse(lines[0]),
                  json({{"id", "1"}, {"result", "Created cube 'Cube' at [0, 0, 0] with size 2"}}));
    }

    TEST_F(StdioTransportTest, FinalLineWithoutNewline_IsProcessedAtEndOfInput)
    {
        // Arrange
        std::promise<void> ended;
        ASSERT_TRUE(m_transport->start([&ended]() { ended.set_value(); }));

        // Act
        send(R"({"jsonrpc":"2.0","id":9,"method":"ping"})");
        closeInput();
        auto const status = ended.get_future().wait_for(std::chrono::seconds(5));
        auto const lines = m_sink.waitForLines(1, std::chrono::seconds(5));

        // Assert
        EXPECT_EQ(status, std::future_status::ready);
        ASSERT_EQ(lines.size(), 1u);
        EXPECT_EQ(json::parse(lines[0])["id"], 9);
    }

    TEST_F(StdioTransportTest, EndOfInput_AnswersEveryRequestBeforeSignallingEnd)
    {
        // Arrange
        constexpr int requestCount = 6;
        ON_CALL(m_executor, invoke(_))
          .WillByDefault(
            [](ToolCall const &) -> ToolOutcome
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                return ToolSuccess{"Reset scene - cleared all objects"};
            });
        std::promise<std::vector<std::string>> ended;
        ASSERT_TRUE(m_transport->start([this, &ended]() { ended.set_value(m_sink.snapshot()); }));

        // Act
        std::string input;
        for (int id = 1; id <= requestCount; ++id)
        {
            input += json({{"jsonrpc", "2.0"},
                           {"id", id},
                           {"method", "tools/call"},
                           {"params", {{"name", "reset_scene"}}}})
                       .dump() +
                     "\n";
        }
        send(input);
        closeInput();
        auto endedFuture = ended.get_future();
        ASSERT_EQ(endedFuture.wait_for(std::chrono::seconds(10)), std::future_status::ready);
        auto const lines = endedFuture.get();

        // Assert
        ASSERT_EQ(lines.size(), static_cast<size_t>(requestCount));
        std::set<int> ids;
        for (auto const & line : lines)
        {
            auto const frame = json::parse(line);
            EXPECT_TRUE(frame.contains("result")) << line;
            ids.insert(frame["id"].get<int>());
        }
        EXPECT_EQ(ids.size(), static_cast<size_t>(requestCount));
    }

    TEST_F(StdioTransportTest, Stop_CancelsInFlightRequestWithoutResponse)
    {
        // Arrange
        std::promise<CancellationFlag> entered;
        std::promise<void> release;
        auto releaseFuture = release.get_future().share();
        EXPECT_CALL(m_executor, invoke(_))
          .WillOnce(
            [&entered, releaseFuture](ToolCall const & call) -> ToolOutcome
            {
                entered.set_value(call.cancelled);
                releaseFuture.wait();
                return ToolSuccess{"too late"};
            });
        ASSERT_TRUE(m_transport->start());

        // Act
        send(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"reset_scene"}})"
             "\n");
        auto const flag = entered.get_future().get();
        auto stopping = std::async(std::launch::async, [this]() { m_transport->stop(); });
        for (int i = 0; i < 500 && !(flag && flag->load()); ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        bool const cancelled = flag && flag->load();
        release.set_value();
        stopping.wait();

        // Assert
        EXPECT_TRUE(cancelled);
        EXPECT_TRUE(m_sink.snapshot().empty());
        EXPECT_FALSE(m_transport->isRunning());
    }

    TEST_F(StdioTransportTest, Stop_IsIdempotent)
    {
        ASSERT_TRUE(m_transport->start());
        EXPECT_FALSE(m_transport->start());

        m_transport->stop();
        m_transport->stop();

        EXPECT_FALSE(m_transport->isRunning());
    }
}
