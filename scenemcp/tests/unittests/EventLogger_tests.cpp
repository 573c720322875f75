#include "EventLogger.h"
#include "testhelper.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <thread>

namespace scenemcp::tests
{
    using namespace scenemcp::events;

    /// @brief Test fixture for EventLogger tests
    class EventLoggerTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            m_directory = helper::scratchDirectory("EventLoggerTest");
            m_logger = std::make_shared<Logger>(OutputMode::Silent);
            m_logger->setLogDirectory(m_directory);
        }

        void TearDown() override
        {
            m_logger.reset();
            std::filesystem::remove_all(m_directory);
        }

        std::string readLogFile() const
        {
            std::ifstream file(m_logger->getLogFilePath());
            std::stringstream content;
            content << file.rdbuf();
            return content.str();
        }

        std::filesystem::path m_directory;
        std::shared_ptr<Logger> m_logger;
    };

    TEST_F(EventLoggerTest, Initialize_CreatesLogFilePathInLogDirectory)
    {
        // Arrange & Act
        m_logger->initialize();

        // Assert
        EXPECT_TRUE(m_logger->isFileLoggingEnabled());
        auto const logPath = m_logger->getLogFilePath();
        EXPECT_EQ(logPath.parent_path().string(), m_directory.string());
        EXPECT_TRUE(logPath.filename().string().starts_with("scenemcp_"));
        EXPECT_EQ(logPath.extension().string(), ".log");
    }

    TEST_F(EventLoggerTest, LogInfo_AddsEventToMemoryAndFile)
    {
        // Arrange
        std::string const testMessage = "Worker 1234 ready";

        // Act
        m_logger->logInfo(testMessage);
        m_logger->flush();

        // Assert
        ASSERT_EQ(m_logger->size(), 1u);
        auto const events = m_logger->snapshot();
        EXPECT_EQ(events.front().getMessage(), testMessage);
        EXPECT_EQ(events.front().getSeverity(), Severity::Info);

        auto const content = readLogFile();
        EXPECT_NE(content.find("[INFO] Worker 1234 ready"), std::string::npos);
    }

    TEST_F(EventLoggerTest, LogErrorAndWarning_UpdateCounts)
    {
        // Act
        m_logger->logError("Worker crashed");
        m_logger->logFatalError("Cannot bind port");
        m_logger->logWarning("Discarding stale reply");

        // Assert
        EXPECT_EQ(m_logger->getErrorCount(), 2u);
        EXPECT_EQ(m_logger->getWarningCount(), 1u);
    }

    TEST_F(EventLoggerTest, Clear_ResetsCountsAndEvents)
    {
        // Arrange
        m_logger->logError("error");
        m_logger->logWarning("warning");

        // Act
        m_logger->clear();

        // Assert
        EXPECT_EQ(m_logger->size(), 0u);
        EXPECT_EQ(m_logger->getErrorCount(), 0u);
        EXPECT_EQ(m_logger->getWarningCount(), 0u);
    }

    TEST_F(EventLoggerTest, ManyEvents_RetainsOnlyMostRecent)
    {
        // Arrange
        m_logger->setFileLoggingEnabled(false);

        // Act
        for (size_t i = 0; i < Logger::MAX_RETAINED_EVENTS + 50; ++i)
        {
            m_logger->logInfo("event " + std::to_string(i));
        }

        // Assert
        EXPECT_EQ(m_logger->size(), Logger::MAX_RETAINED_EVENTS);
        EXPECT_EQ(m_logger->snapshot().front().getMessage(), "event 50");
    }

    TEST_F(EventLoggerTest, FileLoggingDisabled_WritesNoFile)
    {
        // Arrange
        m_logger->setFileLoggingEnabled(false);

        // Act
        m_logger->logError("not persisted");
        m_logger->flush();

        // Assert
        EXPECT_EQ(m_logger->size(), 1u);
        EXPECT_TRUE(std::filesystem::is_empty(m_directory));
    }

    TEST_F(EventLoggerTest, ConcurrentLogging_CountsEveryEvent)
    {
        // Arrange
        constexpr int threadCount = 4;
        constexpr int eventsPerThread = 50;
        std::vector<std::thread> threads;

        // Act
        for (int t = 0; t < threadCount; ++t)
        {
            threads.emplace_back(
              [this]()
              {
                  for (int i = 0; i < eventsPerThread; ++i)
                  {
                      m_logger->logWarning("warning");
                  }
              });
        }
        for (auto & thread : threads)
        {
            thread.join();
        }

        // Assert
        EXPECT_EQ(m_logger->getWarningCount(), static_cast<size_t>(threadCount * eventsPerThread));
    }
}
