#include "EventLogger.h"

#include <coro/coro.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace scenemcp::events
{
    Event::Event(std::string msg, Severity severity)
        : m_timestamp(std::chrono::system_clock::now())
        , m_msg(std::move(msg))
        , m_severity(severity)
    {
    }

    std::chrono::system_clock::time_point Event::getTimeStamp() const
    {
        return m_timestamp;
    }

    std::string Event::getMessage() const
    {
        return m_msg;
    }

    Severity Event::getSeverity() const
    {
        return m_severity;
    }

    void Logger::initialize()
    {
        if (m_initialized)
        {
            return;
        }

        if (m_logDirectory.empty())
        {
            m_logDirectory = std::filesystem::temp_directory_path() / "scenemcp" / "logs";
        }
        ensureLogDirectoryExists();

        m_logFilePath = m_logDirectory / generateLogFilename();

        if (m_fileLoggingEnabled)
        {
            m_fileWritePool = coro::thread_pool::make_shared(coro::thread_pool::options{
              .thread_count = 1, // Single thread for file writing to avoid conflicts
              .on_thread_start_functor = [](std::size_t) {},
              .on_thread_stop_functor = [](std::size_t) {}});
        }

        m_initialized = true;
    }

    Logger::~Logger()
    {
        try
        {
            flush();
        }
        catch (std::exception const & e)
        {
            std::cerr << "[scenemcp] failed to flush log file: " << e.what() << "\n";
        }

        if (m_fileWritePool)
        {
            m_fileWritePool->shutdown();
        }
    }

    void Logger::addEvent(Event const & event)
    {
        {
            std::lock_guard<std::mutex> initLock(m_initMutex);
            if (m_fileLoggingEnabled && !m_initialized)
            {
                initialize();
            }
        }

        {
            std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
            if (event.getSeverity() == Severity::Error ||
                event.getSeverity() == Severity::FatalError)
            {
                m_countErrors++;
            }
            else if (event.getSeverity() == Severity::Warning)
            {
                m_countWarnings++;
            }
            m_events.push_back(event);
            while (m_events.size() > MAX_RETAINED_EVENTS)
            {
                m_events.pop_front();
            }
        }

        if (m_fileLoggingEnabled && m_initialized)
        {
            if (event.getSeverity() == Severity::FatalError)
            {
                // Fatal errors: write immediately (synchronous)
                std::lock_guard<std::mutex> fileLock(m_fileMutex);
                std::ofstream logFile(m_logFilePath, std::ios::app);
                if (logFile.is_open())
                {
                    logFile << formatEvent(event) << std::endl;
                    m_lastFlushTime = std::chrono::steady_clock::now();
                }
                else
                {
                    m_fileLoggingEnabled = false;
                }
            }
            else
            {
                bool shouldWrite = false;
                {
                    std::lock_guard<std::mutex> fileLock(m_fileMutex);
                    m_pendingFileEvents.push_back(event);

                    shouldWrite =
                      (m_pendingFileEvents.size() >= 10 || event.getSeverity() == Severity::Error ||
                       shouldFlushByTime());
                }

                if (shouldWrite)
                {
                    flush();
                }
            }
        }

        writeToConsole(event);
    }

    void Logger::writeToConsole(Event const & event) const
    {
        if (m_outputMode != OutputMode::Console)
        {
            return;
        }

        if (event.getSeverity() == Severity::Info && !m_verbose)
        {
            return;
        }

        std::lock_guard<std::mutex> consoleLock(m_consoleMutex);
        std::cerr << "[scenemcp] " << formatEvent(event) << "\n";
    }

    void Logger::logInfo(const std::string & message)
    {
        addEvent(Event(message, Severity::Info));
    }

    void Logger::logWarning(const std::string & message)
    {
        addEvent(Event(message, Severity::Warning));
    }

    void Logger::logError(const std::string & message)
    {
        addEvent(Event(message, Severity::Error));
    }

    void Logger::logFatalError(const std::string & message)
    {
        addEvent(Event(message, Severity::FatalError));
    }

    void Logger::clear()
    {
        flush();

        {
            std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
            m_events.clear();
            m_countErrors = 0;
            m_countWarnings = 0;
        }

        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            m_pendingFileEvents.clear();
        }
    }

    void Logger::flush()
    {
        if (!m_fileLoggingEnabled || !m_fileWritePool)
        {
            return;
        }

        bool hasEvents = false;
        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            hasEvents = !m_pendingFileEvents.empty();
        }

        if (hasEvents)
        {
            coro::sync_wait(writeEventsToFile());
        }
    }

    std::vector<Event> Logger::snapshot() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return {m_events.cbegin(), m_events.cend()};
    }

    size_t Logger::size() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_events.size();
    }

    size_t Logger::getErrorCount() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_countErrors;
    }

    size_t Logger::getWarningCount() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_countWarnings;
    }

    std::filesystem::path Logger::getLogFilePath() const
    {
        return m_logFilePath;
    }

    void Logger::setLogDirectory(std::filesystem::path directory)
    {
        m_logDirectory = std::move(directory);
    }

    void Logger::setFileLoggingEnabled(bool enabled)
    {
        m_fileLoggingEnabled = enabled;
        if (enabled && !m_initialized)
        {
            std::lock_guard<std::mutex> initLock(m_initMutex);
            initialize();
        }
    }

    void Logger::ensureLogDirectoryExists()
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_logDirectory, ec))
        {
            std::filesystem::create_directories(m_logDirectory, ec);
        }
        if (ec)
        {
            // Keep running without a log file, the console mirror still works
            m_fileLoggingEnabled = false;
        }
    }

    std::string Logger::generateLogFilename() const
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);

        std::tm tm_result;
        localtime_r(&time_t_val, &tm_result);

        std::ostringstream oss;
        oss << "scenemcp_" << std::put_time(&tm_result, "%Y%m%d_%H%M%S") << "_" << ::getpid()
            << ".log";
        return oss.str();
    }

    std::string Logger::formatEvent(Event const & event) const
    {
        auto time_t_val = std::chrono::system_clock::to_time_t(event.getTimeStamp());

        std::tm tm_result;
        localtime_r(&time_t_val, &tm_result);

        std::ostringstream oss;
        oss << "[" << std::put_time(&tm_result, "%Y-%m-%d %H:%M:%S") << "] ";

        switch (event.getSeverity())
        {
        case Severity::Info:
            oss << "[INFO] ";
            break;
        case Severity::Warning:
            oss << "[WARN] ";
            break;
        case Severity::Error:
            oss << "[ERROR] ";
            break;
        case Severity::FatalError:
            oss << "[FATAL] ";
            break;
        }

        oss << event.getMessage();
        return oss.str();
    }

    coro::task<void> Logger::writeEventsToFile()
    {
        std::vector<Event> eventsToWrite;

        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            if (m_pendingFileEvents.empty())
            {
                co_return;
            }
            eventsToWrite.swap(m_pendingFileEvents);
        }

        // Switch to the file writing thread pool
        co_await m_fileWritePool->schedule();

        std::lock_guard<std::mutex> fileLock(m_fileMutex);
        std::ofstream logFile(m_logFilePath, std::ios::app);
        if (!logFile.is_open())
        {
            m_fileLoggingEnabled = false;
            co_return;
        }

        for (Event const & event : eventsToWrite)
        {
            logFile << formatEvent(event) << '\n';
        }
        logFile.flush();
        m_lastFlushTime = std::chrono::steady_clock::now();
    }

    bool Logger::shouldFlushByTime() const
    {
        auto now = std::chrono::steady_clock::now();
        return (now - m_lastFlushTime) >= FLUSH_INTERVAL;
    }
}
