#pragma once

#include <atomic>
#include <chrono>
#include <coro/coro.hpp>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scenemcp::events
{
    enum class Severity
    {
        Info,
        Warning,
        Error,
        FatalError
    };

    enum class OutputMode
    {
        Console, ///< Diagnostics on stderr (stdout is never used)
        Silent   ///< No console output at all
    };

    class Event
    {
      public:
        Event(std::string msg, Severity severity = Severity::Warning);

        [[nodiscard]] std::chrono::system_clock::time_point getTimeStamp() const;

        [[nodiscard]] std::string getMessage() const;

        [[nodiscard]] Severity getSeverity() const;

      private:
        std::chrono::system_clock::time_point m_timestamp;
        std::string m_msg;
        Severity m_severity;
    };

    using Events = std::deque<Event>;

    /**
     * @brief Thread-safe event log shared by all server components
     *
     * Events are kept in a bounded in-memory list, optionally mirrored to stderr and
     * batched into a log file below the temp directory. The logger never writes to
     * stdout, which is reserved for protocol frames in stdio mode.
     */
    class Logger
    {
      public:
        Logger() = default;
        explicit Logger(OutputMode mode)
            : m_outputMode(mode)
        {
        }

        Logger(Logger const &) = delete;
        Logger & operator=(Logger const &) = delete;

        /// Initialize the logger with file logging capability
        void initialize();

        ~Logger();

        virtual void addEvent(Event const & event);

        void clear();

        void setOutputMode(OutputMode mode)
        {
            m_outputMode = mode;
        }

        OutputMode getOutputMode() const
        {
            return m_outputMode;
        }

        /// Also echo info events to the console (Console mode only)
        void setVerbose(bool verbose)
        {
            m_verbose = verbose;
        }

        void logInfo(const std::string & message);
        void logWarning(const std::string & message);
        void logError(const std::string & message);
        void logFatalError(const std::string & message);

        [[nodiscard]] std::filesystem::path getLogFilePath() const;

        /// Set the directory used for log files; must be called before initialize()
        void setLogDirectory(std::filesystem::path directory);

        void setFileLoggingEnabled(bool enabled);

        [[nodiscard]] bool isFileLoggingEnabled() const
        {
            return m_fileLoggingEnabled;
        }

        /// @brief Write pending log entries to file (blocks until complete)
        void flush();

        /// Copy of the retained events, oldest first
        [[nodiscard]] std::vector<Event> snapshot() const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] size_t getErrorCount() const;

        [[nodiscard]] size_t getWarningCount() const;

        static constexpr size_t MAX_RETAINED_EVENTS{1000};

      private:
        void ensureLogDirectoryExists();

        std::string generateLogFilename() const;

        std::string formatEvent(Event const & event) const;

        /// Write queued events to file on the file writing pool
        coro::task<void> writeEventsToFile();

        void writeToConsole(Event const & event) const;

        bool shouldFlushByTime() const;

        Events m_events;
        size_t m_countErrors{};
        size_t m_countWarnings{};
        OutputMode m_outputMode{OutputMode::Console};
        bool m_verbose{false};

        std::atomic<bool> m_fileLoggingEnabled{true};
        std::filesystem::path m_logDirectory;
        std::filesystem::path m_logFilePath;
        std::vector<Event> m_pendingFileEvents;
        bool m_initialized{false};
        std::shared_ptr<coro::thread_pool> m_fileWritePool;
        std::chrono::steady_clock::time_point m_lastFlushTime{std::chrono::steady_clock::now()};
        static constexpr std::chrono::seconds FLUSH_INTERVAL{1};

        mutable std::mutex m_eventsMutex;
        mutable std::mutex m_fileMutex;
        std::mutex m_initMutex;
        mutable std::mutex m_consoleMutex;
    };

    using SharedLogger = std::shared_ptr<Logger>;
}
