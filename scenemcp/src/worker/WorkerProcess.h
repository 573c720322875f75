/**
 * @file WorkerProcess.h
 * @brief Child process with line-oriented pipes on its stdin and stdout
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace scenemcp::worker
{
    /**
     * @brief Owns one worker child process
     *
     * The child's stdin and stdout are pipes; its stderr is inherited so diagnostics
     * end up in the server's log stream. The destructor terminates and reaps the child.
     */
    class WorkerProcess
    {
      public:
        WorkerProcess() = default;
        ~WorkerProcess();

        WorkerProcess(WorkerProcess const &) = delete;
        WorkerProcess & operator=(WorkerProcess const &) = delete;

        /**
         * @brief Fork and exec the command
         * @throws WorkerStartError if pipes cannot be created, fork fails or exec fails
         */
        void spawn(std::string const & command, std::vector<std::string> const & args);

        /**
         * @brief Write one line to the child's stdin
         * @throws WorkerCrashedError if the pipe is closed
         */
        void writeLine(std::string const & line);

        /**
         * @brief Read one line from the child's stdout
         * @return Nothing if the deadline passed or abort was set first
         * @throws WorkerCrashedError on end of file or read error
         */
        std::optional<std::string> readLine(std::chrono::steady_clock::time_point deadline,
                                            std::atomic<bool> const * abort = nullptr);

        /**
         * @brief Close stdin, send SIGTERM, wait up to grace, then SIGKILL and reap
         * @return true if the child exited within the grace period
         */
        bool terminate(std::chrono::milliseconds grace);

        /// Reaps the child if it exited
        [[nodiscard]] bool isAlive();

        [[nodiscard]] pid_t pid() const
        {
            return m_pid;
        }

        /// Exit status as reported by waitpid, if the child was reaped
        [[nodiscard]] std::optional<int> exitStatus() const
        {
            return m_exitStatus;
        }

      private:
        bool reap(bool block);
        void closeDescriptors();

        pid_t m_pid{-1};
        int m_stdinFd{-1};
        int m_stdoutFd{-1};
        std::string m_readBuffer;
        std::optional<int> m_exitStatus;
    };

    /// Human readable description of a waitpid status
    std::string describeExitStatus(int status);
}
