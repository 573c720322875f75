#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <sys/types.h>

namespace scenemcp
{
    /// @brief Pid file recording the running server instance
    class PidFile
    {
      public:
        explicit PidFile(std::filesystem::path path);

        /// @throws FileIOError if the file or its directory cannot be written
        void write(pid_t pid) const;

        /// Empty if the file is missing or does not contain a pid
        [[nodiscard]] std::optional<pid_t> read() const;

        /// Removes the file if present
        void remove() const;

        [[nodiscard]] std::filesystem::path const & path() const
        {
            return m_path;
        }

      private:
        std::filesystem::path m_path;
    };

    [[nodiscard]] bool isProcessAlive(pid_t pid);

    /// Executable image of a process as reported by /proc, empty if it cannot be inspected
    [[nodiscard]] std::filesystem::path processExecutable(pid_t pid);

    /// True if pid is alive and runs the given executable
    [[nodiscard]] bool isProcessRunning(pid_t pid, std::filesystem::path const & executable);

    enum class StopResult
    {
        NotRunning,
        Stopped,
        Killed
    };

    /**
     * @brief Stop the process recorded in a pid file
     *
     * Only a process running the given executable is signalled: a pid that was reused by
     * another program counts as stale. Sends SIGTERM, waits up to grace for the process to
     * exit and sends SIGKILL afterwards. A missing pid file or a stale pid counts as
     * NotRunning. The pid file is removed in every case.
     */
    StopResult stopRecordedProcess(PidFile const & pidFile,
                                   std::filesystem::path const & executable,
                                   std::chrono::milliseconds grace);
}
