#include "ProcessControl.h"
#include "exceptions.h"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <string_view>
#include <thread>

#include <fmt/format.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scenemcp
{
    PidFile::PidFile(std::filesystem::path path)
        : m_path(std::move(path))
    {
    }

    void PidFile::write(pid_t pid) const
    {
        std::error_code ec;
        if (m_path.has_parent_path())
        {
            std::filesystem::create_directories(m_path.parent_path(), ec);
            if (ec)
            {
                throw FileIOError(fmt::format(
                  "cannot create directory {}: {}", m_path.parent_path().string(), ec.message()));
            }
        }

        std::ofstream file(m_path, std::ios::trunc);
        if (!file.is_open())
        {
            throw FileIOError(fmt::format("cannot write pid file {}", m_path.string()));
        }
        file << pid << '\n';
    }

    std::optional<pid_t> PidFile::read() const
    {
        std::ifstream file(m_path);
        if (!file.is_open())
        {
            return std::nullopt;
        }

        long value = 0;
        if (!(file >> value) || value <= 0)
        {
            return std::nullopt;
        }
        return static_cast<pid_t>(value);
    }

    void PidFile::remove() const
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    bool isProcessAlive(pid_t pid)
    {
        if (pid <= 0)
        {
            return false;
        }

        // Reap the process if it is our own zombie child
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid)
        {
            return false;
        }

        if (::kill(pid, 0) == 0)
        {
            return true;
        }
        return errno == EPERM;
    }

    std::filesystem::path processExecutable(pid_t pid)
    {
        if (pid <= 0)
        {
            return {};
        }

        std::error_code ec;
        auto const link = std::filesystem::read_symlink(fmt::format("/proc/{}/exe", pid), ec);
        if (ec)
        {
            return {};
        }

        // The kernel marks images replaced on disk after the process started
        constexpr std::string_view deletedSuffix = " (deleted)";
        auto text = link.string();
        if (text.ends_with(deletedSuffix))
        {
            text.erase(text.size() - deletedSuffix.size());
        }
        return text;
    }

    bool isProcessRunning(pid_t pid, std::filesystem::path const & executable)
    {
        if (!isProcessAlive(pid))
        {
            return false;
        }
        auto const image = processExecutable(pid);
        return !image.empty() && image == executable;
    }

    StopResult stopRecordedProcess(PidFile const & pidFile,
                                   std::filesystem::path const & executable,
                                   std::chrono::milliseconds grace)
    {
        auto const pid = pidFile.read();
        if (!pid || !isProcessRunning(*pid, executable))
        {
            pidFile.remove();
            return StopResult::NotRunning;
        }

        ::kill(*pid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (!isProcessAlive(*pid))
            {
                pidFile.remove();
                return StopResult::Stopped;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        ::kill(*pid, SIGKILL);
        for (int i = 0; i < 20 && isProcessAlive(*pid); ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        pidFile.remove();
        return StopResult::Killed;
    }
}
