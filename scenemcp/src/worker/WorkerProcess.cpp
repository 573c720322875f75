/**
 * @file WorkerProcess.cpp
 * @brief fork/exec based worker process
 */

#include "WorkerProcess.h"
#include "../exceptions.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace scenemcp::worker
{
    namespace
    {
        constexpr int POLL_SLICE_MS = 50;

        void ignoreSigpipe()
        {
            // A crashed worker must surface as a write error, not terminate the server
            static std::once_flag once;
            std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
        }

        void closeFd(int & fd)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        std::string errnoText(int error)
        {
            return std::strerror(error);
        }
    }

    std::string describeExitStatus(int status)
    {
        if (WIFEXITED(status))
        {
            return fmt::format("exited with status {}", WEXITSTATUS(status));
        }
        if (WIFSIGNALED(status))
        {
            return fmt::format("killed by signal {}", WTERMSIG(status));
        }
        return fmt::format("ended with wait status {}", status);
    }

    WorkerProcess::~WorkerProcess()
    {
        if (m_pid > 0)
        {
            terminate(std::chrono::milliseconds(500));
        }
        closeDescriptors();
    }

    void WorkerProcess::spawn(std::string const & command, std::vector<std::string> const & args)
    {
        if (m_pid > 0)
        {
            throw WorkerStartError("worker process is already running");
        }
        ignoreSigpipe();

        int stdinPipe[2] = {-1, -1};
        int stdoutPipe[2] = {-1, -1};
        int execStatusPipe[2] = {-1, -1};

        auto closeAll = [&]()
        {
            for (int * pipeFds : {stdinPipe, stdoutPipe, execStatusPipe})
            {
                closeFd(pipeFds[0]);
                closeFd(pipeFds[1]);
            }
        };

        if (::pipe2(stdinPipe, O_CLOEXEC) == -1 || ::pipe2(stdoutPipe, O_CLOEXEC) == -1 ||
            ::pipe2(execStatusPipe, O_CLOEXEC) == -1)
        {
            int const error = errno;
            closeAll();
            throw WorkerStartError(fmt::format("cannot create pipes: {}", errnoText(error)));
        }

        std::vector<std::string> argvStorage;
        argvStorage.push_back(command);
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());
        std::vector<char *> argv;
        for (auto & arg : argvStorage)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        pid_t const pid = ::fork();
        if (pid == -1)
        {
            int const error = errno;
            closeAll();
            throw WorkerStartError(fmt::format("fork failed: {}", errnoText(error)));
        }

        if (pid == 0)
        {
            // Child process: only async-signal-safe calls from here on
            ::dup2(stdinPipe[0], STDIN_FILENO);
            ::dup2(stdoutPipe[1], STDOUT_FILENO);
            ::execvp(argv[0], argv.data());

            int const error = errno;
            ssize_t const written = ::write(execStatusPipe[1], &error, sizeof(error));
            (void) written;
            ::_exit(127);
        }

        closeFd(stdinPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(execStatusPipe[1]);

        // The status pipe is closed by a successful exec and carries errno otherwise
        int execError = 0;
        ssize_t count = 0;
        do
        {
            count = ::read(execStatusPipe[0], &execError, sizeof(execError));
        } while (count == -1 && errno == EINTR);
        closeFd(execStatusPipe[0]);

        if (count > 0)
        {
            closeFd(stdinPipe[1]);
            closeFd(stdoutPipe[0]);
            int status = 0;
            ::waitpid(pid, &status, 0);
            throw WorkerStartError(
              fmt::format("cannot execute '{}': {}", command, errnoText(execError)));
        }

        m_pid = pid;
        m_stdinFd = stdinPipe[1];
        m_stdoutFd = stdoutPipe[0];
        m_readBuffer.clear();
        m_exitStatus.reset();
    }

    void WorkerProcess::writeLine(std::string const & line)
    {
        if (m_stdinFd < 0)
        {
            throw WorkerCrashedError("worker input is closed");
        }

        std::string const data = line + "\n";
        size_t offset = 0;
        while (offset < data.size())
        {
            ssize_t const written = ::write(m_stdinFd, data.data() + offset, data.size() - offset);
            if (written < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw WorkerCrashedError(
                  fmt::format("cannot write to worker: {}", errnoText(errno)));
            }
            offset += static_cast<size_t>(written);
        }
    }

    std::optional<std::string> WorkerProcess::readLine(std::chrono::steady_clock::time_point deadline,
                                                       std::atomic<bool> const * abort)
    {
        if (m_stdoutFd < 0)
        {
            throw WorkerCrashedError("worker output is closed");
        }

        char chunk[4096];
        while (true)
        {
            auto const newline = m_readBuffer.find('\n');
            if (newline != std::string::npos)
            {
                std::string line = m_readBuffer.substr(0, newline);
                m_readBuffer.erase(0, newline + 1);
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                return line;
            }

            if (abort && abort->load())
            {
                return std::nullopt;
            }

            auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
              deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                return std::nullopt;
            }

            pollfd descriptor{m_stdoutFd, POLLIN, 0};
            int const timeout =
              static_cast<int>(std::min<long long>(remaining.count(), POLL_SLICE_MS));
            int const ready = ::poll(&descriptor, 1, timeout);
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw WorkerCrashedError(fmt::format("poll failed: {}", errnoText(errno)));
            }
            if (ready == 0)
            {
                continue;
            }

            ssize_t const count = ::read(m_stdoutFd, chunk, sizeof(chunk));
            if (count < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                {
                    continue;
                }
                throw WorkerCrashedError(fmt::format("read failed: {}", errnoText(errno)));
            }
            if (count == 0)
            {
                reap(false);
                throw WorkerCrashedError(
                  m_exitStatus ? describeExitStatus(*m_exitStatus) : "worker closed its output");
            }
            m_readBuffer.append(chunk, static_cast<size_t>(count));
        }
    }

    bool WorkerProcess::terminate(std::chrono::milliseconds grace)
    {
        if (m_pid <= 0)
        {
            closeDescriptors();
            return true;
        }

        // Closing stdin lets a well-behaved worker exit on end of file
        closeFd(m_stdinFd);
        if (!reap(false))
        {
            ::kill(m_pid, SIGTERM);
        }

        auto const deadline = std::chrono::steady_clock::now() + grace;
        while (m_pid > 0 && std::chrono::steady_clock::now() < deadline)
        {
            if (reap(false))
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        bool const graceful = m_pid <= 0;
        if (!graceful)
        {
            ::kill(m_pid, SIGKILL);
            reap(true);
        }

        closeDescriptors();
        return graceful;
    }

    bool WorkerProcess::isAlive()
    {
        if (m_pid <= 0)
        {
            return false;
        }
        return !reap(false);
    }

    bool WorkerProcess::reap(bool block)
    {
        if (m_pid <= 0)
        {
            return true;
        }

        int status = 0;
        pid_t result = 0;
        do
        {
            result = ::waitpid(m_pid, &status, block ? 0 : WNOHANG);
        } while (result == -1 && errno == EINTR);

        if (result == m_pid || (result == -1 && errno == ECHILD))
        {
            if (result == m_pid)
            {
                m_exitStatus = status;
            }
            m_pid = -1;
            return true;
        }
        return false;
    }

    void WorkerProcess::closeDescriptors()
    {
        closeFd(m_stdinFd);
        closeFd(m_stdoutFd);
    }
}
