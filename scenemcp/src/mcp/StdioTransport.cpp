/**
 * @file StdioTransport.cpp
 * @brief Implementation of the stdio transport
 */

#include "StdioTransport.h"
#include "../scopeguard.h"

#include <cerrno>
#include <fmt/format.h>
#include <httplib.h>
#include <poll.h>
#include <unistd.h>

using json = nlohmann::json;

namespace scenemcp::mcp
{
    namespace
    {
        constexpr int POLL_INTERVAL_MS = 100;
    }

    StdioTransport::StdioTransport(MCPServer & server,
                                   int inputFd,
                                   std::ostream & output,
                                   events::SharedLogger logger,
                                   size_t threadCount)
        : m_server(server)
        , m_inputFd(inputFd)
        , m_output(output)
        , m_logger(std::move(logger))
        , m_threadCount(threadCount)
    {
    }

    StdioTransport::~StdioTransport()
    {
        stop();
    }

    bool StdioTransport::start(std::function<void()> onEndOfInput)
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (m_running)
        {
            return false;
        }

        m_onEndOfInput = std::move(onEndOfInput);
        m_pool = std::make_unique<httplib::ThreadPool>(m_threadCount);
        m_running = true;
        m_readerThread = std::thread([this]() { readLoop(); });
        return true;
    }

    void StdioTransport::stop()
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        m_running = false;

        if (m_readerThread.joinable())
        {
            if (m_readerThread.get_id() == std::this_thread::get_id())
            {
                m_readerThread.detach();
            }
            else
            {
                m_readerThread.join();
            }
        }

        if (m_pool)
        {
            m_session.cancelAll();
            m_pool->shutdown();
            m_pool.reset();
        }
    }

    void StdioTransport::readLoop()
    {
        std::string buffer;
        char chunk[4096];

        while (m_running)
        {
            pollfd descriptor{m_inputFd, POLLIN, 0};
            int const ready = ::poll(&descriptor, 1, POLL_INTERVAL_MS);
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                if (m_logger)
                {
                    m_logger->logError(fmt::format("Polling stdin failed: errno {}", errno));
                }
                break;
            }
            if (ready == 0)
            {
                continue;
            }

            ssize_t const count = ::read(m_inputFd, chunk, sizeof(chunk));
            if (count < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                {
                    continue;
                }
                if (m_logger)
                {
                    m_logger->logError(fmt::format("Reading stdin failed: errno {}", errno));
                }
                break;
            }
            if (count == 0)
            {
                break;
            }

            buffer.append(chunk, static_cast<size_t>(count));
            size_t newline = 0;
            while ((newline = buffer.find('\n')) != std::string::npos)
            {
                std::string line = buffer.substr(0, newline);
                buffer.erase(0, newline + 1);
                handleLine(std::move(line));
            }
        }

        if (!m_running)
        {
            return;
        }

        // A final line without a trailing newline is still a complete frame
        if (!buffer.empty())
        {
            handleLine(std::move(buffer));
        }

        if (m_logger)
        {
            m_logger->logInfo("Input closed, answering pending requests");
        }
        waitForPendingLines();
        if (!m_running)
        {
            return;
        }
        if (m_onEndOfInput)
        {
            m_onEndOfInput();
        }
    }

    void StdioTransport::handleLine(std::string line)
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos)
        {
            return;
        }

        json const parsed = json::parse(line, nullptr, false);
        bool const isNotification = !parsed.is_discarded() && parsed.is_object() &&
                                    parsed.contains("method") && !parsed.contains("id");
        if (isNotification)
        {
            if (auto response = m_server.processMessage(parsed, m_session))
            {
                writeFrame(*response);
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_pendingMutex);
            ++m_pendingLines;
        }
        m_pool->enqueue(
          [this, line = std::move(line)]()
          {
              scope_guard const done(
                [this]()
                {
                    {
                        std::lock_guard<std::mutex> lock(m_pendingMutex);
                        --m_pendingLines;
                    }
                    m_pendingCondition.notify_all();
                });

              if (auto response = m_server.handleFrame(line, m_session))
              {
                  writeFrame(*response);
              }
          });
    }

    void StdioTransport::waitForPendingLines()
    {
        // Each request is bounded by its own deadline, stop() ends the wait early
        std::unique_lock<std::mutex> lock(m_pendingMutex);
        while (m_pendingLines > 0 && m_running)
        {
            m_pendingCondition.wait_for(lock, std::chrono::milliseconds(POLL_INTERVAL_MS));
        }
    }

    void StdioTransport::writeFrame(json const & frame)
    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_output << frame.dump() << '\n';
        m_output.flush();
    }
}
