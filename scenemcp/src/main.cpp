#include "CommandLine.h"
#include "ConfigManager.h"
#include "EventLogger.h"
#include "ProcessControl.h"
#include "ServerConfig.h"
#include "Supervisor.h"
#include "exceptions.h"
#include "scopeguard.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

namespace
{
    constexpr int EXIT_CONFIG_ERROR = 2;
    constexpr int EXIT_NOT_RUNNING = 3;

    std::filesystem::path executableDirectory()
    {
        std::error_code ec;
        auto const executable = std::filesystem::read_symlink("/proc/self/exe", ec);
        return ec ? std::filesystem::path{} : executable.parent_path();
    }

    scenemcp::ServerConfig loadConfig(scenemcp::CommandLineOptions const & options)
    {
        auto config = scenemcp::defaultServerConfig();

        auto settings = options.configFile
                          ? std::make_unique<scenemcp::ConfigManager>(*options.configFile)
                          : std::make_unique<scenemcp::ConfigManager>();
        scenemcp::applyConfigFile(config, *settings);
        scenemcp::applyEnvironment(config, scenemcp::processEnvironment());
        scenemcp::applyCommandLine(config, options);
        scenemcp::validateServerConfig(config);

        config.workerCommand =
          scenemcp::resolveWorkerCommand(config.workerCommand, executableDirectory());
        return config;
    }

    int runStop(scenemcp::ServerConfig const & config)
    {
        auto const path = scenemcp::resolvePidFile(config);
        if (path.empty())
        {
            std::cout << "stdio servers record no pid file, pass --pid-file or --http <port>"
                      << std::endl;
            return 0;
        }

        scenemcp::PidFile const pidFile(path);
        switch (scenemcp::stopRecordedProcess(
          pidFile, scenemcp::processExecutable(::getpid()), config.shutdownGrace))
        {
        case scenemcp::StopResult::NotRunning:
            std::cout << "scenemcp-server is not running" << std::endl;
            break;
        case scenemcp::StopResult::Stopped:
            std::cout << "scenemcp-server stopped" << std::endl;
            break;
        case scenemcp::StopResult::Killed:
            std::cout << "scenemcp-server killed after " << config.shutdownGrace.count()
                      << " ms grace period" << std::endl;
            break;
        }
        return 0;
    }

    /// Pid of another live server recorded in the pid file, if any
    std::optional<pid_t> recordedServer(std::filesystem::path const & path)
    {
        if (path.empty())
        {
            return std::nullopt;
        }
        auto const pid = scenemcp::PidFile(path).read();
        if (pid && *pid != ::getpid() &&
            scenemcp::isProcessRunning(*pid, scenemcp::processExecutable(::getpid())))
        {
            return pid;
        }
        return std::nullopt;
    }

    int runStatus(scenemcp::ServerConfig const & config)
    {
        if (auto const pid = recordedServer(scenemcp::resolvePidFile(config)))
        {
            std::cout << "scenemcp-server is running (pid " << *pid << ")" << std::endl;
            return 0;
        }
        std::cout << "scenemcp-server is stopped" << std::endl;
        return EXIT_NOT_RUNNING;
    }
}

int main(int argc, char ** argv)
{
    scenemcp::CommandLineOptions options;
    scenemcp::ServerConfig config;
    try
    {
        options = scenemcp::parseCommandLine(argc, argv);
        if (options.command == scenemcp::Command::Help)
        {
            scenemcp::printUsage(std::cout);
            return 0;
        }
        config = loadConfig(options);
    }
    catch (scenemcp::ConfigError const & e)
    {
        std::cerr << e.what() << std::endl;
        scenemcp::printUsage(std::cerr);
        return EXIT_CONFIG_ERROR;
    }

    if (options.command == scenemcp::Command::Stop)
    {
        return runStop(config);
    }
    if (options.command == scenemcp::Command::Status)
    {
        return runStatus(config);
    }

    // Starting an HTTP server that already runs on the same pid file is a no-op. Stdio
    // servers are private to their client and never share a pid file.
    auto const pidPath = scenemcp::resolvePidFile(config);
    if (config.transport == scenemcp::TransportMode::Http)
    {
        if (auto const pid = recordedServer(pidPath))
        {
            std::cerr << "scenemcp-server is already running (pid " << *pid << ")" << std::endl;
            return 0;
        }
    }

    // Graceful termination flag
    static std::atomic<bool> terminateRequested{false};
    auto signalHandler = [](int) { terminateRequested.store(true); };
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto logger = std::make_shared<scenemcp::events::Logger>();
    logger->setVerbose(config.verbose);
    logger->setFileLoggingEnabled(config.logToFile);

    // In stdio mode stdout carries protocol frames only. Everything else that writes to
    // std::cout ends up on stderr.
    std::streambuf * const originalStdout = std::cout.rdbuf();
    std::ostream protocolOut(originalStdout);
    if (config.transport == scenemcp::TransportMode::Stdio)
    {
        std::cout.rdbuf(std::cerr.rdbuf());
    }
    scenemcp::scope_guard const restoreStdout([originalStdout]() { std::cout.rdbuf(originalStdout); });

    scenemcp::PidFile const pidFile(pidPath);
    if (!pidPath.empty())
    {
        try
        {
            pidFile.write(::getpid());
        }
        catch (scenemcp::FileIOError const & e)
        {
            logger->logWarning(e.what());
        }
    }
    scenemcp::scope_guard const removePidFile(
      [&pidFile, &pidPath]()
      {
          if (!pidPath.empty())
          {
              pidFile.remove();
          }
      });

    scenemcp::Supervisor supervisor(config, logger, protocolOut);
    try
    {
        supervisor.start();
    }
    catch (scenemcp::ScenemcpException const & e)
    {
        logger->logFatalError(e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (config.transport == scenemcp::TransportMode::Http)
    {
        std::cerr << "scenemcp-server listening on http://" << config.host << ":"
                  << supervisor.httpPort() << "/mcp" << std::endl;
    }

    while (!terminateRequested.load() &&
           !supervisor.waitForShutdown(std::chrono::milliseconds(200)))
    {
    }

    supervisor.stop();
    return 0;
}
