#pragma once

#include "ServerConfig.h"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace scenemcp
{
    enum class Command
    {
        Start,
        Stop,
        Status,
        Help
    };

    /// Values given on the command line; unset members leave the layered config untouched
    struct CommandLineOptions
    {
        Command command{Command::Start};

        std::optional<TransportMode> transport;
        std::optional<std::string> host;
        std::optional<int> port;
        std::optional<std::chrono::milliseconds> timeout;
        std::optional<std::string> workerCommand;
        std::vector<std::string> workerArgs;
        std::optional<std::filesystem::path> configFile;
        std::optional<std::filesystem::path> pidFile;
        bool verbose{false};
        bool noLogFile{false};
    };

    /**
     * @brief Parse argv into a command and option overrides
     * @throws ConfigError on unknown options or invalid values
     */
    CommandLineOptions parseCommandLine(std::vector<std::string> const & args);

    CommandLineOptions parseCommandLine(int argc, char ** argv);

    /// Overlay the command line on an already layered configuration
    void applyCommandLine(ServerConfig & config, CommandLineOptions const & options);

    void printUsage(std::ostream & out);
}
