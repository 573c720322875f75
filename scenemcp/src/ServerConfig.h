#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scenemcp
{
    class ConfigManager;

    enum class TransportMode
    {
        Stdio,
        Http
    };

    /// Settings consumed by the server core and the supervisor
    struct ServerConfig
    {
        TransportMode transport{TransportMode::Stdio};
        std::string host{"127.0.0.1"};
        int port{4000};

        std::chrono::milliseconds timeout{30000};
        std::chrono::milliseconds workerStartTimeout{10000};
        std::chrono::milliseconds shutdownGrace{5000};

        std::string workerCommand{"scenemcp-worker"};
        std::vector<std::string> workerArgs;

        uint32_t restartFailureThreshold{3};
        std::chrono::milliseconds restartFailureWindow{60000};
        std::chrono::milliseconds restartCooldown{30000};

        bool logToFile{true};
        bool verbose{false};
        /// Explicit pid file, see resolvePidFile for the default
        std::filesystem::path pidFile;
    };

    using EnvironmentLookup = std::function<std::optional<std::string>(std::string const &)>;

    /// @throws ConfigError for anything but "stdio" or "http" (case-insensitive)
    TransportMode parseTransportMode(std::string const & value);

    std::string toString(TransportMode mode);

    ServerConfig defaultServerConfig();

    /**
     * @brief Pid file used by start, stop and status
     *
     * An explicit pid file always wins. Without one an HTTP server records itself in
     * <tmp>/scenemcp/scenemcp-server-http-<port>.pid, so servers on different ports do
     * not collide. A stdio server belongs to the client that spawned it and records no
     * pid file, the result is empty.
     */
    std::filesystem::path resolvePidFile(ServerConfig const & config);

    /// Overlay the "server" section of a settings file
    void applyConfigFile(ServerConfig & config, ConfigManager const & settings);

    /// Overlay SCENEMCP_* (and the legacy MCP_TRANSPORT / PORT) environment variables
    void applyEnvironment(ServerConfig & config, EnvironmentLookup const & lookup);

    /// Lookup backed by ::getenv
    EnvironmentLookup processEnvironment();

    /// @throws ConfigError when a value is out of range
    void validateServerConfig(ServerConfig const & config);

    /// Parse a positive millisecond count, @throws ConfigError
    std::chrono::milliseconds parseMilliseconds(std::string const & name, std::string const & value);

    /// Parse a TCP port (0 means any free port), @throws ConfigError
    int parsePort(std::string const & value);

    /// A bare worker command found next to the server executable resolves to that file,
    /// anything else is left to the PATH lookup of execvp
    std::string resolveWorkerCommand(std::string const & command,
                                     std::filesystem::path const & executableDir);
}
