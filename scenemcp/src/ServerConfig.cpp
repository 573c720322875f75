#include "ServerConfig.h"
#include "ConfigManager.h"
#include "exceptions.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>

namespace scenemcp
{
    namespace
    {
        constexpr auto SECTION = "server";

        std::string toLower(std::string value)
        {
            std::transform(value.begin(),
                           value.end(),
                           value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        long long parseInteger(std::string const & name, std::string const & value)
        {
            try
            {
                size_t consumed = 0;
                long long result = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    throw ConfigError(fmt::format("{} must be an integer, got '{}'", name, value));
                }
                return result;
            }
            catch (std::invalid_argument const &)
            {
                throw ConfigError(fmt::format("{} must be an integer, got '{}'", name, value));
            }
            catch (std::out_of_range const &)
            {
                throw ConfigError(fmt::format("{} is out of range: '{}'", name, value));
            }
        }

        std::chrono::milliseconds
        durationFromSettings(ConfigManager const & settings,
                             std::string const & key,
                             std::chrono::milliseconds fallback)
        {
            auto const value = settings.getValue<long long>(SECTION, key, fallback.count());
            if (value <= 0)
            {
                throw ConfigError(fmt::format("{} must be positive, got {}", key, value));
            }
            return std::chrono::milliseconds{value};
        }
    }

    TransportMode parseTransportMode(std::string const & value)
    {
        auto const lowered = toLower(value);
        if (lowered == "stdio")
        {
            return TransportMode::Stdio;
        }
        if (lowered == "http")
        {
            return TransportMode::Http;
        }
        throw ConfigError(fmt::format("unknown transport '{}', expected stdio or http", value));
    }

    std::string toString(TransportMode mode)
    {
        return mode == TransportMode::Http ? "http" : "stdio";
    }

    ServerConfig defaultServerConfig()
    {
        return ServerConfig{};
    }

    std::filesystem::path resolvePidFile(ServerConfig const & config)
    {
        if (!config.pidFile.empty())
        {
            return config.pidFile;
        }
        if (config.transport == TransportMode::Stdio)
        {
            return {};
        }
        return std::filesystem::temp_directory_path() / "scenemcp" /
               fmt::format("scenemcp-server-http-{}.pid", config.port);
    }

    std::chrono::milliseconds parseMilliseconds(std::string const & name, std::string const & value)
    {
        auto const parsed = parseInteger(name, value);
        if (parsed <= 0)
        {
            throw ConfigError(fmt::format("{} must be positive, got {}", name, parsed));
        }
        return std::chrono::milliseconds{parsed};
    }

    int parsePort(std::string const & value)
    {
        auto const parsed = parseInteger("port", value);
        if (parsed < 0 || parsed > 65535)
        {
            throw ConfigError(fmt::format("invalid port number: {}", parsed));
        }
        return static_cast<int>(parsed);
    }

    void applyConfigFile(ServerConfig & config, ConfigManager const & settings)
    {
        if (settings.hasValue(SECTION, "transport"))
        {
            config.transport =
              parseTransportMode(settings.getValue<std::string>(SECTION, "transport", "stdio"));
        }

        config.host = settings.getValue<std::string>(SECTION, "host", config.host);
        config.port = settings.getValue<int>(SECTION, "port", config.port);
        config.timeout = durationFromSettings(settings, "timeout_ms", config.timeout);
        config.workerStartTimeout =
          durationFromSettings(settings, "worker_start_timeout_ms", config.workerStartTimeout);
        config.shutdownGrace =
          durationFromSettings(settings, "shutdown_grace_ms", config.shutdownGrace);
        config.workerCommand =
          settings.getValue<std::string>(SECTION, "worker_command", config.workerCommand);
        config.workerArgs =
          settings.getValue<std::vector<std::string>>(SECTION, "worker_args", config.workerArgs);
        config.restartFailureThreshold = settings.getValue<uint32_t>(
          SECTION, "restart_failure_threshold", config.restartFailureThreshold);
        config.restartFailureWindow =
          durationFromSettings(settings, "restart_failure_window_ms", config.restartFailureWindow);
        config.restartCooldown =
          durationFromSettings(settings, "restart_cooldown_ms", config.restartCooldown);
        config.logToFile = settings.getValue<bool>(SECTION, "log_to_file", config.logToFile);
        config.verbose = settings.getValue<bool>(SECTION, "verbose", config.verbose);

        if (settings.hasValue(SECTION, "pid_file"))
        {
            config.pidFile = settings.getValue<std::string>(SECTION, "pid_file", "");
        }
    }

    void applyEnvironment(ServerConfig & config, EnvironmentLookup const & lookup)
    {
        auto firstOf = [&lookup](std::string const & primary,
                                 std::string const & legacy) -> std::optional<std::string>
        {
            if (auto value = lookup(primary); value && !value->empty())
            {
                return value;
            }
            if (auto value = lookup(legacy); value && !value->empty())
            {
                return value;
            }
            return std::nullopt;
        };

        if (auto transport = firstOf("SCENEMCP_TRANSPORT", "MCP_TRANSPORT"))
        {
            config.transport = parseTransportMode(*transport);
        }
        if (auto port = firstOf("SCENEMCP_PORT", "PORT"))
        {
            config.port = parsePort(*port);
        }
        if (auto timeout = lookup("SCENEMCP_TIMEOUT_MS"); timeout && !timeout->empty())
        {
            config.timeout = parseMilliseconds("SCENEMCP_TIMEOUT_MS", *timeout);
        }
        if (auto worker = lookup("SCENEMCP_WORKER"); worker && !worker->empty())
        {
            config.workerCommand = *worker;
        }
    }

    EnvironmentLookup processEnvironment()
    {
        return [](std::string const & name) -> std::optional<std::string>
        {
            char const * value = std::getenv(name.c_str());
            if (!value)
            {
                return std::nullopt;
            }
            return std::string{value};
        };
    }

    void validateServerConfig(ServerConfig const & config)
    {
        if (config.port < 0 || config.port > 65535)
        {
            throw ConfigError(fmt::format("invalid port number: {}", config.port));
        }
        if (config.timeout.count() <= 0)
        {
            throw ConfigError("timeout_ms must be positive");
        }
        if (config.workerStartTimeout.count() <= 0)
        {
            throw ConfigError("worker_start_timeout_ms must be positive");
        }
        if (config.workerCommand.empty())
        {
            throw ConfigError("worker_command must not be empty");
        }
        if (config.restartFailureThreshold == 0)
        {
            throw ConfigError("restart_failure_threshold must be at least 1");
        }
        if (config.transport == TransportMode::Http && config.host.empty())
        {
            throw ConfigError("host must not be empty for the http transport");
        }
    }

    std::string resolveWorkerCommand(std::string const & command,
                                     std::filesystem::path const & executableDir)
    {
        if (command.find('/') != std::string::npos || executableDir.empty())
        {
            return command;
        }

        std::error_code ec;
        auto const candidate = executableDir / command;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate.string();
        }
        return command;
    }
}
