#include "CommandLine.h"
#include "exceptions.h"

#include <fmt/format.h>
#include <ostream>

namespace scenemcp
{
    namespace
    {
        std::string const & requireValue(std::vector<std::string> const & args, size_t & i)
        {
            if (i + 1 >= args.size())
            {
                throw ConfigError(fmt::format("option {} requires a value", args[i]));
            }
            return args[++i];
        }

        bool nextIsValue(std::vector<std::string> const & args, size_t i)
        {
            return i + 1 < args.size() && !args[i + 1].starts_with("-");
        }
    }

    CommandLineOptions parseCommandLine(std::vector<std::string> const & args)
    {
        CommandLineOptions options;
        bool commandSeen = false;

        for (size_t i = 0; i < args.size(); ++i)
        {
            std::string const & arg = args[i];

            if (arg == "--help" || arg == "-h")
            {
                options.command = Command::Help;
            }
            else if (arg == "--stdio")
            {
                options.transport = TransportMode::Stdio;
            }
            else if (arg == "--http")
            {
                options.transport = TransportMode::Http;
                if (nextIsValue(args, i))
                {
                    options.port = parsePort(args[++i]);
                }
            }
            else if (arg == "--transport")
            {
                options.transport = parseTransportMode(requireValue(args, i));
            }
            else if (arg == "--port")
            {
                options.port = parsePort(requireValue(args, i));
            }
            else if (arg == "--host")
            {
                options.host = requireValue(args, i);
            }
            else if (arg == "--timeout-ms")
            {
                options.timeout = parseMilliseconds("--timeout-ms", requireValue(args, i));
            }
            else if (arg == "--worker")
            {
                options.workerCommand = requireValue(args, i);
            }
            else if (arg == "--worker-arg")
            {
                options.workerArgs.push_back(requireValue(args, i));
            }
            else if (arg == "--config")
            {
                options.configFile = std::filesystem::path(requireValue(args, i));
            }
            else if (arg == "--pid-file")
            {
                options.pidFile = std::filesystem::path(requireValue(args, i));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                options.verbose = true;
            }
            else if (arg == "--no-log-file")
            {
                options.noLogFile = true;
            }
            else if (!arg.starts_with("-") && !commandSeen)
            {
                commandSeen = true;
                if (arg == "start")
                {
                    options.command =
                      options.command == Command::Help ? Command::Help : Command::Start;
                }
                else if (arg == "stop")
                {
                    options.command = Command::Stop;
                }
                else if (arg == "status")
                {
                    options.command = Command::Status;
                }
                else if (arg == "help")
                {
                    options.command = Command::Help;
                }
                else
                {
                    throw ConfigError(fmt::format("unknown command '{}'", arg));
                }
            }
            else
            {
                throw ConfigError(fmt::format("unknown option '{}'", arg));
            }
        }

        return options;
    }

    CommandLineOptions parseCommandLine(int argc, char ** argv)
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return parseCommandLine(args);
    }

    void applyCommandLine(ServerConfig & config, CommandLineOptions const & options)
    {
        if (options.transport)
        {
            config.transport = *options.transport;
        }
        if (options.host)
        {
            config.host = *options.host;
        }
        if (options.port)
        {
            config.port = *options.port;
        }
        if (options.timeout)
        {
            config.timeout = *options.timeout;
        }
        if (options.workerCommand)
        {
            config.workerCommand = *options.workerCommand;
        }
        if (!options.workerArgs.empty())
        {
            config.workerArgs = options.workerArgs;
        }
        if (options.pidFile)
        {
            config.pidFile = *options.pidFile;
        }
        if (options.verbose)
        {
            config.verbose = true;
        }
        if (options.noLogFile)
        {
            config.logToFile = false;
        }
    }

    void printUsage(std::ostream & out)
    {
        out << "Usage: scenemcp-server [start|stop|status] [options]\n";
        out << "Commands:\n";
        out << "  start                 Run the server in the foreground (default)\n";
        out << "  stop                  Stop a server started with the same pid file\n";
        out << "  status                Report whether a server is running\n";
        out << "Options:\n";
        out << "  --stdio               Serve MCP over stdin/stdout (default)\n";
        out << "  --http [port]         Serve MCP over HTTP (default port: 4000)\n";
        out << "  --transport <mode>    stdio or http\n";
        out << "  --host <address>      HTTP bind address (default: 127.0.0.1)\n";
        out << "  --port <port>         HTTP port, 0 picks a free port\n";
        out << "  --timeout-ms <ms>     Per-call timeout (default: 30000)\n";
        out << "  --worker <command>    Worker executable (default: scenemcp-worker)\n";
        out << "  --worker-arg <arg>    Extra worker argument, may be repeated\n";
        out << "  --config <file>       JSON settings file\n";
        out << "  --pid-file <file>     Pid file used by start/stop/status\n";
        out << "                        (default: one per HTTP port, none for stdio)\n";
        out << "  --verbose             Log informational events to stderr\n";
        out << "  --no-log-file         Disable the log file\n";
        out << "  --help                Show this help message\n";
        out << "Environment:\n";
        out << "  SCENEMCP_TRANSPORT (MCP_TRANSPORT), SCENEMCP_PORT (PORT),\n";
        out << "  SCENEMCP_TIMEOUT_MS, SCENEMCP_WORKER\n";
    }
}
