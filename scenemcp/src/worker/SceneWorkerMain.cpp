#include "../EventLogger.h"
#include "SceneState.h"

#include <fmt/format.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace
{
    void reply(json const & message)
    {
        std::cout << message.dump() << std::endl;
    }
}

int main(int argc, char ** argv)
{
    auto logger = std::make_shared<scenemcp::events::Logger>();
    logger->setFileLoggingEnabled(false);
    for (int i = 1; i < argc; ++i)
    {
        if (std::string(argv[i]) == "--verbose")
        {
            logger->setVerbose(true);
        }
    }

    scenemcp::worker::SceneState scene;
    reply({{"ready", true}, {"worker", "scenemcp-worker"}});

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
        {
            continue;
        }

        json const request = json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object() || !request.contains("tool") ||
            !request["tool"].is_string())
        {
            logger->logWarning(fmt::format("Ignoring malformed request: {}", line));
            continue;
        }

        json const id = request.contains("id") ? request["id"] : json(nullptr);
        auto const tool = request["tool"].get<std::string>();
        auto const arguments = request.contains("arguments") ? request["arguments"] : json::object();

        try
        {
            reply({{"id", id}, {"success", scene.execute(tool, arguments)}});
            logger->logInfo(fmt::format("Executed {}", tool));
        }
        catch (scenemcp::worker::SceneError const & e)
        {
            logger->logWarning(fmt::format("{} failed: {}", tool, e.what()));
            reply({{"id", id}, {"failure", {{"code", e.code()}, {"message", e.what()}}}});
        }
        catch (std::exception const & e)
        {
            logger->logError(fmt::format("{} raised: {}", tool, e.what()));
            reply({{"id", id}, {"failure", {{"code", "InternalError"}, {"message", e.what()}}}});
        }
    }

    return 0;
}
