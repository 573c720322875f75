#include "ConfigManager.h"
#include "exceptions.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sago/platform_folders.h>

namespace scenemcp
{
    ConfigManager::ConfigManager()
        : ConfigManager(defaultConfigFilePath())
    {
    }

    ConfigManager::ConfigManager(std::filesystem::path configFilePath)
        : m_configFilePath(std::move(configFilePath))
        , m_config(nlohmann::json::object())
    {
        load();
    }

    std::filesystem::path ConfigManager::defaultConfigFilePath()
    {
        return std::filesystem::path{sago::getConfigHome()} / "scenemcp" / "settings.json";
    }

    bool ConfigManager::hasValue(std::string const & section, std::string const & key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.contains(section) && m_config[section].is_object() &&
               m_config[section].contains(key);
    }

    void ConfigManager::load()
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!std::filesystem::exists(m_configFilePath))
        {
            m_config = nlohmann::json::object();
            return;
        }

        try
        {
            std::ifstream configFile(m_configFilePath);
            if (!configFile.is_open())
            {
                throw FileIOError("Failed to open configuration file: " +
                                  m_configFilePath.string());
            }

            configFile >> m_config;
            if (!m_config.is_object())
            {
                std::cerr << "Ignoring configuration file without a top-level object: "
                          << m_configFilePath.string() << std::endl;
                m_config = nlohmann::json::object();
            }
        }
        catch (nlohmann::json::exception const & e)
        {
            std::cerr << "Error loading configuration file: " << e.what() << std::endl;
            m_config = nlohmann::json::object();
        }
        catch (FileIOError const & e)
        {
            std::cerr << e.what() << std::endl;
            m_config = nlohmann::json::object();
        }
    }

    void ConfigManager::save()
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto const configDir = m_configFilePath.parent_path();
        if (!configDir.empty() && !std::filesystem::is_directory(configDir))
        {
            std::error_code ec;
            std::filesystem::create_directories(configDir, ec);
            if (ec)
            {
                throw FileIOError("Failed to create configuration directory: " +
                                  configDir.string() + ", error: " + ec.message());
            }
        }

        std::ofstream configFile(m_configFilePath);
        if (!configFile.is_open())
        {
            throw FileIOError("Failed to open configuration file for writing: " +
                              m_configFilePath.string());
        }

        configFile << std::setw(4) << m_config << std::endl;
    }

    void ConfigManager::reload()
    {
        load();
    }

} // namespace scenemcp
