#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace scenemcp
{
    /**
     * @brief Configuration manager class for handling persisted server settings
     *
     * Settings are stored in a JSON file organised in sections. A missing file is not
     * an error; it simply yields the defaults passed to getValue().
     */
    class ConfigManager
    {
      public:
        /**
         * @brief Construct a ConfigManager reading the default settings file
         *
         * The default location is <config home>/scenemcp/settings.json.
         */
        ConfigManager();

        /**
         * @brief Construct a ConfigManager reading a specific settings file
         * @param configFilePath Path of the JSON settings file
         */
        explicit ConfigManager(std::filesystem::path configFilePath);

        ~ConfigManager() = default;

        /**
         * @brief Get a value from the configuration
         * @tparam T Type of the value to retrieve
         * @param section Section name in the configuration
         * @param key Key name within the section
         * @param defaultValue Default value to return if the key doesn't exist
         * @return The value from the configuration or the default value
         */
        template <typename T>
        T getValue(std::string const & section,
                   std::string const & key,
                   T const & defaultValue) const;

        /// @brief True if the section contains the key
        bool hasValue(std::string const & section, std::string const & key) const;

        template <typename T>
        void setValue(std::string const & section, std::string const & key, T const & value);

        /**
         * @brief Save the current configuration to the file
         * @throws FileIOError if the file or its directory cannot be written
         */
        void save();

        void reload();

        std::filesystem::path const & getConfigFilePath() const
        {
            return m_configFilePath;
        }

        /// Path of the settings file used when no explicit path is given
        static std::filesystem::path defaultConfigFilePath();

      private:
        void load();

        std::filesystem::path m_configFilePath;
        nlohmann::json m_config;
        mutable std::mutex m_mutex;

        ConfigManager(ConfigManager const &) = delete;
        ConfigManager & operator=(ConfigManager const &) = delete;
        ConfigManager(ConfigManager &&) = delete;
        ConfigManager & operator=(ConfigManager &&) = delete;
    };

    template <typename T>
    T ConfigManager::getValue(std::string const & section,
                              std::string const & key,
                              T const & defaultValue) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_config.contains(section) && m_config[section].contains(key))
        {
            try
            {
                return m_config[section][key].get<T>();
            }
            catch (nlohmann::json::exception const &)
            {
                // In case of type mismatch, return default
                return defaultValue;
            }
        }

        return defaultValue;
    }

    template <typename T>
    void
    ConfigManager::setValue(std::string const & section, std::string const & key, T const & value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config[section][key] = value;
    }

} // namespace scenemcp
