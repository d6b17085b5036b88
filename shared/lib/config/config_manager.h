/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables with defaults.
 * Values set programmatically take precedence over the environment.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

    /**
     * @brief Find a value: programmatic override first, then the environment
     */
    std::optional<std::string> lookup(const std::string& key) const;

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values fall back to @p defaultValue with a warning.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove a programmatic override
     */
    void unset(const std::string& key);

    /**
     * @brief Load the predefined keys from the environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys
    static constexpr const char* SERVICE_NAME = "SERVICE_NAME";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    /// @name Defaults
    static constexpr const char* DEFAULT_SERVICE_NAME = "person-registry";
    static constexpr const char* DEFAULT_LOG_LEVEL = "info";
    static constexpr const char* DEFAULT_LOG_FILE = "logs/person-registry.log";
};

} // namespace common
