/**
 * @file config_manager.h
 * @brief Environment-backed configuration
 *
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Explicit overrides that win over the environment
 * - Thread-safe singleton pattern
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace bras::common {

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
     * @return Explicitly set value, else environment variable, else default
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values log a warning and yield the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Copy the known BRAS_* environment variables into the store
     */
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    static constexpr const char* LOG_LEVEL = "BRAS_LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "BRAS_LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "BRAS_LOG_FILE";
};

} // namespace bras::common
