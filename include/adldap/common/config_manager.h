/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Environment variable access with typed getters and explicit overrides.
 * Thread-safe singleton.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace adldap::common {

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

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load known keys from the environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // LDAP
    static constexpr const char* LDAP_HOST = "LDAP_HOST";
    static constexpr const char* LDAP_PORT = "LDAP_PORT";
    static constexpr const char* LDAP_BASE_DN = "LDAP_BASE_DN";
    static constexpr const char* LDAP_BIND_DN = "LDAP_BIND_DN";
    static constexpr const char* LDAP_BIND_PASSWORD = "LDAP_BIND_PASSWORD";
    static constexpr const char* LDAP_NETWORK_TIMEOUT = "LDAP_NETWORK_TIMEOUT";
    static constexpr const char* LDAP_PAGE_SIZE = "LDAP_PAGE_SIZE";
    static constexpr const char* LDAP_RECURSIVE_GROUPS = "LDAP_RECURSIVE_GROUPS";
    static constexpr const char* LDAP_ACCOUNT_SUFFIX = "LDAP_ACCOUNT_SUFFIX";

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace adldap::common
