/**
 * @file configuration.h
 * @brief Directory connection and behaviour settings
 */

#pragma once

#include <string>

namespace adldap {

namespace common {
class ConfigManager;
}

/**
 * @brief Directory configuration
 *
 * An empty baseDn is allowed; the base DN is then discovered from the
 * root DSE (defaultNamingContext) on first use.
 */
struct Configuration {
    std::string host = "localhost";
    int port = 389;
    std::string bindDn;
    std::string bindPassword;
    std::string baseDn;
    std::string accountSuffix;
    int networkTimeoutSec = 5;
    int pageSize = 50;
    bool recursiveGroups = true;

    std::string getUri() const {
        return "ldap://" + host + ":" + std::to_string(port);
    }

    /**
     * @brief Check host and port
     * @throws ConfigException on empty host or port outside 1..65535
     */
    void validate() const;

    /**
     * @brief Build from LDAP_* configuration keys
     */
    static Configuration fromConfigManager(const common::ConfigManager& config);
};

} // namespace adldap
