/**
 * @file configuration.cpp
 * @brief Directory configuration
 */

#include "adldap/configuration.h"
#include "adldap/common/config_manager.h"
#include "adldap/exceptions.h"

namespace adldap {

void Configuration::validate() const {
    if (host.empty()) {
        throw ConfigException("LDAP host is empty");
    }
    if (port < 1 || port > 65535) {
        throw ConfigException("LDAP port out of range: " + std::to_string(port));
    }
    if (pageSize < 1) {
        throw ConfigException("LDAP page size must be positive: " + std::to_string(pageSize));
    }
}

Configuration Configuration::fromConfigManager(const common::ConfigManager& config) {
    using common::ConfigManager;

    Configuration result;
    result.host = config.getString(ConfigManager::LDAP_HOST, result.host);
    result.port = config.getInt(ConfigManager::LDAP_PORT, result.port);
    result.baseDn = config.getString(ConfigManager::LDAP_BASE_DN);
    result.bindDn = config.getString(ConfigManager::LDAP_BIND_DN);
    result.bindPassword = config.getString(ConfigManager::LDAP_BIND_PASSWORD);
    result.accountSuffix = config.getString(ConfigManager::LDAP_ACCOUNT_SUFFIX);
    result.networkTimeoutSec = config.getInt(ConfigManager::LDAP_NETWORK_TIMEOUT, result.networkTimeoutSec);
    result.pageSize = config.getInt(ConfigManager::LDAP_PAGE_SIZE, result.pageSize);
    result.recursiveGroups = config.getBool(ConfigManager::LDAP_RECURSIVE_GROUPS, result.recursiveGroups);
    return result;
}

} // namespace adldap
