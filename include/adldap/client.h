/**
 * @file client.h
 * @brief Entry point tying a connection to its configuration
 */

#pragma once

#include "adldap/configuration.h"
#include "adldap/connection.h"
#include "adldap/groups.h"
#include "adldap/query/search.h"
#include "adldap/users.h"

#include <optional>
#include <string>

namespace adldap {

/**
 * @brief Directory client
 *
 * Holds a non-owning reference to the connection; the caller keeps it
 * alive for the client's lifetime.
 *
 * Usage:
 * @code
 *   openldap::OpenLdapConnection connection(config);
 *   connection.connect();
 *   Client client(connection, config);
 *   auto admins = client.groups().members("Domain Admins");
 * @endcode
 */
class Client {
public:
    Client(IConnection& connection, Configuration config);

    /**
     * @brief New search rooted at the base DN
     */
    query::Search search();

    GroupManager groups();
    UserManager users();

    /**
     * @brief Configured base DN, or the root DSE's defaultNamingContext
     *
     * Discovery runs once; its result is cached. Returns "" if nothing is
     * configured and discovery fails.
     */
    std::string getBaseDn();

    const Configuration& getConfiguration() const { return config_; }
    IConnection& getConnection() { return connection_; }

private:
    IConnection& connection_;
    Configuration config_;
    std::optional<std::string> discoveredBaseDn_;
};

} // namespace adldap
