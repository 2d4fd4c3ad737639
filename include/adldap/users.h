/**
 * @file users.h
 * @brief User lookups
 */

#pragma once

#include "adldap/models/entry.h"

#include <optional>
#include <string>
#include <vector>

namespace adldap {

class Client;

/**
 * @brief User lookups by account name
 *
 * If an account suffix is configured, a username carrying it
 * ("jdoe@corp.local") is matched on the bare account name.
 */
class UserManager {
public:
    explicit UserManager(Client& client);

    /**
     * @brief Find a person by sAMAccountName
     * @param fields Attributes to retrieve (empty for the server default)
     */
    std::optional<models::User> find(const std::string& username,
                                     const std::vector<std::string>& fields = {});

    /**
     * @brief DN of a user, std::nullopt if not found
     */
    std::optional<std::string> dn(const std::string& username);

private:
    std::string stripAccountSuffix(const std::string& username) const;

    Client& client_;
};

} // namespace adldap
