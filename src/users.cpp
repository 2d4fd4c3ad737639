/**
 * @file users.cpp
 * @brief User lookups
 */

#include "adldap/users.h"
#include "adldap/client.h"
#include "adldap/schema.h"
#include "adldap/utils/string_utils.h"

namespace adldap {

UserManager::UserManager(Client& client) : client_(client) {}

std::optional<models::User> UserManager::find(const std::string& username,
                                              const std::vector<std::string>& fields) {
    auto attributes = client_.search()
                          .select(fields)
                          .where(schema::OBJECT_CATEGORY, schema::OBJECT_CATEGORY_PERSON)
                          .where(schema::ACCOUNT_NAME, stripAccountSuffix(username))
                          .raw()
                          .firstRaw();
    if (!attributes) {
        return std::nullopt;
    }
    return models::User(std::move(*attributes));
}

std::optional<std::string> UserManager::dn(const std::string& username) {
    auto user = find(username);
    if (!user) {
        return std::nullopt;
    }
    std::string userDn = user->getDn();
    if (userDn.empty()) {
        return std::nullopt;
    }
    return userDn;
}

std::string UserManager::stripAccountSuffix(const std::string& username) const {
    const std::string& suffix = client_.getConfiguration().accountSuffix;
    if (suffix.empty() || username.size() <= suffix.size()) {
        return username;
    }

    std::string tail = username.substr(username.size() - suffix.size());
    if (utils::iequals(tail, suffix)) {
        return username.substr(0, username.size() - suffix.size());
    }
    return username;
}

} // namespace adldap
