/**
 * @file client.cpp
 * @brief Directory client
 */

#include "adldap/client.h"

#include <spdlog/spdlog.h>

namespace adldap {

Client::Client(IConnection& connection, Configuration config)
    : connection_(connection), config_(std::move(config)) {}

query::Search Client::search() {
    query::Search search(connection_, getBaseDn());
    search.setPageSize(config_.pageSize);
    return search;
}

GroupManager Client::groups() {
    return GroupManager(*this);
}

UserManager Client::users() {
    return UserManager(*this);
}

std::string Client::getBaseDn() {
    if (!config_.baseDn.empty()) {
        return config_.baseDn;
    }

    if (!discoveredBaseDn_) {
        auto found = query::Search(connection_, std::string()).findBaseDn();
        if (!found) {
            return std::string();
        }
        spdlog::info("Discovered base DN: {}", *found);
        discoveredBaseDn_ = found;
    }
    return *discoveredBaseDn_;
}

} // namespace adldap
