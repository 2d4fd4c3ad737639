/**
 * @file groups.cpp
 * @brief Group management
 */

#include "adldap/groups.h"
#include "adldap/client.h"
#include "adldap/exceptions.h"
#include "adldap/schema.h"
#include "adldap/utils/ldap_utils.h"
#include "adldap/utils/sid_utils.h"
#include "adldap/utils/string_utils.h"

#include <spdlog/spdlog.h>

namespace adldap {

void GroupAttributes::validateRequired() const {
    if (name.empty()) {
        throw ValidationException("Missing compulsory field [name]");
    }
    if (description.empty()) {
        throw ValidationException("Missing compulsory field [description]");
    }
    if (container.empty()) {
        throw ValidationException("Missing compulsory field [container]");
    }
}

GroupManager::GroupManager(Client& client) : client_(client) {}

void GroupManager::ensureBound() const {
    if (!client_.getConnection().isBound()) {
        throw ConnectionException("No LDAP connection is currently bound.");
    }
}

// ========== Listing ==========

std::optional<query::ResultSet> GroupManager::all(const std::vector<std::string>& select, bool sorted) {
    return search(std::nullopt, select, sorted);
}

std::optional<query::ResultSet> GroupManager::search(std::optional<int> samAccountType,
                                                     const std::vector<std::string>& select,
                                                     bool sorted) {
    ensureBound();

    auto groupSearch = client_.search();
    groupSearch.select(select).where(schema::OBJECT_CATEGORY, schema::OBJECT_CATEGORY_GROUP);

    if (samAccountType) {
        groupSearch.where(schema::ACCOUNT_TYPE, std::to_string(*samAccountType));
    }
    if (sorted) {
        groupSearch.sortBy(schema::ACCOUNT_NAME, "asc");
    }

    return groupSearch.get();
}

std::optional<query::ResultSet> GroupManager::allSecurity(const std::vector<std::string>& select, bool sorted) {
    return search(schema::SECURITY_GLOBAL_GROUP, select, sorted);
}

std::optional<query::ResultSet> GroupManager::allDistribution(const std::vector<std::string>& select, bool sorted) {
    return search(schema::DISTRIBUTION_GROUP, select, sorted);
}

// ========== Lookup ==========

std::optional<models::Group> GroupManager::find(const std::string& name, const std::vector<std::string>& fields) {
    auto attributes = client_.search()
                          .select(fields)
                          .where(schema::OBJECT_CATEGORY, schema::OBJECT_CATEGORY_GROUP)
                          .where(schema::ANR, name)
                          .raw()
                          .firstRaw();
    if (!attributes) {
        return std::nullopt;
    }
    return models::Group(std::move(*attributes));
}

std::optional<std::string> GroupManager::dn(const std::string& name) {
    auto group = find(name);
    if (!group) {
        return std::nullopt;
    }
    std::string groupDn = group->getDn();
    if (groupDn.empty()) {
        return std::nullopt;
    }
    return groupDn;
}

std::optional<Attributes> GroupManager::findGroupByDn(const std::string& dn) {
    return client_.search()
        .select(std::vector<std::string>{schema::ACCOUNT_NAME, schema::DISTINGUISHED_NAME,
                                         schema::OBJECT_CLASS, schema::MEMBER})
        .where(schema::OBJECT_CATEGORY, schema::OBJECT_CATEGORY_GROUP)
        .where(schema::DISTINGUISHED_NAME, dn)
        .raw()
        .firstRaw();
}

// ========== Membership ==========

OperationResult GroupManager::modifyMember(const std::string& groupDn, const std::string& memberDn, bool add) {
    AttributeMap change{{schema::MEMBER, {memberDn}}};

    auto& connection = client_.getConnection();
    OperationResult result = add ? connection.modAdd(groupDn, change) : connection.modDelete(groupDn, change);

    if (result.success) {
        spdlog::info("{} member '{}' {} group '{}'", add ? "Added" : "Removed", memberDn,
                     add ? "to" : "from", groupDn);
    } else {
        spdlog::warn("Failed to {} member '{}' of group '{}': {}", add ? "add" : "remove",
                     memberDn, groupDn, result.message);
    }
    return result;
}

OperationResult GroupManager::addGroup(const std::string& parent, const std::string& child) {
    auto parentDn = dn(parent);
    if (!parentDn) {
        return OperationResult::error("Group not found: " + parent);
    }
    auto childDn = dn(child);
    if (!childDn) {
        return OperationResult::error("Group not found: " + child);
    }
    return modifyMember(*parentDn, *childDn, true);
}

OperationResult GroupManager::addUser(const std::string& group, const std::string& username) {
    auto groupDn = dn(group);
    if (!groupDn) {
        return OperationResult::error("Group not found: " + group);
    }
    auto userDn = client_.users().dn(username);
    if (!userDn) {
        return OperationResult::error("User not found: " + username);
    }
    return modifyMember(*groupDn, *userDn, true);
}

OperationResult GroupManager::addContact(const std::string& group, const std::string& contactDn) {
    if (contactDn.empty()) {
        return OperationResult::error("Contact DN is empty");
    }
    auto groupDn = dn(group);
    if (!groupDn) {
        return OperationResult::error("Group not found: " + group);
    }
    return modifyMember(*groupDn, contactDn, true);
}

OperationResult GroupManager::removeGroup(const std::string& parent, const std::string& child) {
    auto parentDn = dn(parent);
    if (!parentDn) {
        return OperationResult::error("Group not found: " + parent);
    }
    auto childDn = dn(child);
    if (!childDn) {
        return OperationResult::error("Group not found: " + child);
    }
    return modifyMember(*parentDn, *childDn, false);
}

OperationResult GroupManager::removeUser(const std::string& group, const std::string& username) {
    auto groupDn = dn(group);
    if (!groupDn) {
        return OperationResult::error("Group not found: " + group);
    }
    auto userDn = client_.users().dn(username);
    if (!userDn) {
        return OperationResult::error("User not found: " + username);
    }
    return modifyMember(*groupDn, *userDn, false);
}

OperationResult GroupManager::removeContact(const std::string& group, const std::string& contactDn) {
    if (contactDn.empty()) {
        return OperationResult::error("Contact DN is empty");
    }
    auto groupDn = dn(group);
    if (!groupDn) {
        return OperationResult::error("Group not found: " + group);
    }
    return modifyMember(*groupDn, contactDn, false);
}

std::optional<std::vector<std::string>> GroupManager::inGroup(const std::string& group,
                                                              std::optional<bool> recursive) {
    ensureBound();

    bool descend = recursive.value_or(client_.getConfiguration().recursiveGroups);

    auto info = find(group);
    if (!info || !info->hasAttribute(schema::MEMBER)) {
        return std::nullopt;
    }

    std::set<std::string> visited{utils::toLower(info->getDn())};
    std::vector<std::string> groups;
    collectMemberGroups(info->getAttributes(), descend, visited, groups);
    return groups;
}

void GroupManager::collectMemberGroups(const Attributes& group, bool recursive,
                                       std::set<std::string>& visited, std::vector<std::string>& out) {
    for (const auto& memberDn : group.get(schema::MEMBER)) {
        std::string key = utils::toLower(memberDn);
        if (visited.count(key) > 0) {
            continue;
        }

        auto memberGroup = findGroupByDn(memberDn);
        if (!memberGroup) {
            // user, contact or computer
            continue;
        }

        visited.insert(key);
        out.push_back(memberGroup->first(schema::DISTINGUISHED_NAME).value_or(memberDn));

        if (recursive) {
            collectMemberGroups(*memberGroup, recursive, visited, out);
        }
    }
}

std::optional<std::vector<models::User>> GroupManager::members(const std::string& group,
                                                               const std::vector<std::string>& fields) {
    auto info = find(group);
    if (!info || !info->hasAttribute(schema::MEMBER)) {
        return std::nullopt;
    }

    std::vector<models::User> users;
    for (const auto& memberDn : info->getMembers()) {
        auto attributes = client_.search()
                              .setDn(memberDn)
                              .select(fields)
                              .where(schema::OBJECT_CLASS, schema::OBJECT_CLASS_USER)
                              .where(schema::OBJECT_CLASS, schema::OBJECT_CLASS_PERSON)
                              .raw()
                              .firstRaw();
        if (!attributes) {
            spdlog::debug("Member '{}' of '{}' is not a user, skipped", memberDn, group);
            continue;
        }
        users.emplace_back(std::move(*attributes));
    }
    return users;
}

std::vector<std::string> GroupManager::recursiveGroups(const std::string& name) {
    std::set<std::string> visited;
    std::vector<std::string> groups;
    collectParentGroups(name, visited, groups);
    return groups;
}

void GroupManager::collectParentGroups(const std::string& name, std::set<std::string>& visited,
                                       std::vector<std::string>& out) {
    auto info = find(name);
    if (!info || !info->getCommonName()) {
        return;
    }

    std::string groupDn = info->getDn();
    if (!visited.insert(utils::toLower(groupDn)).second) {
        return;
    }
    out.push_back(groupDn);

    for (const auto& parentDn : info->getMemberOf()) {
        auto components = utils::explodeDn(parentDn);
        if (components.empty()) {
            continue;
        }
        collectParentGroups(components.front(), visited, out);
    }
}

// ========== CRUD ==========

std::string GroupManager::containerDn(const std::vector<std::string>& container) {
    std::string baseDn = client_.getBaseDn();
    if (container.empty()) {
        return baseDn;
    }

    std::vector<std::string> units;
    for (auto it = container.rbegin(); it != container.rend(); ++it) {
        units.push_back("OU=" + utils::escapeDnComponent(*it));
    }

    std::string result = utils::join(units, ",");
    if (!baseDn.empty()) {
        result += "," + baseDn;
    }
    return result;
}

OperationResult GroupManager::create(const GroupAttributes& attributes) {
    attributes.validateRequired();

    std::string groupDn = "CN=" + utils::escapeDnComponent(attributes.name) + "," + containerDn(attributes.container);

    AttributeMap entry{
        {schema::COMMON_NAME, {attributes.name}},
        {schema::ACCOUNT_NAME, {attributes.name}},
        {schema::OBJECT_CLASS, {schema::OBJECT_CLASS_GROUP}},
        {schema::DESCRIPTION, {attributes.description}},
    };

    OperationResult result = client_.getConnection().add(groupDn, entry);
    if (result.success) {
        spdlog::info("Created group '{}'", groupDn);
    } else {
        spdlog::warn("Failed to create group '{}': {}", groupDn, result.message);
    }
    return result;
}

OperationResult GroupManager::remove(const std::string& name) {
    if (name.empty()) {
        throw ValidationException("Group cannot be empty");
    }
    ensureBound();

    auto groupDn = dn(name);
    if (!groupDn) {
        return OperationResult::error("Group not found: " + name);
    }

    OperationResult result = client_.getConnection().remove(*groupDn);
    if (result.success) {
        spdlog::info("Deleted group '{}'", *groupDn);
    }
    return result;
}

OperationResult GroupManager::rename(const std::string& name, const std::string& newName,
                                     const std::vector<std::string>& container) {
    if (newName.empty()) {
        throw ValidationException("New group name cannot be empty");
    }

    auto groupDn = dn(name);
    if (!groupDn) {
        return OperationResult::error("Group not found: " + name);
    }

    std::string newRdn = "CN=" + utils::escapeDnComponent(newName);
    std::string newParent = containerDn(container);

    OperationResult result = client_.getConnection().rename(*groupDn, newRdn, newParent, true);
    if (result.success) {
        spdlog::info("Renamed group '{}' to '{},{}'", *groupDn, newRdn, newParent);
    }
    return result;
}

std::optional<std::string> GroupManager::getPrimaryGroup(uint32_t groupRid, const std::string& userSid) {
    if (groupRid == 0) {
        throw ValidationException("Group ID cannot be empty");
    }
    if (userSid.empty()) {
        throw ValidationException("User ID cannot be empty");
    }

    auto groupSid = utils::replaceRid(userSid, groupRid);
    if (!groupSid) {
        throw ValidationException("User ID is not a valid binary SID");
    }

    auto sid = utils::sidToString(*groupSid);
    if (!sid) {
        throw ValidationException("User ID is not a valid binary SID");
    }

    auto attributes = client_.search().where(schema::OBJECT_SID, *sid).raw().firstRaw();
    if (!attributes) {
        return std::nullopt;
    }

    models::Entry group(std::move(*attributes));
    std::string groupDn = group.getDn();
    if (groupDn.empty()) {
        return std::nullopt;
    }
    return groupDn;
}

} // namespace adldap
