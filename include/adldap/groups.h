/**
 * @file groups.h
 * @brief Group management
 *
 * Lookups go through Search; membership changes and group CRUD go through
 * the connection's modAdd/modDelete/add/rename/remove. Mutation results
 * are passed through unmodified.
 */

#pragma once

#include "adldap/attributes.h"
#include "adldap/models/entry.h"
#include "adldap/query/result_set.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace adldap {

class Client;

/**
 * @brief Attributes of a group to create
 *
 * container is listed from the top-level OU down, e.g. {"Corp", "Groups"}
 * for OU=Groups,OU=Corp.
 */
struct GroupAttributes {
    std::string name;
    std::string description;
    std::vector<std::string> container;

    /**
     * @throws ValidationException naming the first missing attribute
     */
    void validateRequired() const;
};

class GroupManager {
public:
    explicit GroupManager(Client& client);

    // ========== Listing ==========

    /**
     * @brief All groups regardless of type
     */
    std::optional<query::ResultSet> all(const std::vector<std::string>& select = {}, bool sorted = true);

    /**
     * @brief Groups of one sAMAccountType
     * @param samAccountType Type filter, std::nullopt for every group
     * @param sorted Sort by sAMAccountName ascending
     * @throws ConnectionException if the connection is not bound
     */
    std::optional<query::ResultSet> search(std::optional<int> samAccountType,
                                           const std::vector<std::string>& select = {},
                                           bool sorted = true);

    std::optional<query::ResultSet> allSecurity(const std::vector<std::string>& select = {}, bool sorted = true);
    std::optional<query::ResultSet> allDistribution(const std::vector<std::string>& select = {}, bool sorted = true);

    // ========== Lookup ==========

    /**
     * @brief Find a group by ambiguous name resolution
     */
    std::optional<models::Group> find(const std::string& name, const std::vector<std::string>& fields = {});

    std::optional<models::Group> info(const std::string& name, const std::vector<std::string>& fields = {}) {
        return find(name, fields);
    }

    /**
     * @brief DN of a group, std::nullopt if not found
     */
    std::optional<std::string> dn(const std::string& name);

    // ========== Membership ==========

    OperationResult addGroup(const std::string& parent, const std::string& child);
    OperationResult addUser(const std::string& group, const std::string& username);
    OperationResult addContact(const std::string& group, const std::string& contactDn);

    OperationResult removeGroup(const std::string& parent, const std::string& child);
    OperationResult removeUser(const std::string& group, const std::string& username);
    OperationResult removeContact(const std::string& group, const std::string& contactDn);

    /**
     * @brief DNs of the groups that are members of a group
     * @param recursive Descend into member groups; std::nullopt uses the
     *        configured default
     * @return Group DNs in discovery order without duplicates, std::nullopt
     *         if the group is not found or has no members
     * @throws ConnectionException if the connection is not bound
     */
    std::optional<std::vector<std::string>> inGroup(const std::string& group,
                                                    std::optional<bool> recursive = std::nullopt);

    /**
     * @brief User entries that are members of a group
     *
     * Members that are not users (groups, contacts) are skipped.
     *
     * @return Users in member order, std::nullopt if the group is not found
     *         or has no members
     */
    std::optional<std::vector<models::User>> members(const std::string& group,
                                                     const std::vector<std::string>& fields = {});

    /**
     * @brief DN of a group followed by the DNs of every group it is
     *        transitively a member of
     * @return Empty if the group is not found
     */
    std::vector<std::string> recursiveGroups(const std::string& name);

    // ========== CRUD ==========

    /**
     * @brief Create a group at CN=name,OU=...,baseDn
     * @throws ValidationException if name, description or container is missing
     */
    OperationResult create(const GroupAttributes& attributes);

    /**
     * @brief Delete a group
     * @throws ValidationException if name is empty
     * @throws ConnectionException if the connection is not bound
     */
    OperationResult remove(const std::string& name);

    /**
     * @brief Rename a group and move it under container
     * @param container OU path from the top-level OU down; empty for the base DN
     */
    OperationResult rename(const std::string& name, const std::string& newName,
                           const std::vector<std::string>& container);

    /**
     * @brief Resolve a user's primary group
     *
     * Active Directory does not list the primary group in memberOf. Its SID
     * is the user's SID with the RID replaced by primaryGroupID.
     *
     * @param groupRid primaryGroupID of the user
     * @param userSid Binary objectSid of the user
     * @return Group DN, std::nullopt if no group has that SID
     * @throws ValidationException if either argument is empty or the SID is malformed
     */
    std::optional<std::string> getPrimaryGroup(uint32_t groupRid, const std::string& userSid);

private:
    void ensureBound() const;

    std::optional<Attributes> findGroupByDn(const std::string& dn);

    void collectMemberGroups(const Attributes& group, bool recursive,
                             std::set<std::string>& visited, std::vector<std::string>& out);

    void collectParentGroups(const std::string& name, std::set<std::string>& visited,
                             std::vector<std::string>& out);

    OperationResult modifyMember(const std::string& groupDn, const std::string& memberDn, bool add);

    std::string containerDn(const std::vector<std::string>& container);

    Client& client_;
};

} // namespace adldap
