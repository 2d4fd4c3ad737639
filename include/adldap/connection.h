/**
 * @file connection.h
 * @brief Directory connection interface
 *
 * The query layer never talks to the wire itself. Every read, search,
 * listing, paging control and mutation goes through this interface:
 *   - OpenLdapConnection: libldap implementation (adldap_openldap target)
 *   - tests: FakeConnection serving canned entries
 */

#pragma once

#include "adldap/attributes.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adldap {

/**
 * @brief Opaque handle to one result container
 *
 * Implementations own whatever the transport returned and release it
 * in their destructor.
 */
class ResultHandle {
public:
    virtual ~ResultHandle() = default;
};

using ResultHandlePtr = std::unique_ptr<ResultHandle>;

/**
 * @brief Directory connection interface
 *
 * Search operations return nullptr when no result container could be
 * produced at all (connection failure). An empty container is a valid,
 * successful result.
 *
 * A DN of std::nullopt addresses the directory root (null DN).
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Check if the connection is bound
     */
    virtual bool isBound() const = 0;

    // ========== Search ==========

    /**
     * @brief Base scope read of a single entry
     */
    virtual ResultHandlePtr read(
        const std::optional<std::string>& dn,
        const std::string& filter,
        const std::vector<std::string>& attributes) = 0;

    /**
     * @brief Subtree search rooted at dn
     */
    virtual ResultHandlePtr search(
        const std::optional<std::string>& dn,
        const std::string& filter,
        const std::vector<std::string>& attributes) = 0;

    /**
     * @brief Single level search (immediate children of dn)
     */
    virtual ResultHandlePtr listing(
        const std::optional<std::string>& dn,
        const std::string& filter,
        const std::vector<std::string>& attributes) = 0;

    /**
     * @brief Extract entries from a result container
     */
    virtual RawEntries getEntries(const ResultHandle& result) = 0;

    // ========== Paged Results ==========

    /**
     * @brief Request paging for the next search
     * @param pageSize Entries per page
     * @param isCritical Fail the search instead of truncating when the
     *        server cannot honour the page size
     * @param cookie Cookie returned by the previous page, empty for the first
     */
    virtual bool controlPagedResult(int pageSize, bool isCritical, const std::string& cookie) = 0;

    /**
     * @brief Read the paging cookie from a result container
     * @param cookie Replaced by the server cookie; empty when no pages remain
     */
    virtual bool controlPagedResultResponse(const ResultHandle& result, std::string& cookie) = 0;

    // ========== Mutations ==========

    virtual OperationResult modAdd(const std::string& dn, const AttributeMap& attributes) = 0;

    virtual OperationResult modDelete(const std::string& dn, const AttributeMap& attributes) = 0;

    virtual OperationResult add(const std::string& dn, const AttributeMap& attributes) = 0;

    virtual OperationResult rename(
        const std::string& dn,
        const std::string& newRdn,
        const std::string& newParent,
        bool deleteOldRdn) = 0;

    virtual OperationResult remove(const std::string& dn) = 0;
};

} // namespace adldap
