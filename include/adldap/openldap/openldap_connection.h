/**
 * @file openldap_connection.h
 * @brief IConnection implementation over the OpenLDAP C API
 */

#pragma once

#include "adldap/configuration.h"
#include "adldap/connection.h"

#include <ldap.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adldap::openldap {

/**
 * @brief Owns one LDAPMessage chain
 */
class OpenLdapResult : public ResultHandle {
public:
    explicit OpenLdapResult(LDAPMessage* message) : message_(message, &ldap_msgfree) {}

    LDAPMessage* get() const { return message_.get(); }

private:
    std::unique_ptr<LDAPMessage, int (*)(LDAPMessage*)> message_;
};

/**
 * @brief Single synchronous libldap session
 *
 * connect() initializes the session (protocol v3, network timeout, no
 * referral chasing) and performs a simple bind. A paging control requested
 * with controlPagedResult() is attached to the next search only.
 *
 * Not thread-safe; use one instance per thread.
 */
class OpenLdapConnection : public IConnection {
public:
    explicit OpenLdapConnection(Configuration config);
    ~OpenLdapConnection() override;

    OpenLdapConnection(const OpenLdapConnection&) = delete;
    OpenLdapConnection& operator=(const OpenLdapConnection&) = delete;

    /**
     * @brief Initialize and bind
     * @throws ConnectionException if initialization or bind fails
     */
    void connect();

    /**
     * @brief Unbind and release the session
     */
    void disconnect();

    bool isBound() const override { return bound_; }

    ResultHandlePtr read(const std::optional<std::string>& dn, const std::string& filter,
                         const std::vector<std::string>& attributes) override;
    ResultHandlePtr search(const std::optional<std::string>& dn, const std::string& filter,
                           const std::vector<std::string>& attributes) override;
    ResultHandlePtr listing(const std::optional<std::string>& dn, const std::string& filter,
                            const std::vector<std::string>& attributes) override;

    RawEntries getEntries(const ResultHandle& result) override;

    bool controlPagedResult(int pageSize, bool isCritical, const std::string& cookie) override;
    bool controlPagedResultResponse(const ResultHandle& result, std::string& cookie) override;

    OperationResult modAdd(const std::string& dn, const AttributeMap& attributes) override;
    OperationResult modDelete(const std::string& dn, const AttributeMap& attributes) override;
    OperationResult add(const std::string& dn, const AttributeMap& attributes) override;
    OperationResult rename(const std::string& dn, const std::string& newRdn,
                           const std::string& newParent, bool deleteOldRdn) override;
    OperationResult remove(const std::string& dn) override;

private:
    struct PageRequest {
        int pageSize;
        bool isCritical;
        std::string cookie;
    };

    ResultHandlePtr runSearch(int scope, const std::optional<std::string>& dn, const std::string& filter,
                              const std::vector<std::string>& attributes);

    OperationResult modify(int op, const std::string& dn, const AttributeMap& attributes);

    Configuration config_;
    LDAP* ld_ = nullptr;
    bool bound_ = false;
    std::optional<PageRequest> pendingPage_;
};

} // namespace adldap::openldap
