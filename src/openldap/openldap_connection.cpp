/**
 * @file openldap_connection.cpp
 * @brief IConnection implementation over the OpenLDAP C API
 */

#include "adldap/openldap/openldap_connection.h"
#include "adldap/exceptions.h"

#include <spdlog/spdlog.h>

#include <sys/time.h>

namespace adldap::openldap {

namespace {

/**
 * @brief LDAPMod array over an AttributeMap
 *
 * Values are passed as bervals so binary attributes survive. The map must
 * outlive the list.
 */
class ModList {
public:
    ModList(int op, const AttributeMap& attributes) {
        mods_.reserve(attributes.size());
        values_.reserve(attributes.size());
        valuePtrs_.reserve(attributes.size());

        for (const auto& [name, list] : attributes) {
            std::vector<berval> values;
            values.reserve(list.size());
            for (const auto& value : list) {
                berval bv;
                bv.bv_len = static_cast<ber_len_t>(value.size());
                bv.bv_val = const_cast<char*>(value.data());
                values.push_back(bv);
            }
            values_.push_back(std::move(values));
        }

        size_t index = 0;
        for (const auto& [name, list] : attributes) {
            std::vector<berval*> ptrs;
            for (auto& bv : values_[index]) {
                ptrs.push_back(&bv);
            }
            ptrs.push_back(nullptr);
            valuePtrs_.push_back(std::move(ptrs));

            LDAPMod mod{};
            mod.mod_op = op | LDAP_MOD_BVALUES;
            mod.mod_type = const_cast<char*>(name.c_str());
            mod.mod_bvalues = valuePtrs_.back().data();
            mods_.push_back(mod);
            ++index;
        }

        for (auto& mod : mods_) {
            modPtrs_.push_back(&mod);
        }
        modPtrs_.push_back(nullptr);
    }

    LDAPMod** data() { return modPtrs_.data(); }

private:
    std::vector<LDAPMod> mods_;
    std::vector<std::vector<berval>> values_;
    std::vector<std::vector<berval*>> valuePtrs_;
    std::vector<LDAPMod*> modPtrs_;
};

const char* dnOrNull(const std::optional<std::string>& dn) {
    return dn ? dn->c_str() : nullptr;
}

} // anonymous namespace

OpenLdapConnection::OpenLdapConnection(Configuration config) : config_(std::move(config)) {}

OpenLdapConnection::~OpenLdapConnection() {
    disconnect();
}

// ========== Connection Management ==========

void OpenLdapConnection::connect() {
    disconnect();

    const std::string uri = config_.getUri();
    int rc = ldap_initialize(&ld_, uri.c_str());
    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_initialize failed: {}", ldap_err2string(rc));
        ld_ = nullptr;
        throw ConnectionException(std::string("ldap_initialize failed: ") + ldap_err2string(rc));
    }

    int version = LDAP_VERSION3;
    rc = ldap_set_option(ld_, LDAP_OPT_PROTOCOL_VERSION, &version);
    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_set_option PROTOCOL_VERSION failed: {}", ldap_err2string(rc));
        disconnect();
        throw ConnectionException(std::string("Failed to set protocol version: ") + ldap_err2string(rc));
    }

    struct timeval timeout = {config_.networkTimeoutSec, 0};
    rc = ldap_set_option(ld_, LDAP_OPT_NETWORK_TIMEOUT, &timeout);
    if (rc != LDAP_SUCCESS) {
        spdlog::warn("ldap_set_option NETWORK_TIMEOUT failed: {}", ldap_err2string(rc));
    }

    // Active Directory referrals need their own bind
    rc = ldap_set_option(ld_, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);
    if (rc != LDAP_SUCCESS) {
        spdlog::warn("ldap_set_option REFERRALS failed: {}", ldap_err2string(rc));
    }

    struct berval* cred = ber_str2bv(config_.bindPassword.c_str(), 0, 1, nullptr);
    if (!cred) {
        spdlog::error("ber_str2bv failed to create berval");
        disconnect();
        throw ConnectionException("Failed to allocate bind credentials");
    }

    rc = ldap_sasl_bind_s(ld_, config_.bindDn.empty() ? nullptr : config_.bindDn.c_str(),
                          LDAP_SASL_SIMPLE, cred, nullptr, nullptr, nullptr);
    ber_bvfree(cred);

    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_sasl_bind_s failed for '{}': {}", config_.bindDn, ldap_err2string(rc));
        disconnect();
        throw ConnectionException(std::string("Bind failed: ") + ldap_err2string(rc));
    }

    bound_ = true;
    spdlog::info("Bound to {} as '{}'", uri, config_.bindDn);
}

void OpenLdapConnection::disconnect() {
    if (ld_) {
        ldap_unbind_ext_s(ld_, nullptr, nullptr);
        ld_ = nullptr;
    }
    bound_ = false;
    pendingPage_.reset();
}

// ========== Search ==========

ResultHandlePtr OpenLdapConnection::read(const std::optional<std::string>& dn, const std::string& filter,
                                         const std::vector<std::string>& attributes) {
    return runSearch(LDAP_SCOPE_BASE, dn, filter, attributes);
}

ResultHandlePtr OpenLdapConnection::search(const std::optional<std::string>& dn, const std::string& filter,
                                           const std::vector<std::string>& attributes) {
    return runSearch(LDAP_SCOPE_SUBTREE, dn, filter, attributes);
}

ResultHandlePtr OpenLdapConnection::listing(const std::optional<std::string>& dn, const std::string& filter,
                                            const std::vector<std::string>& attributes) {
    return runSearch(LDAP_SCOPE_ONELEVEL, dn, filter, attributes);
}

ResultHandlePtr OpenLdapConnection::runSearch(int scope, const std::optional<std::string>& dn,
                                              const std::string& filter,
                                              const std::vector<std::string>& attributes) {
    if (!ld_ || !bound_) {
        spdlog::warn("LDAP search attempted without a bound connection");
        pendingPage_.reset();
        return nullptr;
    }

    std::vector<char*> attrs;
    for (const auto& attr : attributes) {
        attrs.push_back(const_cast<char*>(attr.c_str()));
    }
    attrs.push_back(nullptr);

    LDAPControl* pageControl = nullptr;
    if (pendingPage_) {
        berval cookie;
        cookie.bv_len = static_cast<ber_len_t>(pendingPage_->cookie.size());
        cookie.bv_val = const_cast<char*>(pendingPage_->cookie.data());

        int rc = ldap_create_page_control(ld_, static_cast<ber_int_t>(pendingPage_->pageSize),
                                          pendingPage_->cookie.empty() ? nullptr : &cookie,
                                          pendingPage_->isCritical ? 1 : 0, &pageControl);
        pendingPage_.reset();
        if (rc != LDAP_SUCCESS) {
            spdlog::warn("Failed to create page control: {}", ldap_err2string(rc));
            return nullptr;
        }
    }

    LDAPControl* serverControls[] = {pageControl, nullptr};

    LDAPMessage* message = nullptr;
    int rc = ldap_search_ext_s(
        ld_,
        dnOrNull(dn),
        scope,
        filter.empty() ? nullptr : filter.c_str(),
        attributes.empty() ? nullptr : attrs.data(),
        0,
        pageControl ? serverControls : nullptr,
        nullptr,
        nullptr,
        LDAP_NO_LIMIT,
        &message
    );

    if (pageControl) {
        ldap_control_free(pageControl);
    }

    if (rc == LDAP_SIZELIMIT_EXCEEDED) {
        spdlog::warn("LDAP size limit exceeded, results truncated (filter '{}')", filter);
    } else if (rc != LDAP_SUCCESS) {
        spdlog::warn("LDAP search failed: {} (dn='{}', filter='{}')", ldap_err2string(rc),
                     dn.value_or("<root>"), filter);
        if (message) {
            ldap_msgfree(message);
        }
        return nullptr;
    }

    return std::make_unique<OpenLdapResult>(message);
}

RawEntries OpenLdapConnection::getEntries(const ResultHandle& result) {
    RawEntries entries;

    auto* handle = dynamic_cast<const OpenLdapResult*>(&result);
    if (!handle || !handle->get() || !ld_) {
        spdlog::warn("getEntries called with a foreign or empty result handle");
        return entries;
    }

    for (LDAPMessage* entry = ldap_first_entry(ld_, handle->get());
         entry != nullptr;
         entry = ldap_next_entry(ld_, entry)) {

        Attributes attributes;

        char* dn = ldap_get_dn(ld_, entry);
        if (dn) {
            attributes.setDn(dn);
            ldap_memfree(dn);
        }

        BerElement* ber = nullptr;
        for (char* attr = ldap_first_attribute(ld_, entry, &ber);
             attr != nullptr;
             attr = ldap_next_attribute(ld_, entry, ber)) {

            std::vector<std::string> values;
            berval** bvals = ldap_get_values_len(ld_, entry, attr);
            if (bvals) {
                for (int i = 0; bvals[i] != nullptr; ++i) {
                    values.emplace_back(bvals[i]->bv_val, bvals[i]->bv_len);
                }
                ldap_value_free_len(bvals);
            }

            attributes.set(attr, std::move(values));
            ldap_memfree(attr);
        }

        if (ber) {
            ber_free(ber, 0);
        }

        entries.push_back(std::move(attributes));
    }

    return entries;
}

// ========== Paged Results ==========

bool OpenLdapConnection::controlPagedResult(int pageSize, bool isCritical, const std::string& cookie) {
    if (!ld_ || pageSize <= 0) {
        return false;
    }
    pendingPage_ = PageRequest{pageSize, isCritical, cookie};
    return true;
}

bool OpenLdapConnection::controlPagedResultResponse(const ResultHandle& result, std::string& cookie) {
    auto* handle = dynamic_cast<const OpenLdapResult*>(&result);
    if (!handle || !handle->get() || !ld_) {
        return false;
    }

    int errcode = LDAP_SUCCESS;
    LDAPControl** returnedControls = nullptr;
    int rc = ldap_parse_result(ld_, handle->get(), &errcode, nullptr, nullptr, nullptr,
                               &returnedControls, 0);
    if (rc != LDAP_SUCCESS) {
        spdlog::warn("ldap_parse_result failed: {}", ldap_err2string(rc));
        return false;
    }

    LDAPControl* pageControl = ldap_control_find(LDAP_CONTROL_PAGEDRESULTS, returnedControls, nullptr);
    if (!pageControl) {
        if (returnedControls) {
            ldap_controls_free(returnedControls);
        }
        return false;
    }

    ber_int_t totalCount = 0;
    berval newCookie;
    newCookie.bv_len = 0;
    newCookie.bv_val = nullptr;

    rc = ldap_parse_pageresponse_control(ld_, pageControl, &totalCount, &newCookie);
    if (rc != LDAP_SUCCESS) {
        spdlog::warn("Failed to parse page response control: {}", ldap_err2string(rc));
        ldap_controls_free(returnedControls);
        return false;
    }

    if (newCookie.bv_val) {
        cookie.assign(newCookie.bv_val, newCookie.bv_len);
        ber_memfree(newCookie.bv_val);
    } else {
        cookie.clear();
    }

    ldap_controls_free(returnedControls);
    return true;
}

// ========== Mutations ==========

OperationResult OpenLdapConnection::modify(int op, const std::string& dn, const AttributeMap& attributes) {
    if (!ld_ || !bound_) {
        return OperationResult::error("LDAP connection is not bound");
    }

    ModList mods(op, attributes);
    int rc = ldap_modify_ext_s(ld_, dn.c_str(), mods.data(), nullptr, nullptr);
    if (rc != LDAP_SUCCESS) {
        return OperationResult::error(std::string("Modify failed: ") + ldap_err2string(rc));
    }
    return OperationResult::ok();
}

OperationResult OpenLdapConnection::modAdd(const std::string& dn, const AttributeMap& attributes) {
    return modify(LDAP_MOD_ADD, dn, attributes);
}

OperationResult OpenLdapConnection::modDelete(const std::string& dn, const AttributeMap& attributes) {
    return modify(LDAP_MOD_DELETE, dn, attributes);
}

OperationResult OpenLdapConnection::add(const std::string& dn, const AttributeMap& attributes) {
    if (!ld_ || !bound_) {
        return OperationResult::error("LDAP connection is not bound");
    }

    ModList mods(LDAP_MOD_ADD, attributes);
    int rc = ldap_add_ext_s(ld_, dn.c_str(), mods.data(), nullptr, nullptr);
    if (rc != LDAP_SUCCESS) {
        return OperationResult::error(std::string("Add failed: ") + ldap_err2string(rc));
    }
    return OperationResult::ok();
}

OperationResult OpenLdapConnection::rename(const std::string& dn, const std::string& newRdn,
                                           const std::string& newParent, bool deleteOldRdn) {
    if (!ld_ || !bound_) {
        return OperationResult::error("LDAP connection is not bound");
    }

    int rc = ldap_rename_s(ld_, dn.c_str(), newRdn.c_str(),
                           newParent.empty() ? nullptr : newParent.c_str(),
                           deleteOldRdn ? 1 : 0, nullptr, nullptr);
    if (rc != LDAP_SUCCESS) {
        return OperationResult::error(std::string("Rename failed: ") + ldap_err2string(rc));
    }
    return OperationResult::ok();
}

OperationResult OpenLdapConnection::remove(const std::string& dn) {
    if (!ld_ || !bound_) {
        return OperationResult::error("LDAP connection is not bound");
    }

    int rc = ldap_delete_ext_s(ld_, dn.c_str(), nullptr, nullptr);
    if (rc != LDAP_SUCCESS) {
        return OperationResult::error(std::string("Delete failed: ") + ldap_err2string(rc));
    }
    return OperationResult::ok();
}

} // namespace adldap::openldap
