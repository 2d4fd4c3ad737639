/**
 * @file entry.h
 * @brief Directory entry models
 *
 * Every model keeps the complete raw attribute map it was built from;
 * the typed accessors are conveniences on top of it.
 */

#pragma once

#include "adldap/attributes.h"

#include <optional>
#include <string>
#include <vector>

namespace adldap::models {

/**
 * @brief Model kind, in the alternative order of MappedEntry
 */
enum class EntryCategory {
    GENERIC,
    COMPUTER,
    USER,
    GROUP,
    PRINTER,
    CONTAINER,
    EXCHANGE_SERVER
};

std::string toString(EntryCategory category);

/**
 * @brief Generic directory entry
 */
class Entry {
public:
    Entry() = default;
    explicit Entry(Attributes attributes) : attributes_(std::move(attributes)) {}

    /// Full raw attribute map
    const Attributes& getAttributes() const { return attributes_; }

    const std::vector<std::string>& getAttribute(const std::string& name) const {
        return attributes_.get(name);
    }

    std::optional<std::string> getFirstAttribute(const std::string& name) const {
        return attributes_.first(name);
    }

    bool hasAttribute(const std::string& name) const { return attributes_.has(name); }

    /**
     * @brief Entry DN, falling back to the distinguishedName attribute
     */
    std::string getDn() const;

    std::optional<std::string> getCommonName() const;
    std::optional<std::string> getName() const;
    std::optional<std::string> getDescription() const;
    std::optional<std::string> getDistinguishedName() const;
    std::optional<std::string> getObjectCategory() const;
    const std::vector<std::string>& getObjectClass() const;
    const std::vector<std::string>& getMemberOf() const;

protected:
    Attributes attributes_;
};

class User : public Entry {
public:
    using Entry::Entry;

    std::optional<std::string> getAccountName() const;
    std::optional<std::string> getUserPrincipalName() const;
    std::optional<std::string> getDisplayName() const;
    std::optional<std::string> getEmail() const;
    std::optional<std::string> getTitle() const;
    std::optional<std::string> getDepartment() const;
};

class Computer : public Entry {
public:
    using Entry::Entry;

    std::optional<std::string> getOperatingSystem() const;
    std::optional<std::string> getOperatingSystemVersion() const;
    std::optional<std::string> getDnsHostName() const;
};

class Group : public Entry {
public:
    using Entry::Entry;

    const std::vector<std::string>& getMembers() const;
    std::optional<std::string> getAccountName() const;
    std::optional<std::string> getGroupType() const;
};

class Printer : public Entry {
public:
    using Entry::Entry;

    std::optional<std::string> getPrinterName() const;
    std::optional<std::string> getServerName() const;
    std::optional<std::string> getPortName() const;
    std::optional<std::string> getDriverName() const;
    std::optional<std::string> getLocation() const;
};

class Container : public Entry {
public:
    using Entry::Entry;

    std::optional<std::string> getSystemFlags() const;
};

class ExchangeServer : public Entry {
public:
    using Entry::Entry;

    std::optional<std::string> getSerialNumber() const;
    std::optional<std::string> getVersionNumber() const;
    const std::vector<std::string>& getServerRoles() const;
};

} // namespace adldap::models
