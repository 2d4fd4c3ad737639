/**
 * @file entry.cpp
 * @brief Directory entry models
 */

#include "adldap/models/entry.h"
#include "adldap/schema.h"

namespace adldap::models {

std::string toString(EntryCategory category) {
    switch (category) {
        case EntryCategory::GENERIC:         return "GENERIC";
        case EntryCategory::COMPUTER:        return "COMPUTER";
        case EntryCategory::USER:            return "USER";
        case EntryCategory::GROUP:           return "GROUP";
        case EntryCategory::PRINTER:         return "PRINTER";
        case EntryCategory::CONTAINER:       return "CONTAINER";
        case EntryCategory::EXCHANGE_SERVER: return "EXCHANGE_SERVER";
    }
    return "GENERIC";
}

// ========== Entry ==========

std::string Entry::getDn() const {
    if (!attributes_.getDn().empty()) {
        return attributes_.getDn();
    }
    return attributes_.first(schema::DISTINGUISHED_NAME).value_or("");
}

std::optional<std::string> Entry::getCommonName() const {
    return attributes_.first(schema::COMMON_NAME);
}

std::optional<std::string> Entry::getName() const {
    return attributes_.first(schema::NAME);
}

std::optional<std::string> Entry::getDescription() const {
    return attributes_.first(schema::DESCRIPTION);
}

std::optional<std::string> Entry::getDistinguishedName() const {
    return attributes_.first(schema::DISTINGUISHED_NAME);
}

std::optional<std::string> Entry::getObjectCategory() const {
    return attributes_.first(schema::OBJECT_CATEGORY);
}

const std::vector<std::string>& Entry::getObjectClass() const {
    return attributes_.get(schema::OBJECT_CLASS);
}

const std::vector<std::string>& Entry::getMemberOf() const {
    return attributes_.get(schema::MEMBER_OF);
}

// ========== User ==========

std::optional<std::string> User::getAccountName() const {
    return attributes_.first(schema::ACCOUNT_NAME);
}

std::optional<std::string> User::getUserPrincipalName() const {
    return attributes_.first(schema::USER_PRINCIPAL_NAME);
}

std::optional<std::string> User::getDisplayName() const {
    return attributes_.first(schema::DISPLAY_NAME);
}

std::optional<std::string> User::getEmail() const {
    return attributes_.first(schema::EMAIL);
}

std::optional<std::string> User::getTitle() const {
    return attributes_.first(schema::TITLE);
}

std::optional<std::string> User::getDepartment() const {
    return attributes_.first(schema::DEPARTMENT);
}

// ========== Computer ==========

std::optional<std::string> Computer::getOperatingSystem() const {
    return attributes_.first(schema::OPERATING_SYSTEM);
}

std::optional<std::string> Computer::getOperatingSystemVersion() const {
    return attributes_.first(schema::OPERATING_SYSTEM_VERSION);
}

std::optional<std::string> Computer::getDnsHostName() const {
    return attributes_.first(schema::DNS_HOST_NAME);
}

// ========== Group ==========

const std::vector<std::string>& Group::getMembers() const {
    return attributes_.get(schema::MEMBER);
}

std::optional<std::string> Group::getAccountName() const {
    return attributes_.first(schema::ACCOUNT_NAME);
}

std::optional<std::string> Group::getGroupType() const {
    return attributes_.first(schema::GROUP_TYPE);
}

// ========== Printer ==========

std::optional<std::string> Printer::getPrinterName() const {
    return attributes_.first(schema::PRINTER_NAME);
}

std::optional<std::string> Printer::getServerName() const {
    return attributes_.first(schema::SERVER_NAME);
}

std::optional<std::string> Printer::getPortName() const {
    return attributes_.first(schema::PORT_NAME);
}

std::optional<std::string> Printer::getDriverName() const {
    return attributes_.first(schema::DRIVER_NAME);
}

std::optional<std::string> Printer::getLocation() const {
    return attributes_.first(schema::LOCATION);
}

// ========== Container ==========

std::optional<std::string> Container::getSystemFlags() const {
    return attributes_.first(schema::SYSTEM_FLAGS);
}

// ========== ExchangeServer ==========

std::optional<std::string> ExchangeServer::getSerialNumber() const {
    return attributes_.first(schema::SERIAL_NUMBER);
}

std::optional<std::string> ExchangeServer::getVersionNumber() const {
    return attributes_.first(schema::VERSION_NUMBER);
}

const std::vector<std::string>& ExchangeServer::getServerRoles() const {
    return attributes_.get(schema::EXCHANGE_SERVER_ROLES);
}

} // namespace adldap::models
