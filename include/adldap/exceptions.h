/**
 * @file exceptions.h
 * @brief Exception hierarchy for the adldap library
 *
 * Search, read and listing failures are reported through empty optionals
 * and null result handles. Exceptions are reserved for the cases below.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace adldap {

/**
 * @brief Base exception for all adldap exceptions
 */
class AdldapException : public std::runtime_error {
public:
    explicit AdldapException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A lookup that requires a result matched nothing
 *
 * Only raised by findOrFail-style entry points.
 */
class EntryNotFoundException : public AdldapException {
public:
    explicit EntryNotFoundException(const std::string& message)
        : AdldapException(message) {}
};

/**
 * @brief Connection could not be initialized, bound, or is not bound
 */
class ConnectionException : public AdldapException {
public:
    explicit ConnectionException(const std::string& message)
        : AdldapException("LDAP connection error: " + message) {}
};

/**
 * @brief Required attribute missing before a mutating operation
 */
class ValidationException : public AdldapException {
public:
    explicit ValidationException(const std::string& message)
        : AdldapException("Validation error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public AdldapException {
public:
    explicit ConfigException(const std::string& message)
        : AdldapException("Configuration error: " + message) {}
};

} // namespace adldap
