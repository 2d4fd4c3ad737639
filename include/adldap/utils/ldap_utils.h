/**
 * @file ldap_utils.h
 * @brief LDAP filter and DN string helpers
 */

#pragma once

#include <string>
#include <vector>

namespace adldap {
namespace utils {

/**
 * @brief Escape LDAP filter value according to RFC 4515
 *
 * Escapes special characters in LDAP search filter values:
 * - * (asterisk) → \2a
 * - ( (left paren) → \28
 * - ) (right paren) → \29
 * - \ (backslash) → \5c
 * - NUL (null byte) → \00
 * - Other control characters (< 0x20, 0x7f) → \HH
 *
 * Bytes above 0x7f are left alone so UTF-8 values pass through.
 *
 * @example
 *   escapeFilterValue("admin*)(uid=*") → "admin\2a\29\28uid=\2a"
 */
std::string escapeFilterValue(const std::string& value);

/**
 * @brief Escape LDAP DN attribute value according to RFC 4514
 *
 * Escapes , + " \ < > ; = and a leading space or '#', a trailing space,
 * and NUL as \00.
 *
 * @example
 *   escapeDnComponent("Doe, John") → "Doe\, John"
 */
std::string escapeDnComponent(const std::string& value);

/**
 * @brief Split a DN into its RDN components
 *
 * Splits on unescaped commas, trims whitespace around each component and
 * resolves backslash escapes (\, and \2C both yield ',').
 *
 * @param dn Distinguished name, e.g. "CN=Group,CN=Schema,DC=corp,DC=local"
 * @param removeAttributePrefixes Drop the "CN=" style type prefix
 * @return Components in DN order ({"Group", "Schema", "corp", "local"})
 */
std::vector<std::string> explodeDn(const std::string& dn, bool removeAttributePrefixes = true);

} // namespace utils
} // namespace adldap
