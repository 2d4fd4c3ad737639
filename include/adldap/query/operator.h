/**
 * @file operator.h
 * @brief Filter predicate operators
 */

#pragma once

#include <optional>
#include <string>

namespace adldap::query {

/**
 * @brief Comparison operator of a filter predicate
 */
enum class Operator {
    EQUALS,                 ///< (field=value)
    NOT_EQUALS,             ///< (!(field=value))
    CONTAINS,               ///< (field=*value*)
    STARTS_WITH,            ///< (field=value*)
    ENDS_WITH,              ///< (field=*value)
    WILDCARD,               ///< (field=*)
    HAS,                    ///< (field=*)
    GREATER_THAN_OR_EQUALS, ///< (field>=value)
    LESS_THAN_OR_EQUALS,    ///< (field<=value)
    APPROXIMATELY_EQUALS    ///< (field~=value)
};

/**
 * @brief How a predicate joins the expression before it
 */
enum class Boolean {
    AND,
    OR
};

/**
 * @brief Parse an operator token
 *
 * Tokens: "=", "!", "*", ">=", "<=", "~=", "starts_with", "ends_with",
 * "contains", "has".
 *
 * @return Operator or std::nullopt for an unknown token
 */
std::optional<Operator> operatorFromString(const std::string& token);

std::string toString(Operator op);

} // namespace adldap::query
