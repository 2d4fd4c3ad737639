/**
 * @file operator.cpp
 * @brief Filter predicate operators
 */

#include "adldap/query/operator.h"
#include "adldap/utils/string_utils.h"

namespace adldap::query {

std::optional<Operator> operatorFromString(const std::string& token) {
    std::string lower = utils::toLower(token);

    if (lower == "=") return Operator::EQUALS;
    if (lower == "!") return Operator::NOT_EQUALS;
    if (lower == "*") return Operator::WILDCARD;
    if (lower == ">=") return Operator::GREATER_THAN_OR_EQUALS;
    if (lower == "<=") return Operator::LESS_THAN_OR_EQUALS;
    if (lower == "~=") return Operator::APPROXIMATELY_EQUALS;
    if (lower == "starts_with") return Operator::STARTS_WITH;
    if (lower == "ends_with") return Operator::ENDS_WITH;
    if (lower == "contains") return Operator::CONTAINS;
    if (lower == "has") return Operator::HAS;

    return std::nullopt;
}

std::string toString(Operator op) {
    switch (op) {
        case Operator::EQUALS:                 return "=";
        case Operator::NOT_EQUALS:             return "!";
        case Operator::CONTAINS:               return "contains";
        case Operator::STARTS_WITH:            return "starts_with";
        case Operator::ENDS_WITH:              return "ends_with";
        case Operator::WILDCARD:               return "*";
        case Operator::HAS:                    return "has";
        case Operator::GREATER_THAN_OR_EQUALS: return ">=";
        case Operator::LESS_THAN_OR_EQUALS:    return "<=";
        case Operator::APPROXIMATELY_EQUALS:   return "~=";
    }
    return "=";
}

} // namespace adldap::query
