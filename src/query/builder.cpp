/**
 * @file builder.cpp
 * @brief LDAP filter builder
 */

#include "adldap/query/builder.h"
#include "adldap/utils/ldap_utils.h"
#include "adldap/utils/string_utils.h"

#include <algorithm>

namespace adldap::query {

Builder& Builder::addPredicate(const std::string& field, Operator op,
                               const std::string& value, Boolean boolean) {
    predicates_.push_back(Predicate{field, op, value, boolean});
    return *this;
}

Builder& Builder::addWildcard(const std::string& field, Boolean boolean) {
    return addPredicate(field, Operator::WILDCARD, "", boolean);
}

// ========== AND ==========

Builder& Builder::where(const std::string& field, Operator op, const std::string& value) {
    return addPredicate(field, op, value, Boolean::AND);
}

Builder& Builder::where(const std::string& field, const std::string& value) {
    return where(field, Operator::EQUALS, value);
}

Builder& Builder::whereContains(const std::string& field, const std::string& value) {
    return where(field, Operator::CONTAINS, value);
}

Builder& Builder::whereStartsWith(const std::string& field, const std::string& value) {
    return where(field, Operator::STARTS_WITH, value);
}

Builder& Builder::whereEndsWith(const std::string& field, const std::string& value) {
    return where(field, Operator::ENDS_WITH, value);
}

Builder& Builder::whereHas(const std::string& field) {
    return where(field, Operator::HAS);
}

// ========== OR ==========

Builder& Builder::orWhere(const std::string& field, Operator op, const std::string& value) {
    return addPredicate(field, op, value, Boolean::OR);
}

Builder& Builder::orWhere(const std::string& field, const std::string& value) {
    return orWhere(field, Operator::EQUALS, value);
}

Builder& Builder::orWhereContains(const std::string& field, const std::string& value) {
    return orWhere(field, Operator::CONTAINS, value);
}

Builder& Builder::orWhereStartsWith(const std::string& field, const std::string& value) {
    return orWhere(field, Operator::STARTS_WITH, value);
}

Builder& Builder::orWhereEndsWith(const std::string& field, const std::string& value) {
    return orWhere(field, Operator::ENDS_WITH, value);
}

Builder& Builder::orWhereHas(const std::string& field) {
    return orWhere(field, Operator::HAS);
}

// ========== Select ==========

Builder& Builder::select(const std::vector<std::string>& fields) {
    for (const auto& field : fields) {
        select(field);
    }
    return *this;
}

Builder& Builder::select(const std::string& field) {
    if (field.empty()) {
        return *this;
    }
    auto existing = std::find_if(selects_.begin(), selects_.end(),
                                 [&field](const std::string& s) { return utils::iequals(s, field); });
    if (existing == selects_.end()) {
        selects_.push_back(field);
    }
    return *this;
}

void Builder::clear() {
    predicates_.clear();
    selects_.clear();
}

// ========== Rendering ==========

std::string Builder::renderClause(const Predicate& predicate) {
    const std::string field = utils::escapeFilterValue(predicate.field);
    const std::string value = utils::escapeFilterValue(predicate.value);

    switch (predicate.op) {
        case Operator::EQUALS:
            return "(" + field + "=" + value + ")";
        case Operator::NOT_EQUALS:
            return "(!(" + field + "=" + value + "))";
        case Operator::CONTAINS:
            return "(" + field + "=*" + value + "*)";
        case Operator::STARTS_WITH:
            return "(" + field + "=" + value + "*)";
        case Operator::ENDS_WITH:
            return "(" + field + "=*" + value + ")";
        case Operator::WILDCARD:
        case Operator::HAS:
            return "(" + field + "=*)";
        case Operator::GREATER_THAN_OR_EQUALS:
            return "(" + field + ">=" + value + ")";
        case Operator::LESS_THAN_OR_EQUALS:
            return "(" + field + "<=" + value + ")";
        case Operator::APPROXIMATELY_EQUALS:
            return "(" + field + "~=" + value + ")";
    }
    return "";
}

std::string Builder::render() const {
    if (predicates_.empty()) {
        return "";
    }

    std::string query = renderClause(predicates_.front());

    size_t i = 1;
    while (i < predicates_.size()) {
        Boolean boolean = predicates_[i].boolean;
        std::string group = query;
        while (i < predicates_.size() && predicates_[i].boolean == boolean) {
            group += renderClause(predicates_[i]);
            ++i;
        }
        query = std::string("(") + (boolean == Boolean::AND ? "&" : "|") + group + ")";
    }

    return query;
}

} // namespace adldap::query
