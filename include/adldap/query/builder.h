/**
 * @file builder.h
 * @brief LDAP filter builder
 *
 * Accumulates predicates in insertion order and renders them into a
 * single RFC 4515 filter string. Field names and values are escaped.
 *
 * Usage:
 * @code
 *   Builder builder;
 *   builder.where("objectcategory", "person").orWhereStartsWith("cn", "bo");
 *   builder.render();  // "(|(objectcategory=person)(cn=bo*))"
 * @endcode
 */

#pragma once

#include "adldap/query/operator.h"

#include <string>
#include <vector>

namespace adldap::query {

/**
 * @brief A unit of search criteria
 */
struct Predicate {
    std::string field;
    Operator op;
    std::string value;
    Boolean boolean;

    bool operator==(const Predicate& other) const {
        return field == other.field && op == other.op && value == other.value &&
               boolean == other.boolean;
    }
};

class Builder {
public:
    Builder() = default;

    /**
     * @brief Append a predicate
     * @param boolean How the predicate joins the expression before it
     */
    Builder& addPredicate(const std::string& field, Operator op,
                          const std::string& value = "", Boolean boolean = Boolean::AND);

    /**
     * @brief Append a catch-all (field=*) predicate
     */
    Builder& addWildcard(const std::string& field = "objectclass", Boolean boolean = Boolean::AND);

    Builder& where(const std::string& field, Operator op, const std::string& value = "");
    Builder& where(const std::string& field, const std::string& value);
    Builder& whereContains(const std::string& field, const std::string& value);
    Builder& whereStartsWith(const std::string& field, const std::string& value);
    Builder& whereEndsWith(const std::string& field, const std::string& value);
    Builder& whereHas(const std::string& field);

    Builder& orWhere(const std::string& field, Operator op, const std::string& value = "");
    Builder& orWhere(const std::string& field, const std::string& value);
    Builder& orWhereContains(const std::string& field, const std::string& value);
    Builder& orWhereStartsWith(const std::string& field, const std::string& value);
    Builder& orWhereEndsWith(const std::string& field, const std::string& value);
    Builder& orWhereHas(const std::string& field);

    /**
     * @brief Add attributes to retrieve
     *
     * Keeps insertion order; names already selected (case-insensitive)
     * are ignored.
     */
    Builder& select(const std::vector<std::string>& fields);
    Builder& select(const std::string& field);

    const std::vector<std::string>& getSelects() const { return selects_; }
    const std::vector<Predicate>& getPredicates() const { return predicates_; }
    bool hasPredicates() const { return !predicates_.empty(); }

    /**
     * @brief Remove all predicates and selects
     */
    void clear();

    /**
     * @brief Render the filter string
     *
     * Predicates fold left to right: the first predicate seeds the
     * expression, and every run of consecutive predicates sharing a boolean
     * wraps the expression so far together with the run's clauses in one
     * (&...) or (|...) group. A single predicate renders bare; no
     * predicates render "".
     *
     *   a AND b AND c      → (&(a)(b)(c))
     *   a OR b OR c        → (|(a)(b)(c))
     *   a AND b OR c       → (|(&(a)(b))(c))
     *   a OR b AND c       → (&(|(a)(b))(c))
     */
    std::string render() const;

    /**
     * @brief Render one predicate as a filter clause (boolean ignored)
     */
    static std::string renderClause(const Predicate& predicate);

private:
    std::vector<Predicate> predicates_;
    std::vector<std::string> selects_;
};

} // namespace adldap::query
