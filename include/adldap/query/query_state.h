/**
 * @file query_state.h
 * @brief Immutable snapshot of a prepared query
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace adldap::query {

/// Search scope, chosen from the read/recursive flags (read wins)
enum class SearchMode {
    READ,       ///< Base scope, the entry at the DN itself
    RECURSIVE,  ///< Subtree below the DN
    LISTING     ///< Immediate children of the DN
};

enum class SortDirection {
    ASC,
    DESC
};

struct SortOrder {
    std::string field;
    SortDirection direction = SortDirection::DESC;
};

SearchMode resolveMode(bool read, bool recursive);

std::string toString(SearchMode mode);

/**
 * @brief Parse "asc" (case-insensitive); anything else is DESC
 */
SortDirection sortDirectionFromString(const std::string& direction);

/**
 * @brief Everything needed to execute one query
 *
 * Built by Search::snapshot() and consumed by Search::execute(). The
 * filter is already rendered and the DN already resolved.
 */
class QueryState {
public:
    QueryState(std::vector<std::string> selects,
               std::string filter,
               std::optional<std::string> dn,
               SearchMode mode,
               bool raw,
               std::optional<SortOrder> sort)
        : selects_(std::move(selects)),
          filter_(std::move(filter)),
          dn_(std::move(dn)),
          mode_(mode),
          raw_(raw),
          sort_(std::move(sort)) {}

    const std::vector<std::string>& getSelects() const { return selects_; }
    const std::string& getFilter() const { return filter_; }

    /// std::nullopt addresses the directory root
    const std::optional<std::string>& getDn() const { return dn_; }

    SearchMode getMode() const { return mode_; }
    bool isRaw() const { return raw_; }
    const std::optional<SortOrder>& getSort() const { return sort_; }

    /**
     * @brief Copy with another filter (used by query(filter))
     */
    QueryState withFilter(std::string filter) const {
        return QueryState(selects_, std::move(filter), dn_, mode_, raw_, sort_);
    }

private:
    std::vector<std::string> selects_;
    std::string filter_;
    std::optional<std::string> dn_;
    SearchMode mode_;
    bool raw_;
    std::optional<SortOrder> sort_;
};

} // namespace adldap::query
