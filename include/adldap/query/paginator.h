/**
 * @file paginator.h
 * @brief Flattened paged search result
 */

#pragma once

#include "adldap/query/result_set.h"

#include <json/json.h>

namespace adldap::query {

/**
 * @brief All rows of a paged search plus page bookkeeping
 *
 * Rows are in server order, page after page. currentPage selects the
 * slice returned by getCurrentPageEntries() (zero-based).
 */
class Paginator {
public:
    Paginator(ResultSet results, int perPage, int currentPage, int pages);

    const ResultSet& getResults() const { return results_; }
    int getPerPage() const { return perPage_; }
    int getCurrentPage() const { return currentPage_; }

    /// Number of pages retrieved from the server
    int getPages() const { return pages_; }

    /// Total number of rows
    size_t count() const { return results_.size(); }

    /**
     * @brief Raw rows of the current page
     */
    RawEntries getCurrentPageRawEntries() const;

    /**
     * @brief Mapped rows of the current page (empty for raw results)
     */
    std::vector<models::MappedEntry> getCurrentPageEntries() const;

    Json::Value toJson() const;

private:
    std::pair<size_t, size_t> currentRange(size_t total) const;

    ResultSet results_;
    int perPage_;
    int currentPage_;
    int pages_;
};

} // namespace adldap::query
