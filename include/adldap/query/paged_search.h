/**
 * @file paged_search.h
 * @brief Cookie-threaded paged search cursor
 */

#pragma once

#include "adldap/attributes.h"
#include "adldap/connection.h"
#include "adldap/query/query_state.h"

#include <optional>
#include <string>

namespace adldap::query {

/**
 * @brief Finite sequence of result pages
 *
 * Each call to next() requests one page with the cookie returned by the
 * previous page and waits for it. The cursor is exhausted when the server
 * returns an empty cookie or a page request fails; an exhausted cursor
 * issues no further requests and cannot be restarted.
 *
 * Usage:
 * @code
 *   PagedSearch pages(connection, state, 500, true);
 *   while (auto page = pages.next()) {
 *       process(*page);
 *   }
 * @endcode
 */
class PagedSearch {
public:
    /**
     * @param connection Directory connection (non-owning)
     * @param state Prepared query; pages are always subtree searches
     * @param pageSize Entries per page
     * @param isCritical Passed to the paging control unchanged
     */
    PagedSearch(IConnection& connection, QueryState state, int pageSize, bool isCritical);

    /**
     * @brief Fetch the next page
     * @return Raw entries of the page, std::nullopt once exhausted
     */
    std::optional<RawEntries> next();

    bool exhausted() const { return exhausted_; }

    /// Number of pages successfully fetched so far
    int pagesFetched() const { return pagesFetched_; }

    /// True if a page request failed before the cookie ran out
    bool failed() const { return failed_; }

    const QueryState& getState() const { return state_; }

private:
    IConnection& connection_;
    QueryState state_;
    int pageSize_;
    bool isCritical_;
    std::string cookie_;
    bool exhausted_ = false;
    bool failed_ = false;
    int pagesFetched_ = 0;
};

} // namespace adldap::query
