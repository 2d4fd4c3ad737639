/**
 * @file paged_search.cpp
 * @brief Cookie-threaded paged search cursor
 */

#include "adldap/query/paged_search.h"

#include <spdlog/spdlog.h>

namespace adldap::query {

PagedSearch::PagedSearch(IConnection& connection, QueryState state, int pageSize, bool isCritical)
    : connection_(connection),
      state_(std::move(state)),
      pageSize_(pageSize),
      isCritical_(isCritical) {}

std::optional<RawEntries> PagedSearch::next() {
    if (exhausted_) {
        return std::nullopt;
    }

    if (!connection_.controlPagedResult(pageSize_, isCritical_, cookie_)) {
        spdlog::warn("Paged result control rejected (page {}, size {})", pagesFetched_ + 1, pageSize_);
        failed_ = true;
        exhausted_ = true;
        return std::nullopt;
    }

    auto results = connection_.search(state_.getDn(), state_.getFilter(), state_.getSelects());
    if (!results) {
        spdlog::warn("Paged search returned no results (page {}, filter '{}')",
                     pagesFetched_ + 1, state_.getFilter());
        failed_ = true;
        exhausted_ = true;
        return std::nullopt;
    }

    if (!connection_.controlPagedResultResponse(*results, cookie_)) {
        spdlog::debug("No paged result response control, treating page {} as last", pagesFetched_ + 1);
        cookie_.clear();
    }

    RawEntries entries = connection_.getEntries(*results);
    ++pagesFetched_;

    spdlog::debug("Fetched page {} with {} entries", pagesFetched_, entries.size());

    if (cookie_.empty()) {
        exhausted_ = true;
    }

    return entries;
}

} // namespace adldap::query
