/**
 * @file paginator.cpp
 * @brief Flattened paged search result
 */

#include "adldap/query/paginator.h"

#include <algorithm>

namespace adldap::query {

Paginator::Paginator(ResultSet results, int perPage, int currentPage, int pages)
    : results_(std::move(results)),
      perPage_(perPage),
      currentPage_(currentPage),
      pages_(pages) {}

std::pair<size_t, size_t> Paginator::currentRange(size_t total) const {
    if (perPage_ <= 0 || currentPage_ < 0) {
        return {0, 0};
    }
    size_t begin = std::min(total, static_cast<size_t>(currentPage_) * static_cast<size_t>(perPage_));
    size_t end = std::min(total, begin + static_cast<size_t>(perPage_));
    return {begin, end};
}

RawEntries Paginator::getCurrentPageRawEntries() const {
    const auto& raw = results_.rawEntries();
    auto [begin, end] = currentRange(raw.size());
    return RawEntries(raw.begin() + begin, raw.begin() + end);
}

std::vector<models::MappedEntry> Paginator::getCurrentPageEntries() const {
    const auto& entries = results_.entries();
    auto [begin, end] = currentRange(entries.size());
    return std::vector<models::MappedEntry>(entries.begin() + begin, entries.begin() + end);
}

Json::Value Paginator::toJson() const {
    Json::Value json;
    json["perPage"] = perPage_;
    json["currentPage"] = currentPage_;
    json["pages"] = pages_;
    json["count"] = static_cast<Json::UInt64>(count());
    json["entries"] = results_.toJson();
    return json;
}

} // namespace adldap::query
