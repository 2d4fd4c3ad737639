/**
 * @file result_set.cpp
 * @brief Search results, raw and mapped
 */

#include "adldap/query/result_set.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace adldap::query {

ResultSet ResultSet::fromRaw(RawEntries rawEntries) {
    ResultSet results;
    results.rawEntries_ = std::move(rawEntries);
    results.raw_ = true;
    return results;
}

ResultSet ResultSet::fromMapped(RawEntries rawEntries) {
    ResultSet results;
    results.entries_.reserve(rawEntries.size());
    for (const auto& attributes : rawEntries) {
        results.entries_.push_back(models::EntryMapper::map(attributes));
    }
    results.rawEntries_ = std::move(rawEntries);
    results.raw_ = false;
    return results;
}

bool ResultSet::sortBy(const SortOrder& order) {
    std::vector<std::string> keys;
    keys.reserve(rawEntries_.size());
    for (const auto& attributes : rawEntries_) {
        auto value = attributes.first(order.field);
        if (!value) {
            spdlog::debug("Sort field '{}' missing from '{}', keeping server order",
                          order.field, attributes.getDn());
            return false;
        }
        keys.push_back(std::move(*value));
    }

    std::vector<size_t> indices(rawEntries_.size());
    std::iota(indices.begin(), indices.end(), 0);

    if (order.direction == SortDirection::ASC) {
        std::stable_sort(indices.begin(), indices.end(),
                         [&keys](size_t a, size_t b) { return keys[a] < keys[b]; });
    } else {
        std::stable_sort(indices.begin(), indices.end(),
                         [&keys](size_t a, size_t b) { return keys[b] < keys[a]; });
    }

    RawEntries sortedRaw;
    sortedRaw.reserve(indices.size());
    std::vector<models::MappedEntry> sortedEntries;
    sortedEntries.reserve(entries_.size());

    for (size_t index : indices) {
        sortedRaw.push_back(std::move(rawEntries_[index]));
        if (!entries_.empty()) {
            sortedEntries.push_back(std::move(entries_[index]));
        }
    }

    rawEntries_ = std::move(sortedRaw);
    entries_ = std::move(sortedEntries);
    return true;
}

Json::Value ResultSet::toJson() const {
    Json::Value array(Json::arrayValue);
    if (raw_) {
        for (const auto& attributes : rawEntries_) {
            array.append(models::toJson(attributes));
        }
    } else {
        for (const auto& entry : entries_) {
            array.append(models::toJson(entry));
        }
    }
    return array;
}

} // namespace adldap::query
