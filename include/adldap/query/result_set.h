/**
 * @file result_set.h
 * @brief Search results, raw and mapped
 */

#pragma once

#include "adldap/attributes.h"
#include "adldap/models/mapped_entry.h"
#include "adldap/query/query_state.h"

#include <json/json.h>

#include <vector>

namespace adldap::query {

/**
 * @brief Rows of a successful search
 *
 * Raw attribute maps are always kept. Unless the search ran in raw mode,
 * the mapped entries are kept alongside them in the same order.
 */
class ResultSet {
public:
    ResultSet() = default;

    /**
     * @brief Results without mapping
     */
    static ResultSet fromRaw(RawEntries rawEntries);

    /**
     * @brief Results with every row passed through EntryMapper
     */
    static ResultSet fromMapped(RawEntries rawEntries);

    bool isRaw() const { return raw_; }
    bool empty() const { return rawEntries_.empty(); }
    size_t size() const { return rawEntries_.size(); }

    const RawEntries& rawEntries() const { return rawEntries_; }

    /// Mapped rows; empty for raw results
    const std::vector<models::MappedEntry>& entries() const { return entries_; }

    /**
     * @brief Stable sort by the first value of a field
     *
     * Values compare byte-wise. If any row lacks the field, the sort key
     * map is incomplete and the rows keep server order.
     *
     * @return true if the rows were sorted
     */
    bool sortBy(const SortOrder& order);

    Json::Value toJson() const;

private:
    RawEntries rawEntries_;
    std::vector<models::MappedEntry> entries_;
    bool raw_ = false;
};

} // namespace adldap::query
