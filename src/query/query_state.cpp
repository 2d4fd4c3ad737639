/**
 * @file query_state.cpp
 * @brief Query mode and sort helpers
 */

#include "adldap/query/query_state.h"
#include "adldap/utils/string_utils.h"

namespace adldap::query {

SearchMode resolveMode(bool read, bool recursive) {
    if (read) {
        return SearchMode::READ;
    }
    return recursive ? SearchMode::RECURSIVE : SearchMode::LISTING;
}

std::string toString(SearchMode mode) {
    switch (mode) {
        case SearchMode::READ:      return "READ";
        case SearchMode::RECURSIVE: return "RECURSIVE";
        case SearchMode::LISTING:   return "LISTING";
    }
    return "RECURSIVE";
}

SortDirection sortDirectionFromString(const std::string& direction) {
    return utils::toLower(direction) == "asc" ? SortDirection::ASC : SortDirection::DESC;
}

} // namespace adldap::query
