/**
 * @file mapped_entry.h
 * @brief Entry variant and the objectCategory based mapper
 */

#pragma once

#include "adldap/attributes.h"
#include "adldap/models/entry.h"

#include <json/json.h>

#include <variant>

namespace adldap::models {

/**
 * @brief Closed set of entry models
 *
 * Alternative order matches EntryCategory.
 */
using MappedEntry = std::variant<Entry, Computer, User, Group, Printer, Container, ExchangeServer>;

/**
 * @brief Common Entry view of any mapped entry
 */
const Entry& entryOf(const MappedEntry& entry);

EntryCategory categoryOf(const MappedEntry& entry);

/**
 * @brief Maps raw attributes to a model by object category
 *
 * The dispatch key is the first component of the exploded objectCategory
 * DN, compared case-insensitively:
 *
 *   computer                → Computer
 *   person                  → User
 *   group                   → Group
 *   container               → Container
 *   print-queue             → Printer
 *   ms-exch-exchange-server → ExchangeServer
 *
 * Anything else, including a missing objectCategory, maps to Entry.
 */
class EntryMapper {
public:
    static EntryCategory categorize(const Attributes& attributes);

    static MappedEntry map(const Attributes& attributes);
};

// ========== JSON ==========

/**
 * @brief {"dn": ..., "attributes": {name: [values...]}}
 */
Json::Value toJson(const Attributes& attributes);

/**
 * @brief Attribute JSON plus "category"
 */
Json::Value toJson(const MappedEntry& entry);

} // namespace adldap::models
