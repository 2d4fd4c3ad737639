/**
 * @file mapped_entry.cpp
 * @brief objectCategory based entry mapping
 */

#include "adldap/models/mapped_entry.h"
#include "adldap/schema.h"
#include "adldap/utils/ldap_utils.h"
#include "adldap/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <map>

namespace adldap::models {

namespace {

const std::map<std::string, EntryCategory>& categoryTable() {
    static const std::map<std::string, EntryCategory> table = {
        {schema::OBJECT_CATEGORY_COMPUTER, EntryCategory::COMPUTER},
        {schema::OBJECT_CATEGORY_PERSON, EntryCategory::USER},
        {schema::OBJECT_CATEGORY_GROUP, EntryCategory::GROUP},
        {schema::OBJECT_CATEGORY_CONTAINER, EntryCategory::CONTAINER},
        {schema::OBJECT_CATEGORY_PRINTER, EntryCategory::PRINTER},
        {schema::MS_EXCHANGE_SERVER, EntryCategory::EXCHANGE_SERVER},
    };
    return table;
}

} // anonymous namespace

const Entry& entryOf(const MappedEntry& entry) {
    return std::visit([](const auto& e) -> const Entry& { return e; }, entry);
}

EntryCategory categoryOf(const MappedEntry& entry) {
    return static_cast<EntryCategory>(entry.index());
}

EntryCategory EntryMapper::categorize(const Attributes& attributes) {
    auto category = attributes.first(schema::OBJECT_CATEGORY);
    if (!category) {
        return EntryCategory::GENERIC;
    }

    auto components = utils::explodeDn(*category);
    if (components.empty()) {
        return EntryCategory::GENERIC;
    }

    const auto& table = categoryTable();
    auto it = table.find(utils::toLower(components.front()));
    return it != table.end() ? it->second : EntryCategory::GENERIC;
}

MappedEntry EntryMapper::map(const Attributes& attributes) {
    EntryCategory category = categorize(attributes);
    spdlog::trace("Mapping entry '{}' as {}", attributes.getDn(), toString(category));

    switch (category) {
        case EntryCategory::COMPUTER:        return Computer(attributes);
        case EntryCategory::USER:            return User(attributes);
        case EntryCategory::GROUP:           return Group(attributes);
        case EntryCategory::PRINTER:         return Printer(attributes);
        case EntryCategory::CONTAINER:       return Container(attributes);
        case EntryCategory::EXCHANGE_SERVER: return ExchangeServer(attributes);
        case EntryCategory::GENERIC:         break;
    }
    return Entry(attributes);
}

// ========== JSON ==========

Json::Value toJson(const Attributes& attributes) {
    Json::Value json;
    json["dn"] = attributes.getDn();

    Json::Value values(Json::objectValue);
    for (const auto& [name, list] : attributes.values()) {
        Json::Value array(Json::arrayValue);
        for (const auto& value : list) {
            array.append(value);
        }
        values[name] = array;
    }
    json["attributes"] = values;

    return json;
}

Json::Value toJson(const MappedEntry& entry) {
    Json::Value json = toJson(entryOf(entry).getAttributes());
    json["category"] = toString(categoryOf(entry));
    return json;
}

} // namespace adldap::models
