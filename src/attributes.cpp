/**
 * @file attributes.cpp
 * @brief Raw directory entry
 */

#include "adldap/attributes.h"
#include "adldap/utils/string_utils.h"

namespace adldap {

Attributes::Attributes(std::string dn) : dn_(std::move(dn)) {}

Attributes::Attributes(std::string dn, const AttributeMap& values) : dn_(std::move(dn)) {
    for (const auto& [name, list] : values) {
        auto& target = values_[utils::toLower(name)];
        target.insert(target.end(), list.begin(), list.end());
    }
}

bool Attributes::has(const std::string& name) const {
    return values_.find(utils::toLower(name)) != values_.end();
}

const std::vector<std::string>& Attributes::get(const std::string& name) const {
    static const std::vector<std::string> empty;
    auto it = values_.find(utils::toLower(name));
    return it != values_.end() ? it->second : empty;
}

std::optional<std::string> Attributes::first(const std::string& name) const {
    const auto& list = get(name);
    if (list.empty()) {
        return std::nullopt;
    }
    return list.front();
}

void Attributes::set(const std::string& name, std::vector<std::string> values) {
    values_[utils::toLower(name)] = std::move(values);
}

void Attributes::add(const std::string& name, const std::string& value) {
    values_[utils::toLower(name)].push_back(value);
}

} // namespace adldap
