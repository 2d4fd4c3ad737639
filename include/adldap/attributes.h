/**
 * @file attributes.h
 * @brief Raw directory entry and mutation value types
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace adldap {

/// Attribute name to values, used for add and modify requests
using AttributeMap = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Raw directory entry as returned by the connection
 *
 * Attribute names are stored lower-cased; the size of each value list is the
 * attribute's value count. Values are kept byte-for-byte, so binary
 * attributes such as objectSid survive unchanged.
 */
class Attributes {
public:
    Attributes() = default;
    explicit Attributes(std::string dn);
    Attributes(std::string dn, const AttributeMap& values);

    const std::string& getDn() const { return dn_; }
    void setDn(const std::string& dn) { dn_ = dn; }

    /**
     * @brief Check if attribute is present (case-insensitive name)
     */
    bool has(const std::string& name) const;

    /**
     * @brief Get all values of an attribute
     * @return Values in server order, empty if the attribute is absent
     */
    const std::vector<std::string>& get(const std::string& name) const;

    /**
     * @brief Get first value of an attribute
     */
    std::optional<std::string> first(const std::string& name) const;

    void set(const std::string& name, std::vector<std::string> values);
    void add(const std::string& name, const std::string& value);

    /// Number of attributes in the entry
    size_t count() const { return values_.size(); }

    const std::map<std::string, std::vector<std::string>>& values() const { return values_; }

    bool operator==(const Attributes& other) const {
        return dn_ == other.dn_ && values_ == other.values_;
    }
    bool operator!=(const Attributes& other) const { return !(*this == other); }

private:
    std::string dn_;
    std::map<std::string, std::vector<std::string>> values_;
};

/// Entries of one result container, in server order
using RawEntries = std::vector<Attributes>;

/**
 * @brief Outcome of a mutating directory operation
 */
struct OperationResult {
    bool success;
    std::string message;

    static OperationResult ok(const std::string& msg = "Operation successful") {
        return {true, msg};
    }

    static OperationResult error(const std::string& msg) {
        return {false, msg};
    }

    explicit operator bool() const { return success; }
};

} // namespace adldap
