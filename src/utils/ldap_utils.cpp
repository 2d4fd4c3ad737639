/**
 * @file ldap_utils.cpp
 * @brief LDAP filter and DN string helpers
 */

#include "adldap/utils/ldap_utils.h"
#include "adldap/utils/string_utils.h"

#include <cctype>
#include <cstdio>

namespace adldap {
namespace utils {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * @brief Resolve RFC 4514 escapes (\, and \2C style hex pairs)
 */
std::string unescapeDnValue(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != '\\' || i + 1 >= value.size()) {
            result += c;
            continue;
        }

        if (i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }

        result += value[i + 1];
        ++i;
    }

    return result;
}

/**
 * @brief Trim whitespace, keeping an escaped trailing space
 */
std::string trimComponent(const std::string& component) {
    size_t start = 0;
    while (start < component.size() && std::isspace(static_cast<unsigned char>(component[start]))) {
        ++start;
    }

    size_t end = component.size();
    while (end > start && std::isspace(static_cast<unsigned char>(component[end - 1]))) {
        if (end - 1 > start && component[end - 2] == '\\') {
            break;
        }
        --end;
    }

    return component.substr(start, end - start);
}

} // anonymous namespace

std::string escapeFilterValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() * 3);

    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        switch (c) {
            case '*':
                escaped += "\\2a";
                break;
            case '(':
                escaped += "\\28";
                break;
            case ')':
                escaped += "\\29";
                break;
            case '\\':
                escaped += "\\5c";
                break;
            case '\0':
                escaped += "\\00";
                break;
            default:
                if (uc < 0x20 || uc == 0x7f) {
                    char buf[4];
                    std::snprintf(buf, sizeof(buf), "\\%02x", uc);
                    escaped += buf;
                } else {
                    escaped += c;
                }
                break;
        }
    }

    return escaped;
}

std::string escapeDnComponent(const std::string& value) {
    if (value.empty()) return value;

    std::string escaped;
    escaped.reserve(value.size() * 2);

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];

        if (c == ',' || c == '=' || c == '+' || c == '"' || c == '\\' ||
            c == '<' || c == '>' || c == ';') {
            escaped += '\\';
            escaped += c;
        }
        // Leading space or hash
        else if (i == 0 && (c == ' ' || c == '#')) {
            escaped += '\\';
            escaped += c;
        }
        // Trailing space
        else if (i == value.size() - 1 && c == ' ') {
            escaped += '\\';
            escaped += c;
        }
        else if (c == '\0') {
            escaped += "\\00";
        }
        else {
            escaped += c;
        }
    }

    return escaped;
}

std::vector<std::string> explodeDn(const std::string& dn, bool removeAttributePrefixes) {
    std::vector<std::string> components;
    if (trim(dn).empty()) {
        return components;
    }

    // Split on unescaped commas, keeping escapes for now
    std::vector<std::string> raw;
    std::string current;
    for (size_t i = 0; i < dn.size(); ++i) {
        char c = dn[i];
        if (c == '\\' && i + 1 < dn.size()) {
            current += c;
            current += dn[++i];
        } else if (c == ',') {
            raw.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    raw.push_back(current);

    for (const auto& part : raw) {
        std::string component = trimComponent(part);

        if (removeAttributePrefixes) {
            for (size_t i = 0; i < component.size(); ++i) {
                if (component[i] == '\\') {
                    ++i;
                } else if (component[i] == '=') {
                    component = trimComponent(component.substr(i + 1));
                    break;
                }
            }
        }

        components.push_back(unescapeDnValue(component));
    }

    return components;
}

} // namespace utils
} // namespace adldap
