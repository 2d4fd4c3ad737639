/**
 * @file string_utils.h
 * @brief String manipulation utilities
 */

#pragma once

#include <string>
#include <vector>

namespace adldap {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII)
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts ("" yields [""], "a," yields ["a", ""])
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Join strings with delimiter
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Case-insensitive (ASCII) equality
 */
bool iequals(const std::string& a, const std::string& b);

} // namespace utils
} // namespace adldap
