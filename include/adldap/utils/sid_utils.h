/**
 * @file sid_utils.h
 * @brief Windows security identifier (objectSid) conversion
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace adldap {
namespace utils {

/**
 * @brief Convert a binary SID to its text form
 *
 * Layout: revision (1 byte), sub-authority count (1 byte), identifier
 * authority (6 bytes, big-endian), then count sub-authorities
 * (4 bytes each, little-endian).
 *
 * @param binarySid Raw objectSid value
 * @return "S-1-5-21-..." or std::nullopt if the buffer is malformed
 */
std::optional<std::string> sidToString(const std::string& binarySid);

/**
 * @brief Replace the relative identifier (last sub-authority) of a binary SID
 *
 * Used to derive a user's primary group SID from the user SID and the
 * primaryGroupID attribute.
 *
 * @return Modified binary SID or std::nullopt if the buffer is malformed
 */
std::optional<std::string> replaceRid(const std::string& binarySid, uint32_t rid);

} // namespace utils
} // namespace adldap
