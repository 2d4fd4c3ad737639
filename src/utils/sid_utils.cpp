/**
 * @file sid_utils.cpp
 * @brief Windows security identifier conversion
 */

#include "adldap/utils/sid_utils.h"

namespace adldap {
namespace utils {

namespace {

constexpr size_t SID_HEADER_SIZE = 8;
constexpr size_t SUB_AUTHORITY_SIZE = 4;

bool isWellFormed(const std::string& binarySid) {
    if (binarySid.size() < SID_HEADER_SIZE) {
        return false;
    }
    size_t count = static_cast<unsigned char>(binarySid[1]);
    return binarySid.size() == SID_HEADER_SIZE + count * SUB_AUTHORITY_SIZE;
}

uint32_t readLittleEndian32(const std::string& data, size_t offset) {
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<unsigned char>(data[offset + i])) << (8 * i);
    }
    return value;
}

} // anonymous namespace

std::optional<std::string> sidToString(const std::string& binarySid) {
    if (!isWellFormed(binarySid)) {
        return std::nullopt;
    }

    unsigned revision = static_cast<unsigned char>(binarySid[0]);
    size_t count = static_cast<unsigned char>(binarySid[1]);

    // 48-bit identifier authority, big-endian
    uint64_t authority = 0;
    for (size_t i = 2; i < SID_HEADER_SIZE; ++i) {
        authority = (authority << 8) | static_cast<unsigned char>(binarySid[i]);
    }

    std::string result = "S-" + std::to_string(revision) + "-" + std::to_string(authority);
    for (size_t i = 0; i < count; ++i) {
        result += "-" + std::to_string(readLittleEndian32(binarySid, SID_HEADER_SIZE + i * SUB_AUTHORITY_SIZE));
    }

    return result;
}

std::optional<std::string> replaceRid(const std::string& binarySid, uint32_t rid) {
    if (!isWellFormed(binarySid) || static_cast<unsigned char>(binarySid[1]) == 0) {
        return std::nullopt;
    }

    std::string result = binarySid;
    size_t offset = result.size() - SUB_AUTHORITY_SIZE;
    for (size_t i = 0; i < 4; ++i) {
        result[offset + i] = static_cast<char>((rid >> (8 * i)) & 0xff);
    }
    return result;
}

} // namespace utils
} // namespace adldap
