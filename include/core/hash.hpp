#pragma once

#include <zlib.h>

#include <cstdint>
#include <string_view>

namespace meshguard {

/**
 * @brief IEEE CRC-32 of a byte string (zlib)
 */
[[nodiscard]] inline uint32_t crc32_of(std::string_view data) {
    const auto crc = ::crc32(0L, reinterpret_cast<const Bytef*>(data.data()),
                             static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

} // namespace meshguard
