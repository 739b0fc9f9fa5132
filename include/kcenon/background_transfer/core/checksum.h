/**
 * @file checksum.h
 * @brief CRC32 used to detect torn or corrupted state files
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_CHECKSUM_H
#define KCENON_BACKGROUND_TRANSFER_CORE_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace kcenon::background_transfer {

class checksum {
public:
    /**
     * @brief Calculate CRC32 (IEEE 802.3 polynomial) of data
     * @param data Input data span
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    [[nodiscard]] static auto crc32(std::string_view text) -> uint32_t;

    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_CHECKSUM_H
