/**
 * @file checksum.cpp
 * @brief CRC32 implementation
 */

#include <kcenon/background_transfer/core/checksum.h>

#include <array>

namespace kcenon::background_transfer {

namespace {

constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32_POLYNOMIAL : crc >> 1;
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    uint32_t crc = 0xFFFFFFFF;

    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::crc32(std::string_view text) -> uint32_t {
    return crc32(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(text.data()), text.size()));
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

}  // namespace kcenon::background_transfer
