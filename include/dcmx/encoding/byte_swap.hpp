/**
 * @file byte_swap.hpp
 * @brief Endian-aware integer reads/writes on byte buffers
 *
 * Shared by the DICOM data set reader and the ZIP / ISO 9660 archive
 * parsers, which mix little and big endian fields.
 */

#ifndef DCMX_ENCODING_BYTE_SWAP_HPP
#define DCMX_ENCODING_BYTE_SWAP_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dcmx::encoding {

/// @name Little Endian
/// @{

[[nodiscard]] constexpr uint16_t read_le16(const uint8_t* data) noexcept {
    return static_cast<uint16_t>(static_cast<uint16_t>(data[0]) |
                                 (static_cast<uint16_t>(data[1]) << 8));
}

[[nodiscard]] constexpr uint32_t read_le32(const uint8_t* data) noexcept {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

[[nodiscard]] constexpr uint64_t read_le64(const uint8_t* data) noexcept {
    return static_cast<uint64_t>(read_le32(data)) |
           (static_cast<uint64_t>(read_le32(data + 4)) << 32);
}

inline void write_le16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline void write_le32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

/// @}

/// @name Big Endian
/// @{

[[nodiscard]] constexpr uint16_t read_be16(const uint8_t* data) noexcept {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) |
                                 static_cast<uint16_t>(data[1]));
}

[[nodiscard]] constexpr uint32_t read_be32(const uint8_t* data) noexcept {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

inline void write_be16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void write_be32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

/// @}

/**
 * @brief Reverses the byte order of each @p unit-sized value in place.
 *
 * A trailing partial unit is left untouched.
 */
inline void swap_units(std::span<uint8_t> data, std::size_t unit) noexcept {
    if (unit < 2) {
        return;
    }
    for (std::size_t i = 0; i + unit <= data.size(); i += unit) {
        std::reverse(data.begin() + static_cast<std::ptrdiff_t>(i),
                     data.begin() + static_cast<std::ptrdiff_t>(i + unit));
    }
}

}  // namespace dcmx::encoding

#endif  // DCMX_ENCODING_BYTE_SWAP_HPP
