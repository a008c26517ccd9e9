/**
 * @file rle_builder.hpp
 * @brief Builds RLE Lossless frames for decoder tests
 */

#pragma once

#include <dcmx/encoding/byte_swap.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace dcmx::test {

/**
 * @brief PackBits-encode a segment using literal runs only.
 */
inline std::vector<uint8_t> pack_literal(const std::vector<uint8_t>& segment) {
    std::vector<uint8_t> out;
    for (size_t pos = 0; pos < segment.size();) {
        const size_t count = std::min<size_t>(128, segment.size() - pos);
        out.push_back(static_cast<uint8_t>(count - 1));
        out.insert(out.end(), segment.begin() + static_cast<std::ptrdiff_t>(pos),
                   segment.begin() + static_cast<std::ptrdiff_t>(pos + count));
        pos += count;
    }
    if (out.size() % 2 != 0) {
        out.push_back(0x80);  // no-op keeps segments even
    }
    return out;
}

/**
 * @brief Assemble a 64-byte RLE header followed by the encoded segments.
 * @param segments Raw (unencoded) byte planes, most significant first
 */
inline std::vector<uint8_t> make_rle_frame(const std::vector<std::vector<uint8_t>>& segments) {
    std::vector<uint8_t> header;
    std::vector<uint8_t> body;
    encoding::write_le32(header, static_cast<uint32_t>(segments.size()));

    for (const auto& segment : segments) {
        encoding::write_le32(header, static_cast<uint32_t>(64 + body.size()));
        const auto packed = pack_literal(segment);
        body.insert(body.end(), packed.begin(), packed.end());
    }
    header.resize(64, 0);
    header.insert(header.end(), body.begin(), body.end());
    return header;
}

/**
 * @brief Split 8-bit interleaved samples into one plane per sample.
 */
inline std::vector<std::vector<uint8_t>> split_planes(const std::vector<uint8_t>& pixels,
                                                      size_t samples_per_pixel) {
    std::vector<std::vector<uint8_t>> planes(samples_per_pixel);
    for (size_t i = 0; i < pixels.size(); ++i) {
        planes[i % samples_per_pixel].push_back(pixels[i]);
    }
    return planes;
}

}  // namespace dcmx::test
