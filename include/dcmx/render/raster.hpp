/**
 * @file raster.hpp
 * @brief 8-bit display raster
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dcmx::render {

/**
 * @brief Row-major 8-bit image with 1 (gray) or 3 (RGB) interleaved channels.
 */
struct raster {
    uint32_t width{0};
    uint32_t height{0};
    uint32_t channels{1};
    std::vector<uint8_t> pixels;

    raster() = default;
    raster(uint32_t w, uint32_t h, uint32_t c)
        : width(w), height(h), channels(c),
          pixels(static_cast<size_t>(w) * h * c, 0) {}

    [[nodiscard]] auto row_stride() const noexcept -> size_t {
        return static_cast<size_t>(width) * channels;
    }

    [[nodiscard]] auto at(uint32_t x, uint32_t y) noexcept -> uint8_t* {
        return pixels.data() + static_cast<size_t>(y) * row_stride() +
               static_cast<size_t>(x) * channels;
    }
};

}  // namespace dcmx::render
