/**
 * @file text_overlay.hpp
 * @brief FreeType glyph rendering onto display rasters
 */

#pragma once

#include "dcmx/render/raster.hpp"

#include <dcmx/core/result.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dcmx::render {

/**
 * @brief A scalable font loaded at one pixel size.
 *
 * Owns its FreeType library and face handles.
 */
class font_face {
public:
    /**
     * @brief Load the first face of @p path.
     * @return The font, or font_unavailable with the FreeType error code
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path, unsigned pixel_size)
        -> dcmx::Result<std::unique_ptr<font_face>>;

    ~font_face();

    font_face(const font_face&) = delete;
    font_face& operator=(const font_face&) = delete;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path&;

    /// Baseline-to-baseline distance in pixels
    [[nodiscard]] auto line_height() const noexcept -> int;

    /// Distance from the top of a line to its baseline
    [[nodiscard]] auto ascender() const noexcept -> int;

    /**
     * @brief Blend UTF-8 @p text into @p image with its pen at (x, baseline).
     *
     * Glyph coverage is alpha; pixels outside the image are clipped.
     * Characters the face lacks are skipped.
     */
    void draw_text(raster& image, int x, int baseline, std::string_view text,
                   uint8_t intensity) const;

private:
    class impl;
    explicit font_face(std::unique_ptr<impl> handle);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief Draw @p lines top-left, white with a one-pixel black shadow.
 */
void draw_overlay(raster& image, const font_face& font,
                  const std::vector<std::string>& lines, int margin);

}  // namespace dcmx::render
