/**
 * @file png_writer.hpp
 * @brief libpng output for display rasters
 */

#pragma once

#include "dcmx/render/raster.hpp"

#include <dcmx/core/result.hpp>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace dcmx::render {

/// PNG tEXt (keyword, text) pairs
using png_text_fields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Write @p image as an 8-bit gray or RGB PNG.
 *
 * Each text field becomes an uncompressed tEXt chunk before the image
 * data. Keywords are truncated to the 79 bytes PNG allows.
 *
 * @return ok, or image_write_error
 */
[[nodiscard]] auto write_png(const std::filesystem::path& path, const raster& image,
                             const png_text_fields& text = {}) -> dcmx::VoidResult;

}  // namespace dcmx::render
