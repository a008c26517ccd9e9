/**
 * @file font_resolver.hpp
 * @brief Ranked font candidate lookup
 */

#pragma once

#include "dcmx/render/text_overlay.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dcmx::render {

/// Environment variable naming a font file to try before platform fonts
inline constexpr const char* kFontPathEnvironment = "DCMX_FONT_PATH";

/**
 * @brief Monospace fonts commonly installed on the build platform.
 */
[[nodiscard]] auto platform_font_candidates() -> std::vector<std::filesystem::path>;

/**
 * @brief Full candidate list: @p configured first, then $DCMX_FONT_PATH
 *        (when @p use_environment), then platform fonts (when @p use_platform).
 */
[[nodiscard]] auto font_candidates(const std::vector<std::filesystem::path>& configured,
                                   bool use_environment, bool use_platform = true)
    -> std::vector<std::filesystem::path>;

/**
 * @brief Outcome of trying a candidate list.
 */
struct font_resolution {
    /// First loadable font, or nullptr
    std::unique_ptr<font_face> font;

    /// "path: reason" for every candidate that failed to load
    std::vector<std::string> failures;
};

/**
 * @brief Load the first candidate that FreeType accepts.
 */
[[nodiscard]] auto resolve_font(const std::vector<std::filesystem::path>& candidates,
                                unsigned pixel_size) -> font_resolution;

}  // namespace dcmx::render
