/**
 * @file gallery_builder.hpp
 * @brief Series grouping and the self-contained HTML gallery
 */

#pragma once

#include "dcmx/gallery/gallery_report.hpp"

#include <dcmx/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dcmx::gallery {

/// Gallery document name inside the export directory
inline constexpr std::string_view kGalleryDocument = "index.html";

/**
 * @brief Groups rendered images and writes index.html.
 *
 * Series are ordered by number, then description, then first appearance,
 * with unknown values after known ones. Images inside a series are stably
 * sorted by slice location, then instance number, unknown last.
 */
class gallery_builder {
public:
    /**
     * @brief Group and sort @p images.
     *
     * Ties keep the relative order of rendered_image::order.
     */
    [[nodiscard]] static auto group(std::vector<rendered_image> images)
        -> std::vector<gallery_series>;

    /**
     * @brief Build the gallery document.
     *
     * The header comes from the image with the lowest order. Images are
     * referenced by file name relative to the document.
     */
    [[nodiscard]] static auto to_html(const std::vector<gallery_series>& series)
        -> std::string;

    /**
     * @brief Write to_html(@p series) to "<export_dir>/index.html".
     * @return Path of the written document
     */
    [[nodiscard]] static auto write(const std::filesystem::path& export_dir,
                                    const std::vector<gallery_series>& series)
        -> Result<std::filesystem::path>;

    /// Escape &, <, >, " and ' for element and attribute content
    [[nodiscard]] static auto html_escape(std::string_view text) -> std::string;

    /// Percent-encode a file name for use in a relative URL
    [[nodiscard]] static auto url_escape(std::string_view text) -> std::string;
};

}  // namespace dcmx::gallery
