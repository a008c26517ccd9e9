/**
 * @file gallery_report.hpp
 * @brief Rendered images, their series grouping and the render summary
 */

#pragma once

#include <dcmx/render/image_metadata.hpp>
#include <dcmx/render/image_renderer.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace dcmx::gallery {

/**
 * @brief One PNG produced in this run.
 */
struct rendered_image {
    std::filesystem::path image;
    render::image_metadata metadata;

    /// Position in the record sequence the renderer was given
    std::size_t order{0};
};

/**
 * @brief Grouping key of a series.
 */
struct series_key {
    render::metadata_value<int> number;
    render::metadata_value<std::string> description;

    friend auto operator==(const series_key&, const series_key&) -> bool = default;

    /// "Series 3 - AX T1", with "unknown" for missing parts
    [[nodiscard]] auto title() const -> std::string {
        return "Series " + number.to_string() + " - " + description.to_string();
    }
};

/**
 * @brief Images of one series in display order.
 */
struct gallery_series {
    series_key key;
    std::vector<rendered_image> images;
};

/**
 * @brief Render summary counts.
 */
struct gallery_counts {
    std::size_t rendered{0};
    std::size_t no_image{0};
    std::size_t failed{0};
};

/**
 * @brief Everything one render_gallery() call produced.
 */
struct gallery_report {
    std::filesystem::path export_directory;

    /// One entry per input record, in input order
    std::vector<render::render_result> records;

    /// Successfully rendered images, in input order
    std::vector<rendered_image> images;

    /// Grouped and sorted images
    std::vector<gallery_series> series;

    /// index.html, empty if it could not be written
    std::filesystem::path document;

    /// Export directory or gallery write failure
    std::string error;

    [[nodiscard]] auto counts() const noexcept -> gallery_counts {
        gallery_counts c;
        for (const auto& record : records) {
            switch (record.outcome) {
                case render::render_outcome::rendered:
                    ++c.rendered;
                    break;
                case render::render_outcome::no_image:
                    ++c.no_image;
                    break;
                case render::render_outcome::failed:
                    ++c.failed;
                    break;
            }
        }
        return c;
    }
};

}  // namespace dcmx::gallery
