/**
 * @file image_renderer.hpp
 * @brief Converts extracted DICOM records into annotated PNG images
 */

#pragma once

#include "dcmx/render/image_metadata.hpp"
#include "dcmx/render/text_overlay.hpp"

#include <dcmx/di/ilogger.hpp>
#include <dcmx/extract/destination_namer.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dcmx::render {

/**
 * @brief Renderer settings.
 */
struct renderer_config {
    /// Fonts tried before $DCMX_FONT_PATH and the platform fonts
    std::vector<std::filesystem::path> font_candidates;

    /// Consult $DCMX_FONT_PATH
    bool use_environment{true};

    /// Consult the platform font list
    bool use_platform_fonts{true};

    /// Glyph height in pixels
    unsigned font_pixel_size{14};

    /// Distance of the text block from the image corner
    int text_margin{4};

    /// Draw the metadata overlay at all
    bool overlay{true};
};

/**
 * @brief What happened to one record.
 */
enum class render_outcome {
    rendered,  ///< PNG written
    no_image,  ///< Record has no Pixel Data (e.g. DICOMDIR)
    failed     ///< Unreadable record, undecodable pixels or write failure
};

[[nodiscard]] constexpr auto to_string(render_outcome o) noexcept -> std::string_view {
    switch (o) {
        case render_outcome::rendered:
            return "rendered";
        case render_outcome::no_image:
            return "no_image";
        case render_outcome::failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief Result for one record.
 */
struct render_result {
    std::filesystem::path source;
    render_outcome outcome{render_outcome::failed};

    /// Written PNG, set for rendered
    std::filesystem::path image;

    /// Header fields, set whenever the record could be parsed
    image_metadata metadata;

    std::string reason;
};

/**
 * @brief Renders records one at a time into an export directory.
 *
 * The font is resolved once, at construction. Without a loadable font
 * images are written undecorated and a single warning is logged.
 */
class image_renderer {
public:
    explicit image_renderer(renderer_config config = {},
                            std::shared_ptr<di::ILogger> logger = nullptr);

    ~image_renderer();

    image_renderer(const image_renderer&) = delete;
    image_renderer& operator=(const image_renderer&) = delete;

    /**
     * @brief Render @p source to "<export_dir>/<source stem>.png".
     *
     * A name already written by this renderer gets a "_<n>" suffix, so
     * records sharing a stem (IM0001, IM0001.dcm) keep separate images.
     * PNGs left by an earlier run are replaced.
     */
    [[nodiscard]] auto render(const std::filesystem::path& source,
                              const std::filesystem::path& export_dir) -> render_result;

    /// Font used for overlays, nullptr if none could be loaded
    [[nodiscard]] auto font() const noexcept -> const font_face* { return font_.get(); }

    [[nodiscard]] auto config() const noexcept -> const renderer_config& { return config_; }

    /**
     * @brief Unsuffixed output path for @p source.
     */
    [[nodiscard]] static auto output_path(const std::filesystem::path& source,
                                          const std::filesystem::path& export_dir)
        -> std::filesystem::path;

private:
    renderer_config config_;
    std::shared_ptr<di::ILogger> logger_;
    std::unique_ptr<font_face> font_;
    std::map<std::filesystem::path, extract::destination_namer> output_names_;
};

}  // namespace dcmx::render
