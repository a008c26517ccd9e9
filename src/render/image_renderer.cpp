/**
 * @file image_renderer.cpp
 * @brief Implementation of the record renderer
 */

#include "dcmx/render/image_renderer.hpp"

#include "dcmx/render/font_resolver.hpp"
#include "dcmx/render/pixel_decoder.hpp"
#include "dcmx/render/png_writer.hpp"

#include <dcmx/core/dicom_file.hpp>
#include <dcmx/core/dicom_tag_constants.hpp>

#include <utility>

namespace dcmx::render {

// ============================================================================
// Construction
// ============================================================================

image_renderer::image_renderer(renderer_config config, std::shared_ptr<di::ILogger> logger)
    : config_(std::move(config)), logger_(logger ? std::move(logger) : di::null_logger()) {
    if (!config_.overlay) {
        return;
    }

    const auto candidates = font_candidates(config_.font_candidates, config_.use_environment,
                                            config_.use_platform_fonts);
    auto resolution = resolve_font(candidates, config_.font_pixel_size);
    for (const auto& failure : resolution.failures) {
        logger_->debug_fmt("Font candidate rejected: {}", failure);
    }

    font_ = std::move(resolution.font);
    if (font_) {
        logger_->debug_fmt("Overlay font: {}", font_->path().string());
    } else {
        logger_->warn("No usable font found; images are rendered without text overlay");
    }
}

image_renderer::~image_renderer() = default;

// ============================================================================
// Rendering
// ============================================================================

auto image_renderer::output_path(const std::filesystem::path& source,
                                 const std::filesystem::path& export_dir)
    -> std::filesystem::path {
    return export_dir / (source.stem().string() + ".png");
}

auto image_renderer::render(const std::filesystem::path& source,
                            const std::filesystem::path& export_dir) -> render_result {
    render_result result;
    result.source = source;
    result.metadata.source_path = source;

    auto file = core::dicom_file::open(source);
    if (file.is_err()) {
        result.reason = file.error().message;
        logger_->warn_fmt("Cannot read {}: {}", source.string(), result.reason);
        return result;
    }

    const auto& dataset = file.value().dataset();
    result.metadata = image_metadata::from_dataset(dataset, source);

    if (!dataset.contains(core::tags::pixel_data)) {
        result.outcome = render_outcome::no_image;
        result.reason = "no pixel data";
        logger_->info_fmt("{}: no image", source.string());
        return result;
    }

    auto frame = decode_first_frame(file.value());
    if (frame.is_err()) {
        result.reason = frame.error().message;
        logger_->warn_fmt("Cannot decode {}: {}", source.string(), result.reason);
        return result;
    }

    auto image = to_display_raster(frame.value());
    if (image.is_err()) {
        result.reason = image.error().message;
        logger_->warn_fmt("Cannot convert {}: {}", source.string(), result.reason);
        return result;
    }

    if (font_) {
        draw_overlay(image.value(), *font_, result.metadata.overlay_lines(),
                     config_.text_margin);
    }

    auto& names = output_names_.try_emplace(export_dir, export_dir, true).first->second;
    const auto target = names.assign(output_path(source, export_dir).filename().string()).path;
    auto written = write_png(target, image.value(), result.metadata.text_fields());
    if (written.is_err()) {
        result.reason = written.error().message;
        logger_->warn_fmt("Cannot write {}: {}", target.string(), result.reason);
        return result;
    }

    result.outcome = render_outcome::rendered;
    result.image = target;
    logger_->info_fmt("Rendered {} -> {}", source.string(), target.string());
    return result;
}

}  // namespace dcmx::render
