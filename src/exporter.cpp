/**
 * @file exporter.cpp
 * @brief Implementation of the extract/render entry points
 */

#include "dcmx/exporter.hpp"

#include "dcmx/archive/archive_reader.hpp"
#include "dcmx/extract/extraction_engine.hpp"
#include "dcmx/gallery/gallery_builder.hpp"

#include <system_error>
#include <utility>

namespace dcmx {

auto extract_archive(const extract_options& options, std::shared_ptr<di::ILogger> logger)
    -> extract::extraction_report {
    if (!logger) {
        logger = di::null_logger();
    }

    auto reader = archive::open_archive(options.archive);
    if (reader.is_err()) {
        extract::extraction_report report;
        report.archive = options.archive;
        report.status = extract::extraction_status::archive_unreadable;
        report.error = reader.error().message;
        logger->error_fmt("Cannot open archive {}: {}", options.archive.string(), report.error);
        return report;
    }

    auto& archive_reader = *reader.value();
    const bool derived = !options.destination.has_value();
    const auto destination =
        derived ? extract::extraction_engine::derive_destination(options.archive,
                                                                 archive_reader.kind())
                : *options.destination;

    logger->info_fmt("Extracting {} ({}, {} entries) to {}", options.archive.string(),
                     archive::to_string(archive_reader.kind()), archive_reader.entries().size(),
                     destination.string());

    extract::extraction_engine engine{logger};
    auto report = engine.run(archive_reader, destination, options.overwrite);
    report.archive = options.archive;
    report.destination_derived = derived;
    return report;
}

auto export_directory(const extract::extraction_report& report) -> std::filesystem::path {
    if (report.destination_derived) {
        auto sibling = report.destination;
        sibling += "_export";
        return sibling;
    }
    return report.destination / "export";
}

auto render_gallery(const extract::extraction_report& report, const render_options& options,
            std::shared_ptr<di::ILogger> logger) -> gallery::gallery_report {
    if (!logger) {
        logger = di::null_logger();
    }

    gallery::gallery_report result;
    result.export_directory = options.export_directory.value_or(export_directory(report));

    std::error_code ec;
    std::filesystem::create_directories(result.export_directory, ec);
    if (ec) {
        result.error = "Cannot create export directory " + result.export_directory.string() +
                       ": " + ec.message();
        logger->error(result.error);
        return result;
    }

    render::image_renderer renderer{options.renderer, logger};

    for (const auto& source : report.record_paths) {
        auto rendered = renderer.render(source, result.export_directory);
        if (rendered.outcome == render::render_outcome::rendered) {
            result.images.push_back(
                gallery::rendered_image{rendered.image, rendered.metadata, result.images.size()});
        }
        result.records.push_back(std::move(rendered));
    }

    result.series = gallery::gallery_builder::group(result.images);

    auto document = gallery::gallery_builder::write(result.export_directory, result.series);
    if (document.is_err()) {
        result.error = document.error().message;
        logger->error_fmt("Cannot write gallery in {}: {}", result.export_directory.string(),
                          result.error);
        return result;
    }
    result.document = document.value();

    const auto counts = result.counts();
    logger->info_fmt("Rendered {} image(s), {} without pixel data, {} failed; gallery at {}",
                     counts.rendered, counts.no_image, counts.failed, result.document.string());
    return result;
}

auto to_exit_status(const extract::extraction_report& report) noexcept -> exit_status {
    switch (report.status) {
        case extract::extraction_status::success:
            return exit_status::success;
        case extract::extraction_status::no_qualifying_records:
            return exit_status::no_qualifying_records;
        case extract::extraction_status::archive_unreadable:
            return exit_status::archive_unreadable;
    }
    return exit_status::archive_unreadable;
}

}  // namespace dcmx
