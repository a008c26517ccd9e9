/**
 * @file exporter.hpp
 * @brief Public entry points: extract an archive, render its records
 *
 * @code
 * dcmx::extract_options options;
 * options.archive = "study.zip";
 * auto report = dcmx::extract_archive(options, logger);
 *
 * if (report.status == dcmx::extract::extraction_status::success) {
 *     auto gallery = dcmx::render_gallery(report, {}, logger);
 * }
 * return static_cast<int>(dcmx::to_exit_status(report));
 * @endcode
 */

#pragma once

#include "dcmx/di/ilogger.hpp"
#include "dcmx/extract/extraction_report.hpp"
#include "dcmx/gallery/gallery_report.hpp"
#include "dcmx/render/image_renderer.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace dcmx {

/**
 * @brief Inputs of extract_archive().
 */
struct extract_options {
    std::filesystem::path archive;

    /// Used verbatim when set; otherwise "<archive dir>/<stem>_<zip|iso>"
    std::optional<std::filesystem::path> destination;

    bool overwrite{false};
};

/**
 * @brief Inputs of render_gallery().
 */
struct render_options {
    /// Defaults to export_directory(report)
    std::optional<std::filesystem::path> export_directory;

    render::renderer_config renderer;
};

/**
 * @brief Process exit codes of the command-line front end.
 */
enum class exit_status : int {
    success = 0,
    invalid_arguments = 1,
    no_qualifying_records = 2,
    archive_unreadable = 3
};

/**
 * @brief Open the archive and extract its DICOM records.
 *
 * Never throws; an archive that cannot be opened yields a report with
 * status archive_unreadable and the reason in report.error.
 */
[[nodiscard]] auto extract_archive(const extract_options& options,
                           std::shared_ptr<di::ILogger> logger = nullptr)
    -> extract::extraction_report;

/**
 * @brief Render report.record_paths into PNGs and write the gallery.
 *
 * index.html is rewritten on every call, even when nothing rendered.
 */
[[nodiscard]] auto render_gallery(const extract::extraction_report& report,
                          const render_options& options = {},
                          std::shared_ptr<di::ILogger> logger = nullptr)
    -> gallery::gallery_report;

/**
 * @brief "<destination>/export" for an explicit destination,
 *        "<destination>_export" beside a derived one.
 */
[[nodiscard]] auto export_directory(const extract::extraction_report& report)
    -> std::filesystem::path;

[[nodiscard]] auto to_exit_status(const extract::extraction_report& report) noexcept
    -> exit_status;

}  // namespace dcmx
