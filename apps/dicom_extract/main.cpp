/**
 * @file main.cpp
 * @brief DICOM Extract - Archive Export Utility
 *
 * A command-line utility that pulls the DICOM records out of a ZIP or
 * ISO 9660 archive and optionally renders them into annotated PNG images
 * with an HTML gallery.
 *
 * Usage:
 *   dicom_extract <archive> [output_dir] [options]
 *
 * Example:
 *   dicom_extract study.zip                      # Extract to ./study_zip
 *   dicom_extract cd.iso ./out --render          # Extract and render
 *   dicom_extract study.zip ./out --overwrite -v
 */

#include "dcmx/di/ilogger.hpp"
#include "dcmx/exporter.hpp"
#include "dcmx/integration/logger_adapter.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

/**
 * @brief Command line options
 */
struct options {
    std::filesystem::path archive_path;
    std::filesystem::path output_path;
    std::filesystem::path log_directory;
    std::filesystem::path font_path;
    bool render{false};
    bool overwrite{false};
    bool verbose{false};
    bool quiet{false};
};

constexpr const char* kBanner = R"(
  ____ ___ ____ ___  __  __   _______  _______ ____      _    ____ _____
 |  _ \_ _/ ___/ _ \|  \/  | | ____\ \/ /_   _|  _ \    / \  / ___|_   _|
 | | | | | |  | | | | |\/| | |  _|  \  /  | | | |_) |  / _ \| |     | |
 | |_| | | |__| |_| | |  | | | |___ /  \  | | |  _ <  / ___ \ |___  | |
 |____/___\____\___/|_|  |_| |_____/_/\_\ |_| |_| \_\/_/   \_\____| |_|

      DICOM Archive Export Utility
)";

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
DICOM Extract - Archive Export Utility

Usage: )" << program_name
              << R"( <archive> [output_dir] [options]

Arguments:
  archive             ZIP or ISO 9660 file containing DICOM records
  output_dir          Destination directory (default: <archive>_zip or
                      <archive>_iso beside the archive)

Processing Options:
  --render            Render records to PNG and write an HTML gallery
  --overwrite         Replace existing files instead of skipping a
                      populated destination
  --font <path>       Font file for the image overlay (also: DCMX_FONT_PATH)

Output Options:
  -v, --verbose       Log progress and list every extracted file
  --quiet             Minimal output (errors only)
  --log-dir <dir>     Also write a rotating log and audit trail to <dir>
  -h, --help          Show this help message

Examples:
  )" << program_name
              << R"( study.zip
  )" << program_name
              << R"( cd.iso ./out --render
  )" << program_name
              << R"( study.zip ./out --overwrite --verbose

Exit Codes:
  0  Success - DICOM records extracted (or already present)
  1  Error - Invalid arguments
  2  Error - No DICOM records found in archive
  3  Error - Archive could not be read
)";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output: parsed options
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--render") {
            opts.render = true;
        } else if (arg == "--overwrite") {
            opts.overwrite = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--log-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-dir requires a directory\n";
                return false;
            }
            opts.log_directory = argv[++i];
        } else if (arg == "--font") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --font requires a path\n";
                return false;
            }
            opts.font_path = argv[++i];
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.archive_path.empty()) {
            opts.archive_path = arg;
        } else if (opts.output_path.empty()) {
            opts.output_path = arg;
        } else {
            std::cerr << "Error: Too many arguments\n";
            return false;
        }
    }

    if (opts.archive_path.empty()) {
        std::cerr << "Error: No archive specified\n";
        return false;
    }

    // Quiet mode overrides verbose
    if (opts.quiet) {
        opts.verbose = false;
    }

    return true;
}

/**
 * @brief Configure console and optional file logging
 */
void initialize_logging(const options& opts) {
    using namespace dcmx::integration;

    logger_config config;
    config.min_level = opts.verbose ? log_level::info
                                    : (opts.quiet ? log_level::error : log_level::warn);
    if (!opts.log_directory.empty()) {
        config.log_directory = opts.log_directory;
        config.enable_file = true;
        config.enable_audit_log = true;
    }
    logger_adapter::initialize(config);
}

/**
 * @brief Print extraction summary
 * @param report The extraction report
 * @param verbose List every extracted file
 */
void print_summary(const dcmx::extract::extraction_report& report, bool verbose) {
    const auto counts = report.counts();

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "        Extraction Summary\n";
    std::cout << "========================================\n";
    std::cout << "  Archive:       " << report.archive.string() << "\n";
    std::cout << "  Destination:   " << report.destination.string() << "\n";
    std::cout << "  Extracted:     " << counts.written << "\n";
    std::cout << "  Overwritten:   " << counts.overwritten << "\n";
    std::cout << "  Renamed:       " << counts.renamed << "\n";
    std::cout << "  Skipped:       " << counts.skipped_existing << "\n";
    std::cout << "  Not DICOM:     " << counts.not_dicom << "\n";
    std::cout << "  Errors:        " << counts.failed << "\n";
    std::cout << "========================================\n";

    if (report.cache_hit) {
        std::cout << "Destination already populated; nothing was written "
                     "(use --overwrite to extract again).\n";
    }

    if (verbose) {
        for (const auto& path : report.record_paths) {
            std::cout << " - " << path.string() << "\n";
        }
        for (const auto& file : report.files) {
            if (file.outcome == dcmx::extract::extraction_outcome::failed) {
                std::cout << " ! " << file.source << ": " << file.reason << "\n";
            }
        }
    }
}

/**
 * @brief Print render summary
 * @param report The gallery report
 */
void print_render_summary(const dcmx::gallery::gallery_report& report) {
    const auto counts = report.counts();

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "        Render Summary\n";
    std::cout << "========================================\n";
    std::cout << "  Export dir:    " << report.export_directory.string() << "\n";
    std::cout << "  Rendered:      " << counts.rendered << "\n";
    std::cout << "  No image:      " << counts.no_image << "\n";
    std::cout << "  Failed:        " << counts.failed << "\n";
    std::cout << "  Series:        " << report.series.size() << "\n";
    if (!report.document.empty()) {
        std::cout << "  Gallery:       " << report.document.string() << "\n";
    }
    std::cout << "========================================\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        std::cout << kBanner << "\n";
        print_usage(argv[0]);
        return static_cast<int>(dcmx::exit_status::invalid_arguments);
    }

    if (!opts.quiet) {
        std::cout << kBanner << "\n";
    }

    initialize_logging(opts);
    auto logger = std::make_shared<dcmx::di::LoggerService>();

    dcmx::extract_options extract_opts;
    extract_opts.archive = opts.archive_path;
    if (!opts.output_path.empty()) {
        extract_opts.destination = opts.output_path;
    }
    extract_opts.overwrite = opts.overwrite;

    const auto report = dcmx::extract_archive(extract_opts, logger);
    const auto status = dcmx::to_exit_status(report);

    if (status == dcmx::exit_status::archive_unreadable) {
        std::cerr << "Error: Cannot read archive " << opts.archive_path.string() << ": "
                  << report.error << "\n";
        dcmx::integration::logger_adapter::log_archive_rejected(opts.archive_path.string(),
                                                                report.error);
        dcmx::integration::logger_adapter::shutdown();
        return static_cast<int>(status);
    }

    if (!opts.quiet) {
        print_summary(report, opts.verbose);
    }

    if (status == dcmx::exit_status::no_qualifying_records) {
        std::cerr << "No DICOM files found in archive.\n";
        dcmx::integration::logger_adapter::log_archive_rejected(opts.archive_path.string(),
                                                                "no DICOM records");
        dcmx::integration::logger_adapter::shutdown();
        return static_cast<int>(status);
    }

    dcmx::integration::logger_adapter::log_archive_extracted(
        opts.archive_path.string(), report.destination.string(), report.record_paths.size(),
        report.cache_hit);

    if (opts.render) {
        dcmx::render_options render_opts;
        if (!opts.font_path.empty()) {
            render_opts.renderer.font_candidates.push_back(opts.font_path);
        }

        const auto gallery = dcmx::render_gallery(report, render_opts, logger);
        if (!gallery.error.empty()) {
            std::cerr << "Error: " << gallery.error << "\n";
        } else {
            dcmx::integration::logger_adapter::log_gallery_exported(
                gallery.export_directory.string(), gallery.counts().rendered);
        }

        if (!opts.quiet) {
            print_render_summary(gallery);
        }
    }

    dcmx::integration::logger_adapter::shutdown();
    return static_cast<int>(status);
}
