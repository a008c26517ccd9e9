/**
 * @file extraction_engine.cpp
 * @brief Implementation of the extraction engine
 */

#include "dcmx/extract/extraction_engine.hpp"

#include "dcmx/extract/destination_namer.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <random>
#include <system_error>

namespace dcmx::extract {

namespace {

/// Sibling of @p target used while its content is being written
auto temp_sibling(const std::filesystem::path& target) -> std::filesystem::path {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;

    auto temp_name = target.filename().string() + ".tmp." + std::to_string(dist(gen));
    return target.parent_path() / temp_name;
}

/// Best effort; archives without timestamps leave the write time
void apply_modification_time(const std::filesystem::path& path,
                             const archive::archive_entry& entry) {
    if (!entry.modified) {
        return;
    }
    const auto file_time = std::filesystem::file_time_type::clock::now() +
                           std::chrono::duration_cast<std::filesystem::file_time_type::duration>(
                               *entry.modified - std::chrono::system_clock::now());
    std::error_code ec;
    std::filesystem::last_write_time(path, file_time, ec);
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

extraction_engine::extraction_engine(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

// ============================================================================
// Destination Helpers
// ============================================================================

auto extraction_engine::derive_destination(const std::filesystem::path& archive,
                                           archive::archive_kind kind)
    -> std::filesystem::path {
    return archive.parent_path() /
           (archive.stem().string() + "_" + std::string{archive::to_string(kind)});
}

auto extraction_engine::existing_files(const std::filesystem::path& root)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::directory_iterator it{root, ec};
    if (ec) {
        return files;
    }
    for (const auto& dir_entry : it) {
        std::error_code status_ec;
        if (dir_entry.is_regular_file(status_ec)) {
            files.push_back(dir_entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// Extraction
// ============================================================================

auto extraction_engine::run(archive::archive_reader& reader,
                            const std::filesystem::path& destination,
                            bool overwrite) -> extraction_report {
    extraction_report report;
    report.archive = reader.path();
    report.destination = destination;
    report.rejected_entries = reader.rejected();

    for (const auto& name : report.rejected_entries) {
        logger_->warn_fmt("Not extracting unsafe archive member {}", name);
    }

    auto existing = existing_files(destination);
    report.cache_hit = !overwrite && !existing.empty();

    std::string directory_error;
    if (report.cache_hit) {
        logger_->warn_fmt(
            "Destination {} already contains {} file(s) and overwrite is off; skipping extraction",
            destination.string(), existing.size());
        report.record_paths = std::move(existing);
    } else {
        std::error_code ec;
        std::filesystem::create_directories(destination, ec);
        if (ec) {
            directory_error = "Cannot create destination " + destination.string() + ": " +
                              ec.message();
            logger_->error(directory_error);
        }
    }

    destination_namer namer{destination, overwrite};

    for (const auto& entry : reader.entries()) {
        extracted_file file;
        file.source = entry.path;

        const auto classification = classifier_.classify(reader, entry);
        file.kind = classification.kind;

        if (classification.kind == classify::record_class::not_dicom) {
            file.outcome = extraction_outcome::skipped_not_dicom;
            file.reason = classification.reason;
            logger_->debug_fmt("Skipping non-DICOM entry {}: {}", entry.path,
                               classification.reason);
            report.files.push_back(std::move(file));
            continue;
        }

        if (classification.kind == classify::record_class::unreadable) {
            file.outcome = extraction_outcome::failed;
            file.reason = classification.reason;
            logger_->warn_fmt("Cannot classify {}: {}", entry.path, classification.reason);
            report.files.push_back(std::move(file));
            continue;
        }

        if (report.cache_hit) {
            file.destination = destination / entry.base_name();
            file.outcome = extraction_outcome::skipped_existing;
            report.files.push_back(std::move(file));
            continue;
        }

        if (!directory_error.empty()) {
            file.outcome = extraction_outcome::failed;
            file.reason = directory_error;
            report.files.push_back(std::move(file));
            continue;
        }

        auto target = namer.assign(entry.base_name());
        file.destination = target.path;
        file.suffix = target.suffix;

        auto written = write_entry(reader, entry, target.path);
        if (written.is_err()) {
            file.outcome = extraction_outcome::failed;
            file.reason = written.error().message;
            logger_->warn_fmt("Failed to extract {}: {}", entry.path, file.reason);
        } else {
            file.outcome = target.outcome;
            report.record_paths.push_back(target.path);
            logger_->info_fmt("{}: {} -> {}", to_string(target.outcome), entry.path,
                              target.path.string());
        }
        report.files.push_back(std::move(file));
    }

    const auto counts = report.counts();
    if (report.cache_hit || counts.materialized() > 0) {
        report.status = extraction_status::success;
    } else {
        report.status = extraction_status::no_qualifying_records;
        logger_->warn_fmt("No DICOM records extracted from {}", report.archive.string());
    }

    return report;
}

auto extraction_engine::write_entry(archive::archive_reader& reader,
                                    const archive::archive_entry& entry,
                                    const std::filesystem::path& target)
    -> dcmx::VoidResult {
    auto data = reader.read_entry(entry);
    if (data.is_err()) {
        return dcmx::VoidResult(data.error());
    }

    const auto temp_path = temp_sibling(target);
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return dcmx::dcmx_void_error(dcmx::error_codes::file_write_error,
                                         "Cannot create " + temp_path.string());
        }
        const auto& bytes = data.value();
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return dcmx::dcmx_void_error(dcmx::error_codes::file_write_error,
                                         "Failed to write " + temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        return dcmx::dcmx_void_error(dcmx::error_codes::file_write_error,
                                     "Failed to rename temp file: " + ec.message());
    }

    apply_modification_time(target, entry);
    return dcmx::ok();
}

}  // namespace dcmx::extract
