/**
 * @file extraction_report.hpp
 * @brief Per-entry outcomes and summary of one extraction run
 */

#pragma once

#include "dcmx/classify/record_classifier.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dcmx::extract {

/**
 * @brief What happened to one archive entry.
 */
enum class extraction_outcome {
    written,            ///< New file created under its own name
    skipped_existing,   ///< Destination already populated, nothing written
    overwritten,        ///< Existing file of the same name replaced
    conflict_renamed,   ///< Written under "<stem>_<n><ext>"
    skipped_not_dicom,  ///< Entry is not a DICOM record
    failed              ///< Read, classification or write failure
};

[[nodiscard]] constexpr auto to_string(extraction_outcome o) noexcept -> std::string_view {
    switch (o) {
        case extraction_outcome::written:
            return "written";
        case extraction_outcome::skipped_existing:
            return "skipped_existing";
        case extraction_outcome::overwritten:
            return "overwritten";
        case extraction_outcome::conflict_renamed:
            return "conflict_renamed";
        case extraction_outcome::skipped_not_dicom:
            return "skipped_not_dicom";
        case extraction_outcome::failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief Overall result of a run.
 */
enum class extraction_status {
    success,                ///< At least one record materialized, or cache hit
    no_qualifying_records,  ///< Archive opened but nothing was materialized
    archive_unreadable      ///< Archive could not be opened
};

[[nodiscard]] constexpr auto to_string(extraction_status s) noexcept -> std::string_view {
    switch (s) {
        case extraction_status::success:
            return "success";
        case extraction_status::no_qualifying_records:
            return "no_qualifying_records";
        case extraction_status::archive_unreadable:
            return "archive_unreadable";
    }
    return "unknown";
}

/**
 * @brief Result for one archive entry.
 */
struct extracted_file {
    /// Path inside the archive
    std::string source;

    /// Target path (empty for skipped_not_dicom and early failures)
    std::filesystem::path destination;

    extraction_outcome outcome{extraction_outcome::failed};

    classify::record_class kind{classify::record_class::not_dicom};

    /// Disambiguation number for conflict_renamed, 0 otherwise
    unsigned suffix{0};

    /// Failure or skip reason
    std::string reason;

    /**
     * @brief True if the run put this entry's bytes on disk.
     */
    [[nodiscard]] auto materialized() const noexcept -> bool {
        return outcome == extraction_outcome::written ||
               outcome == extraction_outcome::overwritten ||
               outcome == extraction_outcome::conflict_renamed;
    }
};

/**
 * @brief Summary counts over extraction_report::files.
 */
struct extraction_counts {
    std::size_t written{0};
    std::size_t skipped_existing{0};
    std::size_t overwritten{0};
    std::size_t renamed{0};
    std::size_t not_dicom{0};
    std::size_t failed{0};

    [[nodiscard]] auto materialized() const noexcept -> std::size_t {
        return written + overwritten + renamed;
    }
};

/**
 * @brief Everything one extract_archive() call produced.
 *
 * files is in archive enumeration order.
 */
struct extraction_report {
    std::filesystem::path archive;

    /// Destination root actually used
    std::filesystem::path destination;

    /// True when destination was derived from the archive name
    bool destination_derived{false};

    /// True when the non-empty destination was reused without writing
    bool cache_hit{false};

    extraction_status status{extraction_status::no_qualifying_records};

    /// Open failure message for archive_unreadable
    std::string error;

    std::vector<extracted_file> files;

    /// Files to render: materialized records in enumeration order, or the
    /// existing top-level files (sorted) on a cache hit
    std::vector<std::filesystem::path> record_paths;

    /// Members the archive reader refused to enumerate
    std::vector<std::string> rejected_entries;

    [[nodiscard]] auto counts() const noexcept -> extraction_counts;
};

}  // namespace dcmx::extract
