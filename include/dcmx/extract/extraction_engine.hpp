/**
 * @file extraction_engine.hpp
 * @brief Materializes the DICOM records of an archive into a directory
 */

#pragma once

#include "dcmx/archive/archive_reader.hpp"
#include "dcmx/classify/record_classifier.hpp"
#include "dcmx/di/ilogger.hpp"
#include "dcmx/extract/extraction_report.hpp"

#include <dcmx/core/result.hpp>

#include <filesystem>
#include <memory>
#include <vector>

namespace dcmx::extract {

/**
 * @brief Drives archive enumeration, classification and file writing.
 *
 * Entries are handled one at a time in enumeration order. A destination
 * root holding at least one regular file is treated as a complete earlier
 * extraction when overwrite is off: nothing is written and every record is
 * reported skipped_existing.
 *
 * @code
 * extraction_engine engine{logger};
 * auto report = engine.run(*reader, "/data/study_zip", false);
 * @endcode
 */
class extraction_engine {
public:
    explicit extraction_engine(std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Extract every DICOM record of @p reader into @p destination.
     *
     * The returned report has archive, destination, cache_hit, status,
     * files and record_paths filled in.
     */
    [[nodiscard]] auto run(archive::archive_reader& reader,
                           const std::filesystem::path& destination,
                           bool overwrite) -> extraction_report;

    /**
     * @brief "<archive parent>/<archive stem>_<zip|iso>".
     */
    [[nodiscard]] static auto derive_destination(const std::filesystem::path& archive,
                                                 archive::archive_kind kind)
        -> std::filesystem::path;

    /**
     * @brief Regular files directly inside @p root, sorted by path.
     */
    [[nodiscard]] static auto existing_files(const std::filesystem::path& root)
        -> std::vector<std::filesystem::path>;

private:
    [[nodiscard]] auto write_entry(archive::archive_reader& reader,
                                   const archive::archive_entry& entry,
                                   const std::filesystem::path& target)
        -> dcmx::VoidResult;

    std::shared_ptr<di::ILogger> logger_;
    classify::record_classifier classifier_;
};

}  // namespace dcmx::extract
