/**
 * @file record_classifier.hpp
 * @brief Content-based detection of DICOM records inside an archive
 *
 * The classifier looks only at a bounded prefix of each entry: the
 * 128-byte preamble, the "DICM" signature and the File Meta Information
 * group. Pixel data is never read.
 *
 * @see DICOM PS3.10 Section 7.1 - DICOM File Meta Information
 */

#ifndef DCMX_CLASSIFY_RECORD_CLASSIFIER_HPP
#define DCMX_CLASSIFY_RECORD_CLASSIFIER_HPP

#include "dcmx/archive/archive_entry.hpp"
#include "dcmx/archive/archive_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace dcmx::classify {

/// Number of leading bytes read from each entry.
inline constexpr std::size_t kClassifierWindow = 8 * 1024;

/**
 * @brief What an archive entry turned out to be.
 */
enum class record_class {
    dicom_image,      ///< Part 10 file other than a directory index
    dicom_directory,  ///< DICOMDIR (Media Storage Directory Storage)
    not_dicom,        ///< No preamble / "DICM" signature
    unreadable        ///< Prefix could not be read, or corrupt meta group
};

[[nodiscard]] constexpr auto to_string(record_class c) noexcept -> std::string_view {
    switch (c) {
        case record_class::dicom_image:
            return "dicom_image";
        case record_class::dicom_directory:
            return "dicom_directory";
        case record_class::not_dicom:
            return "not_dicom";
        case record_class::unreadable:
            return "unreadable";
    }
    return "unknown";
}

/**
 * @brief Outcome of classifying one entry.
 */
struct classification_result {
    record_class kind{record_class::not_dicom};

    /// Human readable explanation for not_dicom / unreadable
    std::string reason;

    /// Media Storage SOP Class UID (0002,0002), when present
    std::string sop_class_uid;

    /**
     * @brief True for records the extraction engine materializes.
     */
    [[nodiscard]] auto is_dicom_record() const noexcept -> bool {
        return kind == record_class::dicom_image || kind == record_class::dicom_directory;
    }
};

/**
 * @brief Decides whether archive entries are DICOM records.
 *
 * Stateless; one instance may classify any number of entries.
 */
class record_classifier {
public:
    /**
     * @brief Classify @p entry by reading at most kClassifierWindow bytes.
     */
    [[nodiscard]] auto classify(archive::archive_reader& reader,
                                const archive::archive_entry& entry) const
        -> classification_result;

    /**
     * @brief Classify an already-read prefix.
     *
     * @param prefix Leading bytes of the entry
     * @param base_name File name of the entry (DICOMDIR detection)
     * @param complete True if @p prefix is the whole entry
     */
    [[nodiscard]] auto classify_prefix(std::span<const uint8_t> prefix,
                                       std::string_view base_name,
                                       bool complete) const
        -> classification_result;

    /**
     * @brief True if @p base_name is "DICOMDIR", ignoring case.
     */
    [[nodiscard]] static auto is_directory_name(std::string_view base_name) noexcept
        -> bool;
};

}  // namespace dcmx::classify

#endif  // DCMX_CLASSIFY_RECORD_CLASSIFIER_HPP
