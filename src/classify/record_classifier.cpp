/**
 * @file record_classifier.cpp
 * @brief Implementation of the DICOM record classifier
 */

#include "dcmx/classify/record_classifier.hpp"

#include "dcmx/core/dicom_file.hpp"
#include "dcmx/core/dicom_tag_constants.hpp"

#include <algorithm>
#include <cctype>

namespace dcmx::classify {

auto record_classifier::classify(archive::archive_reader& reader,
                                 const archive::archive_entry& entry) const
    -> classification_result {
    auto prefix = reader.read_prefix(entry, kClassifierWindow);
    if (prefix.is_err()) {
        return {record_class::unreadable, prefix.error().message, {}};
    }

    const bool complete = entry.size <= kClassifierWindow;
    return classify_prefix(prefix.value(), entry.base_name(), complete);
}

auto record_classifier::classify_prefix(std::span<const uint8_t> prefix,
                                        std::string_view base_name,
                                        bool complete) const
    -> classification_result {
    if (prefix.size() < core::dicom_file::kMetaOffset) {
        return {record_class::not_dicom, "shorter than preamble and signature", {}};
    }
    if (!core::dicom_file::has_dicm_prefix(prefix)) {
        return {record_class::not_dicom, "no DICM signature", {}};
    }

    auto meta = core::dicom_file::read_meta_information(prefix, !complete);
    if (meta.is_err()) {
        return {record_class::unreadable,
                "malformed file meta information: " + meta.error().message, {}};
    }

    classification_result result;
    result.sop_class_uid =
        meta.value().get_string(core::tags::media_storage_sop_class_uid);

    if (result.sop_class_uid == core::media_storage_directory_sop_class ||
        is_directory_name(base_name)) {
        result.kind = record_class::dicom_directory;
    } else {
        result.kind = record_class::dicom_image;
    }
    return result;
}

auto record_classifier::is_directory_name(std::string_view base_name) noexcept -> bool {
    constexpr std::string_view kDicomdir = "DICOMDIR";
    return std::equal(base_name.begin(), base_name.end(), kDicomdir.begin(), kDicomdir.end(),
                      [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) == b;
                      });
}

}  // namespace dcmx::classify
