/**
 * @file dicom_builder.hpp
 * @brief Synthetic DICOM records for tests
 */

#pragma once

#include <dcmx/core/dicom_dataset.hpp>
#include <dcmx/core/dicom_element.hpp>
#include <dcmx/core/dicom_file.hpp>
#include <dcmx/core/dicom_tag_constants.hpp>
#include <dcmx/encoding/transfer_syntax.hpp>
#include <dcmx/encoding/vr_type.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

namespace dcmx::test {

inline constexpr const char* kSecondaryCaptureSopClass = "1.2.840.10008.5.1.4.1.1.7";

/**
 * @brief Header and pixel description of a synthetic image.
 *
 * Empty strings and empty optionals leave the attribute out.
 */
struct image_fields {
    std::string patient_name{"DOE^JANE"};
    std::string patient_id{"PID-0001"};
    std::string study_date{"20240305"};
    std::optional<int> series_number{1};
    std::string series_description{"AX T1"};
    std::string modality{"MR"};
    std::optional<double> slice_location;
    std::optional<int> instance_number;
    std::string sop_instance_uid{"1.2.826.0.1.3680043.2.1125.1"};

    uint16_t rows{4};
    uint16_t columns{4};
    uint16_t bits_stored{12};
    std::string photometric{"MONOCHROME2"};

    /// 16-bit samples, rows * columns; empty means a 0..(n-1)*100 ramp
    std::vector<uint16_t> pixels;

    bool with_pixel_data{true};
};

[[nodiscard]] inline auto decimal_string(double value) -> std::string {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

[[nodiscard]] inline auto make_image_dataset(const image_fields& fields) -> core::dicom_dataset {
    using namespace core;
    using encoding::vr_type;

    dicom_dataset ds;
    ds.set_string(tags::sop_class_uid, vr_type::UI, kSecondaryCaptureSopClass);
    ds.set_string(tags::sop_instance_uid, vr_type::UI, fields.sop_instance_uid);

    auto set_if = [&ds](dicom_tag tag, vr_type vr, const std::string& value) {
        if (!value.empty()) {
            ds.set_string(tag, vr, value);
        }
    };
    set_if(tags::patient_name, vr_type::PN, fields.patient_name);
    set_if(tags::patient_id, vr_type::LO, fields.patient_id);
    set_if(tags::study_date, vr_type::DA, fields.study_date);
    set_if(tags::series_description, vr_type::LO, fields.series_description);
    set_if(tags::modality, vr_type::CS, fields.modality);
    if (fields.series_number) {
        ds.set_string(tags::series_number, vr_type::IS, std::to_string(*fields.series_number));
    }
    if (fields.instance_number) {
        ds.set_string(tags::instance_number, vr_type::IS, std::to_string(*fields.instance_number));
    }
    if (fields.slice_location) {
        ds.set_string(tags::slice_location, vr_type::DS, decimal_string(*fields.slice_location));
    }

    if (!fields.with_pixel_data) {
        return ds;
    }

    ds.set_numeric<uint16_t>(tags::samples_per_pixel, vr_type::US, 1);
    ds.set_string(tags::photometric_interpretation, vr_type::CS, fields.photometric);
    ds.set_numeric<uint16_t>(tags::rows, vr_type::US, fields.rows);
    ds.set_numeric<uint16_t>(tags::columns, vr_type::US, fields.columns);
    ds.set_numeric<uint16_t>(tags::bits_allocated, vr_type::US, 16);
    ds.set_numeric<uint16_t>(tags::bits_stored, vr_type::US, fields.bits_stored);
    ds.set_numeric<uint16_t>(tags::high_bit, vr_type::US,
                             static_cast<uint16_t>(fields.bits_stored - 1));
    ds.set_numeric<uint16_t>(tags::pixel_representation, vr_type::US, 0);

    auto pixels = fields.pixels;
    if (pixels.empty()) {
        pixels.resize(static_cast<std::size_t>(fields.rows) * fields.columns);
        for (std::size_t i = 0; i < pixels.size(); ++i) {
            pixels[i] = static_cast<uint16_t>(i * 100);
        }
    }
    ds.insert(dicom_element::from_numeric_list<uint16_t>(
        tags::pixel_data, vr_type::OW, std::span<const uint16_t>{pixels}));
    return ds;
}

[[nodiscard]] inline auto make_image_bytes(const image_fields& fields = {}) -> std::vector<uint8_t> {
    return core::dicom_file::create(make_image_dataset(fields),
                                    encoding::transfer_syntax::explicit_vr_little_endian)
        .to_bytes();
}

/**
 * @brief Media Storage Directory record with one empty directory record item.
 */
[[nodiscard]] inline auto make_dicomdir_bytes() -> std::vector<uint8_t> {
    using namespace core;
    using encoding::vr_type;

    dicom_dataset ds;
    ds.set_string(tags::sop_class_uid, vr_type::UI, media_storage_directory_sop_class);
    ds.set_string(tags::sop_instance_uid, vr_type::UI, "1.2.826.0.1.3680043.2.1125.99");
    ds.set_string(tags::file_set_id, vr_type::CS, "STUDY1");
    ds.set_string(tags::patient_name, vr_type::PN, "DOE^JANE");
    return dicom_file::create(std::move(ds), encoding::transfer_syntax::explicit_vr_little_endian)
        .to_bytes();
}

[[nodiscard]] inline auto make_text_bytes(std::string_view text = "not a dicom file\n")
    -> std::vector<uint8_t> {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace dcmx::test
