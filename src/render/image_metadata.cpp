/**
 * @file image_metadata.cpp
 * @brief Header field extraction for rendering
 */

#include "dcmx/render/image_metadata.hpp"

#include <dcmx/compat/format.hpp>
#include <dcmx/core/dicom_tag_constants.hpp>

#include <charconv>
#include <cmath>

namespace dcmx::render {

template <typename T>
auto metadata_value<T>::to_string() const -> std::string {
    if (!value_) {
        return std::string{kUnknownText};
    }
    if constexpr (std::is_same_v<T, std::string>) {
        return *value_;
    } else {
        return dcmx::compat::format("{}", *value_);
    }
}

template class metadata_value<std::string>;
template class metadata_value<int>;
template class metadata_value<double>;

namespace {

auto string_field(const core::dicom_dataset& dataset, core::dicom_tag tag)
    -> metadata_value<std::string> {
    auto value = dataset.find_string(tag);
    return value ? metadata_value<std::string>{std::move(*value)}
                 : metadata_value<std::string>::unknown();
}

/// IS value; a DS-style "3.0" is accepted when integral
auto integer_field(const core::dicom_dataset& dataset, core::dicom_tag tag)
    -> metadata_value<int> {
    auto text = dataset.find_string(tag);
    if (!text) {
        return metadata_value<int>::unknown();
    }

    int value = 0;
    const auto* first = text->data();
    const auto* last = text->data() + text->size();
    if (*first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc{} && ptr == last) {
        return metadata_value<int>{value};
    }

    auto decimal = dataset.get_decimal(tag);
    if (decimal && std::isfinite(*decimal) && std::floor(*decimal) == *decimal) {
        return metadata_value<int>{static_cast<int>(*decimal)};
    }
    return metadata_value<int>::unknown();
}

auto decimal_field(const core::dicom_dataset& dataset, core::dicom_tag tag)
    -> metadata_value<double> {
    auto value = dataset.get_decimal(tag);
    if (value && std::isfinite(*value)) {
        return metadata_value<double>{*value};
    }
    return metadata_value<double>::unknown();
}

}  // namespace

auto image_metadata::from_dataset(const core::dicom_dataset& dataset,
                                  std::filesystem::path source) -> image_metadata {
    namespace tags = core::tags;

    image_metadata meta;
    meta.patient_name = string_field(dataset, tags::patient_name);
    meta.patient_id = string_field(dataset, tags::patient_id);
    meta.study_date = string_field(dataset, tags::study_date);
    meta.series_number = integer_field(dataset, tags::series_number);
    meta.series_description = string_field(dataset, tags::series_description);
    meta.modality = string_field(dataset, tags::modality);
    meta.slice_location = decimal_field(dataset, tags::slice_location);
    meta.instance_number = integer_field(dataset, tags::instance_number);
    meta.source_path = std::move(source);
    return meta;
}

auto image_metadata::overlay_lines() const -> std::vector<std::string> {
    return {
        "Patient: " + patient_name.to_string(),
        "ID: " + patient_id.to_string(),
        "Date: " + study_date.to_string(),
        "Series: " + series_description.to_string(),
        "Modality: " + modality.to_string(),
        "Slice: " + slice_location.to_string(),
        "Instance: " + instance_number.to_string(),
    };
}

auto image_metadata::text_fields() const
    -> std::vector<std::pair<std::string, std::string>> {
    return {
        {"PatientName", patient_name.to_string()},
        {"PatientID", patient_id.to_string()},
        {"StudyDate", study_date.to_string()},
        {"SeriesDescription", series_description.to_string()},
        {"Modality", modality.to_string()},
        {"SliceLocation", slice_location.to_string()},
        {"InstanceNumber", instance_number.to_string()},
        {"Source", source_path.filename().string()},
    };
}

}  // namespace dcmx::render
