/**
 * @file image_metadata.hpp
 * @brief Header fields shown on rendered images and in the gallery
 */

#pragma once

#include <dcmx/core/dicom_dataset.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dcmx::render {

/// Text printed for fields that are absent or unparsable
inline constexpr std::string_view kUnknownText = "unknown";

/**
 * @brief A header value that is either known or explicitly "unknown".
 *
 * Ordering helpers treat unknown as greater than every known value.
 */
template <typename T>
class metadata_value {
public:
    metadata_value() = default;
    explicit metadata_value(T value) : value_(std::move(value)) {}

    [[nodiscard]] static auto unknown() -> metadata_value { return {}; }

    [[nodiscard]] auto is_known() const noexcept -> bool { return value_.has_value(); }

    [[nodiscard]] auto value_or(T fallback) const -> T {
        return value_ ? *value_ : std::move(fallback);
    }

    /**
     * @brief Display form: the value, or "unknown".
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Three-way compare with unknown after all known values.
     * @return negative, zero or positive
     */
    [[nodiscard]] auto compare(const metadata_value& other) const -> int {
        if (!value_ || !other.value_) {
            return static_cast<int>(!value_) - static_cast<int>(!other.value_);
        }
        if (*value_ < *other.value_) return -1;
        if (*other.value_ < *value_) return 1;
        return 0;
    }

    friend auto operator==(const metadata_value&, const metadata_value&) -> bool = default;

private:
    std::optional<T> value_;
};

/**
 * @brief The header subset the renderer and gallery work with.
 */
struct image_metadata {
    metadata_value<std::string> patient_name;
    metadata_value<std::string> patient_id;
    metadata_value<std::string> study_date;
    metadata_value<int> series_number;
    metadata_value<std::string> series_description;
    metadata_value<std::string> modality;
    metadata_value<double> slice_location;
    metadata_value<int> instance_number;
    std::filesystem::path source_path;

    /**
     * @brief Read the fields from @p dataset.
     *
     * Blank strings and numbers that do not parse become unknown.
     */
    [[nodiscard]] static auto from_dataset(const core::dicom_dataset& dataset,
                                           std::filesystem::path source)
        -> image_metadata;

    /**
     * @brief Overlay text, one line per field, in display order.
     */
    [[nodiscard]] auto overlay_lines() const -> std::vector<std::string>;

    /**
     * @brief (keyword, text) pairs embedded in the output image.
     */
    [[nodiscard]] auto text_fields() const
        -> std::vector<std::pair<std::string, std::string>>;
};

extern template class metadata_value<std::string>;
extern template class metadata_value<int>;
extern template class metadata_value<double>;

}  // namespace dcmx::render
