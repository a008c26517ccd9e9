/**
 * @file dicom_element.hpp
 * @brief DICOM Data Element (Tag, VR, Value)
 *
 * Values are held in little endian byte order regardless of the transfer
 * syntax they were read from; the reader swaps big endian data on decode.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include "dcmx/core/dicom_tag.hpp"
#include "dcmx/core/result.hpp"

#include <dcmx/encoding/vr_type.hpp>

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dcmx::core {

class dicom_dataset;

/**
 * @brief A single DICOM Data Element.
 *
 * Besides plain values the element can hold:
 * - sequence items (VR SQ), each a nested dicom_dataset
 * - encapsulated pixel data fragments (Pixel Data with undefined length);
 *   the Basic Offset Table is kept separately from the fragments
 *
 * @code
 * auto name = dicom_element::from_string(tags::patient_name, vr_type::PN, "DOE^JANE");
 * auto rows = dicom_element::from_numeric<uint16_t>(tags::rows, vr_type::US, 512);
 * std::string patient = name.as_string().unwrap_or("");
 * @endcode
 */
class dicom_element {
public:
    dicom_element(dicom_tag tag, encoding::vr_type vr) noexcept;

    dicom_element(dicom_tag tag, encoding::vr_type vr,
                  std::span<const uint8_t> data);

    dicom_element(const dicom_element&);
    dicom_element(dicom_element&&) noexcept;
    auto operator=(const dicom_element&) -> dicom_element&;
    auto operator=(dicom_element&&) noexcept -> dicom_element&;
    ~dicom_element();

    // ========================================================================
    // Factory Methods
    // ========================================================================

    [[nodiscard]] static auto from_string(dicom_tag tag, encoding::vr_type vr,
                                          std::string_view value) -> dicom_element;

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] static auto from_numeric(dicom_tag tag, encoding::vr_type vr,
                                           T value) -> dicom_element;

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] static auto from_numeric_list(dicom_tag tag, encoding::vr_type vr,
                                                std::span<const T> values) -> dicom_element;

    /**
     * @brief Create an encapsulated Pixel Data element.
     * @param vr OB in practice
     * @param fragments Compressed fragments, one frame per fragment is typical
     * @param offset_table Basic Offset Table contents (may be empty)
     */
    [[nodiscard]] static auto encapsulated(dicom_tag tag, encoding::vr_type vr,
                                           std::vector<std::vector<uint8_t>> fragments,
                                           std::vector<uint8_t> offset_table = {})
        -> dicom_element;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] constexpr auto tag() const noexcept -> dicom_tag { return tag_; }

    [[nodiscard]] constexpr auto vr() const noexcept -> encoding::vr_type { return vr_; }

    [[nodiscard]] auto length() const noexcept -> uint32_t {
        return static_cast<uint32_t>(data_.size());
    }

    [[nodiscard]] auto raw_data() const noexcept -> std::span<const uint8_t> {
        return data_;
    }

    [[nodiscard]] auto is_empty() const noexcept -> bool;

    // ========================================================================
    // String Value Access
    // ========================================================================

    /**
     * @brief Get the value as a string.
     *
     * String VRs lose their padding; numeric VRs are formatted in decimal.
     * Binary VRs fail with decode_error.
     */
    [[nodiscard]] auto as_string() const -> dcmx::Result<std::string>;

    /**
     * @brief Split a multi-valued string on the backslash delimiter.
     */
    [[nodiscard]] auto as_string_list() const
        -> dcmx::Result<std::vector<std::string>>;

    // ========================================================================
    // Numeric Value Access
    // ========================================================================

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric() const -> dcmx::Result<T>;

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric_list() const -> dcmx::Result<std::vector<T>>;

    /**
     * @brief First value as a double, from a binary numeric VR or from the
     *        decimal text of DS / IS.
     */
    [[nodiscard]] auto as_decimal() const -> dcmx::Result<double>;

    // ========================================================================
    // Sequence Access
    // ========================================================================

    [[nodiscard]] auto is_sequence() const noexcept -> bool {
        return vr_ == encoding::vr_type::SQ;
    }

    [[nodiscard]] auto sequence_items() -> std::vector<dicom_dataset>&;
    [[nodiscard]] auto sequence_items() const -> const std::vector<dicom_dataset>&;

    // ========================================================================
    // Encapsulated Pixel Data
    // ========================================================================

    [[nodiscard]] auto is_encapsulated() const noexcept -> bool {
        return encapsulated_;
    }

    [[nodiscard]] auto fragments() const noexcept
        -> const std::vector<std::vector<uint8_t>>& {
        return fragments_;
    }

    [[nodiscard]] auto offset_table() const noexcept -> std::span<const uint8_t> {
        return offset_table_;
    }

    // ========================================================================
    // Modification
    // ========================================================================

    void set_value(std::span<const uint8_t> data);
    void set_value(std::vector<uint8_t>&& data) noexcept;
    void set_string(std::string_view value);

    template <typename T>
        requires std::is_arithmetic_v<T>
    void set_numeric(T value);

private:
    dicom_tag tag_;
    encoding::vr_type vr_;
    std::vector<uint8_t> data_;
    std::vector<dicom_dataset> sequence_items_;
    std::vector<std::vector<uint8_t>> fragments_;
    std::vector<uint8_t> offset_table_;
    bool encapsulated_{false};

    [[nodiscard]] auto apply_padding(std::string_view str) const -> std::string;

    [[nodiscard]] static auto remove_padding(std::string_view str) -> std::string;
};

// ============================================================================
// Template Implementations
// ============================================================================

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::from_numeric(dicom_tag tag, encoding::vr_type vr,
                                 T value) -> dicom_element {
    dicom_element elem{tag, vr};
    elem.set_numeric(value);
    return elem;
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::from_numeric_list(dicom_tag tag, encoding::vr_type vr,
                                      std::span<const T> values) -> dicom_element {
    dicom_element elem{tag, vr};
    std::vector<uint8_t> data(values.size() * sizeof(T));
    if (!values.empty()) {
        std::memcpy(data.data(), values.data(), data.size());
    }
    elem.set_value(std::move(data));
    return elem;
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::as_numeric() const -> dcmx::Result<T> {
    if (data_.size() < sizeof(T)) {
        return dcmx::dcmx_error<T>(
            dcmx::error_codes::data_size_mismatch,
            "Insufficient data for numeric conversion of " + tag_.to_string() +
                ": expected " + std::to_string(sizeof(T)) + " bytes, got " +
                std::to_string(data_.size()));
    }

    T result{};
    std::memcpy(&result, data_.data(), sizeof(T));
    return dcmx::ok(result);
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::as_numeric_list() const -> dcmx::Result<std::vector<T>> {
    if (data_.size() % sizeof(T) != 0) {
        return dcmx::dcmx_error<std::vector<T>>(
            dcmx::error_codes::data_size_mismatch,
            "Data size not aligned for numeric type: " +
                std::to_string(data_.size()) + " bytes is not divisible by " +
                std::to_string(sizeof(T)));
    }

    std::vector<T> result(data_.size() / sizeof(T));
    if (!result.empty()) {
        std::memcpy(result.data(), data_.data(), data_.size());
    }
    return dcmx::ok(std::move(result));
}

template <typename T>
    requires std::is_arithmetic_v<T>
void dicom_element::set_numeric(T value) {
    data_.resize(sizeof(T));
    std::memcpy(data_.data(), &value, sizeof(T));
}

}  // namespace dcmx::core
