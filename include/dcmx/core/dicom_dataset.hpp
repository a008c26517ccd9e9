/**
 * @file dicom_dataset.hpp
 * @brief Ordered collection of DICOM Data Elements
 *
 * @see DICOM PS3.5 Section 7 - The Data Set
 */

#pragma once

#include "dcmx/core/dicom_element.hpp"
#include "dcmx/core/dicom_tag.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dcmx::core {

/**
 * @brief A DICOM Data Set: elements kept in ascending tag order.
 *
 * Not thread-safe.
 *
 * @code
 * dicom_dataset ds;
 * ds.set_string(tags::patient_name, vr_type::PN, "DOE^JANE");
 * auto rows = ds.get_numeric<uint16_t>(tags::rows).value_or(0);
 * auto slice = ds.get_decimal(tags::slice_location);   // std::optional<double>
 * @endcode
 */
class dicom_dataset {
public:
    using storage_type = std::map<dicom_tag, dicom_element>;
    using iterator = storage_type::iterator;
    using const_iterator = storage_type::const_iterator;

    dicom_dataset() = default;
    dicom_dataset(const dicom_dataset&) = default;
    dicom_dataset(dicom_dataset&&) noexcept = default;
    auto operator=(const dicom_dataset&) -> dicom_dataset& = default;
    auto operator=(dicom_dataset&&) noexcept -> dicom_dataset& = default;
    ~dicom_dataset() = default;

    // ========================================================================
    // Element Access
    // ========================================================================

    [[nodiscard]] auto contains(dicom_tag tag) const noexcept -> bool;

    /**
     * @return Pointer to the element, or nullptr if absent
     */
    [[nodiscard]] auto get(dicom_tag tag) noexcept -> dicom_element*;
    [[nodiscard]] auto get(dicom_tag tag) const noexcept -> const dicom_element*;

    /**
     * @brief String value of @p tag, or @p default_value when the element
     *        is absent or has no string form.
     */
    [[nodiscard]] auto get_string(dicom_tag tag,
                                  std::string_view default_value = "") const
        -> std::string;

    /**
     * @brief String value of @p tag, or std::nullopt when the element is
     *        absent or its value is empty after padding removal.
     */
    [[nodiscard]] auto find_string(dicom_tag tag) const
        -> std::optional<std::string>;

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto get_numeric(dicom_tag tag) const -> std::optional<T>;

    /**
     * @brief First value of a numeric, DS or IS element as a double.
     */
    [[nodiscard]] auto get_decimal(dicom_tag tag) const -> std::optional<double>;

    // ========================================================================
    // Modification
    // ========================================================================

    /**
     * @brief Insert or replace the element with the same tag.
     */
    void insert(dicom_element element);

    void set_string(dicom_tag tag, encoding::vr_type vr, std::string_view value);

    template <typename T>
        requires std::is_arithmetic_v<T>
    void set_numeric(dicom_tag tag, encoding::vr_type vr, T value);

    auto remove(dicom_tag tag) -> bool;

    void clear() noexcept;

    // ========================================================================
    // Iteration
    // ========================================================================

    [[nodiscard]] auto begin() noexcept -> iterator;
    [[nodiscard]] auto end() noexcept -> iterator;
    [[nodiscard]] auto begin() const noexcept -> const_iterator;
    [[nodiscard]] auto end() const noexcept -> const_iterator;

    [[nodiscard]] auto size() const noexcept -> size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;

private:
    storage_type elements_;
};

// ============================================================================
// Template Implementations
// ============================================================================

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_dataset::get_numeric(dicom_tag tag) const -> std::optional<T> {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }

    auto result = elem->as_numeric<T>();
    if (result.is_err()) {
        return std::nullopt;
    }
    return result.value();
}

template <typename T>
    requires std::is_arithmetic_v<T>
void dicom_dataset::set_numeric(dicom_tag tag, encoding::vr_type vr, T value) {
    insert(dicom_element::from_numeric(tag, vr, value));
}

}  // namespace dcmx::core
