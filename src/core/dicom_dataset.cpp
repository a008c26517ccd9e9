/**
 * @file dicom_dataset.cpp
 * @brief Implementation of DICOM Dataset
 */

#include <dcmx/core/dicom_dataset.hpp>

namespace dcmx::core {

// ============================================================================
// Element Access
// ============================================================================

auto dicom_dataset::contains(dicom_tag tag) const noexcept -> bool {
    return elements_.contains(tag);
}

auto dicom_dataset::get(dicom_tag tag) noexcept -> dicom_element* {
    auto it = elements_.find(tag);
    if (it == elements_.end()) {
        return nullptr;
    }
    return &it->second;
}

auto dicom_dataset::get(dicom_tag tag) const noexcept -> const dicom_element* {
    auto it = elements_.find(tag);
    if (it == elements_.end()) {
        return nullptr;
    }
    return &it->second;
}

// ============================================================================
// Convenience Accessors
// ============================================================================

auto dicom_dataset::get_string(dicom_tag tag,
                               std::string_view default_value) const
    -> std::string {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::string{default_value};
    }
    return elem->as_string().unwrap_or(std::string{default_value});
}

auto dicom_dataset::find_string(dicom_tag tag) const
    -> std::optional<std::string> {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }
    auto value = elem->as_string();
    if (value.is_err()) {
        return std::nullopt;
    }

    // Leading spaces are insignificant for every VR we display
    std::string text = value.value();
    const auto begin = text.find_first_not_of(' ');
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    text.erase(0, begin);
    return text;
}

auto dicom_dataset::get_decimal(dicom_tag tag) const -> std::optional<double> {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }
    auto value = elem->as_decimal();
    if (value.is_err()) {
        return std::nullopt;
    }
    return value.value();
}

// ============================================================================
// Modification
// ============================================================================

void dicom_dataset::insert(dicom_element element) {
    elements_.insert_or_assign(element.tag(), std::move(element));
}

void dicom_dataset::set_string(dicom_tag tag, encoding::vr_type vr,
                               std::string_view value) {
    insert(dicom_element::from_string(tag, vr, value));
}

auto dicom_dataset::remove(dicom_tag tag) -> bool {
    return elements_.erase(tag) > 0;
}

void dicom_dataset::clear() noexcept {
    elements_.clear();
}

// ============================================================================
// Iteration
// ============================================================================

auto dicom_dataset::begin() noexcept -> iterator {
    return elements_.begin();
}

auto dicom_dataset::end() noexcept -> iterator {
    return elements_.end();
}

auto dicom_dataset::begin() const noexcept -> const_iterator {
    return elements_.begin();
}

auto dicom_dataset::end() const noexcept -> const_iterator {
    return elements_.end();
}

auto dicom_dataset::size() const noexcept -> size_t {
    return elements_.size();
}

auto dicom_dataset::empty() const noexcept -> bool {
    return elements_.empty();
}

}  // namespace dcmx::core
