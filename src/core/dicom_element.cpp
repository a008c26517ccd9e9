/**
 * @file dicom_element.cpp
 * @brief Implementation of DICOM Data Element
 */

#include <dcmx/core/dicom_element.hpp>
#include <dcmx/core/dicom_dataset.hpp>

#include <cstdlib>

namespace dcmx::core {

// ============================================================================
// Constructors
// ============================================================================

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr) noexcept
    : tag_{tag}, vr_{vr} {}

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr,
                             std::span<const uint8_t> data)
    : tag_{tag}, vr_{vr}, data_(data.begin(), data.end()) {}

dicom_element::dicom_element(const dicom_element&) = default;
dicom_element::dicom_element(dicom_element&&) noexcept = default;
auto dicom_element::operator=(const dicom_element&) -> dicom_element& = default;
auto dicom_element::operator=(dicom_element&&) noexcept -> dicom_element& = default;
dicom_element::~dicom_element() = default;

// ============================================================================
// Factory Methods
// ============================================================================

auto dicom_element::from_string(dicom_tag tag, encoding::vr_type vr,
                                std::string_view value) -> dicom_element {
    dicom_element elem{tag, vr};
    elem.set_string(value);
    return elem;
}

auto dicom_element::encapsulated(dicom_tag tag, encoding::vr_type vr,
                                 std::vector<std::vector<uint8_t>> fragments,
                                 std::vector<uint8_t> offset_table)
    -> dicom_element {
    dicom_element elem{tag, vr};
    elem.fragments_ = std::move(fragments);
    elem.offset_table_ = std::move(offset_table);
    elem.encapsulated_ = true;
    return elem;
}

auto dicom_element::is_empty() const noexcept -> bool {
    return data_.empty() && fragments_.empty() && sequence_items_.empty();
}

// ============================================================================
// String Value Access
// ============================================================================

auto dicom_element::as_string() const -> dcmx::Result<std::string> {
    if (data_.empty()) {
        return dcmx::ok(std::string{});
    }

    if (encoding::is_string_vr(vr_)) {
        std::string_view raw{reinterpret_cast<const char*>(data_.data()),
                             data_.size()};
        return dcmx::ok(remove_padding(raw));
    }

    switch (vr_) {
        case encoding::vr_type::US:
            if (auto val = as_numeric<uint16_t>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::SS:
            if (auto val = as_numeric<int16_t>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::UL:
            if (auto val = as_numeric<uint32_t>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::SL:
            if (auto val = as_numeric<int32_t>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::UV:
            if (auto val = as_numeric<uint64_t>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::SV:
            if (auto val = as_numeric<int64_t>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::FL:
            if (auto val = as_numeric<float>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        case encoding::vr_type::FD:
            if (auto val = as_numeric<double>(); val.is_ok())
                return dcmx::ok(std::to_string(val.value()));
            break;
        default:
            break;
    }

    return dcmx::dcmx_error<std::string>(
        dcmx::error_codes::decode_error,
        "Element " + tag_.to_string() + " with VR " +
            std::string{encoding::to_string(vr_)} + " has no string form");
}

auto dicom_element::as_string_list() const
    -> dcmx::Result<std::vector<std::string>> {
    auto str_result = as_string();
    if (str_result.is_err()) {
        return dcmx::dcmx_error<std::vector<std::string>>(
            str_result.error().code, str_result.error().message);
    }
    const std::string str = str_result.value();

    std::vector<std::string> result;
    if (str.empty()) {
        return dcmx::ok(result);
    }

    std::string::size_type start = 0;
    std::string::size_type pos = 0;
    while ((pos = str.find('\\', start)) != std::string::npos) {
        result.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    result.push_back(str.substr(start));

    return dcmx::ok(result);
}

auto dicom_element::as_decimal() const -> dcmx::Result<double> {
    if (encoding::is_numeric_vr(vr_)) {
        switch (vr_) {
            case encoding::vr_type::US: {
                auto v = as_numeric<uint16_t>();
                if (v.is_ok()) return dcmx::ok(static_cast<double>(v.value()));
                return dcmx::Result<double>::err(v.error());
            }
            case encoding::vr_type::SS: {
                auto v = as_numeric<int16_t>();
                if (v.is_ok()) return dcmx::ok(static_cast<double>(v.value()));
                return dcmx::Result<double>::err(v.error());
            }
            case encoding::vr_type::UL: {
                auto v = as_numeric<uint32_t>();
                if (v.is_ok()) return dcmx::ok(static_cast<double>(v.value()));
                return dcmx::Result<double>::err(v.error());
            }
            case encoding::vr_type::SL: {
                auto v = as_numeric<int32_t>();
                if (v.is_ok()) return dcmx::ok(static_cast<double>(v.value()));
                return dcmx::Result<double>::err(v.error());
            }
            case encoding::vr_type::FL: {
                auto v = as_numeric<float>();
                if (v.is_ok()) return dcmx::ok(static_cast<double>(v.value()));
                return dcmx::Result<double>::err(v.error());
            }
            case encoding::vr_type::FD:
                return as_numeric<double>();
            default:
                break;
        }
    }

    auto list = as_string_list();
    if (list.is_err()) {
        return dcmx::Result<double>::err(list.error());
    }
    if (list.value().empty()) {
        return dcmx::dcmx_error<double>(dcmx::error_codes::element_not_found,
                                        "Element " + tag_.to_string() + " is empty");
    }

    // DS and IS allow leading spaces; trailing padding is already gone
    std::string first = list.value().front();
    const auto begin = first.find_first_not_of(' ');
    if (begin == std::string::npos) {
        return dcmx::dcmx_error<double>(dcmx::error_codes::element_not_found,
                                        "Element " + tag_.to_string() + " is blank");
    }
    first.erase(0, begin);
    while (!first.empty() && first.back() == ' ') {
        first.pop_back();
    }

    char* end = nullptr;
    const double value = std::strtod(first.c_str(), &end);
    if (end == first.c_str() || *end != '\0') {
        return dcmx::dcmx_error<double>(
            dcmx::error_codes::decode_error,
            "Element " + tag_.to_string() + " is not a number: '" + first + "'");
    }
    return dcmx::ok(value);
}

// ============================================================================
// Sequence Access
// ============================================================================

auto dicom_element::sequence_items() -> std::vector<dicom_dataset>& {
    return sequence_items_;
}

auto dicom_element::sequence_items() const -> const std::vector<dicom_dataset>& {
    return sequence_items_;
}

// ============================================================================
// Modification
// ============================================================================

void dicom_element::set_value(std::span<const uint8_t> data) {
    data_.assign(data.begin(), data.end());
}

void dicom_element::set_value(std::vector<uint8_t>&& data) noexcept {
    data_ = std::move(data);
}

void dicom_element::set_string(std::string_view value) {
    std::string padded = apply_padding(value);
    data_.assign(padded.begin(), padded.end());
}

// ============================================================================
// Private Helpers
// ============================================================================

auto dicom_element::apply_padding(std::string_view str) const -> std::string {
    std::string result{str};
    if (result.length() % 2 != 0) {
        result += encoding::padding_char(vr_);
    }
    return result;
}

auto dicom_element::remove_padding(std::string_view str) -> std::string {
    std::string result{str};

    // Writers disagree on NUL vs space padding, so strip both
    while (!result.empty() && (result.back() == '\0' || result.back() == ' ')) {
        result.pop_back();
    }
    return result;
}

}  // namespace dcmx::core
