/**
 * @file dataset_reader.cpp
 * @brief Implementation of the uncompressed data set decoder
 */

#include <dcmx/encoding/dataset_reader.hpp>

#include <dcmx/core/dicom_tag_constants.hpp>
#include <dcmx/encoding/byte_swap.hpp>

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace dcmx::encoding {

namespace {

struct implied_entry {
    uint32_t tag;
    vr_type vr;
};

// Sorted by tag for binary search
constexpr std::array<implied_entry, 33> implied_vrs = {{
    {0x00041130, vr_type::CS},  // File-set ID
    {0x00041220, vr_type::SQ},  // Directory Record Sequence
    {0x00041430, vr_type::CS},  // Directory Record Type
    {0x00041500, vr_type::CS},  // Referenced File ID
    {0x00080005, vr_type::CS},
    {0x00080008, vr_type::CS},  // Image Type
    {0x00080016, vr_type::UI},
    {0x00080018, vr_type::UI},
    {0x00080020, vr_type::DA},
    {0x00080030, vr_type::TM},
    {0x00080060, vr_type::CS},
    {0x0008103E, vr_type::LO},
    {0x00100010, vr_type::PN},
    {0x00100020, vr_type::LO},
    {0x00100030, vr_type::DA},  // Patient's Birth Date
    {0x0020000D, vr_type::UI},
    {0x0020000E, vr_type::UI},
    {0x00200011, vr_type::IS},
    {0x00200013, vr_type::IS},
    {0x00201041, vr_type::DS},
    {0x00280002, vr_type::US},
    {0x00280004, vr_type::CS},
    {0x00280006, vr_type::US},
    {0x00280008, vr_type::IS},
    {0x00280010, vr_type::US},
    {0x00280011, vr_type::US},
    {0x00280100, vr_type::US},
    {0x00280101, vr_type::US},
    {0x00280102, vr_type::US},
    {0x00280103, vr_type::US},
    {0x00281050, vr_type::DS},  // Window Center
    {0x00281051, vr_type::DS},  // Window Width
    {0x7FE00010, vr_type::OW},
}};

}  // namespace

auto implied_vr(core::dicom_tag tag) noexcept -> vr_type {
    if (tag.is_group_length()) {
        return vr_type::UL;
    }
    if (tag.is_private() || tag.is_item_marker()) {
        return vr_type::UN;
    }

    std::size_t lo = 0;
    std::size_t hi = implied_vrs.size();
    while (lo < hi) {
        const auto mid = lo + (hi - lo) / 2;
        if (implied_vrs[mid].tag < tag.combined()) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    if (lo < implied_vrs.size() && implied_vrs[lo].tag == tag.combined()) {
        return implied_vrs[lo].vr;
    }
    return vr_type::UN;
}

// ============================================================================
// Construction
// ============================================================================

dataset_reader::dataset_reader(byte_order order, vr_encoding encoding) noexcept
    : order_(order), encoding_(encoding) {}

dataset_reader::dataset_reader(const transfer_syntax& ts) noexcept
    : order_(ts.endianness()), encoding_(ts.vr_type()) {}

auto dataset_reader::u16(const uint8_t* p) const noexcept -> uint16_t {
    return order_ == byte_order::big_endian ? read_be16(p) : read_le16(p);
}

auto dataset_reader::u32(const uint8_t* p) const noexcept -> uint32_t {
    return order_ == byte_order::big_endian ? read_be32(p) : read_le32(p);
}

// ============================================================================
// Data Set Decoding
// ============================================================================

auto dataset_reader::read(std::span<const uint8_t> data) const
    -> result<core::dicom_dataset> {
    core::dicom_dataset dataset;

    while (data.size() >= 8) {
        auto element = read_element(data);
        if (element.is_err()) {
            return result<core::dicom_dataset>::err(element.error());
        }
        dataset.insert(std::move(element.value()));
    }

    return result<core::dicom_dataset>::ok(std::move(dataset));
}

auto dataset_reader::read_header(std::span<const uint8_t> data) const
    -> result<element_header> {
    if (data.size() < 8) {
        return dcmx::dcmx_error<element_header>(
            dcmx::error_codes::insufficient_data,
            "Insufficient data to decode element header");
    }

    const core::dicom_tag tag{u16(data.data()), u16(data.data() + 2)};

    if (tag.is_item_marker() || encoding_ == vr_encoding::implicit) {
        return result<element_header>::ok(
            element_header{tag, implied_vr(tag), u32(data.data() + 4), 8});
    }

    const std::string_view vr_chars{reinterpret_cast<const char*>(data.data() + 4), 2};
    const auto vr = from_string(vr_chars);
    if (!vr) {
        return dcmx::dcmx_error<element_header>(
            dcmx::error_codes::decode_error,
            "Unknown VR '" + std::string{vr_chars} + "' for element " +
                tag.to_string());
    }

    if (has_explicit_32bit_length(*vr)) {
        if (data.size() < 12) {
            return dcmx::dcmx_error<element_header>(
                dcmx::error_codes::insufficient_data,
                "Insufficient data for extended VR header of " + tag.to_string());
        }
        return result<element_header>::ok(
            element_header{tag, *vr, u32(data.data() + 8), 12});
    }

    return result<element_header>::ok(
        element_header{tag, *vr, u16(data.data() + 6), 8});
}

auto dataset_reader::read_element(std::span<const uint8_t>& data) const
    -> result<core::dicom_element> {
    auto header_result = read_header(data);
    if (header_result.is_err()) {
        return result<core::dicom_element>::err(header_result.error());
    }
    const auto header = header_result.value();

    if (header.tag.is_item_marker()) {
        return dcmx::dcmx_error<core::dicom_element>(
            dcmx::error_codes::invalid_sequence,
            "Unexpected " + header.tag.to_string() + " outside of a sequence");
    }

    data = data.subspan(header.size);

    if (header.length == undefined_length) {
        if (header.tag == core::tags::pixel_data && header.vr != vr_type::SQ &&
            header.vr != vr_type::UN) {
            return read_encapsulated(header.tag, header.vr, data);
        }
        if (header.vr == vr_type::SQ) {
            return read_sequence(header.tag, data, true);
        }
        if (header.vr == vr_type::UN) {
            // Undefined-length UN is a sequence encoded as Implicit VR LE
            const dataset_reader implicit_reader{byte_order::little_endian,
                                                 vr_encoding::implicit};
            return implicit_reader.read_sequence(header.tag, data, true);
        }
        return dcmx::dcmx_error<core::dicom_element>(
            dcmx::error_codes::invalid_sequence,
            "Undefined length on non-sequence element " + header.tag.to_string());
    }

    if (data.size() < header.length) {
        return dcmx::dcmx_error<core::dicom_element>(
            dcmx::error_codes::insufficient_data,
            "Value of " + header.tag.to_string() + " needs " +
                std::to_string(header.length) + " bytes, " +
                std::to_string(data.size()) + " available");
    }

    auto value = data.subspan(0, header.length);
    data = data.subspan(header.length);

    if (header.vr == vr_type::SQ) {
        return read_sequence(header.tag, value, false);
    }

    std::vector<uint8_t> bytes(value.begin(), value.end());
    if (order_ == byte_order::big_endian) {
        swap_units(bytes, swap_unit(header.vr));
    }

    core::dicom_element element{header.tag, header.vr};
    element.set_value(std::move(bytes));
    return result<core::dicom_element>::ok(std::move(element));
}

// ============================================================================
// Sequences
// ============================================================================

auto dataset_reader::read_sequence(core::dicom_tag tag,
                                   std::span<const uint8_t>& data,
                                   bool delimited) const
    -> result<core::dicom_element> {
    core::dicom_element sequence{tag, vr_type::SQ};

    while (!data.empty()) {
        if (data.size() < 8) {
            return dcmx::dcmx_error<core::dicom_element>(
                dcmx::error_codes::insufficient_data,
                "Truncated item in sequence " + tag.to_string());
        }

        const core::dicom_tag item_tag{u16(data.data()), u16(data.data() + 2)};
        if (item_tag == core::tags::sequence_delimitation_item) {
            data = data.subspan(8);
            return result<core::dicom_element>::ok(std::move(sequence));
        }

        auto item = read_item(data);
        if (item.is_err()) {
            return result<core::dicom_element>::err(item.error());
        }
        sequence.sequence_items().push_back(std::move(item.value()));
    }

    if (delimited) {
        return dcmx::dcmx_error<core::dicom_element>(
            dcmx::error_codes::invalid_sequence,
            "Missing sequence delimiter for " + tag.to_string());
    }
    return result<core::dicom_element>::ok(std::move(sequence));
}

auto dataset_reader::read_item(std::span<const uint8_t>& data) const
    -> result<core::dicom_dataset> {
    const core::dicom_tag tag{u16(data.data()), u16(data.data() + 2)};
    if (tag != core::tags::item) {
        return dcmx::dcmx_error<core::dicom_dataset>(
            dcmx::error_codes::invalid_sequence,
            "Expected item tag, found " + tag.to_string());
    }

    const uint32_t length = u32(data.data() + 4);
    data = data.subspan(8);

    if (length != undefined_length) {
        if (data.size() < length) {
            return dcmx::dcmx_error<core::dicom_dataset>(
                dcmx::error_codes::insufficient_data,
                "Item length exceeds available data");
        }
        auto content = data.subspan(0, length);
        data = data.subspan(length);

        core::dicom_dataset item;
        while (!content.empty()) {
            auto element = read_element(content);
            if (element.is_err()) {
                return result<core::dicom_dataset>::err(element.error());
            }
            item.insert(std::move(element.value()));
        }
        return result<core::dicom_dataset>::ok(std::move(item));
    }

    core::dicom_dataset item;
    while (data.size() >= 8) {
        const core::dicom_tag next{u16(data.data()), u16(data.data() + 2)};
        if (next == core::tags::item_delimitation_item) {
            data = data.subspan(8);
            return result<core::dicom_dataset>::ok(std::move(item));
        }

        auto element = read_element(data);
        if (element.is_err()) {
            return result<core::dicom_dataset>::err(element.error());
        }
        item.insert(std::move(element.value()));
    }

    return dcmx::dcmx_error<core::dicom_dataset>(
        dcmx::error_codes::invalid_sequence, "Missing item delimiter");
}

// ============================================================================
// Encapsulated Pixel Data
// ============================================================================

auto dataset_reader::read_encapsulated(core::dicom_tag tag, vr_type vr,
                                       std::span<const uint8_t>& data) const
    -> result<core::dicom_element> {
    std::vector<uint8_t> offset_table;
    std::vector<std::vector<uint8_t>> fragments;
    bool first_item = true;

    while (data.size() >= 8) {
        const core::dicom_tag item_tag{u16(data.data()), u16(data.data() + 2)};
        const uint32_t length = u32(data.data() + 4);
        data = data.subspan(8);

        if (item_tag == core::tags::sequence_delimitation_item) {
            return result<core::dicom_element>::ok(core::dicom_element::encapsulated(
                tag, vr, std::move(fragments), std::move(offset_table)));
        }
        if (item_tag != core::tags::item || length == undefined_length) {
            return dcmx::dcmx_error<core::dicom_element>(
                dcmx::error_codes::invalid_sequence,
                "Invalid item " + item_tag.to_string() + " in encapsulated pixel data");
        }
        if (data.size() < length) {
            return dcmx::dcmx_error<core::dicom_element>(
                dcmx::error_codes::insufficient_data,
                "Pixel data fragment exceeds available data");
        }

        std::vector<uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);

        // The first item is always the Basic Offset Table, possibly empty
        if (first_item) {
            offset_table = std::move(bytes);
            first_item = false;
        } else {
            fragments.push_back(std::move(bytes));
        }
    }

    return dcmx::dcmx_error<core::dicom_element>(
        dcmx::error_codes::insufficient_data,
        "Missing sequence delimiter after encapsulated pixel data");
}

}  // namespace dcmx::encoding
