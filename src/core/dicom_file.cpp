/**
 * @file dicom_file.cpp
 * @brief Implementation of DICOM Part 10 file handling
 */

#include "dcmx/core/dicom_file.hpp"

#include <dcmx/encoding/byte_swap.hpp>
#include <dcmx/encoding/dataset_reader.hpp>
#include <dcmx/encoding/inflate.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace dcmx::core {

namespace {

using encoding::read_le16;
using encoding::read_le32;
using encoding::write_le16;
using encoding::write_le32;

constexpr uint32_t kUndefinedLength = 0xFFFFFFFF;

[[nodiscard]] auto read_file_contents(const std::filesystem::path& path)
    -> dcmx::Result<std::vector<uint8_t>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::file_not_found,
            "File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::file_read_error,
            "Failed to open file: " + path.string());
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(size))) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::file_read_error,
            "Failed to read file: " + path.string());
    }

    return dcmx::Result<std::vector<uint8_t>>::ok(std::move(buffer));
}

void write_tag(std::vector<uint8_t>& buffer, dicom_tag tag) {
    write_le16(buffer, tag.group());
    write_le16(buffer, tag.element());
}

void write_even(std::vector<uint8_t>& buffer, std::span<const uint8_t> bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    if (bytes.size() % 2 != 0) {
        buffer.push_back(0x00);
    }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

dicom_file::dicom_file(dicom_dataset meta_info, dicom_dataset main_dataset)
    : meta_info_(std::move(meta_info)), dataset_(std::move(main_dataset)) {}

// ============================================================================
// Reading
// ============================================================================

auto dicom_file::open(const std::filesystem::path& path)
    -> dcmx::Result<dicom_file> {
    auto contents = read_file_contents(path);
    if (contents.is_err()) {
        return dcmx::Result<dicom_file>::err(contents.error());
    }

    return from_bytes(contents.value());
}

auto dicom_file::has_dicm_prefix(std::span<const uint8_t> data) noexcept -> bool {
    return data.size() >= kMetaOffset &&
           std::memcmp(data.data() + kPreambleSize, kDicmPrefix, 4) == 0;
}

auto dicom_file::read_meta_information(std::span<const uint8_t> data,
                                       bool truncated)
    -> dcmx::Result<dicom_dataset> {
    if (data.size() < kMetaOffset) {
        return dcmx::dcmx_error<dicom_dataset>(
            dcmx::error_codes::invalid_dicom_file,
            "Data too small to be a DICOM Part 10 file");
    }
    if (!has_dicm_prefix(data)) {
        return dcmx::dcmx_error<dicom_dataset>(
            dcmx::error_codes::missing_dicm_prefix,
            "Missing DICM prefix at offset 128");
    }

    size_t bytes_read = 0;
    return parse_meta_group(data.subspan(kMetaOffset), truncated, bytes_read);
}

auto dicom_file::from_bytes(std::span<const uint8_t> data)
    -> dcmx::Result<dicom_file> {
    if (data.size() < kMetaOffset) {
        return dcmx::dcmx_error<dicom_file>(
            dcmx::error_codes::invalid_dicom_file,
            "File too small to be a DICOM Part 10 file");
    }
    if (!has_dicm_prefix(data)) {
        return dcmx::dcmx_error<dicom_file>(
            dcmx::error_codes::missing_dicm_prefix,
            "Missing DICM prefix at offset 128");
    }

    const auto meta_start = data.subspan(kMetaOffset);
    size_t meta_bytes_read = 0;
    auto meta_result = parse_meta_group(meta_start, false, meta_bytes_read);
    if (meta_result.is_err()) {
        return dcmx::Result<dicom_file>::err(meta_result.error());
    }

    const auto* ts_elem = meta_result.value().get(tags::transfer_syntax_uid);
    if (ts_elem == nullptr) {
        return dcmx::dcmx_error<dicom_file>(
            dcmx::error_codes::missing_transfer_syntax,
            "Transfer Syntax UID not found in meta information");
    }

    const auto ts_uid = ts_elem->as_string().unwrap_or(std::string{});
    const encoding::transfer_syntax ts{ts_uid};
    if (!ts.is_supported()) {
        return dcmx::dcmx_error<dicom_file>(
            dcmx::error_codes::unsupported_transfer_syntax,
            "Unsupported Transfer Syntax: " + ts_uid);
    }

    const auto body = meta_start.subspan(meta_bytes_read);

    if (ts.is_deflated()) {
        auto inflated = encoding::inflate_raw(body);
        if (inflated.is_err()) {
            return dcmx::Result<dicom_file>::err(inflated.error());
        }
        const encoding::dataset_reader reader{encoding::byte_order::little_endian,
                                              encoding::vr_encoding::explicit_vr};
        auto dataset_result = reader.read(inflated.value());
        if (dataset_result.is_err()) {
            return dcmx::Result<dicom_file>::err(dataset_result.error());
        }
        return dcmx::Result<dicom_file>::ok(dicom_file{
            std::move(meta_result.value()), std::move(dataset_result.value())});
    }

    const encoding::dataset_reader reader{ts};
    auto dataset_result = reader.read(body);
    if (dataset_result.is_err()) {
        return dcmx::Result<dicom_file>::err(dataset_result.error());
    }

    return dcmx::Result<dicom_file>::ok(
        dicom_file{std::move(meta_result.value()), std::move(dataset_result.value())});
}

auto dicom_file::parse_meta_group(std::span<const uint8_t> meta, bool truncated,
                                  size_t& bytes_read)
    -> dcmx::Result<dicom_dataset> {
    // File Meta Information is always Explicit VR Little Endian
    dicom_dataset meta_info;
    size_t offset = 0;
    size_t bound = meta.size();

    if (meta.size() < 8 || read_le16(meta.data()) != 0x0002) {
        return dcmx::dcmx_error<dicom_dataset>(
            dcmx::error_codes::invalid_meta_info,
            "File Meta Information group does not follow the DICM prefix");
    }

    while (offset + 8 <= bound) {
        const uint16_t group = read_le16(meta.data() + offset);
        const uint16_t element = read_le16(meta.data() + offset + 2);
        if (group != 0x0002) {
            break;
        }
        const dicom_tag tag{group, element};

        const std::string_view vr_chars{
            reinterpret_cast<const char*>(meta.data() + offset + 4), 2};
        const auto vr_opt = encoding::from_string(vr_chars);
        if (!vr_opt) {
            return dcmx::dcmx_error<dicom_dataset>(
                dcmx::error_codes::invalid_meta_info,
                "Invalid VR '" + std::string{vr_chars} + "' in meta element " +
                    tag.to_string());
        }
        const auto vr = *vr_opt;

        uint32_t length = 0;
        size_t header_size = 0;
        if (encoding::has_explicit_32bit_length(vr)) {
            if (offset + 12 > meta.size()) {
                if (truncated) {
                    break;
                }
                return dcmx::dcmx_error<dicom_dataset>(
                    dcmx::error_codes::invalid_meta_info,
                    "Meta element " + tag.to_string() + " header is truncated");
            }
            length = read_le32(meta.data() + offset + 8);
            header_size = 12;
        } else {
            length = read_le16(meta.data() + offset + 6);
            header_size = 8;
        }

        if (length == kUndefinedLength ||
            offset + header_size + length > meta.size()) {
            if (truncated && length != kUndefinedLength) {
                break;
            }
            return dcmx::dcmx_error<dicom_dataset>(
                dcmx::error_codes::invalid_meta_info,
                "Meta element " + tag.to_string() + " length exceeds available data");
        }

        const auto value = meta.subspan(offset + header_size, length);
        meta_info.insert(dicom_element{tag, vr, value});
        offset += header_size + length;

        // Group length, when present, is authoritative for where the group ends
        if (tag == tags::file_meta_information_group_length && length == 4) {
            bound = std::min(meta.size(), offset + read_le32(value.data()));
        }
    }

    bytes_read = offset;
    return dcmx::Result<dicom_dataset>::ok(std::move(meta_info));
}

// ============================================================================
// Creation
// ============================================================================

auto dicom_file::create(dicom_dataset dataset,
                        const encoding::transfer_syntax& ts)
    -> dicom_file {
    auto meta_info = generate_meta_information(dataset, ts);
    return dicom_file{std::move(meta_info), std::move(dataset)};
}

// ============================================================================
// Writing
// ============================================================================

auto dicom_file::save(const std::filesystem::path& path) const
    -> dcmx::VoidResult {
    auto bytes = to_bytes();

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return dcmx::dcmx_void_error(
            dcmx::error_codes::file_write_error,
            "Failed to open file for writing: " + path.string());
    }

    if (!file.write(reinterpret_cast<const char*>(bytes.data()),
                    static_cast<std::streamsize>(bytes.size()))) {
        return dcmx::dcmx_void_error(
            dcmx::error_codes::file_write_error,
            "Failed to write to file: " + path.string());
    }

    return dcmx::ok();
}

auto dicom_file::to_bytes() const -> std::vector<uint8_t> {
    std::vector<uint8_t> result;
    result.reserve(kMetaOffset + 512 + 65536);

    result.resize(kPreambleSize, 0);
    result.insert(result.end(), std::begin(kDicmPrefix), std::end(kDicmPrefix));

    // (0002,0000) is recomputed from the other meta elements
    dicom_dataset meta_body = meta_info_;
    meta_body.remove(tags::file_meta_information_group_length);
    auto meta_bytes = encode_explicit_vr_le(meta_body);

    dicom_dataset group_length;
    group_length.set_numeric<uint32_t>(tags::file_meta_information_group_length,
                                       encoding::vr_type::UL,
                                       static_cast<uint32_t>(meta_bytes.size()));
    auto length_bytes = encode_explicit_vr_le(group_length);

    result.insert(result.end(), length_bytes.begin(), length_bytes.end());
    result.insert(result.end(), meta_bytes.begin(), meta_bytes.end());

    auto dataset_bytes = encode_explicit_vr_le(dataset_);
    result.insert(result.end(), dataset_bytes.begin(), dataset_bytes.end());

    return result;
}

// ============================================================================
// Accessors
// ============================================================================

auto dicom_file::meta_information() const noexcept -> const dicom_dataset& {
    return meta_info_;
}

auto dicom_file::meta_information() noexcept -> dicom_dataset& {
    return meta_info_;
}

auto dicom_file::dataset() const noexcept -> const dicom_dataset& {
    return dataset_;
}

auto dicom_file::dataset() noexcept -> dicom_dataset& {
    return dataset_;
}

auto dicom_file::transfer_syntax() const -> encoding::transfer_syntax {
    return encoding::transfer_syntax{meta_info_.get_string(tags::transfer_syntax_uid)};
}

auto dicom_file::sop_class_uid() const -> std::string {
    return dataset_.get_string(tags::sop_class_uid);
}

auto dicom_file::media_storage_sop_class_uid() const -> std::string {
    return meta_info_.get_string(tags::media_storage_sop_class_uid);
}

// ============================================================================
// Private Helper Methods
// ============================================================================

auto dicom_file::generate_meta_information(const dicom_dataset& dataset,
                                           const encoding::transfer_syntax& ts)
    -> dicom_dataset {
    dicom_dataset meta_info;

    const uint8_t version_bytes[] = {0x00, 0x01};
    meta_info.insert(dicom_element{tags::file_meta_information_version,
                                   encoding::vr_type::OB,
                                   std::span<const uint8_t>(version_bytes, 2)});

    meta_info.set_string(tags::media_storage_sop_class_uid, encoding::vr_type::UI,
                         dataset.get_string(tags::sop_class_uid));
    meta_info.set_string(tags::media_storage_sop_instance_uid, encoding::vr_type::UI,
                         dataset.get_string(tags::sop_instance_uid));
    meta_info.set_string(tags::transfer_syntax_uid, encoding::vr_type::UI, ts.uid());
    meta_info.set_string(tags::implementation_class_uid, encoding::vr_type::UI,
                         kImplementationClassUid);
    meta_info.set_string(tags::implementation_version_name, encoding::vr_type::SH,
                         kImplementationVersionName);

    return meta_info;
}

auto dicom_file::encode_explicit_vr_le(const dicom_dataset& dataset)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> result;
    for (const auto& [tag, element] : dataset) {
        encode_element(result, element);
    }
    return result;
}

void dicom_file::encode_element(std::vector<uint8_t>& buffer,
                                const dicom_element& element) {
    write_tag(buffer, element.tag());

    const auto vr_str = encoding::to_string(element.vr());
    buffer.push_back(static_cast<uint8_t>(vr_str[0]));
    buffer.push_back(static_cast<uint8_t>(vr_str[1]));

    if (element.is_sequence()) {
        buffer.push_back(0x00);
        buffer.push_back(0x00);
        write_le32(buffer, kUndefinedLength);

        for (const auto& item : element.sequence_items()) {
            auto content = encode_explicit_vr_le(item);
            write_tag(buffer, tags::item);
            write_le32(buffer, static_cast<uint32_t>(content.size()));
            buffer.insert(buffer.end(), content.begin(), content.end());
        }

        write_tag(buffer, tags::sequence_delimitation_item);
        write_le32(buffer, 0);
        return;
    }

    if (element.is_encapsulated()) {
        buffer.push_back(0x00);
        buffer.push_back(0x00);
        write_le32(buffer, kUndefinedLength);

        const auto table = element.offset_table();
        write_tag(buffer, tags::item);
        write_le32(buffer, static_cast<uint32_t>(table.size()));
        buffer.insert(buffer.end(), table.begin(), table.end());

        for (const auto& fragment : element.fragments()) {
            write_tag(buffer, tags::item);
            write_le32(buffer, static_cast<uint32_t>((fragment.size() + 1) & ~size_t{1}));
            write_even(buffer, fragment);
        }

        write_tag(buffer, tags::sequence_delimitation_item);
        write_le32(buffer, 0);
        return;
    }

    const auto raw_data = element.raw_data();
    const auto length = static_cast<uint32_t>((raw_data.size() + 1) & ~size_t{1});

    if (encoding::has_explicit_32bit_length(element.vr())) {
        buffer.push_back(0x00);
        buffer.push_back(0x00);
        write_le32(buffer, length);
    } else {
        write_le16(buffer, static_cast<uint16_t>(length));
    }
    write_even(buffer, raw_data);
}

}  // namespace dcmx::core
