#include "dcmx/encoding/transfer_syntax.hpp"

#include <algorithm>
#include <array>

namespace dcmx::encoding {

namespace {

struct ts_entry {
    std::string_view uid;
    std::string_view name;
    byte_order endian;
    vr_encoding vr;
    bool encapsulated;
    bool deflated;
    bool pixel_decodable;
};

/**
 * @brief Transfer Syntaxes recognized by the reader (DICOM PS3.5 Annex A).
 */
constexpr std::array<ts_entry, 11> ts_registry = {{
    {"1.2.840.10008.1.2", "Implicit VR Little Endian",
     byte_order::little_endian, vr_encoding::implicit, false, false, true},
    {"1.2.840.10008.1.2.1", "Explicit VR Little Endian",
     byte_order::little_endian, vr_encoding::explicit_vr, false, false, true},
    {"1.2.840.10008.1.2.2", "Explicit VR Big Endian",
     byte_order::big_endian, vr_encoding::explicit_vr, false, false, true},
    {"1.2.840.10008.1.2.1.99", "Deflated Explicit VR Little Endian",
     byte_order::little_endian, vr_encoding::explicit_vr, false, true, true},
    {"1.2.840.10008.1.2.4.50", "JPEG Baseline (Process 1)",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, true},
    {"1.2.840.10008.1.2.4.51", "JPEG Extended (Process 2 & 4)",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, false},
    {"1.2.840.10008.1.2.4.70",
     "JPEG Lossless, Non-Hierarchical, First-Order Prediction",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, false},
    {"1.2.840.10008.1.2.4.80", "JPEG-LS Lossless",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, false},
    {"1.2.840.10008.1.2.4.90", "JPEG 2000 Image Compression (Lossless Only)",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, false},
    {"1.2.840.10008.1.2.4.91", "JPEG 2000 Image Compression",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, false},
    {"1.2.840.10008.1.2.5", "RLE Lossless",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false, true},
}};

const ts_entry* find_entry(std::string_view uid) {
    const auto trimmed = trim_uid(uid);
    auto it = std::find_if(ts_registry.begin(), ts_registry.end(),
                           [trimmed](const ts_entry& entry) {
                               return entry.uid == trimmed;
                           });
    return (it != ts_registry.end()) ? &(*it) : nullptr;
}

}  // namespace

std::string_view trim_uid(std::string_view uid) noexcept {
    while (!uid.empty() && (uid.back() == '\0' || uid.back() == ' ')) {
        uid.remove_suffix(1);
    }
    return uid;
}

const transfer_syntax transfer_syntax::implicit_vr_little_endian{"1.2.840.10008.1.2"};
const transfer_syntax transfer_syntax::explicit_vr_little_endian{"1.2.840.10008.1.2.1"};
const transfer_syntax transfer_syntax::explicit_vr_big_endian{"1.2.840.10008.1.2.2"};
const transfer_syntax transfer_syntax::deflated_explicit_vr_le{"1.2.840.10008.1.2.1.99"};
const transfer_syntax transfer_syntax::jpeg_baseline{"1.2.840.10008.1.2.4.50"};
const transfer_syntax transfer_syntax::jpeg_extended{"1.2.840.10008.1.2.4.51"};
const transfer_syntax transfer_syntax::jpeg_lossless{"1.2.840.10008.1.2.4.70"};
const transfer_syntax transfer_syntax::jpeg_ls_lossless{"1.2.840.10008.1.2.4.80"};
const transfer_syntax transfer_syntax::jpeg2000_lossless{"1.2.840.10008.1.2.4.90"};
const transfer_syntax transfer_syntax::jpeg2000_lossy{"1.2.840.10008.1.2.4.91"};
const transfer_syntax transfer_syntax::rle_lossless{"1.2.840.10008.1.2.5"};

transfer_syntax::transfer_syntax(std::string_view uid)
    : uid_(trim_uid(uid)),
      name_("Unknown"),
      endianness_(byte_order::little_endian),
      vr_type_(vr_encoding::explicit_vr),
      encapsulated_(false),
      deflated_(false),
      valid_(false),
      pixel_decodable_(false) {
    if (const auto* entry = find_entry(uid)) {
        name_ = entry->name;
        endianness_ = entry->endian;
        vr_type_ = entry->vr;
        encapsulated_ = entry->encapsulated;
        deflated_ = entry->deflated;
        valid_ = true;
        pixel_decodable_ = entry->pixel_decodable;
    }
}

transfer_syntax::transfer_syntax(std::string_view uid, std::string_view name,
                                 byte_order endian, vr_encoding vr,
                                 bool encapsulated, bool deflated,
                                 bool pixel_decodable)
    : uid_(uid),
      name_(name),
      endianness_(endian),
      vr_type_(vr),
      encapsulated_(encapsulated),
      deflated_(deflated),
      valid_(true),
      pixel_decodable_(pixel_decodable) {}

std::string_view transfer_syntax::uid() const noexcept {
    return uid_;
}

std::string_view transfer_syntax::name() const noexcept {
    return name_;
}

byte_order transfer_syntax::endianness() const noexcept {
    return endianness_;
}

vr_encoding transfer_syntax::vr_type() const noexcept {
    return vr_type_;
}

bool transfer_syntax::is_encapsulated() const noexcept {
    return encapsulated_;
}

bool transfer_syntax::is_deflated() const noexcept {
    return deflated_;
}

bool transfer_syntax::is_valid() const noexcept {
    return valid_;
}

bool transfer_syntax::is_supported() const noexcept {
    return valid_;
}

bool transfer_syntax::is_pixel_decodable() const noexcept {
    return pixel_decodable_;
}

bool transfer_syntax::operator==(const transfer_syntax& other) const noexcept {
    return uid_ == other.uid_;
}

bool transfer_syntax::operator!=(const transfer_syntax& other) const noexcept {
    return !(*this == other);
}

std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid) {
    if (const auto* entry = find_entry(uid)) {
        return transfer_syntax{entry->uid, entry->name, entry->endian,
                               entry->vr, entry->encapsulated, entry->deflated,
                               entry->pixel_decodable};
    }
    return std::nullopt;
}

}  // namespace dcmx::encoding
