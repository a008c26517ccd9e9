/**
 * @file zip_archive_reader.cpp
 * @brief Implementation of the ZIP container reader
 */

#include <dcmx/archive/zip_archive_reader.hpp>

#include <dcmx/encoding/byte_swap.hpp>
#include <dcmx/encoding/inflate.hpp>

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <limits>
#include <span>
#include <string>

namespace dcmx::archive {

namespace {

using encoding::read_le16;
using encoding::read_le32;
using encoding::read_le64;

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr std::uint32_t kZip64EndSignature = 0x06064b50;
constexpr std::uint32_t kZip64LocatorSignature = 0x07064b50;

constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kMaxCommentSize = 0xFFFF;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kLocalHeaderSize = 30;

constexpr std::uint16_t kZip64ExtraId = 0x0001;
constexpr std::uint16_t kExtendedTimestampId = 0x5455;

constexpr std::uint64_t kReadChunkSize = 64 * 1024;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

/**
 * @brief DOS date/time fields (local time) to a time point.
 */
auto from_dos_time(std::uint16_t dos_date, std::uint16_t dos_time)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (dos_date == 0) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = ((dos_date >> 9) & 0x7F) + 80;
    tm.tm_mon = ((dos_date >> 5) & 0x0F) - 1;
    tm.tm_mday = dos_date & 0x1F;
    tm.tm_hour = (dos_time >> 11) & 0x1F;
    tm.tm_min = (dos_time >> 5) & 0x3F;
    tm.tm_sec = (dos_time & 0x1F) * 2;
    tm.tm_isdst = -1;

    if (tm.tm_mon < 0 || tm.tm_mday == 0) {
        return std::nullopt;
    }

    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

struct extra_fields {
    std::optional<std::uint64_t> uncompressed_size;
    std::optional<std::uint64_t> compressed_size;
    std::optional<std::uint64_t> local_header_offset;
    std::optional<std::chrono::system_clock::time_point> modified;
};

/**
 * @brief Parse the ZIP64 and extended timestamp extra fields.
 *
 * ZIP64 values are present only for the header fields that hold the
 * 0xFFFFFFFF escape, in the fixed order below.
 */
auto parse_extra(std::span<const uint8_t> extra, bool need_uncompressed,
                 bool need_compressed, bool need_offset) -> extra_fields {
    extra_fields result;
    std::size_t pos = 0;

    while (pos + 4 <= extra.size()) {
        const auto id = read_le16(extra.data() + pos);
        const auto length = read_le16(extra.data() + pos + 2);
        const auto data_start = pos + 4;
        if (data_start + length > extra.size()) {
            break;
        }
        const auto* data = extra.data() + data_start;

        if (id == kZip64ExtraId) {
            std::size_t offset = 0;
            if (need_uncompressed && offset + 8 <= length) {
                result.uncompressed_size = read_le64(data + offset);
                offset += 8;
            }
            if (need_compressed && offset + 8 <= length) {
                result.compressed_size = read_le64(data + offset);
                offset += 8;
            }
            if (need_offset && offset + 8 <= length) {
                result.local_header_offset = read_le64(data + offset);
            }
        } else if (id == kExtendedTimestampId && length >= 5 && (data[0] & 0x01) != 0) {
            const auto unix_time = static_cast<std::int32_t>(read_le32(data + 1));
            result.modified = std::chrono::system_clock::from_time_t(
                static_cast<std::time_t>(unix_time));
        }

        pos = data_start + length;
    }

    return result;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

zip_archive_reader::zip_archive_reader(std::filesystem::path path, file_source source)
    : archive_reader(std::move(path)), source_(std::move(source)) {}

auto zip_archive_reader::open(const std::filesystem::path& path)
    -> dcmx::Result<std::unique_ptr<zip_archive_reader>> {
    auto source = file_source::open(path);
    if (source.is_err()) {
        return dcmx::Result<std::unique_ptr<zip_archive_reader>>::err(source.error());
    }

    std::unique_ptr<zip_archive_reader> reader{
        new zip_archive_reader(path, std::move(source.value()))};

    auto parsed = reader->read_central_directory();
    if (parsed.is_err()) {
        return dcmx::Result<std::unique_ptr<zip_archive_reader>>::err(parsed.error());
    }

    return dcmx::Result<std::unique_ptr<zip_archive_reader>>::ok(std::move(reader));
}

// ============================================================================
// Central Directory
// ============================================================================

auto zip_archive_reader::read_central_directory() -> dcmx::VoidResult {
    const auto file_size = source_.size();
    if (file_size < kEndOfCentralDirSize) {
        return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                     "File too small to be a ZIP archive: " +
                                         path_.string());
    }

    const auto tail_size = std::min<std::uint64_t>(
        file_size, kEndOfCentralDirSize + kMaxCommentSize);
    const auto tail_offset = file_size - tail_size;
    auto tail_result = source_.read_at(tail_offset, tail_size);
    if (tail_result.is_err()) {
        return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                     tail_result.error().message);
    }
    const auto& tail = tail_result.value();

    // Search backwards; the record is followed only by its comment
    std::optional<std::size_t> eocd_pos;
    for (std::size_t pos = tail.size() - kEndOfCentralDirSize + 1; pos-- > 0;) {
        if (read_le32(tail.data() + pos) != kEndOfCentralDirSignature) {
            continue;
        }
        const auto comment_length = read_le16(tail.data() + pos + 20);
        if (pos + kEndOfCentralDirSize + comment_length <= tail.size()) {
            eocd_pos = pos;
            break;
        }
    }
    if (!eocd_pos) {
        return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                     "End of central directory not found in " +
                                         path_.string());
    }

    const auto* eocd = tail.data() + *eocd_pos;
    std::uint64_t entry_count = read_le16(eocd + 10);
    std::uint64_t cd_size = read_le32(eocd + 12);
    std::uint64_t cd_offset = read_le32(eocd + 16);

    const bool needs_zip64 = entry_count == 0xFFFF || cd_size == 0xFFFFFFFF ||
                             cd_offset == 0xFFFFFFFF;
    const auto eocd_absolute = tail_offset + *eocd_pos;
    if (needs_zip64 && eocd_absolute >= 20) {
        auto locator = source_.read_at(eocd_absolute - 20, 20);
        if (locator.is_ok() &&
            read_le32(locator.value().data()) == kZip64LocatorSignature) {
            const auto zip64_offset = read_le64(locator.value().data() + 8);
            auto record = source_.read_at(zip64_offset, 56);
            if (record.is_err() ||
                read_le32(record.value().data()) != kZip64EndSignature) {
                return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                             "Corrupt ZIP64 end of central directory");
            }
            entry_count = read_le64(record.value().data() + 32);
            cd_size = read_le64(record.value().data() + 40);
            cd_offset = read_le64(record.value().data() + 48);
        }
    }

    auto cd_result = source_.read_at(cd_offset, cd_size);
    if (cd_result.is_err()) {
        return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                     "Central directory outside of archive: " +
                                         cd_result.error().message);
    }
    const auto& cd = cd_result.value();

    std::size_t pos = 0;
    for (std::uint64_t i = 0; i < entry_count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() ||
            read_le32(cd.data() + pos) != kCentralHeaderSignature) {
            return dcmx::dcmx_void_error(
                dcmx::error_codes::archive_open_error,
                "Corrupt central directory header #" + std::to_string(i));
        }

        const auto* h = cd.data() + pos;
        const auto name_length = read_le16(h + 28);
        const auto extra_length = read_le16(h + 30);
        const auto comment_length = read_le16(h + 32);
        const auto record_size = kCentralHeaderSize + name_length +
                                 extra_length + comment_length;
        if (pos + record_size > cd.size()) {
            return dcmx::dcmx_void_error(
                dcmx::error_codes::archive_open_error,
                "Truncated central directory header #" + std::to_string(i));
        }

        member m;
        m.flags = read_le16(h + 8);
        m.method = read_le16(h + 10);
        m.crc32 = read_le32(h + 16);
        m.compressed_size = read_le32(h + 20);
        m.uncompressed_size = read_le32(h + 24);
        m.local_header_offset = read_le32(h + 42);

        const std::string raw_name{reinterpret_cast<const char*>(h + kCentralHeaderSize),
                                   name_length};
        const auto extra = parse_extra(
            std::span<const uint8_t>{h + kCentralHeaderSize + name_length, extra_length},
            m.uncompressed_size == 0xFFFFFFFF, m.compressed_size == 0xFFFFFFFF,
            m.local_header_offset == 0xFFFFFFFF);
        if (extra.uncompressed_size) m.uncompressed_size = *extra.uncompressed_size;
        if (extra.compressed_size) m.compressed_size = *extra.compressed_size;
        if (extra.local_header_offset) m.local_header_offset = *extra.local_header_offset;

        pos += record_size;

        if (!raw_name.empty() && (raw_name.back() == '/' || raw_name.back() == '\\')) {
            continue;  // directory
        }

        auto normalized = normalize_entry_path(raw_name);
        if (!normalized) {
            rejected_.push_back(raw_name + " (unsafe path)");
            continue;
        }

        archive_entry entry;
        entry.path = std::move(*normalized);
        entry.size = m.uncompressed_size;
        entry.index = entries_.size();
        entry.modified = extra.modified ? extra.modified
                                        : from_dos_time(read_le16(h + 14), read_le16(h + 12));
        entries_.push_back(std::move(entry));
        members_.push_back(m);
    }

    return dcmx::ok();
}

// ============================================================================
// Member Data
// ============================================================================

auto zip_archive_reader::read_entry(const archive_entry& entry)
    -> dcmx::Result<std::vector<uint8_t>> {
    return read_member(entry, std::numeric_limits<std::size_t>::max(), true);
}

auto zip_archive_reader::read_prefix(const archive_entry& entry, std::size_t max_bytes)
    -> dcmx::Result<std::vector<uint8_t>> {
    return read_member(entry, max_bytes, false);
}

auto zip_archive_reader::read_member(const archive_entry& entry, std::size_t max_bytes,
                                     bool verify) -> dcmx::Result<std::vector<uint8_t>> {
    using result_type = dcmx::Result<std::vector<uint8_t>>;

    if (entry.index >= members_.size() || entries_[entry.index].path != entry.path) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Entry does not belong to this archive: " + entry.path);
    }
    const auto& m = members_[entry.index];

    if ((m.flags & kFlagEncrypted) != 0) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Encrypted ZIP member: " + entry.path);
    }
    if (m.method != kMethodStored && m.method != kMethodDeflated) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "ZIP compression method " + std::to_string(m.method) +
                " is not supported: " + entry.path);
    }

    auto local = source_.read_at(m.local_header_offset, kLocalHeaderSize);
    if (local.is_err() || read_le32(local.value().data()) != kLocalHeaderSignature) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Corrupt local header for " + entry.path);
    }
    const auto data_offset = m.local_header_offset + kLocalHeaderSize +
                             read_le16(local.value().data() + 26) +
                             read_le16(local.value().data() + 28);

    if (data_offset > source_.size() || m.compressed_size > source_.size() - data_offset) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Member data runs past end of archive: " + entry.path);
    }

    std::vector<uint8_t> data;
    if (m.method == kMethodStored) {
        const auto length = std::min<std::uint64_t>(m.compressed_size, max_bytes);
        auto stored = source_.read_at(data_offset, length);
        if (stored.is_err()) {
            return result_type::err(stored.error());
        }
        data = std::move(stored.value());
    } else {
        if (m.uncompressed_size > m.compressed_size * encoding::max_deflate_ratio) {
            return dcmx::dcmx_error<std::vector<uint8_t>>(
                dcmx::error_codes::archive_read_error,
                "Declared size " + std::to_string(m.uncompressed_size) +
                    " exceeds what " + std::to_string(m.compressed_size) +
                    " deflated bytes can hold: " + entry.path);
        }

        // One extra byte on full reads exposes a stream longer than declared
        const auto limit = verify
            ? static_cast<std::size_t>(m.uncompressed_size) + 1
            : max_bytes;
        data.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(
            {m.uncompressed_size, limit, encoding::max_reserve_size})));

        encoding::raw_inflater inflater;
        std::uint64_t offset = 0;
        while (offset < m.compressed_size && data.size() < limit && !inflater.finished()) {
            const auto length = std::min(m.compressed_size - offset, kReadChunkSize);
            auto chunk = source_.read_at(data_offset + offset, length);
            if (chunk.is_err()) {
                return result_type::err(chunk.error());
            }
            offset += length;

            auto fed = inflater.feed(chunk.value(), data, limit);
            if (fed.is_err()) {
                return dcmx::dcmx_error<std::vector<uint8_t>>(
                    dcmx::error_codes::archive_read_error,
                    "Cannot inflate " + entry.path + ": " + fed.error().message);
            }
        }
        if (!inflater.finished() && data.size() < limit) {
            return dcmx::dcmx_error<std::vector<uint8_t>>(
                dcmx::error_codes::archive_read_error,
                "Cannot inflate " + entry.path + ": Deflate stream is truncated");
        }
    }

    if (!verify) {
        return result_type::ok(std::move(data));
    }

    if (data.size() != m.uncompressed_size) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Size mismatch for " + entry.path + ": expected " +
                std::to_string(m.uncompressed_size) + " bytes, got " +
                std::to_string(data.size()));
    }

    uLong crc = ::crc32(0L, Z_NULL, 0);
    std::size_t done = 0;
    while (done < data.size()) {
        const auto chunk = static_cast<uInt>(
            std::min<std::size_t>(data.size() - done, 1u << 30));
        crc = ::crc32(crc, data.data() + done, chunk);
        done += chunk;
    }
    if (static_cast<std::uint32_t>(crc) != m.crc32) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "CRC-32 mismatch for " + entry.path);
    }

    return result_type::ok(std::move(data));
}

}  // namespace dcmx::archive
