/**
 * @file iso9660_archive_reader.cpp
 * @brief Implementation of the ISO 9660 image reader
 */

#include <dcmx/archive/iso9660_archive_reader.hpp>

#include <dcmx/encoding/byte_swap.hpp>
#include <dcmx/encoding/inflate.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace dcmx::archive {

namespace {

using encoding::read_le16;
using encoding::read_le32;

constexpr std::uint8_t kTypePrimary = 1;
constexpr std::uint8_t kTypeSupplementary = 2;
constexpr std::uint8_t kTypeTerminator = 255;

/// Descriptor sets longer than this are treated as corrupt.
constexpr std::uint32_t kMaxDescriptors = 64;

constexpr std::size_t kRootRecordOffset = 156;
constexpr std::size_t kMinRecordLength = 33;

constexpr std::uint8_t kFlagDirectory = 0x02;
constexpr std::uint8_t kFlagMultiExtent = 0x80;

constexpr int kMaxDirectoryDepth = 64;
constexpr int kMaxContinuationDepth = 8;

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
constexpr auto days_from_civil(int y, unsigned m, unsigned d) noexcept -> long long {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;
}

/**
 * @brief 7-byte directory record date (ECMA-119 9.1.5).
 */
auto recording_time(const uint8_t* d) -> std::optional<std::chrono::system_clock::time_point> {
    const int year = 1900 + d[0];
    const unsigned month = d[1];
    const unsigned day = d[2];
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    const auto gmt_offset_minutes = static_cast<int>(static_cast<int8_t>(d[6])) * 15;

    const long long seconds = days_from_civil(year, month, day) * 86400LL +
                              d[3] * 3600LL + d[4] * 60LL + d[5] -
                              gmt_offset_minutes * 60LL;
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

/**
 * @brief Strip the ";N" version and a trailing '.' from an identifier.
 */
auto clean_identifier(std::string name) -> std::string {
    if (const auto semicolon = name.find(';'); semicolon != std::string::npos) {
        name.erase(semicolon);
    }
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    return name;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

iso9660_archive_reader::iso9660_archive_reader(std::filesystem::path path,
                                               file_source source)
    : archive_reader(std::move(path)), source_(std::move(source)) {}

auto iso9660_archive_reader::open(const std::filesystem::path& path)
    -> dcmx::Result<std::unique_ptr<iso9660_archive_reader>> {
    auto source = file_source::open(path);
    if (source.is_err()) {
        return dcmx::Result<std::unique_ptr<iso9660_archive_reader>>::err(source.error());
    }

    std::unique_ptr<iso9660_archive_reader> reader{
        new iso9660_archive_reader(path, std::move(source.value()))};

    auto parsed = reader->read_volume();
    if (parsed.is_err()) {
        return dcmx::Result<std::unique_ptr<iso9660_archive_reader>>::err(parsed.error());
    }

    return dcmx::Result<std::unique_ptr<iso9660_archive_reader>>::ok(std::move(reader));
}

// ============================================================================
// Volume Descriptors
// ============================================================================

auto iso9660_archive_reader::read_volume() -> dcmx::VoidResult {
    std::optional<extent> root;

    for (std::uint32_t i = 0; i < kMaxDescriptors; ++i) {
        const auto offset =
            static_cast<std::uint64_t>(kFirstDescriptorSector + i) * kSectorSize;
        auto sector = source_.read_at(offset, kSectorSize);
        if (sector.is_err()) {
            if (root) {
                break;
            }
            return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                         "Truncated volume descriptor set in " +
                                             path_.string());
        }
        const auto& d = sector.value();

        if (std::memcmp(d.data() + 1, "CD001", 5) != 0) {
            if (root) {
                break;
            }
            return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                         "Not an ISO 9660 image: " + path_.string());
        }

        const auto type = d[0];
        if (type == kTypeTerminator) {
            break;
        }
        if (type == kTypePrimary && !root) {
            block_size_ = read_le16(d.data() + 128);
            if (block_size_ == 0) {
                block_size_ = kSectorSize;
            }
            root = extent{read_le32(d.data() + kRootRecordOffset + 2),
                          read_le32(d.data() + kRootRecordOffset + 10)};
        } else if (type == kTypeSupplementary) {
            // Joliet escape sequences for UCS-2 levels 1-3
            const auto* esc = d.data() + 88;
            if (esc[0] == '%' && esc[1] == '/' &&
                (esc[2] == '@' || esc[2] == 'C' || esc[2] == 'E')) {
                has_joliet_ = true;
            }
        }
    }

    if (!root) {
        return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                     "No primary volume descriptor in " + path_.string());
    }

    // The SUSP "SP" entry sits in the root's own "." record
    auto first = source_.read_at(static_cast<std::uint64_t>(root->lba) * block_size_,
                                 std::min<std::uint32_t>(root->length, block_size_));
    if (first.is_err()) {
        return dcmx::dcmx_void_error(dcmx::error_codes::archive_open_error,
                                     "Root directory outside of image: " +
                                         first.error().message);
    }
    const auto& dot = first.value();
    if (!dot.empty() && dot[0] >= 34 && dot[0] <= dot.size()) {
        const std::size_t su_start = 34;  // 33 + one-byte name, no padding
        const std::size_t su_end = dot[0];
        if (su_end >= su_start + 7 && dot[su_start] == 'S' && dot[su_start + 1] == 'P' &&
            dot[su_start + 4] == 0xBE && dot[su_start + 5] == 0xEF) {
            rock_ridge_ = true;
            susp_skip_ = dot[su_start + 6];
        }
    }

    std::set<std::uint32_t> visited;
    walk(*root, "", visited, 0);
    return dcmx::ok();
}

// ============================================================================
// Directory Tree
// ============================================================================

auto iso9660_archive_reader::read_directory(const extent& dir)
    -> dcmx::Result<std::vector<directory_record>> {
    auto data_result =
        source_.read_at(static_cast<std::uint64_t>(dir.lba) * block_size_, dir.length);
    if (data_result.is_err()) {
        return dcmx::Result<std::vector<directory_record>>::err(data_result.error());
    }
    const auto& data = data_result.value();

    std::vector<directory_record> records;
    std::size_t pos = 0;

    while (pos < data.size()) {
        const std::size_t length = data[pos];
        if (length == 0) {
            // Records never straddle a sector; zeros pad to the next one
            pos = (pos / block_size_ + 1) * block_size_;
            continue;
        }
        if (length < kMinRecordLength || pos + length > data.size()) {
            break;
        }

        const auto* r = data.data() + pos;
        const std::size_t name_length = r[32];
        if (kMinRecordLength + name_length > length) {
            pos += length;
            continue;
        }

        // "." and ".." are encoded as single 0x00 / 0x01 bytes
        if (name_length == 1 && (r[33] == 0x00 || r[33] == 0x01)) {
            pos += length;
            continue;
        }

        directory_record record;
        record.is_directory = (r[25] & kFlagDirectory) != 0;
        record.more_extents = (r[25] & kFlagMultiExtent) != 0;
        record.extents.push_back(extent{read_le32(r + 2), read_le32(r + 10)});
        record.recorded = recording_time(r + 18);

        const std::size_t su_start =
            kMinRecordLength + name_length + (name_length % 2 == 0 ? 1 : 0) + susp_skip_;
        std::string rr_name;
        if (su_start < length) {
            parse_system_use(std::span<const uint8_t>{r + su_start, length - su_start},
                             record, rr_name, 0);
        }

        record.name = rr_name.empty()
                          ? clean_identifier(std::string{reinterpret_cast<const char*>(r + 33),
                                                         name_length})
                          : rr_name;

        pos += length;

        if (!records.empty() && records.back().more_extents &&
            records.back().name == record.name) {
            records.back().extents.push_back(record.extents.front());
            records.back().more_extents = record.more_extents;
            continue;
        }
        records.push_back(std::move(record));
    }

    return dcmx::Result<std::vector<directory_record>>::ok(std::move(records));
}

void iso9660_archive_reader::parse_system_use(std::span<const uint8_t> area,
                                              directory_record& record,
                                              std::string& rr_name, int depth) {
    std::size_t pos = 0;
    while (pos + 4 <= area.size()) {
        const auto* e = area.data() + pos;
        const std::size_t length = e[2];
        if (length < 4 || pos + length > area.size()) {
            break;
        }

        if (e[0] == 'N' && e[1] == 'M' && length >= 5) {
            // Flags 0x02 / 0x04 mark "current" / "parent" names
            if ((e[4] & 0x06) == 0) {
                rr_name.append(reinterpret_cast<const char*>(e + 5), length - 5);
            }
            rock_ridge_ = true;
        } else if (e[0] == 'R' && e[1] == 'E') {
            record.relocated = true;
        } else if (e[0] == 'C' && e[1] == 'L' && length >= 12) {
            record.child_link = read_le32(e + 4);
        } else if (e[0] == 'C' && e[1] == 'E' && length >= 28 &&
                   depth < kMaxContinuationDepth) {
            const auto block = read_le32(e + 4);
            const auto offset = read_le32(e + 12);
            const auto size = read_le32(e + 20);
            auto continuation = source_.read_at(
                static_cast<std::uint64_t>(block) * block_size_ + offset, size);
            if (continuation.is_ok()) {
                parse_system_use(continuation.value(), record, rr_name, depth + 1);
            }
        } else if (e[0] == 'S' && e[1] == 'T') {
            break;
        }

        pos += length;
    }
}

void iso9660_archive_reader::walk(const extent& dir, const std::string& prefix,
                                  std::set<std::uint32_t>& visited, int depth) {
    if (depth > kMaxDirectoryDepth || !visited.insert(dir.lba).second) {
        rejected_.push_back((prefix.empty() ? std::string{"/"} : prefix) +
                            " (directory loop)");
        return;
    }

    auto records_result = read_directory(dir);
    if (records_result.is_err()) {
        rejected_.push_back((prefix.empty() ? std::string{"/"} : prefix) +
                            " (unreadable directory: " +
                            records_result.error().message + ")");
        return;
    }
    auto records = std::move(records_result.value());

    std::stable_sort(records.begin(), records.end(),
                     [](const directory_record& a, const directory_record& b) {
                         return a.name < b.name;
                     });

    for (const auto& record : records) {
        if (record.relocated || record.name.empty()) {
            continue;
        }

        const auto raw_path = prefix.empty() ? record.name : prefix + "/" + record.name;
        auto path = normalize_entry_path(raw_path);
        if (!path) {
            rejected_.push_back(raw_path + " (unsafe path)");
            continue;
        }

        if (record.child_link) {
            // Deep directory moved elsewhere; its "." record has the length
            auto dot = source_.read_at(
                static_cast<std::uint64_t>(*record.child_link) * block_size_, 34);
            if (dot.is_ok()) {
                walk(extent{*record.child_link, read_le32(dot.value().data() + 10)},
                     *path, visited, depth + 1);
            } else {
                rejected_.push_back(*path + " (unreadable relocated directory)");
            }
            continue;
        }

        if (record.is_directory) {
            walk(record.extents.front(), *path, visited, depth + 1);
            continue;
        }

        archive_entry entry;
        entry.path = std::move(*path);
        for (const auto& e : record.extents) {
            entry.size += e.length;
        }
        entry.index = entries_.size();
        entry.modified = record.recorded;
        entries_.push_back(std::move(entry));
        extents_.push_back(record.extents);
    }
}

// ============================================================================
// File Data
// ============================================================================

auto iso9660_archive_reader::read_entry(const archive_entry& entry)
    -> dcmx::Result<std::vector<uint8_t>> {
    return read_extents(entry, entry.size);
}

auto iso9660_archive_reader::read_prefix(const archive_entry& entry, std::size_t max_bytes)
    -> dcmx::Result<std::vector<uint8_t>> {
    return read_extents(entry, std::min<std::uint64_t>(entry.size, max_bytes));
}

auto iso9660_archive_reader::read_extents(const archive_entry& entry, std::uint64_t limit)
    -> dcmx::Result<std::vector<uint8_t>> {
    if (entry.index >= extents_.size() || entries_[entry.index].path != entry.path) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Entry does not belong to this image: " + entry.path);
    }

    for (const auto& e : extents_[entry.index]) {
        const auto start = static_cast<std::uint64_t>(e.lba) * block_size_;
        if (start > source_.size() || e.length > source_.size() - start) {
            return dcmx::dcmx_error<std::vector<uint8_t>>(
                dcmx::error_codes::archive_read_error,
                "Extent of " + entry.path + " runs past end of image");
        }
    }

    std::vector<uint8_t> data;
    data.reserve(static_cast<std::size_t>(
        std::min<std::uint64_t>({limit, source_.size(), encoding::max_reserve_size})));

    for (const auto& e : extents_[entry.index]) {
        if (data.size() >= limit) {
            break;
        }
        const auto wanted = std::min<std::uint64_t>(e.length, limit - data.size());
        auto chunk = source_.read_at(static_cast<std::uint64_t>(e.lba) * block_size_, wanted);
        if (chunk.is_err()) {
            return dcmx::dcmx_error<std::vector<uint8_t>>(
                dcmx::error_codes::archive_read_error,
                "Cannot read " + entry.path + ": " + chunk.error().message);
        }
        data.insert(data.end(), chunk.value().begin(), chunk.value().end());
    }

    return dcmx::Result<std::vector<uint8_t>>::ok(std::move(data));
}

}  // namespace dcmx::archive
