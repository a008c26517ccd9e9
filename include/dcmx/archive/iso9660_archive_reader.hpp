/**
 * @file iso9660_archive_reader.hpp
 * @brief ISO 9660 image reader with Rock Ridge names
 *
 * @see ECMA-119 (ISO 9660), IEEE P1282 (Rock Ridge), IEEE P1281 (SUSP)
 */

#pragma once

#include "dcmx/archive/archive_reader.hpp"
#include "dcmx/archive/file_source.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace dcmx::archive {

/**
 * @brief Enumerates the file tree of the first Primary Volume Descriptor.
 *
 * - Volume descriptors are scanned from sector 16 up to the set terminator;
 *   later PVDs (hybrid or multi-session images) are ignored. Joliet
 *   supplementary descriptors are noted but their tree is not walked.
 * - Directories are walked depth-first with children in name order.
 * - Identifiers lose their ";N" version and a trailing '.'; a Rock Ridge
 *   NM name replaces the identifier when present.
 * - Multi-extent files are presented as one entry.
 * - A directory extent is visited at most once.
 */
class iso9660_archive_reader final : public archive_reader {
public:
    static constexpr std::uint32_t kSectorSize = 2048;
    static constexpr std::uint32_t kFirstDescriptorSector = 16;

    /**
     * @brief Parse the volume descriptors and directory tree of @p path.
     * @return The reader, or archive_open_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> dcmx::Result<std::unique_ptr<iso9660_archive_reader>>;

    [[nodiscard]] auto kind() const noexcept -> archive_kind override {
        return archive_kind::iso9660;
    }

    [[nodiscard]] auto read_entry(const archive_entry& entry)
        -> dcmx::Result<std::vector<uint8_t>> override;

    [[nodiscard]] auto read_prefix(const archive_entry& entry, std::size_t max_bytes)
        -> dcmx::Result<std::vector<uint8_t>> override;

    /// A Joliet supplementary volume descriptor is present.
    [[nodiscard]] auto has_joliet() const noexcept -> bool { return has_joliet_; }

    /// Rock Ridge extensions were detected on the root directory.
    [[nodiscard]] auto has_rock_ridge() const noexcept -> bool { return rock_ridge_; }

private:
    struct extent {
        std::uint32_t lba{0};
        std::uint32_t length{0};
    };

    struct directory_record {
        std::string name;
        std::vector<extent> extents;
        bool is_directory{false};
        bool more_extents{false};
        bool relocated{false};
        std::optional<std::uint32_t> child_link;
        std::optional<std::chrono::system_clock::time_point> recorded;
    };

    iso9660_archive_reader(std::filesystem::path path, file_source source);

    [[nodiscard]] auto read_volume() -> dcmx::VoidResult;

    [[nodiscard]] auto read_directory(const extent& dir) -> dcmx::Result<std::vector<directory_record>>;

    void walk(const extent& dir, const std::string& prefix, std::set<std::uint32_t>& visited,
              int depth);

    void parse_system_use(std::span<const uint8_t> area, directory_record& record,
                          std::string& rr_name, int depth);

    [[nodiscard]] auto read_extents(const archive_entry& entry, std::uint64_t limit)
        -> dcmx::Result<std::vector<uint8_t>>;

    file_source source_;
    std::uint32_t block_size_{kSectorSize};
    bool has_joliet_{false};
    bool rock_ridge_{false};
    std::uint8_t susp_skip_{0};

    /// Parallel to entries_
    std::vector<std::vector<extent>> extents_;
};

}  // namespace dcmx::archive
