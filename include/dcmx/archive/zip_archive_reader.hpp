/**
 * @file zip_archive_reader.hpp
 * @brief ZIP container reader (stored and deflated members, ZIP64)
 *
 * @see PKWARE APPNOTE.TXT 6.3
 */

#pragma once

#include "dcmx/archive/archive_reader.hpp"
#include "dcmx/archive/file_source.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace dcmx::archive {

/**
 * @brief Reads members of a ZIP file through its central directory.
 *
 * The End Of Central Directory record is searched in the trailing
 * 64 KiB + 22 bytes. Members are stored (method 0) or deflated (method 8,
 * inflated with zlib); CRC-32 is verified on full reads.
 */
class zip_archive_reader final : public archive_reader {
public:
    /**
     * @brief Parse the central directory of @p path.
     * @return The reader, or archive_open_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> dcmx::Result<std::unique_ptr<zip_archive_reader>>;

    [[nodiscard]] auto kind() const noexcept -> archive_kind override {
        return archive_kind::zip;
    }

    [[nodiscard]] auto read_entry(const archive_entry& entry)
        -> dcmx::Result<std::vector<uint8_t>> override;

    [[nodiscard]] auto read_prefix(const archive_entry& entry, std::size_t max_bytes)
        -> dcmx::Result<std::vector<uint8_t>> override;

private:
    struct member {
        std::uint16_t flags{0};
        std::uint16_t method{0};
        std::uint32_t crc32{0};
        std::uint64_t compressed_size{0};
        std::uint64_t uncompressed_size{0};
        std::uint64_t local_header_offset{0};
    };

    zip_archive_reader(std::filesystem::path path, file_source source);

    [[nodiscard]] auto read_central_directory() -> dcmx::VoidResult;

    [[nodiscard]] auto read_member(const archive_entry& entry, std::size_t max_bytes,
                                   bool verify) -> dcmx::Result<std::vector<uint8_t>>;

    file_source source_;

    /// Parallel to entries_
    std::vector<member> members_;
};

}  // namespace dcmx::archive
