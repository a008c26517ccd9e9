/**
 * @file archive_reader.hpp
 * @brief Uniform read-only access to ZIP and ISO 9660 containers
 */

#pragma once

#include "dcmx/archive/archive_entry.hpp"

#include <dcmx/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dcmx::archive {

/**
 * @brief Abstract reader over the regular files of one container.
 *
 * The entry list is built when the archive is opened and stays valid until
 * the reader is destroyed; iterating it again yields the same entries in
 * the same order. Directories are never entries.
 *
 * Reads are independent of each other: a corrupt entry (truncated data,
 * CRC mismatch, bad deflate stream, unsupported method) makes only that
 * read fail, with archive_read_error.
 */
class archive_reader {
public:
    virtual ~archive_reader() = default;

    archive_reader(const archive_reader&) = delete;
    archive_reader& operator=(const archive_reader&) = delete;

    [[nodiscard]] virtual auto kind() const noexcept -> archive_kind = 0;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
        return path_;
    }

    /**
     * @brief Entries in archive-native order.
     */
    [[nodiscard]] auto entries() const noexcept -> const std::vector<archive_entry>& {
        return entries_;
    }

    /**
     * @brief Names of members that were not enumerated (unsafe paths),
     *        with the reason appended.
     */
    [[nodiscard]] auto rejected() const noexcept -> const std::vector<std::string>& {
        return rejected_;
    }

    /**
     * @brief Read the full content of @p entry.
     */
    [[nodiscard]] virtual auto read_entry(const archive_entry& entry)
        -> dcmx::Result<std::vector<uint8_t>> = 0;

    /**
     * @brief Read at most @p max_bytes from the start of @p entry.
     *
     * Checksums are not verified on partial reads.
     */
    [[nodiscard]] virtual auto read_prefix(const archive_entry& entry,
                                           std::size_t max_bytes)
        -> dcmx::Result<std::vector<uint8_t>> = 0;

protected:
    explicit archive_reader(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
    std::vector<archive_entry> entries_;
    std::vector<std::string> rejected_;
};

/**
 * @brief Identify the container format of @p path.
 *
 * The extension decides first (".zip", ".iso", case-insensitive); other
 * files are identified by signature: "PK\x03\x04" or "PK\x05\x06" at
 * offset 0 for ZIP, "CD001" at offset 32769 for ISO 9660.
 *
 * @return The format, or std::nullopt if neither matches
 */
[[nodiscard]] auto detect_archive_kind(const std::filesystem::path& path)
    -> std::optional<archive_kind>;

/**
 * @brief Open @p path with the reader for its detected format.
 *
 * When the reader chosen by extension cannot parse the file, the
 * signature is checked and the other reader is tried if it matches.
 *
 * @return The reader, or archive_open_error when the format is unknown or
 *         the container structure cannot be parsed
 */
[[nodiscard]] auto open_archive(const std::filesystem::path& path)
    -> dcmx::Result<std::unique_ptr<archive_reader>>;

/**
 * @brief Normalize a member name to a safe relative path.
 *
 * Backslashes become '/', leading '/' and "./" are dropped, empty and "."
 * components are removed.
 *
 * @return The normalized path, or std::nullopt if it is empty or contains
 *         a ".." component
 */
[[nodiscard]] auto normalize_entry_path(std::string_view raw)
    -> std::optional<std::string>;

}  // namespace dcmx::archive
