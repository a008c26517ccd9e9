/**
 * @file file_source.hpp
 * @brief Positioned reads from an archive file on disk
 */

#pragma once

#include <dcmx/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace dcmx::archive {

/**
 * @brief Owns the open stream of an archive and reads byte ranges from it.
 *
 * Not thread-safe; each reader owns one.
 */
class file_source {
public:
    /**
     * @brief Open @p path for reading.
     * @return The source, or archive_open_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> dcmx::Result<file_source>;

    file_source(file_source&&) noexcept = default;
    file_source& operator=(file_source&&) noexcept = default;

    [[nodiscard]] auto size() const noexcept -> std::uint64_t { return size_; }

    /**
     * @brief Read exactly @p length bytes at @p offset.
     * @return The bytes, or archive_read_error if the range is outside the
     *         file or the read comes up short
     */
    [[nodiscard]] auto read_at(std::uint64_t offset, std::uint64_t length)
        -> dcmx::Result<std::vector<uint8_t>>;

private:
    file_source(std::ifstream stream, std::uint64_t size);

    std::ifstream stream_;
    std::uint64_t size_{0};
};

}  // namespace dcmx::archive
