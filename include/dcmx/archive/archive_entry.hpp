/**
 * @file archive_entry.hpp
 * @brief One file inside an archive container
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dcmx::archive {

/**
 * @brief Container formats the exporter can read.
 */
enum class archive_kind {
    zip,
    iso9660
};

/**
 * @brief Short lower-case name: "zip" or "iso".
 *
 * Also used as the suffix of derived destination directories.
 */
[[nodiscard]] constexpr auto to_string(archive_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case archive_kind::zip:
            return "zip";
        case archive_kind::iso9660:
            return "iso";
    }
    return "unknown";
}

/**
 * @brief A regular file inside an archive.
 *
 * Entries carry no payload; bytes are read through the archive_reader that
 * produced them and the entry is only valid while that reader is open.
 */
struct archive_entry {
    /// '/'-separated path inside the container, no leading slash
    std::string path;

    /// Uncompressed size in bytes
    std::uint64_t size{0};

    /// Position in the reader's enumeration order
    std::size_t index{0};

    /// Modification time recorded in the container, when available
    std::optional<std::chrono::system_clock::time_point> modified;

    /**
     * @brief Last path component ("IM0001.dcm" for "CT/IM0001.dcm").
     */
    [[nodiscard]] auto base_name() const -> std::string {
        const auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }
};

}  // namespace dcmx::archive
