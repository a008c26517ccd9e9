/**
 * @file file_source.cpp
 * @brief Implementation of positioned archive reads
 */

#include <dcmx/archive/file_source.hpp>

#include <string>

namespace dcmx::archive {

file_source::file_source(std::ifstream stream, std::uint64_t size)
    : stream_(std::move(stream)), size_(size) {}

auto file_source::open(const std::filesystem::path& path)
    -> dcmx::Result<file_source> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return dcmx::dcmx_error<file_source>(
            dcmx::error_codes::archive_open_error,
            "Cannot stat archive: " + path.string(), ec.message());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return dcmx::dcmx_error<file_source>(
            dcmx::error_codes::archive_open_error,
            "Cannot open archive: " + path.string());
    }

    return dcmx::Result<file_source>::ok(file_source{std::move(stream), size});
}

auto file_source::read_at(std::uint64_t offset, std::uint64_t length)
    -> dcmx::Result<std::vector<uint8_t>> {
    if (offset > size_ || length > size_ - offset) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Read of " + std::to_string(length) + " bytes at offset " +
                std::to_string(offset) + " runs past end of archive (" +
                std::to_string(size_) + " bytes)");
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(length));
    if (length == 0) {
        return dcmx::Result<std::vector<uint8_t>>::ok(std::move(buffer));
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.read(reinterpret_cast<char*>(buffer.data()),
                      static_cast<std::streamsize>(length))) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::archive_read_error,
            "Short read at offset " + std::to_string(offset));
    }

    return dcmx::Result<std::vector<uint8_t>>::ok(std::move(buffer));
}

}  // namespace dcmx::archive
