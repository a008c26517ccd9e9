/**
 * @file archive_reader.cpp
 * @brief Container format detection and member name normalization
 */

#include <dcmx/archive/archive_reader.hpp>

#include <dcmx/archive/file_source.hpp>
#include <dcmx/archive/iso9660_archive_reader.hpp>
#include <dcmx/archive/zip_archive_reader.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace dcmx::archive {

namespace {

constexpr std::uint64_t kIsoSignatureOffset = 32769;  // sector 16, byte 1

auto lower_extension(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

template <typename Reader>
auto upcast(dcmx::Result<std::unique_ptr<Reader>> opened)
    -> dcmx::Result<std::unique_ptr<archive_reader>> {
    if (opened.is_err()) {
        return dcmx::Result<std::unique_ptr<archive_reader>>::err(opened.error());
    }
    std::unique_ptr<archive_reader> reader = std::move(opened.value());
    return dcmx::Result<std::unique_ptr<archive_reader>>::ok(std::move(reader));
}

auto kind_from_extension(const std::filesystem::path& path) -> std::optional<archive_kind> {
    const auto ext = lower_extension(path);
    if (ext == ".zip") {
        return archive_kind::zip;
    }
    if (ext == ".iso") {
        return archive_kind::iso9660;
    }
    return std::nullopt;
}

auto kind_from_signature(const std::filesystem::path& path) -> std::optional<archive_kind> {
    auto source = file_source::open(path);
    if (source.is_err()) {
        return std::nullopt;
    }

    auto head = source.value().read_at(0, 4);
    if (head.is_ok()) {
        const auto& h = head.value();
        if (h[0] == 'P' && h[1] == 'K' &&
            ((h[2] == 0x03 && h[3] == 0x04) || (h[2] == 0x05 && h[3] == 0x06))) {
            return archive_kind::zip;
        }
    }

    auto iso = source.value().read_at(kIsoSignatureOffset, 5);
    if (iso.is_ok() && std::memcmp(iso.value().data(), "CD001", 5) == 0) {
        return archive_kind::iso9660;
    }

    return std::nullopt;
}

auto open_as(archive_kind kind, const std::filesystem::path& path)
    -> dcmx::Result<std::unique_ptr<archive_reader>> {
    switch (kind) {
        case archive_kind::zip:
            return upcast(zip_archive_reader::open(path));
        case archive_kind::iso9660:
            return upcast(iso9660_archive_reader::open(path));
    }

    return dcmx::dcmx_error<std::unique_ptr<archive_reader>>(
        dcmx::error_codes::archive_open_error, "Unrecognized archive format");
}

}  // namespace

auto detect_archive_kind(const std::filesystem::path& path)
    -> std::optional<archive_kind> {
    if (auto kind = kind_from_extension(path)) {
        return kind;
    }
    return kind_from_signature(path);
}

auto open_archive(const std::filesystem::path& path)
    -> dcmx::Result<std::unique_ptr<archive_reader>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return dcmx::dcmx_error<std::unique_ptr<archive_reader>>(
            dcmx::error_codes::archive_open_error,
            "Archive not found: " + path.string());
    }

    const auto kind = detect_archive_kind(path);
    if (!kind) {
        return dcmx::dcmx_error<std::unique_ptr<archive_reader>>(
            dcmx::error_codes::archive_open_error,
            "Unrecognized archive format: " + path.string());
    }

    auto opened = open_as(*kind, path);
    if (opened.is_ok() || !kind_from_extension(path)) {
        return opened;
    }

    // A misnamed archive: the content decides
    const auto actual = kind_from_signature(path);
    if (actual && *actual != *kind) {
        return open_as(*actual, path);
    }
    return opened;
}

auto normalize_entry_path(std::string_view raw) -> std::optional<std::string> {
    std::string normalized;
    normalized.reserve(raw.size());

    std::size_t pos = 0;
    while (pos <= raw.size()) {
        auto end = raw.find_first_of("/\\", pos);
        if (end == std::string_view::npos) {
            end = raw.size();
        }
        const auto component = raw.substr(pos, end - pos);
        pos = end + 1;

        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            return std::nullopt;
        }
        if (!normalized.empty()) {
            normalized.push_back('/');
        }
        normalized.append(component);
    }

    if (normalized.empty()) {
        return std::nullopt;
    }
    return normalized;
}

}  // namespace dcmx::archive
