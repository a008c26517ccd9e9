/**
 * @file png_inspect.hpp
 * @brief Reads back PNG files written by the renderer
 */

#pragma once

#include <png.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dcmx::test {

struct png_info {
    uint32_t width{0};
    uint32_t height{0};
    uint8_t bit_depth{0};
    uint8_t color_type{0};

    /// tEXt keyword -> text
    std::map<std::string, std::string> text;
};

/**
 * @brief Walk the chunk list: IHDR fields and every tEXt chunk.
 */
[[nodiscard]] inline auto inspect_png(const std::filesystem::path& path) -> std::optional<png_info> {
    std::ifstream in(path, std::ios::binary);
    const std::vector<uint8_t> data(std::istreambuf_iterator<char>(in),
                                    std::istreambuf_iterator<char>{});

    static constexpr uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (data.size() < 8 || !std::equal(signature, signature + 8, data.begin())) {
        return std::nullopt;
    }

    auto be32 = [&data](std::size_t at) {
        return (static_cast<uint32_t>(data[at]) << 24) | (static_cast<uint32_t>(data[at + 1]) << 16) |
               (static_cast<uint32_t>(data[at + 2]) << 8) | static_cast<uint32_t>(data[at + 3]);
    };

    png_info info;
    std::size_t pos = 8;
    while (pos + 12 <= data.size()) {
        const auto length = be32(pos);
        const std::string type(data.begin() + static_cast<std::ptrdiff_t>(pos + 4),
                               data.begin() + static_cast<std::ptrdiff_t>(pos + 8));
        const auto body = pos + 8;
        if (body + length + 4 > data.size()) {
            return std::nullopt;
        }

        if (type == "IHDR" && length >= 13) {
            info.width = be32(body);
            info.height = be32(body + 4);
            info.bit_depth = data[body + 8];
            info.color_type = data[body + 9];
        } else if (type == "tEXt") {
            const auto begin = data.begin() + static_cast<std::ptrdiff_t>(body);
            const auto end = begin + static_cast<std::ptrdiff_t>(length);
            const auto nul = std::find(begin, end, uint8_t{0});
            if (nul != end) {
                info.text[std::string(begin, nul)] = std::string(nul + 1, end);
            }
        } else if (type == "IEND") {
            break;
        }
        pos = body + length + 4;
    }
    return info;
}

/**
 * @brief Decode to 8-bit grayscale through libpng's simplified API.
 */
[[nodiscard]] inline auto read_png_gray(const std::filesystem::path& path)
    -> std::optional<std::vector<uint8_t>> {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    if (png_image_begin_read_from_file(&image, path.string().c_str()) == 0) {
        return std::nullopt;
    }
    image.format = PNG_FORMAT_GRAY;

    std::vector<uint8_t> pixels(PNG_IMAGE_SIZE(image));
    if (png_image_finish_read(&image, nullptr, pixels.data(), 0, nullptr) == 0) {
        png_image_free(&image);
        return std::nullopt;
    }
    return pixels;
}

}  // namespace dcmx::test
