/**
 * @file png_writer.cpp
 * @brief PNG encoding with libpng
 */

#include "dcmx/render/png_writer.hpp"

#include <csetjmp>
#include <cstdio>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <png.h>

namespace dcmx::render {

namespace {

constexpr size_t kMaxKeywordLength = 79;

struct file_closer {
    void operator()(std::FILE* file) const noexcept {
        if (file != nullptr) {
            std::fclose(file);
        }
    }
};

using file_ptr = std::unique_ptr<std::FILE, file_closer>;

/**
 * @brief RAII wrapper for png_struct / png_info.
 */
class png_writer_handle {
public:
    png_writer_handle() {
        png_ = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (png_ != nullptr) {
            info_ = png_create_info_struct(png_);
        }
    }

    ~png_writer_handle() {
        if (png_ != nullptr) {
            png_destroy_write_struct(&png_, info_ != nullptr ? &info_ : nullptr);
        }
    }

    png_writer_handle(const png_writer_handle&) = delete;
    png_writer_handle& operator=(const png_writer_handle&) = delete;

    [[nodiscard]] bool valid() const noexcept { return png_ != nullptr && info_ != nullptr; }

    png_structp png() noexcept { return png_; }
    png_infop info() noexcept { return info_; }

private:
    png_structp png_{nullptr};
    png_infop info_{nullptr};
};

/**
 * @brief Encode into @p file; the setjmp point for libpng errors.
 *
 * Only trivially destructible locals live in this frame.
 *
 * @return false if libpng reported an error
 */
bool encode(png_writer_handle& handle, std::FILE* file, const raster& image,
            std::vector<png_text>& text) {
    if (setjmp(png_jmpbuf(handle.png()))) {
        return false;
    }

    png_init_io(handle.png(), file);
    png_set_compression_level(handle.png(), 6);

    const int color_type = image.channels == 1 ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB;
    png_set_IHDR(handle.png(), handle.info(),
                 image.width, image.height,
                 8,
                 color_type,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);

    if (!text.empty()) {
        png_set_text(handle.png(), handle.info(), text.data(), static_cast<int>(text.size()));
    }

    png_write_info(handle.png(), handle.info());

    const size_t row_stride = image.row_stride();
    for (uint32_t y = 0; y < image.height; ++y) {
        png_write_row(handle.png(),
                      const_cast<png_bytep>(image.pixels.data() + y * row_stride));
    }

    png_write_end(handle.png(), nullptr);
    return true;
}

}  // namespace

auto write_png(const std::filesystem::path& path, const raster& image,
               const png_text_fields& text) -> dcmx::VoidResult {
    if (image.width == 0 || image.height == 0 ||
        (image.channels != 1 && image.channels != 3) ||
        image.pixels.size() < image.row_stride() * image.height) {
        return dcmx::dcmx_void_error(dcmx::error_codes::image_write_error,
                                     "Invalid raster for " + path.string());
    }

    file_ptr file{std::fopen(path.string().c_str(), "wb")};
    if (!file) {
        return dcmx::dcmx_void_error(dcmx::error_codes::image_write_error,
                                     "Cannot create file: " + path.string());
    }

    png_writer_handle handle;
    if (!handle.valid()) {
        return dcmx::dcmx_void_error(dcmx::error_codes::image_write_error,
                                     "Failed to create PNG write struct");
    }

    std::vector<std::string> keys;
    keys.reserve(text.size());
    for (const auto& [key, value] : text) {
        keys.push_back(key.substr(0, kMaxKeywordLength));
    }

    std::vector<png_text> chunks(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        chunks[i].compression = PNG_TEXT_COMPRESSION_NONE;
        chunks[i].key = keys[i].data();
        chunks[i].text = const_cast<char*>(text[i].second.c_str());
        chunks[i].text_length = text[i].second.size();
    }

    if (!encode(handle, file.get(), image, chunks)) {
        file.reset();
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return dcmx::dcmx_void_error(dcmx::error_codes::image_write_error,
                                     "PNG write error: " + path.string());
    }

    if (std::fflush(file.get()) != 0) {
        return dcmx::dcmx_void_error(dcmx::error_codes::image_write_error,
                                     "Failed to flush " + path.string());
    }
    return dcmx::ok();
}

}  // namespace dcmx::render
