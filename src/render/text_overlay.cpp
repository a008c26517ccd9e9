/**
 * @file text_overlay.cpp
 * @brief FreeType based text rendering
 */

#include "dcmx/render/text_overlay.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace dcmx::render {

namespace {

/**
 * @brief Next code point of @p text at @p pos; invalid bytes yield U+FFFD.
 */
auto next_code_point(std::string_view text, size_t& pos) -> char32_t {
    const auto lead = static_cast<unsigned char>(text[pos++]);
    if (lead < 0x80) {
        return lead;
    }

    int extra = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return 0xFFFD;
    }

    for (int i = 0; i < extra; ++i) {
        if (pos >= text.size() ||
            (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80) {
            return 0xFFFD;
        }
        cp = (cp << 6) | (static_cast<unsigned char>(text[pos++]) & 0x3F);
    }
    return cp;
}

}  // namespace

// ============================================================================
// font_face::impl
// ============================================================================

class font_face::impl {
public:
    impl(std::filesystem::path path, FT_Library library, FT_Face face)
        : path_(std::move(path)), library_(library), face_(face) {}

    ~impl() {
        FT_Done_Face(face_);
        FT_Done_FreeType(library_);
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    std::filesystem::path path_;
    FT_Library library_;
    FT_Face face_;
};

// ============================================================================
// Construction
// ============================================================================

font_face::font_face(std::unique_ptr<impl> handle) : impl_(std::move(handle)) {}

font_face::~font_face() = default;

auto font_face::load(const std::filesystem::path& path, unsigned pixel_size)
    -> dcmx::Result<std::unique_ptr<font_face>> {
    FT_Library library = nullptr;
    if (const auto error = FT_Init_FreeType(&library); error != 0) {
        return dcmx::dcmx_error<std::unique_ptr<font_face>>(
            dcmx::error_codes::font_unavailable,
            "FreeType initialization failed (error " + std::to_string(error) + ")");
    }

    FT_Face face = nullptr;
    if (const auto error = FT_New_Face(library, path.string().c_str(), 0, &face);
        error != 0) {
        FT_Done_FreeType(library);
        return dcmx::dcmx_error<std::unique_ptr<font_face>>(
            dcmx::error_codes::font_unavailable,
            "Cannot load font " + path.string() + " (FreeType error " +
                std::to_string(error) + ")");
    }

    auto handle = std::make_unique<impl>(path, library, face);

    if (const auto error = FT_Set_Pixel_Sizes(face, 0, pixel_size); error != 0) {
        return dcmx::dcmx_error<std::unique_ptr<font_face>>(
            dcmx::error_codes::font_unavailable,
            "Font " + path.string() + " has no size " + std::to_string(pixel_size));
    }

    return dcmx::Result<std::unique_ptr<font_face>>::ok(
        std::unique_ptr<font_face>(new font_face(std::move(handle))));
}

// ============================================================================
// Metrics
// ============================================================================

auto font_face::path() const noexcept -> const std::filesystem::path& {
    return impl_->path_;
}

auto font_face::line_height() const noexcept -> int {
    return static_cast<int>(impl_->face_->size->metrics.height >> 6);
}

auto font_face::ascender() const noexcept -> int {
    return static_cast<int>(impl_->face_->size->metrics.ascender >> 6);
}

// ============================================================================
// Drawing
// ============================================================================

void font_face::draw_text(raster& image, int x, int baseline, std::string_view text,
                          uint8_t intensity) const {
    FT_Face face = impl_->face_;
    int pen_x = x;

    size_t pos = 0;
    while (pos < text.size()) {
        const auto cp = next_code_point(text, pos);
        if (FT_Load_Char(face, cp, FT_LOAD_RENDER) != 0) {
            continue;
        }

        const FT_GlyphSlot slot = face->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;
        if (bitmap.pixel_mode == FT_PIXEL_MODE_GRAY) {
            const int left = pen_x + slot->bitmap_left;
            const int top = baseline - slot->bitmap_top;

            for (unsigned row = 0; row < bitmap.rows; ++row) {
                const int py = top + static_cast<int>(row);
                if (py < 0 || py >= static_cast<int>(image.height)) {
                    continue;
                }
                const unsigned char* src = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
                for (unsigned col = 0; col < bitmap.width; ++col) {
                    const int px = left + static_cast<int>(col);
                    if (px < 0 || px >= static_cast<int>(image.width)) {
                        continue;
                    }
                    const unsigned alpha = src[col];
                    if (alpha == 0) {
                        continue;
                    }
                    uint8_t* dst = image.at(static_cast<uint32_t>(px), static_cast<uint32_t>(py));
                    for (uint32_t c = 0; c < image.channels; ++c) {
                        dst[c] = static_cast<uint8_t>(
                            (dst[c] * (255 - alpha) + intensity * alpha + 127) / 255);
                    }
                }
            }
        }

        pen_x += static_cast<int>(slot->advance.x >> 6);
    }
}

void draw_overlay(raster& image, const font_face& font,
                  const std::vector<std::string>& lines, int margin) {
    const int line_height = std::max(font.line_height(), 1);
    int baseline = margin + font.ascender();

    for (const auto& line : lines) {
        font.draw_text(image, margin + 1, baseline + 1, line, 0);
        font.draw_text(image, margin, baseline, line, 255);
        baseline += line_height;
    }
}

}  // namespace dcmx::render
