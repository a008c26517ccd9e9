/**
 * @file image_params.hpp
 * @brief Image parameters for pixel data decoding
 *
 * @see DICOM PS3.3 Section C.7.6.3 - Image Pixel Module
 */

#ifndef DCMX_ENCODING_COMPRESSION_IMAGE_PARAMS_HPP
#define DCMX_ENCODING_COMPRESSION_IMAGE_PARAMS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dcmx::encoding::compression {

/**
 * @brief Photometric Interpretation values (0028,0004).
 */
enum class photometric_interpretation {
    monochrome1,     ///< Minimum pixel value displayed as white
    monochrome2,     ///< Minimum pixel value displayed as black
    rgb,             ///< Red, Green, Blue color model
    ycbcr_full,      ///< YBR_FULL
    ycbcr_full_422,  ///< YBR_FULL_422 (JPEG baseline color)
    palette_color,   ///< Palette color lookup table
    unknown          ///< Unknown or unsupported interpretation
};

[[nodiscard]] inline std::string to_string(photometric_interpretation pi) {
    switch (pi) {
        case photometric_interpretation::monochrome1:
            return "MONOCHROME1";
        case photometric_interpretation::monochrome2:
            return "MONOCHROME2";
        case photometric_interpretation::rgb:
            return "RGB";
        case photometric_interpretation::ycbcr_full:
            return "YBR_FULL";
        case photometric_interpretation::ycbcr_full_422:
            return "YBR_FULL_422";
        case photometric_interpretation::palette_color:
            return "PALETTE COLOR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parses a Photometric Interpretation code string.
 *
 * An empty value is taken as MONOCHROME2.
 */
[[nodiscard]] inline photometric_interpretation parse_photometric_interpretation(
    std::string_view str) {
    if (str.empty() || str == "MONOCHROME2") return photometric_interpretation::monochrome2;
    if (str == "MONOCHROME1") return photometric_interpretation::monochrome1;
    if (str == "RGB") return photometric_interpretation::rgb;
    if (str == "YBR_FULL") return photometric_interpretation::ycbcr_full;
    if (str == "YBR_FULL_422") return photometric_interpretation::ycbcr_full_422;
    if (str == "PALETTE COLOR") return photometric_interpretation::palette_color;
    return photometric_interpretation::unknown;
}

/**
 * @brief Image Pixel Module attributes needed to interpret pixel data.
 */
struct image_params {
    /// Image width in pixels (Columns - 0028,0011)
    uint16_t width{0};

    /// Image height in pixels (Rows - 0028,0010)
    uint16_t height{0};

    /// Bits allocated per pixel sample (0028,0100)
    uint16_t bits_allocated{0};

    /// Bits stored per pixel sample (0028,0101)
    uint16_t bits_stored{0};

    /// High bit position (0028,0102)
    uint16_t high_bit{0};

    /// Number of samples per pixel (0028,0002)
    uint16_t samples_per_pixel{1};

    /// 0 = interleaved (R1G1B1R2G2B2...), 1 = separate planes (RRR...GGG...BBB...)
    uint16_t planar_configuration{0};

    /// Pixel representation (0028,0103): 0 = unsigned, 1 = signed
    uint16_t pixel_representation{0};

    photometric_interpretation photometric{photometric_interpretation::monochrome2};

    /// Number of Frames (0028,0008)
    uint32_t number_of_frames{1};

    [[nodiscard]] size_t bytes_per_sample() const noexcept {
        return (static_cast<size_t>(bits_allocated) + 7) / 8;
    }

    [[nodiscard]] size_t pixel_count() const noexcept {
        return static_cast<size_t>(width) * height;
    }

    [[nodiscard]] size_t frame_size_bytes() const noexcept {
        return pixel_count() * samples_per_pixel * bytes_per_sample();
    }

    [[nodiscard]] bool is_grayscale() const noexcept {
        return samples_per_pixel == 1;
    }

    [[nodiscard]] bool is_color() const noexcept {
        return samples_per_pixel > 1;
    }

    [[nodiscard]] bool is_signed() const noexcept {
        return pixel_representation == 1;
    }

    /**
     * @brief Checks the attribute combinations the decoders accept.
     *
     * - width and height non-zero
     * - bits_allocated 8, 16 or 32 and 1 <= bits_stored <= bits_allocated
     * - 1 or 3 samples per pixel
     */
    [[nodiscard]] bool is_consistent() const noexcept {
        if (width == 0 || height == 0) return false;
        if (bits_allocated != 8 && bits_allocated != 16 && bits_allocated != 32) return false;
        if (bits_stored == 0 || bits_stored > bits_allocated) return false;
        if (samples_per_pixel != 1 && samples_per_pixel != 3) return false;
        return true;
    }

    [[nodiscard]] bool valid_for_jpeg_baseline() const noexcept {
        if (bits_allocated != 8) return false;
        if (samples_per_pixel != 1 && samples_per_pixel != 3) return false;
        return true;
    }

    /**
     * @brief RLE Lossless allows at most 15 segments
     *        (samples_per_pixel * bytes per sample).
     */
    [[nodiscard]] bool valid_for_rle() const noexcept {
        if (bits_allocated != 8 && bits_allocated != 16 && bits_allocated != 32) return false;
        if (samples_per_pixel < 1 || samples_per_pixel > 3) return false;
        if (width == 0 || height == 0) return false;
        return samples_per_pixel * bytes_per_sample() <= 15;
    }
};

}  // namespace dcmx::encoding::compression

#endif  // DCMX_ENCODING_COMPRESSION_IMAGE_PARAMS_HPP
