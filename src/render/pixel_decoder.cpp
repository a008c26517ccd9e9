/**
 * @file pixel_decoder.cpp
 * @brief Implementation of first-frame decoding and normalization
 */

#include "dcmx/render/pixel_decoder.hpp"

#include <dcmx/core/dicom_tag_constants.hpp>
#include <dcmx/encoding/byte_swap.hpp>
#include <dcmx/encoding/compression/codec_factory.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace dcmx::render {

using encoding::compression::compression_result;
using encoding::compression::image_params;
using encoding::compression::photometric_interpretation;

namespace {

auto decode_error(const std::string& message) -> dcmx::Result<compression_result> {
    return dcmx::dcmx_error<compression_result>(dcmx::error_codes::decode_error, message);
}

/**
 * @brief Bytes of frame 0 from encapsulated Pixel Data.
 *
 * A single-frame image owns every fragment. For multi-frame images the
 * Basic Offset Table bounds frame 0; without one, frame 0 is the first
 * fragment.
 */
auto first_frame_fragments(const core::dicom_element& pixel, uint32_t frames)
    -> std::vector<uint8_t> {
    const auto& fragments = pixel.fragments();
    std::vector<uint8_t> frame;
    if (fragments.empty()) {
        return frame;
    }

    if (frames <= 1) {
        for (const auto& f : fragments) {
            frame.insert(frame.end(), f.begin(), f.end());
        }
        return frame;
    }

    const auto bot = pixel.offset_table();
    if (bot.size() >= 8) {
        const auto begin = encoding::read_le32(bot.data());
        const auto end = encoding::read_le32(bot.data() + 4);
        // Offsets count from the first fragment's item tag
        uint64_t position = 0;
        for (const auto& f : fragments) {
            if (position >= begin && position < end) {
                frame.insert(frame.end(), f.begin(), f.end());
            }
            position += 8 + f.size();
        }
        if (!frame.empty()) {
            return frame;
        }
    }

    frame = fragments.front();
    return frame;
}

/// Native frame 0, interleaved
auto native_first_frame(std::span<const uint8_t> data, const image_params& params)
    -> dcmx::Result<compression_result> {
    const auto frame_size = params.frame_size_bytes();
    if (data.size() < frame_size) {
        return decode_error("Pixel data too short: expected " + std::to_string(frame_size) +
                            " bytes, got " + std::to_string(data.size()));
    }

    compression_result frame;
    frame.output_params = params;
    frame.output_params.planar_configuration = 0;

    if (params.samples_per_pixel > 1 && params.planar_configuration == 1) {
        const auto pixels = params.pixel_count();
        const auto bps = params.bytes_per_sample();
        const auto spp = static_cast<size_t>(params.samples_per_pixel);
        frame.data.resize(frame_size);
        for (size_t s = 0; s < spp; ++s) {
            for (size_t i = 0; i < pixels; ++i) {
                std::copy_n(data.data() + (s * pixels + i) * bps, bps,
                            frame.data.data() + (i * spp + s) * bps);
            }
        }
    } else {
        frame.data.assign(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(frame_size));
    }

    return dcmx::ok<compression_result>(std::move(frame));
}

/// Sample @p index as a signed value, masked to bits_stored
auto sample_at(const uint8_t* data, size_t index, const image_params& params) -> double {
    const auto bps = params.bytes_per_sample();
    const uint8_t* p = data + index * bps;

    uint64_t raw = 0;
    switch (bps) {
        case 1:
            raw = p[0];
            break;
        case 2:
            raw = encoding::read_le16(p);
            break;
        default:
            raw = encoding::read_le32(p);
            break;
    }

    const unsigned bits = params.bits_stored;
    const uint64_t mask = bits >= 64 ? ~0ULL : ((1ULL << bits) - 1);
    raw &= mask;

    if (params.is_signed() && bits > 0 && (raw & (1ULL << (bits - 1))) != 0) {
        return static_cast<double>(static_cast<int64_t>(raw) - static_cast<int64_t>(1ULL << bits));
    }
    return static_cast<double>(raw);
}

}  // namespace

// ============================================================================
// Image Pixel Module
// ============================================================================

auto read_image_params(const core::dicom_dataset& dataset)
    -> dcmx::Result<image_params> {
    namespace tags = core::tags;

    const auto rows = dataset.get_numeric<uint16_t>(tags::rows);
    const auto columns = dataset.get_numeric<uint16_t>(tags::columns);
    const auto bits_allocated = dataset.get_numeric<uint16_t>(tags::bits_allocated);

    if (!rows || !columns || !bits_allocated) {
        return dcmx::dcmx_error<image_params>(
            dcmx::error_codes::decode_error,
            "Missing Rows, Columns or Bits Allocated");
    }

    image_params params;
    params.height = *rows;
    params.width = *columns;
    params.bits_allocated = *bits_allocated;
    params.bits_stored = dataset.get_numeric<uint16_t>(tags::bits_stored).value_or(*bits_allocated);
    params.high_bit = dataset.get_numeric<uint16_t>(tags::high_bit)
                          .value_or(static_cast<uint16_t>(params.bits_stored - 1));
    params.samples_per_pixel = dataset.get_numeric<uint16_t>(tags::samples_per_pixel).value_or(1);
    params.planar_configuration =
        dataset.get_numeric<uint16_t>(tags::planar_configuration).value_or(0);
    params.pixel_representation =
        dataset.get_numeric<uint16_t>(tags::pixel_representation).value_or(0);
    params.photometric = encoding::compression::parse_photometric_interpretation(
        dataset.get_string(tags::photometric_interpretation));

    const auto frames = dataset.get_decimal(tags::number_of_frames);
    params.number_of_frames =
        frames && *frames >= 1 ? static_cast<uint32_t>(*frames) : 1;

    if (!params.is_consistent()) {
        return dcmx::dcmx_error<image_params>(
            dcmx::error_codes::decode_error,
            "Unsupported pixel layout: " + std::to_string(params.width) + "x" +
                std::to_string(params.height) + ", " +
                std::to_string(params.bits_stored) + "/" +
                std::to_string(params.bits_allocated) + " bits, " +
                std::to_string(params.samples_per_pixel) + " samples");
    }
    if (params.photometric == photometric_interpretation::palette_color ||
        params.photometric == photometric_interpretation::unknown) {
        return dcmx::dcmx_error<image_params>(
            dcmx::error_codes::decode_error,
            "Unsupported photometric interpretation: " +
                dataset.get_string(tags::photometric_interpretation));
    }
    if ((params.samples_per_pixel == 1) !=
        (params.photometric == photometric_interpretation::monochrome1 ||
         params.photometric == photometric_interpretation::monochrome2)) {
        return dcmx::dcmx_error<image_params>(
            dcmx::error_codes::decode_error,
            "Photometric interpretation " + encoding::compression::to_string(params.photometric) +
                " does not match " + std::to_string(params.samples_per_pixel) +
                " samples per pixel");
    }

    return dcmx::ok<image_params>(params);
}

// ============================================================================
// Frame Decoding
// ============================================================================

auto decode_first_frame(const core::dicom_file& file)
    -> dcmx::Result<compression_result> {
    const auto& dataset = file.dataset();

    const auto* pixel = dataset.get(core::tags::pixel_data);
    if (pixel == nullptr) {
        return dcmx::dcmx_error<compression_result>(dcmx::error_codes::element_not_found,
                                                    "No Pixel Data element");
    }

    auto params = read_image_params(dataset);
    if (params.is_err()) {
        return dcmx::Result<compression_result>::err(params.error());
    }

    if (!pixel->is_encapsulated()) {
        return native_first_frame(pixel->raw_data(), params.value());
    }

    const auto ts = file.transfer_syntax();
    auto codec = encoding::compression::codec_factory::create(ts);
    if (!codec) {
        return decode_error("No decoder for transfer syntax " + std::string{ts.uid()} +
                            " (" + std::string{ts.name()} + ")");
    }
    if (!codec->can_decode(params.value())) {
        return decode_error(std::string{codec->name()} +
                            " cannot decode this pixel layout");
    }

    const auto compressed = first_frame_fragments(*pixel, params.value().number_of_frames);
    if (compressed.empty()) {
        return decode_error("Encapsulated Pixel Data has no fragments");
    }

    auto decoded = codec->decode(compressed, params.value());
    if (decoded.is_err()) {
        return decoded;
    }
    if (decoded.value().data.size() < decoded.value().output_params.frame_size_bytes()) {
        return decode_error("Decoded frame is shorter than its dimensions");
    }
    return decoded;
}

// ============================================================================
// Display Conversion
// ============================================================================

auto to_display_raster(const compression_result& frame) -> dcmx::Result<raster> {
    const auto& params = frame.output_params;
    if (!params.is_consistent() ||
        frame.data.size() < params.frame_size_bytes()) {
        return dcmx::dcmx_error<raster>(dcmx::error_codes::decode_error,
                                        "Frame does not match its parameters");
    }

    const size_t pixels = params.pixel_count();
    const size_t spp = params.samples_per_pixel;
    const size_t count = pixels * spp;

    std::vector<double> values(count);
    for (size_t i = 0; i < count; ++i) {
        values[i] = sample_at(frame.data.data(), i, params);
    }

    if (spp == 3 && (params.photometric == photometric_interpretation::ycbcr_full ||
                     params.photometric == photometric_interpretation::ycbcr_full_422)) {
        const double mid = std::ldexp(1.0, params.bits_stored - 1);
        for (size_t i = 0; i < pixels; ++i) {
            const double y = values[i * 3];
            const double cb = values[i * 3 + 1] - mid;
            const double cr = values[i * 3 + 2] - mid;
            values[i * 3] = y + 1.402 * cr;
            values[i * 3 + 1] = y - 0.344136 * cb - 0.714136 * cr;
            values[i * 3 + 2] = y + 1.772 * cb;
        }
    }

    const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    const double lo = *min_it;
    const double range = *max_it - lo;

    raster out{params.width, params.height, static_cast<uint32_t>(spp)};
    for (size_t i = 0; i < count; ++i) {
        const double scaled = range > 0.0 ? (values[i] - lo) * 255.0 / range : 0.0;
        out.pixels[i] = static_cast<uint8_t>(std::clamp(std::lround(scaled), 0L, 255L));
    }

    if (params.photometric == photometric_interpretation::monochrome1) {
        for (auto& p : out.pixels) {
            p = static_cast<uint8_t>(255 - p);
        }
    }

    return dcmx::ok<raster>(std::move(out));
}

}  // namespace dcmx::render
