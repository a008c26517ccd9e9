#include "dcmx/encoding/compression/rle_codec.hpp"

#include <dcmx/core/result.hpp>
#include <dcmx/encoding/byte_swap.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace dcmx::encoding::compression {

namespace {

/**
 * @brief Decode one PackBits segment (PS3.5 G.3.2).
 * @throws std::runtime_error on truncated input
 */
std::vector<uint8_t> decode_rle_segment(std::span<const uint8_t> input, size_t expected_size) {
    std::vector<uint8_t> output;
    output.reserve(expected_size);

    size_t pos = 0;
    const size_t size = input.size();

    while (pos < size && output.size() < expected_size) {
        auto control = static_cast<int8_t>(input[pos]);
        ++pos;

        if (control >= 0) {
            // Literal: copy next (control + 1) bytes
            size_t count = static_cast<size_t>(control) + 1;
            if (pos + count > size) {
                throw std::runtime_error("insufficient literal data");
            }
            output.insert(output.end(), input.begin() + static_cast<std::ptrdiff_t>(pos),
                          input.begin() + static_cast<std::ptrdiff_t>(pos + count));
            pos += count;
        } else if (control != -128) {
            // Run: repeat next byte (1 - control) times
            if (pos >= size) {
                throw std::runtime_error("missing replicate byte");
            }
            size_t count = static_cast<size_t>(1 - control);
            uint8_t value = input[pos];
            ++pos;
            for (size_t i = 0; i < count && output.size() < expected_size; ++i) {
                output.push_back(value);
            }
        }
        // -128 is a no-op
    }

    if (output.size() > expected_size) {
        output.resize(expected_size);
    }
    return output;
}

codec_result make_decode_error(const std::string& message) {
    return dcmx::dcmx_error<compression_result>(dcmx::error_codes::decode_error, message);
}

}  // namespace

class rle_codec::impl {
public:
    [[nodiscard]] codec_result decode(
        std::span<const uint8_t> compressed_data,
        const image_params& params) const {

        if (compressed_data.size() < kRLEHeaderSize) {
            return make_decode_error("Compressed data too small for RLE header");
        }
        if (!params.valid_for_rle()) {
            return make_decode_error(
                "Invalid parameters for RLE: requires 8/16/32-bit, 1-3 samples per pixel");
        }

        try {
            return decode_frame(compressed_data, params);
        } catch (const std::exception& e) {
            return make_decode_error(std::string("RLE decoding failed: ") + e.what());
        }
    }

private:
    [[nodiscard]] codec_result decode_frame(
        std::span<const uint8_t> compressed_data,
        const image_params& params) const {

        const uint8_t* header = compressed_data.data();

        const uint32_t num_segments = read_le32(header);
        const auto bytes_per_sample = params.bytes_per_sample();
        const auto expected_segments = params.samples_per_pixel * bytes_per_sample;
        if (num_segments != expected_segments) {
            return make_decode_error(
                "Segment count mismatch: expected " + std::to_string(expected_segments) +
                ", got " + std::to_string(num_segments));
        }

        std::vector<uint32_t> offsets(num_segments);
        for (uint32_t i = 0; i < num_segments; ++i) {
            offsets[i] = read_le32(header + 4 + i * 4);
            if (offsets[i] < kRLEHeaderSize || offsets[i] >= compressed_data.size() ||
                (i > 0 && offsets[i] < offsets[i - 1])) {
                return make_decode_error("Invalid segment offset: " +
                                         std::to_string(offsets[i]));
            }
        }

        const size_t pixels_per_frame = params.pixel_count();

        std::vector<std::vector<uint8_t>> decoded_segments(num_segments);
        for (uint32_t i = 0; i < num_segments; ++i) {
            const size_t end = i + 1 < num_segments ? offsets[i + 1] : compressed_data.size();
            decoded_segments[i] = decode_rle_segment(
                compressed_data.subspan(offsets[i], end - offsets[i]), pixels_per_frame);

            if (decoded_segments[i].size() != pixels_per_frame) {
                return make_decode_error(
                    "Segment " + std::to_string(i) + " decoded size mismatch: expected " +
                    std::to_string(pixels_per_frame) + ", got " +
                    std::to_string(decoded_segments[i].size()));
            }
        }

        // Segment (s * bytes_per_sample + b) holds byte b, most significant
        // first, of sample s; output is interleaved little endian
        std::vector<uint8_t> output(params.frame_size_bytes());
        const size_t spp = params.samples_per_pixel;
        for (size_t i = 0; i < pixels_per_frame; ++i) {
            for (size_t s = 0; s < spp; ++s) {
                const size_t base = (i * spp + s) * bytes_per_sample;
                for (size_t b = 0; b < bytes_per_sample; ++b) {
                    output[base + (bytes_per_sample - 1 - b)] =
                        decoded_segments[s * bytes_per_sample + b][i];
                }
            }
        }

        image_params output_params = params;
        output_params.planar_configuration = 0;
        if (output_params.bits_stored == 0) {
            output_params.bits_stored = params.bits_allocated;
        }
        output_params.high_bit = static_cast<uint16_t>(output_params.bits_stored - 1);

        return dcmx::ok<compression_result>(
            compression_result{std::move(output), output_params});
    }
};

rle_codec::rle_codec() : impl_(std::make_unique<impl>()) {}

rle_codec::~rle_codec() = default;

rle_codec::rle_codec(rle_codec&&) noexcept = default;

rle_codec& rle_codec::operator=(rle_codec&&) noexcept = default;

std::string_view rle_codec::transfer_syntax_uid() const noexcept {
    return kTransferSyntaxUID;
}

std::string_view rle_codec::name() const noexcept {
    return "RLE Lossless";
}

bool rle_codec::can_decode(const image_params& params) const noexcept {
    if (params.bits_allocated != 0 &&
        params.bits_allocated != 8 &&
        params.bits_allocated != 16 &&
        params.bits_allocated != 32) {
        return false;
    }
    if (params.samples_per_pixel != 0 &&
        (params.samples_per_pixel < 1 || params.samples_per_pixel > 3)) {
        return false;
    }
    return true;
}

codec_result rle_codec::decode(
    std::span<const uint8_t> compressed_data,
    const image_params& params) const {
    return impl_->decode(compressed_data, params);
}

}  // namespace dcmx::encoding::compression
