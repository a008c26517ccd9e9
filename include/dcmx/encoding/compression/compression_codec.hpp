/**
 * @file compression_codec.hpp
 * @brief Abstract decoder interface for encapsulated pixel data
 *
 * @see DICOM PS3.5 Section 8.2 - Native or Encapsulated Format Encoding
 */

#ifndef DCMX_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP
#define DCMX_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP

#include "dcmx/encoding/compression/image_params.hpp"
#include <dcmx/core/result.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace dcmx::encoding::compression {

/**
 * @brief Decoded frame plus the parameters describing its layout.
 *
 * Output samples are always interleaved and little endian.
 */
struct compression_result {
    std::vector<uint8_t> data;

    /// May differ from the input parameters (e.g. JPEG color converted to RGB)
    image_params output_params;
};

using codec_result = dcmx::Result<compression_result>;

/**
 * @brief Decoder for one encapsulated transfer syntax.
 *
 * Decoders are stateless and const; one instance can decode any number
 * of frames.
 */
class compression_codec {
public:
    virtual ~compression_codec() = default;

    [[nodiscard]] virtual std::string_view transfer_syntax_uid() const noexcept = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Checks whether the codec can decode data with these parameters.
     */
    [[nodiscard]] virtual bool can_decode(const image_params& params) const noexcept = 0;

    /**
     * @brief Decode one frame.
     * @param compressed_data All fragments of the frame, concatenated
     * @param params Parameters taken from the data set
     * @return Decoded pixels, or decode_error
     */
    [[nodiscard]] virtual codec_result decode(
        std::span<const uint8_t> compressed_data,
        const image_params& params) const = 0;

protected:
    compression_codec() = default;
    compression_codec(const compression_codec&) = default;
    compression_codec& operator=(const compression_codec&) = default;
    compression_codec(compression_codec&&) = default;
    compression_codec& operator=(compression_codec&&) = default;
};

}  // namespace dcmx::encoding::compression

#endif  // DCMX_ENCODING_COMPRESSION_COMPRESSION_CODEC_HPP
