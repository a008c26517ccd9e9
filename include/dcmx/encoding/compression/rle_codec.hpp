/**
 * @file rle_codec.hpp
 * @brief RLE Lossless decoder
 *
 * @see DICOM PS3.5 Annex G - Encapsulated RLE Compressed Images
 */

#ifndef DCMX_ENCODING_COMPRESSION_RLE_CODEC_HPP
#define DCMX_ENCODING_COMPRESSION_RLE_CODEC_HPP

#include "dcmx/encoding/compression/compression_codec.hpp"

#include <memory>

namespace dcmx::encoding::compression {

/**
 * @brief Decoder for DICOM RLE Lossless frames.
 *
 * A frame starts with a 64-byte header: the segment count followed by 15
 * segment offsets. Each segment holds one byte plane (most significant
 * byte first) of one sample, PackBits encoded.
 */
class rle_codec final : public compression_codec {
public:
    /// DICOM Transfer Syntax UID for RLE Lossless
    static constexpr std::string_view kTransferSyntaxUID = "1.2.840.10008.1.2.5";

    /// Maximum number of RLE segments allowed by the RLE header
    static constexpr int kMaxSegments = 15;

    /// RLE header size (16 x 4-byte values)
    static constexpr size_t kRLEHeaderSize = 64;

    rle_codec();

    ~rle_codec() override;

    rle_codec(const rle_codec&) = delete;
    rle_codec& operator=(const rle_codec&) = delete;
    rle_codec(rle_codec&&) noexcept;
    rle_codec& operator=(rle_codec&&) noexcept;

    [[nodiscard]] std::string_view transfer_syntax_uid() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] bool can_decode(const image_params& params) const noexcept override;

    [[nodiscard]] codec_result decode(
        std::span<const uint8_t> compressed_data,
        const image_params& params) const override;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dcmx::encoding::compression

#endif  // DCMX_ENCODING_COMPRESSION_RLE_CODEC_HPP
