/**
 * @file jpeg_baseline_codec.hpp
 * @brief JPEG Baseline (Process 1) decoder using libjpeg
 *
 * @see DICOM PS3.5 Section 8.2.1 - JPEG Image Compression
 */

#ifndef DCMX_ENCODING_COMPRESSION_JPEG_BASELINE_CODEC_HPP
#define DCMX_ENCODING_COMPRESSION_JPEG_BASELINE_CODEC_HPP

#include "dcmx/encoding/compression/compression_codec.hpp"

#include <memory>

namespace dcmx::encoding::compression {

/**
 * @brief Decoder for 8-bit JPEG Baseline frames.
 *
 * Color frames are returned as interleaved RGB regardless of the
 * photometric interpretation in the data set.
 */
class jpeg_baseline_codec final : public compression_codec {
public:
    /// DICOM Transfer Syntax UID for JPEG Baseline
    static constexpr std::string_view kTransferSyntaxUID = "1.2.840.10008.1.2.4.50";

    jpeg_baseline_codec();

    ~jpeg_baseline_codec() override;

    jpeg_baseline_codec(const jpeg_baseline_codec&) = delete;
    jpeg_baseline_codec& operator=(const jpeg_baseline_codec&) = delete;
    jpeg_baseline_codec(jpeg_baseline_codec&&) noexcept;
    jpeg_baseline_codec& operator=(jpeg_baseline_codec&&) noexcept;

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

#endif  // DCMX_ENCODING_COMPRESSION_JPEG_BASELINE_CODEC_HPP
