/**
 * @file pixel_decoder.hpp
 * @brief First-frame pixel decoding and display normalization
 *
 * @see DICOM PS3.5 Section 8 - Encoding of Pixel, Overlay and Waveform Data
 */

#pragma once

#include "dcmx/render/raster.hpp"

#include <dcmx/core/dicom_file.hpp>
#include <dcmx/core/result.hpp>
#include <dcmx/encoding/compression/compression_codec.hpp>
#include <dcmx/encoding/compression/image_params.hpp>

namespace dcmx::render {

/**
 * @brief Read the Image Pixel Module attributes of @p dataset.
 *
 * Missing Bits Stored defaults to Bits Allocated, Samples per Pixel to 1.
 *
 * @return The parameters, or decode_error if rows, columns or bits
 *         allocated are missing or the combination is not supported
 */
[[nodiscard]] auto read_image_params(const core::dicom_dataset& dataset)
    -> dcmx::Result<encoding::compression::image_params>;

/**
 * @brief Decode the first frame of @p file.
 *
 * Native data is copied (planar configuration 1 is interleaved);
 * encapsulated data goes through codec_factory. The result is always
 * interleaved little endian samples.
 *
 * @return The frame, element_not_found if there is no Pixel Data, or
 *         decode_error
 */
[[nodiscard]] auto decode_first_frame(const core::dicom_file& file)
    -> dcmx::Result<encoding::compression::compression_result>;

/**
 * @brief Convert a decoded frame to an 8-bit raster.
 *
 * Samples are masked to Bits Stored and sign extended, YBR_FULL is
 * converted to RGB, then all samples are stretched linearly so the
 * minimum maps to 0 and the maximum to 255 (a flat frame maps to 0).
 * MONOCHROME1 is inverted after stretching.
 */
[[nodiscard]] auto to_display_raster(const encoding::compression::compression_result& frame)
    -> dcmx::Result<raster>;

}  // namespace dcmx::render
