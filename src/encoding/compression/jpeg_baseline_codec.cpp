#include "dcmx/encoding/compression/jpeg_baseline_codec.hpp"

#include <dcmx/core/result.hpp>

#include <csetjmp>
#include <cstdio>
#include <string>
#include <vector>

#include <jpeglib.h>
#include <jerror.h>

namespace dcmx::encoding::compression {

namespace {

/**
 * @brief libjpeg error manager that longjmps back into the decoder.
 */
struct jpeg_error_handler {
    jpeg_error_mgr pub;          // Public fields (must be first)
    jmp_buf setjmp_buffer;
    std::string error_message;
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<jpeg_error_handler*>(cinfo->err);

    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    err->error_message = buffer;

    std::longjmp(err->setjmp_buffer, 1);
}

void jpeg_output_message([[maybe_unused]] j_common_ptr cinfo) {
    // Warnings are not reported
}

/**
 * @brief RAII wrapper for jpeg_decompress_struct.
 */
class jpeg_decompressor {
public:
    jpeg_decompressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;

        jpeg_create_decompress(&cinfo_);
    }

    ~jpeg_decompressor() {
        jpeg_destroy_decompress(&cinfo_);
    }

    jpeg_decompressor(const jpeg_decompressor&) = delete;
    jpeg_decompressor& operator=(const jpeg_decompressor&) = delete;

    jpeg_decompress_struct* operator->() { return &cinfo_; }
    jpeg_decompress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

private:
    jpeg_decompress_struct cinfo_{};
    jpeg_error_handler jerr_{};
};

codec_result make_decode_error(const std::string& message) {
    return dcmx::dcmx_error<compression_result>(dcmx::error_codes::decode_error, message);
}

/**
 * @brief Run libjpeg over @p data into @p output.
 *
 * Holds the setjmp point; nothing with a destructor lives in this frame,
 * so a longjmp from libjpeg skips no cleanup.
 *
 * @return false if libjpeg reported an error
 */
bool run_decompress(jpeg_decompressor& decompressor, std::span<const uint8_t> data,
                    std::vector<uint8_t>& output) {
    if (setjmp(decompressor.error().setjmp_buffer)) {
        return false;
    }

    jpeg_mem_src(&decompressor.get(),
                 const_cast<unsigned char*>(data.data()),
                 static_cast<unsigned long>(data.size()));

    jpeg_read_header(&decompressor.get(), TRUE);

    if (decompressor->num_components == 3) {
        decompressor->out_color_space = JCS_RGB;
    }

    jpeg_start_decompress(&decompressor.get());

    const JDIMENSION row_stride = decompressor->output_width *
                                  static_cast<JDIMENSION>(decompressor->output_components);
    output.resize(static_cast<size_t>(row_stride) * decompressor->output_height);

    while (decompressor->output_scanline < decompressor->output_height) {
        JSAMPROW row = output.data() +
                       static_cast<size_t>(decompressor->output_scanline) * row_stride;
        jpeg_read_scanlines(&decompressor.get(), &row, 1);
    }

    jpeg_finish_decompress(&decompressor.get());
    return true;
}

}  // namespace

/**
 * @brief PIMPL implementation for jpeg_baseline_codec.
 */
class jpeg_baseline_codec::impl {
public:
    [[nodiscard]] codec_result decode(
        std::span<const uint8_t> compressed_data,
        const image_params& params) const {

        if (compressed_data.empty()) {
            return make_decode_error("Empty compressed data");
        }

        jpeg_decompressor decompressor;
        std::vector<uint8_t> output;

        if (!run_decompress(decompressor, compressed_data, output)) {
            return make_decode_error(
                "JPEG decompression failed: " + decompressor.error().error_message);
        }

        if (params.width > 0 && decompressor->output_width != params.width) {
            return make_decode_error(
                "Image width mismatch: expected " + std::to_string(params.width) +
                ", got " + std::to_string(decompressor->output_width));
        }
        if (params.height > 0 && decompressor->output_height != params.height) {
            return make_decode_error(
                "Image height mismatch: expected " + std::to_string(params.height) +
                ", got " + std::to_string(decompressor->output_height));
        }

        image_params output_params;
        output_params.width = static_cast<uint16_t>(decompressor->output_width);
        output_params.height = static_cast<uint16_t>(decompressor->output_height);
        output_params.bits_allocated = 8;
        output_params.bits_stored = 8;
        output_params.high_bit = 7;
        output_params.samples_per_pixel =
            static_cast<uint16_t>(decompressor->output_components);
        output_params.planar_configuration = 0;
        output_params.pixel_representation = 0;

        if (output_params.samples_per_pixel == 1) {
            output_params.photometric =
                params.photometric == photometric_interpretation::monochrome1
                    ? photometric_interpretation::monochrome1
                    : photometric_interpretation::monochrome2;
        } else {
            output_params.photometric = photometric_interpretation::rgb;
        }

        return dcmx::ok<compression_result>(
            compression_result{std::move(output), output_params});
    }
};

jpeg_baseline_codec::jpeg_baseline_codec()
    : impl_(std::make_unique<impl>()) {}

jpeg_baseline_codec::~jpeg_baseline_codec() = default;

jpeg_baseline_codec::jpeg_baseline_codec(jpeg_baseline_codec&&) noexcept = default;

jpeg_baseline_codec& jpeg_baseline_codec::operator=(jpeg_baseline_codec&&) noexcept = default;

std::string_view jpeg_baseline_codec::transfer_syntax_uid() const noexcept {
    return kTransferSyntaxUID;
}

std::string_view jpeg_baseline_codec::name() const noexcept {
    return "JPEG Baseline (Process 1)";
}

bool jpeg_baseline_codec::can_decode(const image_params& params) const noexcept {
    // Zero means "not known yet"; the JPEG header supplies it
    if (params.bits_allocated != 0 && params.bits_allocated != 8) return false;
    if (params.samples_per_pixel != 0 &&
        params.samples_per_pixel != 1 &&
        params.samples_per_pixel != 3) {
        return false;
    }
    return true;
}

codec_result jpeg_baseline_codec::decode(
    std::span<const uint8_t> compressed_data,
    const image_params& params) const {
    return impl_->decode(compressed_data, params);
}

}  // namespace dcmx::encoding::compression
