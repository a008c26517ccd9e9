/**
 * @file jpeg_baseline_codec_test.cpp
 * @brief Unit tests for the JPEG Baseline decoder
 */

#include <catch2/catch_test_macros.hpp>

#include "dcmx/encoding/compression/image_params.hpp"
#include "dcmx/encoding/compression/jpeg_baseline_codec.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

#include <jpeglib.h>

using namespace dcmx::encoding::compression;

namespace {

/**
 * @brief Compress an 8-bit image with libjpeg at high quality.
 */
std::vector<uint8_t> compress(const std::vector<uint8_t>& pixels, int width, int height,
                              int components) {
    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);

    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    jpeg_mem_dest(&cinfo, &buffer, &size);

    cinfo.image_width = static_cast<JDIMENSION>(width);
    cinfo.image_height = static_cast<JDIMENSION>(height);
    cinfo.input_components = components;
    cinfo.in_color_space = components == 3 ? JCS_RGB : JCS_GRAYSCALE;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 100, TRUE);

    jpeg_start_compress(&cinfo, TRUE);
    const int stride = width * components;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<unsigned char*>(pixels.data()) +
                       static_cast<size_t>(cinfo.next_scanline) * stride;
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);

    std::vector<uint8_t> out(buffer, buffer + size);
    jpeg_destroy_compress(&cinfo);
    std::free(buffer);
    return out;
}

std::vector<uint8_t> flat_image(int width, int height, int components, uint8_t value) {
    return std::vector<uint8_t>(static_cast<size_t>(width * height * components), value);
}

bool all_near(const std::vector<uint8_t>& data, int expected, int tolerance) {
    for (auto v : data) {
        if (std::abs(static_cast<int>(v) - expected) > tolerance) {
            return false;
        }
    }
    return true;
}

}  // namespace

TEST_CASE("jpeg_baseline_codec basic properties", "[encoding][compression][jpeg]") {
    jpeg_baseline_codec codec;

    CHECK(codec.transfer_syntax_uid() == "1.2.840.10008.1.2.4.50");

    image_params params;
    CHECK(codec.can_decode(params));  // unknown layout is taken from the header
    params.bits_allocated = 16;
    CHECK_FALSE(codec.can_decode(params));
}

TEST_CASE("jpeg_baseline_codec decodes grayscale", "[encoding][compression][jpeg]") {
    jpeg_baseline_codec codec;
    const auto jpeg = compress(flat_image(16, 8, 1, 120), 16, 8, 1);

    image_params params;
    params.width = 16;
    params.height = 8;
    params.photometric = photometric_interpretation::monochrome1;

    auto result = codec.decode(jpeg, params);

    REQUIRE(result.is_ok());
    const auto& out = result.value();
    CHECK(out.output_params.width == 16);
    CHECK(out.output_params.height == 8);
    CHECK(out.output_params.samples_per_pixel == 1);
    CHECK(out.output_params.photometric == photometric_interpretation::monochrome1);
    REQUIRE(out.data.size() == 16 * 8);
    CHECK(all_near(out.data, 120, 2));
}

TEST_CASE("jpeg_baseline_codec decodes color to RGB", "[encoding][compression][jpeg]") {
    jpeg_baseline_codec codec;
    const auto jpeg = compress(flat_image(8, 8, 3, 200), 8, 8, 3);

    auto result = codec.decode(jpeg, image_params{});

    REQUIRE(result.is_ok());
    const auto& out = result.value();
    CHECK(out.output_params.samples_per_pixel == 3);
    CHECK(out.output_params.photometric == photometric_interpretation::rgb);
    REQUIRE(out.data.size() == 8 * 8 * 3);
    CHECK(all_near(out.data, 200, 3));
}

TEST_CASE("jpeg_baseline_codec error handling", "[encoding][compression][jpeg]") {
    jpeg_baseline_codec codec;

    SECTION("empty data") {
        auto result = codec.decode({}, image_params{});
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::decode_error);
    }

    SECTION("not a JPEG stream") {
        const std::vector<uint8_t> garbage{0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
        auto result = codec.decode(garbage, image_params{});
        REQUIRE(result.is_err());
    }

    SECTION("dimensions disagree with the data set") {
        const auto jpeg = compress(flat_image(8, 8, 1, 50), 8, 8, 1);
        image_params params;
        params.width = 16;
        params.height = 8;
        auto result = codec.decode(jpeg, params);
        REQUIRE(result.is_err());
    }
}
