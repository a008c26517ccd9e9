/**
 * @file png_writer_test.cpp
 * @brief Unit tests for PNG output
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/render/png_writer.hpp>

#include "fixtures/png_inspect.hpp"
#include "fixtures/temp_directory.hpp"

using namespace dcmx::render;
using dcmx::test::temp_directory;

TEST_CASE("write_png grayscale with text chunks", "[render][png]") {
    temp_directory dir;
    raster image{3, 2, 1};
    image.pixels = {0, 50, 100, 150, 200, 250};

    auto written = write_png(dir / "gray.png", image,
                             {{"PatientID", "PID-0001"}, {"Modality", "MR"}});
    REQUIRE(written.is_ok());

    const auto info = dcmx::test::inspect_png(dir / "gray.png");
    REQUIRE(info.has_value());
    CHECK(info->width == 3);
    CHECK(info->height == 2);
    CHECK(info->bit_depth == 8);
    CHECK(info->color_type == 0);
    CHECK(info->text.at("PatientID") == "PID-0001");
    CHECK(info->text.at("Modality") == "MR");

    const auto pixels = dcmx::test::read_png_gray(dir / "gray.png");
    REQUIRE(pixels.has_value());
    CHECK(*pixels == image.pixels);
}

TEST_CASE("write_png RGB", "[render][png]") {
    temp_directory dir;
    raster image{2, 2, 3};
    *image.at(1, 1) = 255;

    REQUIRE(write_png(dir / "rgb.png", image).is_ok());

    const auto info = dcmx::test::inspect_png(dir / "rgb.png");
    REQUIRE(info.has_value());
    CHECK(info->color_type == 2);
    CHECK(info->text.empty());
}

TEST_CASE("write_png truncates long keywords", "[render][png]") {
    temp_directory dir;
    raster image{1, 1, 1};
    const std::string long_key(100, 'K');

    REQUIRE(write_png(dir / "k.png", image, {{long_key, "v"}}).is_ok());

    const auto info = dcmx::test::inspect_png(dir / "k.png");
    REQUIRE(info.has_value());
    REQUIRE(info->text.size() == 1);
    CHECK(info->text.begin()->first == std::string(79, 'K'));
}

TEST_CASE("write_png errors", "[render][png]") {
    temp_directory dir;

    SECTION("empty raster") {
        auto result = write_png(dir / "empty.png", raster{});
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::image_write_error);
    }

    SECTION("unsupported channel count") {
        auto result = write_png(dir / "two.png", raster{2, 2, 2});
        REQUIRE(result.is_err());
    }

    SECTION("missing directory") {
        auto result = write_png(dir / "no" / "such" / "dir.png", raster{1, 1, 1});
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::image_write_error);
    }
}
