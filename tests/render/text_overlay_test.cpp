/**
 * @file text_overlay_test.cpp
 * @brief Unit tests for font resolution and the text overlay
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/render/font_resolver.hpp>
#include <dcmx/render/text_overlay.hpp>

#include "fixtures/temp_directory.hpp"

#include <algorithm>
#include <cstdlib>

using namespace dcmx::render;
using dcmx::test::temp_directory;

TEST_CASE("font_candidates ordering", "[render][font]") {
    const std::vector<std::filesystem::path> configured{"/opt/fonts/a.ttf"};

    SECTION("configured fonts come first") {
        ::unsetenv(kFontPathEnvironment);
        const auto candidates = font_candidates(configured, true, true);
        REQUIRE_FALSE(candidates.empty());
        CHECK(candidates.front() == "/opt/fonts/a.ttf");
        CHECK(candidates.size() == 1 + platform_font_candidates().size());
    }

    SECTION("the environment variable follows the configured fonts") {
        ::setenv(kFontPathEnvironment, "/env/font.ttf", 1);
        const auto candidates = font_candidates(configured, true, false);
        ::unsetenv(kFontPathEnvironment);

        CHECK(candidates == std::vector<std::filesystem::path>{"/opt/fonts/a.ttf",
                                                               "/env/font.ttf"});
    }

    SECTION("environment and platform lists can be disabled") {
        ::setenv(kFontPathEnvironment, "/env/font.ttf", 1);
        const auto candidates = font_candidates(configured, false, false);
        ::unsetenv(kFontPathEnvironment);

        CHECK(candidates == configured);
    }
}

TEST_CASE("resolve_font", "[render][font]") {
    temp_directory dir;

    SECTION("missing files are skipped silently") {
        auto resolution = resolve_font({dir / "missing.ttf"}, 14);
        CHECK(resolution.font == nullptr);
        CHECK(resolution.failures.empty());
    }

    SECTION("files that are not fonts are reported") {
        dcmx::test::write_text(dir / "fake.ttf", "definitely not a font");
        auto resolution = resolve_font({dir / "fake.ttf"}, 14);
        CHECK(resolution.font == nullptr);
        REQUIRE(resolution.failures.size() == 1);
        CHECK(resolution.failures.front().find("fake.ttf") != std::string::npos);
    }
}

TEST_CASE("font_face load errors", "[render][font]") {
    auto result = font_face::load("/nonexistent/font.ttf", 14);
    REQUIRE(result.is_err());
    CHECK(result.error().code == dcmx::error_codes::font_unavailable);
}

TEST_CASE("draw_overlay with a platform font", "[render][font]") {
    auto resolution = resolve_font(platform_font_candidates(), 14);
    if (!resolution.font) {
        SKIP("No platform font installed");
    }
    const auto& font = *resolution.font;
    CHECK(font.line_height() > 0);
    CHECK(font.ascender() > 0);

    SECTION("text is drawn in white on grayscale") {
        raster image{200, 120, 1};
        draw_overlay(image, font, {"Patient: DOE^JANE", "ID: PID-0001"}, 4);
        CHECK(std::any_of(image.pixels.begin(), image.pixels.end(),
                          [](uint8_t p) { return p > 128; }));
    }

    SECTION("color images get the same text on every channel") {
        raster image{200, 120, 3};
        draw_overlay(image, font, {"Modality: MR"}, 4);
        bool any_lit = false;
        for (size_t i = 0; i < image.pixels.size(); i += 3) {
            CHECK(image.pixels[i] == image.pixels[i + 1]);
            CHECK(image.pixels[i] == image.pixels[i + 2]);
            any_lit = any_lit || image.pixels[i] > 0;
        }
        CHECK(any_lit);
    }

    SECTION("text outside the image is clipped") {
        raster image{4, 4, 1};
        draw_overlay(image, font, {"a long line that does not fit"}, 2);
        CHECK(image.pixels.size() == 16);
    }
}
