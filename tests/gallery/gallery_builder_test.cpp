/**
 * @file gallery_builder_test.cpp
 * @brief Unit tests for series grouping and the HTML gallery
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/gallery/gallery_builder.hpp>

#include "fixtures/temp_directory.hpp"

#include <optional>
#include <string>

using namespace dcmx::gallery;
using dcmx::render::metadata_value;

namespace {

rendered_image make_image(std::string file, std::size_t order, std::optional<int> series,
                          std::optional<double> slice, std::optional<int> instance,
                          std::string description = "AX T1") {
    rendered_image image;
    image.image = std::filesystem::path{"/export"} / file;
    image.order = order;
    image.metadata.patient_name = metadata_value<std::string>{"DOE^JANE"};
    image.metadata.patient_id = metadata_value<std::string>{"PID-0001"};
    image.metadata.study_date = metadata_value<std::string>{"20240305"};
    if (series) {
        image.metadata.series_number = metadata_value<int>{*series};
    }
    if (!description.empty()) {
        image.metadata.series_description = metadata_value<std::string>{std::move(description)};
    }
    if (slice) {
        image.metadata.slice_location = metadata_value<double>{*slice};
    }
    if (instance) {
        image.metadata.instance_number = metadata_value<int>{*instance};
    }
    return image;
}

std::vector<std::string> file_order(const gallery_series& series) {
    std::vector<std::string> names;
    for (const auto& image : series.images) {
        names.push_back(image.image.filename().string());
    }
    return names;
}

}  // namespace

TEST_CASE("gallery_builder groups images by series", "[gallery][group]") {
    std::vector<rendered_image> images{
        make_image("a.png", 0, 2, 10.0, 1),
        make_image("b.png", 1, 1, 20.0, 1),
        make_image("c.png", 2, std::nullopt, 0.0, 1),
        make_image("d.png", 3, 1, 10.0, 2),
    };

    const auto series = gallery_builder::group(images);

    REQUIRE(series.size() == 3);
    CHECK(series[0].key.title() == "Series 1 - AX T1");
    CHECK(series[1].key.title() == "Series 2 - AX T1");
    CHECK(series[2].key.title() == "Series unknown - AX T1");
    CHECK(file_order(series[0]) == std::vector<std::string>{"d.png", "b.png"});
}

TEST_CASE("gallery_builder orders series by number then description", "[gallery][group]") {
    std::vector<rendered_image> images{
        make_image("a.png", 0, 1, 1.0, 1, "SAG"),
        make_image("b.png", 1, 1, 1.0, 1, "AX"),
        make_image("c.png", 2, 1, 1.0, 1, ""),
    };

    const auto series = gallery_builder::group(images);

    REQUIRE(series.size() == 3);
    CHECK(series[0].key.description.to_string() == "AX");
    CHECK(series[1].key.description.to_string() == "SAG");
    CHECK_FALSE(series[2].key.description.is_known());
}

TEST_CASE("gallery_builder orders images within a series", "[gallery][group]") {
    SECTION("slice location, then instance number, unknown last") {
        std::vector<rendered_image> images{
            make_image("none.png", 0, 1, std::nullopt, 1),
            make_image("s20.png", 1, 1, 20.0, 1),
            make_image("s-5.png", 2, 1, -5.0, 9),
            make_image("s20i0.png", 3, 1, 20.0, 0),
            make_image("s20u.png", 4, 1, 20.0, std::nullopt),
        };

        const auto series = gallery_builder::group(images);
        REQUIRE(series.size() == 1);
        CHECK(file_order(series[0]) == std::vector<std::string>{
                                           "s-5.png", "s20i0.png", "s20.png", "s20u.png",
                                           "none.png"});
    }

    SECTION("ties keep the input order") {
        std::vector<rendered_image> images{
            make_image("third.png", 7, 1, 5.0, 1),
            make_image("first.png", 2, 1, 5.0, 1),
            make_image("second.png", 4, 1, 5.0, 1),
        };

        const auto series = gallery_builder::group(images);
        REQUIRE(series.size() == 1);
        CHECK(file_order(series[0]) ==
              std::vector<std::string>{"first.png", "second.png", "third.png"});
    }
}

TEST_CASE("gallery_builder escaping", "[gallery][html]") {
    CHECK(gallery_builder::html_escape(R"(<b>"O'Neil" & co</b>)") ==
          "&lt;b&gt;&quot;O&#39;Neil&quot; &amp; co&lt;/b&gt;");
    CHECK(gallery_builder::html_escape("plain") == "plain");

    CHECK(gallery_builder::url_escape("IM0001.png") == "IM0001.png");
    CHECK(gallery_builder::url_escape("my image#1.png") == "my%20image%231.png");
}

TEST_CASE("gallery_builder HTML document", "[gallery][html]") {
    SECTION("header, sections and viewer") {
        auto hostile = make_image("x<1>.png", 1, 3, 1.0, 1, "<script>alert(1)</script>");
        auto first = make_image("IM0001.png", 0, 1, 1.0, 1);
        first.metadata.patient_name = metadata_value<std::string>{"O'BRIEN^PAT"};

        const auto html = gallery_builder::to_html(gallery_builder::group({hostile, first}));

        CHECK(html.find("<!DOCTYPE html>") == 0);
        CHECK(html.find("O&#39;BRIEN^PAT") != std::string::npos);
        CHECK(html.find("PID-0001") != std::string::npos);
        CHECK(html.find("20240305") != std::string::npos);
        CHECK(html.find("<script>alert(1)</script>") == std::string::npos);
        CHECK(html.find("Series 3 - &lt;script&gt;") != std::string::npos);
        CHECK(html.find("data-src=\"x%3C1%3E.png\"") != std::string::npos);
        CHECK(html.find("data-src=\"IM0001.png\"") != std::string::npos);
        CHECK(html.find("id=\"viewer\"") != std::string::npos);
        CHECK(html.find("ArrowRight") != std::string::npos);
        CHECK(html.find("Escape") != std::string::npos);

        // Series 1 precedes series 3
        CHECK(html.find("Series 1 - AX T1") < html.find("Series 3 - "));
    }

    SECTION("empty gallery") {
        const auto html = gallery_builder::to_html({});
        CHECK(html.find("No images were rendered.") != std::string::npos);
        CHECK(html.find("<dd>unknown</dd>") != std::string::npos);
    }
}

TEST_CASE("gallery_builder write", "[gallery][html]") {
    dcmx::test::temp_directory dir;

    SECTION("writes index.html") {
        auto result = gallery_builder::write(dir.path(),
                                             gallery_builder::group({make_image("a.png", 0, 1, 1.0, 1)}));
        REQUIRE(result.is_ok());
        CHECK(result.value() == dir / "index.html");

        const auto bytes = dcmx::test::read_file(dir / "index.html");
        const std::string html(bytes.begin(), bytes.end());
        CHECK(html.find("a.png") != std::string::npos);
    }

    SECTION("missing export directory") {
        auto result = gallery_builder::write(dir / "missing", {});
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::gallery_write_error);
    }
}
