/**
 * @file exporter_test.cpp
 * @brief End-to-end tests for extraction and rendering
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/exporter.hpp>

#include "fixtures/dicom_builder.hpp"
#include "fixtures/iso_builder.hpp"
#include "fixtures/png_inspect.hpp"
#include "fixtures/temp_directory.hpp"
#include "fixtures/zip_builder.hpp"
#include "mocks/mock_logger.hpp"

#include <cstdint>
#include <memory>
#include <string>

using dcmx::test::iso_builder;
using dcmx::test::temp_directory;
using dcmx::test::zip_builder;

namespace {

std::vector<uint8_t> image(int series, double slice, int instance) {
    dcmx::test::image_fields fields;
    fields.series_number = series;
    fields.series_description = series == 1 ? "AX T1" : "COR T2";
    fields.slice_location = slice;
    fields.instance_number = instance;
    fields.sop_instance_uid = "1.2.826.0.1.3680043.2.1125." + std::to_string(series) + "." +
                            std::to_string(instance);
    return dcmx::test::make_image_bytes(fields);
}

dcmx::render_options plain_render() {
    dcmx::render_options options;
    options.renderer.overlay = false;
    return options;
}

std::string read_text(const std::filesystem::path& path) {
    const auto bytes = dcmx::test::read_file(path);
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace

TEST_CASE("extract and render a ZIP archive", "[exporter][zip]") {
    temp_directory dir;
    zip_builder{}
        .add("DICOMDIR", dcmx::test::make_dicomdir_bytes())
        .add("DICOM/S2/IM0001", image(2, 5.0, 1), true)
        .add("DICOM/S1/IM0002", image(1, 10.0, 2), true)
        .add("DICOM/S1/IM0003", image(1, -10.0, 3))
        .add("README.TXT", dcmx::test::make_text_bytes())
        .write(dir / "study.zip");

    dcmx::extract_options options;
    options.archive = dir / "study.zip";

    auto logger = std::make_shared<dcmx::test::mock_logger>();
    const auto report = dcmx::extract_archive(options, logger);

    REQUIRE(dcmx::to_exit_status(report) == dcmx::exit_status::success);
    CHECK(report.destination == dir / "study_zip");
    CHECK(report.destination_derived);
    CHECK(report.counts().written == 4);
    CHECK(report.counts().not_dicom == 1);
    CHECK(dcmx::test::file_names(dir / "study_zip") ==
          std::vector<std::string>{"DICOMDIR", "IM0001", "IM0002", "IM0003"});

    const auto gallery = dcmx::render_gallery(report, plain_render(), logger);

    CHECK(gallery.error.empty());
    CHECK(gallery.export_directory == dir / "study_zip_export");
    CHECK(gallery.counts().rendered == 3);
    CHECK(gallery.counts().no_image == 1);
    CHECK(gallery.counts().failed == 0);
    CHECK(dcmx::test::file_names(dir / "study_zip_export") ==
          std::vector<std::string>{"IM0001.png", "IM0002.png", "IM0003.png", "index.html"});

    REQUIRE(gallery.series.size() == 2);
    CHECK(gallery.series[0].key.title() == "Series 1 - AX T1");
    REQUIRE(gallery.series[0].images.size() == 2);
    CHECK(gallery.series[0].images[0].image.filename() == "IM0003.png");
    CHECK(gallery.series[1].key.title() == "Series 2 - COR T2");

    const auto html = read_text(gallery.document);
    CHECK(html.find("IM0003.png") < html.find("IM0002.png"));
    CHECK(html.find("IM0002.png") < html.find("IM0001.png"));

    const auto info = dcmx::test::inspect_png(dir / "study_zip_export" / "IM0002.png");
    REQUIRE(info.has_value());
    CHECK(info->text.at("SliceLocation") == "10");
}

TEST_CASE("extract and render an ISO image", "[exporter][iso]") {
    temp_directory dir;
    iso_builder{}
        .rock_ridge()
        .add_file("DICOMDIR", dcmx::test::make_dicomdir_bytes())
        .add_file("DICOM/ST1/SE1/IM1", image(1, 0.0, 1), "image-1.dcm")
        .add_file("DICOM/ST1/SE1/IM2", image(1, 1.0, 2), "image-2.dcm")
        .write(dir / "disc.iso");

    dcmx::extract_options options;
    options.archive = dir / "disc.iso";
    options.destination = dir / "out";

    const auto report = dcmx::extract_archive(options);

    REQUIRE(dcmx::to_exit_status(report) == dcmx::exit_status::success);
    CHECK_FALSE(report.destination_derived);
    CHECK(dcmx::test::file_names(dir / "out") ==
          std::vector<std::string>{"DICOMDIR", "image-1.dcm", "image-2.dcm"});
    CHECK(dcmx::export_directory(report) == dir / "out" / "export");

    const auto gallery = dcmx::render_gallery(report, plain_render());
    CHECK(gallery.counts().rendered == 2);
    CHECK(dcmx::test::file_names(dir / "out" / "export") ==
          std::vector<std::string>{"image-1.png", "image-2.png", "index.html"});
}

TEST_CASE("records sharing a stem render to separate images", "[exporter][render]") {
    temp_directory dir;
    zip_builder{}
        .add("A/IM0001", image(1, 0.0, 1))
        .add("B/IM0001.dcm", image(1, 1.0, 2))
        .write(dir / "study.zip");

    dcmx::extract_options options;
    options.archive = dir / "study.zip";
    const auto report = dcmx::extract_archive(options);
    REQUIRE(report.counts().written == 2);

    const auto gallery = dcmx::render_gallery(report, plain_render());

    CHECK(gallery.counts().rendered == 2);
    CHECK(dcmx::test::file_names(dir / "study_zip_export") ==
          std::vector<std::string>{"IM0001.png", "IM0001_1.png", "index.html"});
    REQUIRE(gallery.series.size() == 1);
    REQUIRE(gallery.series[0].images.size() == 2);
    CHECK(gallery.series[0].images[0].image != gallery.series[0].images[1].image);
}

TEST_CASE("re-running on a populated destination", "[exporter][cache]") {
    temp_directory dir;
    zip_builder{}.add("IM0001", image(1, 0.0, 1)).write(dir / "study.zip");

    dcmx::extract_options options;
    options.archive = dir / "study.zip";

    const auto first = dcmx::extract_archive(options);
    REQUIRE(first.counts().written == 1);
    const auto before = std::filesystem::last_write_time(dir / "study_zip" / "IM0001");

    const auto second = dcmx::extract_archive(options);

    CHECK(dcmx::to_exit_status(second) == dcmx::exit_status::success);
    CHECK(second.cache_hit);
    CHECK(second.counts().skipped_existing == 1);
    CHECK(std::filesystem::last_write_time(dir / "study_zip" / "IM0001") == before);

    // The existing files are still rendered
    const auto gallery = dcmx::render_gallery(second, plain_render());
    CHECK(gallery.counts().rendered == 1);
}

TEST_CASE("a member with a corrupt size field fails on its own", "[exporter][zip]") {
    temp_directory dir;
    zip_builder{}
        .add_zip64("IM0001", image(1, 0.0, 1), true, std::uint64_t{1} << 62)
        .add("IM0002", image(1, 1.0, 2), true)
        .write(dir / "study.zip");

    dcmx::extract_options options;
    options.archive = dir / "study.zip";
    const auto report = dcmx::extract_archive(options);

    CHECK(report.error.empty());
    CHECK(report.counts().failed == 1);
    CHECK(report.counts().written == 1);
    CHECK(dcmx::test::file_names(dir / "study_zip") == std::vector<std::string>{"IM0002"});
}

TEST_CASE("exit status mapping", "[exporter][status]") {
    temp_directory dir;

    SECTION("archive without DICOM records") {
        zip_builder{}.add("README.TXT", dcmx::test::make_text_bytes()).write(dir / "docs.zip");

        dcmx::extract_options options;
        options.archive = dir / "docs.zip";
        const auto report = dcmx::extract_archive(options);

        CHECK(dcmx::to_exit_status(report) == dcmx::exit_status::no_qualifying_records);
        CHECK(static_cast<int>(dcmx::to_exit_status(report)) == 2);
    }

    SECTION("unreadable archive") {
        dcmx::test::write_text(dir / "broken.zip", "no zip here");

        dcmx::extract_options options;
        options.archive = dir / "broken.zip";
        auto logger = std::make_shared<dcmx::test::mock_logger>();
        const auto report = dcmx::extract_archive(options, logger);

        CHECK(dcmx::to_exit_status(report) == dcmx::exit_status::archive_unreadable);
        CHECK(static_cast<int>(dcmx::to_exit_status(report)) == 3);
        CHECK_FALSE(report.error.empty());
        CHECK(logger->count(dcmx::integration::log_level::error) == 1);
        CHECK_FALSE(std::filesystem::exists(dir / "broken_zip"));
    }

    SECTION("missing archive") {
        dcmx::extract_options options;
        options.archive = dir / "missing.iso";
        CHECK(dcmx::to_exit_status(dcmx::extract_archive(options)) ==
              dcmx::exit_status::archive_unreadable);
    }
}

TEST_CASE("render with an explicit export directory", "[exporter][render]") {
    temp_directory dir;
    zip_builder{}.add("IM0001", image(1, 0.0, 1)).write(dir / "study.zip");

    dcmx::extract_options options;
    options.archive = dir / "study.zip";
    const auto report = dcmx::extract_archive(options);

    auto render_opts = plain_render();
    render_opts.export_directory = dir / "gallery";
    const auto gallery = dcmx::render_gallery(report, render_opts);

    CHECK(gallery.document == dir / "gallery" / "index.html");
    CHECK(std::filesystem::exists(dir / "gallery" / "IM0001.png"));
    CHECK_FALSE(std::filesystem::exists(dir / "study_zip_export"));
}
