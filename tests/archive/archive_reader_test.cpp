/**
 * @file archive_reader_test.cpp
 * @brief Unit tests for archive detection and entry path normalization
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/archive/archive_reader.hpp>

#include "fixtures/iso_builder.hpp"
#include "fixtures/temp_directory.hpp"
#include "fixtures/zip_builder.hpp"

using namespace dcmx::archive;
using dcmx::test::iso_builder;
using dcmx::test::temp_directory;
using dcmx::test::zip_builder;

TEST_CASE("normalize_entry_path", "[archive][path]") {
    SECTION("plain relative paths are kept") {
        CHECK(normalize_entry_path("IM0001") == "IM0001");
        CHECK(normalize_entry_path("DICOM/S1/IM0001.dcm") == "DICOM/S1/IM0001.dcm");
    }

    SECTION("separators and dot components are folded") {
        CHECK(normalize_entry_path("/DICOM//S1/./IM1") == "DICOM/S1/IM1");
        CHECK(normalize_entry_path("DICOM\\S1\\IM1") == "DICOM/S1/IM1");
    }

    SECTION("parent references and empty names are rejected") {
        CHECK_FALSE(normalize_entry_path("../etc/passwd").has_value());
        CHECK_FALSE(normalize_entry_path("DICOM/../../x").has_value());
        CHECK_FALSE(normalize_entry_path("").has_value());
        CHECK_FALSE(normalize_entry_path("/./").has_value());
    }
}

TEST_CASE("detect_archive_kind", "[archive][detect]") {
    temp_directory dir;

    SECTION("by extension, case insensitive") {
        dcmx::test::write_text(dir / "a.ZIP", "x");
        dcmx::test::write_text(dir / "b.iso", "x");
        CHECK(detect_archive_kind(dir / "a.ZIP") == archive_kind::zip);
        CHECK(detect_archive_kind(dir / "b.iso") == archive_kind::iso9660);
    }

    SECTION("by signature when the extension is unknown") {
        zip_builder{}.add("x", {1, 2, 3}).write(dir / "study.bin");
        iso_builder{}.add_file("X.DCM", {1, 2}).write(dir / "disc.img");

        CHECK(detect_archive_kind(dir / "study.bin") == archive_kind::zip);
        CHECK(detect_archive_kind(dir / "disc.img") == archive_kind::iso9660);
    }

    SECTION("unknown content") {
        dcmx::test::write_text(dir / "notes.txt", "hello world");
        CHECK_FALSE(detect_archive_kind(dir / "notes.txt").has_value());
        CHECK_FALSE(detect_archive_kind(dir / "missing.dat").has_value());
    }
}

TEST_CASE("open_archive", "[archive][open]") {
    temp_directory dir;

    SECTION("dispatches on the detected kind") {
        zip_builder{}.add("IM1", {1, 2, 3}).write(dir / "study.zip");
        iso_builder{}.add_file("IM1.DCM", {1, 2}).write(dir / "disc.iso");

        auto zip = open_archive(dir / "study.zip");
        REQUIRE(zip.is_ok());
        CHECK(zip.value()->kind() == archive_kind::zip);
        CHECK(zip.value()->path() == dir / "study.zip");

        auto iso = open_archive(dir / "disc.iso");
        REQUIRE(iso.is_ok());
        CHECK(iso.value()->kind() == archive_kind::iso9660);
    }

    SECTION("missing file") {
        auto result = open_archive(dir / "nope.zip");
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::archive_open_error);
    }

    SECTION("directory instead of a file") {
        auto result = open_archive(dir.path());
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::archive_open_error);
    }

    SECTION("unrecognized content") {
        dcmx::test::write_text(dir / "plain.dat", "not an archive at all");
        auto result = open_archive(dir / "plain.dat");
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::archive_open_error);
    }

    SECTION("misnamed archives are opened by signature") {
        iso_builder{}.add_file("IM1.DCM", {1, 2}).write(dir / "disc.zip");
        zip_builder{}.add("IM1", {1, 2, 3}).write(dir / "study.iso");

        auto iso = open_archive(dir / "disc.zip");
        REQUIRE(iso.is_ok());
        CHECK(iso.value()->kind() == archive_kind::iso9660);
        CHECK(iso.value()->entries().size() == 1);

        auto zip = open_archive(dir / "study.iso");
        REQUIRE(zip.is_ok());
        CHECK(zip.value()->kind() == archive_kind::zip);
    }

    SECTION("zip extension over garbage") {
        dcmx::test::write_text(dir / "broken.zip", "this is not a zip file, just text");
        auto result = open_archive(dir / "broken.zip");
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmx::error_codes::archive_open_error);
    }
}

TEST_CASE("archive_entry base_name", "[archive][entry]") {
    archive_entry entry;
    entry.path = "DICOM/S1/IM0001";
    CHECK(entry.base_name() == "IM0001");

    entry.path = "IM0002";
    CHECK(entry.base_name() == "IM0002");
}
