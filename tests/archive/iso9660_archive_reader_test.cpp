/**
 * @file iso9660_archive_reader_test.cpp
 * @brief Unit tests for the ISO 9660 image reader
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/archive/iso9660_archive_reader.hpp>

#include "fixtures/iso_builder.hpp"
#include "fixtures/temp_directory.hpp"

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

using namespace dcmx::archive;
using dcmx::test::iso_builder;
using dcmx::test::temp_directory;

namespace {

std::vector<std::string> paths_of(const archive_reader& reader) {
    std::vector<std::string> paths;
    for (const auto& entry : reader.entries()) {
        paths.push_back(entry.path);
    }
    return paths;
}

std::vector<uint8_t> filled(size_t count, uint8_t value) {
    return std::vector<uint8_t>(count, value);
}

// Hand-edits of built images. Without Joliet the root directory is sector
// 18 and subdirectories follow in insertion order.
constexpr uint32_t kRootSector = 18;

void put_both32(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
        p[7 - i] = p[i];
    }
}

std::size_t record_offset(const std::vector<uint8_t>& image, uint32_t lba,
                          const std::string& identifier) {
    std::size_t pos = static_cast<std::size_t>(lba) * iso_builder::kSector;
    while (image[pos] != 0) {
        if (image[pos + 32] == identifier.size() &&
            std::equal(identifier.begin(), identifier.end(), image.begin() + pos + 33)) {
            return pos;
        }
        pos += image[pos];
    }
    return pos;
}

void append_record(std::vector<uint8_t>& image, uint32_t lba, const std::vector<uint8_t>& record) {
    const auto pos = record_offset(image, lba, std::string(255, '?'));
    std::copy(record.begin(), record.end(), image.begin() + static_cast<std::ptrdiff_t>(pos));
}

uint32_t append_sector(std::vector<uint8_t>& image) {
    const auto lba = static_cast<uint32_t>(image.size() / iso_builder::kSector);
    image.resize(image.size() + iso_builder::kSector, 0);
    return lba;
}

}  // namespace

TEST_CASE("iso9660_archive_reader walks the tree depth first", "[archive][iso]") {
    temp_directory dir;
    iso_builder{}
        .add_file("DICOMDIR", filled(100, 1))
        .add_file("DICOM/S2/IM0001", filled(10, 2))
        .add_file("DICOM/S1/IM0002", filled(10, 3))
        .add_file("DICOM/S1/IM0001", filled(10, 4))
        .add_file("README.TXT", filled(5, 5))
        .write(dir / "disc.iso");

    auto reader = iso9660_archive_reader::open(dir / "disc.iso");
    REQUIRE(reader.is_ok());

    CHECK(paths_of(*reader.value()) == std::vector<std::string>{
                                           "DICOM/S1/IM0001",
                                           "DICOM/S1/IM0002",
                                           "DICOM/S2/IM0001",
                                           "DICOMDIR",
                                           "README.TXT",
                                       });
    CHECK(reader.value()->rejected().empty());
    CHECK_FALSE(reader.value()->has_rock_ridge());
    CHECK_FALSE(reader.value()->has_joliet());
}

TEST_CASE("iso9660_archive_reader reads file extents", "[archive][iso]") {
    temp_directory dir;
    std::vector<uint8_t> large(5000);
    for (size_t i = 0; i < large.size(); ++i) {
        large[i] = static_cast<uint8_t>(i * 7);
    }
    iso_builder{}.add_file("BIG.BIN", large).add_file("SMALL.BIN", {9, 8, 7}).write(dir / "d.iso");

    auto opened = iso9660_archive_reader::open(dir / "d.iso");
    REQUIRE(opened.is_ok());
    auto& reader = *opened.value();
    REQUIRE(reader.entries().size() == 2);

    const auto& big = reader.entries()[0];
    CHECK(big.path == "BIG.BIN");
    CHECK(big.size == 5000);

    auto data = reader.read_entry(big);
    REQUIRE(data.is_ok());
    CHECK(data.value() == large);

    auto prefix = reader.read_prefix(big, 132);
    REQUIRE(prefix.is_ok());
    CHECK(prefix.value().size() == 132);
    CHECK(prefix.value()[131] == large[131]);

    auto small = reader.read_entry(reader.entries()[1]);
    REQUIRE(small.is_ok());
    CHECK(small.value() == std::vector<uint8_t>{9, 8, 7});
}

TEST_CASE("iso9660_archive_reader records the recording time", "[archive][iso]") {
    temp_directory dir;
    iso_builder{}.add_file("IM1", {1}).write(dir / "t.iso");

    auto reader = iso9660_archive_reader::open(dir / "t.iso");
    REQUIRE(reader.is_ok());

    const auto& modified = reader.value()->entries().front().modified;
    REQUIRE(modified.has_value());

    const std::time_t t = std::chrono::system_clock::to_time_t(*modified);
    const std::tm utc = *std::gmtime(&t);
    CHECK(utc.tm_year == 124);
    CHECK(utc.tm_mon == 2);
    CHECK(utc.tm_mday == 5);
    CHECK(utc.tm_hour == 10);
    CHECK(utc.tm_min == 20);
    CHECK(utc.tm_sec == 30);
}

TEST_CASE("iso9660_archive_reader uses Rock Ridge names", "[archive][iso]") {
    temp_directory dir;
    iso_builder{}
        .rock_ridge()
        .add_file("DICOM/IM_0001.DCM", filled(4, 1), "image-0001.dcm")
        .add_file("DICOM/PLAIN.DCM", filled(4, 2))
        .write(dir / "rr.iso");

    auto reader = iso9660_archive_reader::open(dir / "rr.iso");
    REQUIRE(reader.is_ok());
    CHECK(reader.value()->has_rock_ridge());

    CHECK(paths_of(*reader.value()) == std::vector<std::string>{
                                           "DICOM/PLAIN.DCM",
                                           "DICOM/image-0001.dcm",
                                       });
}

TEST_CASE("iso9660_archive_reader notes a Joliet descriptor", "[archive][iso]") {
    temp_directory dir;
    iso_builder{}.joliet().add_file("IM1", {1}).write(dir / "j.iso");

    auto reader = iso9660_archive_reader::open(dir / "j.iso");
    REQUIRE(reader.is_ok());
    CHECK(reader.value()->has_joliet());
    CHECK(paths_of(*reader.value()) == std::vector<std::string>{"IM1"});
}

TEST_CASE("iso9660_archive_reader rejects non ISO files", "[archive][iso]") {
    temp_directory dir;

    SECTION("too small") {
        dcmx::test::write_text(dir / "small.iso", "tiny");
        auto reader = iso9660_archive_reader::open(dir / "small.iso");
        REQUIRE(reader.is_err());
        CHECK(reader.error().code == dcmx::error_codes::archive_open_error);
    }

    SECTION("no volume descriptor signature") {
        dcmx::test::write_file(dir / "blank.iso", std::vector<uint8_t>(40 * 2048, 0));
        auto reader = iso9660_archive_reader::open(dir / "blank.iso");
        REQUIRE(reader.is_err());
        CHECK(reader.error().code == dcmx::error_codes::archive_open_error);
    }
}

TEST_CASE("iso9660_archive_reader stops at directory loops", "[archive][iso]") {
    temp_directory dir;
    auto image = iso_builder{}.add_file("A/IM1", filled(4, 1)).bytes();
    // "A" (sector 19) gets a subdirectory pointing back at the root
    append_record(image, kRootSector + 1,
                  iso_builder::record("LOOP", kRootSector, iso_builder::kSector, true, {}));
    dcmx::test::write_file(dir / "loop.iso", image);

    auto reader = iso9660_archive_reader::open(dir / "loop.iso");
    REQUIRE(reader.is_ok());

    CHECK(paths_of(*reader.value()) == std::vector<std::string>{"A/IM1"});
    REQUIRE(reader.value()->rejected().size() == 1);
    CHECK(reader.value()->rejected().front() == "A/LOOP (directory loop)");
}

TEST_CASE("iso9660_archive_reader follows SUSP continuation areas", "[archive][iso]") {
    temp_directory dir;
    auto image = iso_builder{}.rock_ridge().add_file("IM_1.DCM", filled(6, 7)).bytes();

    // The NM entry of a second record lives in a continuation sector
    const auto area = append_sector(image);
    const auto nm = iso_builder::nm_entry("continued-name.dcm");
    std::copy(nm.begin(), nm.end(),
              image.begin() + static_cast<std::ptrdiff_t>(area * iso_builder::kSector));

    std::vector<uint8_t> ce(28, 0);
    ce[0] = 'C';
    ce[1] = 'E';
    ce[2] = 28;
    ce[3] = 1;
    put_both32(ce.data() + 4, area);
    put_both32(ce.data() + 12, 0);
    put_both32(ce.data() + 20, static_cast<uint32_t>(nm.size()));

    const auto file_lba = kRootSector + 1;
    append_record(image, kRootSector, iso_builder::record("CE_1.DCM;1", file_lba, 6, false, ce));
    dcmx::test::write_file(dir / "ce.iso", image);

    auto reader = iso9660_archive_reader::open(dir / "ce.iso");
    REQUIRE(reader.is_ok());
    CHECK(paths_of(*reader.value()) ==
          std::vector<std::string>{"IM_1.DCM", "continued-name.dcm"});

    auto data = reader.value()->read_entry(reader.value()->entries()[1]);
    REQUIRE(data.is_ok());
    CHECK(data.value() == filled(6, 7));
}

TEST_CASE("iso9660_archive_reader follows relocated directories", "[archive][iso]") {
    temp_directory dir;
    // Sectors: root 18, RR_MOVED 19, DEEP 20
    auto image = iso_builder{}.rock_ridge().add_file("RR_MOVED/DEEP/IM1", filled(3, 9)).bytes();
    constexpr uint32_t moved_lba = kRootSector + 1;
    constexpr uint32_t deep_lba = kRootSector + 2;

    // Mark the real DEEP record as relocated (RE)
    auto* moved = image.data() + static_cast<std::size_t>(moved_lba) * iso_builder::kSector;
    const auto dot = iso_builder::record(std::string(1, '\0'), moved_lba, iso_builder::kSector,
                                         true, {});
    const auto dotdot = iso_builder::record(std::string(1, '\1'), kRootSector,
                                            iso_builder::kSector, true, {});
    const auto relocated =
        iso_builder::record("DEEP", deep_lba, iso_builder::kSector, true, {'R', 'E', 4, 1});
    std::fill_n(moved, iso_builder::kSector, 0);
    moved = std::copy(dot.begin(), dot.end(), moved);
    moved = std::copy(dotdot.begin(), dotdot.end(), moved);
    std::copy(relocated.begin(), relocated.end(), moved);

    // Placeholder at the logical location links to it (CL)
    std::vector<uint8_t> cl{'C', 'L', 12, 1, 0, 0, 0, 0, 0, 0, 0, 0};
    put_both32(cl.data() + 4, deep_lba);
    append_record(image, kRootSector, iso_builder::record("DEEP", 0, 0, false, cl));
    dcmx::test::write_file(dir / "moved.iso", image);

    auto reader = iso9660_archive_reader::open(dir / "moved.iso");
    REQUIRE(reader.is_ok());
    CHECK(paths_of(*reader.value()) == std::vector<std::string>{"DEEP/IM1"});
    CHECK(reader.value()->rejected().empty());

    auto data = reader.value()->read_entry(reader.value()->entries().front());
    REQUIRE(data.is_ok());
    CHECK(data.value() == filled(3, 9));
}

TEST_CASE("iso9660_archive_reader rejects extents outside the image", "[archive][iso]") {
    temp_directory dir;
    auto image = iso_builder{}.add_file("IM1", filled(4, 1)).add_file("IM2", filled(4, 2)).bytes();
    const auto pos = record_offset(image, kRootSector, "IM1;1");
    put_both32(image.data() + pos + 10, 0xFFFFFFF0);
    dcmx::test::write_file(dir / "bad.iso", image);

    auto opened = iso9660_archive_reader::open(dir / "bad.iso");
    REQUIRE(opened.is_ok());
    auto& reader = *opened.value();
    REQUIRE(reader.entries().size() == 2);
    CHECK(reader.entries()[0].size == 0xFFFFFFF0);

    auto data = reader.read_entry(reader.entries()[0]);
    REQUIRE(data.is_err());
    CHECK(data.error().code == dcmx::error_codes::archive_read_error);

    auto prefix = reader.read_prefix(reader.entries()[0], 8192);
    REQUIRE(prefix.is_err());

    auto other = reader.read_entry(reader.entries()[1]);
    REQUIRE(other.is_ok());
    CHECK(other.value() == filled(4, 2));
}
