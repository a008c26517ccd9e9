/**
 * @file dicom_dataset_test.cpp
 * @brief Unit tests for dicom_dataset
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <dcmx/core/dicom_dataset.hpp>
#include <dcmx/core/dicom_tag_constants.hpp>

#include <vector>

using namespace dcmx::core;
using dcmx::encoding::vr_type;

TEST_CASE("dicom_dataset element access", "[core][dicom_dataset]") {
    dicom_dataset ds;
    ds.set_string(tags::patient_name, vr_type::PN, "DOE^JANE");
    ds.set_string(tags::patient_id, vr_type::LO, "   ");
    ds.set_numeric<uint16_t>(tags::rows, vr_type::US, 256);

    SECTION("contains and get") {
        CHECK(ds.contains(tags::patient_name));
        CHECK_FALSE(ds.contains(tags::modality));
        CHECK(ds.get(tags::modality) == nullptr);
        REQUIRE(ds.get(tags::rows) != nullptr);
        CHECK(ds.get(tags::rows)->vr() == vr_type::US);
    }

    SECTION("get_string falls back to the default") {
        CHECK(ds.get_string(tags::patient_name) == "DOE^JANE");
        CHECK(ds.get_string(tags::modality, "n/a") == "n/a");
    }

    SECTION("find_string treats blank values as absent") {
        CHECK(ds.find_string(tags::patient_name) == "DOE^JANE");
        CHECK_FALSE(ds.find_string(tags::patient_id).has_value());
        CHECK_FALSE(ds.find_string(tags::modality).has_value());
    }

    SECTION("numeric and decimal access") {
        CHECK(ds.get_numeric<uint16_t>(tags::rows) == 256);
        CHECK_FALSE(ds.get_numeric<uint16_t>(tags::columns).has_value());
        CHECK(ds.get_decimal(tags::rows).value() == Catch::Approx(256.0));
    }
}

TEST_CASE("dicom_dataset modification", "[core][dicom_dataset]") {
    dicom_dataset ds;
    CHECK(ds.empty());

    ds.set_string(tags::modality, vr_type::CS, "CT");
    ds.set_string(tags::modality, vr_type::CS, "MR");
    CHECK(ds.size() == 1);
    CHECK(ds.get_string(tags::modality) == "MR");

    CHECK(ds.remove(tags::modality));
    CHECK_FALSE(ds.remove(tags::modality));
    CHECK(ds.empty());
}

TEST_CASE("dicom_dataset iterates in tag order", "[core][dicom_dataset]") {
    dicom_dataset ds;
    ds.set_string(tags::patient_id, vr_type::LO, "1");
    ds.set_string(tags::study_date, vr_type::DA, "20240101");
    ds.set_string(tags::patient_name, vr_type::PN, "A");

    std::vector<dicom_tag> order;
    for (const auto& [tag, element] : ds) {
        order.push_back(tag);
    }
    CHECK(order == std::vector<dicom_tag>{tags::study_date, tags::patient_name, tags::patient_id});
}
