/**
 * @file vr_type_test.cpp
 * @brief Unit tests for VR codes and classification
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmx/encoding/vr_type.hpp>

using namespace dcmx::encoding;

TEST_CASE("vr_type string conversion", "[encoding][vr_type]") {
    CHECK(to_string(vr_type::PN) == "PN");
    CHECK(to_string(vr_type::OW) == "OW");
    CHECK(to_string(static_cast<vr_type>(0x0000)) == "??");

    CHECK(from_string("US") == vr_type::US);
    CHECK(from_string("SQ") == vr_type::SQ);
    CHECK_FALSE(from_string("XX").has_value());
    CHECK_FALSE(from_string("U").has_value());
    CHECK_FALSE(from_string("USS").has_value());
}

TEST_CASE("vr_type classification", "[encoding][vr_type]") {
    CHECK(is_string_vr(vr_type::DS));
    CHECK(is_string_vr(vr_type::UI));
    CHECK_FALSE(is_string_vr(vr_type::OB));

    CHECK(is_numeric_vr(vr_type::US));
    CHECK(is_numeric_vr(vr_type::FD));
    CHECK_FALSE(is_numeric_vr(vr_type::IS));

    CHECK(has_explicit_32bit_length(vr_type::OB));
    CHECK(has_explicit_32bit_length(vr_type::SQ));
    CHECK(has_explicit_32bit_length(vr_type::UT));
    CHECK_FALSE(has_explicit_32bit_length(vr_type::US));
    CHECK_FALSE(has_explicit_32bit_length(vr_type::LO));
}

TEST_CASE("vr_type swap units and padding", "[encoding][vr_type]") {
    STATIC_REQUIRE(swap_unit(vr_type::US) == 2);
    STATIC_REQUIRE(swap_unit(vr_type::OW) == 2);
    STATIC_REQUIRE(swap_unit(vr_type::FL) == 4);
    STATIC_REQUIRE(swap_unit(vr_type::FD) == 8);
    STATIC_REQUIRE(swap_unit(vr_type::OB) == 0);
    STATIC_REQUIRE(swap_unit(vr_type::LO) == 0);

    STATIC_REQUIRE(padding_char(vr_type::UI) == '\0');
    STATIC_REQUIRE(padding_char(vr_type::PN) == ' ');
    STATIC_REQUIRE(padding_char(vr_type::OB) == '\0');
}
