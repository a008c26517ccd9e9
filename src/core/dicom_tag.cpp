/**
 * @file dicom_tag.cpp
 * @brief Implementation of dicom_tag formatting
 */

#include "dcmx/core/dicom_tag.hpp"

#include <array>

namespace dcmx::core {

auto dicom_tag::to_string() const -> std::string {
    static constexpr std::array<char, 16> hex_digits = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

    std::string result = "(0000,0000)";
    const auto grp = group();
    const auto elem = element();
    for (int i = 0; i < 4; ++i) {
        result[4 - i] = hex_digits[(grp >> (i * 4)) & 0xF];
        result[9 - i] = hex_digits[(elem >> (i * 4)) & 0xF];
    }
    return result;
}

}  // namespace dcmx::core
