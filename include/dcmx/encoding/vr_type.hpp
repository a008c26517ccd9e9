/**
 * @file vr_type.hpp
 * @brief DICOM Value Representation codes and classification helpers
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */

#ifndef DCMX_ENCODING_VR_TYPE_HPP
#define DCMX_ENCODING_VR_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace dcmx::encoding {

/**
 * @brief DICOM Value Representation (VR) types.
 *
 * The enumerator value is the two ASCII characters of the VR packed
 * big-endian into a uint16_t ("PN" -> 0x504E).
 */
enum class vr_type : uint16_t {
    // Character string VRs
    AE = 0x4145,
    AS = 0x4153,
    CS = 0x4353,
    DA = 0x4441,
    DS = 0x4453,
    DT = 0x4454,
    IS = 0x4953,
    LO = 0x4C4F,
    LT = 0x4C54,
    PN = 0x504E,
    SH = 0x5348,
    ST = 0x5354,
    TM = 0x544D,
    UC = 0x5543,
    UI = 0x5549,
    UR = 0x5552,
    UT = 0x5554,

    // Binary numeric VRs
    FL = 0x464C,
    FD = 0x4644,
    SL = 0x534C,
    SS = 0x5353,
    UL = 0x554C,
    US = 0x5553,
    SV = 0x5356,
    UV = 0x5556,

    // Opaque byte VRs
    OB = 0x4F42,
    OD = 0x4F44,
    OF = 0x4F46,
    OL = 0x4F4C,
    OV = 0x4F56,
    OW = 0x4F57,
    UN = 0x554E,

    AT = 0x4154,  ///< Attribute Tag
    SQ = 0x5351,  ///< Sequence of Items
};

/**
 * @brief Converts a vr_type to its two-character code.
 * @return "PN", "US", ... or "??" for values outside the enumeration
 */
[[nodiscard]] constexpr std::string_view to_string(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: return "AE";
        case vr_type::AS: return "AS";
        case vr_type::CS: return "CS";
        case vr_type::DA: return "DA";
        case vr_type::DS: return "DS";
        case vr_type::DT: return "DT";
        case vr_type::IS: return "IS";
        case vr_type::LO: return "LO";
        case vr_type::LT: return "LT";
        case vr_type::PN: return "PN";
        case vr_type::SH: return "SH";
        case vr_type::ST: return "ST";
        case vr_type::TM: return "TM";
        case vr_type::UC: return "UC";
        case vr_type::UI: return "UI";
        case vr_type::UR: return "UR";
        case vr_type::UT: return "UT";
        case vr_type::FL: return "FL";
        case vr_type::FD: return "FD";
        case vr_type::SL: return "SL";
        case vr_type::SS: return "SS";
        case vr_type::UL: return "UL";
        case vr_type::US: return "US";
        case vr_type::SV: return "SV";
        case vr_type::UV: return "UV";
        case vr_type::OB: return "OB";
        case vr_type::OD: return "OD";
        case vr_type::OF: return "OF";
        case vr_type::OL: return "OL";
        case vr_type::OV: return "OV";
        case vr_type::OW: return "OW";
        case vr_type::UN: return "UN";
        case vr_type::AT: return "AT";
        case vr_type::SQ: return "SQ";
        default: return "??";
    }
}

/**
 * @brief Parses a two-character VR code.
 * @param str Exactly two characters
 * @return The vr_type, or std::nullopt if the code is not a known VR
 */
[[nodiscard]] constexpr std::optional<vr_type> from_string(std::string_view str) noexcept {
    if (str.size() != 2) {
        return std::nullopt;
    }

    const auto code = static_cast<uint16_t>(
        (static_cast<uint16_t>(static_cast<unsigned char>(str[0])) << 8) |
        static_cast<uint16_t>(static_cast<unsigned char>(str[1])));

    switch (static_cast<vr_type>(code)) {
        case vr_type::AE: case vr_type::AS: case vr_type::AT:
        case vr_type::CS: case vr_type::DA: case vr_type::DS:
        case vr_type::DT: case vr_type::FD: case vr_type::FL:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::PN: case vr_type::SH: case vr_type::SL:
        case vr_type::SQ: case vr_type::SS: case vr_type::ST:
        case vr_type::SV: case vr_type::TM: case vr_type::UC:
        case vr_type::UI: case vr_type::UL: case vr_type::UN:
        case vr_type::UR: case vr_type::US: case vr_type::UT:
        case vr_type::UV:
            return static_cast<vr_type>(code);
        default:
            return std::nullopt;
    }
}

/**
 * @brief Checks if a VR holds character data.
 */
[[nodiscard]] constexpr bool is_string_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: case vr_type::AS: case vr_type::CS:
        case vr_type::DA: case vr_type::DS: case vr_type::DT:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::PN: case vr_type::SH: case vr_type::ST:
        case vr_type::TM: case vr_type::UC: case vr_type::UI:
        case vr_type::UR: case vr_type::UT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks if a VR holds binary-encoded numbers.
 */
[[nodiscard]] constexpr bool is_numeric_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::FL: case vr_type::FD:
        case vr_type::SL: case vr_type::SS: case vr_type::SV:
        case vr_type::UL: case vr_type::US: case vr_type::UV:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Size of one value of a numeric VR (used for big endian swapping).
 * @return 2, 4, 8, or 0 for VRs that are not swapped per value
 */
[[nodiscard]] constexpr std::size_t swap_unit(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::SS: case vr_type::US: case vr_type::OW:
            return 2;
        case vr_type::SL: case vr_type::UL: case vr_type::FL:
        case vr_type::OF: case vr_type::OL: case vr_type::AT:
            return 4;
        case vr_type::FD: case vr_type::OD: case vr_type::SV:
        case vr_type::UV: case vr_type::OV:
            return 8;
        default:
            return 0;
    }
}

/**
 * @brief Checks if a VR uses the 2 reserved bytes + 32-bit length layout
 *        in Explicit VR encodings.
 *
 * @see DICOM PS3.5 Section 7.1.2
 */
[[nodiscard]] constexpr bool has_explicit_32bit_length(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::SQ: case vr_type::SV: case vr_type::UC:
        case vr_type::UN: case vr_type::UR: case vr_type::UT:
        case vr_type::UV:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Gets the padding character for a VR.
 *
 * Values have even length; UI and binary VRs pad with NUL, other
 * character VRs with a space.
 */
[[nodiscard]] constexpr char padding_char(vr_type vr) noexcept {
    if (vr == vr_type::UI) {
        return '\0';
    }
    if (is_string_vr(vr)) {
        return ' ';
    }
    return '\0';
}

}  // namespace dcmx::encoding

#endif  // DCMX_ENCODING_VR_TYPE_HPP
