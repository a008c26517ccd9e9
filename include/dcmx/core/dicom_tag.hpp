/**
 * @file dicom_tag.hpp
 * @brief DICOM Tag (Group, Element pair)
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace dcmx::core {

/**
 * @brief A DICOM tag stored as a single uint32_t: (group << 16) | element.
 *
 * Ordering is by group then element, which is the order elements appear
 * in an encoded data set.
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept : combined_{0} {}

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : combined_{static_cast<uint32_t>(group) << 16 | element} {}

    explicit constexpr dicom_tag(uint32_t combined) noexcept
        : combined_{combined} {}

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ >> 16);
    }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ & 0xFFFF);
    }

    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t {
        return combined_;
    }

    /**
     * @brief Private tags have odd group numbers above 0x0008.
     */
    [[nodiscard]] constexpr auto is_private() const noexcept -> bool {
        const auto grp = group();
        return (grp & 1) != 0 && grp > 0x0008;
    }

    [[nodiscard]] constexpr auto is_group_length() const noexcept -> bool {
        return element() == 0x0000;
    }

    /**
     * @brief Item, Item Delimitation and Sequence Delimitation tags
     *        (group FFFE). These never carry a VR, even in explicit VR.
     */
    [[nodiscard]] constexpr auto is_item_marker() const noexcept -> bool {
        return group() == 0xFFFE;
    }

    /**
     * @brief Format as "(GGGG,EEEE)" with upper-case hex digits.
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] constexpr auto operator<=>(const dicom_tag& other) const noexcept
        -> std::strong_ordering = default;

    [[nodiscard]] constexpr auto operator==(const dicom_tag& other) const noexcept
        -> bool = default;

private:
    uint32_t combined_;
};

}  // namespace dcmx::core

template <>
struct std::hash<dcmx::core::dicom_tag> {
    [[nodiscard]] auto operator()(const dcmx::core::dicom_tag& tag) const noexcept
        -> size_t {
        return std::hash<uint32_t>{}(tag.combined());
    }
};
