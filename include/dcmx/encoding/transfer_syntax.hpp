#ifndef DCMX_ENCODING_TRANSFER_SYNTAX_HPP
#define DCMX_ENCODING_TRANSFER_SYNTAX_HPP

#include "dcmx/encoding/byte_order.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dcmx::encoding {

/**
 * @brief A DICOM Transfer Syntax as named by (0002,0010).
 *
 * Carries the data set layout (byte order, VR encoding, deflate) and how
 * Pixel Data is stored (native or encapsulated). Unknown UIDs construct an
 * invalid instance rather than failing; the reader decides what to do
 * with them.
 */
class transfer_syntax {
public:
    /**
     * @brief Looks up @p uid in the registry.
     *
     * Trailing NUL or space padding is ignored.
     */
    explicit transfer_syntax(std::string_view uid);

    [[nodiscard]] std::string_view uid() const noexcept;
    [[nodiscard]] std::string_view name() const noexcept;
    [[nodiscard]] byte_order endianness() const noexcept;
    [[nodiscard]] vr_encoding vr_type() const noexcept;

    /// Pixel Data is a sequence of fragments (compressed).
    [[nodiscard]] bool is_encapsulated() const noexcept;

    /// Data set after the meta group is a raw deflate stream.
    [[nodiscard]] bool is_deflated() const noexcept;

    /// The UID was found in the registry.
    [[nodiscard]] bool is_valid() const noexcept;

    /// The data set can be parsed (every valid syntax is, even when its
    /// pixel compression cannot be decoded).
    [[nodiscard]] bool is_supported() const noexcept;

    /// The pixel data can be decoded to samples by the renderer.
    [[nodiscard]] bool is_pixel_decodable() const noexcept;

    bool operator==(const transfer_syntax& other) const noexcept;
    bool operator!=(const transfer_syntax& other) const noexcept;

    static const transfer_syntax implicit_vr_little_endian;
    static const transfer_syntax explicit_vr_little_endian;
    static const transfer_syntax explicit_vr_big_endian;
    static const transfer_syntax deflated_explicit_vr_le;
    static const transfer_syntax jpeg_baseline;
    static const transfer_syntax jpeg_extended;
    static const transfer_syntax jpeg_lossless;
    static const transfer_syntax jpeg_ls_lossless;
    static const transfer_syntax jpeg2000_lossless;
    static const transfer_syntax jpeg2000_lossy;
    static const transfer_syntax rle_lossless;

private:
    transfer_syntax(std::string_view uid, std::string_view name,
                    byte_order endian, vr_encoding vr, bool encapsulated,
                    bool deflated, bool pixel_decodable);

    std::string uid_;
    std::string name_;
    byte_order endianness_;
    vr_encoding vr_type_;
    bool encapsulated_;
    bool deflated_;
    bool valid_;
    bool pixel_decodable_;

    friend std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid);
};

/**
 * @brief Registry lookup.
 * @return The transfer syntax, or std::nullopt if @p uid is unknown
 */
[[nodiscard]] std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid);

/**
 * @brief Removes trailing NUL and space padding from a UI value.
 */
[[nodiscard]] std::string_view trim_uid(std::string_view uid) noexcept;

}  // namespace dcmx::encoding

#endif  // DCMX_ENCODING_TRANSFER_SYNTAX_HPP
