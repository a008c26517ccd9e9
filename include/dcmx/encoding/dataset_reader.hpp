/**
 * @file dataset_reader.hpp
 * @brief Decoder for DICOM data sets in the uncompressed transfer syntaxes
 *
 * One reader covers Implicit VR Little Endian, Explicit VR Little Endian
 * and Explicit VR Big Endian; the differences are only in how the element
 * header is laid out and in which byte order numbers are stored.
 *
 * Element header layouts:
 * @code
 *   Implicit VR:        tag(4) | length(4)            | value
 *   Explicit, short:    tag(4) | VR(2) | length(2)    | value
 *   Explicit, long:     tag(4) | VR(2) | 00 00 | length(4) | value
 *   Item / delimiters:  tag(4) | length(4)            (never a VR)
 * @endcode
 *
 * Values of big endian data sets are converted to little endian as they
 * are read, so every decoded dicom_element holds little endian data.
 *
 * @see DICOM PS3.5 Section 7.1 and 7.5, Annex A.4
 */

#ifndef DCMX_ENCODING_DATASET_READER_HPP
#define DCMX_ENCODING_DATASET_READER_HPP

#include <dcmx/core/dicom_dataset.hpp>
#include <dcmx/core/dicom_element.hpp>
#include <dcmx/core/result.hpp>
#include <dcmx/encoding/byte_order.hpp>
#include <dcmx/encoding/transfer_syntax.hpp>
#include <dcmx/encoding/vr_type.hpp>

#include <cstdint>
#include <span>

namespace dcmx::encoding {

/**
 * @brief Decodes a byte stream into a dicom_dataset.
 */
class dataset_reader {
public:
    template <typename T>
    using result = dcmx::Result<T>;

    /// Length value meaning "terminated by a delimitation item".
    static constexpr uint32_t undefined_length = 0xFFFFFFFF;

    dataset_reader(byte_order order, vr_encoding encoding) noexcept;

    /**
     * @brief Reader matching the data set layout of @p ts.
     *
     * Deflate is not handled here; inflate the stream first.
     */
    explicit dataset_reader(const transfer_syntax& ts) noexcept;

    /**
     * @brief Decode every element in @p data.
     *
     * Fewer than 8 trailing bytes after the last element are ignored.
     */
    [[nodiscard]] auto read(std::span<const uint8_t> data) const
        -> result<core::dicom_dataset>;

    /**
     * @brief Decode one element and advance @p data past it.
     */
    [[nodiscard]] auto read_element(std::span<const uint8_t>& data) const
        -> result<core::dicom_element>;

private:
    struct element_header {
        core::dicom_tag tag;
        vr_type vr;
        uint32_t length;
        std::size_t size;
    };

    [[nodiscard]] auto read_header(std::span<const uint8_t> data) const
        -> result<element_header>;

    [[nodiscard]] auto read_sequence(core::dicom_tag tag,
                                     std::span<const uint8_t>& data,
                                     bool delimited) const
        -> result<core::dicom_element>;

    [[nodiscard]] auto read_item(std::span<const uint8_t>& data) const
        -> result<core::dicom_dataset>;

    [[nodiscard]] auto read_encapsulated(core::dicom_tag tag, vr_type vr,
                                         std::span<const uint8_t>& data) const
        -> result<core::dicom_element>;

    [[nodiscard]] auto u16(const uint8_t* p) const noexcept -> uint16_t;
    [[nodiscard]] auto u32(const uint8_t* p) const noexcept -> uint32_t;

    byte_order order_;
    vr_encoding encoding_;
};

/**
 * @brief VR used for @p tag when the stream does not carry one.
 *
 * Covers group lengths, item markers and the attributes the exporter
 * reads; anything else is UN.
 */
[[nodiscard]] auto implied_vr(core::dicom_tag tag) noexcept -> vr_type;

}  // namespace dcmx::encoding

#endif  // DCMX_ENCODING_DATASET_READER_HPP
