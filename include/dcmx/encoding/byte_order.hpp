#ifndef DCMX_ENCODING_BYTE_ORDER_HPP
#define DCMX_ENCODING_BYTE_ORDER_HPP

namespace dcmx::encoding {

/**
 * @brief Byte ordering of multi-byte values in a DICOM data set.
 */
enum class byte_order {
    little_endian,
    big_endian  ///< Retired Explicit VR Big Endian only
};

/**
 * @brief Whether the VR is written into the stream or looked up by tag.
 */
enum class vr_encoding {
    implicit,
    explicit_vr
};

}  // namespace dcmx::encoding

#endif  // DCMX_ENCODING_BYTE_ORDER_HPP
