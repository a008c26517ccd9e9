/**
 * @file inflate.hpp
 * @brief Raw DEFLATE (RFC 1951) decompression through zlib
 *
 * Used for ZIP method 8 entries and for the Deflated Explicit VR Little
 * Endian transfer syntax; both store a raw stream without zlib header.
 */

#ifndef DCMX_ENCODING_INFLATE_HPP
#define DCMX_ENCODING_INFLATE_HPP

#include <dcmx/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <vector>

namespace dcmx::encoding {

/// Upper bound of the DEFLATE expansion ratio (RFC 1951, 258 bytes per 2 bits)
inline constexpr std::uint64_t max_deflate_ratio = 1032;

/// Largest buffer pre-allocated from a size declared by the container
inline constexpr std::size_t max_reserve_size = 64 * 1024 * 1024;

/**
 * @brief Incremental raw inflate over input delivered in pieces.
 *
 * Input given to feed() is consumed completely unless @c max_output is
 * reached first; once that happens the stream must not be fed again.
 */
class raw_inflater {
public:
    raw_inflater();
    ~raw_inflater();

    raw_inflater(const raw_inflater&) = delete;
    raw_inflater& operator=(const raw_inflater&) = delete;

    /**
     * @brief Inflate @p input, appending to @p output.
     *
     * Stops at the end of the stream, when @p input is exhausted, or when
     * @p output holds @p max_output bytes.
     *
     * @return decode_error for a corrupt stream
     */
    [[nodiscard]] auto feed(std::span<const uint8_t> input, std::vector<uint8_t>& output,
                            std::size_t max_output) -> dcmx::VoidResult;

    /// True once the end-of-stream block was decoded
    [[nodiscard]] auto finished() const noexcept -> bool;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Inflate a complete raw deflate stream held in memory.
 *
 * @param input Compressed bytes
 * @param max_output Stop once this many bytes are produced; the stream
 *        need not be complete in that case
 * @param size_hint Expected output size used to pre-size the buffer; it is
 *        capped by the expansion ratio of @p input and by max_reserve_size
 * @return Decompressed bytes, or decode_error for a corrupt or truncated
 *         stream
 */
[[nodiscard]] auto inflate_raw(std::span<const uint8_t> input,
                               std::size_t max_output = std::numeric_limits<std::size_t>::max(),
                               std::size_t size_hint = 0)
    -> dcmx::Result<std::vector<uint8_t>>;

}  // namespace dcmx::encoding

#endif  // DCMX_ENCODING_INFLATE_HPP
