/**
 * @file inflate.cpp
 * @brief zlib-backed raw inflate
 */

#include <dcmx/encoding/inflate.hpp>

#include <zlib.h>

#include <algorithm>
#include <string>

namespace dcmx::encoding {

namespace {

constexpr std::size_t chunk_size = 64 * 1024;

}  // namespace

// =============================================================================
// raw_inflater
// =============================================================================

/**
 * @brief Owns the zlib stream.
 */
class raw_inflater::impl {
public:
    impl() noexcept {
        stream_.zalloc = Z_NULL;
        stream_.zfree = Z_NULL;
        stream_.opaque = Z_NULL;
        // Negative window bits select a raw stream (no zlib header)
        status_ = inflateInit2(&stream_, -MAX_WBITS);
    }

    ~impl() {
        if (status_ == Z_OK) {
            inflateEnd(&stream_);
        }
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    [[nodiscard]] bool valid() const noexcept { return status_ == Z_OK; }
    [[nodiscard]] z_stream* get() noexcept { return &stream_; }

    bool finished{false};

private:
    z_stream stream_{};
    int status_{Z_STREAM_ERROR};
};

raw_inflater::raw_inflater() : impl_(std::make_unique<impl>()) {}

raw_inflater::~raw_inflater() = default;

auto raw_inflater::finished() const noexcept -> bool { return impl_->finished; }

auto raw_inflater::feed(std::span<const uint8_t> input, std::vector<uint8_t>& output,
                        std::size_t max_output) -> dcmx::VoidResult {
    if (!impl_->valid()) {
        return dcmx::dcmx_void_error(dcmx::error_codes::decode_error,
                                     "Failed to initialize zlib inflate");
    }

    auto* zs = impl_->get();
    std::size_t consumed = 0;

    while (!impl_->finished && output.size() < max_output) {
        // avail_in is 32-bit; hand over very large inputs in slices
        if (zs->avail_in == 0) {
            if (consumed == input.size()) {
                break;
            }
            const auto slice = std::min<std::size_t>(input.size() - consumed, 1u << 30);
            zs->next_in = const_cast<Bytef*>(input.data() + consumed);
            zs->avail_in = static_cast<uInt>(slice);
            consumed += slice;
        }

        const auto offset = output.size();
        const auto want = std::min(chunk_size, max_output - offset);
        output.resize(offset + want);
        zs->next_out = output.data() + offset;
        zs->avail_out = static_cast<uInt>(want);

        const int status = inflate(zs, Z_NO_FLUSH);
        output.resize(offset + (want - zs->avail_out));

        if (status == Z_STREAM_END) {
            impl_->finished = true;
        } else if (status != Z_OK && status != Z_BUF_ERROR) {
            return dcmx::dcmx_void_error(
                dcmx::error_codes::decode_error,
                std::string{"Deflate stream is corrupt: "} +
                    (zs->msg != nullptr ? zs->msg : "unknown error"));
        }
    }

    return dcmx::ok();
}

// =============================================================================
// One-shot inflate
// =============================================================================

auto inflate_raw(std::span<const uint8_t> input, std::size_t max_output,
                 std::size_t size_hint) -> dcmx::Result<std::vector<uint8_t>> {
    const auto ratio_bound = std::min<std::uint64_t>(
        static_cast<std::uint64_t>(input.size()) * max_deflate_ratio, max_reserve_size);

    std::vector<uint8_t> output;
    output.reserve(std::min({size_hint, max_output, static_cast<std::size_t>(ratio_bound)}));

    raw_inflater inflater;
    auto fed = inflater.feed(input, output, max_output);
    if (fed.is_err()) {
        return dcmx::Result<std::vector<uint8_t>>::err(fed.error());
    }
    if (!inflater.finished() && output.size() < max_output) {
        return dcmx::dcmx_error<std::vector<uint8_t>>(
            dcmx::error_codes::decode_error, "Deflate stream is truncated");
    }

    return dcmx::Result<std::vector<uint8_t>>::ok(std::move(output));
}

}  // namespace dcmx::encoding
