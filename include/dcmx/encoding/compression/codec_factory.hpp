/**
 * @file codec_factory.hpp
 * @brief Creates pixel data decoders by Transfer Syntax UID
 */

#ifndef DCMX_ENCODING_COMPRESSION_CODEC_FACTORY_HPP
#define DCMX_ENCODING_COMPRESSION_CODEC_FACTORY_HPP

#include "dcmx/encoding/compression/compression_codec.hpp"
#include "dcmx/encoding/transfer_syntax.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace dcmx::encoding::compression {

/**
 * @brief Static factory for compression codecs.
 *
 * @code
 * auto codec = codec_factory::create(file.transfer_syntax());
 * if (!codec) {
 *     // encapsulated syntax without a decoder (JPEG-LS, JPEG 2000, ...)
 * }
 * @endcode
 */
class codec_factory {
public:
    /**
     * @return A decoder, or nullptr if the syntax has none
     */
    [[nodiscard]] static std::unique_ptr<compression_codec> create(
        std::string_view transfer_syntax_uid);

    [[nodiscard]] static std::unique_ptr<compression_codec> create(
        const transfer_syntax& ts);

    [[nodiscard]] static std::vector<std::string_view> supported_transfer_syntaxes();

    [[nodiscard]] static bool is_supported(std::string_view transfer_syntax_uid);

private:
    codec_factory() = delete;
};

}  // namespace dcmx::encoding::compression

#endif  // DCMX_ENCODING_COMPRESSION_CODEC_FACTORY_HPP
