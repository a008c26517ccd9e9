#include "dcmx/encoding/compression/codec_factory.hpp"
#include "dcmx/encoding/compression/jpeg_baseline_codec.hpp"
#include "dcmx/encoding/compression/rle_codec.hpp"

#include <array>

namespace dcmx::encoding::compression {

namespace {

constexpr std::array<std::string_view, 2> kSupportedTransferSyntaxes = {{
    jpeg_baseline_codec::kTransferSyntaxUID,  // 1.2.840.10008.1.2.4.50
    rle_codec::kTransferSyntaxUID,            // 1.2.840.10008.1.2.5
}};

}  // namespace

std::unique_ptr<compression_codec> codec_factory::create(
    std::string_view transfer_syntax_uid) {

    if (transfer_syntax_uid == jpeg_baseline_codec::kTransferSyntaxUID) {
        return std::make_unique<jpeg_baseline_codec>();
    }

    if (transfer_syntax_uid == rle_codec::kTransferSyntaxUID) {
        return std::make_unique<rle_codec>();
    }

    return nullptr;
}

std::unique_ptr<compression_codec> codec_factory::create(const transfer_syntax& ts) {
    return create(ts.uid());
}

std::vector<std::string_view> codec_factory::supported_transfer_syntaxes() {
    return {kSupportedTransferSyntaxes.begin(), kSupportedTransferSyntaxes.end()};
}

bool codec_factory::is_supported(std::string_view transfer_syntax_uid) {
    for (const auto& uid : kSupportedTransferSyntaxes) {
        if (uid == transfer_syntax_uid) {
            return true;
        }
    }
    return false;
}

}  // namespace dcmx::encoding::compression
