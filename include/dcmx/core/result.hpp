/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the exporter
 *
 * Standardized Result<T> types built on common_system's Result pattern,
 * plus the exporter-specific error code range.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace dcmx {

/**
 * @brief Result type alias for exporter operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Exporter error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int dcmx_base = -900;

    // Archive errors (-900 to -919)
    constexpr int archive_open_error = dcmx_base - 0;
    constexpr int archive_read_error = dcmx_base - 1;

    // DICOM file errors (-920 to -939)
    constexpr int file_not_found = dcmx_base - 20;
    constexpr int file_read_error = dcmx_base - 21;
    constexpr int file_write_error = dcmx_base - 22;
    constexpr int invalid_dicom_file = dcmx_base - 23;
    constexpr int missing_dicm_prefix = dcmx_base - 24;
    constexpr int invalid_meta_info = dcmx_base - 25;
    constexpr int missing_transfer_syntax = dcmx_base - 26;
    constexpr int unsupported_transfer_syntax = dcmx_base - 27;

    // Element/decoding errors (-940 to -959)
    constexpr int element_not_found = dcmx_base - 40;
    constexpr int data_size_mismatch = dcmx_base - 41;
    constexpr int insufficient_data = dcmx_base - 42;
    constexpr int invalid_sequence = dcmx_base - 43;
    constexpr int decode_error = dcmx_base - 44;

    // Extraction / render errors (-960 to -979)
    constexpr int no_qualifying_records = dcmx_base - 60;
    constexpr int image_write_error = dcmx_base - 61;
    constexpr int font_unavailable = dcmx_base - 62;
    constexpr int gallery_write_error = dcmx_base - 63;
} // namespace error_codes

using kcenon::common::ok;

/**
 * @brief Create an exporter error result with module context
 * @tparam T The result value type
 * @param code Error code from dcmx::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> dcmx_error(int code, const std::string& message,
                            const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "dcmx");
    }
    return kcenon::common::make_error<T>(code, message, "dcmx", details);
}

/**
 * @brief Create an exporter void error result
 * @param code Error code from dcmx::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult dcmx_void_error(int code, const std::string& message,
                                  const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "dcmx"});
    }
    return VoidResult(error_info{code, message, "dcmx", details});
}

} // namespace dcmx
