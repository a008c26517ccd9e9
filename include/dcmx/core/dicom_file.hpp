/**
 * @file dicom_file.hpp
 * @brief DICOM Part 10 file reading and the fixture writer
 *
 * File layout:
 * @code
 *   128-byte preamble | "DICM" | File Meta Information (group 0002,
 *   always Explicit VR LE) | data set in the announced transfer syntax
 * @endcode
 *
 * @see DICOM PS3.10 Section 7 - DICOM File Format
 */

#pragma once

#include "dcmx/core/dicom_dataset.hpp"
#include "dcmx/core/dicom_tag_constants.hpp"
#include "dcmx/core/result.hpp"

#include <dcmx/encoding/transfer_syntax.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dcmx::core {

/// SOP Class UID of a Media Storage Directory (DICOMDIR).
inline constexpr std::string_view media_storage_directory_sop_class =
    "1.2.840.10008.1.3.10";

/**
 * @brief A parsed DICOM Part 10 file.
 *
 * @code
 * auto file = dicom_file::open("IM0001.dcm");
 * if (file.is_ok()) {
 *     auto name = file.value().dataset().get_string(tags::patient_name);
 * }
 * @endcode
 */
class dicom_file {
public:
    /// Preamble length before the "DICM" marker.
    static constexpr size_t kPreambleSize = 128;

    /// Offset of the first File Meta Information element.
    static constexpr size_t kMetaOffset = kPreambleSize + 4;

    static constexpr uint8_t kDicmPrefix[4] = {'D', 'I', 'C', 'M'};

    dicom_file(const dicom_file&) = default;
    dicom_file(dicom_file&&) noexcept = default;
    auto operator=(const dicom_file&) -> dicom_file& = default;
    auto operator=(dicom_file&&) noexcept -> dicom_file& = default;
    ~dicom_file() = default;

    // ========================================================================
    // Reading
    // ========================================================================

    /**
     * @brief Read and parse a file from disk.
     * @return The file, or file_not_found / file_read_error /
     *         missing_dicm_prefix / invalid_meta_info /
     *         unsupported_transfer_syntax / decode errors
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> dcmx::Result<dicom_file>;

    [[nodiscard]] static auto from_bytes(std::span<const uint8_t> data)
        -> dcmx::Result<dicom_file>;

    /**
     * @brief True if @p data holds a preamble followed by "DICM".
     */
    [[nodiscard]] static auto has_dicm_prefix(std::span<const uint8_t> data) noexcept
        -> bool;

    /**
     * @brief Parse only the File Meta Information group.
     *
     * @param data Leading bytes of a file, starting at the preamble
     * @param truncated True if @p data is a prefix of a longer file; an
     *        element cut off by the end of @p data then ends the group
     *        instead of failing
     * @return The meta group, or missing_dicm_prefix / invalid_meta_info
     */
    [[nodiscard]] static auto read_meta_information(std::span<const uint8_t> data,
                                                    bool truncated = false)
        -> dcmx::Result<dicom_dataset>;

    // ========================================================================
    // Creation / Writing
    // ========================================================================

    /**
     * @brief Wrap @p dataset with a freshly generated meta group.
     *
     * The Media Storage SOP Class / Instance UIDs are copied from the
     * data set's (0008,0016) / (0008,0018).
     */
    [[nodiscard]] static auto create(dicom_dataset dataset,
                                     const encoding::transfer_syntax& ts)
        -> dicom_file;

    [[nodiscard]] auto save(const std::filesystem::path& path) const
        -> dcmx::VoidResult;

    /**
     * @brief Serialize the file.
     *
     * The data set is always written as Explicit VR Little Endian, which
     * is correct for that syntax and for the encapsulated (compressed)
     * syntaxes.
     */
    [[nodiscard]] auto to_bytes() const -> std::vector<uint8_t>;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto meta_information() const noexcept -> const dicom_dataset&;
    [[nodiscard]] auto meta_information() noexcept -> dicom_dataset&;
    [[nodiscard]] auto dataset() const noexcept -> const dicom_dataset&;
    [[nodiscard]] auto dataset() noexcept -> dicom_dataset&;

    [[nodiscard]] auto transfer_syntax() const -> encoding::transfer_syntax;
    [[nodiscard]] auto sop_class_uid() const -> std::string;
    [[nodiscard]] auto media_storage_sop_class_uid() const -> std::string;

private:
    dicom_file(dicom_dataset meta_info, dicom_dataset main_dataset);

    [[nodiscard]] static auto parse_meta_group(std::span<const uint8_t> meta,
                                               bool truncated, size_t& bytes_read)
        -> dcmx::Result<dicom_dataset>;

    [[nodiscard]] static auto generate_meta_information(
        const dicom_dataset& dataset, const encoding::transfer_syntax& ts)
        -> dicom_dataset;

    [[nodiscard]] static auto encode_explicit_vr_le(const dicom_dataset& dataset)
        -> std::vector<uint8_t>;

    static void encode_element(std::vector<uint8_t>& buffer,
                               const dicom_element& element);

    static constexpr std::string_view kImplementationClassUid =
        "1.2.826.0.1.3680043.10.1451.1";
    static constexpr std::string_view kImplementationVersionName = "DCMX_100";

    dicom_dataset meta_info_;
    dicom_dataset dataset_;
};

}  // namespace dcmx::core
