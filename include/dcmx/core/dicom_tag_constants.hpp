/**
 * @file dicom_tag_constants.hpp
 * @brief Tags read or written by the exporter
 *
 * @see DICOM PS3.6 Data Dictionary
 */

#pragma once

#include "dcmx/core/dicom_tag.hpp"

namespace dcmx::core::tags {

// ============================================================================
// File Meta Information (0002,xxxx)
// ============================================================================

inline constexpr dicom_tag file_meta_information_group_length{0x0002, 0x0000};
inline constexpr dicom_tag file_meta_information_version{0x0002, 0x0001};
inline constexpr dicom_tag media_storage_sop_class_uid{0x0002, 0x0002};
inline constexpr dicom_tag media_storage_sop_instance_uid{0x0002, 0x0003};
inline constexpr dicom_tag transfer_syntax_uid{0x0002, 0x0010};
inline constexpr dicom_tag implementation_class_uid{0x0002, 0x0012};
inline constexpr dicom_tag implementation_version_name{0x0002, 0x0013};

// ============================================================================
// Directory records (DICOMDIR)
// ============================================================================

inline constexpr dicom_tag file_set_id{0x0004, 0x1130};
inline constexpr dicom_tag directory_record_sequence{0x0004, 0x1220};

// ============================================================================
// Patient / Study / Series / Instance
// ============================================================================

inline constexpr dicom_tag specific_character_set{0x0008, 0x0005};
inline constexpr dicom_tag sop_class_uid{0x0008, 0x0016};
inline constexpr dicom_tag sop_instance_uid{0x0008, 0x0018};
inline constexpr dicom_tag study_date{0x0008, 0x0020};
inline constexpr dicom_tag modality{0x0008, 0x0060};
inline constexpr dicom_tag series_description{0x0008, 0x103E};

inline constexpr dicom_tag patient_name{0x0010, 0x0010};
inline constexpr dicom_tag patient_id{0x0010, 0x0020};

inline constexpr dicom_tag study_instance_uid{0x0020, 0x000D};
inline constexpr dicom_tag series_instance_uid{0x0020, 0x000E};
inline constexpr dicom_tag series_number{0x0020, 0x0011};
inline constexpr dicom_tag instance_number{0x0020, 0x0013};
inline constexpr dicom_tag slice_location{0x0020, 0x1041};

// ============================================================================
// Image Pixel Module (0028,xxxx)
// ============================================================================

inline constexpr dicom_tag samples_per_pixel{0x0028, 0x0002};
inline constexpr dicom_tag photometric_interpretation{0x0028, 0x0004};
inline constexpr dicom_tag planar_configuration{0x0028, 0x0006};
inline constexpr dicom_tag number_of_frames{0x0028, 0x0008};
inline constexpr dicom_tag rows{0x0028, 0x0010};
inline constexpr dicom_tag columns{0x0028, 0x0011};
inline constexpr dicom_tag bits_allocated{0x0028, 0x0100};
inline constexpr dicom_tag bits_stored{0x0028, 0x0101};
inline constexpr dicom_tag high_bit{0x0028, 0x0102};
inline constexpr dicom_tag pixel_representation{0x0028, 0x0103};

inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

// ============================================================================
// Item markers (FFFE,xxxx)
// ============================================================================

inline constexpr dicom_tag item{0xFFFE, 0xE000};
inline constexpr dicom_tag item_delimitation_item{0xFFFE, 0xE00D};
inline constexpr dicom_tag sequence_delimitation_item{0xFFFE, 0xE0DD};

}  // namespace dcmx::core::tags
