/**
 * @file extraction_report.cpp
 * @brief Summary counting for extraction reports
 */

#include "dcmx/extract/extraction_report.hpp"

namespace dcmx::extract {

auto extraction_report::counts() const noexcept -> extraction_counts {
    extraction_counts c;
    for (const auto& file : files) {
        switch (file.outcome) {
            case extraction_outcome::written:
                ++c.written;
                break;
            case extraction_outcome::skipped_existing:
                ++c.skipped_existing;
                break;
            case extraction_outcome::overwritten:
                ++c.overwritten;
                break;
            case extraction_outcome::conflict_renamed:
                ++c.renamed;
                break;
            case extraction_outcome::skipped_not_dicom:
                ++c.not_dicom;
                break;
            case extraction_outcome::failed:
                ++c.failed;
                break;
        }
    }
    return c;
}

}  // namespace dcmx::extract
