/**
 * @file destination_namer.cpp
 * @brief Implementation of conflict-safe destination naming
 */

#include "dcmx/extract/destination_namer.hpp"

#include <system_error>

namespace dcmx::extract {

destination_namer::destination_namer(std::filesystem::path root, bool overwrite)
    : root_(std::move(root)), overwrite_(overwrite) {}

auto destination_namer::assign(std::string_view base_name) -> assignment {
    const std::string name{base_name};

    if (claimed_.count(name) == 0) {
        std::error_code ec;
        const auto candidate = root_ / name;
        const auto status = std::filesystem::symlink_status(candidate, ec);

        if (!std::filesystem::exists(status)) {
            claimed_.insert(name);
            return {candidate, extraction_outcome::written, 0};
        }
        if (overwrite_ && std::filesystem::is_regular_file(status)) {
            claimed_.insert(name);
            return {candidate, extraction_outcome::overwritten, 0};
        }
    }

    for (unsigned n = 1;; ++n) {
        auto renamed = suffixed_name(base_name, n);
        if (is_free(renamed)) {
            auto path = root_ / renamed;
            claimed_.insert(std::move(renamed));
            return {std::move(path), extraction_outcome::conflict_renamed, n};
        }
    }
}

auto destination_namer::suffixed_name(std::string_view base_name, unsigned n)
    -> std::string {
    const std::filesystem::path name{base_name};
    return name.stem().string() + "_" + std::to_string(n) + name.extension().string();
}

auto destination_namer::is_free(const std::string& name) const -> bool {
    if (claimed_.count(name) != 0) {
        return false;
    }
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(root_ / name, ec);
    if (!std::filesystem::exists(status)) {
        return true;
    }
    // Leftovers from an earlier run are replaceable; only in-run claims force
    // the next suffix.
    return overwrite_ && std::filesystem::is_regular_file(status);
}

}  // namespace dcmx::extract
