/**
 * @file destination_namer.hpp
 * @brief Single authority for destination file names within one run
 */

#pragma once

#include "dcmx/extract/extraction_report.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace dcmx::extract {

/**
 * @brief Assigns unique file names inside a destination root.
 *
 * Rules, applied to a base name such as "IM0001.dcm":
 * - a name already handed out by this instance always gets a suffix;
 * - a name that exists on disk is replaced when @c overwrite is set and
 *   the existing path is a regular file;
 * - otherwise the first free "IM0001_1.dcm", "IM0001_2.dcm", ... is used,
 *   where a suffixed regular file left on disk counts as free under
 *   @c overwrite, so repeated runs produce the same names.
 */
class destination_namer {
public:
    struct assignment {
        std::filesystem::path path;
        extraction_outcome outcome{extraction_outcome::written};
        unsigned suffix{0};
    };

    destination_namer(std::filesystem::path root, bool overwrite);

    /**
     * @brief Claim a destination for @p base_name.
     */
    [[nodiscard]] auto assign(std::string_view base_name) -> assignment;

    /**
     * @brief "<stem>_<n><ext>" for @p base_name.
     */
    [[nodiscard]] static auto suffixed_name(std::string_view base_name, unsigned n)
        -> std::string;

private:
    [[nodiscard]] auto is_free(const std::string& name) const -> bool;

    std::filesystem::path root_;
    bool overwrite_;
    std::set<std::string> claimed_;
};

}  // namespace dcmx::extract
