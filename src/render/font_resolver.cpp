/**
 * @file font_resolver.cpp
 * @brief Font candidate list and resolution
 */

#include "dcmx/render/font_resolver.hpp"

#include <cstdlib>
#include <system_error>

namespace dcmx::render {

auto platform_font_candidates() -> std::vector<std::filesystem::path> {
#if defined(_WIN32)
    return {
        "C:/Windows/Fonts/consola.ttf",
        "C:/Windows/Fonts/lucon.ttf",
        "C:/Windows/Fonts/cour.ttf",
    };
#elif defined(__APPLE__)
    return {
        "/System/Library/Fonts/Menlo.ttc",
        "/System/Library/Fonts/Monaco.ttf",
        "/Library/Fonts/Courier New.ttf",
    };
#else
    return {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
        "/usr/share/fonts/liberation-mono/LiberationMono-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeMono.ttf",
        "/usr/share/fonts/gnu-free/FreeMono.otf",
        "/usr/share/fonts/truetype/noto/NotoSansMono-Regular.ttf",
    };
#endif
}

auto font_candidates(const std::vector<std::filesystem::path>& configured,
                     bool use_environment, bool use_platform)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> candidates = configured;

    if (use_environment) {
        if (const char* env = std::getenv(kFontPathEnvironment); env != nullptr && *env != '\0') {
            candidates.emplace_back(env);
        }
    }

    if (!use_platform) {
        return candidates;
    }

    auto platform = platform_font_candidates();
    candidates.insert(candidates.end(), platform.begin(), platform.end());
    return candidates;
}

auto resolve_font(const std::vector<std::filesystem::path>& candidates,
                  unsigned pixel_size) -> font_resolution {
    font_resolution resolution;

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }

        auto loaded = font_face::load(candidate, pixel_size);
        if (loaded.is_ok()) {
            resolution.font = std::move(loaded.value());
            return resolution;
        }
        resolution.failures.push_back(candidate.string() + ": " + loaded.error().message);
    }

    return resolution;
}

}  // namespace dcmx::render
