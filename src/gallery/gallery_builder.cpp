/**
 * @file gallery_builder.cpp
 * @brief Implementation of series grouping and the HTML gallery
 */

#include "dcmx/gallery/gallery_builder.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>

namespace dcmx::gallery {

namespace {

constexpr std::string_view kStyle = R"css(
    body { font-family: -apple-system, 'Segoe UI', Roboto, sans-serif; margin: 24px; background: #111; color: #ddd; }
    header { border-bottom: 1px solid #333; margin-bottom: 16px; }
    header dl { display: grid; grid-template-columns: max-content auto; gap: 4px 16px; }
    header dt { color: #888; }
    section h2 { font-size: 1.1em; margin: 24px 0 8px; }
    .thumbs { display: flex; flex-wrap: wrap; gap: 8px; }
    .thumb { background: #000; border: 1px solid #333; padding: 4px; cursor: pointer; color: inherit; font: inherit; }
    .thumb:hover, .thumb:focus { border-color: #4a90d9; }
    .thumb img { display: block; width: 160px; height: 160px; object-fit: contain; }
    .thumb span { display: block; font-size: 0.8em; margin-top: 4px; }
    #viewer { display: none; position: fixed; inset: 0; background: rgba(0, 0, 0, 0.92); align-items: center; justify-content: center; flex-direction: column; }
    #viewer.open { display: flex; }
    #viewer img { max-width: 90vw; max-height: 80vh; }
    #viewer p { margin: 8px 0; }
    #viewer button { background: #222; color: #ddd; border: 1px solid #444; padding: 6px 14px; margin: 0 4px; }
    #viewer button:disabled { opacity: 0.3; }
)css";

constexpr std::string_view kScript = R"js(
(function () {
    var thumbs = Array.prototype.slice.call(document.querySelectorAll('.thumb'));
    var viewer = document.getElementById('viewer');
    var image = document.getElementById('viewer-image');
    var caption = document.getElementById('viewer-caption');
    var prev = document.getElementById('viewer-prev');
    var next = document.getElementById('viewer-next');
    var current = -1;

    function show(index) {
        if (index < 0 || index >= thumbs.length) {
            return;
        }
        current = index;
        image.src = thumbs[index].getAttribute('data-src');
        caption.textContent = thumbs[index].getAttribute('data-caption');
        prev.disabled = index === 0;
        next.disabled = index === thumbs.length - 1;
        viewer.classList.add('open');
    }

    function close() {
        viewer.classList.remove('open');
        current = -1;
    }

    thumbs.forEach(function (thumb, index) {
        thumb.addEventListener('click', function () { show(index); });
    });
    prev.addEventListener('click', function () { show(current - 1); });
    next.addEventListener('click', function () { show(current + 1); });
    document.getElementById('viewer-close').addEventListener('click', close);

    document.addEventListener('keydown', function (event) {
        if (current < 0) {
            return;
        }
        if (event.key === 'ArrowLeft') {
            show(current - 1);
        } else if (event.key === 'ArrowRight') {
            show(current + 1);
        } else if (event.key === 'Escape') {
            close();
        }
    });
})();
)js";

auto thumb_label(const render::image_metadata& meta) -> std::string {
    return "Slice " + meta.slice_location.to_string() + " / Instance " +
           meta.instance_number.to_string();
}

auto full_caption(const rendered_image& image) -> std::string {
    return image.image.filename().string() + " - " + thumb_label(image.metadata);
}

auto first_encountered(const std::vector<gallery_series>& series) -> const rendered_image* {
    const rendered_image* first = nullptr;
    for (const auto& s : series) {
        for (const auto& image : s.images) {
            if (first == nullptr || image.order < first->order) {
                first = &image;
            }
        }
    }
    return first;
}

}  // namespace

// ============================================================================
// Grouping
// ============================================================================

auto gallery_builder::group(std::vector<rendered_image> images)
    -> std::vector<gallery_series> {
    std::stable_sort(images.begin(), images.end(),
                     [](const rendered_image& a, const rendered_image& b) {
                         return a.order < b.order;
                     });

    // Series appear here in first-appearance order
    std::vector<gallery_series> series;
    for (auto& image : images) {
        series_key key{image.metadata.series_number, image.metadata.series_description};
        auto it = std::find_if(series.begin(), series.end(),
                               [&](const gallery_series& s) { return s.key == key; });
        if (it == series.end()) {
            series.push_back(gallery_series{std::move(key), {}});
            it = std::prev(series.end());
        }
        it->images.push_back(std::move(image));
    }

    std::stable_sort(series.begin(), series.end(),
                     [](const gallery_series& a, const gallery_series& b) {
                         if (auto c = a.key.number.compare(b.key.number); c != 0) {
                             return c < 0;
                         }
                         return a.key.description.compare(b.key.description) < 0;
                     });

    for (auto& s : series) {
        std::stable_sort(s.images.begin(), s.images.end(),
                         [](const rendered_image& a, const rendered_image& b) {
                             const auto& ma = a.metadata;
                             const auto& mb = b.metadata;
                             if (auto c = ma.slice_location.compare(mb.slice_location); c != 0) {
                                 return c < 0;
                             }
                             return ma.instance_number.compare(mb.instance_number) < 0;
                         });
    }

    return series;
}

// ============================================================================
// Document
// ============================================================================

auto gallery_builder::html_escape(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                result += "&amp;";
                break;
            case '<':
                result += "&lt;";
                break;
            case '>':
                result += "&gt;";
                break;
            case '"':
                result += "&quot;";
                break;
            case '\'':
                result += "&#39;";
                break;
            default:
                result += c;
        }
    }
    return result;
}

auto gallery_builder::url_escape(std::string_view text) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        const auto byte = static_cast<uint8_t>(c);
        const bool unreserved = (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') ||
                                (byte >= '0' && byte <= '9') || byte == '-' || byte == '_' ||
                                byte == '.' || byte == '~';
        if (unreserved) {
            result += c;
        } else {
            result += '%';
            result += hex[byte >> 4];
            result += hex[byte & 0x0F];
        }
    }
    return result;
}

auto gallery_builder::to_html(const std::vector<gallery_series>& series) -> std::string {
    const auto* first = first_encountered(series);
    const render::image_metadata header = first ? first->metadata : render::image_metadata{};

    std::ostringstream oss;

    oss << R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>)" << html_escape(header.patient_name.to_string()) << R"( - DICOM gallery</title>
<style>)" << kStyle << R"(</style>
</head>
<body>
<header>
<h1>DICOM gallery</h1>
<dl>
<dt>Patient</dt><dd>)" << html_escape(header.patient_name.to_string()) << R"(</dd>
<dt>Patient ID</dt><dd>)" << html_escape(header.patient_id.to_string()) << R"(</dd>
<dt>Study date</dt><dd>)" << html_escape(header.study_date.to_string()) << R"(</dd>
</dl>
</header>
)";

    if (series.empty()) {
        oss << "<p>No images were rendered.</p>\n";
    }

    for (const auto& s : series) {
        oss << "<section>\n<h2>" << html_escape(s.key.title()) << " ("
            << s.images.size() << ")</h2>\n<div class=\"thumbs\">\n";
        for (const auto& image : s.images) {
            const auto src = url_escape(image.image.filename().string());
            const auto label = thumb_label(image.metadata);
            oss << "<button class=\"thumb\" type=\"button\" data-src=\"" << src
                << "\" data-caption=\"" << html_escape(full_caption(image)) << "\">"
                << "<img src=\"" << src << "\" alt=\"" << html_escape(label)
                << "\" loading=\"lazy\"><span>" << html_escape(label) << "</span></button>\n";
        }
        oss << "</div>\n</section>\n";
    }

    oss << R"(<div id="viewer" role="dialog" aria-modal="true">
<img id="viewer-image" alt="">
<p id="viewer-caption"></p>
<div>
<button id="viewer-prev" type="button">&larr; Previous</button>
<button id="viewer-close" type="button">Close</button>
<button id="viewer-next" type="button">Next &rarr;</button>
</div>
</div>
<script>)" << kScript << R"(</script>
</body>
</html>
)";

    return oss.str();
}

auto gallery_builder::write(const std::filesystem::path& export_dir,
                            const std::vector<gallery_series>& series)
    -> Result<std::filesystem::path> {
    const auto path = export_dir / std::string{kGalleryDocument};

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return dcmx_error<std::filesystem::path>(error_codes::gallery_write_error,
                                                 "Cannot create gallery document",
                                                 path.string());
    }

    const auto html = to_html(series);
    file.write(html.data(), static_cast<std::streamsize>(html.size()));
    file.close();
    if (!file) {
        return dcmx_error<std::filesystem::path>(error_codes::gallery_write_error,
                                                 "Failed to write gallery document",
                                                 path.string());
    }

    return Result<std::filesystem::path>::ok(path);
}

}  // namespace dcmx::gallery
