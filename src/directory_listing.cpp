#include "directory_listing.hpp"
#include "url_codec.hpp"
#include <algorithm>

namespace serveit {

void sort_entries(std::vector<DirEntry>& entries) {
    // std::string ordering compares as unsigned char, i.e. byte-wise
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
}

std::string render_directory_listing(const std::vector<DirEntry>& entries, bool include_parent) {
    std::string html;
    html += "<!doctype html><html><head><meta charset='utf-8'>";
    html += "<title>Index</title>";
    html += "<style>body{font-family:system-ui,Arial,sans-serif} a{text-decoration:none}</style>";
    html += "</head><body>";
    html += "<h1>Index</h1><ul>";

    if (include_parent) {
        html += "<li><a href=\"../\">../</a></li>";
    }

    for (const auto& entry : entries) {
        // href and label are encoded independently from the raw name; the
        // href keeps raw bytes so it still resolves, the label must be UTF-8
        std::string href = url_encode(entry.name);
        std::string label = entry.name;
        if (entry.is_directory) {
            href += '/';
            label += '/';
        }

        html += "<li><a href=\"";
        html += href;
        html += "\">";
        html += html_escape(to_utf8_lossy(label));
        html += "</a></li>";
    }

    html += "</ul></body></html>";
    return html;
}

} // namespace serveit
