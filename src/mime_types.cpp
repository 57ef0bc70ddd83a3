#include "mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace serveit {

static const std::unordered_map<std::string, std::string> kMimeTypes = {
    // Text / web
    {".html", "text/html"},
    {".htm",  "text/html"},
    {".css",  "text/css"},
    {".js",   "application/javascript"},
    {".mjs",  "application/javascript"},
    {".json", "application/json"},
    {".xml",  "text/xml"},
    {".txt",  "text/plain"},
    {".md",   "text/markdown"},
    {".csv",  "text/csv"},
    {".c",    "text/x-c"},
    {".h",    "text/x-c"},
    {".cpp",  "text/x-c++src"},
    {".hpp",  "text/x-c++hdr"},
    {".rs",   "text/x-rust"},
    {".py",   "text/x-python"},
    {".sh",   "application/x-sh"},
    {".yaml", "text/x-yaml"},
    {".yml",  "text/x-yaml"},
    {".toml", "text/x-toml"},
    {".wasm", "application/wasm"},
    // Images
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".webp", "image/webp"},
    {".bmp",  "image/bmp"},
    {".avif", "image/avif"},
    // Fonts
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
    {".otf",  "font/otf"},
    // Audio / video
    {".mp3",  "audio/mpeg"},
    {".wav",  "audio/wav"},
    {".ogg",  "audio/ogg"},
    {".flac", "audio/flac"},
    {".mp4",  "video/mp4"},
    {".webm", "video/webm"},
    {".mkv",  "video/x-matroska"},
    // Documents / archives
    {".pdf",  "application/pdf"},
    {".zip",  "application/zip"},
    {".gz",   "application/gzip"},
    {".tar",  "application/x-tar"},
    {".7z",   "application/x-7z-compressed"},
};

std::string mime_type_for(const std::string& filename) {
    fs::path p(filename);
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = kMimeTypes.find(ext);
    if (it != kMimeTypes.end()) {
        return it->second;
    }
    return kDefaultMimeType;
}

} // namespace serveit
