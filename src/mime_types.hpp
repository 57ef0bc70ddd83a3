#pragma once

#include <string>

namespace serveit {

constexpr const char* kDefaultMimeType = "application/octet-stream";

// Guess a content type from the file name's extension (case-insensitive).
// Falls back to application/octet-stream.
std::string mime_type_for(const std::string& filename);

} // namespace serveit
