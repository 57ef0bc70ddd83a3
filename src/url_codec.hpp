#pragma once

#include <optional>
#include <string>

namespace serveit {

// Percent-decode a URL path segment. Returns nullopt when a '%' is not
// followed by two hex digits or when the result contains a NUL byte. The
// decoded bytes need not be UTF-8 (POSIX file names are raw bytes). '+' is
// left as-is.
std::optional<std::string> url_decode(const std::string& s);

// Percent-encode every byte outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& s);

// Escape & < > " ' for use in HTML text and attribute values.
std::string html_escape(const std::string& s);

bool is_valid_utf8(const std::string& s);

// Replace every byte that is not part of a well-formed UTF-8 sequence
// with U+FFFD.
std::string to_utf8_lossy(const std::string& s);

} // namespace serveit
