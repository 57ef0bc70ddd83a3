#pragma once

#include "filesystem.hpp"
#include <filesystem>
#include <string>
#include <variant>

namespace serveit {

// Request-level failures. Each maps to exactly one HTTP status at the
// request handler boundary.
enum class RequestError {
    BadRequest, // malformed percent-encoding
    NotFound,   // missing, unreadable metadata, or outside the root
    Forbidden,  // exists but cannot be read / enumerated
};

enum class TargetKind { File, Directory };

struct ResolvedTarget {
    std::filesystem::path path;
    TargetKind kind = TargetKind::File;
    bool is_root = false;
};

template <typename T>
using Result = std::variant<T, RequestError>;

class PathResolver {
public:
    // root must be absolute and canonical
    PathResolver(std::filesystem::path root, const FileSystem& fs);

    // raw_path is the request target path with the query stripped,
    // e.g. "/", "/docs/My%20File.txt". An empty string means the root.
    Result<ResolvedTarget> resolve(const std::string& raw_path) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    const FileSystem& fs_;
};

} // namespace serveit
