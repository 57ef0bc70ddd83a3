#include "path_resolver.hpp"
#include "url_codec.hpp"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace serveit {

// Drop a trailing separator so "/srv/www/sub/" compares equal to "/srv/www/sub"
static fs::path strip_trailing_separator(fs::path p) {
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

static bool is_within(const fs::path& root, const fs::path& candidate) {
    fs::path rel = candidate.lexically_relative(root);
    if (rel.empty()) {
        return false;
    }
    return *rel.begin() != "..";
}

PathResolver::PathResolver(fs::path root, const FileSystem& fs)
    : root_(strip_trailing_separator(std::move(root)))
    , fs_(fs)
{
}

Result<ResolvedTarget> PathResolver::resolve(const std::string& raw_path) const {
    auto decoded = url_decode(raw_path);
    if (!decoded) {
        return RequestError::BadRequest;
    }

    // Leading separators never make the request absolute
    fs::path relative = fs::path(*decoded).relative_path();
    fs::path candidate = strip_trailing_separator((root_ / relative).lexically_normal());

    if (!is_within(root_, candidate)) {
        spdlog::warn("HTTP: Path traversal attempt: {}", raw_path);
        return RequestError::NotFound;
    }

    auto st = fs_.status(candidate);
    if (!st) {
        return RequestError::NotFound;
    }

    ResolvedTarget target;
    target.path = candidate;
    target.kind = st->is_directory ? TargetKind::Directory : TargetKind::File;
    target.is_root = (candidate == root_);
    return target;
}

} // namespace serveit
