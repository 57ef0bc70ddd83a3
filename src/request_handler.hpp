#pragma once

#include "filesystem.hpp"
#include "path_resolver.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace serveit {

struct HttpResponse {
    int status = 200;
    std::string content_type;
    std::string body;
    std::vector<std::pair<std::string, std::string>> extra_headers;
};

const char* status_text(int status);

// Resolves and renders one GET request. Immutable after construction and
// safe to share between connection threads.
class RequestHandler {
public:
    RequestHandler(std::filesystem::path root, std::shared_ptr<const FileSystem> fs);

    // Non-copyable (resolver holds a reference into fs_)
    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    // raw_path: request target with the query string removed
    HttpResponse handle(const std::string& raw_path) const;

    const std::filesystem::path& root() const { return resolver_.root(); }

private:
    Result<HttpResponse> serve_file(const ResolvedTarget& target) const;
    Result<HttpResponse> serve_directory(const ResolvedTarget& target) const;

    std::shared_ptr<const FileSystem> fs_;
    PathResolver resolver_;
};

} // namespace serveit
