#include "request_handler.hpp"
#include "directory_listing.hpp"
#include "mime_types.hpp"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace serveit {

namespace {

HttpResponse plain_text(int status, const std::string& body) {
    HttpResponse resp;
    resp.status = status;
    resp.content_type = "text/plain; charset=utf-8";
    resp.body = body;
    return resp;
}

// Single point where request errors become HTTP responses
HttpResponse error_response(RequestError err, TargetKind kind) {
    switch (err) {
        case RequestError::BadRequest:
            return plain_text(400, "Bad URL encoding");
        case RequestError::NotFound:
            return plain_text(404, "Not found");
        case RequestError::Forbidden:
            return plain_text(403, kind == TargetKind::Directory ? "Cannot read directory"
                                                                 : "Cannot read file");
    }
    return plain_text(404, "Not found");
}

} // namespace

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

RequestHandler::RequestHandler(fs::path root, std::shared_ptr<const FileSystem> fs)
    : fs_(std::move(fs))
    , resolver_(std::move(root), *fs_)
{
}

HttpResponse RequestHandler::handle(const std::string& raw_path) const {
    auto resolved = resolver_.resolve(raw_path);
    if (auto* err = std::get_if<RequestError>(&resolved)) {
        return error_response(*err, TargetKind::File);
    }

    const auto& target = std::get<ResolvedTarget>(resolved);
    auto rendered = target.kind == TargetKind::Directory ? serve_directory(target)
                                                         : serve_file(target);
    if (auto* err = std::get_if<RequestError>(&rendered)) {
        return error_response(*err, target.kind);
    }
    return std::get<HttpResponse>(std::move(rendered));
}

Result<HttpResponse> RequestHandler::serve_file(const ResolvedTarget& target) const {
    auto bytes = fs_->read_file(target.path);
    if (!bytes) {
        spdlog::warn("HTTP: Cannot read file {}", target.path.string());
        return RequestError::Forbidden;
    }

    HttpResponse resp;
    resp.status = 200;
    resp.content_type = mime_type_for(target.path.filename().string());
    resp.body = std::move(*bytes);
    return resp;
}

Result<HttpResponse> RequestHandler::serve_directory(const ResolvedTarget& target) const {
    auto entries = fs_->list_directory(target.path);
    if (!entries) {
        spdlog::warn("HTTP: Cannot read directory {}", target.path.string());
        return RequestError::Forbidden;
    }

    sort_entries(*entries);

    HttpResponse resp;
    resp.status = 200;
    resp.content_type = "text/html; charset=utf-8";
    resp.body = render_directory_listing(*entries, !target.is_root);
    return resp;
}

} // namespace serveit
