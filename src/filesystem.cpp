#include "filesystem.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace serveit {

std::optional<FileStatus> LocalFileSystem::status(const fs::path& path) const {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return std::nullopt;
    }
    return FileStatus{fs::is_directory(st)};
}

std::optional<std::vector<DirEntry>> LocalFileSystem::list_directory(const fs::path& path) const {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return std::nullopt;
    }

    std::vector<DirEntry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::nullopt;
        }
        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec);
        entries.push_back(DirEntry{it->path().filename().string(), !type_ec && is_dir});
    }
    if (ec) {
        return std::nullopt;
    }
    return entries;
}

std::optional<std::string> LocalFileSystem::read_file(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string body((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return body;
}

} // namespace serveit
