#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace serveit {

struct FileStatus {
    bool is_directory = false;
};

struct DirEntry {
    std::string name;
    bool is_directory = false;
};

// Filesystem capability used by the request path. Every call is a fresh
// query; nothing is cached. Implementations must be safe to call from
// several threads at once.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // nullopt if the path does not exist or its metadata cannot be read
    virtual std::optional<FileStatus> status(const std::filesystem::path& path) const = 0;

    // Immediate children, unsorted. nullopt if the directory cannot be enumerated.
    virtual std::optional<std::vector<DirEntry>> list_directory(const std::filesystem::path& path) const = 0;

    // Whole file contents. nullopt on any read failure.
    virtual std::optional<std::string> read_file(const std::filesystem::path& path) const = 0;
};

// std::filesystem backed implementation
class LocalFileSystem : public FileSystem {
public:
    std::optional<FileStatus> status(const std::filesystem::path& path) const override;
    std::optional<std::vector<DirEntry>> list_directory(const std::filesystem::path& path) const override;
    std::optional<std::string> read_file(const std::filesystem::path& path) const override;
};

} // namespace serveit
