#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace mediaseek {

// ============================================================================
// FileProbe - read-only view of the filesystem
// ============================================================================
//
// Everything that decides based on file sizes and directory contents goes
// through this interface so it can be scripted in tests.

class FileProbe {
public:
    virtual ~FileProbe() = default;

    // Size of a regular file; nullopt when missing or not a regular file
    virtual std::optional<uint64_t> file_size(const std::filesystem::path& path) const = 0;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    // Regular files under `root`, recursively, in a stable (sorted) order
    virtual std::vector<std::filesystem::path> list_files(const std::filesystem::path& root) const = 0;
};

class LocalFileProbe : public FileProbe {
public:
    std::optional<uint64_t> file_size(const std::filesystem::path& path) const override;
    bool exists(const std::filesystem::path& path) const override;
    std::vector<std::filesystem::path> list_files(const std::filesystem::path& root) const override;
};

const FileProbe& local_file_probe();

} // namespace mediaseek
