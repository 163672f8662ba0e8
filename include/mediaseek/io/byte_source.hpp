#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "mediaseek/core/error.hpp"
#include "mediaseek/io/file_descriptor.hpp"

namespace mediaseek {

// ============================================================================
// ByteSource - a place bytes can be read from at an offset
// ============================================================================
//
// size() is the size the resource will have once fully materialized. A read
// at an offset below size() may come back empty while the bytes are still
// being written; the caller decides whether to wait.

class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    // At most max_len bytes starting at offset. Empty means "nothing there
    // yet" (or past the end). An error means the read itself failed.
    virtual Result<std::string> read_at(uint64_t offset, size_t max_len) = 0;

    // Human readable identity for logs
    virtual std::string describe() const = 0;
};

// ============================================================================
// DirectFileSource - positioned reads from a file on disk
// ============================================================================

class DirectFileSource : public ByteSource {
    std::filesystem::path path_;
    FileDescriptor fd_;
    uint64_t size_ = 0;

    DirectFileSource(std::filesystem::path path, FileDescriptor fd, uint64_t size)
        : path_(std::move(path)), fd_(std::move(fd)), size_(size) {}

public:
    // Size is taken once at open time
    static Result<std::unique_ptr<DirectFileSource>> open(const std::filesystem::path& path);

    uint64_t size() const override { return size_; }
    Result<std::string> read_at(uint64_t offset, size_t max_len) override;
    std::string describe() const override { return path_.string(); }

    const std::filesystem::path& path() const noexcept { return path_; }
};

// ============================================================================
// MemorySource - bytes already held in memory
// ============================================================================

class MemorySource : public ByteSource {
    std::string data_;
    std::string name_;

public:
    MemorySource(std::string data, std::string name)
        : data_(std::move(data)), name_(std::move(name)) {}

    uint64_t size() const override { return data_.size(); }

    Result<std::string> read_at(uint64_t offset, size_t max_len) override {
        if (offset >= data_.size()) {
            return std::string{};
        }
        return data_.substr(static_cast<size_t>(offset), max_len);
    }

    std::string describe() const override { return name_; }
};

} // namespace mediaseek
