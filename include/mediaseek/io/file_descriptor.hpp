#pragma once

#include <unistd.h>

namespace mediaseek {

// ============================================================================
// FileDescriptor - RAII wrapper for a POSIX file descriptor
// ============================================================================

class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_valid() const noexcept { return fd_ >= 0; }
    int get() const noexcept { return fd_; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
};

} // namespace mediaseek
