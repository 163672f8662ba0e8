#include "mediaseek/io/byte_source.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mediaseek {

// ============================================================================
// DirectFileSource
// ============================================================================

Result<std::unique_ptr<DirectFileSource>> DirectFileSource::open(const std::filesystem::path& path) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.is_valid()) {
        return unexpected(Error::system(
            std::error_code(errno, std::system_category()), path.string()));
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return unexpected(Error::system(
            std::error_code(errno, std::system_category()), path.string()));
    }
    if (S_ISDIR(st.st_mode)) {
        return unexpected(Error::not_found(path.string() + " is a directory"));
    }

    return std::unique_ptr<DirectFileSource>(
        new DirectFileSource(path, std::move(fd), static_cast<uint64_t>(st.st_size)));
}

Result<std::string> DirectFileSource::read_at(uint64_t offset, size_t max_len) {
    std::string buffer(max_len, '\0');
    size_t filled = 0;

    while (filled < max_len) {
        ssize_t n = ::pread(fd_.get(), buffer.data() + filled, max_len - filled,
                            static_cast<off_t>(offset + filled));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unexpected(Error(StreamError::ReadFailed,
                path_.string() + ": " + std::error_code(errno, std::system_category()).message()));
        }
        if (n == 0) {
            break;  // end of what has been written so far
        }
        filled += static_cast<size_t>(n);
    }

    buffer.resize(filled);
    return buffer;
}

} // namespace mediaseek
