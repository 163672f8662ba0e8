#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mediaseek/archive/archive_index.hpp"
#include "mediaseek/core/error.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/core/range.hpp"
#include "mediaseek/core/response.hpp"
#include "mediaseek/coro/cancellation.hpp"
#include "mediaseek/io/clock.hpp"
#include "mediaseek/io/file_probe.hpp"
#include "mediaseek/stream/partial_read_streamer.hpp"
#include "mediaseek/stream/retry_policy.hpp"

namespace mediaseek {

// ============================================================================
// StreamServiceOptions
// ============================================================================

struct StreamServiceOptions {
    // Every reference resolves under this directory
    std::filesystem::path root;

    StreamerOptions streamer;

    // When a direct path does not exist, serve the first file under root
    // with the same file name
    bool find_by_name = true;

    // Cap on the span of one response for files under a directory named
    // `incomplete_dir_name`; nullopt disables the cap
    std::optional<uint64_t> max_incomplete_span = 10 * 1024 * 1024;
    std::string incomplete_dir_name = "incomplete";
};

// ============================================================================
// OpenedStream - everything the HTTP boundary needs to answer
// ============================================================================

struct OpenedStream {
    RangeSpec range;
    std::string content_type;
    ResponseHead head;              // 206 head
    PartialReadStreamer body;       // lazy chunks of `range`

    uint64_t content_length() const noexcept { return range.length(); }
};

// ============================================================================
// StreamService - resolve a reference and range into a ready stream
// ============================================================================
//
// A reference is either a path relative to the root, or an archive member
// "<archive path>|<member name>". Failures come back as an Error whose
// http_status() is the status to answer with; ResponseHead::from_error
// builds the matching head (416 carries "Content-Range: bytes */<total>").

class StreamService {
    StreamServiceOptions options_;
    Sleeper& sleeper_;
    const FileProbe& probe_;
    const Logger& logger_;

    Result<std::unique_ptr<ByteSource>> open_source(std::string_view reference,
                                                    std::filesystem::path& resolved) const;

public:
    explicit StreamService(StreamServiceOptions options,
                           Sleeper& sleeper = thread_sleeper(),
                           const FileProbe& probe = local_file_probe(),
                           const Logger& logger = default_logger());

    Result<OpenedStream> open(std::string_view reference,
                              std::optional<std::string_view> range_header,
                              CancellationToken token = {}) const;

    // Path under the root for a relative reference, with the find-by-name
    // fallback. AccessDenied when it escapes the root, NotFound when absent.
    Result<std::filesystem::path> resolve_path(std::string_view relative) const;

    // Member listing of an archive given relative to the root
    Result<std::vector<ArchiveEntry>> list_archive(std::string_view relative) const;

    // True when `path` lies under the root once canonicalized
    bool is_path_allowed(const std::filesystem::path& path) const;

    // True when `path` has a component named incomplete_dir_name
    bool is_incomplete(const std::filesystem::path& path) const;

    const StreamServiceOptions& options() const noexcept { return options_; }
};

} // namespace mediaseek
