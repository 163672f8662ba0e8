#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "mediaseek/core/error.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/stream/retry_policy.hpp"
#include "mediaseek/stream/stream_service.hpp"
#include "mediaseek/watch/extraction_scheduler.hpp"
#include "mediaseek/watch/extractor.hpp"

namespace mediaseek {

// ============================================================================
// Config - process settings, loaded from MEDIASEEK_* environment variables
// ============================================================================

struct Config {
    // Media root served and watched
    std::filesystem::path root = ".";

    // Streaming
    size_t chunk_size = 256 * 1024;
    uint32_t max_retries = 30;
    uint32_t end_seek_retries = 3;
    uint64_t max_incomplete_span = 10 * 1024 * 1024;   // 0 disables the cap

    // Extraction
    std::chrono::seconds stable_window{30};
    std::chrono::seconds scan_interval{10};
    std::chrono::seconds extract_timeout{300};
    size_t extract_workers = 1;
    std::string sevenzip_program = "7z";

    // Logging
    LogLevel log_level = LogLevel::Info;
    std::string log_format = "console";

    using Lookup = std::function<std::optional<std::string>(std::string_view)>;

    // Load configuration from environment variables
    static Result<Config> from_env();

    // Same, reading variables through `lookup`
    static Result<Config> from_lookup(const Lookup& lookup);

    StreamerOptions streamer_options() const;
    StreamServiceOptions service_options() const;
    SchedulerOptions scheduler_options() const;
    SevenZipOptions sevenzip_options() const;
};

} // namespace mediaseek
