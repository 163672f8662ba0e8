#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "mediaseek/core/logging.hpp"
#include "mediaseek/io/clock.hpp"

namespace mediaseek {

// ============================================================================
// StabilityTracker - has a file stopped growing?
// ============================================================================

enum class StabilityState {
    Unseen,
    Growing,
    Stable
};

std::string_view stability_state_name(StabilityState state) noexcept;

struct StabilityEntry {
    std::filesystem::path path;
    uint64_t last_size = 0;
    Clock::time_point last_seen_at;     // time of the last observed size change
};

// A path is Stable once its size has not changed for at least `window`.
// The first observation and any size change report Growing and restart the
// window. Thread safe.
class StabilityTracker {
    struct Record {
        uint64_t last_size = 0;
        Clock::time_point last_seen_at;
        bool reported_stable = false;
    };

    Clock::duration window_;
    const Logger* logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> records_;

public:
    explicit StabilityTracker(Clock::duration window = std::chrono::seconds(30),
                              const Logger& logger = default_logger())
        : window_(window), logger_(&logger) {}

    StabilityTracker(const StabilityTracker&) = delete;
    StabilityTracker& operator=(const StabilityTracker&) = delete;

    // Record the current size of `path` and report its state
    StabilityState observe(const std::filesystem::path& path, uint64_t size, Clock::time_point now);

    // State without recording anything; Unseen for unknown paths
    StabilityState state(const std::filesystem::path& path, Clock::time_point now) const;

    std::optional<StabilityEntry> entry(const std::filesystem::path& path) const;

    // Drop the entry; the next observation starts from Unseen
    void forget(const std::filesystem::path& path);

    size_t size() const;
    Clock::duration window() const noexcept { return window_; }
};

} // namespace mediaseek
