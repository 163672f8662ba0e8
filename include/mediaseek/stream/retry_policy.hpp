#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace mediaseek {

// ============================================================================
// RetryPolicy - how long to wait for bytes that are not there yet
// ============================================================================

struct RetryPolicy {
    // Waits allowed for one stall away from the end of the resource
    uint32_t max_retries = 30;

    // Waits allowed once the cursor is past end_seek_threshold of the
    // resource. Players probe the tail for duration and index data and must
    // not be stalled.
    uint32_t end_seek_retries = 3;
    double end_seek_threshold = 0.9;
    bool shorten_near_end = true;

    std::chrono::milliseconds initial_delay{100};
    double multiplier = 1.5;
    std::chrono::milliseconds max_delay{1000};

    bool is_end_seek(uint64_t cursor, uint64_t total) const noexcept {
        if (!shorten_near_end || total == 0) {
            return false;
        }
        return static_cast<double>(cursor) / static_cast<double>(total) > end_seek_threshold;
    }

    uint32_t budget_for(uint64_t cursor, uint64_t total) const noexcept {
        return is_end_seek(cursor, total) ? end_seek_retries : max_retries;
    }

    // Delay before attempt n (1-based): min(max_delay, initial * multiplier^(n-1))
    std::chrono::milliseconds delay_for(uint32_t attempt) const noexcept {
        if (attempt <= 1) {
            return std::min(initial_delay, max_delay);
        }
        double scaled = static_cast<double>(initial_delay.count()) *
                        std::pow(multiplier, static_cast<double>(attempt - 1));
        double cap = static_cast<double>(max_delay.count());
        return std::chrono::milliseconds(static_cast<int64_t>(std::min(scaled, cap)));
    }
};

// ============================================================================
// StreamerOptions
// ============================================================================

struct StreamerOptions {
    size_t chunk_size = 256 * 1024;
    RetryPolicy retry;
};

} // namespace mediaseek
