#pragma once

#include <chrono>

#include "mediaseek/coro/cancellation.hpp"

namespace mediaseek {

// ============================================================================
// Clock - monotonic time source
// ============================================================================

class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Shared process instance
Clock& steady_clock();

// ============================================================================
// Sleeper - interruptible wait
// ============================================================================

class Sleeper {
public:
    virtual ~Sleeper() = default;

    // Wait for `delay` or until `token` is cancelled.
    // Returns false when the wait ended because of cancellation.
    virtual bool sleep_for(std::chrono::milliseconds delay,
                           const CancellationToken& token) = 0;
};

// Blocks the calling thread on a condition variable woken by cancellation
class ThreadSleeper : public Sleeper {
public:
    bool sleep_for(std::chrono::milliseconds delay,
                   const CancellationToken& token) override;
};

Sleeper& thread_sleeper();

} // namespace mediaseek
