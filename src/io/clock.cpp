#include "mediaseek/io/clock.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

namespace mediaseek {

Clock& steady_clock() {
    static SteadyClock clock;
    return clock;
}

Sleeper& thread_sleeper() {
    static ThreadSleeper sleeper;
    return sleeper;
}

namespace {

// Outlives the wait: the cancellation callback may fire on another thread
// after sleep_for has returned
struct Waiter {
    std::mutex mutex;
    std::condition_variable cv;
    bool woken = false;
};

} // anonymous namespace

bool ThreadSleeper::sleep_for(std::chrono::milliseconds delay,
                              const CancellationToken& token) {
    if (token.is_cancelled()) {
        return false;
    }
    if (delay.count() <= 0) {
        return true;
    }

    auto waiter = std::make_shared<Waiter>();
    auto registration = token.on_cancel([waiter] {
        {
            std::lock_guard lock(waiter->mutex);
            waiter->woken = true;
        }
        waiter->cv.notify_all();
    });

    std::unique_lock lock(waiter->mutex);
    waiter->cv.wait_for(lock, delay, [&] { return waiter->woken; });
    return !token.is_cancelled();
}

} // namespace mediaseek
