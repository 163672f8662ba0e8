#include "mediaseek/watch/stability_tracker.hpp"

namespace mediaseek {

std::string_view stability_state_name(StabilityState state) noexcept {
    switch (state) {
        case StabilityState::Unseen: return "unseen";
        case StabilityState::Growing: return "growing";
        case StabilityState::Stable: return "stable";
        default: return "unknown";
    }
}

StabilityState StabilityTracker::observe(const std::filesystem::path& path,
                                         uint64_t size,
                                         Clock::time_point now) {
    std::unique_lock lock(mutex_);

    auto key = path.string();
    auto it = records_.find(key);
    if (it == records_.end()) {
        records_.emplace(key, Record{size, now, false});
        lock.unlock();
        logger_->log(logger_->entry(LogLevel::Debug, "Tracking file")
            .field("path", key)
            .field("size", size));
        return StabilityState::Growing;
    }

    Record& record = it->second;
    if (record.last_size != size) {
        uint64_t previous = record.last_size;
        record.last_size = size;
        // last_seen_at never moves backwards
        if (now > record.last_seen_at) {
            record.last_seen_at = now;
        }
        record.reported_stable = false;
        lock.unlock();
        logger_->log(logger_->entry(LogLevel::Debug, "File still growing")
            .field("path", key)
            .field("previous", previous)
            .field("size", size));
        return StabilityState::Growing;
    }

    if (now < record.last_seen_at || now - record.last_seen_at < window_) {
        return StabilityState::Growing;
    }

    bool first_report = !record.reported_stable;
    record.reported_stable = true;
    lock.unlock();

    if (first_report) {
        logger_->log(logger_->entry(LogLevel::Info, "File stable")
            .field("path", key)
            .field("size", size));
    }
    return StabilityState::Stable;
}

StabilityState StabilityTracker::state(const std::filesystem::path& path, Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(path.string());
    if (it == records_.end()) {
        return StabilityState::Unseen;
    }
    const Record& record = it->second;
    if (now < record.last_seen_at || now - record.last_seen_at < window_) {
        return StabilityState::Growing;
    }
    return StabilityState::Stable;
}

std::optional<StabilityEntry> StabilityTracker::entry(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(path.string());
    if (it == records_.end()) {
        return std::nullopt;
    }
    return StabilityEntry{path, it->second.last_size, it->second.last_seen_at};
}

void StabilityTracker::forget(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    records_.erase(path.string());
}

size_t StabilityTracker::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

} // namespace mediaseek
