#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace mediaseek {

class CancellationToken;
class CancellationSource;
class CancellationRegistration;

// ============================================================================
// CancellationState - Shared state between source and tokens
// ============================================================================

namespace detail {

class CancellationState {
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks_;

public:
    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    bool cancel() noexcept {
        bool expected = false;
        if (!cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        std::vector<std::pair<uint64_t, std::function<void()>>> cbs;
        {
            std::lock_guard lock(mutex_);
            cbs = std::move(callbacks_);
        }
        for (auto& [id, cb] : cbs) {
            if (cb) cb();
        }
        return true;
    }

    // Returns 0 when already cancelled; the callback has then run inline
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                uint64_t id = next_id_++;
                callbacks_.emplace_back(id, std::move(cb));
                return id;
            }
        }
        if (cb) cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::lock_guard lock(mutex_);
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == id) {
                callbacks_.erase(it);
                return;
            }
        }
    }
};

} // namespace detail

// ============================================================================
// CancellationRegistration - Removes its callback when destroyed
// ============================================================================

class CancellationRegistration {
    std::shared_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;

public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~CancellationRegistration() { reset(); }

    void reset() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        state_.reset();
        id_ = 0;
    }
};

// ============================================================================
// CancellationToken - Read-only view of cancellation state
// ============================================================================

class CancellationToken {
    std::shared_ptr<detail::CancellationState> state_;

    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

public:
    CancellationToken() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->is_cancelled();
    }

    // true while NOT cancelled
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    bool valid() const noexcept {
        return state_ != nullptr;
    }

    // Callback runs immediately if already cancelled. Keep the returned
    // registration alive for as long as the callback may run.
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const {
        if (!state_) {
            return {};
        }
        uint64_t id = state_->add_callback(std::move(callback));
        return CancellationRegistration{state_, id};
    }

    // A token that is never cancelled
    static CancellationToken none() {
        return CancellationToken{};
    }
};

// ============================================================================
// CancellationSource - Controls cancellation
// ============================================================================

class CancellationSource {
    std::shared_ptr<detail::CancellationState> state_;

public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const {
        return CancellationToken{state_};
    }

    bool cancel() noexcept {
        return state_ && state_->cancel();
    }

    bool is_cancelled() const noexcept {
        return state_ && state_->is_cancelled();
    }
};

// ============================================================================
// RAII guard: cancels on scope exit unless released
// ============================================================================

class CancellationGuard {
    CancellationSource* source_;

public:
    explicit CancellationGuard(CancellationSource& source) : source_(&source) {}

    CancellationGuard(const CancellationGuard&) = delete;
    CancellationGuard& operator=(const CancellationGuard&) = delete;

    ~CancellationGuard() {
        if (source_) source_->cancel();
    }

    void release() noexcept {
        source_ = nullptr;
    }
};

} // namespace mediaseek
