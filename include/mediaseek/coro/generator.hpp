#pragma once

#include <coroutine>
#include <exception>
#include <iterator>
#include <optional>
#include <utility>

namespace mediaseek {

// ============================================================================
// Generator<T> - lazy, single-pass sequence produced by a coroutine
// ============================================================================
//
// The coroutine body runs only while the consumer advances. Destroying the
// generator destroys the suspended frame, so an abandoned sequence releases
// whatever the body holds (file handles, decompression buffers).

template<typename T>
class Generator {
public:
    struct promise_type;
    using handle_type = std::coroutine_handle<promise_type>;

    struct promise_type {
        std::optional<T> current_;
        std::exception_ptr exception_;

        Generator get_return_object() noexcept {
            return Generator{handle_type::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        std::suspend_always yield_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
            current_.emplace(std::move(value));
            return {};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept {
            exception_ = std::current_exception();
        }

        // Generators never co_await
        template<typename U>
        std::suspend_never await_transform(U&&) = delete;
    };

    class iterator {
        handle_type handle_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;

        iterator() noexcept = default;
        explicit iterator(handle_type h) noexcept : handle_(h) {}

        T& operator*() const { return *handle_.promise().current_; }
        T* operator->() const { return &*handle_.promise().current_; }

        iterator& operator++() {
            advance(handle_);
            return *this;
        }
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return !it.handle_ || it.handle_.done();
        }
    };

private:
    handle_type handle_;

    static void advance(handle_type h) {
        h.promise().current_.reset();
        h.resume();
        if (h.done() && h.promise().exception_) {
            std::rethrow_exception(std::exchange(h.promise().exception_, nullptr));
        }
    }

public:
    Generator() noexcept = default;
    explicit Generator(handle_type h) noexcept : handle_(h) {}

    Generator(Generator&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Generator& operator=(Generator&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    ~Generator() {
        if (handle_) handle_.destroy();
    }

    bool valid() const noexcept { return handle_ != nullptr; }

    // Resume to the next value; nullopt once the body has returned
    std::optional<T> next() {
        if (!handle_ || handle_.done()) {
            return std::nullopt;
        }
        advance(handle_);
        if (handle_.done()) {
            return std::nullopt;
        }
        return std::move(handle_.promise().current_);
    }

    // Single pass: begin() starts the body
    iterator begin() {
        if (handle_ && !handle_.done()) {
            advance(handle_);
        }
        return iterator{handle_};
    }

    std::default_sentinel_t end() const noexcept { return {}; }
};

} // namespace mediaseek
