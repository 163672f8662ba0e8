#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include "mediaseek/util/expected.hpp"

namespace mediaseek {

// ============================================================================
// Stream Errors
// ============================================================================

enum class StreamError {
    Success = 0,

    // Request-facing
    RangeNotSatisfiable,
    SourceTemporarilyUnavailable,
    NotFound,
    AccessDenied,
    InvalidReference,
    ReadFailed,
    Cancelled,

    // Archive access
    ArchiveUnreadable,
    MemberNotFound,

    // Background extraction (never surfaced to a request)
    ExtractionIncomplete,
    ExtractionFailed,

    InvalidConfig
};

} // namespace mediaseek

template<>
struct std::is_error_code_enum<mediaseek::StreamError> : std::true_type {};

namespace mediaseek {

const std::error_category& stream_error_category() noexcept;
std::error_code make_error_code(StreamError e) noexcept;

// ============================================================================
// Error
// ============================================================================

class Error {
public:
    using Variant = std::variant<StreamError, std::error_code>;

private:
    Variant inner_;
    std::string message_;
    std::optional<uint64_t> resource_size_;  // set for RangeNotSatisfiable

public:
    Error() : inner_(StreamError::Success) {}

    Error(StreamError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(std::error_code ec, std::string message = "")
        : inner_(ec), message_(std::move(message)) {}

    // Factory methods
    static Error range_not_satisfiable(uint64_t total_size) {
        Error e(StreamError::RangeNotSatisfiable,
                "Requested range starts beyond " + std::to_string(total_size) + " bytes");
        e.resource_size_ = total_size;
        return e;
    }

    static Error not_found(std::string what) {
        return Error(StreamError::NotFound, std::move(what));
    }

    static Error invalid_reference(std::string what) {
        return Error(StreamError::InvalidReference, std::move(what));
    }

    static Error archive_unreadable(std::string what) {
        return Error(StreamError::ArchiveUnreadable, std::move(what));
    }

    static Error system(std::error_code ec, std::string what = "") {
        return Error(ec, std::move(what));
    }

    static Error source_unavailable(uint64_t offset, uint32_t retries) {
        return Error(StreamError::SourceTemporarilyUnavailable,
                     "No data at offset " + std::to_string(offset) + " after " +
                     std::to_string(retries) + " retries");
    }

    static Error cancelled() {
        return Error(StreamError::Cancelled, "Consumer went away");
    }

    // Type checks
    bool is_stream() const noexcept {
        return std::holds_alternative<StreamError>(inner_);
    }

    bool is_system() const noexcept {
        return std::holds_alternative<std::error_code>(inner_);
    }

    bool is(StreamError e) const noexcept {
        return is_stream() && std::get<StreamError>(inner_) == e;
    }

    bool is_cancelled() const noexcept { return is(StreamError::Cancelled); }

    // Archive-class errors exclude the archive from results instead of retrying
    bool is_archive_error() const noexcept {
        return is(StreamError::ArchiveUnreadable) || is(StreamError::MemberNotFound);
    }

    // Accessors
    StreamError stream_error() const noexcept {
        return is_stream() ? std::get<StreamError>(inner_) : StreamError::ReadFailed;
    }

    std::error_code system_error() const noexcept {
        return is_system() ? std::get<std::error_code>(inner_) : std::error_code{};
    }

    std::optional<uint64_t> resource_size() const noexcept { return resource_size_; }

    std::error_code code() const noexcept;

    // Status the HTTP boundary answers with
    int http_status() const noexcept;

    std::string_view message() const noexcept { return message_; }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }

    explicit operator bool() const noexcept {
        if (is_stream()) return std::get<StreamError>(inner_) != StreamError::Success;
        return static_cast<bool>(std::get<std::error_code>(inner_));
    }
};

// ============================================================================
// Result type alias
// ============================================================================

template<typename T>
using Result = expected<T, Error>;

} // namespace mediaseek
