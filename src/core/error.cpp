#include "mediaseek/core/error.hpp"
#include <sstream>

namespace mediaseek {

// ============================================================================
// StreamError Category
// ============================================================================

namespace {

class StreamErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "mediaseek.stream";
    }

    std::string message(int ev) const override {
        switch (static_cast<StreamError>(ev)) {
            case StreamError::Success: return "Success";
            case StreamError::RangeNotSatisfiable: return "Range not satisfiable";
            case StreamError::SourceTemporarilyUnavailable: return "Source temporarily unavailable";
            case StreamError::NotFound: return "Resource not found";
            case StreamError::AccessDenied: return "Access denied";
            case StreamError::InvalidReference: return "Invalid resource reference";
            case StreamError::ReadFailed: return "Read failed";
            case StreamError::Cancelled: return "Cancelled";
            case StreamError::ArchiveUnreadable: return "Archive unreadable";
            case StreamError::MemberNotFound: return "Archive member not found";
            case StreamError::ExtractionIncomplete: return "Archive data incomplete";
            case StreamError::ExtractionFailed: return "Extraction failed";
            case StreamError::InvalidConfig: return "Invalid configuration";
            default: return "Unknown stream error";
        }
    }
};

const StreamErrorCategory stream_category_instance{};

} // anonymous namespace

const std::error_category& stream_error_category() noexcept {
    return stream_category_instance;
}

std::error_code make_error_code(StreamError e) noexcept {
    return {static_cast<int>(e), stream_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

std::error_code Error::code() const noexcept {
    if (is_stream()) {
        return make_error_code(std::get<StreamError>(inner_));
    }
    return std::get<std::error_code>(inner_);
}

int Error::http_status() const noexcept {
    if (is_system()) {
        auto ec = std::get<std::error_code>(inner_);
        if (ec == std::errc::no_such_file_or_directory) return 404;
        if (ec == std::errc::permission_denied) return 403;
        return 500;
    }
    switch (std::get<StreamError>(inner_)) {
        case StreamError::Success: return 200;
        case StreamError::RangeNotSatisfiable: return 416;
        case StreamError::SourceTemporarilyUnavailable: return 503;
        case StreamError::NotFound: return 404;
        case StreamError::AccessDenied: return 403;
        case StreamError::InvalidReference: return 400;
        case StreamError::Cancelled: return 499;  // Client Closed Request
        case StreamError::ArchiveUnreadable: return 422;
        case StreamError::MemberNotFound: return 404;
        case StreamError::ExtractionIncomplete:
        case StreamError::ExtractionFailed: return 503;
        default: return 500;
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;

    if (is_stream()) {
        oss << "StreamError::" << stream_error_category().message(
            static_cast<int>(std::get<StreamError>(inner_)));
    } else {
        auto ec = std::get<std::error_code>(inner_);
        oss << "SystemError::" << ec.category().name() << ":" << ec.value() << " " << ec.message();
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace mediaseek
