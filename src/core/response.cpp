#include "mediaseek/core/response.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mediaseek {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

std::optional<std::string_view> ResponseHead::header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers_) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::string ResponseHead::serialize() const {
    std::ostringstream oss;

    // Status line
    oss << "HTTP/1.1 " << status_ << " " << status_text_ << "\r\n";

    for (const auto& [key, value] : headers_) {
        oss << key << ": " << value << "\r\n";
    }

    // Empty line separating headers from body
    oss << "\r\n";

    return oss.str();
}

ResponseHead ResponseHead::partial_content(const RangeSpec& range, std::string_view content_type) {
    ResponseHead head(206);
    head.set_header("Content-Type", std::string(content_type));
    head.set_header("Accept-Ranges", "bytes");
    head.set_header("Content-Range", range.content_range());
    head.set_header("Content-Length", std::to_string(range.length()));
    return head;
}

ResponseHead ResponseHead::range_not_satisfiable(uint64_t total_size) {
    ResponseHead head(416);
    head.set_header("Content-Range", "bytes */" + std::to_string(total_size));
    head.set_header("Content-Length", "0");
    return head;
}

ResponseHead ResponseHead::from_error(const Error& error) {
    if (error.is(StreamError::RangeNotSatisfiable)) {
        return range_not_satisfiable(error.resource_size().value_or(0));
    }
    ResponseHead head(error.http_status());
    head.set_header("Content-Length", "0");
    return head;
}

std::string_view ResponseHead::default_status_text(int status) noexcept {
    switch (status) {
        // 2xx Success
        case 200: return "OK";
        case 206: return "Partial Content";

        // 4xx Client Errors
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 416: return "Range Not Satisfiable";
        case 422: return "Unprocessable Entity";
        case 499: return "Client Closed Request";

        // 5xx Server Errors
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";

        default: return "Unknown";
    }
}

} // namespace mediaseek
