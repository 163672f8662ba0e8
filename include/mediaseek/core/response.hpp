#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mediaseek/core/error.hpp"
#include "mediaseek/core/range.hpp"

namespace mediaseek {

// ============================================================================
// ResponseHead - status line and headers of a ranged response
// ============================================================================
//
// The body is streamed separately, so only the head is modelled here.

class ResponseHead {
public:
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

private:
    int status_ = 200;
    std::string status_text_ = "OK";
    Headers headers_;

public:
    ResponseHead() = default;
    explicit ResponseHead(int status)
        : status_(status), status_text_(default_status_text(status)) {}

    int status() const noexcept { return status_; }
    std::string_view status_text() const noexcept { return status_text_; }
    const Headers& headers() const noexcept { return headers_; }

    // Case-insensitive lookup
    std::optional<std::string_view> header(std::string_view name) const noexcept;

    void set_header(std::string key, std::string value) {
        for (auto& [k, v] : headers_) {
            if (k == key) {
                v = std::move(value);
                return;
            }
        }
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void set_status(int status) {
        status_ = status;
        status_text_ = default_status_text(status);
    }

    // "HTTP/1.1 <status> <text>\r\n" + headers + blank line
    std::string serialize() const;

    // 206 with Content-Range, Accept-Ranges, Content-Length and Content-Type.
    // Also used when the client sent no Range header, so that it learns
    // seeking is supported.
    static ResponseHead partial_content(const RangeSpec& range, std::string_view content_type);

    // 416 with "Content-Range: bytes */<total>"
    static ResponseHead range_not_satisfiable(uint64_t total_size);

    // Head for any failed open; 416 keeps its Content-Range
    static ResponseHead from_error(const Error& error);

    static std::string_view default_status_text(int status) noexcept;
};

} // namespace mediaseek
