#include "mediaseek/core/range.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>

namespace mediaseek {

// ============================================================================
// RangeSpec Implementation
// ============================================================================

std::string RangeSpec::content_range() const {
    std::ostringstream oss;
    oss << "bytes " << start << "-" << end << "/" << total;
    return oss.str();
}

// ============================================================================
// Range Parsing
// ============================================================================

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

size_t count_digits(std::string_view s) {
    size_t n = 0;
    while (n < s.size() && std::isdigit(static_cast<unsigned char>(s[n]))) {
        ++n;
    }
    return n;
}

// Saturates instead of failing: an absurdly large start is still "beyond
// the end" and an absurdly large end still clamps
uint64_t parse_digits(std::string_view digits) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<uint64_t>::max();
    }
    return value;
}

} // anonymous namespace

namespace range {

std::optional<RequestedRange> parse(std::string_view header) {
    header = trim(header);

    constexpr std::string_view prefix = "bytes=";
    if (!header.starts_with(prefix)) {
        return std::nullopt;
    }
    header.remove_prefix(prefix.size());

    size_t start_len = count_digits(header);
    if (start_len == 0 || start_len >= header.size() || header[start_len] != '-') {
        return std::nullopt;
    }

    RequestedRange result;
    result.start = parse_digits(header.substr(0, start_len));

    auto rest = header.substr(start_len + 1);
    size_t end_len = count_digits(rest);
    if (end_len > 0) {
        result.end = parse_digits(rest.substr(0, end_len));
        // "bytes=500-100" is not a valid byte-range-spec
        if (*result.end < result.start) {
            return std::nullopt;
        }
    }

    return result;
}

Result<RangeSpec> resolve(const RequestedRange& requested, uint64_t total) {
    if (total == 0 || requested.start >= total) {
        return unexpected(Error::range_not_satisfiable(total));
    }

    uint64_t end = requested.end.value_or(total - 1);
    if (end < requested.start) {
        return RangeSpec{0, total - 1, total};
    }
    if (end >= total) {
        end = total - 1;
    }

    return RangeSpec{requested.start, end, total};
}

Result<RangeSpec> resolve(std::optional<std::string_view> header, uint64_t total) {
    std::optional<RequestedRange> requested;
    if (header) {
        requested = parse(*header);
    }
    return resolve(requested.value_or(RequestedRange{}), total);
}

} // namespace range

} // namespace mediaseek
