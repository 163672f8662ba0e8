#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "mediaseek/core/error.hpp"

namespace mediaseek {

// ============================================================================
// RangeSpec - resolved inclusive byte range against a known total
// ============================================================================

// Invariant: start <= end < total
struct RangeSpec {
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t total = 0;

    uint64_t length() const noexcept { return end - start + 1; }

    // "bytes start-end/total"
    std::string content_range() const;

    // Position of the range start as a percentage of the resource
    double start_percent() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(start) * 100.0 / static_cast<double>(total);
    }

    bool operator==(const RangeSpec&) const = default;
};

// ============================================================================
// Range Parsing
// ============================================================================

namespace range {

// Leading "bytes=<start>-<end>?" of a Range header. Only the first range of a
// multi-range request is considered; suffix ranges ("bytes=-500") have no
// numeric start and do not parse, nor does an end before the start.
struct RequestedRange {
    uint64_t start = 0;
    std::optional<uint64_t> end;
};

std::optional<RequestedRange> parse(std::string_view header);

// Resolve a Range header against the resource size.
//   absent or malformed  -> [0, total-1]
//   end < start          -> malformed, [0, total-1]
//   end missing          -> end = total-1
//   end >= total         -> clamped to total-1
//   start >= total       -> RangeNotSatisfiable (checked before clamping)
//   total == 0           -> RangeNotSatisfiable
Result<RangeSpec> resolve(std::optional<std::string_view> header, uint64_t total);

// Resolve an already parsed request
Result<RangeSpec> resolve(const RequestedRange& requested, uint64_t total);

} // namespace range

} // namespace mediaseek
