#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "mediaseek/core/error.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/core/range.hpp"
#include "mediaseek/coro/cancellation.hpp"
#include "mediaseek/coro/generator.hpp"
#include "mediaseek/io/byte_source.hpp"
#include "mediaseek/io/clock.hpp"
#include "mediaseek/stream/retry_policy.hpp"

namespace mediaseek {

// ============================================================================
// Stream statistics
// ============================================================================

enum class StreamOutcome {
    InProgress,
    Completed,          // every byte of the range was emitted
    RetriesExhausted,   // source stayed empty past the retry budget
    Cancelled,          // consumer went away
    ReadFailed          // the source reported an I/O error
};

std::string_view stream_outcome_name(StreamOutcome outcome) noexcept;

struct StreamStats {
    uint64_t bytes_emitted = 0;
    uint32_t retries = 0;       // backoff waits performed in total
    StreamOutcome outcome = StreamOutcome::InProgress;
    // Why the stream ended early: the read error for ReadFailed,
    // SourceTemporarilyUnavailable for RetriesExhausted, Cancelled for Cancelled
    std::optional<Error> failure;
};

// ============================================================================
// PartialReadStreamer
// ============================================================================
//
// Lazily produces the bytes of `range` from `source` in chunks of at most
// options.chunk_size. An empty read before the range is exhausted means the
// bytes are not materialized yet: the streamer backs off and retries within
// the policy's budget, then ends early. The concatenated output is always the
// requested range or a strict prefix of it.
//
// The streamer owns its source. The sequence is single pass.

class PartialReadStreamer {
    std::shared_ptr<StreamStats> stats_;
    RangeSpec range_;
    Generator<std::string> chunks_;

    static Generator<std::string> run(std::unique_ptr<ByteSource> source,
                                      RangeSpec range,
                                      StreamerOptions options,
                                      CancellationToken token,
                                      Sleeper& sleeper,
                                      const Logger& logger,
                                      std::shared_ptr<StreamStats> stats);

public:
    PartialReadStreamer(std::unique_ptr<ByteSource> source,
                        RangeSpec range,
                        StreamerOptions options = {},
                        CancellationToken token = {},
                        Sleeper& sleeper = thread_sleeper(),
                        const Logger& logger = default_logger());

    PartialReadStreamer(PartialReadStreamer&&) noexcept = default;
    PartialReadStreamer& operator=(PartialReadStreamer&&) noexcept = default;

    // Next chunk, or nullopt once the sequence has ended
    std::optional<std::string> next() { return chunks_.next(); }

    auto begin() { return chunks_.begin(); }
    auto end() { return chunks_.end(); }

    const RangeSpec& range() const noexcept { return range_; }
    const StreamStats& stats() const noexcept { return *stats_; }
};

} // namespace mediaseek
