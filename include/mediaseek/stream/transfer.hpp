#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include "mediaseek/coro/cancellation.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/stream/partial_read_streamer.hpp"

namespace mediaseek {

// ============================================================================
// ChunkSink - the consumer end of a transfer (socket, pipe, buffer)
// ============================================================================

class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    // false when the consumer can no longer accept data
    virtual bool write(std::string_view chunk) = 0;
};

class OstreamSink : public ChunkSink {
    std::ostream& out_;

public:
    explicit OstreamSink(std::ostream& out) : out_(out) {}

    bool write(std::string_view chunk) override {
        out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        return static_cast<bool>(out_);
    }
};

// ============================================================================
// TransferOutcome
// ============================================================================

struct TransferOutcome {
    uint64_t bytes_sent = 0;
    uint64_t announced = 0;     // the Content-Length promised in the head
    StreamOutcome stream_outcome = StreamOutcome::InProgress;
    bool sink_failed = false;
    std::optional<Error> failure;   // why the body is short, when it is

    bool complete() const noexcept { return bytes_sent == announced; }

    // A short body under a fixed Content-Length must not be finished as if it
    // were whole; the connection has to be dropped instead
    bool must_abort_connection() const noexcept { return !complete(); }
};

// Drive `stream` into `sink`. A failing sink cancels `cancel` (when given)
// and stops the transfer.
TransferOutcome pump(PartialReadStreamer& stream,
                     ChunkSink& sink,
                     CancellationSource* cancel = nullptr,
                     const Logger& logger = default_logger());

} // namespace mediaseek
