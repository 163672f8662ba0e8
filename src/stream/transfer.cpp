#include "mediaseek/stream/transfer.hpp"

namespace mediaseek {

TransferOutcome pump(PartialReadStreamer& stream,
                     ChunkSink& sink,
                     CancellationSource* cancel,
                     const Logger& logger) {
    TransferOutcome outcome;
    outcome.announced = stream.range().length();

    while (auto chunk = stream.next()) {
        if (!sink.write(*chunk)) {
            outcome.sink_failed = true;
            if (cancel) {
                cancel->cancel();
            }
            break;
        }
        outcome.bytes_sent += chunk->size();
    }

    if (outcome.sink_failed) {
        outcome.stream_outcome = StreamOutcome::Cancelled;
        outcome.failure = Error::cancelled();
    } else {
        outcome.stream_outcome = stream.stats().outcome;
        outcome.failure = stream.stats().failure;
    }

    if (outcome.must_abort_connection()) {
        logger.log(logger.entry(LogLevel::Warn, "Short transfer, connection must be aborted")
            .field("range", stream.range().content_range())
            .field("sent", outcome.bytes_sent)
            .field("announced", outcome.announced)
            .field("outcome", stream_outcome_name(outcome.stream_outcome))
            .field("error", outcome.failure ? outcome.failure->to_string() : std::string("-")));
    }

    return outcome;
}

} // namespace mediaseek
