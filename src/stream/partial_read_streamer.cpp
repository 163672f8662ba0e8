#include "mediaseek/stream/partial_read_streamer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mediaseek {

std::string_view stream_outcome_name(StreamOutcome outcome) noexcept {
    switch (outcome) {
        case StreamOutcome::InProgress: return "in_progress";
        case StreamOutcome::Completed: return "completed";
        case StreamOutcome::RetriesExhausted: return "retries_exhausted";
        case StreamOutcome::Cancelled: return "cancelled";
        case StreamOutcome::ReadFailed: return "read_failed";
        default: return "unknown";
    }
}

namespace {

std::string percent(uint64_t cursor, uint64_t total) {
    std::ostringstream oss;
    double pct = total == 0 ? 0.0 : static_cast<double>(cursor) * 100.0 / static_cast<double>(total);
    oss << std::fixed << std::setprecision(1) << pct << "%";
    return oss.str();
}

// Wait progress is logged on the first stall and then every N waits
constexpr uint32_t progress_log_interval = 10;

} // anonymous namespace

PartialReadStreamer::PartialReadStreamer(std::unique_ptr<ByteSource> source,
                                         RangeSpec range,
                                         StreamerOptions options,
                                         CancellationToken token,
                                         Sleeper& sleeper,
                                         const Logger& logger)
    : stats_(std::make_shared<StreamStats>())
    , range_(range)
    , chunks_(run(std::move(source), range, options, std::move(token), sleeper, logger, stats_)) {}

Generator<std::string> PartialReadStreamer::run(std::unique_ptr<ByteSource> source,
                                                RangeSpec range,
                                                StreamerOptions options,
                                                CancellationToken token,
                                                Sleeper& sleeper,
                                                const Logger& logger,
                                                std::shared_ptr<StreamStats> stats) {
    const size_t chunk_size = std::max<size_t>(options.chunk_size, 1);
    const RetryPolicy& policy = options.retry;

    uint64_t remaining = range.length();
    uint64_t cursor = range.start;
    uint32_t eof_retries = 0;

    if (logger.is_enabled(LogLevel::Debug)) {
        logger.log(logger.entry(LogLevel::Debug, "Stream started")
            .field("source", source->describe())
            .field("range", range.content_range()));
    }

    while (remaining > 0) {
        if (token.is_cancelled()) {
            stats->outcome = StreamOutcome::Cancelled;
            stats->failure = Error::cancelled();
            break;
        }

        size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size, remaining));
        auto data = source->read_at(cursor, want);
        if (!data) {
            logger.log(logger.entry(LogLevel::Error, "Read failed")
                .field("source", source->describe())
                .field("offset", cursor)
                .field("error", data.error().to_string()));
            stats->failure = data.error();
            stats->outcome = StreamOutcome::ReadFailed;
            break;
        }

        if (!data->empty()) {
            if (data->size() > remaining) {
                data->resize(static_cast<size_t>(remaining));
            }
            cursor += data->size();
            remaining -= data->size();
            stats->bytes_emitted += data->size();
            eof_retries = 0;
            co_yield std::move(*data);
            continue;
        }

        // Not materialized yet
        uint32_t budget = policy.budget_for(cursor, range.total);
        if (eof_retries >= budget) {
            logger.log(logger.entry(LogLevel::Warn, "Gave up waiting for data")
                .field("source", source->describe())
                .field("retries", eof_retries)
                .field("sent", stats->bytes_emitted)
                .field("requested", range.length())
                .field("end_seek", policy.is_end_seek(cursor, range.total)));
            stats->outcome = StreamOutcome::RetriesExhausted;
            stats->failure = Error::source_unavailable(cursor, eof_retries);
            break;
        }

        ++eof_retries;
        ++stats->retries;

        if (eof_retries == 1) {
            logger.log(logger.entry(LogLevel::Info, "Hit end of available data, waiting")
                .field("source", source->describe())
                .field("position", percent(cursor, range.total))
                .field("sent", stats->bytes_emitted)
                .field("requested", range.length()));
        } else if (eof_retries % progress_log_interval == 0) {
            logger.log(logger.entry(LogLevel::Debug, "Still waiting for data")
                .field("source", source->describe())
                .field("retries", eof_retries)
                .field("budget", budget));
        }

        if (!sleeper.sleep_for(policy.delay_for(eof_retries), token)) {
            stats->outcome = StreamOutcome::Cancelled;
            stats->failure = Error::cancelled();
            break;
        }
    }

    if (remaining == 0) {
        stats->outcome = StreamOutcome::Completed;
    }

    if (logger.is_enabled(LogLevel::Debug)) {
        logger.log(logger.entry(LogLevel::Debug, "Stream finished")
            .field("source", source->describe())
            .field("outcome", stream_outcome_name(stats->outcome))
            .field("bytes", stats->bytes_emitted)
            .field("retries", stats->retries));
    }
}

} // namespace mediaseek
