#include <catch2/catch_test_macros.hpp>
#include <mediaseek/stream/transfer.hpp>

#include "support/fakes.hpp"

#include <sstream>

using namespace mediaseek;
using namespace mediaseek::testing;

namespace {

class CollectingSink : public ChunkSink {
public:
    std::string received;
    size_t writes = 0;
    std::optional<size_t> fail_on_write;    // 1-based

    bool write(std::string_view chunk) override {
        ++writes;
        if (fail_on_write && writes >= *fail_on_write) {
            return false;
        }
        received.append(chunk);
        return true;
    }
};

StreamerOptions chunks_of(size_t n) {
    StreamerOptions options;
    options.chunk_size = n;
    return options;
}

} // anonymous namespace

TEST_CASE("Complete transfer", "[transfer]") {
    auto content = pattern_bytes(1000);
    RecordingSleeper sleeper;
    PartialReadStreamer stream(std::make_unique<ScriptedSource>(content, 1000),
                               RangeSpec{0, 999, 1000}, chunks_of(300), {},
                               sleeper, quiet_logger());
    CollectingSink sink;

    auto outcome = pump(stream, sink, nullptr, quiet_logger());
    CHECK(sink.received == content);
    CHECK(outcome.bytes_sent == 1000);
    CHECK(outcome.announced == 1000);
    CHECK(outcome.complete());
    CHECK(!outcome.must_abort_connection());
    CHECK(outcome.stream_outcome == StreamOutcome::Completed);
    CHECK(!outcome.failure);
}

TEST_CASE("Short transfer must abort the connection", "[transfer]") {
    RecordingSleeper sleeper;
    PartialReadStreamer stream(std::make_unique<ScriptedSource>(pattern_bytes(1000), 600),
                               RangeSpec{0, 999, 1000}, chunks_of(300), {},
                               sleeper, quiet_logger());
    CollectingSink sink;

    auto outcome = pump(stream, sink, nullptr, quiet_logger());
    CHECK(outcome.bytes_sent == 600);
    CHECK(outcome.announced == 1000);
    CHECK(outcome.must_abort_connection());
    CHECK(outcome.stream_outcome == StreamOutcome::RetriesExhausted);
    REQUIRE(outcome.failure);
    CHECK(outcome.failure->is(StreamError::SourceTemporarilyUnavailable));
}

TEST_CASE("Failing sink cancels the stream", "[transfer]") {
    CancellationSource cancel;
    auto source = std::make_unique<ScriptedSource>(pattern_bytes(1000), 1000);
    auto* raw = source.get();
    RecordingSleeper sleeper;
    PartialReadStreamer stream(std::move(source), RangeSpec{0, 999, 1000}, chunks_of(100),
                               cancel.token(), sleeper, quiet_logger());
    CollectingSink sink;
    sink.fail_on_write = 3;

    auto outcome = pump(stream, sink, &cancel, quiet_logger());
    CHECK(outcome.sink_failed);
    CHECK(outcome.bytes_sent == 200);
    CHECK(outcome.stream_outcome == StreamOutcome::Cancelled);
    REQUIRE(outcome.failure);
    CHECK(outcome.failure->is_cancelled());
    CHECK(cancel.is_cancelled());

    // No reads past the chunk the sink refused
    CHECK(raw->reads.size() == 3);
}

TEST_CASE("Ostream sink", "[transfer]") {
    std::ostringstream out;
    OstreamSink sink(out);
    CHECK(sink.write("abc"));
    CHECK(sink.write("def"));
    CHECK(out.str() == "abcdef");
}
