#include <catch2/catch_test_macros.hpp>
#include <mediaseek/watch/extractor.hpp>

#include "support/fakes.hpp"

using namespace mediaseek;
using namespace mediaseek::testing;

TEST_CASE("7z command line", "[extractor]") {
    SevenZipExtractor extractor({}, quiet_logger());
    auto args = extractor.command("/dl/movie/movie.7z.001", "/dl/movie");

    CHECK(args == std::vector<std::string>{
        "7z", "x", "-y", "-aos", "-o/dl/movie", "/dl/movie/movie.7z.001"});

    SECTION("custom program") {
        SevenZipOptions options;
        options.program = "/usr/bin/7za";
        SevenZipExtractor custom(options, quiet_logger());
        CHECK(custom.command("a.rar", "out").front() == "/usr/bin/7za");
    }
}

TEST_CASE("7z exit codes", "[extractor]") {
    CHECK(SevenZipExtractor::classify_exit(0) == ExtractionOutcome::Success);
    CHECK(SevenZipExtractor::classify_exit(2) == ExtractionOutcome::Incomplete);
    CHECK(SevenZipExtractor::classify_exit(1) == ExtractionOutcome::Failed);
    CHECK(SevenZipExtractor::classify_exit(7) == ExtractionOutcome::Failed);
    CHECK(SevenZipExtractor::classify_exit(255) == ExtractionOutcome::Failed);
}

TEST_CASE("Extraction results as errors", "[extractor]") {
    ExtractionResult result;

    result.outcome = ExtractionOutcome::Success;
    result.exit_code = 0;
    CHECK(!result.error());

    result.outcome = ExtractionOutcome::Incomplete;
    result.exit_code = 2;
    result.diagnostics = "Unexpected end of archive";
    auto incomplete = result.error();
    CHECK(incomplete.is(StreamError::ExtractionIncomplete));
    CHECK(incomplete.message().find("Unexpected end of archive") != std::string_view::npos);

    result.outcome = ExtractionOutcome::Failed;
    result.exit_code = 7;
    CHECK(result.error().is(StreamError::ExtractionFailed));

    result.outcome = ExtractionOutcome::TimedOut;
    result.exit_code = -1;
    CHECK(result.error().is(StreamError::ExtractionFailed));
    CHECK(result.error().http_status() == 503);
}

TEST_CASE("Default extractor options", "[extractor]") {
    SevenZipOptions options;
    CHECK(options.program == "7z");
    CHECK(options.timeout == std::chrono::seconds(300));
    CHECK(options.diagnostics_limit == 200);
}

TEST_CASE("Running the extractor process", "[extractor]") {
    TempDir dir;
    SevenZipOptions options;
    options.poll_interval = std::chrono::milliseconds(10);

    SECTION("a program exiting 0 succeeds") {
        options.program = "true";
        SevenZipExtractor extractor(options, quiet_logger());
        auto result = extractor.extract(dir.path() / "a.7z", dir.path(), {});
        CHECK(result.ok());
        CHECK(result.exit_code == 0);
    }

    SECTION("a program exiting 1 fails") {
        options.program = "false";
        SevenZipExtractor extractor(options, quiet_logger());
        auto result = extractor.extract(dir.path() / "a.7z", dir.path(), {});
        CHECK(result.outcome == ExtractionOutcome::Failed);
        CHECK(result.exit_code == 1);
    }

    SECTION("a missing program fails with 127") {
        options.program = (dir.path() / "no-such-7z").string();
        SevenZipExtractor extractor(options, quiet_logger());
        auto result = extractor.extract(dir.path() / "a.7z", dir.path(), {});
        CHECK(result.outcome == ExtractionOutcome::Failed);
        CHECK(result.exit_code == 127);
    }

    SECTION("cancelled before start") {
        CancellationSource cancel;
        cancel.cancel();
        options.program = "true";
        SevenZipExtractor extractor(options, quiet_logger());
        auto result = extractor.extract(dir.path() / "a.7z", dir.path(), cancel.token());
        CHECK(!result.ok());
        CHECK(result.diagnostics == "cancelled before start");
    }
}

TEST_CASE("Extraction outcome names", "[extractor]") {
    CHECK(extraction_outcome_name(ExtractionOutcome::Success) == "success");
    CHECK(extraction_outcome_name(ExtractionOutcome::Incomplete) == "incomplete");
    CHECK(extraction_outcome_name(ExtractionOutcome::TimedOut) == "timed_out");
}
