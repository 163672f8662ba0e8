#include <catch2/catch_test_macros.hpp>
#include <mediaseek/stream/retry_policy.hpp>

using namespace mediaseek;
using std::chrono::milliseconds;

TEST_CASE("Backoff delays", "[retry]") {
    RetryPolicy policy;

    CHECK(policy.delay_for(1) == milliseconds(100));
    CHECK(policy.delay_for(2) == milliseconds(150));
    CHECK(policy.delay_for(3) == milliseconds(225));
    CHECK(policy.delay_for(4) == milliseconds(337));
    CHECK(policy.delay_for(5) == milliseconds(506));
    CHECK(policy.delay_for(6) == milliseconds(759));
    CHECK(policy.delay_for(7) == milliseconds(1000));
    CHECK(policy.delay_for(30) == milliseconds(1000));

    SECTION("initial delay above the cap") {
        policy.initial_delay = milliseconds(5000);
        CHECK(policy.delay_for(1) == milliseconds(1000));
    }
}

TEST_CASE("End seek budget", "[retry]") {
    RetryPolicy policy;

    SECTION("cursor past 90 percent is an end seek") {
        CHECK(policy.is_end_seek(950, 1000));
        CHECK(policy.budget_for(950, 1000) == 3);
    }

    SECTION("exactly 90 percent is not") {
        CHECK(!policy.is_end_seek(900, 1000));
        CHECK(policy.budget_for(900, 1000) == 30);
    }

    SECTION("start of file") {
        CHECK(policy.budget_for(0, 1000) == 30);
    }

    SECTION("shortening can be disabled") {
        policy.shorten_near_end = false;
        CHECK(!policy.is_end_seek(999, 1000));
        CHECK(policy.budget_for(999, 1000) == 30);
    }

    SECTION("empty resource") {
        CHECK(!policy.is_end_seek(0, 0));
    }
}

TEST_CASE("Streamer defaults", "[retry]") {
    StreamerOptions options;
    CHECK(options.chunk_size == 256 * 1024);
    CHECK(options.retry.max_retries == 30);
    CHECK(options.retry.end_seek_retries == 3);
}
