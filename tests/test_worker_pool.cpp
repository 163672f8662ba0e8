#include <catch2/catch_test_macros.hpp>
#include <mediaseek/util/worker_pool.hpp>

#include <atomic>

using namespace mediaseek;

TEST_CASE("Zero threads runs jobs inline", "[worker_pool]") {
    WorkerPool pool(0);
    int ran = 0;
    REQUIRE(pool.post([&] { ++ran; }));
    CHECK(ran == 1);
    CHECK(pool.thread_count() == 0);

    pool.stop();
    CHECK(!pool.post([&] { ++ran; }));
    CHECK(ran == 1);
}

TEST_CASE("Threads drain the queue", "[worker_pool]") {
    WorkerPool pool(3);
    CHECK(pool.thread_count() == 3);

    std::atomic<int> ran{0};
    for (int i = 0; i < 100; ++i) {
        REQUIRE(pool.post([&] { ++ran; }));
    }
    pool.wait_idle();
    CHECK(ran == 100);
}

TEST_CASE("Stop runs queued jobs then refuses new ones", "[worker_pool]") {
    std::atomic<int> ran{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.post([&] { ++ran; });
        }
        pool.stop();
        CHECK(ran == 10);
        CHECK(!pool.post([&] { ++ran; }));
    }
    CHECK(ran == 10);
}
