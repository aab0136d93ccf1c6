#include <catch2/catch_test_macros.hpp>
#include "dispatch/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace flbkinesis;

TEST_CASE("WorkerPool: runs every submitted task", "[worker_pool]") {
    std::atomic<int> ran{0};
    {
        WorkerPool pool(4);
        CHECK(pool.thread_count() == 4);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(pool.submit([&] { ran.fetch_add(1); }));
        }
        pool.shutdown();
        CHECK(pool.get_stats().submitted == 100);
        CHECK(pool.get_stats().completed == 100);
    }
    CHECK(ran.load() == 100);
}

TEST_CASE("WorkerPool: zero threads means one", "[worker_pool]") {
    WorkerPool pool(0);
    CHECK(pool.thread_count() == 1);
}

TEST_CASE("WorkerPool: tasks run on several threads", "[worker_pool]") {
    std::mutex mutex;
    std::set<std::thread::id> seen;
    std::atomic<int> waiting{0};

    WorkerPool pool(3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(pool.submit([&] {
            {
                std::lock_guard<std::mutex> lock(mutex);
                seen.insert(std::this_thread::get_id());
            }
            // Hold each worker until all three tasks have started
            waiting.fetch_add(1);
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (waiting.load() < 3 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }));
    }
    pool.shutdown();
    CHECK(seen.size() == 3);
}

TEST_CASE("WorkerPool: shutdown drains the queue then refuses work", "[worker_pool]") {
    std::atomic<int> ran{0};
    WorkerPool pool(1);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(pool.submit([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ran.fetch_add(1);
        }));
    }

    pool.shutdown();
    CHECK(ran.load() == 10);
    CHECK(pool.queued() == 0);
    CHECK_FALSE(pool.is_running());

    CHECK_FALSE(pool.submit([&] { ran.fetch_add(1); }));
    CHECK(pool.get_stats().rejected == 1);

    // Idempotent
    pool.shutdown();
    CHECK(ran.load() == 10);
}

TEST_CASE("WorkerPool: a throwing task does not stop its worker", "[worker_pool]") {
    std::atomic<int> ran{0};
    WorkerPool pool(1);

    REQUIRE(pool.submit([] { throw std::runtime_error("boom"); }));
    REQUIRE(pool.submit([&] { ran.fetch_add(1); }));
    pool.shutdown();

    CHECK(ran.load() == 1);
    CHECK(pool.get_stats().completed == 2);
}
