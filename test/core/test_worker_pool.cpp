#include <catch2/catch_test_macros.hpp>

#include <toolhost/core/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace toolhost;

TEST_CASE("WorkerPool: runs every submitted task", "[core][pool]") {
    std::atomic<int> count{0};
    {
        WorkerPool pool(4);
        CHECK(pool.Size() == 4);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(pool.Submit([&count] { ++count; }));
        }
        pool.Shutdown();
    }
    CHECK(count == 100);
}

TEST_CASE("WorkerPool: Shutdown drains queued work", "[core][pool]") {
    std::atomic<int> count{0};
    WorkerPool pool(1);
    for (int i = 0; i < 10; ++i) {
        pool.Submit([&count] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++count;
        });
    }
    pool.Shutdown();
    CHECK(count == 10);
}

TEST_CASE("WorkerPool: Submit after Shutdown is refused", "[core][pool]") {
    WorkerPool pool(2);
    pool.Shutdown();
    bool ran = false;
    CHECK_FALSE(pool.Submit([&ran] { ran = true; }));
    CHECK_FALSE(ran);
}

TEST_CASE("WorkerPool: a throwing task does not stop the worker", "[core][pool]") {
    std::atomic<int> count{0};
    WorkerPool pool(1);
    pool.Submit([] { throw std::runtime_error("task failed"); });
    pool.Submit([&count] { ++count; });
    pool.Shutdown();
    CHECK(count == 1);
}

TEST_CASE("WorkerPool: tasks run concurrently", "[core][pool]") {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    WorkerPool pool(4);
    for (int i = 0; i < 4; ++i) {
        pool.Submit([&] {
            const int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            --running;
        });
    }
    pool.Shutdown();
    CHECK(peak > 1);
}
