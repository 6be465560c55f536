#include "catch2_custom.hpp"

#include "sandbox/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace assessgrader;
using namespace std::chrono_literals;

TEST_CASE("Submitted tasks run and deliver their results") {
    WorkerPool pool{3, 16};
    REQUIRE(pool.num_workers() == 3);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        auto fut = pool.submit([i] { return i * i; });
        REQUIRE(fut.has_value());
        futures.push_back(std::move(*fut));
    }

    int sum = 0;
    for (auto& fut : futures) {
        sum += fut.get();
    }

    REQUIRE(sum == 285);
}

TEST_CASE("Exceptions end up in the future") {
    WorkerPool pool{1, 4};

    auto fut = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE(fut.has_value());
    REQUIRE_THROWS_AS(fut->get(), std::runtime_error);
}

TEST_CASE("A full queue rejects work") {
    WorkerPool pool{1, 2};

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<bool> running{false};

    auto blocker = pool.submit([gate, &running] {
        running = true;
        gate.wait();
    });
    REQUIRE(blocker.has_value());

    while (!running) {
        std::this_thread::sleep_for(1ms);
    }

    // The worker is busy, so these two sit in the queue
    REQUIRE(pool.submit([] {}).has_value());
    REQUIRE(pool.submit([] {}).has_value());
    REQUIRE(pool.queued() == 2);

    REQUIRE_FALSE(pool.submit([] {}).has_value());

    release.set_value();
    blocker->get();
}

TEST_CASE("Queued work still runs when the pool is destroyed") {
    std::atomic<int> ran{0};

    {
        WorkerPool pool{2, 32};
        for (int i = 0; i < 20; ++i) {
            REQUIRE(pool.submit([&ran] {
                           std::this_thread::sleep_for(1ms);
                           ++ran;
                       }).has_value());
        }
    }

    REQUIRE(ran == 20);
}
