#include <catch2/catch_test_macros.hpp>

#include "tts_queue/utils/async.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using tts_queue::utils::TaskQueue;

TEST_CASE("task queue runs tasks in post order") {
    TaskQueue queue("test");
    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 20; ++i) {
        REQUIRE(queue.post([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }
    queue.wait_idle();
    REQUIRE(queue.pending() == 0);
    REQUIRE(order.size() == 20);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(order[static_cast<size_t>(i)] == i);
    }
}

TEST_CASE("a throwing task does not stop the queue") {
    TaskQueue queue("test");
    std::atomic<int> ran{0};
    queue.post([]() { throw std::runtime_error("boom"); });
    queue.post([&]() { ++ran; });
    queue.wait_idle();
    REQUIRE(ran.load() == 1);
}

TEST_CASE("a task throwing a non-standard value does not stop the queue") {
    TaskQueue queue("test");
    std::atomic<int> ran{0};
    queue.post([]() { throw 42; });
    queue.post([&]() { ++ran; });
    queue.wait_idle();
    REQUIRE(ran.load() == 1);
}

TEST_CASE("stop drains pending tasks and refuses new ones") {
    TaskQueue queue("test");
    std::atomic<int> ran{0};
    for (int i = 0; i < 5; ++i) {
        queue.post([&]() { ++ran; });
    }
    queue.stop();
    REQUIRE(ran.load() == 5);
    REQUIRE_FALSE(queue.post([&]() { ++ran; }));
    queue.stop();
}
