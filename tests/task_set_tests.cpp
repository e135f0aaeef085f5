// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ranger/core/task_set.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace ranger::core;
using namespace std::chrono_literals;

namespace {

// Blocks until stop is requested
void wait_for_stop(std::stop_token stoken) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait(lock, stoken, [] { return false; });
}

} // namespace

TEST_CASE("TaskSet runs and joins tasks", "[tasks]") {
    std::atomic<int> ran{0};
    {
        TaskSet tasks;
        for (int i = 0; i < 4; ++i) {
            tasks.spawn([&](std::stop_token) { ++ran; });
        }
        CHECK(tasks.size() == 4);
        tasks.join_all();
        CHECK(ran == 4);
        CHECK(!tasks.stop_requested());
    }
    CHECK(ran == 4);
}

TEST_CASE("Destroying a TaskSet cancels its tasks", "[tasks]") {
    std::atomic<int> stopped{0};
    auto started = std::chrono::steady_clock::now();
    {
        TaskSet tasks;
        for (int i = 0; i < 3; ++i) {
            tasks.spawn([&](std::stop_token stoken) {
                wait_for_stop(stoken);
                ++stopped;
            });
        }
        std::this_thread::sleep_for(10ms);
    }
    CHECK(stopped == 3);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("TaskSet::abort_all is idempotent", "[tasks]") {
    TaskSet tasks;
    std::atomic<bool> saw_stop{false};
    tasks.spawn([&](std::stop_token stoken) {
        wait_for_stop(stoken);
        saw_stop = stoken.stop_requested();
    });

    tasks.abort_all();
    CHECK(saw_stop);
    CHECK(tasks.stop_requested());
    CHECK(tasks.token().stop_requested());

    tasks.abort_all();
    CHECK(saw_stop);
}
