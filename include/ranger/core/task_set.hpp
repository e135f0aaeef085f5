// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <functional>
#include <stop_token>
#include <thread>
#include <vector>

namespace ranger::core {

// Owns a group of threads sharing one stop source. Destroying the set
// requests stop and joins every thread.
class TaskSet {
public:
    using Task = std::function<void(std::stop_token)>;

    TaskSet() = default;
    ~TaskSet();

    // Non-copyable, non-movable (threads hold the stop source's tokens)
    TaskSet(const TaskSet&) = delete;
    TaskSet& operator=(const TaskSet&) = delete;
    TaskSet(TaskSet&&) = delete;
    TaskSet& operator=(TaskSet&&) = delete;

    // Start a thread running task(token)
    void spawn(Task task);

    // Request stop and join every thread. Idempotent.
    void abort_all() noexcept;

    // Join without requesting stop
    void join_all() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }
    [[nodiscard]] bool stop_requested() const noexcept { return source_.stop_requested(); }
    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }

private:
    std::stop_source source_;
    std::vector<std::jthread> threads_;
};

} // namespace ranger::core
