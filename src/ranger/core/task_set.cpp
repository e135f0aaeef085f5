// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/task_set.hpp>

namespace ranger::core {

TaskSet::~TaskSet() {
    abort_all();
}

void TaskSet::spawn(Task task) {
    threads_.emplace_back([task = std::move(task), token = source_.get_token()]() {
        task(token);
    });
}

void TaskSet::abort_all() noexcept {
    source_.request_stop();
    join_all();
}

void TaskSet::join_all() noexcept {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace ranger::core
