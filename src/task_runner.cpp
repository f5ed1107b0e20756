#include "task_runner.hpp"

#include <spdlog/spdlog.h>

namespace rplayer {

AsyncTaskRunner::~AsyncTaskRunner() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
        task.wait();
    }
}

void AsyncTaskRunner::reap() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void AsyncTaskRunner::run(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap();
    tasks_.push_back(std::async(std::launch::async, std::move(task)));
}

bool AsyncTaskRunner::wait_all(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
        if (task.wait_until(deadline) != std::future_status::ready) {
            spdlog::warn("tasks: still running after {} ms", timeout.count());
            return false;
        }
    }
    tasks_.clear();
    return true;
}

} // namespace rplayer
