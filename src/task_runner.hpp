#ifndef TASK_RUNNER_HPP
#define TASK_RUNNER_HPP

#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <vector>

namespace rplayer {

// Runs blocking work (resolve, directory lookup) off the controller loop
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    virtual void run(std::function<void()> task) = 0;

    // Wait for outstanding tasks; false if some were still running at the deadline
    virtual bool wait_all(std::chrono::milliseconds timeout) = 0;
};

// One std::async task per call
class AsyncTaskRunner : public TaskRunner {
public:
    ~AsyncTaskRunner() override;

    void run(std::function<void()> task) override;
    bool wait_all(std::chrono::milliseconds timeout) override;

private:
    void reap();

    std::mutex mutex_;
    std::vector<std::future<void>> tasks_;
};

} // namespace rplayer

#endif // TASK_RUNNER_HPP
