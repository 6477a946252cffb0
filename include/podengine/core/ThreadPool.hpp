#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace podengine {
namespace core {

/// Fixed number of worker threads pulling jobs from one FIFO queue.
///
/// A job does its own I/O and reports back by posting a message; the pool
/// knows nothing about what a job does. The queue is unbounded. On
/// destruction each worker finishes its current job and exits; jobs still
/// queued are dropped.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t maxWorkers);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void execute(std::function<void()> job);

    std::size_t size() const { return workers_.size(); }
    std::size_t queued() const;

private:
    void workerLoop(std::size_t index);

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace core
} // namespace podengine
