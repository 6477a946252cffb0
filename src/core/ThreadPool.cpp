#include "podengine/core/ThreadPool.hpp"

#include <iostream>
#include <stdexcept>

namespace podengine {
namespace core {

ThreadPool::ThreadPool(std::size_t maxWorkers) {
    if (maxWorkers == 0) {
        throw std::invalid_argument("ThreadPool needs at least one worker");
    }
    workers_.reserve(maxWorkers);
    for (std::size_t i = 0; i < maxWorkers; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this, i);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        jobs_.clear();
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::execute(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

std::size_t ThreadPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void ThreadPool::workerLoop(std::size_t index) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        // Jobs are expected to turn their own failures into messages; this
        // only keeps a misbehaving job from taking the worker down.
        try {
            job();
        } catch (const std::exception& e) {
            std::cerr << "Worker " << index << ": job failed: " << e.what() << std::endl;
        }
    }
}

} // namespace core
} // namespace podengine
