#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace podengine {
namespace core {

// A value behind its own reader/writer lock. Catalog items are handed out
// as shared_ptr<Guarded<T>> so that work on one item never holds any of the
// catalog's structural locks.
template <typename T>
class Guarded {
public:
    explicit Guarded(T value) : value_(std::move(value)) {}

    Guarded(const Guarded&) = delete;
    Guarded& operator=(const Guarded&) = delete;

    template <typename F>
    auto read(F&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(value_);
    }

    template <typename F>
    auto write(F&& fn) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return fn(value_);
    }

    T snapshot() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return value_;
    }

    void replace(T value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        value_ = std::move(value);
    }

private:
    mutable std::shared_mutex mutex_;
    T value_;
};

// Single-value cell shared between two threads. There is no compound
// invariant across cells, so each one is locked on its own.
template <typename T>
class SharedCell {
public:
    explicit SharedCell(T initial = T{}) : value_(std::move(initial)) {}

    T get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    void set(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
    }

private:
    mutable std::mutex mutex_;
    T value_;
};

} // namespace core
} // namespace podengine
