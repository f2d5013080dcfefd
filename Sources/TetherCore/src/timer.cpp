#include "tether/timer.hpp"

namespace tether {

// ============================================================================
// thread_timer_service
// ============================================================================

thread_timer_service::thread_timer_service() {
    worker_ = std::thread([this] { run_loop(); });
}

thread_timer_service::~thread_timer_service() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        timers_.clear();
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

timer_service::timer_id thread_timer_service::schedule_after(std::chrono::milliseconds delay,
                                                              std::function<void()> fn) {
    timer_id id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_.emplace(steady::now() + delay, std::make_pair(id, std::move(fn)));
    }
    cv_.notify_one();
    return id;
}

void thread_timer_service::cancel(timer_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.first == id) {
            timers_.erase(it);
            return;
        }
    }
}

void thread_timer_service::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (timers_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
            continue;
        }

        auto deadline = timers_.begin()->first;
        if (steady::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        auto fn = std::move(timers_.begin()->second.second);
        timers_.erase(timers_.begin());

        lock.unlock();
        if (fn) fn();
        lock.lock();
    }
}

// ============================================================================
// manual_timer_service
// ============================================================================

timer_service::timer_id manual_timer_service::schedule_after(std::chrono::milliseconds delay,
                                                              std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    timer_id id = next_id_++;
    timers_.emplace(now_ + delay, std::make_pair(id, std::move(fn)));
    return id;
}

void manual_timer_service::cancel(timer_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.first == id) {
            timers_.erase(it);
            return;
        }
    }
}

void manual_timer_service::advance(std::chrono::milliseconds delta) {
    timestamp_t target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + delta;
    }

    // Fire one timer at a time so callbacks may schedule follow-up timers
    while (true) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (timers_.empty() || timers_.begin()->first > target) {
                now_ = target;
                return;
            }
            now_ = timers_.begin()->first;
            fn = std::move(timers_.begin()->second.second);
            timers_.erase(timers_.begin());
        }
        if (fn) fn();
    }
}

timestamp_t manual_timer_service::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

size_t manual_timer_service::scheduled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

} // namespace tether
