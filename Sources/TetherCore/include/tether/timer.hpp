#pragma once

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace tether {

// ============================================================================
// Timer service - delayed callbacks for retry ticks and reconnect backoff
// ============================================================================

class timer_service {
public:
    using timer_id = uint64_t;

    virtual ~timer_service() = default;

    // Run fn once after delay. Callbacks run on the service's own context;
    // callers re-dispatch onto their scheduler.
    virtual timer_id schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    // Cancel a timer that has not fired yet. Unknown ids are ignored.
    virtual void cancel(timer_id id) = 0;
};

// Dedicated thread sleeping until the earliest deadline
class thread_timer_service : public timer_service {
public:
    thread_timer_service();
    ~thread_timer_service() override;

    thread_timer_service(const thread_timer_service&) = delete;
    thread_timer_service& operator=(const thread_timer_service&) = delete;

    timer_id schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) override;
    void cancel(timer_id id) override;

private:
    using steady = std::chrono::steady_clock;

    void run_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<steady::time_point, std::pair<timer_id, std::function<void()>>> timers_;
    timer_id next_id_ = 1;
    bool running_ = true;
    std::thread worker_;
};

// Virtual time: nothing fires until advance() moves the clock past a deadline.
// now() doubles as the engine clock in tests so backoff and timers agree.
class manual_timer_service : public timer_service {
public:
    explicit manual_timer_service(timestamp_t start = from_millis(1'700'000'000'000))
        : now_(start) {}

    timer_id schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) override;
    void cancel(timer_id id) override;

    // Moves virtual time forward, firing due timers in deadline order
    void advance(std::chrono::milliseconds delta);

    timestamp_t now() const;

    size_t scheduled_count() const;

private:
    mutable std::mutex mutex_;
    timestamp_t now_;
    std::multimap<timestamp_t, std::pair<timer_id, std::function<void()>>> timers_;
    timer_id next_id_ = 1;
};

} // namespace tether
