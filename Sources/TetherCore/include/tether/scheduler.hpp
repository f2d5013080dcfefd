#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <vector>
#include <condition_variable>
#include <atomic>

namespace tether {

// ============================================================================
// Scheduler interface - execution context for asynchronous completions
// ============================================================================
//
// Push completions, flush requests and timer ticks are funnelled through one
// scheduler so the queue and store see a single writer at a time:
// - std_thread_scheduler: dedicated worker thread
// - immediate_scheduler: runs inline on the calling thread
// - main_thread_scheduler: queued until the owner calls process_pending()

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Worker-thread scheduler
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
            }

            if (fn) {
                fn();
            }
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }
};

// ============================================================================
// Main thread scheduler - work is queued until process_pending() is called
// ============================================================================
//
// Captures the constructing thread as the "main" thread. Tests use it to
// step asynchronous completions deterministically.

class main_thread_scheduler : public scheduler {
public:
    main_thread_scheduler() : main_thread_id_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(fn));
    }

    // Runs queued work, including work queued by the work itself, until idle.
    // Returns the number of callbacks executed.
    size_t process_pending() {
        size_t executed = 0;
        while (true) {
            std::vector<std::function<void()>> pending;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                while (!queue_.empty()) {
                    pending.push_back(std::move(queue_.front()));
                    queue_.pop();
                }
            }
            if (pending.empty()) return executed;
            for (auto& fn : pending) {
                if (fn) fn();
                ++executed;
            }
        }
    }

    [[nodiscard]] size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == main_thread_id_;
    }

private:
    std::thread::id main_thread_id_;
    mutable std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
};

} // namespace tether
