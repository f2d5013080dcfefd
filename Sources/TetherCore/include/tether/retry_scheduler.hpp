#pragma once

#include "configuration.hpp"
#include "record_store.hpp"
#include "remote_sync_client.hpp"
#include "scheduler.hpp"
#include "session.hpp"
#include "sync_queue.hpp"
#include "timer.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tether {

// ============================================================================
// retry_scheduler - drives the sync queue to completion
// ============================================================================
//
// A pass walks the queue oldest first. Pending and retrying entries are pushed;
// retryable errors are pushed once their backoff window has elapsed; terminal
// errors wait for retry_failed() or discard. At most one push per record is in
// flight. Passes and push completions run on the configured scheduler.
//
// Always owned by a shared_ptr; timer and push callbacks hold a weak
// reference and keep the scheduler alive while they run.

class retry_scheduler : public std::enable_shared_from_this<retry_scheduler> {
public:
    using synced_handler = std::function<void(const sync_operation&)>;
    using failed_handler = std::function<void(const sync_operation&, const push_result&)>;

    retry_scheduler(const configuration& config,
                    std::shared_ptr<sync_queue> queue,
                    std::shared_ptr<record_store> store,
                    std::shared_ptr<remote_sync_client> remote,
                    std::shared_ptr<connectivity_monitor> connectivity,
                    std::shared_ptr<user_context> users,
                    std::shared_ptr<timer_service> timers,
                    SharedScheduler sched,
                    clock_fn clock = system_now);
    ~retry_scheduler();

    retry_scheduler(const retry_scheduler&) = delete;
    retry_scheduler& operator=(const retry_scheduler&) = delete;

    // Recurring pass every retry_interval. A non-positive interval leaves the
    // scheduler stopped; passes then run only on request_flush().
    void start();
    void stop();
    bool is_running() const;

    // Run one pass on the calling thread. Reentrant calls fold into the
    // running pass.
    void tick();

    // Schedule a pass on the scheduler
    void request_flush();

    size_t in_flight_count() const;

    // min(base_backoff * 2^(attempts-1), max_backoff)
    std::chrono::milliseconds backoff_for(int attempts) const;

    void set_on_operation_synced(synced_handler handler) { on_synced_ = std::move(handler); }
    void set_on_operation_failed(failed_handler handler) { on_failed_ = std::move(handler); }

private:
    void run_pass();
    void attempt(const sync_operation& op);
    void on_push_complete(const std::string& operation_id, const std::string& record_id,
                          uint64_t sent_revision, const push_result& result);
    void schedule_next();
    void on_timer(uint64_t generation);

    configuration config_;
    std::shared_ptr<sync_queue> queue_;
    std::shared_ptr<record_store> store_;
    std::shared_ptr<remote_sync_client> remote_;
    std::shared_ptr<connectivity_monitor> connectivity_;
    std::shared_ptr<user_context> users_;
    std::shared_ptr<timer_service> timers_;
    SharedScheduler scheduler_;
    clock_fn clock_;

    synced_handler on_synced_;
    failed_handler on_failed_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> in_flight_;   // record id -> operation id
    bool ticking_ = false;
    bool rerun_ = false;
    bool running_ = false;
    timer_service::timer_id timer_ = 0;
    uint64_t generation_ = 0;   // bumped by stop(); stale ticks compare against it
};

} // namespace tether
