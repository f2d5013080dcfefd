#include "tether/retry_scheduler.hpp"
#include "tether/log.hpp"
#include <algorithm>

namespace tether {

retry_scheduler::retry_scheduler(const configuration& config,
                                 std::shared_ptr<sync_queue> queue,
                                 std::shared_ptr<record_store> store,
                                 std::shared_ptr<remote_sync_client> remote,
                                 std::shared_ptr<connectivity_monitor> connectivity,
                                 std::shared_ptr<user_context> users,
                                 std::shared_ptr<timer_service> timers,
                                 SharedScheduler sched,
                                 clock_fn clock)
    : config_(config)
    , queue_(std::move(queue))
    , store_(std::move(store))
    , remote_(std::move(remote))
    , connectivity_(std::move(connectivity))
    , users_(std::move(users))
    , timers_(std::move(timers))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , clock_(std::move(clock))
{}

retry_scheduler::~retry_scheduler() {
    stop();
}

void retry_scheduler::start() {
    if (config_.retry_interval.count() <= 0) {
        LOG_ERROR("retry_scheduler", "Retry interval must be positive; recurring passes disabled");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_ = true;
    }
    LOG_INFO("retry_scheduler", "Started (interval %lld ms)",
             static_cast<long long>(config_.retry_interval.count()));
    schedule_next();
}

void retry_scheduler::stop() {
    timer_service::timer_id pending = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        generation_++;
        pending = timer_;
        timer_ = 0;
    }
    if (pending != 0) timers_->cancel(pending);
    LOG_INFO("retry_scheduler", "Stopped");
}

bool retry_scheduler::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void retry_scheduler::schedule_next() {
    std::weak_ptr<retry_scheduler> weak = weak_from_this();
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
    }
    auto id = timers_->schedule_after(config_.retry_interval, [weak, generation] {
        auto self = weak.lock();
        if (!self) return;
        self->scheduler_->invoke([weak, generation] {
            if (auto inner = weak.lock()) inner->on_timer(generation);
        });
    });

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ && generation == generation_) {
        timer_ = id;
    } else {
        timers_->cancel(id);
    }
}

void retry_scheduler::on_timer(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || generation != generation_) return;
        timer_ = 0;
    }
    tick();
    bool again;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        again = running_ && generation == generation_ && timer_ == 0;
    }
    if (again) schedule_next();
}

void retry_scheduler::request_flush() {
    std::weak_ptr<retry_scheduler> weak = weak_from_this();
    scheduler_->invoke([weak] {
        if (auto self = weak.lock()) self->tick();
    });
}

void retry_scheduler::tick() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ticking_) {
            rerun_ = true;
            return;
        }
        ticking_ = true;
    }

    while (true) {
        run_pass();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!rerun_) {
            ticking_ = false;
            return;
        }
        rerun_ = false;
    }
}

size_t retry_scheduler::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

std::chrono::milliseconds retry_scheduler::backoff_for(int attempts) const {
    if (attempts <= 0) return std::chrono::milliseconds(0);
    int exponent = std::min(attempts - 1, 30);
    auto delay = config_.base_backoff * (int64_t{1} << exponent);
    return std::min(delay, config_.max_backoff);
}

void retry_scheduler::run_pass() {
    if (!connectivity_->is_online()) {
        LOG_DEBUG("retry_scheduler", "Offline; skipping pass");
        return;
    }
    if (!users_->current_owner()) {
        LOG_DEBUG("retry_scheduler", "No session; skipping pass");
        return;
    }

    auto now = clock_();
    for (auto& op : queue_->all()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_flight_.count(op.record_id)) continue;
        }

        switch (op.status) {
            case sync_status::pending:
            case sync_status::retrying:
                attempt(op);
                break;
            case sync_status::error: {
                if (!is_retryable(op.failure)) continue;
                if (op.last_attempt_at && now - *op.last_attempt_at < backoff_for(op.attempts)) continue;
                if (!queue_->mark_retrying(op.id)) continue;
                op.status = sync_status::retrying;
                attempt(op);
                break;
            }
            case sync_status::synced:
                break;
        }
    }
}

void retry_scheduler::attempt(const sync_operation& op) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_[op.record_id] = op.id;
    }
    LOG_DEBUG("retry_scheduler", "Pushing %s %s (attempt %d)", to_string(op.kind), op.id.c_str(), op.attempts + 1);

    std::weak_ptr<retry_scheduler> weak = weak_from_this();
    std::string op_id = op.id;
    std::string record_id = op.record_id;
    uint64_t revision = op.revision;
    remote_->push(op, [weak, op_id, record_id, revision](push_result result) {
        if (auto self = weak.lock()) self->on_push_complete(op_id, record_id, revision, result);
    });
}

void retry_scheduler::on_push_complete(const std::string& operation_id, const std::string& record_id,
                                       uint64_t sent_revision, const push_result& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(record_id);
        if (it != in_flight_.end() && it->second == operation_id) {
            in_flight_.erase(it);
        }
    }

    if (result.success) {
        auto op = queue_->find(operation_id);
        switch (queue_->mark_synced(operation_id, sent_revision)) {
            case ack_result::removed:
                if (!op) break;
                LOG_INFO("retry_scheduler", "Synced %s %s for %s",
                         to_string(op->kind), operation_id.c_str(), record_id.c_str());
                if (op->kind == operation_kind::remove) {
                    store_->purge(record_id);
                }
                op->status = sync_status::synced;
                if (on_synced_) on_synced_(*op);
                break;
            case ack_result::requeued:
                LOG_DEBUG("retry_scheduler", "%s changed while in flight; re-sending", operation_id.c_str());
                request_flush();
                break;
            case ack_result::missing:
                LOG_DEBUG("retry_scheduler", "%s was superseded while in flight", operation_id.c_str());
                if (queue_->find_for_record(record_id)) request_flush();
                break;
        }
        return;
    }

    if (!queue_->mark_error(operation_id, result.reason, result.failure, sent_revision)) {
        LOG_DEBUG("retry_scheduler", "%s was superseded while in flight", operation_id.c_str());
        if (queue_->find_for_record(record_id)) request_flush();
        return;
    }

    auto op = queue_->find(operation_id);
    if (!op) return;
    if (op->status == sync_status::pending) {
        // Coalesced while in flight: the newer payload has not been tried yet
        request_flush();
        return;
    }

    if (is_retryable(op->failure)) {
        LOG_WARN("retry_scheduler", "Push %s failed (%s, attempt %d): %s; retrying in %lld ms",
                 operation_id.c_str(), to_string(op->failure), op->attempts, op->last_error.c_str(),
                 static_cast<long long>(backoff_for(op->attempts).count()));
    } else {
        LOG_ERROR("retry_scheduler", "Push %s rejected (%s): %s",
                  operation_id.c_str(), to_string(op->failure), op->last_error.c_str());
    }
    if (on_failed_) on_failed_(*op, result);
}

} // namespace tether
