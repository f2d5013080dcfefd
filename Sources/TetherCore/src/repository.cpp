#include "tether/repository.hpp"
#include "tether/errors.hpp"
#include "tether/log.hpp"
#include <algorithm>

namespace tether {

repository::repository(const configuration& config, dependencies deps)
    : config_(config)
    , clock_(deps.clock ? std::move(deps.clock) : clock_fn(system_now))
    , scheduler_(config.sched ? config.sched : std::make_shared<immediate_scheduler>())
    , timers_(deps.timers ? std::move(deps.timers) : std::make_shared<thread_timer_service>())
    , connectivity_(deps.connectivity ? std::move(deps.connectivity) : std::make_shared<connectivity_monitor>())
    , users_(deps.users ? std::move(deps.users) : std::make_shared<user_context>())
{
    set_log_level(config_.log_threshold);

    if (deps.storage) {
        storage_ = std::move(deps.storage);
    } else if (config_.storage_path.empty()) {
        storage_ = std::make_shared<null_backing_store>();
    } else {
        storage_ = std::make_shared<sqlite_backing_store>(config_.storage_path);
    }

    store_ = std::make_shared<record_store>(storage_);
    queue_ = std::make_shared<sync_queue>(storage_, clock_);
    remote_ = std::make_shared<remote_sync_client>(config_, std::move(deps.network), users_, timers_, scheduler_);
    retry_ = std::make_shared<retry_scheduler>(config_, queue_, store_, remote_, connectivity_, users_,
                                               timers_, scheduler_, clock_);
    realtime_ = std::make_shared<realtime_listener>(remote_, store_, queue_, users_, connectivity_,
                                                    config_.pull_on_session);

    store_->load();
    queue_->load();

    std::weak_ptr<realtime_listener> weak_realtime = realtime_;
    std::weak_ptr<retry_scheduler> weak_retry = retry_;
    auto callbacks = callbacks_;

    retry_->set_on_operation_synced([weak_realtime, callbacks](const sync_operation& op) {
        if (auto realtime = weak_realtime.lock()) {
            if (op.kind == operation_kind::remove) realtime->on_record_purged(op.record_id);
            realtime->on_operation_resolved(op.record_id);
        }
        retry_scheduler::synced_handler handler;
        {
            std::lock_guard<std::mutex> lock(callbacks->mutex);
            handler = callbacks->on_synced;
        }
        if (handler) handler(op);
    });
    retry_->set_on_operation_failed([weak_realtime, callbacks](const sync_operation& op, const push_result& result) {
        if (!is_retryable(op.failure)) {
            if (auto realtime = weak_realtime.lock()) realtime->on_operation_resolved(op.record_id);
        }
        retry_scheduler::failed_handler handler;
        {
            std::lock_guard<std::mutex> lock(callbacks->mutex);
            handler = callbacks->on_failed;
        }
        if (handler) handler(op, result);
    });

    connectivity_token_ = connectivity_->observe([weak_retry](const bool& online) {
        LOG_INFO("repository", "Network %s", online ? "online" : "offline");
        if (!online) return;
        if (auto retry = weak_retry.lock()) retry->request_flush();
    });
    owner_token_ = users_->observe([weak_retry](const user_context::owner_t& owner) {
        if (!owner) return;
        if (auto retry = weak_retry.lock()) retry->request_flush();
    });

    realtime_->start();
    retry_->start();
    if (queue_->size() > 0) {
        retry_->request_flush();
    }
    LOG_INFO("repository", "Opened with %zu records and %zu outstanding operations",
             store_->size(), queue_->size());
}

repository::~repository() {
    {
        std::lock_guard<std::mutex> lock(callbacks_->mutex);
        callbacks_->on_synced = nullptr;
        callbacks_->on_failed = nullptr;
    }
    connectivity_token_.unregister();
    owner_token_.unregister();
    retry_->stop();
    realtime_->stop();
}

std::string repository::validate_name(const std::string& name) const {
    std::string trimmed = trim(name);
    if (trimmed.empty()) {
        throw validation_error("Name must not be empty");
    }
    if (utf8_length(trimmed) > config_.max_name_length) {
        throw validation_error("Name must be at most " + std::to_string(config_.max_name_length) + " characters");
    }
    return trimmed;
}

void repository::set_on_operation_synced(retry_scheduler::synced_handler handler) {
    std::lock_guard<std::mutex> lock(callbacks_->mutex);
    callbacks_->on_synced = std::move(handler);
}

void repository::set_on_operation_failed(retry_scheduler::failed_handler handler) {
    std::lock_guard<std::mutex> lock(callbacks_->mutex);
    callbacks_->on_failed = std::move(handler);
}

std::optional<record> repository::visible(const std::string& id) const {
    auto existing = store_->get(id);
    if (!existing) return std::nullopt;
    auto owner = users_->current_owner();
    if (owner && existing->owner_id != *owner) return std::nullopt;
    return existing;
}

record repository::require_live(const std::string& id) const {
    auto existing = visible(id);
    if (!existing || existing->deleted) {
        throw not_found_error("No record with id " + id);
    }
    return *existing;
}

timestamp_t repository::next_timestamp(timestamp_t previous) const {
    return std::max(clock_(), previous + std::chrono::milliseconds(1));
}

record repository::create(const std::string& name, const std::string& owner_id) {
    std::string trimmed = validate_name(name);
    if (owner_id.empty()) {
        throw validation_error("Owner id must not be empty");
    }
    auto session = users_->current_owner();
    if (session && *session != owner_id) {
        throw validation_error("Owner " + owner_id + " is not the signed-in user");
    }

    record r;
    r.id = generate_id();
    r.name = trimmed;
    r.owner_id = owner_id;
    r.created_at = clock_();
    r.updated_at = r.created_at;

    store_->upsert(r);
    try {
        queue_->enqueue(operation_kind::create, r.id, r);
    } catch (const db_error& e) {
        LOG_ERROR("repository", "Could not queue create of %s: %s", r.id.c_str(), e.what());
        store_->purge(r.id);
        throw;
    }
    LOG_DEBUG("repository", "Created %s", r.id.c_str());

    retry_->request_flush();
    return r;
}

record repository::update(const std::string& id, const record_patch& patch) {
    const record previous = require_live(id);
    if (patch.empty()) {
        throw validation_error("Patch has no fields");
    }
    record r = previous;
    if (patch.name) {
        r.name = validate_name(*patch.name);
    }
    r.updated_at = next_timestamp(r.updated_at);

    store_->upsert(r);
    try {
        queue_->enqueue(operation_kind::update, r.id, r);
    } catch (const db_error& e) {
        LOG_ERROR("repository", "Could not queue update of %s: %s", id.c_str(), e.what());
        store_->upsert(previous);
        throw;
    }
    LOG_DEBUG("repository", "Updated %s", r.id.c_str());

    retry_->request_flush();
    return r;
}

void repository::remove(const std::string& id) {
    const record previous = require_live(id);
    auto tombstone = store_->mark_deleted(id, clock_());
    if (!tombstone) {
        throw not_found_error("No record with id " + id);
    }
    try {
        queue_->enqueue(operation_kind::remove, id, *tombstone);
    } catch (const db_error& e) {
        LOG_ERROR("repository", "Could not queue delete of %s: %s", id.c_str(), e.what());
        store_->upsert(previous);
        throw;
    }
    LOG_DEBUG("repository", "Deleted %s", id.c_str());

    retry_->request_flush();
}

std::vector<record> repository::list(const std::string& owner_id) const {
    return store_->list(owner_id);
}

std::optional<record> repository::get(const std::string& id) const {
    return visible(id);
}

notification_token repository::subscribe(const std::string& owner_id, list_callback callback) {
    return store_->subscribe(owner_id, std::move(callback));
}

std::optional<sync_status> repository::get_sync_status(const std::string& id) const {
    if (!visible(id)) return std::nullopt;
    auto op = queue_->find_for_record(id);
    return op ? op->status : sync_status::synced;
}

std::vector<sync_operation> repository::get_pending_operations() const {
    return queue_->all();
}

void repository::retry_failed() {
    auto failed = queue_->failed();
    for (const auto& op : failed) {
        queue_->mark_pending(op.id);
    }
    LOG_INFO("repository", "Re-armed %zu failed operations", failed.size());
    retry_->request_flush();
}

bool repository::discard_operation(const std::string& operation_id) {
    auto op = queue_->find(operation_id);
    if (!op || !queue_->discard(operation_id)) {
        return false;
    }
    realtime_->on_operation_resolved(op->record_id);
    return true;
}

void repository::set_network_status(bool online) {
    connectivity_->set_online(online);
    if (online) retry_->request_flush();
}

void repository::flush() {
    retry_->request_flush();
}

void repository::refresh() {
    realtime_->refresh();
}

void repository::clear_all() {
    queue_->clear();
    store_->clear();
    storage_->clear();
    LOG_INFO("repository", "Cleared all local data");
}

} // namespace tether
