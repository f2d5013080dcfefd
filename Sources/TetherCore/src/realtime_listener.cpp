#include "tether/realtime_listener.hpp"
#include "tether/log.hpp"

namespace tether {

realtime_listener::realtime_listener(std::shared_ptr<remote_sync_client> remote,
                                     std::shared_ptr<record_store> store,
                                     std::shared_ptr<sync_queue> queue,
                                     std::shared_ptr<user_context> users,
                                     std::shared_ptr<connectivity_monitor> connectivity,
                                     bool pull_on_session)
    : remote_(std::move(remote))
    , store_(std::move(store))
    , queue_(std::move(queue))
    , users_(std::move(users))
    , connectivity_(std::move(connectivity))
    , pull_on_session_(pull_on_session) {}

realtime_listener::~realtime_listener() {
    stop();
}

void realtime_listener::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return;
        started_ = true;
    }

    std::weak_ptr<realtime_listener> weak = weak_from_this();
    owner_token_ = users_->observe([weak](const user_context::owner_t& owner) {
        if (auto self = weak.lock()) self->open_for(owner);
    });
    connectivity_token_ = connectivity_->observe([weak](const bool& online) {
        if (!online) return;
        if (auto self = weak.lock()) self->resume_stream();
    });
    open_for(users_->current_owner());
}

void realtime_listener::stop() {
    std::shared_ptr<change_stream> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        started_ = false;
        closing = std::move(stream_);
        owner_.reset();
        buffered_.clear();
        pull_pending_ = false;
    }
    owner_token_.unregister();
    connectivity_token_.unregister();
    if (closing) closing->close();
}

bool realtime_listener::is_streaming() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ && stream_->is_connected();
}

size_t realtime_listener::buffered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_.size();
}

void realtime_listener::open_for(const user_context::owner_t& owner) {
    std::shared_ptr<change_stream> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        if (owner_ == owner) return;
        previous = std::move(stream_);
        owner_ = owner;
        buffered_.clear();
        pull_pending_ = false;
    }
    if (previous) previous->close();
    if (!owner) {
        LOG_INFO("realtime", "No session; change stream stopped");
        return;
    }

    std::weak_ptr<realtime_listener> weak = weak_from_this();
    std::shared_ptr<change_stream> stream =
        remote_->open_change_stream(*owner, [weak](const change_event& event) {
            if (auto self = weak.lock()) self->apply(event);
        });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (owner_ != owner || !started_) return;
        stream_ = std::move(stream);
    }
    if (pull_on_session_) refresh();
}

void realtime_listener::resume_stream() {
    std::shared_ptr<change_stream> stream;
    bool pull;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        stream = stream_;
        pull = pull_pending_;
    }
    if (stream && !stream->is_connected()) stream->resume();
    if (pull) refresh();
}

void realtime_listener::refresh() {
    auto owner = users_->current_owner();
    if (!owner) {
        LOG_DEBUG("realtime", "No session; nothing to fetch");
        return;
    }
    if (!connectivity_->is_online()) {
        LOG_DEBUG("realtime", "Offline; fetch deferred");
        std::lock_guard<std::mutex> lock(mutex_);
        pull_pending_ = true;
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pull_pending_ = false;
    }

    std::weak_ptr<realtime_listener> weak = weak_from_this();
    std::string owner_id = *owner;
    remote_->fetch_rows(owner_id, [weak, owner_id](fetch_result result) {
        auto self = weak.lock();
        if (!self) return;
        if (!result.success) {
            LOG_WARN("realtime", "Could not fetch rows for %s: %s", owner_id.c_str(), result.reason.c_str());
            if (is_retryable(result.failure)) {
                std::lock_guard<std::mutex> lock(self->mutex_);
                self->pull_pending_ = true;
            }
            return;
        }
        self->merge_snapshot(owner_id, result.rows);
    });
}

void realtime_listener::merge_snapshot(const std::string& owner_id, const std::vector<record>& rows) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || owner_ != owner_id) {
            LOG_DEBUG("realtime", "Dropping rows fetched for %s: owner changed", owner_id.c_str());
            return;
        }
    }

    std::unordered_set<std::string> present;
    for (const auto& row : rows) {
        present.insert(row.id);
        change_event event;
        event.event_type = change_event::type::insert;
        event.row = row;
        apply(event);
    }

    // Deleted on the backend while this device was not listening
    size_t removed = 0;
    for (const auto& local : store_->list(owner_id)) {
        if (present.count(local.id) || queue_->find_for_record(local.id)) continue;
        store_->purge(local.id);
        ++removed;
    }
    LOG_INFO("realtime", "Merged %zu fetched rows for %s (%zu removed locally)",
             rows.size(), owner_id.c_str(), removed);
}

void realtime_listener::apply(const change_event& event) {
    const auto& id = event.row.id;

    // Delete payloads may carry only the primary key
    std::string event_owner = event.row.owner_id;
    if (event_owner.empty() && event.event_type == change_event::type::remove) {
        if (auto local = store_->get(id)) event_owner = local->owner_id;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_ || event_owner != *owner_) {
            LOG_DEBUG("realtime", "Ignoring %s for %s: other owner", to_string(event.event_type), id.c_str());
            return;
        }
        if (queue_->has_blocking_operation(id)) {
            LOG_DEBUG("realtime", "Holding %s for %s: local write outstanding",
                      to_string(event.event_type), id.c_str());
            buffered_[id] = event;
            return;
        }
    }
    apply_now(event);
}

void realtime_listener::on_operation_resolved(const std::string& record_id) {
    std::optional<change_event> held;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buffered_.find(record_id);
        if (it == buffered_.end()) return;
        if (queue_->has_blocking_operation(record_id)) return;
        held = std::move(it->second);
        buffered_.erase(it);
    }
    LOG_DEBUG("realtime", "Replaying held %s for %s", to_string(held->event_type), record_id.c_str());
    apply_now(*held);
}

void realtime_listener::on_record_purged(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffered_.erase(record_id) > 0) {
        LOG_DEBUG("realtime", "Discarding held event for deleted %s", record_id.c_str());
    }
    purged_.insert(record_id);
}

void realtime_listener::apply_now(const change_event& event) {
    const record& row = event.row;
    bool is_delete = event.event_type == change_event::type::remove || row.deleted;

    if (!is_delete) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (purged_.count(row.id)) {
            LOG_DEBUG("realtime", "Dropping %s for %s: deleted", to_string(event.event_type), row.id.c_str());
            return;
        }
    }

    auto local = store_->get(row.id);
    bool has_timestamp = row.updated_at != timestamp_t{};
    if (local && has_timestamp && row.updated_at < local->updated_at) {
        LOG_DEBUG("realtime", "Dropping stale %s for %s", to_string(event.event_type), row.id.c_str());
        return;
    }

    if (is_delete) {
        if (!local) return;
        if (queue_->find_for_record(row.id)) {
            // A failed local operation still refers to the row
            if (!local->deleted) store_->mark_deleted(row.id, row.updated_at);
            LOG_INFO("realtime", "Remote delete of %s", row.id.c_str());
            return;
        }
        store_->purge(row.id);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            purged_.insert(row.id);
        }
        LOG_INFO("realtime", "Remote delete of %s; purged", row.id.c_str());
        return;
    }

    if (local && *local == row) return;   // echo of our own write
    store_->upsert(row);
    LOG_INFO("realtime", "Remote %s of %s", to_string(event.event_type), row.id.c_str());
}

} // namespace tether
