#pragma once

#include "record_store.hpp"
#include "remote_sync_client.hpp"
#include "session.hpp"
#include "sync_queue.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tether {

// ============================================================================
// realtime_listener - applies remote changes to the record store
// ============================================================================
//
// Follows the session owner: the change stream is reopened when the owner
// switches and closed when there is no session. Events for a record with a
// blocking local operation are held (latest per record) and replayed once
// the operation resolves. Events older than the local row are dropped.
// A stream that gave up reconnecting is resumed when the network comes back.
//
// Always owned by a shared_ptr; stream, fetch and observer callbacks hold a
// weak reference and keep the listener alive while they run.

class realtime_listener : public std::enable_shared_from_this<realtime_listener> {
public:
    realtime_listener(std::shared_ptr<remote_sync_client> remote,
                      std::shared_ptr<record_store> store,
                      std::shared_ptr<sync_queue> queue,
                      std::shared_ptr<user_context> users,
                      std::shared_ptr<connectivity_monitor> connectivity,
                      bool pull_on_session);
    ~realtime_listener();

    realtime_listener(const realtime_listener&) = delete;
    realtime_listener& operator=(const realtime_listener&) = delete;

    void start();
    void stop();

    // True while the change stream for the current owner is connected
    bool is_streaming() const;

    // Entry point for stream events
    void apply(const change_event& event);

    // Replays the held event for record_id if nothing blocks it any more
    void on_operation_resolved(const std::string& record_id);

    // The backend confirmed a delete and the row was purged. Held and later
    // insert/update events for the id are discarded.
    void on_record_purged(const std::string& record_id);

    /// Fetch the session owner's rows and merge them like stream events.
    /// Synced local rows the backend no longer has are purged.
    void refresh();

    size_t buffered_count() const;

private:
    void open_for(const user_context::owner_t& owner);
    void resume_stream();
    void apply_now(const change_event& event);
    void merge_snapshot(const std::string& owner_id, const std::vector<record>& rows);

    std::shared_ptr<remote_sync_client> remote_;
    std::shared_ptr<record_store> store_;
    std::shared_ptr<sync_queue> queue_;
    std::shared_ptr<user_context> users_;
    std::shared_ptr<connectivity_monitor> connectivity_;
    bool pull_on_session_;

    mutable std::mutex mutex_;
    std::optional<std::string> owner_;
    std::shared_ptr<change_stream> stream_;
    std::unordered_map<std::string, change_event> buffered_;
    std::unordered_set<std::string> purged_;   // confirmed deleted
    bool started_ = false;
    bool pull_pending_ = false;                // fetch skipped offline or failed retryably

    notification_token owner_token_;
    notification_token connectivity_token_;
};

} // namespace tether
