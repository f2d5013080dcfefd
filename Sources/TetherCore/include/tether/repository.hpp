#pragma once

#include "backing_store.hpp"
#include "configuration.hpp"
#include "network.hpp"
#include "observation.hpp"
#include "realtime_listener.hpp"
#include "record.hpp"
#include "record_store.hpp"
#include "remote_sync_client.hpp"
#include "retry_scheduler.hpp"
#include "scheduler.hpp"
#include "session.hpp"
#include "sync_queue.hpp"
#include "timer.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// repository - the CRUD surface applications depend on
// ============================================================================
//
// Every mutation completes locally and returns; pushing to the backend
// happens asynchronously through the retry scheduler. Validation failures
// throw before anything is stored, so there is never an optimistic write to
// roll back.
//
// While a session exists, reads and writes by id only see records owned by
// the session owner; another owner's record behaves as if it did not exist.

class repository {
public:
    using list_callback = record_store::listener_fn;

    // Collaborators supplied by the composition root. Empty members get
    // defaults: null network, thread timer, backing store from
    // configuration::storage_path, online connectivity, no session, system clock.
    struct dependencies {
        std::shared_ptr<network_factory> network;
        std::shared_ptr<timer_service> timers;
        std::shared_ptr<backing_store> storage;
        std::shared_ptr<connectivity_monitor> connectivity;
        std::shared_ptr<user_context> users;
        clock_fn clock;
    };

    explicit repository(const configuration& config = configuration(), dependencies deps = {});
    ~repository();

    repository(const repository&) = delete;
    repository& operator=(const repository&) = delete;

    /// Throws validation_error for an empty or over-long name (counted in
    /// code points), an empty owner, or an owner other than the session owner.
    record create(const std::string& name, const std::string& owner_id);

    /// Throws not_found_error for an unknown, deleted or foreign id and
    /// validation_error for an empty patch or invalid name.
    record update(const std::string& id, const record_patch& patch);

    /// Tombstones the record and queues the delete. Throws not_found_error.
    void remove(const std::string& id);

    std::vector<record> list(const std::string& owner_id) const;

    // Tombstoned records are still returned until purged
    std::optional<record> get(const std::string& id) const;

    [[nodiscard]] notification_token subscribe(const std::string& owner_id, list_callback callback);

    // nullopt for unknown or purged ids; synced when nothing is outstanding
    std::optional<sync_status> get_sync_status(const std::string& id) const;

    // pending, retrying and error entries, oldest first
    std::vector<sync_operation> get_pending_operations() const;

    void retry_failed();
    bool discard_operation(const std::string& operation_id);
    void set_network_status(bool online);
    void flush();

    /// Fetch the session owner's rows from the backend and merge them. Runs
    /// on its own when configuration::pull_on_session is set.
    void refresh();

    // Drops every local record and operation
    void clear_all();

    user_context& users() { return *users_; }
    connectivity_monitor& connectivity() { return *connectivity_; }
    retry_scheduler& sync_scheduler() { return *retry_; }
    realtime_listener& realtime() { return *realtime_; }

    void set_on_operation_synced(retry_scheduler::synced_handler handler);
    void set_on_operation_failed(retry_scheduler::failed_handler handler);

private:
    // Caller callbacks, shared with the scheduler's completion handlers
    struct sync_callbacks {
        std::mutex mutex;
        retry_scheduler::synced_handler on_synced;
        retry_scheduler::failed_handler on_failed;
    };

    std::string validate_name(const std::string& name) const;
    std::optional<record> visible(const std::string& id) const;
    record require_live(const std::string& id) const;
    timestamp_t next_timestamp(timestamp_t previous) const;

    configuration config_;
    clock_fn clock_;
    SharedScheduler scheduler_;
    std::shared_ptr<timer_service> timers_;
    std::shared_ptr<backing_store> storage_;
    std::shared_ptr<connectivity_monitor> connectivity_;
    std::shared_ptr<user_context> users_;

    std::shared_ptr<record_store> store_;
    std::shared_ptr<sync_queue> queue_;
    std::shared_ptr<remote_sync_client> remote_;
    std::shared_ptr<retry_scheduler> retry_;
    std::shared_ptr<realtime_listener> realtime_;

    std::shared_ptr<sync_callbacks> callbacks_ = std::make_shared<sync_callbacks>();

    notification_token connectivity_token_;
    notification_token owner_token_;
};

} // namespace tether
