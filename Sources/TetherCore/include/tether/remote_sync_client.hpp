#pragma once

#include "configuration.hpp"
#include "errors.hpp"
#include "network.hpp"
#include "record.hpp"
#include "scheduler.hpp"
#include "session.hpp"
#include "sync_queue.hpp"
#include "timer.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tether {

// Outcome of one push, delivered on the configured scheduler
struct push_result {
    bool success = false;
    failure_kind failure = failure_kind::none;
    std::string reason;

    static push_result ok() { return push_result{true, failure_kind::none, {}}; }
    static push_result failed(failure_kind kind, std::string why) {
        return push_result{false, kind, std::move(why)};
    }
};

// Outcome of a row fetch, delivered on the configured scheduler
struct fetch_result {
    bool success = false;
    failure_kind failure = failure_kind::none;
    std::string reason;
    std::vector<record> rows;
};

// One inbound realtime event:
// {"type":"change","event":"insert"|"update"|"delete","row":{...}}
struct change_event {
    enum class type { insert, update, remove };

    type event_type = type::update;
    record row;

    std::string to_json() const;
    static std::optional<change_event> from_json(const std::string& json);
};

const char* to_string(change_event::type t);

// ============================================================================
// change_stream - handle for an open realtime subscription
// ============================================================================
//
// Reconnects with exponential backoff when the channel drops and gives up
// after max_reconnect_attempts; resume() starts a fresh round. Destroying the
// handle closes the stream and stops reconnection.

class change_stream {
public:
    struct state;

    explicit change_stream(std::shared_ptr<state> s) : state_(std::move(s)) {}
    ~change_stream();

    change_stream(const change_stream&) = delete;
    change_stream& operator=(const change_stream&) = delete;

    void close();

    // Reconnect now with a fresh attempt budget. No-op while connected or
    // while a connection attempt is under way.
    void resume();

    bool is_connected() const;
    bool gave_up() const;
    const std::string& owner_id() const;

    // Consecutive failed connection attempts since the last successful open
    int reconnect_attempts() const;

private:
    std::shared_ptr<state> state_;
};

// ============================================================================
// remote_sync_client - pushes operations and opens change streams
// ============================================================================

class remote_sync_client {
public:
    using push_completion = std::function<void(push_result)>;
    using fetch_completion = std::function<void(fetch_result)>;
    using change_handler = std::function<void(const change_event&)>;

    remote_sync_client(const configuration& config,
                       std::shared_ptr<network_factory> factory,
                       std::shared_ptr<user_context> users,
                       std::shared_ptr<timer_service> timers,
                       SharedScheduler sched);

    remote_sync_client(const remote_sync_client&) = delete;
    remote_sync_client& operator=(const remote_sync_client&) = delete;

    /// Insert (create), upsert-by-id (update) or row delete (delete), scoped to
    /// the session owner. Without a session, or when the operation belongs to
    /// another owner, completes with auth_mismatch and sends nothing.
    void push(const sync_operation& op, push_completion completion);

    /// Every backend row owned by owner_id, including tombstoned ones. Refused
    /// with auth_mismatch unless owner_id is the session owner.
    void fetch_rows(const std::string& owner_id, fetch_completion completion);

    /// Subscribe to row changes for owner_id. Returns nullptr when no realtime
    /// URL is configured or the platform has no push transport.
    std::unique_ptr<change_stream> open_change_stream(const std::string& owner_id, change_handler on_change);

    http_request build_request(const sync_operation& op, const std::string& owner_id) const;
    http_request build_fetch_request(const std::string& owner_id) const;

    static failure_kind classify_status(int status_code);

private:
    HeadersMap auth_headers() const;
    std::string table_url() const;

    configuration config_;
    std::shared_ptr<network_factory> factory_;
    std::unique_ptr<http_client> http_;
    std::shared_ptr<user_context> users_;
    std::shared_ptr<timer_service> timers_;
    SharedScheduler scheduler_;
};

} // namespace tether
