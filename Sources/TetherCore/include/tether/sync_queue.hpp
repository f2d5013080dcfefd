#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "record.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

class backing_store;

enum class operation_kind : int {
    create = 0,
    update = 1,
    remove = 2   // "delete" on the wire
};

enum class sync_status : int {
    pending = 0,
    synced = 1,
    error = 2,
    retrying = 3
};

const char* to_string(operation_kind kind);
const char* to_string(sync_status status);
std::optional<operation_kind> operation_kind_from_string(const std::string& s);
std::optional<sync_status> sync_status_from_string(const std::string& s);

// ============================================================================
// sync_operation - one outstanding mutation for one record
// ============================================================================

struct sync_operation {
    std::string id;
    operation_kind kind = operation_kind::create;
    std::string record_id;
    record payload;                 // snapshot at (latest) enqueue time
    sync_status status = sync_status::pending;
    int attempts = 0;
    std::string last_error;
    failure_kind failure = failure_kind::none;
    timestamp_t created_at{};
    std::optional<timestamp_t> last_attempt_at;
    uint64_t revision = 0;          // bumped on every coalescing merge
    uint64_t sequence = 0;          // enqueue order tie-breaker for equal created_at

    // Pending, retrying, or failed with a retryable error. Realtime events for
    // the record are held back while this is true.
    bool is_blocking() const {
        return status == sync_status::pending || status == sync_status::retrying ||
               (status == sync_status::error && is_retryable(failure));
    }
};

// Outcome of acknowledging a push
enum class ack_result {
    removed,    // sent revision was current; operation is gone
    requeued,   // coalesced while in flight; newest payload still has to go out
    missing     // operation was superseded or discarded meanwhile
};

// ============================================================================
// sync_queue - coalescing ledger of outstanding operations
// ============================================================================
//
// At most one operation exists per record id. Thread-safe; every mutation is
// written through to the backing store.

class sync_queue {
public:
    explicit sync_queue(std::shared_ptr<backing_store> store, clock_fn clock = system_now);

    sync_queue(const sync_queue&) = delete;
    sync_queue& operator=(const sync_queue&) = delete;

    // Hydrate from the backing store. Entries interrupted while retrying come
    // back as retryable errors.
    void load();

    /// Coalescing insert.
    /// - delete replaces any outstanding operation for the record
    /// - create/update merge into an outstanding create/update: newest payload,
    ///   attempts reset, status pending, created_at preserved
    /// - create/update against an outstanding delete leave the delete in place
    sync_operation enqueue(operation_kind kind, const std::string& record_id, const record& payload);

    /// Success for the revision that was sent. Removes the operation when that
    /// revision is still current; otherwise the newer payload is re-queued
    /// (a create the backend already has becomes an update).
    ack_result mark_synced(const std::string& operation_id, uint64_t sent_revision);

    // Records a failed attempt. When sent_revision is given and the operation
    // was coalesced since, the error is noted but the operation stays pending.
    bool mark_error(const std::string& operation_id, const std::string& error, failure_kind kind,
                    std::optional<uint64_t> sent_revision = std::nullopt);

    // error -> retrying
    bool mark_retrying(const std::string& operation_id);

    // Manual re-arm: back to pending with a fresh retry budget
    bool mark_pending(const std::string& operation_id);

    // Explicit caller action; the only way an unsynced operation leaves the queue
    bool discard(const std::string& operation_id);

    // status in {pending, retrying}, oldest first
    std::vector<sync_operation> pending() const;

    // status == error, oldest first
    std::vector<sync_operation> failed() const;

    // everything outstanding, oldest first
    std::vector<sync_operation> all() const;

    std::optional<sync_operation> find(const std::string& operation_id) const;
    std::optional<sync_operation> find_for_record(const std::string& record_id) const;
    bool has_blocking_operation(const std::string& record_id) const;

    size_t size() const;
    void clear();

private:
    std::vector<sync_operation> collect(bool (*pred)(const sync_operation&)) const;
    void persist(const sync_operation& op);
    void erase_locked(std::map<std::string, sync_operation>::iterator it);

    std::shared_ptr<backing_store> store_;
    clock_fn clock_;
    mutable std::mutex mutex_;
    std::map<std::string, sync_operation> operations_;             // by operation id
    std::unordered_map<std::string, std::string> by_record_;       // record id -> operation id
    uint64_t next_sequence_ = 1;
};

} // namespace tether
