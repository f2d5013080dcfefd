#include "tether/sync_queue.hpp"
#include "tether/backing_store.hpp"
#include "tether/log.hpp"
#include <algorithm>

namespace tether {

const char* to_string(operation_kind kind) {
    switch (kind) {
        case operation_kind::create: return "create";
        case operation_kind::update: return "update";
        case operation_kind::remove: return "delete";
    }
    return "create";
}

const char* to_string(sync_status status) {
    switch (status) {
        case sync_status::pending: return "pending";
        case sync_status::synced: return "synced";
        case sync_status::error: return "error";
        case sync_status::retrying: return "retrying";
    }
    return "pending";
}

std::optional<operation_kind> operation_kind_from_string(const std::string& s) {
    if (s == "create") return operation_kind::create;
    if (s == "update") return operation_kind::update;
    if (s == "delete") return operation_kind::remove;
    return std::nullopt;
}

std::optional<sync_status> sync_status_from_string(const std::string& s) {
    if (s == "pending") return sync_status::pending;
    if (s == "synced") return sync_status::synced;
    if (s == "error") return sync_status::error;
    if (s == "retrying") return sync_status::retrying;
    return std::nullopt;
}

sync_queue::sync_queue(std::shared_ptr<backing_store> store, clock_fn clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

void sync_queue::load() {
    auto loaded = store_->load_operations();

    std::lock_guard<std::mutex> lock(mutex_);
    operations_.clear();
    by_record_.clear();
    next_sequence_ = 1;

    for (auto& op : loaded) {
        // Synced operations are removed on success; a leftover row is stale
        if (op.status == sync_status::synced) {
            store_->erase_operation(op.id);
            continue;
        }
        // The attempt was cut short by shutdown
        if (op.status == sync_status::retrying) {
            op.status = sync_status::error;
            if (!is_retryable(op.failure)) op.failure = failure_kind::network;
            if (op.last_error.empty()) op.last_error = "interrupted";
            store_->save_operation(op);
        }

        auto existing = by_record_.find(op.record_id);
        if (existing != by_record_.end()) {
            LOG_WARN("sync_queue", "Dropping duplicate operation %s for record %s",
                     op.id.c_str(), op.record_id.c_str());
            store_->erase_operation(op.id);
            continue;
        }

        next_sequence_ = std::max(next_sequence_, op.sequence + 1);
        by_record_[op.record_id] = op.id;
        operations_[op.id] = std::move(op);
    }
    LOG_INFO("sync_queue", "Loaded %zu outstanding operations", operations_.size());
}

sync_operation sync_queue::enqueue(operation_kind kind, const std::string& record_id, const record& payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Changes are written to the backing store before memory is touched
    auto existing = by_record_.find(record_id);
    if (existing != by_record_.end()) {
        auto it = operations_.find(existing->second);
        const sync_operation& current = it->second;

        if (current.kind == operation_kind::remove && kind != operation_kind::remove) {
            LOG_WARN("sync_queue", "Ignoring %s for %s: delete outstanding",
                     to_string(kind), record_id.c_str());
            return current;
        }

        if (kind != operation_kind::remove || current.kind == operation_kind::remove) {
            // Coalesce: an update folds into an unsent create, keeping kind.
            // A repeated delete only refreshes the tombstone snapshot.
            sync_operation merged = current;
            merged.payload = payload;
            merged.status = sync_status::pending;
            merged.attempts = 0;
            merged.failure = failure_kind::none;
            merged.last_error.clear();
            merged.revision++;
            persist(merged);
            it->second = merged;
            LOG_DEBUG("sync_queue", "Coalesced %s into %s (revision %llu)",
                      to_string(kind), merged.id.c_str(), static_cast<unsigned long long>(merged.revision));
            return merged;
        }

        LOG_DEBUG("sync_queue", "Delete supersedes %s %s for %s",
                  to_string(current.kind), current.id.c_str(), record_id.c_str());
    }

    sync_operation op;
    op.id = generate_id();
    op.kind = kind;
    op.record_id = record_id;
    op.payload = payload;
    op.status = sync_status::pending;
    op.created_at = clock_();
    op.sequence = next_sequence_;

    // Replaces any stored operation for the same record
    persist(op);
    if (existing != by_record_.end()) {
        operations_.erase(existing->second);
    }
    next_sequence_++;
    by_record_[record_id] = op.id;
    operations_[op.id] = op;
    LOG_DEBUG("sync_queue", "Enqueued %s %s for %s", to_string(kind), op.id.c_str(), record_id.c_str());
    return op;
}

ack_result sync_queue::mark_synced(const std::string& operation_id, uint64_t sent_revision) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return ack_result::missing;

    sync_operation& op = it->second;
    if (op.revision == sent_revision) {
        erase_locked(it);
        return ack_result::removed;
    }

    // The row now exists remotely; the newer payload goes out as an update
    if (op.kind == operation_kind::create) {
        op.kind = operation_kind::update;
    }
    op.status = sync_status::pending;
    op.last_attempt_at = clock_();
    persist(op);
    return ack_result::requeued;
}

bool sync_queue::mark_error(const std::string& operation_id, const std::string& error, failure_kind kind,
                            std::optional<uint64_t> sent_revision) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return false;

    sync_operation& op = it->second;
    op.last_error = error;
    op.last_attempt_at = clock_();

    if (sent_revision && *sent_revision != op.revision) {
        // The failed payload is obsolete; the newer one has not been tried
        op.status = sync_status::pending;
        persist(op);
        return true;
    }

    op.attempts++;
    op.status = sync_status::error;
    op.failure = kind;
    persist(op);
    return true;
}

bool sync_queue::mark_retrying(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end() || it->second.status != sync_status::error) return false;
    it->second.status = sync_status::retrying;
    persist(it->second);
    return true;
}

bool sync_queue::mark_pending(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return false;
    sync_operation& op = it->second;
    op.status = sync_status::pending;
    op.attempts = 0;
    op.failure = failure_kind::none;
    op.last_error.clear();
    persist(op);
    return true;
}

bool sync_queue::discard(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return false;
    LOG_INFO("sync_queue", "Discarding %s %s for %s",
             to_string(it->second.kind), operation_id.c_str(), it->second.record_id.c_str());
    erase_locked(it);
    return true;
}

std::vector<sync_operation> sync_queue::pending() const {
    return collect([](const sync_operation& op) {
        return op.status == sync_status::pending || op.status == sync_status::retrying;
    });
}

std::vector<sync_operation> sync_queue::failed() const {
    return collect([](const sync_operation& op) {
        return op.status == sync_status::error;
    });
}

std::vector<sync_operation> sync_queue::all() const {
    return collect([](const sync_operation&) { return true; });
}

std::optional<sync_operation> sync_queue::find(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return std::nullopt;
    return it->second;
}

std::optional<sync_operation> sync_queue::find_for_record(const std::string& record_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_record_.find(record_id);
    if (it == by_record_.end()) return std::nullopt;
    return operations_.at(it->second);
}

bool sync_queue::has_blocking_operation(const std::string& record_id) const {
    auto op = find_for_record(record_id);
    return op && op->is_blocking();
}

size_t sync_queue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.size();
}

void sync_queue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    operations_.clear();
    by_record_.clear();
}

std::vector<sync_operation> sync_queue::collect(bool (*pred)(const sync_operation&)) const {
    std::vector<sync_operation> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, op] : operations_) {
            if (pred(op)) result.push_back(op);
        }
    }
    std::sort(result.begin(), result.end(), [](const sync_operation& a, const sync_operation& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.sequence < b.sequence;
    });
    return result;
}

void sync_queue::persist(const sync_operation& op) {
    store_->save_operation(op);
}

void sync_queue::erase_locked(std::map<std::string, sync_operation>::iterator it) {
    store_->erase_operation(it->first);
    by_record_.erase(it->second.record_id);
    operations_.erase(it);
}

} // namespace tether
