#pragma once

#include "observation.hpp"
#include "record.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

class backing_store;

// ============================================================================
// record_store - local source of truth
// ============================================================================
//
// Every committed mutation is written through to the backing store and then
// reported to the listeners of the affected owner, synchronously and in
// commit order. Never touches the network.

class record_store {
public:
    // Receives the full visible list (tombstones excluded) for the owner
    using listener_fn = std::function<void(const std::vector<record>&)>;

    explicit record_store(std::shared_ptr<backing_store> store);

    record_store(const record_store&) = delete;
    record_store& operator=(const record_store&) = delete;

    // Hydrate from the backing store, replacing in-memory state
    void load();

    // Tombstones included
    std::optional<record> get(const std::string& id) const;

    // Creation order, ties broken by insertion order; tombstones excluded
    std::vector<record> list(const std::string& owner_id) const;

    void upsert(const record& r);

    // Sets the tombstone and bumps updated_at past its previous value.
    // Returns the tombstoned record, or nullopt for an unknown id.
    std::optional<record> mark_deleted(const std::string& id, timestamp_t now);

    // Physically removes the row. Returns false for an unknown id.
    bool purge(const std::string& id);

    [[nodiscard]] notification_token subscribe(const std::string& owner_id, listener_fn listener);

    size_t size() const;

    // Drops every in-memory record; listeners see empty lists. The caller
    // clears the backing store.
    void clear();

private:
    struct entry {
        record value;
        uint64_t sequence;
    };

    struct subscription {
        std::string owner_id;
        std::shared_ptr<listener_fn> fn;
    };

    struct listener_registry {
        std::mutex mutex;
        std::map<uint64_t, subscription> subscriptions;
        uint64_t next_id = 1;
    };

    std::vector<record> list_locked(const std::string& owner_id) const;
    void notify(const std::string& owner_id);

    std::shared_ptr<backing_store> store_;
    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::string, entry> records_;
    uint64_t next_sequence_ = 1;
    std::shared_ptr<listener_registry> listeners_ = std::make_shared<listener_registry>();
};

} // namespace tether
