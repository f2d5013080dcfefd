#include "tether/record_store.hpp"
#include "tether/backing_store.hpp"
#include "tether/log.hpp"
#include <algorithm>
#include <set>

namespace tether {

record_store::record_store(std::shared_ptr<backing_store> store)
    : store_(std::move(store)) {}

void record_store::load() {
    auto loaded = store_->load_records();

    std::set<std::string> owners;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        for (const auto& [_, e] : records_) owners.insert(e.value.owner_id);
        records_.clear();
        next_sequence_ = 1;
        for (auto& r : loaded) {
            owners.insert(r.owner_id);
            records_[r.id] = entry{std::move(r), next_sequence_++};
        }
        LOG_INFO("record_store", "Loaded %zu records", records_.size());

        for (const auto& owner : owners) notify(owner);
    }
}

std::optional<record> record_store::get(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second.value;
}

std::vector<record> record_store::list(const std::string& owner_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return list_locked(owner_id);
}

std::vector<record> record_store::list_locked(const std::string& owner_id) const {
    std::vector<const entry*> visible;
    for (const auto& [_, e] : records_) {
        if (!e.value.deleted && e.value.owner_id == owner_id) {
            visible.push_back(&e);
        }
    }
    std::sort(visible.begin(), visible.end(), [](const entry* a, const entry* b) {
        if (a->value.created_at != b->value.created_at) {
            return a->value.created_at < b->value.created_at;
        }
        return a->sequence < b->sequence;
    });

    std::vector<record> result;
    result.reserve(visible.size());
    for (const auto* e : visible) result.push_back(e->value);
    return result;
}

void record_store::upsert(const record& r) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    store_->save_record(r);

    std::optional<std::string> previous_owner;
    auto it = records_.find(r.id);
    if (it == records_.end()) {
        records_[r.id] = entry{r, next_sequence_++};
    } else {
        if (it->second.value.owner_id != r.owner_id) {
            previous_owner = it->second.value.owner_id;
        }
        it->second.value = r;
    }
    LOG_DEBUG("record_store", "Upserted %s", r.id.c_str());

    if (previous_owner) notify(*previous_owner);
    notify(r.owner_id);
}

std::optional<record> record_store::mark_deleted(const std::string& id, timestamp_t now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;

    record tombstone = it->second.value;
    tombstone.deleted = true;
    tombstone.updated_at = std::max(now, tombstone.updated_at + std::chrono::milliseconds(1));

    store_->save_record(tombstone);
    it->second.value = tombstone;
    LOG_DEBUG("record_store", "Tombstoned %s", id.c_str());

    notify(tombstone.owner_id);
    return tombstone;
}

bool record_store::purge(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;

    store_->erase_record(id);
    std::string owner = it->second.value.owner_id;
    bool was_visible = !it->second.value.deleted;
    records_.erase(it);
    LOG_DEBUG("record_store", "Purged %s", id.c_str());

    // Tombstones are already invisible; only a live row changes the list
    if (was_visible) notify(owner);
    return true;
}

notification_token record_store::subscribe(const std::string& owner_id, listener_fn listener) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(listeners_->mutex);
        id = listeners_->next_id++;
        listeners_->subscriptions[id] = subscription{owner_id, std::make_shared<listener_fn>(std::move(listener))};
    }

    std::weak_ptr<listener_registry> weak = listeners_;
    return notification_token([weak, id]() {
        if (auto registry = weak.lock()) {
            std::lock_guard<std::mutex> lock(registry->mutex);
            registry->subscriptions.erase(id);
        }
    });
}

size_t record_store::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return records_.size();
}

void record_store::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::set<std::string> owners;
    for (const auto& [_, e] : records_) owners.insert(e.value.owner_id);
    records_.clear();
    LOG_INFO("record_store", "Cleared all records");
    for (const auto& owner : owners) notify(owner);
}

void record_store::notify(const std::string& owner_id) {
    // Snapshot so listeners may unsubscribe or mutate from inside the callback
    std::vector<std::shared_ptr<listener_fn>> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_->mutex);
        for (const auto& [_, sub] : listeners_->subscriptions) {
            if (sub.owner_id == owner_id) targets.push_back(sub.fn);
        }
    }
    if (targets.empty()) return;

    auto visible = list_locked(owner_id);
    for (const auto& fn : targets) {
        (*fn)(visible);
    }
}

} // namespace tether
