#pragma once

#include "observation.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

namespace detail {

// Observer list shared with the tokens it hands out
template <typename T>
class observer_list {
public:
    using callback = std::function<void(const T&)>;

    notification_token add(callback fn) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->callbacks[id] = std::make_shared<callback>(std::move(fn));
        }
        std::weak_ptr<state> weak = state_;
        return notification_token([weak, id]() {
            if (auto s = weak.lock()) {
                std::lock_guard<std::mutex> lock(s->mutex);
                s->callbacks.erase(id);
            }
        });
    }

    void notify(const T& value) const {
        std::vector<std::shared_ptr<callback>> targets;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            for (const auto& [_, fn] : state_->callbacks) targets.push_back(fn);
        }
        for (const auto& fn : targets) (*fn)(value);
    }

private:
    struct state {
        std::mutex mutex;
        std::map<uint64_t, std::shared_ptr<callback>> callbacks;
        uint64_t next_id = 1;
    };
    std::shared_ptr<state> state_ = std::make_shared<state>();
};

} // namespace detail

// ============================================================================
// user_context - authenticated owner, fed by the auth provider
// ============================================================================
//
// nullopt means no session: records stay local and nothing is pushed.

class user_context {
public:
    using owner_t = std::optional<std::string>;

    user_context() = default;
    explicit user_context(owner_t owner) : owner_(std::move(owner)) {}

    owner_t current_owner() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return owner_;
    }

    // Observers fire only when the owner actually changes
    void set_owner(owner_t owner) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (owner_ == owner) return;
            owner_ = owner;
        }
        observers_.notify(owner);
    }

    [[nodiscard]] notification_token observe(std::function<void(const owner_t&)> fn) {
        return observers_.add(std::move(fn));
    }

private:
    mutable std::mutex mutex_;
    owner_t owner_;
    detail::observer_list<owner_t> observers_;
};

// ============================================================================
// connectivity_monitor - reachability as reported by the platform
// ============================================================================

class connectivity_monitor {
public:
    explicit connectivity_monitor(bool online = true) : online_(online) {}

    bool is_online() const { return online_.load(); }

    // Observers fire only on a transition
    void set_online(bool online) {
        if (online_.exchange(online) == online) return;
        observers_.notify(online);
    }

    [[nodiscard]] notification_token observe(std::function<void(const bool&)> fn) {
        return observers_.add(std::move(fn));
    }

private:
    std::atomic<bool> online_;
    detail::observer_list<bool> observers_;
};

} // namespace tether
