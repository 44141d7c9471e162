#pragma once

// ============================================================
// subscriber_registry.hpp -- Concurrent observer set keyed by id
// ============================================================

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <stdexcept>

// Subscriber must expose `std::string id() const`.
template <typename Subscriber>
class SubscriberRegistry {
public:
    using Ptr = std::shared_ptr<Subscriber>;

    // Upsert: a subscriber with an existing id replaces the old entry.
    void subscribe(Ptr sub) {
        if (!sub) throw std::invalid_argument("null subscriber");
        std::string key = sub->id();
        std::unique_lock<std::shared_mutex> lock(mutex_);
        subs_[key] = std::move(sub);
    }

    // No-op when the id is unknown.
    void unsubscribe(const std::string& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        subs_.erase(id);
    }

    // Invoke fn on every subscriber registered at call time. The lock is
    // not held while callbacks run, so a callback may (un)subscribe.
    template <typename Fn>
    void publish(Fn&& fn) const {
        std::vector<Ptr> snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            snapshot.reserve(subs_.size());
            for (const auto& kv : subs_) snapshot.push_back(kv.second);
        }
        for (const auto& s : snapshot) fn(*s);
    }

    bool contains(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return subs_.count(id) != 0;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return subs_.size();
    }

private:
    std::map<std::string, Ptr>  subs_;
    mutable std::shared_mutex   mutex_;
};
