// SubscriptionRegistry.h
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Push callback: decoded attributes plus the raw hub frame.
using PushCallback = std::function<void(const nlohmann::json& data, const nlohmann::json& raw)>;
using SubscriptionId = uint64_t;

// --- SubscriptionRegistry ---
// Callbacks owned per sub-device id. Dispatch copies the callback list under
// a shared lock and invokes it unlocked, so a callback may subscribe or
// unsubscribe without deadlocking.
class SubscriptionRegistry {
public:
    SubscriptionId Subscribe(const std::string& sid, PushCallback callback) {
        std::lock_guard<std::shared_mutex> lock(m_mutex);
        SubscriptionId id = ++m_next_id;
        m_callbacks[sid].push_back(Entry{ id, std::move(callback) });
        return id;
    }

    bool Unsubscribe(SubscriptionId id) {
        std::lock_guard<std::shared_mutex> lock(m_mutex);
        for (auto it = m_callbacks.begin(); it != m_callbacks.end(); ++it) {
            auto& entries = it->second;
            for (auto e = entries.begin(); e != entries.end(); ++e) {
                if (e->id == id) {
                    entries.erase(e);
                    if (entries.empty()) m_callbacks.erase(it);
                    return true;
                }
            }
        }
        return false;
    }

    bool HasSubscribers(const std::string& sid) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_callbacks.count(sid) > 0;
    }

    // Returns the number of callbacks invoked.
    size_t Dispatch(const std::string& sid, const nlohmann::json& data, const nlohmann::json& raw) const {
        std::vector<PushCallback> targets;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_callbacks.find(sid);
            if (it == m_callbacks.end()) return 0;
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.callback);
            }
        }
        for (const auto& callback : targets) {
            callback(data, raw);
        }
        return targets.size();
    }

private:
    struct Entry {
        SubscriptionId id;
        PushCallback callback;
    };

    std::map<std::string, std::vector<Entry>> m_callbacks;
    SubscriptionId m_next_id = 0;
    mutable std::shared_mutex m_mutex;
};
