// include/client/node_registry.h
#pragma once

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mapstore {

/**
 * @brief Live cluster-node registrations per client.
 *
 * NOT transactional: writes are visible to every thread immediately, are
 * not rolled back with the request and are not persisted. Concurrent
 * writers to one node entry resolve last-write-wins.
 */
template<typename K>
class NodeRegistry {
public:
    void registerNode(const K& client, const std::string& node_host, int registration_time) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        nodes_[client][node_host] = registration_time;
    }

    void unregisterNode(const K& client, const std::string& node_host) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = nodes_.find(client);
        if (it == nodes_.end()) {
            return;
        }
        it->second.erase(node_host);
        if (it->second.empty()) {
            nodes_.erase(it);
        }
    }

    // Copy of the registrations at the time of the call.
    std::map<std::string, int> getRegisteredNodes(const K& client) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = nodes_.find(client);
        return it == nodes_.end() ? std::map<std::string, int>{} : it->second;
    }

    void clear(const K& client) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        nodes_.erase(client);
    }

    size_t clientCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return nodes_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::map<std::string, int>> nodes_;
};

} // namespace mapstore
