#ifndef ROOMSYNC_SYNC_REPLICATED_DOCUMENT_H
#define ROOMSYNC_SYNC_REPLICATED_DOCUMENT_H

#include "roomsync/base/encoding.h"
#include "roomsync/base/result.h"
#include "roomsync/sync/delta.h"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomsync {

enum class ChangeOrigin {
    Local,     // write by this process
    Remote,    // merged delta from a peer
    Snapshot   // state restored from persistence
};

struct MapChangeEvent {
    std::string name_space;
    std::vector<std::string> keys;
    ChangeOrigin origin = ChangeOrigin::Local;
};

using MapObserver = std::function<void(const MapChangeEvent&)>;
using UpdateListener = std::function<void(const Bytes& delta)>;

class ReplicatedMap;

// Replicated state of one room document: named last-writer-wins maps with
// tombstones. Merging is idempotent and order independent.
class ReplicatedDocument : public std::enable_shared_from_this<ReplicatedDocument> {
public:
    // client_id 0 picks a random session id
    explicit ReplicatedDocument(std::string document_id, uint64_t client_id = 0);

    ReplicatedDocument(const ReplicatedDocument&) = delete;
    ReplicatedDocument& operator=(const ReplicatedDocument&) = delete;

    const std::string& id() const { return document_id_; }
    uint64_t client_id() const { return client_id_; }
    uint64_t clock() const;

    ReplicatedMap get_map(const std::string& name_space);

    // Local mutations: applied immediately, then emitted as a delta
    void set(const std::string& name_space, const std::string& key, nlohmann::json value);
    bool erase(const std::string& name_space, const std::string& key);
    size_t clear(const std::string& name_space);

    std::optional<nlohmann::json> get(const std::string& name_space, const std::string& key) const;
    bool contains(const std::string& name_space, const std::string& key) const;
    std::vector<std::string> keys(const std::string& name_space) const;
    std::vector<std::pair<std::string, nlohmann::json>> entries(const std::string& name_space) const;
    size_t size(const std::string& name_space) const;

    uint64_t observe(const std::string& name_space, MapObserver observer);
    // Once this returns the observer is not running on another thread and never runs again
    void unobserve(uint64_t subscription);

    // Receives every locally produced delta (for broadcast)
    uint64_t on_update(UpdateListener listener);
    void remove_update_listener(uint64_t subscription);

    // Merge a delta. Malformed input is rejected without touching state.
    Status apply_update(const Bytes& delta, ChangeOrigin origin = ChangeOrigin::Remote);

    // Whole state, tombstones included
    Bytes encode_state_as_update() const;
    // Whole state split into deltas of roughly max_bytes each
    std::vector<Bytes> encode_state_as_updates(size_t max_bytes) const;

    // Late observers get one synthetic Snapshot event once this is set
    void mark_snapshot_loaded();
    bool snapshot_loaded() const;

private:
    struct Entry {
        EntryVersion version;
        std::optional<nlohmann::json> value;
    };
    using Namespace = std::map<std::string, Entry>;

    EntryVersion next_version_locked();
    std::vector<DeltaEntry> state_entries_locked() const;
    // A registered observer or update listener. Removal waits until no other
    // thread is still inside the callback.
    struct Subscription {
        std::string name_space;
        MapObserver observer;
        UpdateListener listener;
        int in_flight = 0;
        bool removed = false;
    };
    using SubscriptionPtr = std::shared_ptr<Subscription>;

    void notify(const std::vector<MapChangeEvent>& events);
    void emit(const Bytes& delta);
    bool enter(const SubscriptionPtr& subscription);
    void leave(const SubscriptionPtr& subscription);
    void remove_subscription(std::map<uint64_t, SubscriptionPtr>& from, uint64_t id);

    struct DispatchGuard {
        ReplicatedDocument* document;
        const SubscriptionPtr& subscription;
        ~DispatchGuard() { document->leave(subscription); }
    };

    std::string document_id_;
    uint64_t client_id_;

    mutable std::mutex mutex_;
    uint64_t clock_ = 0;
    std::unordered_map<std::string, Namespace> namespaces_;
    bool snapshot_loaded_ = false;

    mutable std::mutex listeners_mutex_;
    uint64_t next_subscription_ = 1;
    std::condition_variable listeners_idle_;
    std::map<uint64_t, SubscriptionPtr> observers_;
    std::map<uint64_t, SubscriptionPtr> update_listeners_;
};

// Handle onto one namespace of a document
class ReplicatedMap {
public:
    ReplicatedMap(std::shared_ptr<ReplicatedDocument> document, std::string name_space);

    const std::string& name() const { return name_space_; }
    ReplicatedDocument& document() const { return *document_; }

    void set(const std::string& key, nlohmann::json value);
    bool erase(const std::string& key);
    size_t clear();

    std::optional<nlohmann::json> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;
    std::vector<std::pair<std::string, nlohmann::json>> entries() const;
    size_t size() const;

    uint64_t observe(MapObserver observer);
    void unobserve(uint64_t subscription);

private:
    std::shared_ptr<ReplicatedDocument> document_;
    std::string name_space_;
};

} // namespace roomsync

#endif // ROOMSYNC_SYNC_REPLICATED_DOCUMENT_H
