#include "roomsync/sync/replicated_document.h"
#include "roomsync/base/logger.h"
#include <algorithm>
#include <random>

namespace roomsync {

namespace {

uint64_t random_client_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t id = 0;
    while (id == 0) {
        id = rng();
    }
    return id;
}

// Subscriptions the current thread is inside of, innermost last
thread_local std::vector<const void*> dispatching;

// Per-entry overhead in the delta wire format
constexpr size_t ENTRY_OVERHEAD = 4 + 8 + 8 + 1 + 4;

} // anonymous namespace

ReplicatedDocument::ReplicatedDocument(std::string document_id, uint64_t client_id)
    : document_id_(std::move(document_id)),
      client_id_(client_id != 0 ? client_id : random_client_id()) {}

uint64_t ReplicatedDocument::clock() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_;
}

ReplicatedMap ReplicatedDocument::get_map(const std::string& name_space) {
    return ReplicatedMap(shared_from_this(), name_space);
}

EntryVersion ReplicatedDocument::next_version_locked() {
    return EntryVersion{++clock_, client_id_};
}

void ReplicatedDocument::set(const std::string& name_space, const std::string& key, nlohmann::json value) {
    DeltaEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.name_space = name_space;
        entry.key = key;
        entry.version = next_version_locked();
        entry.value = value;
        namespaces_[name_space][key] = Entry{entry.version, std::move(value)};
    }

    notify({MapChangeEvent{name_space, {key}, ChangeOrigin::Local}});
    emit(encode_delta({entry}));
}

bool ReplicatedDocument::erase(const std::string& name_space, const std::string& key) {
    DeltaEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto ns_it = namespaces_.find(name_space);
        if (ns_it == namespaces_.end()) return false;
        auto it = ns_it->second.find(key);
        if (it == ns_it->second.end() || !it->second.value) return false;

        entry.name_space = name_space;
        entry.key = key;
        entry.version = next_version_locked();
        it->second = Entry{entry.version, std::nullopt};
    }

    notify({MapChangeEvent{name_space, {key}, ChangeOrigin::Local}});
    emit(encode_delta({entry}));
    return true;
}

size_t ReplicatedDocument::clear(const std::string& name_space) {
    std::vector<DeltaEntry> tombstones;
    std::vector<std::string> cleared;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto ns_it = namespaces_.find(name_space);
        if (ns_it == namespaces_.end()) return 0;

        for (auto& [key, entry] : ns_it->second) {
            if (!entry.value) continue;
            DeltaEntry tombstone;
            tombstone.name_space = name_space;
            tombstone.key = key;
            tombstone.version = next_version_locked();
            entry = Entry{tombstone.version, std::nullopt};
            tombstones.push_back(std::move(tombstone));
            cleared.push_back(key);
        }
    }

    if (tombstones.empty()) return 0;

    notify({MapChangeEvent{name_space, cleared, ChangeOrigin::Local}});
    emit(encode_delta(tombstones));
    return cleared.size();
}

std::optional<nlohmann::json> ReplicatedDocument::get(const std::string& name_space,
                                                      const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = namespaces_.find(name_space);
    if (ns_it == namespaces_.end()) return std::nullopt;
    auto it = ns_it->second.find(key);
    if (it == ns_it->second.end()) return std::nullopt;
    return it->second.value;
}

bool ReplicatedDocument::contains(const std::string& name_space, const std::string& key) const {
    return get(name_space, key).has_value();
}

std::vector<std::string> ReplicatedDocument::keys(const std::string& name_space) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = namespaces_.find(name_space);
    if (ns_it == namespaces_.end()) return result;
    for (const auto& [key, entry] : ns_it->second) {
        if (entry.value) result.push_back(key);
    }
    return result;
}

std::vector<std::pair<std::string, nlohmann::json>> ReplicatedDocument::entries(
    const std::string& name_space) const {
    std::vector<std::pair<std::string, nlohmann::json>> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = namespaces_.find(name_space);
    if (ns_it == namespaces_.end()) return result;
    for (const auto& [key, entry] : ns_it->second) {
        if (entry.value) result.emplace_back(key, *entry.value);
    }
    return result;
}

size_t ReplicatedDocument::size(const std::string& name_space) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = namespaces_.find(name_space);
    if (ns_it == namespaces_.end()) return 0;
    return static_cast<size_t>(std::count_if(ns_it->second.begin(), ns_it->second.end(),
                                             [](const auto& kv) { return kv.second.value.has_value(); }));
}

uint64_t ReplicatedDocument::observe(const std::string& name_space, MapObserver observer) {
    auto subscription = std::make_shared<Subscription>();
    subscription->name_space = name_space;
    subscription->observer = observer;
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        id = next_subscription_++;
        observers_[id] = subscription;
    }

    // A snapshot loaded before this observer attached must still be seen once
    if (snapshot_loaded()) {
        observer(MapChangeEvent{name_space, keys(name_space), ChangeOrigin::Snapshot});
    }
    return id;
}

void ReplicatedDocument::unobserve(uint64_t subscription) {
    remove_subscription(observers_, subscription);
}

uint64_t ReplicatedDocument::on_update(UpdateListener listener) {
    auto subscription = std::make_shared<Subscription>();
    subscription->listener = std::move(listener);
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    uint64_t id = next_subscription_++;
    update_listeners_[id] = std::move(subscription);
    return id;
}

void ReplicatedDocument::remove_update_listener(uint64_t subscription) {
    remove_subscription(update_listeners_, subscription);
}

void ReplicatedDocument::remove_subscription(std::map<uint64_t, SubscriptionPtr>& from, uint64_t id) {
    std::unique_lock<std::mutex> lock(listeners_mutex_);
    auto it = from.find(id);
    if (it == from.end()) return;
    auto subscription = it->second;
    from.erase(it);
    subscription->removed = true;

    // A callback removing itself must not wait for its own frame
    int own = static_cast<int>(std::count(dispatching.begin(), dispatching.end(), subscription.get()));
    listeners_idle_.wait(lock, [&] { return subscription->in_flight <= own; });
}

bool ReplicatedDocument::enter(const SubscriptionPtr& subscription) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (subscription->removed) return false;
    subscription->in_flight++;
    dispatching.push_back(subscription.get());
    return true;
}

void ReplicatedDocument::leave(const SubscriptionPtr& subscription) {
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        subscription->in_flight--;
        dispatching.pop_back();
    }
    listeners_idle_.notify_all();
}

Status ReplicatedDocument::apply_update(const Bytes& delta, ChangeOrigin origin) {
    auto decoded = decode_delta(delta);
    if (!decoded) {
        Logger::instance().warning("Dropping malformed delta for " + document_id_ + ": " +
                                   decoded.error().message);
        return decoded.error();
    }

    std::map<std::string, std::vector<std::string>> changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& incoming : *decoded) {
            clock_ = std::max(clock_, incoming.version.clock);

            auto& ns = namespaces_[incoming.name_space];
            auto it = ns.find(incoming.key);
            if (it != ns.end() && !(it->second.version < incoming.version)) {
                continue;  // already have this write or a newer one
            }

            bool was_visible = it != ns.end() && it->second.value.has_value();
            bool now_visible = incoming.value.has_value();
            ns[incoming.key] = Entry{incoming.version, std::move(incoming.value)};
            if (was_visible || now_visible) {
                changed[incoming.name_space].push_back(incoming.key);
            }
        }
    }

    std::vector<MapChangeEvent> events;
    for (auto& [name, keys] : changed) {
        events.push_back(MapChangeEvent{name, std::move(keys), origin});
    }
    if (!events.empty()) {
        notify(events);
    }
    if (origin == ChangeOrigin::Local) {
        emit(delta);
    }
    return Status{};
}

std::vector<DeltaEntry> ReplicatedDocument::state_entries_locked() const {
    std::vector<DeltaEntry> result;
    for (const auto& [name, ns] : namespaces_) {
        for (const auto& [key, entry] : ns) {
            result.push_back(DeltaEntry{name, key, entry.version, entry.value});
        }
    }
    return result;
}

Bytes ReplicatedDocument::encode_state_as_update() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return encode_delta(state_entries_locked());
}

std::vector<Bytes> ReplicatedDocument::encode_state_as_updates(size_t max_bytes) const {
    std::vector<DeltaEntry> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all = state_entries_locked();
    }

    std::vector<Bytes> deltas;
    std::vector<DeltaEntry> batch;
    size_t batch_bytes = 0;
    for (auto& entry : all) {
        size_t entry_bytes = ENTRY_OVERHEAD + entry.key.size() + entry.name_space.size();
        if (entry.value) {
            // Chunk payloads dominate; their base64 text is close to its CBOR size
            entry_bytes += entry.value->is_string() ? entry.value->get_ref<const std::string&>().size()
                                                    : entry.value->dump().size();
        }
        if (!batch.empty() && batch_bytes + entry_bytes > max_bytes) {
            deltas.push_back(encode_delta(batch));
            batch.clear();
            batch_bytes = 0;
        }
        batch_bytes += entry_bytes;
        batch.push_back(std::move(entry));
    }
    if (!batch.empty()) {
        deltas.push_back(encode_delta(batch));
    }
    return deltas;
}

void ReplicatedDocument::mark_snapshot_loaded() {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_loaded_ = true;
}

bool ReplicatedDocument::snapshot_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_loaded_;
}

void ReplicatedDocument::notify(const std::vector<MapChangeEvent>& events) {
    std::vector<SubscriptionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, subscription] : observers_) {
            targets.push_back(subscription);
        }
    }

    for (const auto& event : events) {
        for (const auto& subscription : targets) {
            if (subscription->name_space != event.name_space) continue;
            if (!enter(subscription)) continue;
            DispatchGuard guard{this, subscription};
            try {
                subscription->observer(event);
            } catch (const std::exception& e) {
                Logger::instance().error("Map observer for " + subscription->name_space + " threw: " + e.what());
            }
        }
    }
}

void ReplicatedDocument::emit(const Bytes& delta) {
    std::vector<SubscriptionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, subscription] : update_listeners_) {
            targets.push_back(subscription);
        }
    }

    for (const auto& subscription : targets) {
        if (!enter(subscription)) continue;
        DispatchGuard guard{this, subscription};
        try {
            subscription->listener(delta);
        } catch (const std::exception& e) {
            Logger::instance().error("Update listener for " + document_id_ + " threw: " + e.what());
        }
    }
}

// ReplicatedMap implementation
ReplicatedMap::ReplicatedMap(std::shared_ptr<ReplicatedDocument> document, std::string name_space)
    : document_(std::move(document)), name_space_(std::move(name_space)) {}

void ReplicatedMap::set(const std::string& key, nlohmann::json value) {
    document_->set(name_space_, key, std::move(value));
}

bool ReplicatedMap::erase(const std::string& key) {
    return document_->erase(name_space_, key);
}

size_t ReplicatedMap::clear() {
    return document_->clear(name_space_);
}

std::optional<nlohmann::json> ReplicatedMap::get(const std::string& key) const {
    return document_->get(name_space_, key);
}

bool ReplicatedMap::contains(const std::string& key) const {
    return document_->contains(name_space_, key);
}

std::vector<std::string> ReplicatedMap::keys() const {
    return document_->keys(name_space_);
}

std::vector<std::pair<std::string, nlohmann::json>> ReplicatedMap::entries() const {
    return document_->entries(name_space_);
}

size_t ReplicatedMap::size() const {
    return document_->size(name_space_);
}

uint64_t ReplicatedMap::observe(MapObserver observer) {
    return document_->observe(name_space_, std::move(observer));
}

void ReplicatedMap::unobserve(uint64_t subscription) {
    document_->unobserve(subscription);
}

} // namespace roomsync
