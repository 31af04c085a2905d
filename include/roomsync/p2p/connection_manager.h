#ifndef ROOMSYNC_P2P_CONNECTION_MANAGER_H
#define ROOMSYNC_P2P_CONNECTION_MANAGER_H

#include "roomsync/base/config.h"
#include "roomsync/base/result.h"
#include "roomsync/crypto/room_encryption.h"
#include "roomsync/p2p/nat_traversal.h"
#include "roomsync/p2p/signaling.h"
#include "roomsync/sync/replicated_document.h"
#include <elio/elio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace roomsync {

// Peer channel frame types (first byte of every frame)
enum class FrameType : uint8_t {
    Hello = 1,
    SyncRequest = 2,
    SyncReply = 3,
    Update = 4
};

// Upper bound of one SyncReply delta before encryption
constexpr size_t SYNC_BATCH_BYTES = 1024 * 1024;

struct Peer {
    std::string peer_id;
    std::string display_name = "Anonymous";
    std::string display_color = "#888";
    uint64_t last_seen = 0;  // ms since epoch
    bool online = true;
    bool direct = false;     // frames flow over a direct TCP channel
    bool synced = false;     // a SyncReply was received from this peer
};

struct ConnectionStats {
    size_t peers = 0;
    size_t direct = 0;
    size_t relayed = 0;
    uint64_t messages_in = 0;
    uint64_t messages_out = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    uint64_t dropped = 0;
};

struct RoomSession {
    std::string room_id;
    std::string local_peer_id;
    std::shared_ptr<ReplicatedDocument> document;
    std::vector<std::string> signaling_endpoints;  // endpoints that opened
    uint64_t connected_at = 0;
};

using ConnectionHandle = std::shared_ptr<const RoomSession>;

// Owns per-room signaling subscriptions, peer channels and presence.
// Only encrypted room messages cross into the transport.
class ConnectionManager {
public:
    using PeerJoinedCallback = std::function<void(const std::string& room_id, const Peer& peer)>;
    using PeerLeftCallback = std::function<void(const std::string& room_id, const std::string& peer_id)>;
    using SyncStateCallback = std::function<void(const std::string& room_id, bool synced)>;
    using PresenceCallback = std::function<void(const std::string& room_id, const std::vector<Peer>& peers)>;

    // An empty factory uses TcpSignalingClient
    ConnectionManager(const P2PConfig& config, RoomEncryption& encryption,
                      std::shared_ptr<elio::runtime::scheduler> scheduler,
                      SignalingTransportFactory factory = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    const std::string& local_peer_id() const;

    // Returns the existing handle when already connected to the room
    elio::coro::task<Result<ConnectionHandle>> connect(std::string room_id,
                                                       std::shared_ptr<ReplicatedDocument> document);
    void disconnect(const std::string& room_id);
    void disconnect_all();
    bool is_connected(const std::string& room_id) const;

    void set_local_presence(const std::string& name, const std::string& color);

    std::vector<Peer> get_connected_peers(const std::string& room_id) const;
    size_t get_peer_count(const std::string& room_id) const;
    bool is_synced(const std::string& room_id) const;
    ConnectionStats get_stats(const std::string& room_id) const;

    // Port of the direct-channel listener, 0 when not listening
    uint16_t direct_port() const;

    // Candidate gathering under probe_timeout_sec
    elio::coro::task<ConnectivityReport> test_connectivity();

    // Replacing a callback waits for a call already running on another thread
    void set_on_peer_joined(PeerJoinedCallback callback);
    void set_on_peer_left(PeerLeftCallback callback);
    void set_on_sync_state_changed(SyncStateCallback callback);
    void set_on_presence_changed(PresenceCallback callback);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace roomsync

#endif // ROOMSYNC_P2P_CONNECTION_MANAGER_H
