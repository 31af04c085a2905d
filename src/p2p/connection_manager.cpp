#include "roomsync/p2p/connection_manager.h"
#include "roomsync/p2p/framed_connection.h"
#include "roomsync/p2p/rate_limiter.h"
#include "roomsync/sync/delta.h"
#include "roomsync/base/encoding.h"
#include "roomsync/base/logger.h"
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <atomic>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>

namespace roomsync {

namespace {

constexpr const char* MSG_ANNOUNCE = "announce";
constexpr const char* MSG_LEAVE = "leave";
constexpr const char* MSG_RELAY = "relay";

constexpr auto HEARTBEAT_TICK = std::chrono::milliseconds(200);
constexpr auto REFLEXIVE_PROBE_TIMEOUT = std::chrono::seconds(3);

Bytes make_frame(FrameType type, const Bytes& payload) {
    Bytes frame;
    frame.reserve(payload.size() + 1);
    frame.push_back(static_cast<uint8_t>(type));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

Bytes json_bytes(const nlohmann::json& j) {
    std::string text = j.dump();
    return Bytes(text.begin(), text.end());
}

std::string short_id(const std::string& peer_id) {
    return peer_id.substr(0, 8);
}

template <typename Callback, typename... Args>
void fire(Callback callback, Args&&... args) {
    if (!callback) return;
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Connection callback threw: ") + e.what());
    }
}

struct RelayCheck {
    std::atomic<size_t> pending{0};
    std::mutex mutex;
    std::vector<IceCandidate> reachable;
};

elio::coro::task<void> check_signaling(SignalingTransportFactory factory, std::string endpoint,
                                       std::shared_ptr<RelayCheck> check) {
    auto transport = factory(endpoint);
    bool ok = transport && co_await transport->open();
    if (transport) {
        transport->close();
        transport.reset();
    }
    if (ok) {
        IceCandidate candidate;
        candidate.type = CandidateType::Relay;
        candidate.protocol = "tcp";
        candidate.server = endpoint;
        std::string host;
        uint16_t port = 0;
        if (parse_endpoint(endpoint, host, port)) {
            candidate.address = host;
            candidate.port = port;
        }
        std::lock_guard<std::mutex> lock(check->mutex);
        check->reachable.push_back(std::move(candidate));
    }
    check->pending--;
}

} // anonymous namespace

struct ConnectionManager::Impl : std::enable_shared_from_this<ConnectionManager::Impl> {
    struct PeerState {
        Peer info;
        uint64_t presence_clock = 0;
        std::vector<IceCandidate> candidates;
        std::shared_ptr<FramedConnection> direct;
        bool dialing = false;
        bool sync_requested = false;
    };

    struct Room {
        std::shared_ptr<RoomSession> session;
        std::vector<std::shared_ptr<SignalingTransport>> transports;
        std::map<std::string, PeerState> peers;
        uint64_t update_subscription = 0;
        bool synced = false;
        ConnectionStats stats;
    };

    Impl(const P2PConfig& cfg, RoomEncryption& enc, std::shared_ptr<elio::runtime::scheduler> sched,
         SignalingTransportFactory fac)
        : config(cfg), encryption(enc), scheduler(std::move(sched)), factory(std::move(fac)),
          local_peer_id(generate_uuid()), limiter(cfg) {}

    P2PConfig config;
    RoomEncryption& encryption;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    SignalingTransportFactory factory;
    std::string local_peer_id;
    PeerRateLimiter limiter;

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<Room>> rooms;
    std::string presence_name = "Anonymous";
    std::string presence_color = "#888";
    uint64_t presence_clock = 1;
    std::vector<IceCandidate> local_candidates;
    bool candidates_gathered = false;
    bool heartbeat_started = false;

    std::optional<elio::net::tcp_listener> listener;
    std::atomic<uint16_t> listen_port{0};
    std::atomic<bool> running{true};

    // Held while a callback runs, so replacing one waits out a call in flight.
    // Recursive: a callback may replace callbacks.
    std::recursive_mutex callback_mutex;
    PeerJoinedCallback on_peer_joined;
    PeerLeftCallback on_peer_left;
    SyncStateCallback on_sync_state_changed;
    PresenceCallback on_presence_changed;

    std::shared_ptr<Room> find_room(const std::string& room_id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = rooms.find(room_id);
        return it == rooms.end() ? nullptr : it->second;
    }

    static std::vector<Peer> peer_list_locked(const Room& room) {
        std::vector<Peer> peers;
        for (const auto& [id, state] : room.peers) {
            peers.push_back(state.info);
        }
        return peers;
    }

    // Signaling

    nlohmann::json announce_message_locked() const {
        nlohmann::json candidates = nlohmann::json::array();
        for (const auto& candidate : local_candidates) {
            candidates.push_back(candidate);
        }
        return nlohmann::json{
            {"type", MSG_ANNOUNCE},
            {"from", local_peer_id},
            {"presence", {{"name", presence_name}, {"color", presence_color}}},
            {"clock", presence_clock},
            {"candidates", candidates},
        };
    }

    void publish(const std::shared_ptr<Room>& room, const nlohmann::json& data) {
        std::vector<std::shared_ptr<SignalingTransport>> transports;
        {
            std::lock_guard<std::mutex> lock(mutex);
            transports = room->transports;
        }
        for (auto& transport : transports) {
            if (transport->is_open()) {
                transport->publish(room->session->room_id, data);
            }
        }
    }

    void announce(const std::shared_ptr<Room>& room) {
        nlohmann::json message;
        {
            std::lock_guard<std::mutex> lock(mutex);
            message = announce_message_locked();
        }
        publish(room, message);
    }

    void handle_signal(const std::string& room_id, const std::string& topic, const nlohmann::json& data) {
        if (topic != room_id || !data.is_object()) return;

        std::string type = data.value("type", "");
        std::string from = data.value("from", "");
        if (from.empty() || from == local_peer_id) return;

        auto room = find_room(room_id);
        if (!room) return;

        if (limiter.is_banned(from)) {
            std::lock_guard<std::mutex> lock(mutex);
            room->stats.dropped++;
            return;
        }

        if (type == MSG_ANNOUNCE) {
            handle_announce(room, from, data);
        } else if (type == MSG_LEAVE) {
            remove_peer(room, from, "left");
        } else if (type == MSG_RELAY) {
            std::string to = data.value("to", "");
            if (!to.empty() && to != local_peer_id) return;

            bool known = false;
            {
                std::lock_guard<std::mutex> lock(mutex);
                known = room->peers.count(from) > 0;
            }
            if (!known) {
                Logger::instance().debug("Relay frame from unknown peer {} ignored", short_id(from));
                return;
            }

            auto frame = base64_decode(data.value("frame", ""));
            if (!frame) {
                Logger::instance().warning("Malformed relay frame from peer {}", short_id(from));
                std::lock_guard<std::mutex> lock(mutex);
                room->stats.dropped++;
                return;
            }
            handle_frame(room, from, *frame);
        }
    }

    void handle_announce(const std::shared_ptr<Room>& room, const std::string& from, const nlohmann::json& data) {
        if (!limiter.allow_message(from)) {
            std::lock_guard<std::mutex> lock(mutex);
            room->stats.dropped++;
            return;
        }

        uint64_t clock = data.value("clock", static_cast<uint64_t>(0));
        std::string name = "Anonymous";
        std::string color = "#888";
        if (auto presence = data.find("presence"); presence != data.end() && presence->is_object()) {
            name = presence->value("name", name);
            color = presence->value("color", color);
        }
        std::vector<IceCandidate> candidates;
        if (auto list = data.find("candidates"); list != data.end() && list->is_array()) {
            for (const auto& item : *list) {
                if (!item.is_object()) continue;
                candidates.push_back(item.get<IceCandidate>());
            }
        }

        bool joined = false;
        bool presence_changed = false;
        bool dial = false;
        Peer joined_peer;
        std::vector<Peer> peers;
        const std::string& room_id = room->session->room_id;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = room->peers.find(from);
            if (it == room->peers.end()) {
                if (room->peers.size() >= config.max_peers) {
                    Logger::instance().warning("Room {} is full ({} peers), ignoring peer {}", room_id,
                                               config.max_peers, short_id(from));
                    return;
                }
                if (!limiter.allow_connection(from)) {
                    room->stats.dropped++;
                    return;
                }
                PeerState state;
                state.info.peer_id = from;
                it = room->peers.emplace(from, std::move(state)).first;
                joined = true;
            }

            auto& peer = it->second;
            peer.info.last_seen = now_ms();
            peer.info.online = true;
            if (joined || clock >= peer.presence_clock) {
                presence_changed = joined || peer.info.display_name != name || peer.info.display_color != color;
                peer.presence_clock = clock;
                peer.info.display_name = name;
                peer.info.display_color = color;
                peer.candidates = candidates;
            }

            if (joined && config.enable_direct && listen_port.load() != 0 && local_peer_id < from &&
                !peer.direct && !peer.dialing && !peer.candidates.empty()) {
                peer.dialing = true;
                dial = true;
            }

            joined_peer = peer.info;
            room->stats.messages_in++;
            if (presence_changed) {
                peers = peer_list_locked(*room);
            }
        }

        if (joined) {
            Logger::instance().info("Peer {} ({}) joined room {}", short_id(from), name, room_id);
            {
                std::lock_guard<std::recursive_mutex> lock(callback_mutex);
                fire(on_peer_joined, room_id, joined_peer);
            }

            // Let the newcomer learn about us without waiting for the heartbeat
            announce(room);
            update_sync_state(room);

            if (dial) {
                spawn_detached(scheduler, dial_peer(shared_from_this(), room, from, candidates));
            } else {
                request_sync(room, from);
            }
        }

        if (presence_changed) {
            {
                std::lock_guard<std::recursive_mutex> lock(callback_mutex);
                fire(on_presence_changed, room_id, peers);
            }
        }
    }

    void remove_peer(const std::shared_ptr<Room>& room, const std::string& peer_id, const char* reason) {
        std::shared_ptr<FramedConnection> direct;
        std::vector<Peer> peers;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = room->peers.find(peer_id);
            if (it == room->peers.end()) return;
            direct = std::move(it->second.direct);
            room->peers.erase(it);
            peers = peer_list_locked(*room);
        }
        if (direct) {
            direct->close();
        }
        limiter.forget(peer_id);

        const std::string& room_id = room->session->room_id;
        Logger::instance().info("Peer {} {} room {}", short_id(peer_id), reason, room_id);

        {
            std::lock_guard<std::recursive_mutex> lock(callback_mutex);
            fire(on_peer_left, room_id, peer_id);
            fire(on_presence_changed, room_id, peers);
        }
        update_sync_state(room);
    }

    void update_sync_state(const std::shared_ptr<Room>& room) {
        bool changed = false;
        bool synced = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            synced = !room->peers.empty();
            for (const auto& [id, peer] : room->peers) {
                synced = synced && peer.info.synced;
            }
            changed = synced != room->synced;
            room->synced = synced;
        }
        if (!changed) return;

        Logger::instance().info("Room {} sync state: {}", room->session->room_id, synced ? "synced" : "syncing");
        {
            std::lock_guard<std::recursive_mutex> lock(callback_mutex);
            fire(on_sync_state_changed, room->session->room_id, synced);
        }
    }

    // Peer channel

    // Direct channel when open, otherwise the signaling relay
    bool send_frame(const std::shared_ptr<Room>& room, const std::string& peer_id, FrameType type,
                    const Bytes& payload) {
        auto frame = make_frame(type, payload);
        std::shared_ptr<FramedConnection> direct;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = room->peers.find(peer_id);
            if (it == room->peers.end()) return false;
            if (it->second.direct && it->second.direct->is_open()) {
                direct = it->second.direct;
            } else if (!config.enable_relay) {
                return false;
            }
            room->stats.messages_out++;
            room->stats.bytes_out += frame.size();
        }

        if (direct) {
            direct->send(std::move(frame));
        } else {
            publish(room, nlohmann::json{
                {"type", MSG_RELAY},
                {"from", local_peer_id},
                {"to", peer_id},
                {"frame", base64_encode(frame)},
            });
        }
        return true;
    }

    void request_sync(const std::shared_ptr<Room>& room, const std::string& peer_id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = room->peers.find(peer_id);
            if (it == room->peers.end() || it->second.sync_requested) return;
            bool has_channel = (it->second.direct && it->second.direct->is_open()) || config.enable_relay;
            if (!has_channel) return;
            it->second.sync_requested = true;
        }
        send_frame(room, peer_id, FrameType::SyncRequest, {});
    }

    // Encrypted payload for the room, or nullopt when it must not be sent
    std::optional<Bytes> seal(const std::string& room_id, const Bytes& delta) {
        auto sealed = encryption.encrypt_room_message(room_id, delta);
        if (sealed) {
            return std::move(sealed).value();
        }
        if (encryption.allow_plaintext_fallback()) {
            Logger::instance().warning("Encryption failed for room {} ({}), sending plaintext as configured",
                                       room_id, sealed.error().message);
            return delta;
        }
        Logger::instance().error("Encryption failed for room {}: {}; update not sent", room_id,
                                 sealed.error().message);
        return std::nullopt;
    }

    void send_sync_reply(const std::shared_ptr<Room>& room, const std::string& peer_id) {
        const std::string& room_id = room->session->room_id;
        auto deltas = room->session->document->encode_state_as_updates(SYNC_BATCH_BYTES);
        if (deltas.empty()) {
            deltas.push_back(encode_delta({}));
        }

        for (const auto& delta : deltas) {
            auto payload = seal(room_id, delta);
            if (!payload) return;
            if (!send_frame(room, peer_id, FrameType::SyncReply, *payload)) return;
        }
        Logger::instance().debug("Sent {} sync batches to peer {}", deltas.size(), short_id(peer_id));
    }

    void handle_frame(const std::shared_ptr<Room>& room, const std::string& from, const Bytes& frame) {
        const std::string& room_id = room->session->room_id;
        if (frame.empty()) return;

        auto type = static_cast<FrameType>(frame[0]);
        {
            std::lock_guard<std::mutex> lock(mutex);
            room->stats.messages_in++;
            room->stats.bytes_in += frame.size();
            auto it = room->peers.find(from);
            if (it != room->peers.end()) {
                it->second.info.last_seen = now_ms();
            }
        }

        switch (type) {
            case FrameType::SyncRequest:
                if (!limiter.allow_message(from)) {
                    std::lock_guard<std::mutex> lock(mutex);
                    room->stats.dropped++;
                    return;
                }
                send_sync_reply(room, from);
                return;

            case FrameType::SyncReply:
            case FrameType::Update: {
                Bytes payload(frame.begin() + 1, frame.end());
                auto plain = encryption.decrypt_room_message(room_id, payload);
                if (!plain) {
                    Logger::instance().warning("Dropping update from peer {} in room {}: {}", short_id(from),
                                               room_id, plain.error().message);
                    std::lock_guard<std::mutex> lock(mutex);
                    room->stats.dropped++;
                    return;
                }

                auto applied = room->session->document->apply_update(*plain, ChangeOrigin::Remote);
                if (!applied) {
                    std::lock_guard<std::mutex> lock(mutex);
                    room->stats.dropped++;
                    return;
                }

                if (type == FrameType::SyncReply) {
                    bool first = false;
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        auto it = room->peers.find(from);
                        if (it != room->peers.end() && !it->second.info.synced) {
                            it->second.info.synced = true;
                            first = true;
                        }
                    }
                    if (first) {
                        update_sync_state(room);
                    }
                }
                return;
            }

            case FrameType::Hello:
                // Only meaningful as the first frame of a direct channel
                return;
        }

        Logger::instance().debug("Unknown frame type {} from peer {}", static_cast<int>(frame[0]), short_id(from));
    }

    void broadcast_update(const std::string& room_id, const Bytes& delta) {
        auto room = find_room(room_id);
        if (!room) return;

        auto payload = seal(room_id, delta);
        if (!payload) return;
        auto frame = make_frame(FrameType::Update, *payload);

        std::vector<std::shared_ptr<FramedConnection>> direct;
        std::vector<std::string> relayed;
        size_t total = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            total = room->peers.size();
            for (const auto& [id, peer] : room->peers) {
                if (peer.direct && peer.direct->is_open()) {
                    direct.push_back(peer.direct);
                } else if (config.enable_relay) {
                    relayed.push_back(id);
                }
            }
            room->stats.messages_out += direct.size() + relayed.size();
            room->stats.bytes_out += frame.size() * (direct.size() + relayed.size());
        }

        for (auto& connection : direct) {
            connection->send(frame);
        }
        if (relayed.empty()) return;

        std::string encoded = base64_encode(frame);
        if (relayed.size() == total) {
            // Nobody has a direct channel: one relay publish reaches everyone
            publish(room, nlohmann::json{{"type", MSG_RELAY}, {"from", local_peer_id}, {"to", ""}, {"frame", encoded}});
            return;
        }
        for (const auto& peer_id : relayed) {
            publish(room, nlohmann::json{{"type", MSG_RELAY}, {"from", local_peer_id}, {"to", peer_id}, {"frame", encoded}});
        }
    }

    // Direct channels

    void attach_direct(const std::shared_ptr<Room>& room, const std::string& peer_id,
                       const std::shared_ptr<FramedConnection>& connection) {
        std::shared_ptr<FramedConnection> replaced;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = room->peers.find(peer_id);
            if (it == room->peers.end()) {
                connection->close();
                return;
            }
            replaced = std::move(it->second.direct);
            it->second.direct = connection;
            it->second.info.direct = true;
        }
        if (replaced && replaced != connection) {
            replaced->close();
        }
        Logger::instance().info("Direct channel to peer {} via {}", short_id(peer_id), connection->remote_address());
    }

    void start_direct_channel(const std::shared_ptr<Room>& room, const std::string& peer_id,
                              const std::shared_ptr<FramedConnection>& connection) {
        std::weak_ptr<Impl> weak = shared_from_this();
        std::weak_ptr<Room> weak_room = room;
        std::weak_ptr<FramedConnection> weak_connection = connection;

        connection->start(
            [weak, weak_room, peer_id](Bytes frame) {
                auto impl = weak.lock();
                auto r = weak_room.lock();
                if (impl && r) impl->handle_frame(r, peer_id, frame);
            },
            [weak, weak_room, peer_id, weak_connection]() {
                auto impl = weak.lock();
                auto r = weak_room.lock();
                if (impl && r) impl->detach_direct(r, peer_id, weak_connection.lock());
            });
    }

    void detach_direct(const std::shared_ptr<Room>& room, const std::string& peer_id,
                       const std::shared_ptr<FramedConnection>& connection) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = room->peers.find(peer_id);
        if (it == room->peers.end() || it->second.direct != connection) return;
        it->second.direct.reset();
        it->second.info.direct = false;
        Logger::instance().info("Direct channel to peer {} closed, using relay", short_id(peer_id));
    }

    static elio::coro::task<void> dial_peer(std::shared_ptr<Impl> self, std::shared_ptr<Room> room,
                                            std::string peer_id, std::vector<IceCandidate> candidates) {
        std::shared_ptr<FramedConnection> connection;
        for (const auto& candidate : candidates) {
            if (candidate.type == CandidateType::Relay || candidate.port == 0) continue;

            auto stream = co_await connect_with_timeout(self->scheduler, candidate.address, candidate.port,
                                                        std::chrono::milliseconds(self->config.connect_timeout_ms));
            if (stream) {
                connection = FramedConnection::create(std::move(*stream), self->scheduler);
                break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(self->mutex);
            auto it = room->peers.find(peer_id);
            if (it != room->peers.end()) {
                it->second.dialing = false;
            }
        }

        if (connection) {
            self->start_direct_channel(room, peer_id, connection);
            connection->send(make_frame(FrameType::Hello, json_bytes({
                {"room", room->session->room_id},
                {"from", self->local_peer_id},
                {"to", peer_id},
            })));
            self->attach_direct(room, peer_id, connection);
        } else {
            Logger::instance().info("No direct path to peer {}, falling back to relay", short_id(peer_id));
        }
        self->request_sync(room, peer_id);
    }

    void accept_direct(elio::net::tcp_stream stream) {
        auto connection = FramedConnection::create(std::move(stream), scheduler);
        std::weak_ptr<Impl> weak = shared_from_this();
        std::weak_ptr<FramedConnection> weak_connection = connection;

        // The first frame must be a Hello naming the room and both peers
        connection->start(
            [weak, weak_connection](Bytes frame) {
                auto impl = weak.lock();
                auto conn = weak_connection.lock();
                if (!impl || !conn) return;
                impl->handle_hello(conn, frame);
            },
            []() {});
    }

    void handle_hello(const std::shared_ptr<FramedConnection>& connection, const Bytes& frame) {
        if (frame.empty() || static_cast<FrameType>(frame[0]) != FrameType::Hello) {
            Logger::instance().warning("Direct channel from {} did not start with Hello", connection->remote_address());
            connection->close();
            return;
        }

        auto hello = nlohmann::json::parse(frame.begin() + 1, frame.end(), nullptr, false);
        if (hello.is_discarded() || !hello.is_object()) {
            connection->close();
            return;
        }

        std::string room_id = hello.value("room", "");
        std::string from = hello.value("from", "");
        std::string to = hello.value("to", "");
        auto room = find_room(room_id);

        bool known = false;
        if (room && to == local_peer_id && !limiter.is_banned(from)) {
            std::lock_guard<std::mutex> lock(mutex);
            known = room->peers.count(from) > 0;
        }
        if (!known) {
            Logger::instance().info("Rejecting direct channel from {} for room {}", connection->remote_address(), room_id);
            connection->close();
            return;
        }

        // Rebind the channel from the handshake handler to the room handler
        start_direct_channel(room, from, connection);
        attach_direct(room, from, connection);
        request_sync(room, from);
    }

    bool start_listener() {
        if (listen_port.load() != 0) return true;

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;

        elio::net::ipv4_address addr(config.bind_address, config.listen_port);
        auto bound = elio::net::tcp_listener::bind(addr, opts);
        if (!bound) {
            Logger::instance().error("Failed to bind direct-channel listener on port " +
                                     std::to_string(config.listen_port) + ": " + strerror(errno));
            return false;
        }

        listener = std::move(*bound);
        listen_port = listener->local_address().port();
        spawn_detached(scheduler, accept_loop(shared_from_this()));
        Logger::instance().info("Direct-channel listener on port {}", listen_port.load());
        return true;
    }

    static elio::coro::task<void> accept_loop(std::shared_ptr<Impl> self) {
        while (self->running.load()) {
            auto stream_result = co_await self->listener->accept();
            if (!stream_result) {
                if (self->running.load()) {
                    Logger::instance().error("Accept error: " + std::string(strerror(errno)));
                }
                continue;
            }
            self->accept_direct(std::move(*stream_result));
        }
    }

    // Host candidates right away, reflexive ones once STUN answers
    void gather_candidates() {
        std::vector<IceServer> stun_servers;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (candidates_gathered) return;
            candidates_gathered = true;

            uint16_t port = listen_port.load();
            for (auto candidate : gather_host_candidates()) {
                candidate.protocol = "tcp";
                candidate.port = port;
                local_candidates.push_back(candidate);
            }
            for (const auto& server : config.ice_servers) {
                if (!server.is_turn()) stun_servers.push_back(server);
            }
        }

        if (!stun_servers.empty()) {
            spawn_detached(scheduler, gather_reflexive(shared_from_this(), std::move(stun_servers)));
        }
    }

    static elio::coro::task<void> gather_reflexive(std::shared_ptr<Impl> self, std::vector<IceServer> servers) {
        auto report = co_await probe_ice_servers(std::move(servers), REFLEXIVE_PROBE_TIMEOUT);

        std::vector<std::shared_ptr<Room>> rooms;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            uint16_t port = self->listen_port.load();
            for (const auto& candidate : report.candidates) {
                if (candidate.type != CandidateType::ServerReflexive) continue;
                IceCandidate reflexive = candidate;
                reflexive.protocol = "tcp";
                reflexive.port = port;
                self->local_candidates.push_back(reflexive);
            }
            for (const auto& [id, room] : self->rooms) {
                rooms.push_back(room);
            }
        }
        for (const auto& room : rooms) {
            self->announce(room);
        }
    }

    // Presence refresh and timeout pruning
    static elio::coro::task<void> heartbeat_loop(std::weak_ptr<Impl> weak) {
        auto last_announce = std::chrono::steady_clock::now();
        while (true) {
            co_await elio::time::sleep_for(HEARTBEAT_TICK);
            auto self = weak.lock();
            if (!self || !self->running.load()) co_return;

            auto now = std::chrono::steady_clock::now();
            bool refresh = now - last_announce >= std::chrono::seconds(self->config.presence_interval_sec);
            if (refresh) last_announce = now;

            std::vector<std::shared_ptr<Room>> rooms;
            std::vector<std::pair<std::shared_ptr<Room>, std::string>> expired;
            uint64_t cutoff = now_ms() - static_cast<uint64_t>(self->config.peer_timeout_sec) * 1000;
            {
                std::lock_guard<std::mutex> lock(self->mutex);
                for (const auto& [id, room] : self->rooms) {
                    rooms.push_back(room);
                    for (const auto& [peer_id, peer] : room->peers) {
                        if (peer.info.last_seen < cutoff) {
                            expired.emplace_back(room, peer_id);
                        }
                    }
                }
            }

            for (const auto& [room, peer_id] : expired) {
                self->remove_peer(room, peer_id, "timed out of");
            }
            if (refresh) {
                for (const auto& room : rooms) {
                    self->announce(room);
                }
            }
        }
    }

    void close_room(const std::shared_ptr<Room>& room) {
        publish(room, nlohmann::json{{"type", MSG_LEAVE}, {"from", local_peer_id}});

        std::vector<std::shared_ptr<SignalingTransport>> transports;
        std::vector<std::shared_ptr<FramedConnection>> channels;
        bool was_synced = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            transports = std::move(room->transports);
            for (auto& [id, peer] : room->peers) {
                if (peer.direct) channels.push_back(std::move(peer.direct));
            }
            room->peers.clear();
            was_synced = room->synced;
            room->synced = false;
        }

        room->session->document->remove_update_listener(room->update_subscription);
        for (auto& transport : transports) {
            transport->unsubscribe(room->session->room_id);
            transport->close();
        }
        for (auto& channel : channels) {
            channel->close();
        }

        Logger::instance().info("Disconnected from room {}", room->session->room_id);
        if (was_synced) {
            std::lock_guard<std::recursive_mutex> lock(callback_mutex);
            fire(on_sync_state_changed, room->session->room_id, false);
        }
    }
};

ConnectionManager::ConnectionManager(const P2PConfig& config, RoomEncryption& encryption,
                                     std::shared_ptr<elio::runtime::scheduler> scheduler,
                                     SignalingTransportFactory factory)
    : impl_(std::make_shared<Impl>(config, encryption, scheduler,
                                   factory ? std::move(factory)
                                           : TcpSignalingClient::factory(scheduler, config.connect_timeout_ms))) {}

ConnectionManager::~ConnectionManager() {
    disconnect_all();
    impl_->running = false;
    if (impl_->listener) {
        impl_->listener->close();
    }
}

const std::string& ConnectionManager::local_peer_id() const {
    return impl_->local_peer_id;
}

elio::coro::task<Result<ConnectionHandle>> ConnectionManager::connect(std::string room_id,
                                                                     std::shared_ptr<ReplicatedDocument> document) {
    using ConnectResult = Result<ConnectionHandle>;
    auto impl = impl_;
    if (room_id.empty()) {
        co_return ConnectResult(Error(ErrorCode::InvalidArgument, "Room id must not be empty"));
    }
    if (!document) {
        co_return ConnectResult(Error(ErrorCode::InvalidArgument, "No document to replicate for room " + room_id));
    }
    if (auto existing = impl->find_room(room_id)) {
        co_return ConnectResult(ConnectionHandle(existing->session));
    }

    auto room = std::make_shared<Impl::Room>();
    room->session = std::make_shared<RoomSession>();
    room->session->room_id = room_id;
    room->session->local_peer_id = impl->local_peer_id;
    room->session->document = document;
    room->session->connected_at = now_ms();

    std::weak_ptr<Impl> weak = impl;
    std::string tried;
    for (const auto& endpoint : impl->config.signaling_servers) {
        std::shared_ptr<SignalingTransport> transport = impl->factory(endpoint);
        if (!transport) continue;

        transport->set_message_handler([weak, room_id](const std::string& topic, const nlohmann::json& data) {
            if (auto self = weak.lock()) self->handle_signal(room_id, topic, data);
        });

        if (co_await transport->open()) {
            room->transports.push_back(transport);
            room->session->signaling_endpoints.push_back(endpoint);
        } else {
            transport->close();
        }
        tried += (tried.empty() ? "" : ", ") + endpoint;
    }

    if (room->transports.empty()) {
        co_return ConnectResult(Error(ErrorCode::ConnectFailed, "Unable to reach any signaling server for room " +
                                                                    room_id + " (tried: " + tried + ")"));
    }

    {
        std::lock_guard<std::mutex> lock(impl->mutex);
        auto it = impl->rooms.find(room_id);
        if (it != impl->rooms.end()) {
            // Lost a race with a concurrent connect to the same room
            auto existing = it->second->session;
            for (auto& transport : room->transports) transport->close();
            co_return ConnectResult(ConnectionHandle(existing));
        }
        impl->rooms[room_id] = room;
    }

    if (impl->config.enable_direct) {
        impl->start_listener();
    }
    impl->gather_candidates();

    room->update_subscription = document->on_update([weak, room_id](const Bytes& delta) {
        if (auto self = weak.lock()) self->broadcast_update(room_id, delta);
    });

    for (auto& transport : room->transports) {
        transport->subscribe(room_id);
    }
    impl->announce(room);

    bool start_heartbeat = false;
    {
        std::lock_guard<std::mutex> lock(impl->mutex);
        start_heartbeat = !impl->heartbeat_started;
        impl->heartbeat_started = true;
    }
    if (start_heartbeat) {
        spawn_detached(impl->scheduler, Impl::heartbeat_loop(impl));
    }

    Logger::instance().info("Connected to room {} as peer {} via {} signaling server(s)", room_id,
                            short_id(impl->local_peer_id), room->transports.size());
    co_return ConnectResult(ConnectionHandle(room->session));
}

void ConnectionManager::disconnect(const std::string& room_id) {
    std::shared_ptr<Impl::Room> room;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->rooms.find(room_id);
        if (it == impl_->rooms.end()) return;
        room = it->second;
        impl_->rooms.erase(it);
    }
    impl_->close_room(room);
}

void ConnectionManager::disconnect_all() {
    std::vector<std::shared_ptr<Impl::Room>> rooms;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [id, room] : impl_->rooms) {
            rooms.push_back(room);
        }
        impl_->rooms.clear();
    }
    for (auto& room : rooms) {
        impl_->close_room(room);
    }
}

bool ConnectionManager::is_connected(const std::string& room_id) const {
    return impl_->find_room(room_id) != nullptr;
}

void ConnectionManager::set_local_presence(const std::string& name, const std::string& color) {
    std::vector<std::shared_ptr<Impl::Room>> rooms;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->presence_name = name.empty() ? "Anonymous" : name;
        impl_->presence_color = color.empty() ? "#888" : color;
        impl_->presence_clock++;
        for (auto& [id, room] : impl_->rooms) {
            rooms.push_back(room);
        }
    }
    for (auto& room : rooms) {
        impl_->announce(room);
    }
}

std::vector<Peer> ConnectionManager::get_connected_peers(const std::string& room_id) const {
    auto room = impl_->find_room(room_id);
    if (!room) return {};
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return Impl::peer_list_locked(*room);
}

size_t ConnectionManager::get_peer_count(const std::string& room_id) const {
    auto room = impl_->find_room(room_id);
    if (!room) return 0;
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return room->peers.size();
}

bool ConnectionManager::is_synced(const std::string& room_id) const {
    auto room = impl_->find_room(room_id);
    if (!room) return false;
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return room->synced;
}

ConnectionStats ConnectionManager::get_stats(const std::string& room_id) const {
    auto room = impl_->find_room(room_id);
    if (!room) return {};
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ConnectionStats stats = room->stats;
    stats.peers = room->peers.size();
    stats.direct = 0;
    stats.relayed = 0;
    for (const auto& [id, peer] : room->peers) {
        if (peer.direct && peer.direct->is_open()) {
            stats.direct++;
        } else {
            stats.relayed++;
        }
    }
    return stats;
}

uint16_t ConnectionManager::direct_port() const {
    return impl_->listen_port.load();
}

elio::coro::task<ConnectivityReport> ConnectionManager::test_connectivity() {
    auto impl = impl_;
    auto timeout = std::chrono::milliseconds(static_cast<int64_t>(impl->config.probe_timeout_sec) * 1000);
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;

    auto check = std::make_shared<RelayCheck>();
    check->pending = impl->config.signaling_servers.size();
    for (const auto& endpoint : impl->config.signaling_servers) {
        spawn_detached(impl->scheduler, check_signaling(impl->factory, endpoint, check));
    }

    auto report = co_await probe_ice_servers(impl->config.ice_servers, timeout);

    while (check->pending.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        co_await elio::time::sleep_for(std::chrono::milliseconds(20));
    }
    if (check->pending.load() > 0) {
        report.timed_out = true;
    }

    {
        std::lock_guard<std::mutex> lock(check->mutex);
        for (const auto& candidate : check->reachable) {
            report.candidates.push_back(candidate);
            report.relay_reachable = true;
        }
    }

    auto hosts = gather_host_candidates();
    report.candidates.insert(report.candidates.begin(), hosts.begin(), hosts.end());
    report.elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());

    Logger::instance().info("Connectivity probe: direct={} relay={} candidates={}{}", report.direct_reachable,
                            report.relay_reachable, report.candidates.size(),
                            report.timed_out ? " (timed out)" : "");
    co_return report;
}

void ConnectionManager::set_on_peer_joined(PeerJoinedCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(impl_->callback_mutex);
    impl_->on_peer_joined = std::move(callback);
}

void ConnectionManager::set_on_peer_left(PeerLeftCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(impl_->callback_mutex);
    impl_->on_peer_left = std::move(callback);
}

void ConnectionManager::set_on_sync_state_changed(SyncStateCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(impl_->callback_mutex);
    impl_->on_sync_state_changed = std::move(callback);
}

void ConnectionManager::set_on_presence_changed(PresenceCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(impl_->callback_mutex);
    impl_->on_presence_changed = std::move(callback);
}

} // namespace roomsync
