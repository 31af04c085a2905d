#ifndef ROOMSYNC_P2P_RATE_LIMITER_H
#define ROOMSYNC_P2P_RATE_LIMITER_H

#include "roomsync/base/config.h"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace roomsync {

// Per-peer token bucket for messages plus a sliding window for new
// connections. A peer exceeding either is banned for ban_duration_sec.
class PeerRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit PeerRateLimiter(const P2PConfig& config);

    bool allow_message(const std::string& peer_id) { return allow_message(peer_id, Clock::now()); }
    bool allow_message(const std::string& peer_id, Clock::time_point now);

    bool allow_connection(const std::string& peer_id) { return allow_connection(peer_id, Clock::now()); }
    bool allow_connection(const std::string& peer_id, Clock::time_point now);

    bool is_banned(const std::string& peer_id) const { return is_banned(peer_id, Clock::now()); }
    bool is_banned(const std::string& peer_id, Clock::time_point now) const;

    void forget(const std::string& peer_id);
    void clear();

private:
    struct PeerState {
        double tokens = 0;
        Clock::time_point last_refill{};
        bool initialized = false;
        std::deque<Clock::time_point> connections;
        Clock::time_point banned_until{};
    };

    bool banned_locked(const PeerState& state, Clock::time_point now) const;
    void ban_locked(const std::string& peer_id, PeerState& state, Clock::time_point now);

    double rate_;
    double capacity_;
    uint32_t max_connections_per_min_;
    std::chrono::seconds ban_duration_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerState> peers_;
};

} // namespace roomsync

#endif // ROOMSYNC_P2P_RATE_LIMITER_H
