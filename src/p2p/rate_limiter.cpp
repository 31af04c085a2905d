#include "roomsync/p2p/rate_limiter.h"
#include "roomsync/base/logger.h"
#include <algorithm>

namespace roomsync {

PeerRateLimiter::PeerRateLimiter(const P2PConfig& config)
    : rate_(static_cast<double>(config.max_messages_per_sec)),
      capacity_(static_cast<double>(config.max_messages_per_sec + config.burst_size)),
      max_connections_per_min_(config.max_connections_per_min),
      ban_duration_(config.ban_duration_sec) {}

bool PeerRateLimiter::banned_locked(const PeerState& state, Clock::time_point now) const {
    return now < state.banned_until;
}

void PeerRateLimiter::ban_locked(const std::string& peer_id, PeerState& state, Clock::time_point now) {
    state.banned_until = now + ban_duration_;
    Logger::instance().warning("Peer {} exceeded rate limit, banned for {}s", peer_id, ban_duration_.count());
}

bool PeerRateLimiter::allow_message(const std::string& peer_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = peers_[peer_id];
    if (banned_locked(state, now)) {
        return false;
    }

    if (!state.initialized) {
        state.tokens = capacity_;
        state.last_refill = now;
        state.initialized = true;
    }

    double elapsed = std::chrono::duration<double>(now - state.last_refill).count();
    if (elapsed > 0) {
        state.tokens = std::min(capacity_, state.tokens + elapsed * rate_);
        state.last_refill = now;
    }

    if (state.tokens < 1.0) {
        ban_locked(peer_id, state, now);
        // Start with a full bucket once the ban expires
        state.initialized = false;
        return false;
    }
    state.tokens -= 1.0;
    return true;
}

bool PeerRateLimiter::allow_connection(const std::string& peer_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = peers_[peer_id];
    if (banned_locked(state, now)) {
        return false;
    }

    auto window_start = now - std::chrono::minutes(1);
    while (!state.connections.empty() && state.connections.front() <= window_start) {
        state.connections.pop_front();
    }

    if (state.connections.size() >= max_connections_per_min_) {
        ban_locked(peer_id, state, now);
        state.connections.clear();
        return false;
    }
    state.connections.push_back(now);
    return true;
}

bool PeerRateLimiter::is_banned(const std::string& peer_id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() && banned_locked(it->second, now);
}

void PeerRateLimiter::forget(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it != peers_.end() && it->second.banned_until == Clock::time_point{}) {
        peers_.erase(it);
    }
}

void PeerRateLimiter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}

} // namespace roomsync
