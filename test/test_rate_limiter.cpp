#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include "roomsync/base/config.h"
#include "roomsync/p2p/rate_limiter.h"

using namespace roomsync;
using namespace std::chrono_literals;

namespace {

P2PConfig limiter_config() {
    P2PConfig config;
    config.max_messages_per_sec = 10;
    config.burst_size = 5;
    config.max_connections_per_min = 3;
    config.ban_duration_sec = 60;
    return config;
}

} // anonymous namespace

TEST_CASE("Message Burst Then Ban", "[ratelimit][message]") {
    PeerRateLimiter limiter(limiter_config());
    auto t0 = PeerRateLimiter::Clock::now();

    // Full bucket holds rate + burst tokens
    for (int i = 0; i < 15; ++i) {
        REQUIRE(limiter.allow_message("peer-a", t0));
    }
    REQUIRE_FALSE(limiter.allow_message("peer-a", t0));
    REQUIRE(limiter.is_banned("peer-a", t0));

    // Other peers are unaffected
    REQUIRE(limiter.allow_message("peer-b", t0));
    REQUIRE_FALSE(limiter.is_banned("peer-b", t0));

    // Still banned inside the ban window, refilled afterwards
    REQUIRE_FALSE(limiter.allow_message("peer-a", t0 + 30s));
    REQUIRE_FALSE(limiter.is_banned("peer-a", t0 + 61s));
    REQUIRE(limiter.allow_message("peer-a", t0 + 61s));
}

TEST_CASE("Tokens Refill Over Time", "[ratelimit][message]") {
    PeerRateLimiter limiter(limiter_config());
    auto t0 = PeerRateLimiter::Clock::now();

    for (int i = 0; i < 15; ++i) {
        REQUIRE(limiter.allow_message("peer-a", t0));
    }
    // Half a second at 10 msg/s refills 5 tokens
    auto later = t0 + 500ms;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(limiter.allow_message("peer-a", later));
    }
    REQUIRE_FALSE(limiter.allow_message("peer-a", later));
}

TEST_CASE("Steady Rate Is Never Banned", "[ratelimit][message]") {
    PeerRateLimiter limiter(limiter_config());
    auto t = PeerRateLimiter::Clock::now();
    for (int i = 0; i < 200; ++i) {
        REQUIRE(limiter.allow_message("peer-a", t));
        t += 100ms;
    }
    REQUIRE_FALSE(limiter.is_banned("peer-a", t));
}

TEST_CASE("Connection Window", "[ratelimit][connection]") {
    PeerRateLimiter limiter(limiter_config());
    auto t0 = PeerRateLimiter::Clock::now();

    REQUIRE(limiter.allow_connection("peer-a", t0));
    REQUIRE(limiter.allow_connection("peer-a", t0 + 10s));
    REQUIRE(limiter.allow_connection("peer-a", t0 + 20s));

    // Old attempts slide out of the one-minute window
    REQUIRE(limiter.allow_connection("peer-a", t0 + 61s));

    REQUIRE_FALSE(limiter.allow_connection("peer-a", t0 + 62s));
    REQUIRE(limiter.is_banned("peer-a", t0 + 62s));
    // A banned peer's messages are refused as well
    REQUIRE_FALSE(limiter.allow_message("peer-a", t0 + 63s));
}

TEST_CASE("Forget And Clear", "[ratelimit]") {
    PeerRateLimiter limiter(limiter_config());
    auto t0 = PeerRateLimiter::Clock::now();

    REQUIRE(limiter.allow_message("peer-a", t0));
    limiter.forget("peer-a");

    for (int i = 0; i < 16; ++i) {
        limiter.allow_message("peer-b", t0);
    }
    REQUIRE(limiter.is_banned("peer-b", t0));

    // Bans survive forget but not clear
    limiter.forget("peer-b");
    REQUIRE(limiter.is_banned("peer-b", t0));
    limiter.clear();
    REQUIRE_FALSE(limiter.is_banned("peer-b", t0));
}
