#include <catch2/catch_test_macros.hpp>
#include <elio/elio.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "roomsync/base/config.h"
#include "roomsync/p2p/signaling.h"
#include "roomsync/p2p/signaling_server.h"

using namespace roomsync;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

// Thread-safe record of delivered publishes
struct Inbox {
    std::mutex mutex;
    std::vector<std::pair<std::string, nlohmann::json>> messages;

    SignalingTransport::MessageHandler handler() {
        return [this](const std::string& topic, const nlohmann::json& data) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.emplace_back(topic, data);
        };
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

    std::pair<std::string, nlohmann::json> at(size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.at(i);
    }
};

} // anonymous namespace

TEST_CASE("Parse Signaling Endpoint", "[signaling][endpoint]") {
    std::string host;
    uint16_t port = 0;

    REQUIRE(parse_endpoint("127.0.0.1:4444", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 4444);

    REQUIRE(parse_endpoint("signal.example.org:80", host, port));
    REQUIRE(host == "signal.example.org");

    REQUIRE_FALSE(parse_endpoint("no-port", host, port));
    REQUIRE_FALSE(parse_endpoint(":4444", host, port));
    REQUIRE_FALSE(parse_endpoint("host:", host, port));
    REQUIRE_FALSE(parse_endpoint("host:0", host, port));
    REQUIRE_FALSE(parse_endpoint("host:70000", host, port));
    REQUIRE_FALSE(parse_endpoint("host:12ab", host, port));
}

TEST_CASE("Signaling Server Relays Publish To Subscribers", "[signaling][server]") {
    auto scheduler = std::make_shared<elio::runtime::scheduler>(2);
    scheduler->start();

    SignalingServerConfig config;
    config.bind_address = "127.0.0.1";
    config.listen_port = 0;
    SignalingServer server(config, scheduler);
    REQUIRE(server.start());
    REQUIRE(server.is_running());
    REQUIRE(server.port() != 0);

    std::string endpoint = "127.0.0.1:" + std::to_string(server.port());
    TcpSignalingClient alice(endpoint, scheduler);
    TcpSignalingClient bob(endpoint, scheduler);
    TcpSignalingClient carol(endpoint, scheduler);
    Inbox alice_inbox, bob_inbox, carol_inbox;
    alice.set_message_handler(alice_inbox.handler());
    bob.set_message_handler(bob_inbox.handler());
    carol.set_message_handler(carol_inbox.handler());

    bool opened = false;
    elio::run([&]() -> elio::coro::task<void> {
        opened = co_await alice.open();
        opened = opened && co_await bob.open();
        opened = opened && co_await carol.open();
    }());
    REQUIRE(opened);
    REQUIRE(alice.is_open());
    REQUIRE(wait_until([&] { return server.client_count() == 3; }));

    alice.subscribe("room-x");
    bob.subscribe("room-x");
    carol.subscribe("room-y");
    REQUIRE(wait_until([&] { return server.topic_count() == 2; }));
    // Subscriptions from different connections race; give them a moment
    std::this_thread::sleep_for(200ms);

    alice.publish("room-x", {{"type", "announce"}, {"from", "alice"}});

    REQUIRE(wait_until([&] { return bob_inbox.size() == 1 && alice_inbox.size() == 1; }));
    auto [topic, data] = bob_inbox.at(0);
    REQUIRE(topic == "room-x");
    REQUIRE(data["from"] == "alice");
    REQUIRE(carol_inbox.size() == 0);

    bob.unsubscribe("room-x");
    std::this_thread::sleep_for(200ms);
    alice.publish("room-x", {{"type", "announce"}, {"from", "alice"}, {"n", 2}});
    REQUIRE(wait_until([&] { return alice_inbox.size() == 2; }));
    std::this_thread::sleep_for(100ms);
    REQUIRE(bob_inbox.size() == 1);

    alice.close();
    bob.close();
    carol.close();
    REQUIRE_FALSE(alice.is_open());
    REQUIRE(wait_until([&] { return server.client_count() == 0; }));

    server.stop();
    REQUIRE_FALSE(server.is_running());
    scheduler->shutdown();
}

TEST_CASE("Signaling Client Fails Against Closed Port", "[signaling][client]") {
    auto scheduler = std::make_shared<elio::runtime::scheduler>(1);
    scheduler->start();

    // Bind then stop to find a port with nothing listening
    SignalingServerConfig config;
    config.listen_port = 0;
    uint16_t port = 0;
    {
        SignalingServer server(config, scheduler);
        REQUIRE(server.start());
        port = server.port();
        server.stop();
    }

    TcpSignalingClient client("127.0.0.1:" + std::to_string(port), scheduler, 1000);
    bool opened = true;
    elio::run([&]() -> elio::coro::task<void> {
        opened = co_await client.open();
    }());
    REQUIRE_FALSE(opened);
    client.close();
    scheduler->shutdown();
}
