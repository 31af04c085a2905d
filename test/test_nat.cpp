#include <catch2/catch_test_macros.hpp>
#include <elio/elio.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "roomsync/p2p/nat_traversal.h"

using namespace roomsync;

TEST_CASE("Parse ICE Server URLs", "[nat][url]") {
    auto stun = parse_ice_url("stun:stun.l.google.com:19302");
    REQUIRE(stun.has_value());
    REQUIRE_FALSE(stun->turn);
    REQUIRE(stun->host == "stun.l.google.com");
    REQUIRE(stun->port == 19302);

    auto turn = parse_ice_url("turn:openrelay.metered.ca:80?transport=tcp");
    REQUIRE(turn.has_value());
    REQUIRE(turn->turn);
    REQUIRE(turn->port == 80);

    auto defaulted = parse_ice_url("stun:example.org");
    REQUIRE(defaulted.has_value());
    REQUIRE(defaulted->port == 3478);

    REQUIRE_FALSE(parse_ice_url("http://example.org").has_value());
    REQUIRE_FALSE(parse_ice_url("stun:").has_value());
    REQUIRE_FALSE(parse_ice_url("stun:host:99999").has_value());
}

TEST_CASE("Candidate JSON", "[nat][candidate]") {
    IceCandidate candidate;
    candidate.type = CandidateType::ServerReflexive;
    candidate.address = "203.0.113.7";
    candidate.port = 50000;
    candidate.server = "stun:stun.example.org:3478";

    nlohmann::json j = candidate;
    REQUIRE(j["type"] == "srflx");

    auto parsed = j.get<IceCandidate>();
    REQUIRE(parsed.type == CandidateType::ServerReflexive);
    REQUIRE(parsed.address == "203.0.113.7");
    REQUIRE(parsed.port == 50000);
    REQUIRE(parsed.protocol == "udp");

    REQUIRE(to_string(CandidateType::Host) == "host");
    REQUIRE(to_string(CandidateType::Relay) == "relay");
}

TEST_CASE("STUN Binding Request Encoding", "[nat][stun]") {
    stun::Message request;
    request.type = stun::BINDING_REQUEST;
    request.transaction = stun::new_transaction_id();

    auto wire = stun::encode(request);
    REQUIRE(wire.size() == stun::HEADER_SIZE);
    REQUIRE(wire[0] == 0x00);
    REQUIRE(wire[1] == 0x01);
    REQUIRE(wire[4] == 0x21);
    REQUIRE(wire[7] == 0x42);

    auto decoded = stun::decode(wire.data(), wire.size());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->type == stun::BINDING_REQUEST);
    REQUIRE(decoded->transaction == request.transaction);
}

TEST_CASE("STUN Attributes And Integrity", "[nat][stun]") {
    stun::Message request;
    request.type = stun::ALLOCATE_REQUEST;
    request.transaction = stun::new_transaction_id();
    request.add(stun::ATTR_REQUESTED_TRANSPORT, Bytes{17, 0, 0, 0});
    request.add(stun::ATTR_USERNAME, std::string("user"));  // padded to 8 on the wire

    auto key = stun::long_term_key("user", "realm", "pass");
    REQUIRE(key.size() == 16);

    auto wire = stun::encode(request, key);
    // header + transport(8) + username(8) + integrity(24)
    REQUIRE(wire.size() == stun::HEADER_SIZE + 8 + 8 + 24);

    auto decoded = stun::decode(wire.data(), wire.size());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->find(stun::ATTR_USERNAME) != nullptr);
    REQUIRE(*decoded->find(stun::ATTR_USERNAME) == Bytes{'u', 's', 'e', 'r'});
    REQUIRE(decoded->find(stun::ATTR_MESSAGE_INTEGRITY)->size() == 20);
    REQUIRE(decoded->find(stun::ATTR_NONCE) == nullptr);
}

TEST_CASE("STUN Address And Error Decoding", "[nat][stun]") {
    stun::TransactionId transaction{};

    // 192.0.2.1:32853 XOR-encoded with the magic cookie
    uint16_t port = 32853 ^ 0x2112;
    uint32_t addr = (192u << 24 | 0u << 16 | 2u << 8 | 1u) ^ stun::MAGIC_COOKIE;
    Bytes value = {0x00, 0x01,
                   static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port & 0xFF),
                   static_cast<uint8_t>(addr >> 24), static_cast<uint8_t>(addr >> 16),
                   static_cast<uint8_t>(addr >> 8), static_cast<uint8_t>(addr)};

    auto mapped = stun::decode_address(value, true, transaction);
    REQUIRE(mapped.has_value());
    REQUIRE(mapped->first == "192.0.2.1");
    REQUIRE(mapped->second == 32853);

    // IPv6 family is not handled
    value[1] = 0x02;
    REQUIRE_FALSE(stun::decode_address(value, true, transaction).has_value());

    stun::Message error;
    error.type = stun::ALLOCATE_ERROR;
    error.add(stun::ATTR_ERROR_CODE, Bytes{0, 0, 4, 1});
    REQUIRE(stun::error_code(error) == 401);

    REQUIRE_FALSE(stun::decode(value.data(), value.size()).has_value());
}

TEST_CASE("Probe With No Servers Finishes Immediately", "[nat][probe]") {
    ConnectivityReport report;
    elio::run([&]() -> elio::coro::task<void> {
        report = co_await probe_ice_servers({}, std::chrono::milliseconds(500));
    }());
    REQUIRE_FALSE(report.timed_out);
    REQUIRE(report.candidates.empty());
    REQUIRE(report.elapsed_ms < 500);
}

TEST_CASE("Probe Honours Its Deadline", "[nat][probe]") {
    // TEST-NET-1 address never answers
    std::vector<IceServer> servers = {{"stun:192.0.2.1:3478", "", ""}};
    ConnectivityReport report;
    auto start = std::chrono::steady_clock::now();
    elio::run([&]() -> elio::coro::task<void> {
        report = co_await probe_ice_servers(servers, std::chrono::milliseconds(600));
    }());
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(report.timed_out);
    REQUIRE_FALSE(report.direct_reachable);
    REQUIRE(elapsed < std::chrono::seconds(3));
}

TEST_CASE("ICE Check Does Not Wait For Slow Name Lookups", "[nat][resolve]") {
    std::vector<IceServer> servers(6, IceServer{"stun:blackholed.example:3478", "", ""});
    auto slow_resolver = [](const std::string&) -> std::optional<std::string> {
        std::this_thread::sleep_for(std::chrono::seconds(3));
        return std::nullopt;
    };

    ConnectivityReport report;
    auto start = std::chrono::steady_clock::now();
    elio::run([&]() -> elio::coro::task<void> {
        report = co_await probe_ice_servers(servers, std::chrono::milliseconds(500), slow_resolver);
    }());
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(report.timed_out);
    REQUIRE(report.candidates.empty());
    REQUIRE(report.elapsed_ms <= 800);
    REQUIRE(elapsed < std::chrono::milliseconds(1500));
}

TEST_CASE("Unresolvable ICE Servers Are Skipped", "[nat][resolve]") {
    std::vector<IceServer> servers = {{"stun:nowhere.invalid:3478", "", ""},
                                      {"turn:nowhere.invalid:3478", "user", "pass"}};
    int lookups = 0;
    std::mutex lookups_mutex;
    auto failing_resolver = [&](const std::string& host) -> std::optional<std::string> {
        std::lock_guard<std::mutex> lock(lookups_mutex);
        if (host == "nowhere.invalid") lookups++;
        return std::nullopt;
    };

    ConnectivityReport report;
    elio::run([&]() -> elio::coro::task<void> {
        report = co_await probe_ice_servers(servers, std::chrono::milliseconds(2000), failing_resolver);
    }());

    REQUIRE(lookups == 2);
    REQUIRE_FALSE(report.timed_out);
    REQUIRE(report.elapsed_ms < 1000);
}
