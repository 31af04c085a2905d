#ifndef ROOMSYNC_P2P_NAT_TRAVERSAL_H
#define ROOMSYNC_P2P_NAT_TRAVERSAL_H

#include "roomsync/base/config.h"
#include "roomsync/base/encoding.h"
#include <elio/elio.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

enum class CandidateType {
    Host,
    ServerReflexive,
    Relay
};

std::string to_string(CandidateType type);

struct IceCandidate {
    CandidateType type = CandidateType::Host;
    std::string protocol = "udp";
    std::string address;
    uint16_t port = 0;
    std::string server;  // STUN/TURN/signaling server that produced it
};

void to_json(nlohmann::json& j, const IceCandidate& c);
void from_json(const nlohmann::json& j, IceCandidate& c);

struct ConnectivityReport {
    bool direct_reachable = false;
    bool relay_reachable = false;
    std::vector<IceCandidate> candidates;
    uint64_t elapsed_ms = 0;
    bool timed_out = false;
};

// STUN/TURN wire helpers (RFC 5389 / RFC 5766)
namespace stun {

constexpr uint32_t MAGIC_COOKIE = 0x2112A442;
constexpr size_t HEADER_SIZE = 20;

constexpr uint16_t BINDING_REQUEST = 0x0001;
constexpr uint16_t BINDING_SUCCESS = 0x0101;
constexpr uint16_t ALLOCATE_REQUEST = 0x0003;
constexpr uint16_t ALLOCATE_SUCCESS = 0x0103;
constexpr uint16_t ALLOCATE_ERROR = 0x0113;

constexpr uint16_t ATTR_MAPPED_ADDRESS = 0x0001;
constexpr uint16_t ATTR_USERNAME = 0x0006;
constexpr uint16_t ATTR_MESSAGE_INTEGRITY = 0x0008;
constexpr uint16_t ATTR_ERROR_CODE = 0x0009;
constexpr uint16_t ATTR_REALM = 0x0014;
constexpr uint16_t ATTR_NONCE = 0x0015;
constexpr uint16_t ATTR_XOR_RELAYED_ADDRESS = 0x0016;
constexpr uint16_t ATTR_REQUESTED_TRANSPORT = 0x0019;
constexpr uint16_t ATTR_XOR_MAPPED_ADDRESS = 0x0020;

using TransactionId = std::array<uint8_t, 12>;

struct Message {
    uint16_t type = 0;
    TransactionId transaction{};
    std::vector<std::pair<uint16_t, Bytes>> attributes;

    const Bytes* find(uint16_t attr) const;
    void add(uint16_t attr, Bytes value);
    void add(uint16_t attr, const std::string& value);
};

TransactionId new_transaction_id();

// Serializes; when integrity_key is set a MESSAGE-INTEGRITY attribute is appended
Bytes encode(const Message& message, const std::optional<Bytes>& integrity_key = std::nullopt);
std::optional<Message> decode(const uint8_t* data, size_t size);

// MAPPED-ADDRESS or XOR-MAPPED-ADDRESS style attribute value to ip/port
std::optional<std::pair<std::string, uint16_t>> decode_address(const Bytes& value, bool xored,
                                                                const TransactionId& transaction);

// Error class*100 + number from ERROR-CODE
std::optional<int> error_code(const Message& message);

// Long-term credential key: MD5(username ":" realm ":" password), empty on failure
Bytes long_term_key(const std::string& username, const std::string& realm, const std::string& password);

} // namespace stun

// Parsed stun:/turn: URL
struct IceServerAddress {
    bool turn = false;
    std::string host;
    uint16_t port = 3478;
};

std::optional<IceServerAddress> parse_ice_url(const std::string& url);

// Non-loopback IPv4 interface addresses
std::vector<IceCandidate> gather_host_candidates();

// Host name to dotted IPv4 address; may block
using HostResolver = std::function<std::optional<std::string>(const std::string& host)>;

// getaddrinfo, IPv4 only
std::optional<std::string> resolve_ipv4(const std::string& host);

// Sends STUN bindings and TURN allocations to every server and collects
// what answers before the deadline. Never runs past timeout: host lookups
// run off the worker and a server still unresolved at the deadline is skipped.
elio::coro::task<ConnectivityReport> probe_ice_servers(std::vector<IceServer> servers,
                                                       std::chrono::milliseconds timeout,
                                                       HostResolver resolver = resolve_ipv4);

} // namespace roomsync

#endif // ROOMSYNC_P2P_NAT_TRAVERSAL_H
