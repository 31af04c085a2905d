#include "roomsync/p2p/nat_traversal.h"
#include "roomsync/base/blocking.h"
#include "roomsync/base/logger.h"
#include <elio/time/timer.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <memory>
#include <set>
#include <stdexcept>

namespace roomsync {

std::string to_string(CandidateType type) {
    switch (type) {
        case CandidateType::Host: return "host";
        case CandidateType::ServerReflexive: return "srflx";
        case CandidateType::Relay: return "relay";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const IceCandidate& c) {
    j = nlohmann::json{
        {"type", to_string(c.type)},
        {"protocol", c.protocol},
        {"address", c.address},
        {"port", c.port},
    };
    if (!c.server.empty()) {
        j["server"] = c.server;
    }
}

void from_json(const nlohmann::json& j, IceCandidate& c) {
    std::string type = j.value("type", "host");
    if (type == "srflx") {
        c.type = CandidateType::ServerReflexive;
    } else if (type == "relay") {
        c.type = CandidateType::Relay;
    } else {
        c.type = CandidateType::Host;
    }
    c.protocol = j.value("protocol", "udp");
    c.address = j.value("address", "");
    c.port = j.value("port", static_cast<uint16_t>(0));
    c.server = j.value("server", "");
}

namespace stun {

namespace {

void put_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(Bytes& out, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

void put_attribute(Bytes& out, uint16_t type, const Bytes& value) {
    put_u16(out, type);
    put_u16(out, static_cast<uint16_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
    while (out.size() % 4 != 0) {
        out.push_back(0);
    }
}

} // anonymous namespace

const Bytes* Message::find(uint16_t attr) const {
    for (const auto& [type, value] : attributes) {
        if (type == attr) return &value;
    }
    return nullptr;
}

void Message::add(uint16_t attr, Bytes value) {
    attributes.emplace_back(attr, std::move(value));
}

void Message::add(uint16_t attr, const std::string& value) {
    attributes.emplace_back(attr, Bytes(value.begin(), value.end()));
}

TransactionId new_transaction_id() {
    TransactionId id{};
    if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed for STUN transaction id");
    }
    return id;
}

Bytes encode(const Message& message, const std::optional<Bytes>& integrity_key) {
    Bytes body;
    for (const auto& [type, value] : message.attributes) {
        put_attribute(body, type, value);
    }

    // The length field covers MESSAGE-INTEGRITY when present (4 + 20 bytes)
    size_t length = body.size() + (integrity_key ? 24 : 0);

    Bytes out;
    out.reserve(HEADER_SIZE + length);
    put_u16(out, message.type);
    put_u16(out, static_cast<uint16_t>(length));
    put_u32(out, MAGIC_COOKIE);
    out.insert(out.end(), message.transaction.begin(), message.transaction.end());
    out.insert(out.end(), body.begin(), body.end());

    if (integrity_key) {
        unsigned char mac[EVP_MAX_MD_SIZE];
        unsigned int mac_len = 0;
        HMAC(EVP_sha1(), integrity_key->data(), static_cast<int>(integrity_key->size()),
             out.data(), out.size(), mac, &mac_len);
        put_attribute(out, ATTR_MESSAGE_INTEGRITY, Bytes(mac, mac + mac_len));
    }
    return out;
}

std::optional<Message> decode(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE) return std::nullopt;
    if ((data[0] & 0xC0) != 0) return std::nullopt;
    if (get_u32(data + 4) != MAGIC_COOKIE) return std::nullopt;

    size_t length = get_u16(data + 2);
    if (HEADER_SIZE + length > size || length % 4 != 0) return std::nullopt;

    Message message;
    message.type = get_u16(data);
    std::memcpy(message.transaction.data(), data + 8, message.transaction.size());

    size_t pos = HEADER_SIZE;
    size_t end = HEADER_SIZE + length;
    while (pos + 4 <= end) {
        uint16_t type = get_u16(data + pos);
        uint16_t attr_len = get_u16(data + pos + 2);
        pos += 4;
        if (pos + attr_len > end) return std::nullopt;
        message.add(type, Bytes(data + pos, data + pos + attr_len));
        pos += (attr_len + 3u) & ~3u;
    }
    return message;
}

std::optional<std::pair<std::string, uint16_t>> decode_address(const Bytes& value, bool xored,
                                                                const TransactionId& transaction) {
    (void)transaction;  // only needed for IPv6, which host candidates never use here
    if (value.size() < 8 || value[1] != 0x01) {
        return std::nullopt;
    }

    uint16_t port = get_u16(value.data() + 2);
    uint32_t addr = get_u32(value.data() + 4);
    if (xored) {
        port ^= static_cast<uint16_t>(MAGIC_COOKIE >> 16);
        addr ^= MAGIC_COOKIE;
    }

    in_addr in{};
    in.s_addr = htonl(addr);
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &in, buf, sizeof(buf))) {
        return std::nullopt;
    }
    return std::make_pair(std::string(buf), port);
}

std::optional<int> error_code(const Message& message) {
    const Bytes* value = message.find(ATTR_ERROR_CODE);
    if (!value || value->size() < 4) return std::nullopt;
    return ((*value)[2] & 0x07) * 100 + (*value)[3];
}

Bytes long_term_key(const std::string& username, const std::string& realm, const std::string& password) {
    std::string input = username + ":" + realm + ":" + password;
    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_md5(), nullptr) != 1) {
        return {};
    }
    digest.resize(digest_len);
    return digest;
}

} // namespace stun

std::optional<IceServerAddress> parse_ice_url(const std::string& url) {
    IceServerAddress result;
    std::string rest;
    if (url.rfind("stun:", 0) == 0) {
        rest = url.substr(5);
    } else if (url.rfind("turn:", 0) == 0) {
        result.turn = true;
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    auto query = rest.find('?');
    if (query != std::string::npos) {
        rest = rest.substr(0, query);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        try {
            int port = std::stoi(rest.substr(colon + 1));
            if (port <= 0 || port > 65535) return std::nullopt;
            result.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) return std::nullopt;
    result.host = rest;
    return result;
}

std::vector<IceCandidate> gather_host_candidates() {
    std::vector<IceCandidate> candidates;
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        Logger::instance().warning("getifaddrs failed: " + std::string(strerror(errno)));
        return candidates;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {0};
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        IceCandidate candidate;
        candidate.type = CandidateType::Host;
        candidate.address = buf;
        candidates.push_back(candidate);
    }

    freeifaddrs(ifaddr);
    return candidates;
}

namespace {

class UdpSocket {
public:
    UdpSocket() : fd_(::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0)) {}
    ~UdpSocket() {
        if (fd_ >= 0) ::close(fd_);
    }
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    bool valid() const { return fd_ >= 0; }

    bool send_to(const Bytes& data, const sockaddr_in& to) {
        return ::sendto(fd_, data.data(), data.size(), 0, reinterpret_cast<const sockaddr*>(&to),
                        sizeof(to)) == static_cast<ssize_t>(data.size());
    }

    // Non-blocking; nullopt when nothing is queued
    std::optional<Bytes> receive() {
        uint8_t buf[2048];
        ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), MSG_DONTWAIT, nullptr, nullptr);
        if (n <= 0) return std::nullopt;
        return Bytes(buf, buf + n);
    }

private:
    int fd_;
};

std::optional<sockaddr_in> to_sockaddr(const std::string& ip, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }
    return addr;
}

constexpr auto RETRANSMIT_INTERVAL = std::chrono::milliseconds(500);
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(20);

struct StunProbe {
    std::string url;
    sockaddr_in addr{};
    stun::TransactionId transaction{};
    Bytes request;
    bool done = false;
};

struct TurnProbe {
    std::string url;
    IceServer server;
    sockaddr_in addr{};
    std::unique_ptr<UdpSocket> socket;
    stun::TransactionId transaction{};
    Bytes request;
    std::optional<Bytes> key;
    std::string realm;
    std::string nonce;
    int auth_attempts = 0;
    bool done = false;
};

void add_candidate(ConnectivityReport& report, std::set<std::string>& seen, IceCandidate candidate) {
    std::string key = to_string(candidate.type) + "/" + candidate.address + ":" + std::to_string(candidate.port);
    if (seen.insert(key).second) {
        report.candidates.push_back(std::move(candidate));
    }
}

Bytes turn_allocate(TurnProbe& probe) {
    stun::Message msg;
    msg.type = stun::ALLOCATE_REQUEST;
    msg.transaction = stun::new_transaction_id();
    // UDP (17) in the top byte
    msg.add(stun::ATTR_REQUESTED_TRANSPORT, Bytes{17, 0, 0, 0});
    if (probe.key) {
        msg.add(stun::ATTR_USERNAME, probe.server.username);
        msg.add(stun::ATTR_REALM, probe.realm);
        msg.add(stun::ATTR_NONCE, probe.nonce);
    }
    probe.transaction = msg.transaction;
    return stun::encode(msg, probe.key);
}

// Releases the allocation with a zero-lifetime refresh
void turn_release(TurnProbe& probe) {
    stun::Message msg;
    msg.type = 0x0004;
    msg.transaction = stun::new_transaction_id();
    msg.add(0x000D, Bytes{0, 0, 0, 0});
    msg.add(stun::ATTR_USERNAME, probe.server.username);
    msg.add(stun::ATTR_REALM, probe.realm);
    msg.add(stun::ATTR_NONCE, probe.nonce);
    probe.socket->send_to(stun::encode(msg, probe.key), probe.addr);
}

void handle_turn_response(TurnProbe& probe, const stun::Message& response, ConnectivityReport& report,
                          std::set<std::string>& seen) {
    if (response.transaction != probe.transaction) return;

    if (response.type == stun::ALLOCATE_SUCCESS) {
        if (const Bytes* relayed = response.find(stun::ATTR_XOR_RELAYED_ADDRESS)) {
            if (auto addr = stun::decode_address(*relayed, true, response.transaction)) {
                add_candidate(report, seen, IceCandidate{CandidateType::Relay, "udp", addr->first,
                                                         addr->second, probe.url});
                report.relay_reachable = true;
            }
        }
        if (const Bytes* mapped = response.find(stun::ATTR_XOR_MAPPED_ADDRESS)) {
            if (auto addr = stun::decode_address(*mapped, true, response.transaction)) {
                add_candidate(report, seen, IceCandidate{CandidateType::ServerReflexive, "udp", addr->first,
                                                         addr->second, probe.url});
                report.direct_reachable = true;
            }
        }
        if (probe.key) {
            turn_release(probe);
        }
        probe.done = true;
        return;
    }

    if (response.type != stun::ALLOCATE_ERROR) return;

    auto code = stun::error_code(response).value_or(0);
    const Bytes* realm = response.find(stun::ATTR_REALM);
    const Bytes* nonce = response.find(stun::ATTR_NONCE);

    // 401 Unauthorized or 438 Stale Nonce: retry with long-term credentials
    if ((code == 401 || code == 438) && realm && nonce && probe.auth_attempts < 2 &&
        !probe.server.username.empty()) {
        probe.realm.assign(realm->begin(), realm->end());
        probe.nonce.assign(nonce->begin(), nonce->end());
        auto key = stun::long_term_key(probe.server.username, probe.realm, probe.server.credential);
        if (key.empty()) {
            Logger::instance().warning("TURN {}: could not derive the credential key", probe.url);
            probe.done = true;
            return;
        }
        probe.key = std::move(key);
        probe.auth_attempts++;
        probe.request = turn_allocate(probe);
        probe.socket->send_to(probe.request, probe.addr);
        Logger::instance().debug("TURN {} challenged (realm {}), retrying with credentials", probe.url, probe.realm);
        return;
    }

    Logger::instance().info("TURN {} allocation failed with error {}", probe.url, code);
    probe.done = true;
}

} // anonymous namespace

std::optional<std::string> resolve_ipv4(const std::string& host) {
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) {
        return std::nullopt;
    }
    char buf[INET_ADDRSTRLEN] = {};
    const auto* addr = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
    const char* ip = inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf));
    freeaddrinfo(res);
    if (!ip) return std::nullopt;
    return std::string(buf);
}

elio::coro::task<ConnectivityReport> probe_ice_servers(std::vector<IceServer> servers,
                                                       std::chrono::milliseconds timeout,
                                                       HostResolver resolver) {
    if (!resolver) resolver = resolve_ipv4;
    ConnectivityReport report;
    std::set<std::string> seen;
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;

    UdpSocket stun_socket;
    std::vector<StunProbe> stun_probes;
    std::vector<TurnProbe> turn_probes;

    struct Lookup {
        IceServer server;
        IceServerAddress parsed;
        BlockingCall<std::optional<std::string>> call;
    };
    std::vector<Lookup> lookups;
    for (const auto& server : servers) {
        auto parsed = parse_ice_url(server.url);
        if (!parsed) {
            Logger::instance().warning("Ignoring invalid ICE server url: " + server.url);
            continue;
        }
        std::string host = parsed->host;
        lookups.push_back(Lookup{server, *parsed,
                                 BlockingCall<std::optional<std::string>>([resolver, host] { return resolver(host); })});
    }

    // Lookups run in parallel; whatever is unresolved at the deadline is dropped
    while (std::chrono::steady_clock::now() < deadline) {
        bool waiting = false;
        for (const auto& lookup : lookups) waiting = waiting || !lookup.call.ready();
        if (!waiting) break;
        co_await elio::time::sleep_for(POLL_INTERVAL);
    }

    for (auto& lookup : lookups) {
        const auto& server = lookup.server;
        const auto& parsed = lookup.parsed;
        if (!lookup.call.ready()) {
            Logger::instance().info("ICE server " + server.url + " still unresolved at the deadline");
            report.timed_out = true;
            continue;
        }
        std::optional<sockaddr_in> addr;
        if (auto ip = lookup.call.take()) {
            addr = to_sockaddr(*ip, parsed.port);
        }
        if (!addr) {
            Logger::instance().info("Could not resolve ICE server " + server.url);
            continue;
        }

        if (parsed.turn) {
            TurnProbe probe;
            probe.url = server.url;
            probe.server = server;
            probe.addr = *addr;
            probe.socket = std::make_unique<UdpSocket>();
            if (!probe.socket->valid()) continue;
            probe.request = turn_allocate(probe);
            probe.socket->send_to(probe.request, probe.addr);
            turn_probes.push_back(std::move(probe));
        } else {
            if (!stun_socket.valid()) continue;
            StunProbe probe;
            probe.url = server.url;
            probe.addr = *addr;
            stun::Message msg;
            msg.type = stun::BINDING_REQUEST;
            msg.transaction = stun::new_transaction_id();
            probe.transaction = msg.transaction;
            probe.request = stun::encode(msg);
            stun_socket.send_to(probe.request, probe.addr);
            stun_probes.push_back(std::move(probe));
        }
    }

    auto next_retransmit = std::chrono::steady_clock::now() + RETRANSMIT_INTERVAL;
    while (true) {
        bool pending = false;
        for (const auto& p : stun_probes) pending = pending || !p.done;
        for (const auto& p : turn_probes) pending = pending || !p.done;
        if (!pending) break;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            report.timed_out = true;
            break;
        }

        while (auto packet = stun_socket.valid() ? stun_socket.receive() : std::nullopt) {
            auto response = stun::decode(packet->data(), packet->size());
            if (!response || response->type != stun::BINDING_SUCCESS) continue;
            for (auto& probe : stun_probes) {
                if (probe.done || probe.transaction != response->transaction) continue;
                const Bytes* mapped = response->find(stun::ATTR_XOR_MAPPED_ADDRESS);
                bool xored = mapped != nullptr;
                if (!mapped) mapped = response->find(stun::ATTR_MAPPED_ADDRESS);
                if (mapped) {
                    if (auto addr = stun::decode_address(*mapped, xored, response->transaction)) {
                        add_candidate(report, seen, IceCandidate{CandidateType::ServerReflexive, "udp",
                                                                 addr->first, addr->second, probe.url});
                        report.direct_reachable = true;
                    }
                }
                probe.done = true;
            }
        }

        for (auto& probe : turn_probes) {
            if (probe.done) continue;
            while (auto packet = probe.socket->receive()) {
                auto response = stun::decode(packet->data(), packet->size());
                if (response) {
                    handle_turn_response(probe, *response, report, seen);
                }
                if (probe.done) break;
            }
        }

        if (now >= next_retransmit) {
            for (auto& probe : stun_probes) {
                if (!probe.done) stun_socket.send_to(probe.request, probe.addr);
            }
            for (auto& probe : turn_probes) {
                if (!probe.done) probe.socket->send_to(probe.request, probe.addr);
            }
            next_retransmit = now + RETRANSMIT_INTERVAL;
        }

        co_await elio::time::sleep_for(POLL_INTERVAL);
    }

    report.elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    co_return report;
}

} // namespace roomsync
