#ifndef ROOMSYNC_BASE_CONFIG_H
#define ROOMSYNC_BASE_CONFIG_H

#include <string>
#include <optional>
#include <cstdint>
#include <vector>
#include <map>

namespace CLI {
class App;
}

namespace roomsync {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Local node identity
struct NodeConfig {
    std::string identity;  // stable owner id, generated when empty
    std::string display_name = "Anonymous";
    std::string display_color = "#888";
    std::vector<std::string> admins;
};

// STUN/TURN server entry
struct IceServer {
    std::string url;  // stun:host:port or turn:host:port
    std::string username;
    std::string credential;

    bool is_turn() const;
};

// P2P configuration
struct P2PConfig {
    std::vector<std::string> signaling_servers = {"127.0.0.1:4444"};
    std::vector<IceServer> ice_servers = {
        {"stun:stun.l.google.com:19302", "", ""},
        {"stun:stun1.l.google.com:19302", "", ""},
        {"stun:stun2.l.google.com:19302", "", ""},
        {"stun:stun3.l.google.com:19302", "", ""},
        {"stun:stun4.l.google.com:19302", "", ""},
        {"turn:openrelay.metered.ca:80", "openrelayproject", "openrelayproject"},
    };
    std::string turn_url;
    std::string turn_username;
    std::string turn_credential;

    uint32_t max_peers = 15;
    std::string bind_address = "0.0.0.0";
    uint16_t listen_port = 0;  // 0 means random port
    bool enable_direct = true;
    bool enable_relay = true;
    uint32_t connect_timeout_ms = 5000;
    uint32_t probe_timeout_sec = 10;
    uint32_t presence_interval_sec = 15;
    uint32_t peer_timeout_sec = 45;

    // Per-peer rate limiting
    uint32_t max_messages_per_sec = 50;
    uint32_t burst_size = 20;
    uint32_t max_connections_per_min = 10;
    uint32_t ban_duration_sec = 60;
};

// Room encryption configuration
struct CryptoConfig {
    uint32_t kdf_iterations = 100000;
    uint32_t max_cached_keys = 50;
    bool allow_plaintext_fallback = false;
};

// File transfer configuration
struct TransferConfig {
    uint32_t large_tier_yield_ms = 50;
    std::string download_dir = ".";
};

// Document store configuration
struct StoreConfig {
    std::string snapshot_dir;  // empty disables persistence
};

// Signaling server configuration (when running as server)
struct SignalingServerConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t listen_port = 4444;
    uint32_t ping_timeout_sec = 30;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    P2PConfig p2p;
    CryptoConfig crypto;
    TransferConfig transfer;
    StoreConfig store;
    SignalingServerConfig signaling_server;
};

class Config {
public:
    Config() = default;

    // Load configuration from file (JSON or INI)
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Register command line options that override config fields
    void register_options(CLI::App& app);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Fill generated defaults (identity) and merge the extra TURN server
    void finalize();

    // Check if required fields are set
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

private:
    bool load_json(const std::string& path);
    bool load_ini(const std::string& path);
    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
};

// Splits "a, b,c" into trimmed non-empty items
std::vector<std::string> split_list(const std::string& value);

} // namespace roomsync

#endif // ROOMSYNC_BASE_CONFIG_H
