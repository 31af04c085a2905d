#include "roomsync/base/config.h"
#include "roomsync/base/encoding.h"
#include "roomsync/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace roomsync {

using json = nlohmann::json;

namespace {

constexpr uint32_t MIN_KDF_ITERATIONS = 100000;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

template <typename T>
void read_json(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // anonymous namespace

bool IceServer::is_turn() const {
    return url.rfind("turn:", 0) == 0 || url.rfind("turns:", 0) == 0;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    bool ok = false;
    try {
        if (std::filesystem::path(path).extension() == ".json") {
            ok = load_json(path);
        } else {
            ok = load_ini(path);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to parse config " + path + ": " + e.what());
        return false;
    }

    if (ok) {
        Logger::instance().info("Config loaded successfully from: " + path);
    }
    return ok;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    json root = json::parse(file);

    if (root.contains("log")) {
        const auto& s = root["log"];
        read_json(s, "level", config_.log.level);
        read_json(s, "output", config_.log.output);
        read_json(s, "file_path", config_.log.file_path);
    }

    if (root.contains("node")) {
        const auto& s = root["node"];
        read_json(s, "identity", config_.node.identity);
        read_json(s, "display_name", config_.node.display_name);
        read_json(s, "display_color", config_.node.display_color);
        read_json(s, "admins", config_.node.admins);
    }

    if (root.contains("p2p")) {
        const auto& s = root["p2p"];
        read_json(s, "signaling_servers", config_.p2p.signaling_servers);
        if (s.contains("ice_servers")) {
            config_.p2p.ice_servers.clear();
            for (const auto& entry : s["ice_servers"]) {
                IceServer server;
                server.url = entry.value("url", "");
                server.username = entry.value("username", "");
                server.credential = entry.value("credential", "");
                if (!server.url.empty()) config_.p2p.ice_servers.push_back(server);
            }
        }
        read_json(s, "turn_url", config_.p2p.turn_url);
        read_json(s, "turn_username", config_.p2p.turn_username);
        read_json(s, "turn_credential", config_.p2p.turn_credential);
        read_json(s, "max_peers", config_.p2p.max_peers);
        read_json(s, "bind_address", config_.p2p.bind_address);
        read_json(s, "listen_port", config_.p2p.listen_port);
        read_json(s, "enable_direct", config_.p2p.enable_direct);
        read_json(s, "enable_relay", config_.p2p.enable_relay);
        read_json(s, "connect_timeout_ms", config_.p2p.connect_timeout_ms);
        read_json(s, "probe_timeout_sec", config_.p2p.probe_timeout_sec);
        read_json(s, "presence_interval_sec", config_.p2p.presence_interval_sec);
        read_json(s, "peer_timeout_sec", config_.p2p.peer_timeout_sec);
        read_json(s, "max_messages_per_sec", config_.p2p.max_messages_per_sec);
        read_json(s, "burst_size", config_.p2p.burst_size);
        read_json(s, "max_connections_per_min", config_.p2p.max_connections_per_min);
        read_json(s, "ban_duration_sec", config_.p2p.ban_duration_sec);
    }

    if (root.contains("crypto")) {
        const auto& s = root["crypto"];
        read_json(s, "kdf_iterations", config_.crypto.kdf_iterations);
        read_json(s, "max_cached_keys", config_.crypto.max_cached_keys);
        read_json(s, "allow_plaintext_fallback", config_.crypto.allow_plaintext_fallback);
    }

    if (root.contains("transfer")) {
        const auto& s = root["transfer"];
        read_json(s, "large_tier_yield_ms", config_.transfer.large_tier_yield_ms);
        read_json(s, "download_dir", config_.transfer.download_dir);
    }

    if (root.contains("store")) {
        read_json(root["store"], "snapshot_dir", config_.store.snapshot_dir);
    }

    if (root.contains("signaling_server")) {
        const auto& s = root["signaling_server"];
        read_json(s, "bind_address", config_.signaling_server.bind_address);
        read_json(s, "listen_port", config_.signaling_server.listen_port);
        read_json(s, "ping_timeout_sec", config_.signaling_server.ping_timeout_sec);
    }

    return true;
}

bool Config::load_ini(const std::string& path) {
    std::map<std::string, std::map<std::string, std::string>> sections;
    parse_ini_file(path, sections);

    // Parse log section
    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) config_.log.level = s["level"];
        if (s.count("output")) config_.log.output = s["output"];
        if (s.count("file_path")) config_.log.file_path = s["file_path"];
    }

    // Parse node section
    if (sections.count("node")) {
        auto& s = sections["node"];
        if (s.count("identity")) config_.node.identity = s["identity"];
        if (s.count("display_name")) config_.node.display_name = s["display_name"];
        if (s.count("display_color")) config_.node.display_color = s["display_color"];
        if (s.count("admins")) config_.node.admins = split_list(s["admins"]);
    }

    // Parse p2p section
    if (sections.count("p2p")) {
        auto& s = sections["p2p"];
        if (s.count("signaling_servers")) config_.p2p.signaling_servers = split_list(s["signaling_servers"]);
        if (s.count("stun_servers")) {
            config_.p2p.ice_servers.clear();
            for (const auto& url : split_list(s["stun_servers"])) {
                config_.p2p.ice_servers.push_back({url, "", ""});
            }
        }
        if (s.count("turn_url")) config_.p2p.turn_url = s["turn_url"];
        if (s.count("turn_username")) config_.p2p.turn_username = s["turn_username"];
        if (s.count("turn_credential")) config_.p2p.turn_credential = s["turn_credential"];
        if (s.count("max_peers")) config_.p2p.max_peers = std::stoul(s["max_peers"]);
        if (s.count("bind_address")) config_.p2p.bind_address = s["bind_address"];
        if (s.count("listen_port")) config_.p2p.listen_port = static_cast<uint16_t>(std::stoi(s["listen_port"]));
        if (s.count("enable_direct")) config_.p2p.enable_direct = parse_bool(s["enable_direct"]);
        if (s.count("enable_relay")) config_.p2p.enable_relay = parse_bool(s["enable_relay"]);
        if (s.count("connect_timeout_ms")) config_.p2p.connect_timeout_ms = std::stoul(s["connect_timeout_ms"]);
        if (s.count("probe_timeout_sec")) config_.p2p.probe_timeout_sec = std::stoul(s["probe_timeout_sec"]);
        if (s.count("presence_interval_sec")) config_.p2p.presence_interval_sec = std::stoul(s["presence_interval_sec"]);
        if (s.count("peer_timeout_sec")) config_.p2p.peer_timeout_sec = std::stoul(s["peer_timeout_sec"]);
        if (s.count("max_messages_per_sec")) config_.p2p.max_messages_per_sec = std::stoul(s["max_messages_per_sec"]);
        if (s.count("burst_size")) config_.p2p.burst_size = std::stoul(s["burst_size"]);
        if (s.count("max_connections_per_min")) config_.p2p.max_connections_per_min = std::stoul(s["max_connections_per_min"]);
        if (s.count("ban_duration_sec")) config_.p2p.ban_duration_sec = std::stoul(s["ban_duration_sec"]);
    }

    // Parse crypto section
    if (sections.count("crypto")) {
        auto& s = sections["crypto"];
        if (s.count("kdf_iterations")) config_.crypto.kdf_iterations = std::stoul(s["kdf_iterations"]);
        if (s.count("max_cached_keys")) config_.crypto.max_cached_keys = std::stoul(s["max_cached_keys"]);
        if (s.count("allow_plaintext_fallback")) {
            config_.crypto.allow_plaintext_fallback = parse_bool(s["allow_plaintext_fallback"]);
        }
    }

    // Parse transfer section
    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        if (s.count("large_tier_yield_ms")) config_.transfer.large_tier_yield_ms = std::stoul(s["large_tier_yield_ms"]);
        if (s.count("download_dir")) config_.transfer.download_dir = s["download_dir"];
    }

    // Parse store section
    if (sections.count("store")) {
        auto& s = sections["store"];
        if (s.count("snapshot_dir")) config_.store.snapshot_dir = s["snapshot_dir"];
    }

    // Parse signaling_server section
    if (sections.count("signaling_server")) {
        auto& s = sections["signaling_server"];
        if (s.count("bind_address")) config_.signaling_server.bind_address = s["bind_address"];
        if (s.count("listen_port")) config_.signaling_server.listen_port = static_cast<uint16_t>(std::stoi(s["listen_port"]));
        if (s.count("ping_timeout_sec")) config_.signaling_server.ping_timeout_sec = std::stoul(s["ping_timeout_sec"]);
    }

    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid environment override: " + std::string(e.what()));
        return false;
    }
    return true;
}

void Config::override_from_env() {
    // Node config
    if (const char* val = std::getenv("ROOMSYNC_IDENTITY")) {
        config_.node.identity = val;
    }
    if (const char* val = std::getenv("ROOMSYNC_DISPLAY_NAME")) {
        config_.node.display_name = val;
    }

    // Log config
    if (const char* val = std::getenv("ROOMSYNC_LOG_LEVEL")) {
        config_.log.level = val;
    }

    // P2P
    if (const char* val = std::getenv("ROOMSYNC_SIGNALING")) {
        config_.p2p.signaling_servers = split_list(val);
    }
    if (const char* val = std::getenv("ROOMSYNC_TURN_URL")) {
        config_.p2p.turn_url = val;
    }
    if (const char* val = std::getenv("ROOMSYNC_TURN_USERNAME")) {
        config_.p2p.turn_username = val;
    }
    if (const char* val = std::getenv("ROOMSYNC_TURN_CREDENTIAL")) {
        config_.p2p.turn_credential = val;
    }
    if (const char* val = std::getenv("ROOMSYNC_MAX_PEERS")) {
        config_.p2p.max_peers = std::stoul(val);
    }

    // Store
    if (const char* val = std::getenv("ROOMSYNC_SNAPSHOT_DIR")) {
        config_.store.snapshot_dir = val;
    }
}

void Config::register_options(CLI::App& app) {
    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Node options
    app.add_option("--identity", config_.node.identity, "Stable local identity (owner id)");
    app.add_option("--name", config_.node.display_name, "Display name advertised to peers");
    app.add_option("--color", config_.node.display_color, "Display color advertised to peers");
    app.add_option("--admin", config_.node.admins, "Identity granted the admin role");

    // P2P options
    app.add_option("--signaling", config_.p2p.signaling_servers, "Signaling server host:port");
    app.add_option("--turn-url", config_.p2p.turn_url, "Additional TURN relay URL");
    app.add_option("--turn-username", config_.p2p.turn_username, "TURN relay username");
    app.add_option("--turn-credential", config_.p2p.turn_credential, "TURN relay credential");
    app.add_option("--max-peers", config_.p2p.max_peers, "Maximum connected peers per room");
    app.add_option("--p2p-bind", config_.p2p.bind_address, "Direct channel bind address");
    app.add_option("--p2p-port", config_.p2p.listen_port, "Direct channel listen port (0 = random)");
    app.add_flag("!--no-direct", config_.p2p.enable_direct, "Disable direct peer channels");
    app.add_flag("!--no-relay", config_.p2p.enable_relay, "Disable relaying through signaling");

    // Crypto options
    app.add_option("--kdf-iterations", config_.crypto.kdf_iterations, "PBKDF2 iteration count");
    app.add_flag("--allow-plaintext-fallback", config_.crypto.allow_plaintext_fallback,
                 "Send plaintext when encryption of an outgoing update fails");

    // Transfer/store options
    app.add_option("--download-dir", config_.transfer.download_dir, "Directory for downloaded files");
    app.add_option("--snapshot-dir", config_.store.snapshot_dir, "Directory for document snapshots");
}

void Config::finalize() {
    if (config_.node.identity.empty()) {
        config_.node.identity = generate_uuid();
        Logger::instance().info("Generated local identity: " + config_.node.identity);
    }

    if (!config_.p2p.turn_url.empty()) {
        bool present = std::any_of(config_.p2p.ice_servers.begin(), config_.p2p.ice_servers.end(),
                                   [this](const IceServer& s) { return s.url == config_.p2p.turn_url; });
        if (!present) {
            config_.p2p.ice_servers.push_back(
                {config_.p2p.turn_url, config_.p2p.turn_username, config_.p2p.turn_credential});
        }
    }

    if (config_.crypto.kdf_iterations < MIN_KDF_ITERATIONS) {
        Logger::instance().warning("kdf_iterations raised to the minimum of " +
                                   std::to_string(MIN_KDF_ITERATIONS));
        config_.crypto.kdf_iterations = MIN_KDF_ITERATIONS;
    }

    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "stderr") {
        Logger::instance().set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        Logger::instance().set_file_output(config_.log.file_path);
    }
}

bool Config::validate() const {
    if (config_.p2p.max_peers == 0) {
        Logger::instance().error("p2p.max_peers must be greater than zero");
        return false;
    }
    if (config_.crypto.kdf_iterations < MIN_KDF_ITERATIONS) {
        Logger::instance().error("crypto.kdf_iterations must be at least " +
                                 std::to_string(MIN_KDF_ITERATIONS));
        return false;
    }
    if (config_.crypto.max_cached_keys == 0) {
        Logger::instance().error("crypto.max_cached_keys must be greater than zero");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Identity: " + config_.node.identity);
    Logger::instance().info("Display Name: " + config_.node.display_name);
    Logger::instance().info("Log Level: " + config_.log.level);
    for (const auto& server : config_.p2p.signaling_servers) {
        Logger::instance().info("Signaling: " + server);
    }
    Logger::instance().info("ICE Servers: " + std::to_string(config_.p2p.ice_servers.size()));
    Logger::instance().info("Max Peers: " + std::to_string(config_.p2p.max_peers));
    Logger::instance().info("Snapshot Dir: " +
                            (config_.store.snapshot_dir.empty() ? std::string("(disabled)")
                                                                : config_.store.snapshot_dir));
}

} // namespace roomsync
