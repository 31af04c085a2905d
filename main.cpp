#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <set>
#include <csignal>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <map>
#include <optional>
#include <thread>

#include "CLI/CLI.hpp"
#include "roomsync/base/config.h"
#include "roomsync/base/logger.h"
#include "roomsync/control/permission_gate.h"
#include "roomsync/crypto/room_encryption.h"
#include "roomsync/p2p/connection_manager.h"
#include "roomsync/p2p/room_link.h"
#include "roomsync/p2p/signaling_server.h"
#include "roomsync/sync/document_store.h"
#include "roomsync/transfer/file_transfer.h"

using namespace roomsync;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

struct JoinOptions {
    std::string room;
    std::string password;
    std::vector<std::string> shares;
    std::string tier = "small";
    std::string download_dir;
};

struct LinkOptions {
    std::string room;
    std::string password;
    std::string link;
};

// The config file has to be loaded before CLI11 writes its values so the
// command line keeps the highest precedence
std::string find_config_argument(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

void configure_logger(const LogConfig& config) {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config.level));
    if (config.output == "file" && !config.file_path.empty()) {
        if (!logger.set_file_output(config.file_path)) {
            logger.error("Failed to open log file: " + config.file_path);
        }
    } else if (config.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    }
}

std::optional<Bytes> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return Bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"}, {".md", "text/markdown"}, {".json", "application/json"},
        {".pdf", "application/pdf"}, {".png", "image/png"}, {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"}, {".gif", "image/gif"}, {".zip", "application/zip"},
    };
    auto it = types.find(path.extension().string());
    return it == types.end() ? "application/octet-stream" : it->second;
}

} // anonymous namespace

class RoomSyncApplication {
public:
    explicit RoomSyncApplication(Config& config) : config_(config) {}

    ~RoomSyncApplication() {
        if (scheduler_) {
            scheduler_->shutdown();
        }
    }

    bool initialize() {
        const auto& cfg = config_.get();

        scheduler_ = std::make_shared<elio::runtime::scheduler>(4);
        scheduler_->start();

        encryption_ = std::make_unique<RoomEncryption>(cfg.crypto);

        std::shared_ptr<SnapshotStore> snapshots;
        if (!cfg.store.snapshot_dir.empty()) {
            snapshots = std::make_shared<FileSnapshotStore>(cfg.store.snapshot_dir);
        }
        store_ = std::make_unique<DocumentStore>(snapshots);

        for (const auto& admin : cfg.node.admins) {
            gate_.set_role(admin, Role::Admin);
        }

        manager_ = std::make_unique<ConnectionManager>(cfg.p2p, *encryption_, scheduler_);
        manager_->set_local_presence(cfg.node.display_name, cfg.node.display_color);
        return true;
    }

    int run_signal_server() {
        SignalingServer server(config_.get().signaling_server, scheduler_);
        if (!server.start()) {
            Logger::instance().error("Failed to start signaling server");
            return 1;
        }
        Logger::instance().info("Signaling server listening on {}:{}",
                                config_.get().signaling_server.bind_address, server.port());

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        server.stop();
        Logger::instance().info("Signaling server stopped");
        return 0;
    }

    int run_join(const JoinOptions& options) {
        elio::run(join_room(options));
        return exit_code_;
    }

    int run_probe() {
        elio::run(probe());
        return exit_code_;
    }

private:
    elio::coro::task<void> join_room(JoinOptions options) {
        auto& log = Logger::instance();
        const auto& cfg = config_.get();

        auto requested_tier = parse_tier(options.tier);
        if (!requested_tier) {
            log.error("Unknown tier: {}", options.tier);
            exit_code_ = 1;
            co_return;
        }

        if (!options.password.empty()) {
            auto ready = co_await encryption_->initialize_room_encryption(options.room, options.password);
            if (!ready) {
                log.error("Failed to set up room encryption: {}", ready.error().to_string());
                exit_code_ = 1;
                co_return;
            }
        } else {
            log.warning("No password given, room {} traffic is not encrypted", options.room);
        }

        if (!cfg.store.snapshot_dir.empty()) {
            auto loaded = store_->load_snapshot(options.room);
            if (!loaded && loaded.error().code != ErrorCode::NotFound) {
                log.warning("Ignoring snapshot: {}", loaded.error().to_string());
            }
        }

        FileTransferCoordinator coordinator(*store_, options.room, cfg.node.identity, cfg.transfer, &gate_);
        coordinator.set_on_files_changed([](const std::vector<SharedFile>& files) {
            Logger::instance().debug("Room now lists {} files", files.size());
        });
        coordinator.set_on_peers_changed([](const std::vector<Peer>& peers) {
            Logger::instance().info("{} peers present", peers.size());
        });
        coordinator.set_on_progress([](const TransferProgress& progress) {
            Logger::instance().debug("{} {}: {:.0f}%",
                                     progress.direction == TransferDirection::Upload ? "Upload" : "Download",
                                     progress.name, progress.progress_percent);
        });

        auto attached = coordinator.initialize();
        if (!attached) {
            log.error("Failed to open room document: {}", attached.error().to_string());
            exit_code_ = 1;
            co_return;
        }

        std::string room = options.room;
        manager_->set_on_presence_changed([&coordinator, room](const std::string& room_id,
                                                               const std::vector<Peer>& peers) {
            if (room_id == room) coordinator.handle_peers_changed(peers);
        });
        manager_->set_on_peer_joined([](const std::string&, const Peer& peer) {
            Logger::instance().info("{} joined", peer.display_name);
        });
        manager_->set_on_sync_state_changed([](const std::string& room_id, bool synced) {
            Logger::instance().info("Room {} {}", room_id, synced ? "synced" : "waiting for peers");
        });

        auto document = store_->get_document(options.room);
        if (!document) {
            log.error("Failed to open room document: {}", document.error().to_string());
            manager_->set_on_presence_changed(nullptr);
            exit_code_ = 1;
            co_return;
        }

        auto handle = co_await manager_->connect(options.room, *document);
        if (!handle) {
            log.error("Failed to join room {}: {}", options.room, handle.error().to_string());
            manager_->set_on_presence_changed(nullptr);
            exit_code_ = 1;
            co_return;
        }
        log.info("Joined room {} as {}", options.room, (*handle)->local_peer_id);

        for (const auto& path : options.shares) {
            auto data = read_file(path);
            if (!data) {
                log.error("Cannot read {}", path);
                continue;
            }

            std::filesystem::path fs_path(path);
            ShareRequest request;
            request.name = fs_path.filename().string();
            request.size = static_cast<int64_t>(data->size());
            request.data = std::move(*data);
            request.mime_type = guess_mime_type(fs_path);
            request.uploader_name = cfg.node.display_name;
            request.requested_tier = *requested_tier;

            auto shared = co_await coordinator.share_file(std::move(request));
            if (!shared) {
                log.error("Failed to share {}: {}", path, shared.error().to_string());
                continue;
            }
            std::cout << "Shared " << path << " as " << shared->file_id << " ("
                      << to_string(shared->actual_tier) << " tier";
            if (shared->chunk_count > 0) {
                std::cout << ", " << shared->chunk_count << " chunks";
            }
            std::cout << ")" << std::endl;
        }

        std::set<std::string> finished;
        while (g_running) {
            if (!options.download_dir.empty()) {
                for (const auto& file : coordinator.list_files()) {
                    if (file.is_local || finished.count(file.file_id)) continue;

                    auto data = co_await coordinator.download_file(file);
                    if (!data) {
                        if (data.error().code == ErrorCode::IncompleteTransfer) {
                            log.debug("{} not complete yet: {}", file.name, data.error().message);
                        } else {
                            log.error("Failed to download {}: {}", file.name, data.error().to_string());
                            finished.insert(file.file_id);
                        }
                        continue;
                    }

                    finished.insert(file.file_id);
                    if (save_download(options.download_dir, file, *data)) {
                        std::cout << "Downloaded " << file.name << " (" << file.size_bytes
                                  << " bytes)" << std::endl;
                    }
                }
            }
            co_await elio::time::sleep_for(std::chrono::milliseconds(500));
        }

        manager_->set_on_presence_changed(nullptr);
        manager_->disconnect(options.room);
        if (!cfg.store.snapshot_dir.empty()) {
            auto saved = store_->save_snapshot(options.room);
            if (!saved) {
                log.warning("Failed to save snapshot: {}", saved.error().to_string());
            }
        }
        log.info("Left room {}", options.room);
    }

    elio::coro::task<void> probe() {
        auto report = co_await manager_->test_connectivity();

        std::cout << "Direct reachable: " << (report.direct_reachable ? "yes" : "no") << std::endl;
        std::cout << "Relay reachable:  " << (report.relay_reachable ? "yes" : "no") << std::endl;
        std::cout << "Elapsed:          " << report.elapsed_ms << " ms"
                  << (report.timed_out ? " (timed out)" : "") << std::endl;
        std::cout << "Candidates:" << std::endl;
        for (const auto& candidate : report.candidates) {
            std::cout << "  " << to_string(candidate.type) << " " << candidate.protocol << " "
                      << candidate.address << ":" << candidate.port;
            if (!candidate.server.empty()) {
                std::cout << " via " << candidate.server;
            }
            std::cout << std::endl;
        }
        exit_code_ = report.direct_reachable || report.relay_reachable ? 0 : 2;
    }

    bool save_download(const std::string& dir, const SharedFile& file, const Bytes& data) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);

        std::filesystem::path name = std::filesystem::path(file.name).filename();
        if (name.empty()) {
            name = file.file_id;
        }
        auto target = std::filesystem::path(dir) / name;
        if (std::filesystem::exists(target)) {
            target = std::filesystem::path(dir) /
                     (name.stem().string() + "-" + file.file_id.substr(0, 8) + name.extension().string());
        }

        std::ofstream out(target, std::ios::binary);
        if (!out.is_open()) {
            Logger::instance().error("Cannot write {}", target.string());
            return false;
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return static_cast<bool>(out);
    }

    Config& config_;
    std::shared_ptr<elio::runtime::scheduler> scheduler_;
    std::unique_ptr<RoomEncryption> encryption_;
    std::unique_ptr<DocumentStore> store_;
    RolePermissionGate gate_;
    std::unique_ptr<ConnectionManager> manager_;
    int exit_code_ = 0;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Config config;
    CLI::App app{"RoomSync - encrypted peer-to-peer room sync and file sharing"};
    app.set_version_flag("-v,--version", "roomsync 0.1.0");
    app.require_subcommand(1);

    std::string config_path;
    app.add_option("-c,--config", config_path, "Config file path (.json or INI)");
    config.register_options(app);

    auto* signal_cmd = app.add_subcommand("signal", "Run the signaling and relay server");
    signal_cmd->add_option("--bind", config.get().signaling_server.bind_address, "Bind address");
    signal_cmd->add_option("--port", config.get().signaling_server.listen_port, "Listen port");

    JoinOptions join;
    auto* join_cmd = app.add_subcommand("join", "Join a room, share files and download announced files");
    join_cmd->add_option("--room", join.room, "Room id or invite link")->required();
    join_cmd->add_option("--password", join.password, "Room password");
    join_cmd->add_option("--share", join.shares, "File to share")->check(CLI::ExistingFile);
    join_cmd->add_option("--tier", join.tier, "Requested tier (small, medium, large)");
    join_cmd->add_option("--download-all", join.download_dir, "Download every announced file into DIR");

    app.add_subcommand("probe", "Print the connectivity report");

    LinkOptions invite;
    auto* invite_cmd = app.add_subcommand("invite", "Print an invite link for a room");
    invite_cmd->add_option("--room", invite.room, "Room id")->required();
    invite_cmd->add_option("--password", invite.password, "Room password to embed");

    LinkOptions parse;
    auto* parse_cmd = app.add_subcommand("parse-link", "Print the fields of an invite link");
    parse_cmd->add_option("link", parse.link, "Invite link or bare room code")->required();

    std::string early_config = find_config_argument(argc, argv);
    if (!early_config.empty() && !config.load_from_file(early_config)) {
        std::cerr << "Failed to load config file: " << early_config << std::endl;
        return 1;
    }
    config.load_from_env();

    CLI11_PARSE(app, argc, argv);

    configure_logger(config.get().log);

    if (invite_cmd->parsed()) {
        auto password = invite.password.empty() ? std::nullopt : std::optional<std::string>(invite.password);
        std::cout << generate_room_link(invite.room, password) << std::endl;
        return 0;
    }

    if (parse_cmd->parsed()) {
        auto link = parse_room_link(parse.link);
        if (!link) {
            std::cerr << link.error().to_string() << std::endl;
            return 1;
        }
        std::cout << "Room:     " << link->room_id << std::endl;
        std::cout << "Password: " << (link->password ? "(set)" : "(none)") << std::endl;
        if (link->name) {
            std::cout << "Name:     " << *link->name << std::endl;
        }
        return 0;
    }

    // A room given as an invite link carries its own password
    if (join_cmd->parsed()) {
        auto link = parse_room_link(join.room);
        if (!link) {
            std::cerr << link.error().to_string() << std::endl;
            return 1;
        }
        join.room = link->room_id;
        if (join.password.empty() && link->password) {
            join.password = *link->password;
        }
    }

    config.finalize();
    if (!config.validate()) {
        return 1;
    }

    try {
        RoomSyncApplication application(config);
        if (!application.initialize()) {
            std::cerr << "Failed to initialize application" << std::endl;
            return 1;
        }

        if (signal_cmd->parsed()) {
            return application.run_signal_server();
        }
        if (join_cmd->parsed()) {
            return application.run_join(join);
        }
        return application.run_probe();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
