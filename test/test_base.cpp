#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include "CLI/CLI.hpp"
#include "roomsync/base/config.h"
#include "roomsync/base/encoding.h"
#include "roomsync/base/error_code.h"
#include "roomsync/base/logger.h"
#include "roomsync/base/result.h"

using namespace roomsync;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // anonymous namespace

TEST_CASE("Error Code Text", "[base][error]") {
    REQUIRE(to_string(ErrorCode::FileTooLarge) == "File too large");
    REQUIRE(to_string(ErrorCode::Unauthorized) == "Unauthorized");
    REQUIRE(to_string(ErrorCode::NotFound) == "Not found");

    auto ec = make_error_code(ErrorCode::DecryptFailed);
    REQUIRE(std::string(ec.category().name()) == "RoomSync");
    REQUIRE(ec.message() == "Decrypt failed");
    REQUIRE(ec.value() == 3001);

    RoomSyncError error(ErrorCode::InvalidLink, "bad scheme");
    REQUIRE(error.code() == ErrorCode::InvalidLink);
    REQUIRE(std::string(error.what()) == "Invalid room link: bad scheme");
}

TEST_CASE("Result Carries Value Or Error", "[base][result]") {
    Result<int> ok(42);
    REQUIRE(ok.ok());
    REQUIRE(*ok == 42);

    Result<int> failed(Error(ErrorCode::Timeout, "slow"));
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.error().code == ErrorCode::Timeout);
    REQUIRE(failed.error().to_string() == "Operation timed out: slow");
    REQUIRE_THROWS_AS(failed.value(), RoomSyncError);

    Status done;
    REQUIRE(done.ok());
    Status unauthorized(Error(ErrorCode::Unauthorized, "nope"));
    REQUIRE_FALSE(unauthorized.ok());
    REQUIRE(unauthorized.error().code != ErrorCode::NotFound);
}

TEST_CASE("Incomplete Transfer Error Names The Chunk", "[base][error]") {
    auto error = Error::incomplete_transfer(2, 5);
    REQUIRE(error.code == ErrorCode::IncompleteTransfer);
    REQUIRE(error.missing_index.has_value());
    REQUIRE(*error.missing_index == 2);
    REQUIRE(error.message == "Missing chunk 3/5");
}

TEST_CASE("Base64 Encoding", "[base][encoding]") {
    REQUIRE(base64_encode(Bytes{}) == "");
    REQUIRE(base64_encode(Bytes{'f', 'o', 'o'}) == "Zm9v");
    REQUIRE(base64_encode(Bytes{'f', 'o', 'o', 'b'}) == "Zm9vYg==");

    auto decoded = base64_decode("Zm9vYg==");
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == Bytes{'f', 'o', 'o', 'b'});

    Bytes binary;
    for (int i = 0; i < 256; ++i) binary.push_back(static_cast<uint8_t>(i));
    auto round = base64_decode(base64_encode(binary));
    REQUIRE(round.has_value());
    REQUIRE(*round == binary);

    REQUIRE_FALSE(base64_decode("not base64!").has_value());
}

TEST_CASE("Digest And Identifier Helpers", "[base][encoding]") {
    REQUIRE(sha256_hex(Bytes{'a', 'b', 'c'}) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_uuid();
        REQUIRE(id.size() == 36);
        REQUIRE(id[14] == '4');
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);

    REQUIRE(url_encode("a b&c=d") == "a%20b%26c%3Dd");
    REQUIRE(url_decode("a%20b%26c%3Dd") == "a b&c=d");
    REQUIRE(now_ms() > 0);
}

TEST_CASE("Log Level Parsing", "[base][logger]") {
    REQUIRE(parse_log_level("debug") == LogLevel::debug);
    REQUIRE(parse_log_level("WARNING") == LogLevel::warning);
    REQUIRE(parse_log_level("error") == LogLevel::error);

    auto& logger = Logger::instance();
    auto previous = logger.get_level();
    logger.set_level(LogLevel::warning);
    REQUIRE_FALSE(logger.enabled(LogLevel::info));
    REQUIRE(logger.enabled(LogLevel::error));
    logger.set_level(previous);
}

TEST_CASE("Config Defaults", "[base][config]") {
    Config config;
    const auto& cfg = config.get();
    REQUIRE(cfg.p2p.max_peers == 15);
    REQUIRE(cfg.p2p.max_messages_per_sec == 50);
    REQUIRE(cfg.p2p.burst_size == 20);
    REQUIRE(cfg.p2p.ice_servers.size() == 6);
    REQUIRE(cfg.crypto.kdf_iterations == 100000);
    REQUIRE_FALSE(cfg.crypto.allow_plaintext_fallback);
    REQUIRE(cfg.transfer.large_tier_yield_ms == 50);
    REQUIRE(cfg.node.display_name == "Anonymous");
    REQUIRE(config.validate());
}

TEST_CASE("Config INI File", "[base][config]") {
    auto path = write_temp("roomsync_test_config.ini",
                           "[node]\n"
                           "display_name = Alice\n"
                           "admins = a1, a2\n"
                           "\n"
                           "[p2p]\n"
                           "signaling_servers = 10.0.0.1:4444, 10.0.0.2:4444\n"
                           "max_peers = 20\n"
                           "enable_direct = false\n"
                           "\n"
                           "[crypto]\n"
                           "kdf_iterations = 150000\n");

    Config config;
    REQUIRE(config.load_from_file(path.string()));
    const auto& cfg = config.get();
    REQUIRE(cfg.node.display_name == "Alice");
    REQUIRE(cfg.node.admins == std::vector<std::string>{"a1", "a2"});
    REQUIRE(cfg.p2p.signaling_servers.size() == 2);
    REQUIRE(cfg.p2p.max_peers == 20);
    REQUIRE_FALSE(cfg.p2p.enable_direct);
    REQUIRE(cfg.crypto.kdf_iterations == 150000);

    std::filesystem::remove(path);
}

TEST_CASE("Config JSON File", "[base][config]") {
    auto path = write_temp("roomsync_test_config.json", R"({
        "p2p": {
            "ice_servers": [{"url": "turn:relay.example:3478", "username": "u", "credential": "p"}],
            "presence_interval_sec": 5
        },
        "transfer": {"large_tier_yield_ms": 10}
    })");

    Config config;
    REQUIRE(config.load_from_file(path.string()));
    const auto& cfg = config.get();
    REQUIRE(cfg.p2p.ice_servers.size() == 1);
    REQUIRE(cfg.p2p.ice_servers[0].is_turn());
    REQUIRE(cfg.p2p.ice_servers[0].username == "u");
    REQUIRE(cfg.p2p.presence_interval_sec == 5);
    REQUIRE(cfg.transfer.large_tier_yield_ms == 10);

    std::filesystem::remove(path);
}

TEST_CASE("Config Precedence File Env Command Line", "[base][config]") {
    auto path = write_temp("roomsync_precedence.ini",
                           "[node]\n"
                           "identity = from-file\n"
                           "display_name = FileName\n"
                           "[p2p]\n"
                           "signaling_servers = file-host:1\n");

    Config config;
    REQUIRE(config.load_from_file(path.string()));

    setenv("ROOMSYNC_IDENTITY", "from-env", 1);
    setenv("ROOMSYNC_SIGNALING", "env-host:2", 1);
    REQUIRE(config.load_from_env());
    unsetenv("ROOMSYNC_IDENTITY");
    unsetenv("ROOMSYNC_SIGNALING");

    REQUIRE(config.get().node.identity == "from-env");
    REQUIRE(config.get().p2p.signaling_servers == std::vector<std::string>{"env-host:2"});

    CLI::App app;
    config.register_options(app);
    const char* argv[] = {"roomsync", "--identity", "from-cli"};
    app.parse(3, const_cast<char**>(argv));

    REQUIRE(config.get().node.identity == "from-cli");
    REQUIRE(config.get().node.display_name == "FileName");
    REQUIRE(config.get().p2p.signaling_servers == std::vector<std::string>{"env-host:2"});

    std::filesystem::remove(path);
}

TEST_CASE("Config Finalize And Validate", "[base][config]") {
    Config config;
    config.get().p2p.turn_url = "turn:extra.example:3478";
    config.get().p2p.turn_username = "user";
    config.finalize();

    REQUIRE_FALSE(config.get().node.identity.empty());
    REQUIRE(config.get().p2p.ice_servers.size() == 7);
    REQUIRE(config.get().p2p.ice_servers.back().username == "user");

    config.get().p2p.max_peers = 0;
    REQUIRE_FALSE(config.validate());

    Config weak;
    weak.get().crypto.kdf_iterations = 1000;
    REQUIRE_FALSE(weak.validate());

    REQUIRE(split_list(" a, ,b ,c") == std::vector<std::string>{"a", "b", "c"});
}
