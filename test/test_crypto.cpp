#include <catch2/catch_test_macros.hpp>
#include <elio/elio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "roomsync/base/config.h"
#include "roomsync/crypto/room_encryption.h"
#include "roomsync/sync/replicated_document.h"

using namespace roomsync;

namespace {

Bytes make_payload(size_t size) {
    Bytes data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

struct KdfRace {
    std::atomic<bool> ready{false};
    std::atomic<bool> ok{false};
    std::atomic<int> merges{0};
    std::atomic<int> merges_while_deriving{0};
    std::atomic<bool> stop{false};
};

elio::coro::task<void> initialize(RoomEncryption& encryption, std::shared_ptr<KdfRace> race) {
    auto status = co_await encryption.initialize_room_encryption("slow-room", "pw");
    race->ok = status.ok();
    race->ready = true;
}

elio::coro::task<void> keep_merging(std::shared_ptr<ReplicatedDocument> document, Bytes delta,
                                    std::shared_ptr<KdfRace> race) {
    while (!race->stop) {
        if (document->apply_update(delta).ok()) {
            race->merges++;
            if (!race->ready) race->merges_while_deriving++;
        }
        co_await elio::time::sleep_for(std::chrono::milliseconds(5));
    }
}

} // anonymous namespace

TEST_CASE("Room Key Derivation Is Deterministic", "[crypto][kdf]") {
    // Two independent services stand in for two peers
    RoomEncryption alice(CryptoConfig{});
    RoomEncryption bob(CryptoConfig{});

    auto a = alice.derive_room_key("room-42", "secret");
    auto b = bob.derive_room_key("room-42", "secret");
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    REQUIRE((*a)->fingerprint() == (*b)->fingerprint());

    auto other_password = bob.derive_room_key("room-42", "Secret");
    auto other_room = bob.derive_room_key("room-43", "secret");
    REQUIRE((*other_password)->fingerprint() != (*a)->fingerprint());
    REQUIRE((*other_room)->fingerprint() != (*a)->fingerprint());

    REQUIRE(alice.derive_room_key("", "secret").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Room Salt Padding", "[crypto][kdf]") {
    REQUIRE(RoomEncryption::room_salt("abc") == "abc0000000000000");
    REQUIRE(RoomEncryption::room_salt("a-very-long-room-identifier") == "a-very-long-room");
    REQUIRE(RoomEncryption::room_salt("").size() == ROOM_SALT_SIZE);
}

TEST_CASE("Encryption Round Trip", "[crypto][aead]") {
    RoomEncryption encryption(CryptoConfig{});
    auto key = encryption.derive_room_key("room-42", "secret");
    REQUIRE(key.ok());

    for (size_t size : {size_t(0), size_t(1), size_t(12), size_t(1000), size_t(65536), size_t(1024 * 1024)}) {
        INFO("Payload size: " << size);
        auto plaintext = make_payload(size);
        auto envelope = encryption.encrypt(plaintext, **key);
        REQUIRE(envelope.ok());
        REQUIRE(envelope->size() == size + ENVELOPE_NONCE_SIZE + ENVELOPE_TAG_SIZE);
        REQUIRE(RoomEncryption::is_encrypted_envelope(*envelope));

        auto decrypted = encryption.decrypt(*envelope, **key);
        REQUIRE(decrypted.ok());
        REQUIRE(*decrypted == plaintext);
    }
}

TEST_CASE("Fresh Nonce Per Message", "[crypto][aead]") {
    RoomEncryption encryption(CryptoConfig{});
    auto key = encryption.derive_room_key("room-42", "secret");
    auto plaintext = make_payload(64);

    auto first = encryption.encrypt(plaintext, **key);
    auto second = encryption.encrypt(plaintext, **key);
    REQUIRE(*first != *second);
    REQUIRE(Bytes(first->begin(), first->begin() + ENVELOPE_NONCE_SIZE) !=
            Bytes(second->begin(), second->begin() + ENVELOPE_NONCE_SIZE));
}

TEST_CASE("Wrong Key Fails To Decrypt", "[crypto][aead]") {
    RoomEncryption encryption(CryptoConfig{});
    auto right = encryption.derive_room_key("room-42", "secret");
    auto wrong = encryption.derive_room_key("room-42", "guess");

    auto envelope = encryption.encrypt(make_payload(4096), **right);
    auto decrypted = encryption.decrypt(*envelope, **wrong);
    REQUIRE_FALSE(decrypted.ok());
    REQUIRE(decrypted.error().code == ErrorCode::DecryptFailed);
}

TEST_CASE("Tampered Envelope Fails To Decrypt", "[crypto][aead]") {
    RoomEncryption encryption(CryptoConfig{});
    auto key = encryption.derive_room_key("room-42", "secret");
    auto envelope = encryption.encrypt(make_payload(100), **key);

    Bytes tampered = *envelope;
    tampered[ENVELOPE_NONCE_SIZE + 5] ^= 0x01;
    REQUIRE(encryption.decrypt(tampered, **key).error().code == ErrorCode::DecryptFailed);

    Bytes truncated(envelope->begin(), envelope->begin() + 8);
    REQUIRE(encryption.decrypt(truncated, **key).error().code == ErrorCode::DecryptFailed);
}

TEST_CASE("Envelope Detection Is Structural", "[crypto][envelope]") {
    REQUIRE_FALSE(RoomEncryption::is_encrypted_envelope(Bytes(12, 0x55)));
    REQUIRE_FALSE(RoomEncryption::is_encrypted_envelope(Bytes{}));

    Bytes marked(40, 0x55);
    marked[0] = UNENCRYPTED_UPDATE_MARKER;
    REQUIRE_FALSE(RoomEncryption::is_encrypted_envelope(marked));

    marked[0] = 0x01;
    REQUIRE(RoomEncryption::is_encrypted_envelope(marked));
}

TEST_CASE("Room Encryption Lifecycle", "[crypto][room]") {
    RoomEncryption encryption(CryptoConfig{});
    REQUIRE_FALSE(encryption.is_room_encryption_ready("room-1"));

    // Rooms without encryption pass data through
    Bytes update = {0x00, 0x01, 0x02};
    auto passthrough = encryption.encrypt_room_message("room-1", update);
    REQUIRE(*passthrough == update);

    Status ready = Error(ErrorCode::InternalError, "not run");
    elio::run([&]() -> elio::coro::task<void> {
        ready = co_await encryption.initialize_room_encryption("room-1", "pw");
    }());
    REQUIRE(ready.ok());
    REQUIRE(encryption.is_room_encryption_ready("room-1"));

    auto state = encryption.encryption_state("room-1");
    REQUIRE(state.enabled);
    REQUIRE(state.has_key);
    REQUIRE_FALSE(state.key_fingerprint.empty());

    auto sealed = encryption.encrypt_room_message("room-1", update);
    REQUIRE(sealed.ok());
    REQUIRE(*sealed != update);
    REQUIRE(*encryption.decrypt_room_message("room-1", *sealed) == update);

    // Plaintext is refused in an encrypted room unless fallback is configured
    auto refused = encryption.decrypt_room_message("room-1", update);
    REQUIRE(refused.error().code == ErrorCode::DecryptFailed);

    encryption.disable_room_encryption("room-1");
    REQUIRE_FALSE(encryption.is_room_encryption_ready("room-1"));
}

TEST_CASE("Plaintext Fallback When Configured", "[crypto][room]") {
    CryptoConfig config;
    config.allow_plaintext_fallback = true;
    RoomEncryption encryption(config);
    REQUIRE(encryption.allow_plaintext_fallback());

    elio::run([&]() -> elio::coro::task<void> {
        co_await encryption.initialize_room_encryption("room-2", "pw");
    }());

    Bytes update = {0x00, 0x10, 0x20};
    auto accepted = encryption.decrypt_room_message("room-2", update);
    REQUIRE(accepted.ok());
    REQUIRE(*accepted == update);
}

TEST_CASE("Derived Key Cache Is Bounded", "[crypto][cache]") {
    CryptoConfig config;
    config.max_cached_keys = 2;
    RoomEncryption encryption(config);

    encryption.derive_room_key("a", "pw");
    encryption.derive_room_key("b", "pw");
    encryption.derive_room_key("c", "pw");
    REQUIRE(encryption.cached_key_count() == 2);

    encryption.clear_key_cache();
    REQUIRE(encryption.cached_key_count() == 0);
}

TEST_CASE("Key Derivation Leaves The Worker Free", "[crypto][kdf]") {
    CryptoConfig config;
    config.kdf_iterations = 2000000;
    RoomEncryption encryption(config);

    auto source = std::make_shared<ReplicatedDocument>("slow-room", 1);
    source->set("notes", "a", "b");
    auto document = std::make_shared<ReplicatedDocument>("slow-room", 2);

    // A single worker: merges only advance if initialization yields it
    auto scheduler = std::make_shared<elio::runtime::scheduler>(1);
    scheduler->start();
    auto race = std::make_shared<KdfRace>();
    scheduler->spawn(initialize(encryption, race).release());
    scheduler->spawn(keep_merging(document, source->encode_state_as_update(), race).release());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
    while (!race->ready && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    race->stop = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    scheduler->shutdown();

    REQUIRE(race->ready);
    REQUIRE(race->ok);
    REQUIRE(race->merges_while_deriving > 0);
    REQUIRE(document->get("notes", "a") == nlohmann::json("b"));
    REQUIRE(encryption.is_room_encryption_ready("slow-room"));
}
