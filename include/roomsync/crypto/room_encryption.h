#ifndef ROOMSYNC_CRYPTO_ROOM_ENCRYPTION_H
#define ROOMSYNC_CRYPTO_ROOM_ENCRYPTION_H

#include "roomsync/base/config.h"
#include "roomsync/base/encoding.h"
#include "roomsync/base/result.h"
#include <elio/elio.hpp>
#include <array>
#include <memory>
#include <string>

namespace roomsync {

// Envelope layout: [12-byte nonce][ciphertext][16-byte GCM tag]
constexpr size_t ENVELOPE_NONCE_SIZE = 12;
constexpr size_t ENVELOPE_TAG_SIZE = 16;
constexpr size_t ROOM_KEY_SIZE = 32;
constexpr size_t ROOM_SALT_SIZE = 16;
constexpr uint32_t MIN_KDF_ITERATIONS = 100000;

// First byte of an unencrypted document delta
constexpr uint8_t UNENCRYPTED_UPDATE_MARKER = 0x00;

// Derived AES-256 key. The key material never leaves this object and is
// wiped on destruction.
class RoomKey {
public:
    ~RoomKey();

    RoomKey(const RoomKey&) = delete;
    RoomKey& operator=(const RoomKey&) = delete;

    // Identifies the key without revealing it (hex of a keyed digest prefix)
    const std::string& fingerprint() const { return fingerprint_; }

private:
    friend class RoomEncryption;

    explicit RoomKey(const std::array<uint8_t, ROOM_KEY_SIZE>& bytes);

    std::array<uint8_t, ROOM_KEY_SIZE> bytes_{};
    std::string fingerprint_;
};

using RoomKeyPtr = std::shared_ptr<const RoomKey>;

struct RoomEncryptionState {
    bool enabled = false;
    bool has_key = false;
    std::string key_fingerprint;
};

class RoomEncryption {
public:
    explicit RoomEncryption(const CryptoConfig& config);
    ~RoomEncryption();

    RoomEncryption(const RoomEncryption&) = delete;
    RoomEncryption& operator=(const RoomEncryption&) = delete;

    // PBKDF2-HMAC-SHA256 over the room-derived salt; cached per (room, password hash)
    Result<RoomKeyPtr> derive_room_key(const std::string& room_id, const std::string& password);

    // AES-256-GCM with a fresh random nonce per call
    Result<Bytes> encrypt(const Bytes& plaintext, const RoomKey& key) const;
    Result<Bytes> decrypt(const Bytes& envelope, const RoomKey& key) const;

    // Structural dispatch check only: length > nonce size and non-marker first byte
    static bool is_encrypted_envelope(const uint8_t* data, size_t size);
    static bool is_encrypted_envelope(const Bytes& data) {
        return is_encrypted_envelope(data.data(), data.size());
    }

    // Derives the key and enables encryption for the room
    elio::coro::task<Status> initialize_room_encryption(std::string room_id, std::string password);
    void disable_room_encryption(const std::string& room_id);
    bool is_room_encryption_ready(const std::string& room_id) const;
    RoomEncryptionState encryption_state(const std::string& room_id) const;

    // Pass data through unchanged when the room has no encryption enabled
    Result<Bytes> encrypt_room_message(const std::string& room_id, const Bytes& data) const;
    Result<Bytes> decrypt_room_message(const std::string& room_id, const Bytes& data) const;

    bool allow_plaintext_fallback() const;

    size_t cached_key_count() const;
    void clear_key_cache();

    // Salt derived from the room id: right-padded with '0' and cut to 16 bytes
    static std::string room_salt(const std::string& room_id);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace roomsync

#endif // ROOMSYNC_CRYPTO_ROOM_ENCRYPTION_H
