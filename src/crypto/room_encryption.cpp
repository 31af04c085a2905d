#include "roomsync/crypto/room_encryption.h"
#include "roomsync/base/blocking.h"
#include "roomsync/base/logger.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <list>
#include <mutex>
#include <unordered_map>

namespace roomsync {

namespace {

std::string password_hash_prefix(const std::string& password) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(password.data()), password.size(), hash);
    return to_hex(hash, sizeof(hash)).substr(0, 16);
}

struct CipherCtx {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    ~CipherCtx() { EVP_CIPHER_CTX_free(ctx); }
};

} // anonymous namespace

RoomKey::RoomKey(const std::array<uint8_t, ROOM_KEY_SIZE>& bytes) : bytes_(bytes) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    static const char label[] = "roomsync-key-fingerprint";
    HMAC(EVP_sha256(), bytes_.data(), static_cast<int>(bytes_.size()),
         reinterpret_cast<const unsigned char*>(label), sizeof(label) - 1, digest, &len);
    fingerprint_ = to_hex(digest, 4);
}

RoomKey::~RoomKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

struct RoomEncryption::Impl {
    CryptoConfig config;

    // Derived-key cache, most recently used at front
    mutable std::mutex cache_mutex;
    std::list<std::string> lru_list;
    std::unordered_map<std::string, std::pair<RoomKeyPtr, std::list<std::string>::iterator>> key_cache;

    // Per-room state
    struct RoomState {
        bool enabled = false;
        RoomKeyPtr key;
    };
    mutable std::mutex rooms_mutex;
    std::unordered_map<std::string, RoomState> rooms;

    explicit Impl(const CryptoConfig& cfg) : config(cfg) {
        config.kdf_iterations = std::max(config.kdf_iterations, MIN_KDF_ITERATIONS);
    }

    RoomKeyPtr cache_get(const std::string& cache_key) {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = key_cache.find(cache_key);
        if (it == key_cache.end()) return nullptr;
        lru_list.erase(it->second.second);
        lru_list.push_front(cache_key);
        it->second.second = lru_list.begin();
        return it->second.first;
    }

    void cache_put(const std::string& cache_key, RoomKeyPtr key) {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = key_cache.find(cache_key);
        if (it != key_cache.end()) {
            lru_list.erase(it->second.second);
            key_cache.erase(it);
        }
        lru_list.push_front(cache_key);
        key_cache[cache_key] = {std::move(key), lru_list.begin()};

        while (key_cache.size() > std::max<uint32_t>(config.max_cached_keys, 1)) {
            const std::string& oldest = lru_list.back();
            Logger::instance().debug("Evicting cached room key: " + oldest.substr(0, oldest.find(':')));
            key_cache.erase(oldest);
            lru_list.pop_back();
        }
    }

    RoomState state_of(const std::string& room_id) const {
        std::lock_guard<std::mutex> lock(rooms_mutex);
        auto it = rooms.find(room_id);
        return it == rooms.end() ? RoomState{} : it->second;
    }
};

RoomEncryption::RoomEncryption(const CryptoConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

RoomEncryption::~RoomEncryption() = default;

std::string RoomEncryption::room_salt(const std::string& room_id) {
    std::string salt = room_id;
    if (salt.size() < ROOM_SALT_SIZE) {
        salt.append(ROOM_SALT_SIZE - salt.size(), '0');
    }
    return salt.substr(0, ROOM_SALT_SIZE);
}

Result<RoomKeyPtr> RoomEncryption::derive_room_key(const std::string& room_id,
                                                   const std::string& password) {
    if (room_id.empty()) {
        return Error(ErrorCode::InvalidArgument, "Room id must not be empty");
    }

    std::string cache_key = room_id + ":" + password_hash_prefix(password);
    if (auto cached = impl_->cache_get(cache_key)) {
        return cached;
    }

    std::string salt = room_salt(room_id);
    std::array<uint8_t, ROOM_KEY_SIZE> bytes{};
    int rc = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               reinterpret_cast<const unsigned char*>(salt.data()),
                               static_cast<int>(salt.size()),
                               static_cast<int>(impl_->config.kdf_iterations), EVP_sha256(),
                               static_cast<int>(bytes.size()), bytes.data());
    if (rc != 1) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        return Error(ErrorCode::KeyDerivationFailed, "PBKDF2 failed for room " + room_id);
    }

    RoomKeyPtr key(new RoomKey(bytes));
    OPENSSL_cleanse(bytes.data(), bytes.size());

    impl_->cache_put(cache_key, key);
    Logger::instance().debug("Derived room key for " + room_id + " (" + key->fingerprint() + ")");
    return key;
}

Result<Bytes> RoomEncryption::encrypt(const Bytes& plaintext, const RoomKey& key) const {
    Bytes envelope(ENVELOPE_NONCE_SIZE + plaintext.size() + ENVELOPE_TAG_SIZE);
    uint8_t* nonce = envelope.data();

    if (RAND_bytes(nonce, static_cast<int>(ENVELOPE_NONCE_SIZE)) != 1) {
        return Error(ErrorCode::EncryptFailed, "Random nonce generation failed");
    }
    // A zero first byte would read as an unencrypted update
    while (nonce[0] == UNENCRYPTED_UPDATE_MARKER) {
        if (RAND_bytes(nonce, 1) != 1) {
            return Error(ErrorCode::EncryptFailed, "Random nonce generation failed");
        }
    }

    CipherCtx c;
    int len = 0;
    if (!c.ctx ||
        EVP_EncryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(ENVELOPE_NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(c.ctx, nullptr, nullptr, key.bytes_.data(), nonce) != 1) {
        return Error(ErrorCode::EncryptFailed, "Cipher initialization failed");
    }

    uint8_t* out = envelope.data() + ENVELOPE_NONCE_SIZE;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(c.ctx, out, &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return Error(ErrorCode::EncryptFailed, "Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(c.ctx, out + len, &final_len) != 1) {
        return Error(ErrorCode::EncryptFailed, "Encryption finalization failed");
    }

    uint8_t* tag = envelope.data() + ENVELOPE_NONCE_SIZE + plaintext.size();
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(ENVELOPE_TAG_SIZE), tag) != 1) {
        return Error(ErrorCode::EncryptFailed, "Failed to read authentication tag");
    }
    return envelope;
}

Result<Bytes> RoomEncryption::decrypt(const Bytes& envelope, const RoomKey& key) const {
    if (envelope.size() < ENVELOPE_NONCE_SIZE + ENVELOPE_TAG_SIZE) {
        return Error(ErrorCode::DecryptFailed, "Envelope too short");
    }

    const uint8_t* nonce = envelope.data();
    const uint8_t* ciphertext = envelope.data() + ENVELOPE_NONCE_SIZE;
    size_t ciphertext_size = envelope.size() - ENVELOPE_NONCE_SIZE - ENVELOPE_TAG_SIZE;
    Bytes tag(envelope.end() - ENVELOPE_TAG_SIZE, envelope.end());

    CipherCtx c;
    if (!c.ctx ||
        EVP_DecryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(ENVELOPE_NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(c.ctx, nullptr, nullptr, key.bytes_.data(), nonce) != 1) {
        return Error(ErrorCode::DecryptFailed, "Cipher initialization failed");
    }

    // Spare room keeps data() valid for an empty message
    Bytes plaintext(ciphertext_size + ENVELOPE_TAG_SIZE);
    int len = 0;
    if (ciphertext_size > 0 &&
        EVP_DecryptUpdate(c.ctx, plaintext.data(), &len, ciphertext, static_cast<int>(ciphertext_size)) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return Error(ErrorCode::DecryptFailed, "Decryption failed - wrong key?");
    }
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(ENVELOPE_TAG_SIZE), tag.data()) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return Error(ErrorCode::DecryptFailed, "Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(c.ctx, plaintext.data() + len, &final_len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return Error(ErrorCode::DecryptFailed, "Decryption failed - wrong key?");
    }
    plaintext.resize(ciphertext_size);
    return plaintext;
}

bool RoomEncryption::is_encrypted_envelope(const uint8_t* data, size_t size) {
    return size > ENVELOPE_NONCE_SIZE && data[0] != UNENCRYPTED_UPDATE_MARKER;
}

elio::coro::task<Status> RoomEncryption::initialize_room_encryption(std::string room_id,
                                                                    std::string password) {
    Logger::instance().info("Initializing encryption for room " + room_id);

    // PBKDF2 is slow on purpose; keep it off the worker
    auto key = co_await run_blocking([this, &room_id, &password] { return derive_room_key(room_id, password); });
    OPENSSL_cleanse(password.data(), password.size());
    if (!key) {
        Logger::instance().error("Failed to initialize room encryption: " + key.error().to_string());
        co_return Status(key.error());
    }

    {
        std::lock_guard<std::mutex> lock(impl_->rooms_mutex);
        auto& state = impl_->rooms[room_id];
        state.enabled = true;
        state.key = *key;
    }

    Logger::instance().info("Room encryption ready for " + room_id + " (key " + (*key)->fingerprint() + ")");
    co_return Status{};
}

void RoomEncryption::disable_room_encryption(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(impl_->rooms_mutex);
    if (impl_->rooms.erase(room_id) > 0) {
        Logger::instance().info("Room encryption disabled for " + room_id);
    }
}

bool RoomEncryption::is_room_encryption_ready(const std::string& room_id) const {
    auto state = impl_->state_of(room_id);
    return state.enabled && state.key != nullptr;
}

RoomEncryptionState RoomEncryption::encryption_state(const std::string& room_id) const {
    auto state = impl_->state_of(room_id);
    RoomEncryptionState result;
    result.enabled = state.enabled;
    result.has_key = state.key != nullptr;
    if (state.key) result.key_fingerprint = state.key->fingerprint();
    return result;
}

Result<Bytes> RoomEncryption::encrypt_room_message(const std::string& room_id, const Bytes& data) const {
    auto state = impl_->state_of(room_id);
    if (!state.enabled || !state.key) {
        return data;
    }
    return encrypt(data, *state.key);
}

Result<Bytes> RoomEncryption::decrypt_room_message(const std::string& room_id, const Bytes& data) const {
    auto state = impl_->state_of(room_id);
    if (!state.enabled || !state.key) {
        return data;
    }

    if (!is_encrypted_envelope(data)) {
        if (impl_->config.allow_plaintext_fallback) {
            Logger::instance().warning("Accepting unencrypted update in encrypted room " + room_id);
            return data;
        }
        return Error(ErrorCode::DecryptFailed, "Unencrypted update in encrypted room " + room_id);
    }
    return decrypt(data, *state.key);
}

bool RoomEncryption::allow_plaintext_fallback() const {
    return impl_->config.allow_plaintext_fallback;
}

size_t RoomEncryption::cached_key_count() const {
    std::lock_guard<std::mutex> lock(impl_->cache_mutex);
    return impl_->key_cache.size();
}

void RoomEncryption::clear_key_cache() {
    std::lock_guard<std::mutex> lock(impl_->cache_mutex);
    impl_->key_cache.clear();
    impl_->lru_list.clear();
}

} // namespace roomsync
