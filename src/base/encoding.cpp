#include "roomsync/base/encoding.h"
#include <elio/hash/sha256.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <stdexcept>

namespace roomsync {

std::string base64_encode(const uint8_t* data, size_t size) {
    if (size == 0) return {};
    // EVP_EncodeBlock appends a NUL terminator
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                  static_cast<int>(size));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<Bytes> base64_decode(const std::string& text) {
    if (text.empty()) return Bytes{};
    if (text.size() % 4 != 0) return std::nullopt;

    Bytes out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string to_hex(const uint8_t* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    auto digest = elio::hash::sha256(data, size);
    return elio::hash::sha256_hex(digest);
}

std::string sha256_hex(const Bytes& data) {
    return sha256_hex(data.data(), data.size());
}

std::string generate_uuid() {
    uint8_t b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);

    std::string hex = to_hex(b, sizeof(b));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

uint64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (c == '+') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace roomsync
