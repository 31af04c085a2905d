#ifndef ROOMSYNC_BASE_ENCODING_H
#define ROOMSYNC_BASE_ENCODING_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

using Bytes = std::vector<uint8_t>;

// Binary-safe text encoding for replicated-map storage
std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const Bytes& data);
std::optional<Bytes> base64_decode(const std::string& text);

std::string to_hex(const uint8_t* data, size_t size);

// SHA256 of data as lowercase hex
std::string sha256_hex(const uint8_t* data, size_t size);
std::string sha256_hex(const Bytes& data);

// Random RFC 4122 version 4 identifier
std::string generate_uuid();

// Milliseconds since the Unix epoch
uint64_t now_ms();

// Percent-encoding for URL query values
std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

} // namespace roomsync

#endif // ROOMSYNC_BASE_ENCODING_H
