#ifndef ROOMSYNC_TRANSFER_SHARED_FILE_H
#define ROOMSYNC_TRANSFER_SHARED_FILE_H

#include "roomsync/base/result.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace roomsync {

constexpr uint64_t SMALL_TIER_LIMIT = 5ull * 1024 * 1024;
constexpr uint64_t MEDIUM_TIER_LIMIT = 50ull * 1024 * 1024;
constexpr uint64_t LARGE_TIER_LIMIT = 200ull * 1024 * 1024;
constexpr uint64_t MAX_FILE_SIZE = LARGE_TIER_LIMIT;
constexpr uint64_t CHUNK_SIZE = 256 * 1024;
constexpr uint32_t MAX_CHUNKS = 1000;

enum class Tier {
    Small,
    Medium,
    Large
};

std::string to_string(Tier tier);
std::optional<Tier> parse_tier(const std::string& name);

// Larger of the requested tier and the smallest tier that fits size
Result<Tier> determine_tier(uint64_t size_bytes, Tier requested);

// Full payload inline, base64
struct SmallFilePayload {
    std::string content_base64;
};

// Payload split into chunk_count entries of the chunk map
struct ChunkedFilePayload {
    uint32_t chunk_count = 0;
};

using FilePayload = std::variant<SmallFilePayload, ChunkedFilePayload>;

struct SharedFile {
    std::string file_id;
    std::string name;
    uint64_t size_bytes = 0;
    std::string mime_type = "application/octet-stream";
    uint64_t uploaded_at = 0;
    std::string uploaded_by;
    std::string owner_id;
    Tier tier = Tier::Small;
    FilePayload payload;
    std::string sha256;  // hex digest of the original bytes

    // Computed at read time, never replicated
    bool is_local = false;

    bool is_chunked() const { return std::holds_alternative<ChunkedFilePayload>(payload); }
    uint32_t chunk_count() const;
};

struct FileChunk {
    std::string file_id;
    uint32_t index = 0;
    std::string data;  // base64
};

// "{file_id}-{index}"
std::string chunk_key(const std::string& file_id, uint32_t index);

nlohmann::json to_json(const SharedFile& file);
nlohmann::json to_json(const FileChunk& chunk);

// nullopt when required fields are missing or both/neither payload forms are present
std::optional<SharedFile> parse_shared_file(const nlohmann::json& j);
std::optional<FileChunk> parse_file_chunk(const nlohmann::json& j);

} // namespace roomsync

#endif // ROOMSYNC_TRANSFER_SHARED_FILE_H
