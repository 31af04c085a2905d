#ifndef ROOMSYNC_SYNC_DELTA_H
#define ROOMSYNC_SYNC_DELTA_H

#include "roomsync/base/encoding.h"
#include "roomsync/base/result.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

constexpr uint8_t DELTA_MARKER = 0x00;
constexpr uint8_t DELTA_FORMAT_VERSION = 1;
constexpr uint8_t DELTA_FLAG_TOMBSTONE = 0x01;

// Lamport clock plus writer id; the greater pair wins a key
struct EntryVersion {
    uint64_t clock = 0;
    uint64_t client = 0;

    bool operator<(const EntryVersion& other) const {
        return clock != other.clock ? clock < other.clock : client < other.client;
    }
    bool operator==(const EntryVersion& other) const {
        return clock == other.clock && client == other.client;
    }
    bool operator!=(const EntryVersion& other) const { return !(*this == other); }
};

// One versioned write; an empty value is a delete
struct DeltaEntry {
    std::string name_space;
    std::string key;
    EntryVersion version;
    std::optional<nlohmann::json> value;

    bool is_tombstone() const { return !value.has_value(); }
};

// Wire format (big-endian):
//   u8 marker(0) | u8 version | u32 namespace_count
//   per namespace: str name | u32 entry_count
//   per entry: str key | u64 clock | u64 client | u8 flags | u32 len | CBOR value
// where str is u32 length followed by bytes.
Bytes encode_delta(const std::vector<DeltaEntry>& entries);
Result<std::vector<DeltaEntry>> decode_delta(const uint8_t* data, size_t size);
inline Result<std::vector<DeltaEntry>> decode_delta(const Bytes& data) {
    return decode_delta(data.data(), data.size());
}

} // namespace roomsync

#endif // ROOMSYNC_SYNC_DELTA_H
