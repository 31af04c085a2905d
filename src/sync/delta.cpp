#include "roomsync/sync/delta.h"
#include <arpa/inet.h>
#include <endian.h>
#include <cstring>
#include <map>

namespace roomsync {

namespace {

constexpr uint32_t MAX_NAME_SIZE = 1024;
constexpr uint32_t MAX_KEY_SIZE = 4096;

void write_u8(Bytes& out, uint8_t v) {
    out.push_back(v);
}

void write_u32(Bytes& out, uint32_t v) {
    uint32_t be = htonl(v);
    const auto* p = reinterpret_cast<const uint8_t*>(&be);
    out.insert(out.end(), p, p + 4);
}

void write_u64(Bytes& out, uint64_t v) {
    uint64_t be = htobe64(v);
    const auto* p = reinterpret_cast<const uint8_t*>(&be);
    out.insert(out.end(), p, p + 8);
}

void write_str(Bytes& out, const std::string& s) {
    write_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool u8(uint8_t& v) {
        if (!need(1)) return false;
        v = data_[offset_++];
        return true;
    }

    bool u32(uint32_t& v) {
        if (!need(4)) return false;
        std::memcpy(&v, data_ + offset_, 4);
        v = ntohl(v);
        offset_ += 4;
        return true;
    }

    bool u64(uint64_t& v) {
        if (!need(8)) return false;
        std::memcpy(&v, data_ + offset_, 8);
        v = be64toh(v);
        offset_ += 8;
        return true;
    }

    bool str(std::string& s, uint32_t max_size) {
        uint32_t len = 0;
        if (!u32(len) || len > max_size || !need(len)) return false;
        s.assign(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return true;
    }

    bool bytes(const uint8_t*& p, uint32_t len) {
        if (!need(len)) return false;
        p = data_ + offset_;
        offset_ += len;
        return true;
    }

    bool at_end() const { return offset_ == size_; }

private:
    bool need(size_t n) const { return size_ - offset_ >= n; }

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

Error malformed(const std::string& what) {
    return Error(ErrorCode::MalformedDelta, what);
}

} // anonymous namespace

Bytes encode_delta(const std::vector<DeltaEntry>& entries) {
    // Group by namespace, keeping entry order inside each group
    std::map<std::string, std::vector<const DeltaEntry*>> grouped;
    for (const auto& entry : entries) {
        grouped[entry.name_space].push_back(&entry);
    }

    Bytes out;
    write_u8(out, DELTA_MARKER);
    write_u8(out, DELTA_FORMAT_VERSION);
    write_u32(out, static_cast<uint32_t>(grouped.size()));

    for (const auto& [name, group] : grouped) {
        write_str(out, name);
        write_u32(out, static_cast<uint32_t>(group.size()));
        for (const DeltaEntry* entry : group) {
            write_str(out, entry->key);
            write_u64(out, entry->version.clock);
            write_u64(out, entry->version.client);
            if (entry->is_tombstone()) {
                write_u8(out, DELTA_FLAG_TOMBSTONE);
                write_u32(out, 0);
            } else {
                write_u8(out, 0);
                Bytes cbor = nlohmann::json::to_cbor(*entry->value);
                write_u32(out, static_cast<uint32_t>(cbor.size()));
                out.insert(out.end(), cbor.begin(), cbor.end());
            }
        }
    }
    return out;
}

Result<std::vector<DeltaEntry>> decode_delta(const uint8_t* data, size_t size) {
    Reader reader(data, size);

    uint8_t marker = 0;
    uint8_t version = 0;
    if (!reader.u8(marker) || marker != DELTA_MARKER) {
        return malformed("missing update marker");
    }
    if (!reader.u8(version) || version != DELTA_FORMAT_VERSION) {
        return malformed("unsupported delta version " + std::to_string(version));
    }

    uint32_t ns_count = 0;
    if (!reader.u32(ns_count)) {
        return malformed("truncated header");
    }

    std::vector<DeltaEntry> entries;
    for (uint32_t n = 0; n < ns_count; ++n) {
        std::string name;
        uint32_t entry_count = 0;
        if (!reader.str(name, MAX_NAME_SIZE) || !reader.u32(entry_count)) {
            return malformed("truncated namespace header");
        }

        for (uint32_t i = 0; i < entry_count; ++i) {
            DeltaEntry entry;
            entry.name_space = name;
            uint8_t flags = 0;
            uint32_t value_len = 0;
            if (!reader.str(entry.key, MAX_KEY_SIZE) ||
                !reader.u64(entry.version.clock) ||
                !reader.u64(entry.version.client) ||
                !reader.u8(flags) ||
                !reader.u32(value_len)) {
                return malformed("truncated entry in namespace " + name);
            }

            const uint8_t* value_ptr = nullptr;
            if (!reader.bytes(value_ptr, value_len)) {
                return malformed("truncated value for key " + entry.key);
            }

            if ((flags & DELTA_FLAG_TOMBSTONE) == 0) {
                try {
                    entry.value = nlohmann::json::from_cbor(value_ptr, value_ptr + value_len);
                } catch (const nlohmann::json::exception& e) {
                    return malformed("invalid value for key " + entry.key + ": " + e.what());
                }
            }
            entries.push_back(std::move(entry));
        }
    }

    if (!reader.at_end()) {
        return malformed("trailing bytes after delta");
    }
    return entries;
}

} // namespace roomsync
