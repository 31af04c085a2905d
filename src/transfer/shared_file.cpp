#include "roomsync/transfer/shared_file.h"
#include <fmt/format.h>

namespace roomsync {

std::string to_string(Tier tier) {
    switch (tier) {
        case Tier::Small: return "small";
        case Tier::Medium: return "medium";
        case Tier::Large: return "large";
    }
    return "small";
}

std::optional<Tier> parse_tier(const std::string& name) {
    if (name == "small") return Tier::Small;
    if (name == "medium") return Tier::Medium;
    if (name == "large") return Tier::Large;
    return std::nullopt;
}

Result<Tier> determine_tier(uint64_t size_bytes, Tier requested) {
    if (size_bytes > MAX_FILE_SIZE) {
        return Error(ErrorCode::FileTooLarge,
                     fmt::format("File size {:.1f}MB exceeds maximum of 200MB",
                                 static_cast<double>(size_bytes) / 1024.0 / 1024.0));
    }

    Tier minimal = Tier::Large;
    if (size_bytes <= SMALL_TIER_LIMIT) {
        minimal = Tier::Small;
    } else if (size_bytes <= MEDIUM_TIER_LIMIT) {
        minimal = Tier::Medium;
    }
    return static_cast<int>(requested) > static_cast<int>(minimal) ? requested : minimal;
}

uint32_t SharedFile::chunk_count() const {
    if (auto chunked = std::get_if<ChunkedFilePayload>(&payload)) {
        return chunked->chunk_count;
    }
    return 0;
}

std::string chunk_key(const std::string& file_id, uint32_t index) {
    return file_id + "-" + std::to_string(index);
}

nlohmann::json to_json(const SharedFile& file) {
    nlohmann::json j = {
        {"file_id", file.file_id},
        {"name", file.name},
        {"size", file.size_bytes},
        {"mime_type", file.mime_type},
        {"uploaded_at", file.uploaded_at},
        {"uploaded_by", file.uploaded_by},
        {"owner_id", file.owner_id},
        {"tier", to_string(file.tier)},
        {"sha256", file.sha256},
    };
    if (auto small = std::get_if<SmallFilePayload>(&file.payload)) {
        j["content"] = small->content_base64;
    } else {
        j["chunk_count"] = std::get<ChunkedFilePayload>(file.payload).chunk_count;
    }
    return j;
}

nlohmann::json to_json(const FileChunk& chunk) {
    return nlohmann::json{
        {"file_id", chunk.file_id},
        {"index", chunk.index},
        {"data", chunk.data},
    };
}

std::optional<SharedFile> parse_shared_file(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    auto id = j.find("file_id");
    auto size = j.find("size");
    if (id == j.end() || !id->is_string() || id->get_ref<const std::string&>().empty()) return std::nullopt;
    if (size == j.end() || !size->is_number_unsigned()) return std::nullopt;

    auto content = j.find("content");
    auto chunks = j.find("chunk_count");
    bool has_content = content != j.end() && content->is_string();
    bool has_chunks = chunks != j.end() && chunks->is_number_unsigned();
    if (has_content == has_chunks) return std::nullopt;

    auto tier = parse_tier(j.value("tier", ""));
    if (!tier) return std::nullopt;

    SharedFile file;
    file.file_id = id->get<std::string>();
    file.size_bytes = size->get<uint64_t>();
    file.name = j.value("name", "");
    file.mime_type = j.value("mime_type", "application/octet-stream");
    file.uploaded_at = j.value("uploaded_at", static_cast<uint64_t>(0));
    file.uploaded_by = j.value("uploaded_by", "");
    file.owner_id = j.value("owner_id", "");
    file.sha256 = j.value("sha256", "");
    file.tier = *tier;
    if (has_content) {
        file.payload = SmallFilePayload{content->get<std::string>()};
    } else {
        file.payload = ChunkedFilePayload{chunks->get<uint32_t>()};
    }
    return file;
}

std::optional<FileChunk> parse_file_chunk(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto data = j.find("data");
    auto index = j.find("index");
    if (data == j.end() || !data->is_string()) return std::nullopt;
    if (index == j.end() || !index->is_number_unsigned()) return std::nullopt;

    FileChunk chunk;
    chunk.file_id = j.value("file_id", "");
    chunk.index = index->get<uint32_t>();
    chunk.data = data->get<std::string>();
    return chunk;
}

} // namespace roomsync
