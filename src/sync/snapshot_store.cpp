#include "roomsync/sync/snapshot_store.h"
#include "roomsync/base/logger.h"
#include <filesystem>
#include <fstream>

namespace roomsync {

namespace fs = std::filesystem;

FileSnapshotStore::FileSnapshotStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string FileSnapshotStore::path_for(const std::string& document_id) const {
    // url_encode escapes '/', so ids cannot leave the directory
    return (fs::path(directory_) / ("doc-" + url_encode(document_id) + ".snapshot")).string();
}

std::optional<Bytes> FileSnapshotStore::load(const std::string& document_id) {
    try {
        fs::path path = path_for(document_id);
        if (!fs::exists(path)) {
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            Logger::instance().error("Failed to open snapshot: " + path.string());
            return std::nullopt;
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        Bytes data(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
            Logger::instance().error("Failed to read snapshot: " + path.string());
            return std::nullopt;
        }
        return data;
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to load snapshot: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool FileSnapshotStore::save(const std::string& document_id, const Bytes& state) {
    try {
        fs::path path = path_for(document_id);
        fs::create_directories(path.parent_path());

        // Write to a temp file, then rename over the old snapshot
        fs::path tmp = path;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                Logger::instance().error("Failed to open snapshot for writing: " + tmp.string());
                return false;
            }
            file.write(reinterpret_cast<const char*>(state.data()), static_cast<std::streamsize>(state.size()));
            if (!file) {
                Logger::instance().error("Failed to write snapshot: " + tmp.string());
                return false;
            }
        }
        fs::rename(tmp, path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to save snapshot: " + std::string(e.what()));
        return false;
    }
}

bool FileSnapshotStore::remove(const std::string& document_id) {
    try {
        return fs::remove(path_for(document_id));
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to remove snapshot: " + std::string(e.what()));
        return false;
    }
}

} // namespace roomsync
