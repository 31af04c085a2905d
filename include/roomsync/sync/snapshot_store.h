#ifndef ROOMSYNC_SYNC_SNAPSHOT_STORE_H
#define ROOMSYNC_SYNC_SNAPSHOT_STORE_H

#include "roomsync/base/encoding.h"
#include <optional>
#include <string>

namespace roomsync {

// Persistence collaborator for encoded document state
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual std::optional<Bytes> load(const std::string& document_id) = 0;
    virtual bool save(const std::string& document_id, const Bytes& state) = 0;
    virtual bool remove(const std::string& document_id) = 0;
};

// One file per document under a directory
class FileSnapshotStore : public SnapshotStore {
public:
    explicit FileSnapshotStore(std::string directory);

    std::optional<Bytes> load(const std::string& document_id) override;
    bool save(const std::string& document_id, const Bytes& state) override;
    bool remove(const std::string& document_id) override;

    std::string path_for(const std::string& document_id) const;

private:
    std::string directory_;
};

} // namespace roomsync

#endif // ROOMSYNC_SYNC_SNAPSHOT_STORE_H
