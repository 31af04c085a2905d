#ifndef ROOMSYNC_SYNC_DOCUMENT_STORE_H
#define ROOMSYNC_SYNC_DOCUMENT_STORE_H

#include "roomsync/base/result.h"
#include "roomsync/sync/replicated_document.h"
#include "roomsync/sync/snapshot_store.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomsync {

// Namespaces used by file sharing
constexpr const char* SHARED_FILES_NAMESPACE = "shared-files";
constexpr const char* FILE_CHUNKS_NAMESPACE = "file-chunks";

// Owns the canonical replicated documents of this process
class DocumentStore {
public:
    explicit DocumentStore(std::shared_ptr<SnapshotStore> snapshots = nullptr);
    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // Document ids: [A-Za-z0-9_\-./]+
    static bool is_valid_document_id(const std::string& document_id);

    // Creates the document on first use
    Result<std::shared_ptr<ReplicatedDocument>> get_document(const std::string& document_id);
    Result<ReplicatedMap> get_map(const std::string& document_id, const std::string& name_space);

    bool has_document(const std::string& document_id) const;
    std::vector<std::string> document_ids() const;
    bool remove_document(const std::string& document_id);

    // Snapshot persistence through the SnapshotStore collaborator
    Status load_snapshot(const std::string& document_id);
    Status save_snapshot(const std::string& document_id);
    Status save_all();

    Result<Bytes> export_state(const std::string& document_id);
    Status import_state(const std::string& document_id, const Bytes& state);

    // Merge the full state of source into target (both must exist)
    Status merge_documents(const std::string& target_id, const std::string& source_id);

private:
    std::shared_ptr<SnapshotStore> snapshots_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ReplicatedDocument>> documents_;
};

} // namespace roomsync

#endif // ROOMSYNC_SYNC_DOCUMENT_STORE_H
