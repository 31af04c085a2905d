#ifndef ROOMSYNC_TRANSFER_FILE_TRANSFER_H
#define ROOMSYNC_TRANSFER_FILE_TRANSFER_H

#include "roomsync/base/config.h"
#include "roomsync/base/encoding.h"
#include "roomsync/base/result.h"
#include "roomsync/control/permission_gate.h"
#include "roomsync/p2p/connection_manager.h"
#include "roomsync/sync/document_store.h"
#include "roomsync/transfer/shared_file.h"
#include <elio/elio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

// Shared cancel flag; copies observe the same state
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool is_cancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

enum class TransferDirection {
    Upload,
    Download
};

struct TransferProgress {
    std::string file_id;
    std::string name;
    TransferDirection direction = TransferDirection::Upload;
    uint32_t chunks_done = 0;
    uint32_t chunks_total = 0;
    double progress_percent = 0.0;
};

struct ShareRequest {
    std::string name;
    Bytes data;
    int64_t size = 0;  // declared size, must match data
    std::string mime_type;
    std::string uploader_name;
    Tier requested_tier = Tier::Small;
};

struct ShareResult {
    std::string file_id;
    Tier requested_tier = Tier::Small;
    Tier actual_tier = Tier::Small;
    uint32_t chunk_count = 0;  // 0 for the inline small form
};

// Stores shared files in a room document: small files inline in the
// shared-files map, medium and large files as base64 chunks in the
// file-chunks map. The document replicates both to every peer.
class FileTransferCoordinator {
public:
    using FilesChangedCallback = std::function<void(const std::vector<SharedFile>& files)>;
    using PeersChangedCallback = std::function<void(const std::vector<Peer>& peers)>;
    using TransferProgressCallback = std::function<void(const TransferProgress& progress)>;

    FileTransferCoordinator(DocumentStore& store, std::string document_id,
                            std::string local_identity, const TransferConfig& config,
                            const PermissionGate* gate = nullptr);
    ~FileTransferCoordinator();

    FileTransferCoordinator(const FileTransferCoordinator&) = delete;
    FileTransferCoordinator& operator=(const FileTransferCoordinator&) = delete;

    // Resolve the document and start observing both maps
    Status initialize();
    bool is_initialized() const;

    const std::string& document_id() const { return document_id_; }
    const std::string& local_identity() const { return local_identity_; }

    elio::coro::task<Result<ShareResult>> share_file(ShareRequest request,
                                                     CancellationToken cancel = {});

    elio::coro::task<Result<Bytes>> download_file(SharedFile file,
                                                  CancellationToken cancel = {});

    // Chunks first, then the metadata entry
    Status remove_file(const std::string& file_id, bool caller_is_admin);
    // Admin status taken from the permission gate
    Status remove_file(const std::string& file_id);

    Status clear_all_files(bool caller_is_admin);
    Status clear_all_files();

    // Newest first
    std::vector<SharedFile> list_files() const;
    std::optional<SharedFile> get_file(const std::string& file_id) const;

    void set_on_files_changed(FilesChangedCallback callback);
    void set_on_peers_changed(PeersChangedCallback callback);
    void set_on_progress(TransferProgressCallback callback);

    // Forwarded from the connection manager's presence updates
    void handle_peers_changed(const std::vector<Peer>& peers);

private:
    bool caller_is_admin() const;
    void notify_files_changed();
    void report_progress(const TransferProgress& progress);

    DocumentStore& store_;
    std::string document_id_;
    std::string local_identity_;
    TransferConfig config_;
    const PermissionGate* gate_;

    std::shared_ptr<ReplicatedDocument> document_;
    uint64_t files_subscription_ = 0;
    uint64_t chunks_subscription_ = 0;

    mutable std::mutex callback_mutex_;
    FilesChangedCallback on_files_changed_;
    PeersChangedCallback on_peers_changed_;
    TransferProgressCallback on_progress_;
};

} // namespace roomsync

#endif // ROOMSYNC_TRANSFER_FILE_TRANSFER_H
