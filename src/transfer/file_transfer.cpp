#include "roomsync/transfer/file_transfer.h"
#include "roomsync/base/logger.h"
#include <algorithm>
#include <chrono>

namespace roomsync {

namespace {

constexpr uint32_t LARGE_TIER_YIELD_EVERY = 10;

Status verify_payload(const SharedFile& file, const Bytes& data) {
    if (data.size() != file.size_bytes) {
        return Error(ErrorCode::TransferCorrupted,
                     fmt::format("File {} reassembled to {} bytes, expected {}",
                                 file.name, data.size(), file.size_bytes));
    }
    if (!file.sha256.empty() && sha256_hex(data) != file.sha256) {
        return Error(ErrorCode::TransferCorrupted,
                     fmt::format("File {} failed its SHA256 check", file.name));
    }
    return Status();
}

Error not_initialized() {
    return Error(ErrorCode::InternalError, "File transfer coordinator is not initialized");
}

} // anonymous namespace

FileTransferCoordinator::FileTransferCoordinator(DocumentStore& store, std::string document_id,
                                                 std::string local_identity,
                                                 const TransferConfig& config,
                                                 const PermissionGate* gate)
    : store_(store),
      document_id_(std::move(document_id)),
      local_identity_(std::move(local_identity)),
      config_(config),
      gate_(gate) {}

FileTransferCoordinator::~FileTransferCoordinator() {
    if (document_) {
        document_->unobserve(files_subscription_);
        document_->unobserve(chunks_subscription_);
    }
}

Status FileTransferCoordinator::initialize() {
    if (document_) {
        return Status();
    }

    auto document = store_.get_document(document_id_);
    if (!document) {
        return document.error();
    }
    document_ = *document;

    // A document restored from a snapshot fires one synthetic event per observer
    files_subscription_ = document_->observe(SHARED_FILES_NAMESPACE,
        [this](const MapChangeEvent&) { notify_files_changed(); });
    chunks_subscription_ = document_->observe(FILE_CHUNKS_NAMESPACE,
        [this](const MapChangeEvent&) { notify_files_changed(); });

    Logger::instance().debug("File transfer attached to document {}", document_id_);
    return Status();
}

bool FileTransferCoordinator::is_initialized() const {
    return document_ != nullptr;
}

elio::coro::task<Result<ShareResult>> FileTransferCoordinator::share_file(ShareRequest request,
                                                                          CancellationToken cancel) {
    using ShareOutcome = Result<ShareResult>;
    auto& log = Logger::instance();

    if (!document_) {
        co_return ShareOutcome(not_initialized());
    }
    if (request.data.empty()) {
        co_return ShareOutcome(Error(ErrorCode::InvalidArgument, "Cannot upload empty file"));
    }
    if (request.size <= 0) {
        co_return ShareOutcome(Error(ErrorCode::InvalidArgument, "Invalid file size"));
    }

    auto size = static_cast<uint64_t>(request.size);
    auto tier = determine_tier(size, request.requested_tier);
    if (!tier) {
        co_return ShareOutcome(tier.error());
    }
    if (size != request.data.size()) {
        co_return ShareOutcome(Error(ErrorCode::InvalidArgument,
            fmt::format("Declared size {} does not match the {} bytes provided",
                        size, request.data.size())));
    }

    SharedFile file;
    file.file_id = generate_uuid();
    file.name = request.name;
    file.size_bytes = size;
    if (!request.mime_type.empty()) {
        file.mime_type = request.mime_type;
    }
    file.uploaded_at = now_ms();
    file.uploaded_by = request.uploader_name.empty() ? "Anonymous" : request.uploader_name;
    file.owner_id = local_identity_;
    file.tier = *tier;
    file.sha256 = sha256_hex(request.data);

    if (*tier != request.requested_tier) {
        log.info("File {} ({:.1f}MB) upgraded from {} to {} tier",
                 file.name, static_cast<double>(size) / 1024.0 / 1024.0,
                 to_string(request.requested_tier), to_string(*tier));
    }

    ShareResult result;
    result.file_id = file.file_id;
    result.requested_tier = request.requested_tier;
    result.actual_tier = *tier;

    TransferProgress progress;
    progress.file_id = file.file_id;
    progress.name = file.name;
    progress.direction = TransferDirection::Upload;

    if (*tier == Tier::Small) {
        if (cancel.is_cancelled()) {
            co_return ShareOutcome(Error(ErrorCode::Cancelled, "Upload of " + file.name + " cancelled"));
        }
        file.payload = SmallFilePayload{base64_encode(request.data)};
        document_->set(SHARED_FILES_NAMESPACE, file.file_id, to_json(file));

        progress.chunks_done = 1;
        progress.chunks_total = 1;
        progress.progress_percent = 100.0;
        report_progress(progress);

        log.info("Shared {} inline ({} bytes)", file.name, size);
        co_return ShareOutcome(result);
    }

    uint64_t chunk_count = (size + CHUNK_SIZE - 1) / CHUNK_SIZE;
    if (chunk_count > MAX_CHUNKS) {
        co_return ShareOutcome(Error(ErrorCode::TooManyChunks,
            fmt::format("File would create {} chunks, maximum is {}", chunk_count, MAX_CHUNKS)));
    }
    if (cancel.is_cancelled()) {
        co_return ShareOutcome(Error(ErrorCode::Cancelled, "Upload of " + file.name + " cancelled"));
    }

    auto total = static_cast<uint32_t>(chunk_count);
    file.payload = ChunkedFilePayload{total};
    result.chunk_count = total;
    progress.chunks_total = total;

    // Metadata goes first so readers can detect chunks that have not arrived yet
    document_->set(SHARED_FILES_NAMESPACE, file.file_id, to_json(file));

    for (uint32_t i = 0; i < total; ++i) {
        if (cancel.is_cancelled()) {
            log.info("Upload of {} cancelled after {}/{} chunks", file.name, i, total);
            co_return ShareOutcome(Error(ErrorCode::Cancelled,
                fmt::format("Upload of {} cancelled after {}/{} chunks", file.name, i, total)));
        }

        uint64_t offset = static_cast<uint64_t>(i) * CHUNK_SIZE;
        uint64_t length = std::min(CHUNK_SIZE, size - offset);

        FileChunk chunk;
        chunk.file_id = file.file_id;
        chunk.index = i;
        chunk.data = base64_encode(request.data.data() + offset, static_cast<size_t>(length));
        document_->set(FILE_CHUNKS_NAMESPACE, chunk_key(file.file_id, i), to_json(chunk));

        progress.chunks_done = i + 1;
        progress.progress_percent = static_cast<double>(i + 1) / total * 100.0;
        report_progress(progress);
        log.debug("Uploaded chunk {}/{} of {}", i + 1, total, file.name);

        if (*tier == Tier::Large && (i + 1) % LARGE_TIER_YIELD_EVERY == 0 && i + 1 < total) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(config_.large_tier_yield_ms));
        }
    }

    log.info("Shared {} as {} chunks ({} bytes, {} tier)", file.name, total, size, to_string(*tier));
    co_return ShareOutcome(result);
}

elio::coro::task<Result<Bytes>> FileTransferCoordinator::download_file(SharedFile file,
                                                                       CancellationToken cancel) {
    using DownloadOutcome = Result<Bytes>;
    auto& log = Logger::instance();

    if (!document_) {
        co_return DownloadOutcome(not_initialized());
    }

    TransferProgress progress;
    progress.file_id = file.file_id;
    progress.name = file.name;
    progress.direction = TransferDirection::Download;

    if (auto small = std::get_if<SmallFilePayload>(&file.payload)) {
        auto data = base64_decode(small->content_base64);
        if (!data) {
            co_return DownloadOutcome(Error(ErrorCode::TransferCorrupted,
                "Inline content of " + file.name + " is not valid base64"));
        }
        auto verified = verify_payload(file, *data);
        if (!verified) {
            co_return DownloadOutcome(verified.error());
        }

        progress.chunks_done = 1;
        progress.chunks_total = 1;
        progress.progress_percent = 100.0;
        report_progress(progress);
        co_return DownloadOutcome(std::move(*data));
    }

    uint32_t total = file.chunk_count();
    if (total == 0) {
        co_return DownloadOutcome(Error(ErrorCode::TransferCorrupted,
            "File " + file.name + " declares no chunks"));
    }
    progress.chunks_total = total;

    Bytes data;
    data.reserve(static_cast<size_t>(file.size_bytes));

    for (uint32_t i = 0; i < total; ++i) {
        if (cancel.is_cancelled()) {
            co_return DownloadOutcome(Error(ErrorCode::Cancelled,
                fmt::format("Download of {} cancelled after {}/{} chunks", file.name, i, total)));
        }

        auto stored = document_->get(FILE_CHUNKS_NAMESPACE, chunk_key(file.file_id, i));
        if (!stored) {
            log.warning("Chunk {}/{} of {} is not available", i + 1, total, file.name);
            co_return DownloadOutcome(Error::incomplete_transfer(i, total));
        }

        auto chunk = parse_file_chunk(*stored);
        std::optional<Bytes> decoded;
        if (chunk && chunk->index == i) {
            decoded = base64_decode(chunk->data);
        }
        if (!decoded) {
            log.warning("Chunk {}/{} of {} is unreadable", i + 1, total, file.name);
            co_return DownloadOutcome(Error::incomplete_transfer(i, total));
        }
        data.insert(data.end(), decoded->begin(), decoded->end());

        progress.chunks_done = i + 1;
        progress.progress_percent = static_cast<double>(i + 1) / total * 100.0;
        report_progress(progress);
        log.debug("Downloaded chunk {}/{} of {}", i + 1, total, file.name);

        if (file.tier == Tier::Large && (i + 1) % LARGE_TIER_YIELD_EVERY == 0 && i + 1 < total) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(config_.large_tier_yield_ms));
        }
    }

    auto verified = verify_payload(file, data);
    if (!verified) {
        co_return DownloadOutcome(verified.error());
    }
    co_return DownloadOutcome(std::move(data));
}

Status FileTransferCoordinator::remove_file(const std::string& file_id, bool caller_is_admin) {
    if (!document_) {
        return not_initialized();
    }

    auto file = get_file(file_id);
    if (!file) {
        return Error(ErrorCode::NotFound, "File not found: " + file_id);
    }
    if (!caller_is_admin && file->owner_id != local_identity_) {
        Logger::instance().warning("Refused to remove {}: {} is neither its owner nor an admin",
                                   file->name, local_identity_);
        return Error(ErrorCode::Unauthorized, "Only the file owner or an admin can remove " + file->name);
    }

    uint32_t total = file->chunk_count();
    for (uint32_t i = 0; i < total; ++i) {
        document_->erase(FILE_CHUNKS_NAMESPACE, chunk_key(file_id, i));
    }
    document_->erase(SHARED_FILES_NAMESPACE, file_id);

    Logger::instance().info("Removed file {} ({} chunks)", file->name, total);
    return Status();
}

Status FileTransferCoordinator::remove_file(const std::string& file_id) {
    return remove_file(file_id, caller_is_admin());
}

Status FileTransferCoordinator::clear_all_files(bool caller_is_admin) {
    if (!document_) {
        return not_initialized();
    }
    if (!caller_is_admin) {
        Logger::instance().warning("Refused to clear files: {} is not an admin", local_identity_);
        return Error(ErrorCode::Unauthorized, "Only admins can clear all files");
    }

    size_t chunks = document_->clear(FILE_CHUNKS_NAMESPACE);
    size_t files = document_->clear(SHARED_FILES_NAMESPACE);
    Logger::instance().info("Cleared {} files and {} chunks", files, chunks);
    return Status();
}

Status FileTransferCoordinator::clear_all_files() {
    return clear_all_files(caller_is_admin());
}

std::vector<SharedFile> FileTransferCoordinator::list_files() const {
    std::vector<SharedFile> files;
    if (!document_) {
        return files;
    }

    for (const auto& [key, value] : document_->entries(SHARED_FILES_NAMESPACE)) {
        auto file = parse_shared_file(value);
        if (!file) {
            Logger::instance().debug("Skipping malformed file entry {}", key);
            continue;
        }
        file->is_local = file->owner_id == local_identity_;
        files.push_back(std::move(*file));
    }

    std::sort(files.begin(), files.end(), [](const SharedFile& a, const SharedFile& b) {
        if (a.uploaded_at != b.uploaded_at) {
            return a.uploaded_at > b.uploaded_at;
        }
        return a.file_id < b.file_id;
    });
    return files;
}

std::optional<SharedFile> FileTransferCoordinator::get_file(const std::string& file_id) const {
    if (!document_) {
        return std::nullopt;
    }
    auto value = document_->get(SHARED_FILES_NAMESPACE, file_id);
    if (!value) {
        return std::nullopt;
    }
    auto file = parse_shared_file(*value);
    if (file) {
        file->is_local = file->owner_id == local_identity_;
    }
    return file;
}

void FileTransferCoordinator::set_on_files_changed(FilesChangedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_files_changed_ = std::move(callback);
}

void FileTransferCoordinator::set_on_peers_changed(PeersChangedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_peers_changed_ = std::move(callback);
}

void FileTransferCoordinator::set_on_progress(TransferProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_progress_ = std::move(callback);
}

void FileTransferCoordinator::handle_peers_changed(const std::vector<Peer>& peers) {
    PeersChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_peers_changed_;
    }
    if (callback) {
        callback(peers);
    }
}

bool FileTransferCoordinator::caller_is_admin() const {
    return gate_ != nullptr && gate_->is_admin(local_identity_);
}

void FileTransferCoordinator::notify_files_changed() {
    FilesChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_files_changed_;
    }
    if (callback) {
        callback(list_files());
    }
}

void FileTransferCoordinator::report_progress(const TransferProgress& progress) {
    TransferProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_progress_;
    }
    if (callback) {
        callback(progress);
    }
}

} // namespace roomsync
