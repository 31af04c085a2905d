#include "roomsync/sync/document_store.h"
#include "roomsync/base/logger.h"
#include <cctype>

namespace roomsync {

DocumentStore::DocumentStore(std::shared_ptr<SnapshotStore> snapshots)
    : snapshots_(std::move(snapshots)) {}

DocumentStore::~DocumentStore() = default;

bool DocumentStore::is_valid_document_id(const std::string& document_id) {
    if (document_id.empty()) return false;
    for (unsigned char c : document_id) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.' && c != '/') {
            return false;
        }
    }
    return true;
}

Result<std::shared_ptr<ReplicatedDocument>> DocumentStore::get_document(const std::string& document_id) {
    if (!is_valid_document_id(document_id)) {
        return Error(ErrorCode::InvalidArgument, "Invalid document id: " + document_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it != documents_.end()) {
        return it->second;
    }

    auto doc = std::make_shared<ReplicatedDocument>(document_id);
    documents_[document_id] = doc;
    Logger::instance().debug("Created document " + document_id);
    return doc;
}

Result<ReplicatedMap> DocumentStore::get_map(const std::string& document_id, const std::string& name_space) {
    auto doc = get_document(document_id);
    if (!doc) {
        return doc.error();
    }
    return (*doc)->get_map(name_space);
}

bool DocumentStore::has_document(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.count(document_id) > 0;
}

std::vector<std::string> DocumentStore::document_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(documents_.size());
    for (const auto& [id, doc] : documents_) {
        ids.push_back(id);
    }
    return ids;
}

bool DocumentStore::remove_document(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.erase(document_id) > 0;
}

Status DocumentStore::load_snapshot(const std::string& document_id) {
    if (!snapshots_) {
        return Error(ErrorCode::SnapshotFailed, "No snapshot store configured");
    }

    auto doc = get_document(document_id);
    if (!doc) {
        return doc.error();
    }

    auto state = snapshots_->load(document_id);
    if (!state) {
        return Error(ErrorCode::NotFound, "No snapshot for " + document_id);
    }

    auto applied = (*doc)->apply_update(*state, ChangeOrigin::Snapshot);
    if (!applied) {
        return Error(ErrorCode::SnapshotFailed, "Corrupt snapshot for " + document_id + ": " +
                                                    applied.error().message);
    }

    (*doc)->mark_snapshot_loaded();
    Logger::instance().info("Loaded snapshot for " + document_id + " (" +
                            std::to_string(state->size()) + " bytes)");
    return Status{};
}

Status DocumentStore::save_snapshot(const std::string& document_id) {
    if (!snapshots_) {
        return Error(ErrorCode::SnapshotFailed, "No snapshot store configured");
    }

    std::shared_ptr<ReplicatedDocument> doc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(document_id);
        if (it == documents_.end()) {
            return Error(ErrorCode::NotFound, "Unknown document " + document_id);
        }
        doc = it->second;
    }

    if (!snapshots_->save(document_id, doc->encode_state_as_update())) {
        return Error(ErrorCode::SnapshotFailed, "Failed to save snapshot for " + document_id);
    }
    return Status{};
}

Status DocumentStore::save_all() {
    Status result;
    for (const auto& id : document_ids()) {
        auto saved = save_snapshot(id);
        if (!saved) {
            Logger::instance().error(saved.error().to_string());
            result = saved;
        }
    }
    return result;
}

Result<Bytes> DocumentStore::export_state(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        return Error(ErrorCode::NotFound, "Unknown document " + document_id);
    }
    return it->second->encode_state_as_update();
}

Status DocumentStore::import_state(const std::string& document_id, const Bytes& state) {
    auto doc = get_document(document_id);
    if (!doc) {
        return doc.error();
    }
    return (*doc)->apply_update(state, ChangeOrigin::Local);
}

Status DocumentStore::merge_documents(const std::string& target_id, const std::string& source_id) {
    auto source_state = export_state(source_id);
    if (!source_state) {
        return source_state.error();
    }
    if (!has_document(target_id)) {
        return Error(ErrorCode::NotFound, "Unknown document " + target_id);
    }
    return import_state(target_id, *source_state);
}

} // namespace roomsync
