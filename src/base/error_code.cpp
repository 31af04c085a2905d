#include "roomsync/base/error_code.h"

namespace roomsync {

namespace {

class RoomSyncCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "RoomSync";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const RoomSyncCategory& get_category() {
    static RoomSyncCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::ConnectFailed: return "Connect failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::InvalidLink: return "Invalid room link";
        case ErrorCode::DecryptFailed: return "Decrypt failed";
        case ErrorCode::EncryptFailed: return "Encrypt failed";
        case ErrorCode::KeyDerivationFailed: return "Key derivation failed";
        case ErrorCode::MalformedDelta: return "Malformed delta";
        case ErrorCode::SnapshotFailed: return "Snapshot failed";
        case ErrorCode::FileTooLarge: return "File too large";
        case ErrorCode::TooManyChunks: return "Too many chunks";
        case ErrorCode::IncompleteTransfer: return "Incomplete transfer";
        case ErrorCode::TransferCorrupted: return "Transfer corrupted";
        case ErrorCode::Unauthorized: return "Unauthorized";
        default: return "Unknown error";
    }
}

RoomSyncError::RoomSyncError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* RoomSyncError::what() const noexcept {
    return message_.c_str();
}

} // namespace roomsync
