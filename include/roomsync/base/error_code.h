#ifndef ROOMSYNC_BASE_ERROR_CODE_H
#define ROOMSYNC_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace roomsync {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    Timeout = 1003,
    Cancelled = 1004,
    InternalError = 1005,

    // Network errors (2000-2999)
    ConnectFailed = 2001,
    ConnectionClosed = 2002,
    SendFailed = 2003,
    RateLimited = 2004,
    InvalidLink = 2005,

    // Crypto errors (3000-3999)
    DecryptFailed = 3001,
    EncryptFailed = 3002,
    KeyDerivationFailed = 3003,

    // Replication errors (4000-4999)
    MalformedDelta = 4001,
    SnapshotFailed = 4002,

    // Transfer errors (5000-5999)
    FileTooLarge = 5001,
    TooManyChunks = 5002,
    IncompleteTransfer = 5003,
    TransferCorrupted = 5004,

    // Authorization errors (6000-6999)
    Unauthorized = 6001
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class RoomSyncError : public std::exception {
public:
    RoomSyncError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace roomsync

namespace std {
template <>
struct is_error_code_enum<roomsync::ErrorCode> : true_type {};
} // namespace std

#endif // ROOMSYNC_BASE_ERROR_CODE_H
