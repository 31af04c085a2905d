#ifndef ROOMSYNC_BASE_RESULT_H
#define ROOMSYNC_BASE_RESULT_H

#include "roomsync/base/error_code.h"
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <cstdint>

namespace roomsync {

// Typed failure crossing a component boundary
struct Error {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    std::optional<uint32_t> missing_index;  // set for IncompleteTransfer

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Error incomplete_transfer(uint32_t index, uint32_t total);

    std::error_code error_code() const { return make_error_code(code); }
    std::string to_string() const;
};

template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & {
        if (!ok()) throw RoomSyncError(error().code, error().message);
        return std::get<T>(data_);
    }
    const T& value() const& {
        if (!ok()) throw RoomSyncError(error().code, error().message);
        return std::get<T>(data_);
    }
    T&& value() && {
        if (!ok()) throw RoomSyncError(error().code, error().message);
        return std::get<T>(std::move(data_));
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

using Status = Result<void>;

} // namespace roomsync

#endif // ROOMSYNC_BASE_RESULT_H
