#include "roomsync/base/result.h"

namespace roomsync {

Error Error::incomplete_transfer(uint32_t index, uint32_t total) {
    Error err(ErrorCode::IncompleteTransfer,
              "Missing chunk " + std::to_string(index + 1) + "/" + std::to_string(total));
    err.missing_index = index;
    return err;
}

std::string Error::to_string() const {
    return roomsync::to_string(code) + ": " + message;
}

} // namespace roomsync
