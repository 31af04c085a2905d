#ifndef ROOMSYNC_P2P_ROOM_LINK_H
#define ROOMSYNC_P2P_ROOM_LINK_H

#include "roomsync/base/result.h"
#include <optional>
#include <string>

namespace roomsync {

constexpr const char* ROOM_LINK_SCHEME = "roomsync";

struct RoomLink {
    std::string room_id;
    std::optional<std::string> password;
    std::optional<std::string> name;
};

// roomsync://join/{room_id}[?p={urlencoded password}]
std::string generate_room_link(const std::string& room_id,
                               const std::optional<std::string>& password = std::nullopt);

// Accepts roomsync://join/..., the older roomsync://room/... form, or a
// bare room code. Any other scheme is InvalidLink.
Result<RoomLink> parse_room_link(const std::string& text);

bool is_valid_room_code(const std::string& code);

} // namespace roomsync

#endif // ROOMSYNC_P2P_ROOM_LINK_H
