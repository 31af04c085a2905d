#include "roomsync/p2p/room_link.h"
#include "roomsync/base/encoding.h"
#include <cctype>

namespace roomsync {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Reads p= and n= from an "a=b&c=d" parameter list
void read_params(const std::string& params, RoomLink& link) {
    size_t pos = 0;
    while (pos <= params.size()) {
        size_t amp = params.find('&', pos);
        std::string pair = params.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            std::string key = pair.substr(0, eq);
            std::string value = url_decode(pair.substr(eq + 1));
            if (key == "p" && !value.empty()) {
                link.password = value;
            } else if (key == "n" && !value.empty()) {
                link.name = value;
            }
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
}

} // anonymous namespace

bool is_valid_room_code(const std::string& code) {
    if (code.empty()) return false;
    for (unsigned char c : code) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string generate_room_link(const std::string& room_id, const std::optional<std::string>& password) {
    std::string link = std::string(ROOM_LINK_SCHEME) + "://join/" + url_encode(room_id);
    if (password && !password->empty()) {
        link += "?p=" + url_encode(*password);
    }
    return link;
}

Result<RoomLink> parse_room_link(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) {
        return Error(ErrorCode::InvalidLink, "Empty room link");
    }

    auto scheme_end = input.find("://");
    if (scheme_end == std::string::npos) {
        if (!is_valid_room_code(input)) {
            return Error(ErrorCode::InvalidLink, "Not a room link or room code: " + input);
        }
        return RoomLink{input, std::nullopt, std::nullopt};
    }

    std::string scheme = input.substr(0, scheme_end);
    for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (scheme != ROOM_LINK_SCHEME) {
        return Error(ErrorCode::InvalidLink, "Unsupported link scheme: " + scheme);
    }

    std::string rest = input.substr(scheme_end + 3);
    std::string fragment;
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    std::string query;
    auto question = rest.find('?');
    if (question != std::string::npos) {
        query = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    std::string room_id;
    for (const char* prefix : {"join/", "room/"}) {
        std::string p(prefix);
        if (rest.compare(0, p.size(), p) == 0) {
            room_id = rest.substr(p.size());
            break;
        }
    }
    while (!room_id.empty() && room_id.back() == '/') {
        room_id.pop_back();
    }
    room_id = url_decode(room_id);

    if (!is_valid_room_code(room_id)) {
        return Error(ErrorCode::InvalidLink, "Missing or invalid room id in link: " + input);
    }

    RoomLink link{room_id, std::nullopt, std::nullopt};
    read_params(query, link);
    // A password in the fragment never reaches a server; it wins over the query
    read_params(fragment, link);
    return link;
}

} // namespace roomsync
