#include "roomsync/control/permission_gate.h"
#include <algorithm>
#include <cctype>

namespace roomsync {

std::string to_string(Role role) {
    switch (role) {
        case Role::Owner: return "owner";
        case Role::Admin: return "admin";
        case Role::Member: return "member";
        case Role::Viewer: return "viewer";
    }
    return "unknown";
}

std::optional<Role> parse_role(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "owner") return Role::Owner;
    if (lower == "admin") return Role::Admin;
    if (lower == "member") return Role::Member;
    if (lower == "viewer") return Role::Viewer;
    return std::nullopt;
}

RolePermissionGate::RolePermissionGate(Role default_role) : default_role_(default_role) {}

void RolePermissionGate::set_role(const std::string& identity, Role role) {
    std::lock_guard<std::mutex> lock(mutex_);
    roles_[identity] = role;
}

void RolePermissionGate::remove(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    roles_.erase(identity);
}

Role RolePermissionGate::role_of(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roles_.find(identity);
    return it == roles_.end() ? default_role_ : it->second;
}

bool RolePermissionGate::is_admin(const std::string& identity) const {
    Role role = role_of(identity);
    return role == Role::Owner || role == Role::Admin;
}

bool RolePermissionGate::can_manage_files(const std::string& identity) const {
    return role_of(identity) != Role::Viewer;
}

std::vector<std::string> RolePermissionGate::admins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [identity, role] : roles_) {
        if (role == Role::Owner || role == Role::Admin) {
            result.push_back(identity);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace roomsync
