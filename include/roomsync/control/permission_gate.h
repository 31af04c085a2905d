#ifndef ROOMSYNC_CONTROL_PERMISSION_GATE_H
#define ROOMSYNC_CONTROL_PERMISSION_GATE_H

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomsync {

// Answers whether an identity holds elevated rights in the workspace
class PermissionGate {
public:
    virtual ~PermissionGate() = default;

    virtual bool is_admin(const std::string& identity) const = 0;
};

enum class Role {
    Owner,
    Admin,
    Member,
    Viewer
};

std::string to_string(Role role);
std::optional<Role> parse_role(const std::string& name);

// Role table; identities without an entry get the default role
class RolePermissionGate : public PermissionGate {
public:
    explicit RolePermissionGate(Role default_role = Role::Member);

    void set_role(const std::string& identity, Role role);
    void remove(const std::string& identity);
    Role role_of(const std::string& identity) const;

    // Owner and Admin
    bool is_admin(const std::string& identity) const override;
    // Everyone but Viewer may share and remove their own files
    bool can_manage_files(const std::string& identity) const;

    std::vector<std::string> admins() const;

private:
    Role default_role_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Role> roles_;
};

} // namespace roomsync

#endif // ROOMSYNC_CONTROL_PERMISSION_GATE_H
