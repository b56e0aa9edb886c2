#include "strata/access_control.h"

#include <algorithm>

#include "strata/logging.h"

namespace strata {

STRATA_LOG_TAG(AccessControl);

using json = nlohmann::json;

namespace {

const std::pair<const char*, Privilege> kPrivileges[] = {
    {"OWNERSHIP", Privilege::kOwnership},
    {"SELECT", Privilege::kSelect},
    {"INSERT", Privilege::kInsert},
    {"UPDATE", Privilege::kUpdate},
    {"DELETE", Privilege::kDelete},
    {"USAGE", Privilege::kUsage},
    {"CREATE", Privilege::kCreate},
    {"MONITOR", Privilege::kMonitor},
    {"OPERATE", Privilege::kOperate},
};

const std::pair<const char*, ObjectType> kObjectTypes[] = {
    {"ACCOUNT", ObjectType::kAccount},
    {"DATABASE", ObjectType::kDatabase},
    {"SCHEMA", ObjectType::kSchema},
    {"TABLE", ObjectType::kTable},
    {"WAREHOUSE", ObjectType::kWarehouse},
};

bool IsTableDml(Privilege privilege) {
    return privilege == Privilege::kSelect || privilege == Privilege::kInsert ||
           privilege == Privilege::kUpdate || privilege == Privilege::kDelete;
}

bool HasPrefixPath(const std::string& name, const std::string& container) {
    return name.size() > container.size() + 1 &&
           name.compare(0, container.size(), container) == 0 &&
           name[container.size()] == '.';
}

// Whether grant allows exercising wanted on object
bool Covers(const PrivilegeGrant& grant, Privilege wanted, const ObjectRef& object) {
    if (grant.privilege == Privilege::kOwnership) {
        return grant.object.Contains(object);
    }
    if (grant.privilege != wanted) {
        return false;
    }
    if (IsTableDml(wanted) && object.type == ObjectType::kTable &&
        (grant.object.type == ObjectType::kSchema || grant.object.type == ObjectType::kDatabase)) {
        return grant.object.Contains(object);
    }
    return grant.object == object;
}

json GrantToRecord(const char* type, const std::string& role, Privilege privilege, const ObjectRef& object) {
    json j;
    j["type"] = type;
    j["role"] = role;
    j["privilege"] = PrivilegeToString(privilege);
    j["object_type"] = ObjectTypeToString(object.type);
    j["object"] = object.name;
    return j;
}

Status GrantFromRecord(const json& j, Privilege* privilege, ObjectRef* object) {
    if (!PrivilegeFromString(j.at("privilege").get<std::string>(), privilege)) {
        return Status::Corruption("Unknown privilege in access manifest");
    }
    if (!ObjectTypeFromString(j.at("object_type").get<std::string>(), &object->type)) {
        return Status::Corruption("Unknown object type in access manifest");
    }
    object->name = j.at("object").get<std::string>();
    return Status::OK();
}

} // namespace

const char* PrivilegeToString(Privilege privilege) {
    for (const auto& [text, value] : kPrivileges) {
        if (value == privilege) return text;
    }
    return "UNKNOWN";
}

bool PrivilegeFromString(const std::string& name, Privilege* privilege) {
    for (const auto& [text, value] : kPrivileges) {
        if (name == text) {
            *privilege = value;
            return true;
        }
    }
    return false;
}

const char* ObjectTypeToString(ObjectType type) {
    for (const auto& [text, value] : kObjectTypes) {
        if (value == type) return text;
    }
    return "UNKNOWN";
}

bool ObjectTypeFromString(const std::string& name, ObjectType* type) {
    for (const auto& [text, value] : kObjectTypes) {
        if (name == text) {
            *type = value;
            return true;
        }
    }
    return false;
}

bool ObjectRef::Contains(const ObjectRef& other) const {
    if (*this == other || type == ObjectType::kAccount) {
        return true;
    }
    switch (type) {
        case ObjectType::kDatabase:
            return (other.type == ObjectType::kSchema || other.type == ObjectType::kTable) &&
                   HasPrefixPath(other.name, name);
        case ObjectType::kSchema:
            return other.type == ObjectType::kTable && HasPrefixPath(other.name, name);
        default:
            return false;
    }
}

std::string ObjectRef::ToString() const {
    if (type == ObjectType::kAccount) return "ACCOUNT";
    return std::string(ObjectTypeToString(type)) + " " + name;
}

// ============================================================================
// Open / replay
// ============================================================================

AccessControl::AccessControl(Manifest* manifest) : manifest_(manifest) {}

Status AccessControl::Open(Manifest* manifest, const std::string& admin_user,
                           std::unique_ptr<AccessControl>* access) {
    if (!manifest || !access) {
        return Status::InvalidArgument("Access control requires a manifest and an output pointer");
    }

    std::unique_ptr<AccessControl> result(new AccessControl(manifest));
    {
        std::unique_lock<std::shared_mutex> lock(result->mutex_);
        STRATA_RETURN_NOT_OK(manifest->Replay([&result](const Manifest::Record& record) {
            return result->ApplyRecord(record);
        }));
    }
    STRATA_RETURN_NOT_OK(result->Bootstrap(admin_user));

    STRATA_LOG_INFO(AccessControl) << "Loaded " << result->roles_.size() << " roles, "
                                   << result->users_.size() << " users";
    *access = std::move(result);
    return Status::OK();
}

Status AccessControl::Bootstrap(const std::string& admin_user) {
    if (!HasRole(kAccountAdminRole)) {
        STRATA_RETURN_NOT_OK(CreateRole(kAccountAdminRole, nullptr));
        STRATA_RETURN_NOT_OK(Grant(kAccountAdminRole, Privilege::kOwnership, ObjectRef::Account()));
    }
    if (!admin_user.empty() && !HasUser(admin_user)) {
        STRATA_RETURN_NOT_OK(CreateUser(admin_user));
        STRATA_RETURN_NOT_OK(GrantRoleToUser(kAccountAdminRole, admin_user));
    }
    return Status::OK();
}

Status AccessControl::ApplyRecord(const Manifest::Record& record) {
    const std::string type = record.at("type").get<std::string>();

    if (type == "role") {
        return ApplyCreateRole(record.at("name").get<std::string>(), record.at("id").get<RoleId>());
    }
    if (type == "user") {
        users_[record.at("name").get<std::string>()];
        return Status::OK();
    }
    if (type == "user_role") {
        return ApplyGrantRoleToUser(record.at("role").get<std::string>(),
                                    record.at("user").get<std::string>());
    }
    if (type == "role_grant") {
        return ApplyGrantRole(record.at("role").get<std::string>(),
                              record.at("inherited").get<std::string>());
    }
    if (type == "drop_role") {
        return ApplyDropRole(record.at("name").get<std::string>());
    }
    if (type == "grant" || type == "revoke") {
        Privilege privilege;
        ObjectRef object;
        STRATA_RETURN_NOT_OK(GrantFromRecord(record, &privilege, &object));
        const std::string role = record.at("role").get<std::string>();
        return type == "grant" ? ApplyGrant(role, privilege, object)
                               : ApplyRevoke(role, privilege, object);
    }
    return Status::Corruption("Unknown access record type '" + type + "'");
}

// ============================================================================
// Mutations (caller holds the exclusive lock)
// ============================================================================

Status AccessControl::ApplyCreateRole(const std::string& name, RoleId role_id) {
    if (role_names_.count(name)) {
        return Status::AlreadyExists("Role " + name);
    }
    Role role;
    role.role_id = role_id;
    role.name = name;
    roles_[role_id] = std::move(role);
    role_names_[name] = role_id;
    next_role_id_ = std::max(next_role_id_, role_id + 1);
    return Status::OK();
}

Status AccessControl::ApplyGrantRole(const std::string& role, const std::string& inherited_role) {
    Role* child = FindRoleLocked(role);
    const Role* parent = FindRoleLocked(inherited_role);
    if (!child || !parent) {
        return Status::NotFound("Role " + (child ? inherited_role : role));
    }
    child->parent_roles.insert(parent->role_id);
    InvalidateClosuresLocked();
    return Status::OK();
}

Status AccessControl::ApplyGrant(const std::string& role, Privilege privilege, const ObjectRef& object) {
    Role* target = FindRoleLocked(role);
    if (!target) {
        return Status::NotFound("Role " + role);
    }
    target->grants.insert(PrivilegeGrant{privilege, object});
    return Status::OK();
}

Status AccessControl::ApplyRevoke(const std::string& role, Privilege privilege, const ObjectRef& object) {
    Role* target = FindRoleLocked(role);
    if (!target) {
        return Status::NotFound("Role " + role);
    }
    target->grants.erase(PrivilegeGrant{privilege, object});
    return Status::OK();
}

Status AccessControl::ApplyDropRole(const std::string& name) {
    auto it = role_names_.find(name);
    if (it == role_names_.end()) {
        return Status::NotFound("Role " + name);
    }
    RoleId role_id = it->second;
    for (auto& [id, role] : roles_) {
        role.parent_roles.erase(role_id);
    }
    for (auto& [user, roles] : users_) {
        roles.erase(role_id);
    }
    roles_.erase(role_id);
    role_names_.erase(it);
    InvalidateClosuresLocked();
    return Status::OK();
}

Status AccessControl::ApplyGrantRoleToUser(const std::string& role, const std::string& user) {
    const Role* granted = FindRoleLocked(role);
    if (!granted) {
        return Status::NotFound("Role " + role);
    }
    auto user_it = users_.find(user);
    if (user_it == users_.end()) {
        return Status::NotFound("User " + user);
    }
    user_it->second.insert(granted->role_id);
    return Status::OK();
}

const AccessControl::Role* AccessControl::FindRoleLocked(const std::string& name) const {
    auto it = role_names_.find(name);
    return it == role_names_.end() ? nullptr : &roles_.at(it->second);
}

AccessControl::Role* AccessControl::FindRoleLocked(const std::string& name) {
    auto it = role_names_.find(name);
    return it == role_names_.end() ? nullptr : &roles_.at(it->second);
}

// ============================================================================
// Public DDL
// ============================================================================

Status AccessControl::CreateRole(const std::string& name, RoleId* role_id) {
    if (name.empty()) {
        return Status::InvalidArgument("Role name must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (role_names_.count(name)) {
        return Status::AlreadyExists("Role " + name);
    }

    RoleId id = next_role_id_;
    json j;
    j["type"] = "role";
    j["id"] = id;
    j["name"] = name;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));
    STRATA_RETURN_NOT_OK(ApplyCreateRole(name, id));

    STRATA_LOG_DEBUG(AccessControl) << "Created role " << name << " id=" << id;
    if (role_id) *role_id = id;
    return Status::OK();
}

Status AccessControl::DropRole(const std::string& name) {
    if (name == kAccountAdminRole) {
        return Status::InvalidArgument("Role " + name + " cannot be dropped");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!role_names_.count(name)) {
        return Status::NotFound("Role " + name);
    }

    json j;
    j["type"] = "drop_role";
    j["name"] = name;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));
    return ApplyDropRole(name);
}

Status AccessControl::CreateUser(const std::string& name) {
    if (name.empty()) {
        return Status::InvalidArgument("User name must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (users_.count(name)) {
        return Status::AlreadyExists("User " + name);
    }

    json j;
    j["type"] = "user";
    j["name"] = name;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));
    users_[name];
    return Status::OK();
}

Status AccessControl::GrantRoleToUser(const std::string& role, const std::string& user) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!FindRoleLocked(role)) {
        return Status::NotFound("Role " + role);
    }
    if (!users_.count(user)) {
        return Status::NotFound("User " + user);
    }

    json j;
    j["type"] = "user_role";
    j["role"] = role;
    j["user"] = user;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));
    return ApplyGrantRoleToUser(role, user);
}

Status AccessControl::GrantRole(const std::string& role, const std::string& inherited_role) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const Role* child = FindRoleLocked(role);
    if (!child) {
        return Status::NotFound("Role " + role);
    }
    const Role* parent = FindRoleLocked(inherited_role);
    if (!parent) {
        return Status::NotFound("Role " + inherited_role);
    }

    // child -> parent closes a cycle iff parent already reaches child
    Closure reachable = ClosureLocked(parent->role_id);
    if (reachable->count(child->role_id)) {
        STRATA_LOG_WARN(AccessControl) << "Rejected role grant " << inherited_role << " -> "
                                       << role << ": cycle";
        return Status::Cycle("Granting role " + inherited_role + " to role " + role +
                             " would create a cycle");
    }
    if (child->parent_roles.count(parent->role_id)) {
        return Status::OK();
    }

    json j;
    j["type"] = "role_grant";
    j["role"] = role;
    j["inherited"] = inherited_role;
    STRATA_RETURN_NOT_OK(manifest_->Append(j));
    return ApplyGrantRole(role, inherited_role);
}

Status AccessControl::Grant(const std::string& role, Privilege privilege, const ObjectRef& object) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!FindRoleLocked(role)) {
        return Status::NotFound("Role " + role);
    }
    STRATA_RETURN_NOT_OK(manifest_->Append(GrantToRecord("grant", role, privilege, object)));
    return ApplyGrant(role, privilege, object);
}

Status AccessControl::Revoke(const std::string& role, Privilege privilege, const ObjectRef& object) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const Role* target = FindRoleLocked(role);
    if (!target) {
        return Status::NotFound("Role " + role);
    }
    if (!target->grants.count(PrivilegeGrant{privilege, object})) {
        return Status::NotFound(std::string(PrivilegeToString(privilege)) + " on " +
                                object.ToString() + " is not granted to " + role);
    }
    STRATA_RETURN_NOT_OK(manifest_->Append(GrantToRecord("revoke", role, privilege, object)));
    return ApplyRevoke(role, privilege, object);
}

// ============================================================================
// Checks
// ============================================================================

AccessControl::Closure AccessControl::ClosureLocked(RoleId role_id) const {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    auto cached = closure_cache_.find(role_id);
    if (cached != closure_cache_.end()) {
        return cached->second;
    }

    auto visited = std::make_shared<std::set<RoleId>>();
    std::vector<RoleId> pending{role_id};
    while (!pending.empty()) {
        RoleId id = pending.back();
        pending.pop_back();
        if (!visited->insert(id).second) continue;

        auto it = roles_.find(id);
        if (it == roles_.end()) continue;
        for (RoleId parent : it->second.parent_roles) {
            if (!visited->count(parent)) pending.push_back(parent);
        }
    }

    Closure closure = std::move(visited);
    closure_cache_[role_id] = closure;
    return closure;
}

void AccessControl::InvalidateClosuresLocked() {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    closure_cache_.clear();
}

bool AccessControl::Check(const Session& session, Privilege privilege, const ObjectRef& object) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const Role* role = FindRoleLocked(session.role);
    auto user_it = users_.find(session.user);
    if (!role || user_it == users_.end()) {
        return false;
    }

    bool holds_role = false;
    for (RoleId granted : user_it->second) {
        if (ClosureLocked(granted)->count(role->role_id)) {
            holds_role = true;
            break;
        }
    }
    if (!holds_role) {
        return false;
    }

    for (RoleId id : *ClosureLocked(role->role_id)) {
        for (const auto& grant : roles_.at(id).grants) {
            if (Covers(grant, privilege, object)) {
                return true;
            }
        }
    }
    return false;
}

Status AccessControl::Authorize(const Session& session, Privilege privilege, const ObjectRef& object) const {
    if (Check(session, privilege, object)) {
        return Status::OK();
    }
    STRATA_LOG_WARN(AccessControl) << "Denied " << PrivilegeToString(privilege) << " on "
                                   << object.ToString() << " to " << session.user
                                   << " (role " << session.role << ")";
    return Status::PrivilegeDenied("Role " + session.role + " lacks " + PrivilegeToString(privilege) +
                                   " on " + object.ToString());
}

bool AccessControl::HasRole(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return role_names_.count(name) > 0;
}

bool AccessControl::HasUser(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return users_.count(name) > 0;
}

Status AccessControl::RoleClosure(const std::string& role, std::vector<std::string>* roles) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Role* start = FindRoleLocked(role);
    if (!start) {
        return Status::NotFound("Role " + role);
    }
    roles->clear();
    for (RoleId id : *ClosureLocked(start->role_id)) {
        roles->push_back(roles_.at(id).name);
    }
    std::sort(roles->begin(), roles->end());
    return Status::OK();
}

Status AccessControl::GetGrants(const std::string& role, std::vector<PrivilegeGrant>* grants) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Role* target = FindRoleLocked(role);
    if (!target) {
        return Status::NotFound("Role " + role);
    }
    grants->assign(target->grants.begin(), target->grants.end());
    return Status::OK();
}

} // namespace strata
