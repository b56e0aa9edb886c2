/************************************************************************
Strata Access Control

Role-based privileges over account objects. Roles form a DAG through
GrantRole: a role holds its own grants plus those of every role it
inherits, transitively. Users are granted roles and act through one of
them per session.
**************************************************************************/

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <strata/manifest.h>
#include <strata/status.h>

namespace strata {

using RoleId = uint64_t;

constexpr const char* kAccountAdminRole = "ACCOUNTADMIN";

enum class Privilege {
    kOwnership,
    kSelect,
    kInsert,
    kUpdate,
    kDelete,
    kUsage,
    kCreate,
    kMonitor,
    kOperate,
};

const char* PrivilegeToString(Privilege privilege);
bool PrivilegeFromString(const std::string& name, Privilege* privilege);

enum class ObjectType {
    kAccount,
    kDatabase,
    kSchema,
    kTable,
    kWarehouse,
};

const char* ObjectTypeToString(ObjectType type);
bool ObjectTypeFromString(const std::string& name, ObjectType* type);

/**
 * @brief A securable object, named by its dotted path
 *
 * Schemas are "db.schema", tables "db.schema.table". The account has an
 * empty name.
 */
struct ObjectRef {
    ObjectType type = ObjectType::kAccount;
    std::string name;

    static ObjectRef Account() { return ObjectRef{ObjectType::kAccount, std::string()}; }
    static ObjectRef Database(std::string name) { return ObjectRef{ObjectType::kDatabase, std::move(name)}; }
    static ObjectRef Schema(std::string name) { return ObjectRef{ObjectType::kSchema, std::move(name)}; }
    static ObjectRef Table(std::string name) { return ObjectRef{ObjectType::kTable, std::move(name)}; }
    static ObjectRef Warehouse(std::string name) { return ObjectRef{ObjectType::kWarehouse, std::move(name)}; }

    // True if this object is `other` or encloses it
    bool Contains(const ObjectRef& other) const;

    std::string ToString() const;

    bool operator==(const ObjectRef& other) const { return type == other.type && name == other.name; }
    bool operator<(const ObjectRef& other) const {
        return type != other.type ? type < other.type : name < other.name;
    }
};

struct PrivilegeGrant {
    Privilege privilege;
    ObjectRef object;

    bool operator<(const PrivilegeGrant& other) const {
        return privilege != other.privilege ? privilege < other.privilege : object < other.object;
    }
};

// Who is acting, and through which role
struct Session {
    std::string user;
    std::string role;
};

class AccessControl {
public:
    /**
     * @brief Open the access-control state, replaying the manifest
     *
     * A fresh store gets the ACCOUNTADMIN role (OWNERSHIP on ACCOUNT) and
     * admin_user holding it.
     */
    static Status Open(Manifest* manifest, const std::string& admin_user,
                       std::unique_ptr<AccessControl>* access);

    AccessControl(const AccessControl&) = delete;
    AccessControl& operator=(const AccessControl&) = delete;

    Status CreateRole(const std::string& name, RoleId* role_id);

    // Removes the role, its grants and every edge to it
    Status DropRole(const std::string& name);

    Status CreateUser(const std::string& name);
    Status GrantRoleToUser(const std::string& role, const std::string& user);

    /**
     * @brief Make `role` inherit every privilege of `inherited_role`
     *
     * kCycle if inherited_role already inherits role; nothing changes.
     */
    Status GrantRole(const std::string& role, const std::string& inherited_role);

    Status Grant(const std::string& role, Privilege privilege, const ObjectRef& object);
    Status Revoke(const std::string& role, Privilege privilege, const ObjectRef& object);

    /**
     * @brief Whether session may exercise privilege on object
     *
     * Unknown users or roles, and roles the user does not hold, are denied.
     */
    bool Check(const Session& session, Privilege privilege, const ObjectRef& object) const;

    // Check as a status: kPrivilegeDenied when denied
    Status Authorize(const Session& session, Privilege privilege, const ObjectRef& object) const;

    bool HasRole(const std::string& name) const;
    bool HasUser(const std::string& name) const;

    // The role and every role it inherits
    Status RoleClosure(const std::string& role, std::vector<std::string>* roles) const;

    // Direct grants of a role
    Status GetGrants(const std::string& role, std::vector<PrivilegeGrant>* grants) const;

private:
    explicit AccessControl(Manifest* manifest);

    struct Role {
        RoleId role_id = 0;
        std::string name;
        std::set<RoleId> parent_roles;
        std::set<PrivilegeGrant> grants;
    };

    using Closure = std::shared_ptr<const std::set<RoleId>>;

    Status Bootstrap(const std::string& admin_user);
    Status ApplyRecord(const Manifest::Record& record);

    Status ApplyCreateRole(const std::string& name, RoleId role_id);
    Status ApplyGrantRole(const std::string& role, const std::string& inherited_role);
    Status ApplyGrant(const std::string& role, Privilege privilege, const ObjectRef& object);
    Status ApplyRevoke(const std::string& role, Privilege privilege, const ObjectRef& object);
    Status ApplyDropRole(const std::string& name);
    Status ApplyGrantRoleToUser(const std::string& role, const std::string& user);

    const Role* FindRoleLocked(const std::string& name) const;
    Role* FindRoleLocked(const std::string& name);

    // Memoized; the cache is dropped on every graph mutation
    Closure ClosureLocked(RoleId role_id) const;
    void InvalidateClosuresLocked();

    Manifest* manifest_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<RoleId, Role> roles_;
    std::unordered_map<std::string, RoleId> role_names_;
    std::map<std::string, std::set<RoleId>> users_;
    RoleId next_role_id_ = 1;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<RoleId, Closure> closure_cache_;
};

} // namespace strata
