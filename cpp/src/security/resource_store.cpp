#include "warden/security/resource_store.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

#include "warden/core/hashing.hpp"
#include "warden/core/validation.hpp"

namespace warden::security {

using namespace warden::core;

namespace {
    [[nodiscard]] Status sec_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Security, code);
    }

    [[nodiscard]] std::string join_names(const std::vector<std::string>& names) {
        std::string out;
        for (const std::string& n : names) {
            if (!out.empty()) {
                out += ", ";
            }
            out += n;
        }
        return out;
    }

    // Policy groups live in the directory under a name no plain group can
    // take (':' and '/' fail group-name validation).
    [[nodiscard]] std::string policy_group_name(const PolicyId& id) {
        return "policy:" + to_string(id);
    }

    template <typename T>
    [[nodiscard]] std::vector<T> set_difference_of(const std::set<T>& a, const std::set<T>& b) {
        std::vector<T> out;
        std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
        return out;
    }
} // namespace

ResourceStore::ResourceStore(const ResourceTypeRegistry& types, directory::GroupStore& groups, std::string email_domain)
    : types_(types), groups_(groups), email_domain_(std::move(email_domain)) {}

// ============================================================================
// Resource types
// ============================================================================

Status ResourceStore::register_resource_types(db::DbSession& s) {
    for (const ResourceType* type : types_.all()) {
        const Status status = create_resource_type(s, *type);
        if (!is_ok(status)) {
            return status;
        }
    }
    return ok_status();
}

Status ResourceStore::create_resource_type(db::DbSession& s, const ResourceType& type) {
    {
        db::Statement st(s,
            "INSERT INTO resource_types (name, owner_role) VALUES (?, ?) "
            "ON CONFLICT(name) DO UPDATE SET owner_role = excluded.owner_role");
        if (!st.ok()) {
            return st.error("upsert resource type");
        }
        st.bind_text(1, type.name.v);
        st.bind_text(2, type.owner_role.v);
        const Status status = st.run("upsert resource type " + type.name.v);
        if (!is_ok(status)) {
            return status;
        }
    }

    ResourceTypeKey key{};
    Status status = resolve_type(s, type.name, &key);
    if (!is_ok(status)) {
        return status;
    }

    const char* clear_sql[] = {
        "DELETE FROM resource_type_roles WHERE resource_type_id = ?",
        "DELETE FROM resource_type_action_patterns WHERE resource_type_id = ?",
    };
    for (const char* sql : clear_sql) {
        db::Statement st(s, sql);
        if (!st.ok()) {
            return st.error("clear resource type");
        }
        st.bind_int64(1, key.v);
        status = st.run("clear resource type");
        if (!is_ok(status)) {
            return status;
        }
    }

    db::Statement role_st(s, "INSERT INTO resource_type_roles (resource_type_id, role) VALUES (?, ?)");
    db::Statement action_st(s, "INSERT INTO resource_role_actions (resource_type_id, role, action) VALUES (?, ?, ?)");
    db::Statement pattern_st(s, "INSERT INTO resource_type_action_patterns (resource_type_id, pattern) VALUES (?, ?)");
    if (!role_st.ok()) {
        return role_st.error("prepare role insert");
    }
    if (!action_st.ok()) {
        return action_st.error("prepare role action insert");
    }
    if (!pattern_st.ok()) {
        return pattern_st.error("prepare pattern insert");
    }

    for (const auto& [name, role] : type.roles) {
        role_st.reset();
        role_st.bind_int64(1, key.v);
        role_st.bind_text(2, name.v);
        status = role_st.run("insert role " + name.v);
        if (!is_ok(status)) {
            return status;
        }
        for (const ActionName& action : role.actions) {
            action_st.reset();
            action_st.bind_int64(1, key.v);
            action_st.bind_text(2, name.v);
            action_st.bind_text(3, action.v);
            status = action_st.run("insert role action " + action.v);
            if (!is_ok(status)) {
                return status;
            }
        }
    }
    for (const std::string& pattern : type.action_patterns) {
        pattern_st.reset();
        pattern_st.bind_int64(1, key.v);
        pattern_st.bind_text(2, pattern);
        status = pattern_st.run("insert action pattern " + pattern);
        if (!is_ok(status)) {
            return status;
        }
    }
    return ok_status();
}

Status ResourceStore::resolve_type(db::DbSession& s, const ResourceTypeName& name, ResourceTypeKey* out) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    db::Statement st(s, "SELECT id FROM resource_types WHERE name = ?");
    if (!st.ok()) {
        return st.error("resolve resource type");
    }
    st.bind_text(1, name.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("resolve resource type");
    }
    if (r == db::StepResult::Done) {
        return s.fail(sec_status(StatusCode::NotFound), "resource type " + name.v + " not found");
    }
    *out = ResourceTypeKey{st.column_int64(0)};
    return ok_status();
}

// ============================================================================
// Resources
// ============================================================================

Status ResourceStore::resolve_resource(db::DbSession& s, const FullyQualifiedResourceId& id, ResourceKey* out,
                                       ResourceTypeKey* type) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    db::Statement st(s,
        "SELECT r.id, r.resource_type_id FROM resources r "
        "JOIN resource_types t ON t.id = r.resource_type_id "
        "WHERE t.name = ? AND r.name = ?");
    if (!st.ok()) {
        return st.error("resolve resource");
    }
    st.bind_text(1, id.type.v);
    st.bind_text(2, id.id.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("resolve resource");
    }
    if (r == db::StepResult::Done) {
        return s.fail(sec_status(StatusCode::NotFound), "resource " + to_string(id) + " not found");
    }
    *out = ResourceKey{st.column_int64(0)};
    if (type != nullptr) {
        *type = ResourceTypeKey{st.column_int64(1)};
    }
    return ok_status();
}

Status ResourceStore::create_resource(db::DbSession& s, const FullyQualifiedResourceId& id, const UserId& creator,
                                      const std::optional<FullyQualifiedResourceId>& parent,
                                      const std::set<GroupName>& auth_domain, Resource* out) {
    const ResourceType* type = types_.find(id.type);
    if (type == nullptr) {
        return s.fail(sec_status(StatusCode::NotFound), "resource type " + id.type.v + " not found");
    }
    if (!valid_resource_id(id.id.v)) {
        return s.fail(sec_status(StatusCode::Invalid),
                      "invalid resource id '" + id.id.v + "': use 1-100 printable characters without '/'");
    }

    ResourceTypeKey type_key{};
    Status status = resolve_type(s, id.type, &type_key);
    if (!is_ok(status)) {
        return status;
    }

    ResourceKey existing{};
    status = resolve_resource(s, id, &existing);
    if (is_ok(status)) {
        return s.fail(sec_status(StatusCode::Conflict), "resource " + to_string(id) + " already exists");
    }
    if (status.code != StatusCode::NotFound) {
        return status;
    }

    directory::MemberKey creator_key;
    status = groups_.resolve_member(s, creator, &creator_key);
    if (!is_ok(status)) {
        return status;
    }

    std::optional<ResourceKey> parent_key;
    if (parent) {
        ResourceKey pk{};
        status = resolve_resource(s, *parent, &pk);
        if (!is_ok(status)) {
            return status;
        }
        parent_key = pk;
    }

    {
        db::Statement st(s,
            "INSERT INTO resources (resource_type_id, name, resource_parent_id, created_at) VALUES (?, ?, ?, ?)");
        if (!st.ok()) {
            return st.error("insert resource");
        }
        st.bind_int64(1, type_key.v);
        st.bind_text(2, id.id.v);
        if (parent_key) {
            st.bind_int64(3, parent_key->v);
        } else {
            st.bind_null(3);
        }
        st.bind_int64(4, s.now());
        status = st.run("insert resource " + to_string(id));
        if (!is_ok(status)) {
            return status;
        }
    }
    const ResourceKey key{s.last_insert_rowid()};

    if (!auth_domain.empty()) {
        db::Statement st(s, "INSERT INTO resource_auth_domains (resource_id, group_id) VALUES (?, ?)");
        if (!st.ok()) {
            return st.error("insert auth domain");
        }
        for (const GroupName& g : auth_domain) {
            GroupKey gk{};
            status = groups_.resolve(s, g, &gk);
            if (!is_ok(status)) {
                return status;
            }
            st.reset();
            st.bind_int64(1, key.v);
            st.bind_int64(2, gk.v);
            status = st.run("insert auth domain " + g.v);
            if (!is_ok(status)) {
                return status;
            }
        }
    }

    AccessPolicyMembership owner;
    owner.members.insert(creator);
    owner.roles.insert(type->owner_role);
    status = create_policy(s, PolicyId{id, PolicyName{type->owner_role.v}}, owner);
    if (!is_ok(status)) {
        return status;
    }

    if (out != nullptr) {
        return load_resource(s, id, out);
    }
    return ok_status();
}

Status ResourceStore::load_resource(db::DbSession& s, const FullyQualifiedResourceId& id, Resource* out) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    ResourceKey key{};
    Status status = resolve_resource(s, id, &key);
    if (!is_ok(status)) {
        return status;
    }

    Resource res;
    res.id = id;
    {
        db::Statement st(s,
            "SELECT r.created_at, pt.name, pr.name FROM resources r "
            "LEFT JOIN resources pr ON pr.id = r.resource_parent_id "
            "LEFT JOIN resource_types pt ON pt.id = pr.resource_type_id "
            "WHERE r.id = ?");
        if (!st.ok()) {
            return st.error("load resource");
        }
        st.bind_int64(1, key.v);
        if (st.step() != db::StepResult::Row) {
            return st.error("load resource");
        }
        res.created_at = st.column_int64(0);
        if (!st.column_is_null(1)) {
            res.parent = FullyQualifiedResourceId{ResourceTypeName{st.column_text(1)}, ResourceId{st.column_text(2)}};
        }
    }
    {
        db::Statement st(s,
            "SELECT g.name FROM resource_auth_domains ad JOIN directory_groups g ON g.id = ad.group_id "
            "WHERE ad.resource_id = ?");
        if (!st.ok()) {
            return st.error("load auth domain");
        }
        st.bind_int64(1, key.v);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            res.auth_domain.insert(GroupName{st.column_text(0)});
        }
        if (r == db::StepResult::Error) {
            return st.error("load auth domain");
        }
    }
    *out = std::move(res);
    return ok_status();
}

Status ResourceStore::delete_resource(db::DbSession& s, const FullyQualifiedResourceId& id,
                                      std::vector<PolicyId>* deleted_policies) {
    if (deleted_policies != nullptr) {
        deleted_policies->clear();
    }
    ResourceKey key{};
    Status status = resolve_resource(s, id, &key);
    if (!is_ok(status)) {
        return status;
    }

    std::vector<FullyQualifiedResourceId> children;
    status = list_children(s, id, &children);
    if (!is_ok(status)) {
        return status;
    }
    if (!children.empty()) {
        std::vector<std::string> names;
        for (const auto& c : children) {
            names.push_back(to_string(c));
        }
        return s.fail(sec_status(StatusCode::ReferentialIntegrity),
                      "cannot delete " + to_string(id) + ": it still has children " + join_names(names));
    }

    struct Row {
        PolicyKey policy;
        GroupKey group;
        PolicyId id;
    };
    std::vector<Row> policies;
    {
        db::Statement st(s, "SELECT id, group_id, name FROM policies WHERE resource_id = ? ORDER BY name");
        if (!st.ok()) {
            return st.error("list policies");
        }
        st.bind_int64(1, key.v);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            policies.push_back(Row{PolicyKey{st.column_int64(0)}, GroupKey{st.column_int64(1)},
                                   PolicyId{id, PolicyName{st.column_text(2)}}});
        }
        if (r == db::StepResult::Error) {
            return st.error("list policies");
        }
    }

    for (const Row& row : policies) {
        status = check_policy_unreferenced(s, row.id, row.group);
        if (!is_ok(status)) {
            return status;
        }
    }
    for (const Row& row : policies) {
        status = remove_policy(s, row.id, row.policy, row.group);
        if (!is_ok(status)) {
            return status;
        }
        if (deleted_policies != nullptr) {
            deleted_policies->push_back(row.id);
        }
    }

    db::Statement del(s, "DELETE FROM resources WHERE id = ?");
    if (!del.ok()) {
        return del.error("delete resource");
    }
    del.bind_int64(1, key.v);
    return del.run("delete resource " + to_string(id));
}

// ============================================================================
// Hierarchy
// ============================================================================

Status ResourceStore::set_parent(db::DbSession& s, const FullyQualifiedResourceId& child,
                                 const FullyQualifiedResourceId& parent) {
    ResourceKey child_key{};
    Status status = resolve_resource(s, child, &child_key);
    if (!is_ok(status)) {
        return status;
    }
    ResourceKey parent_key{};
    status = resolve_resource(s, parent, &parent_key);
    if (!is_ok(status)) {
        return status;
    }
    if (child_key == parent_key) {
        return s.fail(sec_status(StatusCode::InvalidGraph), to_string(child) + " cannot be its own parent");
    }

    {
        db::Statement st(s,
            "WITH RECURSIVE up(id) AS ("
            "    SELECT ?1 "
            "    UNION "
            "    SELECT r.resource_parent_id FROM resources r JOIN up ON r.id = up.id "
            "    WHERE r.resource_parent_id IS NOT NULL) "
            "SELECT 1 FROM up WHERE id = ?2 LIMIT 1");
        if (!st.ok()) {
            return st.error("ancestry check");
        }
        st.bind_int64(1, parent_key.v);
        st.bind_int64(2, child_key.v);
        const db::StepResult r = st.step();
        if (r == db::StepResult::Error) {
            return st.error("ancestry check");
        }
        if (r == db::StepResult::Row) {
            return s.fail(sec_status(StatusCode::InvalidGraph),
                          "cannot set parent of " + to_string(child) + " to " + to_string(parent) + ": " +
                              to_string(parent) + " is a descendant of " + to_string(child));
        }
    }

    db::Statement st(s, "UPDATE resources SET resource_parent_id = ? WHERE id = ?");
    if (!st.ok()) {
        return st.error("set parent");
    }
    st.bind_int64(1, parent_key.v);
    st.bind_int64(2, child_key.v);
    return st.run("set parent");
}

Status ResourceStore::get_parent(db::DbSession& s, const FullyQualifiedResourceId& child,
                                 std::optional<FullyQualifiedResourceId>* out) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    Resource res;
    const Status status = load_resource(s, child, &res);
    if (!is_ok(status)) {
        return status;
    }
    *out = res.parent;
    return ok_status();
}

Status ResourceStore::delete_parent(db::DbSession& s, const FullyQualifiedResourceId& child, bool* removed) {
    ResourceKey key{};
    Status status = resolve_resource(s, child, &key);
    if (!is_ok(status)) {
        return status;
    }
    db::Statement st(s,
        "UPDATE resources SET resource_parent_id = NULL WHERE id = ? AND resource_parent_id IS NOT NULL");
    if (!st.ok()) {
        return st.error("delete parent");
    }
    st.bind_int64(1, key.v);
    status = st.run("delete parent");
    if (!is_ok(status)) {
        return status;
    }
    if (removed != nullptr) {
        *removed = s.changes() > 0;
    }
    return ok_status();
}

Status ResourceStore::list_children(db::DbSession& s, const FullyQualifiedResourceId& id,
                                    std::vector<FullyQualifiedResourceId>* out) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    out->clear();
    ResourceKey key{};
    const Status status = resolve_resource(s, id, &key);
    if (!is_ok(status)) {
        return status;
    }
    db::Statement st(s,
        "SELECT t.name, r.name FROM resources r JOIN resource_types t ON t.id = r.resource_type_id "
        "WHERE r.resource_parent_id = ? ORDER BY t.name, r.name");
    if (!st.ok()) {
        return st.error("list children");
    }
    st.bind_int64(1, key.v);
    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        out->push_back(FullyQualifiedResourceId{ResourceTypeName{st.column_text(0)}, ResourceId{st.column_text(1)}});
    }
    if (r == db::StepResult::Error) {
        return st.error("list children");
    }
    return ok_status();
}

// ============================================================================
// Policies
// ============================================================================

Status ResourceStore::resolve_policy(db::DbSession& s, const PolicyId& id, PolicyKey* out, GroupKey* group) {
    db::Statement st(s,
        "SELECT p.id, p.group_id FROM policies p "
        "JOIN resources r ON r.id = p.resource_id "
        "JOIN resource_types t ON t.id = r.resource_type_id "
        "WHERE t.name = ? AND r.name = ? AND p.name = ?");
    if (!st.ok()) {
        return st.error("resolve policy");
    }
    st.bind_text(1, id.resource.type.v);
    st.bind_text(2, id.resource.id.v);
    st.bind_text(3, id.name.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("resolve policy");
    }
    if (r == db::StepResult::Done) {
        return s.fail(sec_status(StatusCode::NotFound), "policy " + to_string(id) + " not found");
    }
    if (out != nullptr) {
        *out = PolicyKey{st.column_int64(0)};
    }
    if (group != nullptr) {
        *group = GroupKey{st.column_int64(1)};
    }
    return ok_status();
}

Status ResourceStore::validate_spec(db::DbSession& s, const PolicyId& id, const AccessPolicyMembership& spec) {
    if (types_.find(id.resource.type) == nullptr) {
        return s.fail(sec_status(StatusCode::NotFound), "resource type " + id.resource.type.v + " not found");
    }
    if (!valid_resource_id(id.name.v)) {
        return s.fail(sec_status(StatusCode::Invalid), "invalid policy name '" + id.name.v + "'");
    }

    auto check_grants = [&](const ResourceTypeName& type, const std::set<RoleName>& roles,
                            const std::set<ActionName>& actions, const char* where) -> Status {
        for (const RoleName& role : roles) {
            if (!types_.has_role(type, role)) {
                return s.fail(sec_status(StatusCode::Invalid),
                              std::string(where) + ": role '" + role.v + "' is not a role of " + type.v);
            }
        }
        for (const ActionName& action : actions) {
            if (!types_.action_allowed(type, action)) {
                return s.fail(sec_status(StatusCode::Invalid),
                              std::string(where) + ": action '" + action.v + "' is not valid for " + type.v);
            }
        }
        return ok_status();
    };

    Status status = check_grants(id.resource.type, spec.roles, spec.actions, "policy");
    if (!is_ok(status)) {
        return status;
    }
    for (const DescendantPermissions& dp : spec.descendant_permissions) {
        if (types_.find(dp.resource_type) == nullptr) {
            return s.fail(sec_status(StatusCode::Invalid),
                          "descendant permissions name unknown resource type " + dp.resource_type.v);
        }
        status = check_grants(dp.resource_type, dp.roles, dp.actions, "descendant permissions");
        if (!is_ok(status)) {
            return status;
        }
    }
    return ok_status();
}

Status ResourceStore::write_grants(db::DbSession& s, PolicyKey policy, ResourceTypeKey own_type,
                                   const AccessPolicyMembership& spec) {
    for (const char* sql : {"DELETE FROM policy_roles WHERE policy_id = ?", "DELETE FROM policy_actions WHERE policy_id = ?"}) {
        db::Statement st(s, sql);
        if (!st.ok()) {
            return st.error("clear grants");
        }
        st.bind_int64(1, policy.v);
        const Status status = st.run("clear grants");
        if (!is_ok(status)) {
            return status;
        }
    }

    db::Statement role_st(s,
        "INSERT OR IGNORE INTO policy_roles (policy_id, resource_type_id, role, descendants_only) VALUES (?, ?, ?, ?)");
    db::Statement action_st(s,
        "INSERT OR IGNORE INTO policy_actions (policy_id, resource_type_id, action, descendants_only) VALUES (?, ?, ?, ?)");
    if (!role_st.ok()) {
        return role_st.error("prepare grants");
    }
    if (!action_st.ok()) {
        return action_st.error("prepare grants");
    }

    auto write = [&](ResourceTypeKey type, const std::set<RoleName>& roles, const std::set<ActionName>& actions,
                     bool descendants_only) -> Status {
        for (const RoleName& role : roles) {
            role_st.reset();
            role_st.bind_int64(1, policy.v);
            role_st.bind_int64(2, type.v);
            role_st.bind_text(3, role.v);
            role_st.bind_int64(4, descendants_only ? 1 : 0);
            const Status status = role_st.run("insert policy role " + role.v);
            if (!is_ok(status)) {
                return status;
            }
        }
        for (const ActionName& action : actions) {
            action_st.reset();
            action_st.bind_int64(1, policy.v);
            action_st.bind_int64(2, type.v);
            action_st.bind_text(3, action.v);
            action_st.bind_int64(4, descendants_only ? 1 : 0);
            const Status status = action_st.run("insert policy action " + action.v);
            if (!is_ok(status)) {
                return status;
            }
        }
        return ok_status();
    };

    Status status = write(own_type, spec.roles, spec.actions, false);
    if (!is_ok(status)) {
        return status;
    }
    for (const DescendantPermissions& dp : spec.descendant_permissions) {
        ResourceTypeKey key{};
        status = resolve_type(s, dp.resource_type, &key);
        if (!is_ok(status)) {
            return status;
        }
        status = write(key, dp.roles, dp.actions, true);
        if (!is_ok(status)) {
            return status;
        }
    }
    return ok_status();
}

Status ResourceStore::load_grants(db::DbSession& s, PolicyKey policy, Grants* out) {
    Grants g;
    std::map<ResourceTypeName, DescendantPermissions> descendants;

    const char* queries[] = {
        "SELECT t.name, x.role, x.descendants_only FROM policy_roles x "
        "JOIN resource_types t ON t.id = x.resource_type_id WHERE x.policy_id = ?",
        "SELECT t.name, x.action, x.descendants_only FROM policy_actions x "
        "JOIN resource_types t ON t.id = x.resource_type_id WHERE x.policy_id = ?",
    };
    for (int q = 0; q < 2; ++q) {
        db::Statement st(s, queries[q]);
        if (!st.ok()) {
            return st.error("load grants");
        }
        st.bind_int64(1, policy.v);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            const bool descendants_only = st.column_int64(2) != 0;
            std::string value = st.column_text(1);
            if (!descendants_only) {
                if (q == 0) {
                    g.roles.insert(RoleName{std::move(value)});
                } else {
                    g.actions.insert(ActionName{std::move(value)});
                }
                continue;
            }
            const ResourceTypeName type{st.column_text(0)};
            DescendantPermissions& dp = descendants[type];
            dp.resource_type = type;
            if (q == 0) {
                dp.roles.insert(RoleName{std::move(value)});
            } else {
                dp.actions.insert(ActionName{std::move(value)});
            }
        }
        if (r == db::StepResult::Error) {
            return st.error("load grants");
        }
    }
    for (auto& [type, dp] : descendants) {
        g.descendant_permissions.insert(std::move(dp));
    }

    db::Statement st(s, "SELECT public FROM policies WHERE id = ?");
    if (!st.ok()) {
        return st.error("load policy");
    }
    st.bind_int64(1, policy.v);
    if (st.step() != db::StepResult::Row) {
        return st.error("load policy");
    }
    g.is_public = st.column_int64(0) != 0;

    *out = std::move(g);
    return ok_status();
}

Status ResourceStore::create_policy(db::DbSession& s, const PolicyId& id, const AccessPolicyMembership& spec,
                                    AccessPolicy* out) {
    Status status = validate_spec(s, id, spec);
    if (!is_ok(status)) {
        return status;
    }

    ResourceKey resource{};
    ResourceTypeKey type_key{};
    status = resolve_resource(s, id.resource, &resource, &type_key);
    if (!is_ok(status)) {
        return status;
    }

    status = resolve_policy(s, id, nullptr, nullptr);
    if (is_ok(status)) {
        return s.fail(sec_status(StatusCode::Conflict), "policy " + to_string(id) + " already exists");
    }
    if (status.code != StatusCode::NotFound) {
        return status;
    }

    Email email;
    status = derive_policy_email(id, email_domain_, &email);
    if (!is_ok(status)) {
        return s.fail(sec_status(StatusCode::Invalid), "no email domain configured for policy addresses");
    }

    GroupKey group{};
    status = groups_.insert_group_row(s, policy_group_name(id), email, &group);
    if (!is_ok(status)) {
        return status;
    }

    {
        db::Statement st(s, "INSERT INTO policies (resource_id, group_id, name, public) VALUES (?, ?, ?, ?)");
        if (!st.ok()) {
            return st.error("insert policy");
        }
        st.bind_int64(1, resource.v);
        st.bind_int64(2, group.v);
        st.bind_text(3, id.name.v);
        st.bind_int64(4, spec.is_public.value_or(false) ? 1 : 0);
        status = st.run("insert policy " + to_string(id));
        if (!is_ok(status)) {
            return status;
        }
    }
    const PolicyKey policy{s.last_insert_rowid()};

    status = write_grants(s, policy, type_key, spec);
    if (!is_ok(status)) {
        return status;
    }

    for (const Subject& m : spec.members) {
        bool added = false;
        status = groups_.link_member(s, group, m, &added);
        if (!is_ok(status)) {
            return status;
        }
    }

    if (out != nullptr) {
        return load_policy(s, id, out);
    }
    return ok_status();
}

Status ResourceStore::overwrite_policy(db::DbSession& s, const PolicyId& id, const AccessPolicyMembership& spec,
                                       AccessPolicy* out, std::vector<Subject>* changed) {
    if (changed != nullptr) {
        changed->clear();
    }
    Status status = validate_spec(s, id, spec);
    if (!is_ok(status)) {
        return status;
    }

    PolicyKey policy{};
    GroupKey group{};
    status = resolve_policy(s, id, &policy, &group);
    if (status.code == StatusCode::NotFound) {
        status = create_policy(s, id, spec, out);
        if (is_ok(status) && changed != nullptr) {
            changed->assign(spec.members.begin(), spec.members.end());
        }
        return status;
    }
    if (!is_ok(status)) {
        return status;
    }

    std::set<Subject> current;
    status = groups_.load_members(s, group, &current);
    if (!is_ok(status)) {
        return status;
    }
    const std::vector<Subject> to_add = set_difference_of(spec.members, current);
    const std::vector<Subject> to_remove = set_difference_of(current, spec.members);

    bool modified = false;
    for (const Subject& m : to_remove) {
        bool removed = false;
        status = groups_.unlink_member(s, group, m, &removed);
        if (!is_ok(status)) {
            return status;
        }
        modified = modified || removed;
    }
    for (const Subject& m : to_add) {
        bool added = false;
        status = groups_.link_member(s, group, m, &added);
        if (!is_ok(status)) {
            return status;
        }
        modified = modified || added;
    }

    Grants grants;
    status = load_grants(s, policy, &grants);
    if (!is_ok(status)) {
        return status;
    }
    if (grants.roles != spec.roles || grants.actions != spec.actions ||
        grants.descendant_permissions != spec.descendant_permissions) {
        ResourceKey resource{};
        ResourceTypeKey type_key{};
        status = resolve_resource(s, id.resource, &resource, &type_key);
        if (!is_ok(status)) {
            return status;
        }
        status = write_grants(s, policy, type_key, spec);
        if (!is_ok(status)) {
            return status;
        }
        modified = true;
    }

    if (spec.is_public && *spec.is_public != grants.is_public) {
        db::Statement st(s, "UPDATE policies SET public = ? WHERE id = ?");
        if (!st.ok()) {
            return st.error("update policy");
        }
        st.bind_int64(1, *spec.is_public ? 1 : 0);
        st.bind_int64(2, policy.v);
        status = st.run("update policy");
        if (!is_ok(status)) {
            return status;
        }
        modified = true;
    }

    if (modified) {
        status = groups_.bump_version(s, group);
        if (!is_ok(status)) {
            return status;
        }
    }
    if (changed != nullptr) {
        changed->insert(changed->end(), to_remove.begin(), to_remove.end());
        changed->insert(changed->end(), to_add.begin(), to_add.end());
    }
    if (out != nullptr) {
        return load_policy(s, id, out);
    }
    return ok_status();
}

Status ResourceStore::check_policy_unreferenced(db::DbSession& s, const PolicyId& id, GroupKey group) {
    (void)group;
    std::vector<GroupIdentity> parents;
    const Status status = groups_.list_parent_groups(s, id, &parents);
    if (!is_ok(status)) {
        return status;
    }
    if (parents.empty()) {
        return ok_status();
    }
    std::vector<std::string> names;
    for (const GroupIdentity& p : parents) {
        names.push_back(to_string(p));
    }
    return s.fail(sec_status(StatusCode::ReferentialIntegrity),
                  "policy " + to_string(id) + " cannot be deleted: it is a member of " + join_names(names));
}

Status ResourceStore::remove_policy(db::DbSession& s, const PolicyId& id, PolicyKey policy, GroupKey group) {
    db::Statement st(s, "DELETE FROM policies WHERE id = ?");
    if (!st.ok()) {
        return st.error("delete policy");
    }
    st.bind_int64(1, policy.v);
    const Status status = st.run("delete policy " + to_string(id));
    if (!is_ok(status)) {
        return status;
    }
    return groups_.delete_group_row(s, group);
}

Status ResourceStore::delete_policy(db::DbSession& s, const PolicyId& id) {
    PolicyKey policy{};
    GroupKey group{};
    Status status = resolve_policy(s, id, &policy, &group);
    if (!is_ok(status)) {
        return status;
    }
    status = check_policy_unreferenced(s, id, group);
    if (!is_ok(status)) {
        return status;
    }
    return remove_policy(s, id, policy, group);
}

Status ResourceStore::load_policy(db::DbSession& s, const PolicyId& id, AccessPolicy* out) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    PolicyKey policy{};
    Status status = resolve_policy(s, id, &policy, nullptr);
    if (!is_ok(status)) {
        return status;
    }
    Group group;
    status = groups_.load_group(s, id, &group);
    if (!is_ok(status)) {
        return status;
    }
    Grants grants;
    status = load_grants(s, policy, &grants);
    if (!is_ok(status)) {
        return status;
    }

    AccessPolicy p;
    p.id = id;
    p.members = std::move(group.members);
    p.email = std::move(group.email);
    p.roles = std::move(grants.roles);
    p.actions = std::move(grants.actions);
    p.descendant_permissions = std::move(grants.descendant_permissions);
    p.is_public = grants.is_public;
    p.version = group.version;
    p.last_synchronized_version = group.last_synchronized_version;
    *out = std::move(p);
    return ok_status();
}

Status ResourceStore::list_policies(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                    std::vector<AccessPolicy>* out) {
    if (out == nullptr) {
        return sec_status(StatusCode::Invalid);
    }
    out->clear();
    ResourceKey key{};
    Status status = resolve_resource(s, resource, &key);
    if (!is_ok(status)) {
        return status;
    }

    std::vector<PolicyName> names;
    {
        db::Statement st(s, "SELECT name FROM policies WHERE resource_id = ? ORDER BY name");
        if (!st.ok()) {
            return st.error("list policies");
        }
        st.bind_int64(1, key.v);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            names.push_back(PolicyName{st.column_text(0)});
        }
        if (r == db::StepResult::Error) {
            return st.error("list policies");
        }
    }
    for (const PolicyName& name : names) {
        AccessPolicy p;
        status = load_policy(s, PolicyId{resource, name}, &p);
        if (!is_ok(status)) {
            return status;
        }
        out->push_back(std::move(p));
    }
    return ok_status();
}

Status ResourceStore::set_public(db::DbSession& s, const PolicyId& id, bool is_public, bool* changed) {
    PolicyKey policy{};
    GroupKey group{};
    Status status = resolve_policy(s, id, &policy, &group);
    if (!is_ok(status)) {
        return status;
    }
    db::Statement st(s, "UPDATE policies SET public = ?1 WHERE id = ?2 AND public <> ?1");
    if (!st.ok()) {
        return st.error("set public");
    }
    st.bind_int64(1, is_public ? 1 : 0);
    st.bind_int64(2, policy.v);
    status = st.run("set public");
    if (!is_ok(status)) {
        return status;
    }
    const bool updated = s.changes() > 0;
    if (changed != nullptr) {
        *changed = updated;
    }
    return updated ? groups_.bump_version(s, group) : ok_status();
}

} // namespace warden::security
