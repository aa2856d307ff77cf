#include "warden/security/evaluator.hpp"

#include <string>
#include <utility>

namespace warden::security {

using namespace warden::core;

namespace {
    [[nodiscard]] Status invalid_arg() noexcept {
        return make_status(StatusDomain::Security, StatusCode::Invalid);
    }

    // Roles and actions of one policy that apply to resources of `type`.
    // Direct grants are stored against the policy's own type, descendant
    // grants against the type they reach.
    Status load_type_grants(db::DbSession& s, PolicyKey policy, ResourceTypeKey type, bool descendants_only,
                            std::set<RoleName>* roles, std::set<ActionName>* actions) {
        db::Statement st(s,
            "SELECT 0, role FROM policy_roles "
            "WHERE policy_id = ?1 AND resource_type_id = ?2 AND descendants_only = ?3 "
            "UNION ALL "
            "SELECT 1, action FROM policy_actions "
            "WHERE policy_id = ?1 AND resource_type_id = ?2 AND descendants_only = ?3");
        if (!st.ok()) {
            return st.error("load grants");
        }
        st.bind_int64(1, policy.v);
        st.bind_int64(2, type.v);
        st.bind_int64(3, descendants_only ? 1 : 0);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            if (st.column_int64(0) == 0) {
                roles->insert(RoleName{st.column_text(1)});
            } else {
                actions->insert(ActionName{st.column_text(1)});
            }
        }
        if (r == db::StepResult::Error) {
            return st.error("load grants");
        }
        return ok_status();
    }
} // namespace

// ============================================================================
// Single-resource queries
// ============================================================================

Status PolicyEvaluator::visit_grants(db::DbSession& s, const FullyQualifiedResourceId& resource, const UserId& user,
                                     const std::function<bool(const PolicyGrant&)>& visit, bool* found) {
    if (found != nullptr) {
        *found = false;
    }
    ResourceKey key{};
    ResourceTypeKey type{};
    Status status = resources_.resolve_resource(s, resource, &key, &type);
    if (status.code == StatusCode::NotFound) {
        return ok_status();
    }
    if (!is_ok(status)) {
        return status;
    }
    if (found != nullptr) {
        *found = true;
    }

    struct Candidate {
        i64 depth;
        PolicyKey policy;
        GroupKey group;
        PolicyName name;
        bool is_public;
    };
    std::vector<Candidate> candidates;
    {
        db::Statement st(s,
            "WITH RECURSIVE ancestry(id, depth) AS ("
            "    SELECT ?1, 0 "
            "    UNION ALL "
            "    SELECT r.resource_parent_id, a.depth + 1 FROM resources r JOIN ancestry a ON r.id = a.id "
            "    WHERE r.resource_parent_id IS NOT NULL) "
            "SELECT a.depth, p.id, p.group_id, p.name, p.public "
            "FROM ancestry a JOIN policies p ON p.resource_id = a.id "
            "ORDER BY a.depth, p.name");
        if (!st.ok()) {
            return st.error("policy ancestry");
        }
        st.bind_int64(1, key.v);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            candidates.push_back(Candidate{st.column_int64(0), PolicyKey{st.column_int64(1)},
                                           GroupKey{st.column_int64(2)}, PolicyName{st.column_text(3)},
                                           st.column_int64(4) != 0});
        }
        if (r == db::StepResult::Error) {
            return st.error("policy ancestry");
        }
    }

    const directory::MemberKey member{user};
    for (const Candidate& c : candidates) {
        if (!c.is_public) {
            bool member_of = false;
            status = index_.is_member(s, c.group, member, &member_of);
            if (!is_ok(status)) {
                return status;
            }
            if (!member_of) {
                continue;
            }
        }
        PolicyGrant grant;
        grant.policy = c.name;
        grant.depth = c.depth;
        grant.is_public = c.is_public;
        status = load_type_grants(s, c.policy, type, c.depth > 0, &grant.roles, &grant.actions);
        if (!is_ok(status)) {
            return status;
        }
        // An ancestor policy with nothing for this type does not apply.
        if (c.depth > 0 && grant.roles.empty() && grant.actions.empty()) {
            continue;
        }
        if (!visit(grant)) {
            break;
        }
    }
    return ok_status();
}

Status PolicyEvaluator::has_permission(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                       const ActionName& action, const UserId& user, bool* out) {
    if (out == nullptr) {
        return invalid_arg();
    }
    *out = false;
    return visit_grants(s, resource, user, [&](const PolicyGrant& g) {
        if (g.actions.count(action) != 0 || types_.role_actions(resource.type, g.roles).count(action) != 0) {
            *out = true;
            return false;
        }
        return true;
    });
}

Status PolicyEvaluator::list_user_resource_actions(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                                   const UserId& user, std::set<ActionName>* out) {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();
    return visit_grants(s, resource, user, [&](const PolicyGrant& g) {
        out->insert(g.actions.begin(), g.actions.end());
        const std::set<ActionName> expanded = types_.role_actions(resource.type, g.roles);
        out->insert(expanded.begin(), expanded.end());
        return true;
    });
}

Status PolicyEvaluator::list_user_resource_roles(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                                 const UserId& user, std::set<RoleName>* out) {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();
    return visit_grants(s, resource, user, [&](const PolicyGrant& g) {
        out->insert(g.roles.begin(), g.roles.end());
        return true;
    });
}

Status PolicyEvaluator::list_user_policies(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                           const UserId& user, std::set<PolicyName>* out) {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();
    return visit_grants(s, resource, user, [&](const PolicyGrant& g) {
        if (g.depth == 0) {
            out->insert(g.policy);
        }
        return true;
    });
}

// ============================================================================
// Listings
// ============================================================================

Status PolicyEvaluator::list_filtered_resources(db::DbSession& s, const ResourceTypeName& type, const UserId& user,
                                                std::vector<FilteredResource>* out) {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();

    ResourceTypeKey type_key{};
    Status status = resources_.resolve_type(s, type, &type_key);
    if (!is_ok(status)) {
        return status;
    }

    std::vector<GroupKey> groups;
    status = index_.ancestor_groups(s, directory::MemberKey{user}, &groups);
    if (!is_ok(status)) {
        return status;
    }

    struct Candidate {
        PolicyKey policy;
        ResourceKey resource;
        i64 resource_type;
        ResourceId resource_id;
        PolicyName name;
        bool is_public;
    };
    std::vector<Candidate> candidates;
    {
        std::string sql =
            "SELECT p.id, p.resource_id, r.resource_type_id, r.name, p.name, p.public "
            "FROM policies p JOIN resources r ON r.id = p.resource_id "
            "WHERE p.public = 1";
        if (!groups.empty()) {
            sql += " OR p.group_id IN (";
            for (size_t i = 0; i < groups.size(); ++i) {
                sql += (i == 0) ? "?" : ",?";
            }
            sql += ")";
        }
        db::Statement st(s, sql.c_str());
        if (!st.ok()) {
            return st.error("candidate policies");
        }
        int idx = 1;
        for (GroupKey g : groups) {
            st.bind_int64(idx++, g.v);
        }
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            candidates.push_back(Candidate{PolicyKey{st.column_int64(0)}, ResourceKey{st.column_int64(1)},
                                           st.column_int64(2), ResourceId{st.column_text(3)},
                                           PolicyName{st.column_text(4)}, st.column_int64(5) != 0});
        }
        if (r == db::StepResult::Error) {
            return st.error("candidate policies");
        }
    }

    std::map<ResourceId, FilteredResource> by_id;
    auto entry = [&](const ResourceId& id) -> FilteredResource& {
        FilteredResource& fr = by_id[id];
        fr.resource = FullyQualifiedResourceId{type, id};
        return fr;
    };

    db::Statement descendants(s,
        "WITH RECURSIVE down(id) AS ("
        "    SELECT id FROM resources WHERE resource_parent_id = ?1 "
        "    UNION "
        "    SELECT r.id FROM resources r JOIN down d ON r.resource_parent_id = d.id) "
        "SELECT r.name FROM down JOIN resources r ON r.id = down.id WHERE r.resource_type_id = ?2");
    if (!descendants.ok()) {
        return descendants.error("descendant resources");
    }

    for (const Candidate& c : candidates) {
        if (c.resource_type == type_key.v) {
            FilteredResource& fr = entry(c.resource_id);
            fr.policies.insert(c.name);
            fr.is_public = fr.is_public || c.is_public;
            status = load_type_grants(s, c.policy, type_key, false, &fr.roles, &fr.actions);
            if (!is_ok(status)) {
                return status;
            }
        }

        std::set<RoleName> roles;
        std::set<ActionName> actions;
        status = load_type_grants(s, c.policy, type_key, true, &roles, &actions);
        if (!is_ok(status)) {
            return status;
        }
        if (roles.empty() && actions.empty()) {
            continue;
        }
        descendants.reset();
        descendants.bind_int64(1, c.resource.v);
        descendants.bind_int64(2, type_key.v);
        db::StepResult r;
        while ((r = descendants.step()) == db::StepResult::Row) {
            FilteredResource& fr = entry(ResourceId{descendants.column_text(0)});
            fr.roles.insert(roles.begin(), roles.end());
            fr.actions.insert(actions.begin(), actions.end());
        }
        if (r == db::StepResult::Error) {
            return descendants.error("descendant resources");
        }
    }

    for (auto& [id, fr] : by_id) {
        const std::set<ActionName> expanded = types_.role_actions(type, fr.roles);
        fr.actions.insert(expanded.begin(), expanded.end());
        out->push_back(std::move(fr));
    }
    return ok_status();
}

Status PolicyEvaluator::list_resources_and_roles(db::DbSession& s, const ResourceTypeName& type, const UserId& user,
                                                 std::map<ResourceId, std::set<RoleName>>* out) {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();
    std::vector<FilteredResource> resources;
    const Status status = list_filtered_resources(s, type, user, &resources);
    if (!is_ok(status)) {
        return status;
    }
    for (FilteredResource& fr : resources) {
        (*out)[fr.resource.id] = std::move(fr.roles);
    }
    return ok_status();
}

} // namespace warden::security
