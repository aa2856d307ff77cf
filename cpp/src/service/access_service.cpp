#include "warden/service/access_service.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "warden/core/log.hpp"
#include "warden/security/actions.hpp"
#include "warden/sync/versioning.hpp"

namespace warden::service {

using namespace warden::core;

namespace {
    [[nodiscard]] Status svc_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Service, code);
    }

    [[nodiscard]] Status null_out(ErrorReport* report) {
        const Status s = svc_status(StatusCode::Invalid);
        report_error(report, s, "missing output argument");
        return s;
    }

    void dedupe(std::vector<GroupIdentity>* groups) {
        std::sort(groups->begin(), groups->end());
        groups->erase(std::unique(groups->begin(), groups->end()), groups->end());
    }
} // namespace

AccessService::AccessService(db::DbHandle db, const security::ResourceTypeRegistry& types, std::string email_domain,
                             SubjectDirectory* directory, sync::MirrorNotifier* notifier)
    : db_(db),
      types_(types),
      groups_(index_),
      users_(groups_),
      resources_(types, groups_, std::move(email_domain)),
      evaluator_(types, resources_, index_),
      db_directory_(db, users_),
      directory_(directory != nullptr ? *directory : static_cast<SubjectDirectory&>(db_directory_)),
      notifier_(notifier != nullptr ? *notifier : static_cast<sync::MirrorNotifier&>(null_notifier_)) {}

Status AccessService::init(const RequestContext& ctx, ErrorReport* report) {
    const Status status = db::db_write(db_, "register_resource_types", ctx, [&](db::DbSession& s) {
        return resources_.register_resource_types(s);
    }, report);
    if (is_ok(status)) {
        log_info("registered %zu resource types", types_.size());
    }
    return status;
}

// ============================================================================
// Helpers
// ============================================================================

Status AccessService::validate_type(const ResourceTypeName& type, ErrorReport* report) const {
    if (types_.find(type) == nullptr) {
        const Status s = svc_status(StatusCode::NotFound);
        report_error(report, s, "resource type " + type.v + " not found");
        return s;
    }
    return ok_status();
}

Status AccessService::caller_enabled(const RequestContext& ctx, const UserId& user, bool* out,
                                     ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return directory_.enabled(ctx, user, out, report);
}

Status AccessService::require_enabled(const RequestContext& ctx, const UserId& user, ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    if (!enabled) {
        const Status s = svc_status(StatusCode::PermissionDenied);
        report_error(report, s, "user " + user.v + " is disabled or unknown");
        return s;
    }
    return ok_status();
}

Status AccessService::authorize(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                const std::vector<ActionName>& actions, const UserId& user, bool enabled) {
    ResourceKey key{};
    Status status = resources_.resolve_resource(s, resource, &key);
    if (!is_ok(status)) {
        return status;
    }

    std::set<ActionName> held;
    if (enabled) {
        status = evaluator_.list_user_resource_actions(s, resource, user, &held);
        if (!is_ok(status)) {
            return status;
        }
    }
    for (const ActionName& action : actions) {
        if (held.count(action) != 0) {
            return ok_status();
        }
    }
    if (held.empty()) {
        return s.fail(svc_status(StatusCode::NotFound), "resource " + to_string(resource) + " not found");
    }

    std::string wanted;
    for (const ActionName& action : actions) {
        if (!wanted.empty()) {
            wanted += " or ";
        }
        wanted += action.v;
    }
    return s.fail(svc_status(StatusCode::PermissionDenied),
                  "user " + user.v + " may not " + wanted + " on " + to_string(resource));
}

Status AccessService::collect_mirror_targets(db::DbSession& s, const GroupIdentity& group,
                                             std::vector<GroupIdentity>* out) {
    std::vector<GroupIdentity> ancestors;
    const Status status = groups_.list_ancestor_groups(s, to_subject(group), &ancestors);
    if (!is_ok(status)) {
        return status;
    }
    out->push_back(group);
    out->insert(out->end(), ancestors.begin(), ancestors.end());
    return ok_status();
}

void AccessService::publish(const RequestContext& ctx, const std::vector<GroupIdentity>& targets,
                            const std::vector<Subject>& changed) noexcept {
    for (const GroupIdentity& group : targets) {
        try {
            notifier_.notify(sync::MirrorEvent{group, changed, ctx.trace_id});
        } catch (const std::exception& e) {
            log_error("mirror event for %s not sent: %s", to_string(group).c_str(), e.what());
        }
    }
}

// ============================================================================
// Users
// ============================================================================

Status AccessService::create_user(const RequestContext& ctx, const UserId& id, const Email& email, bool enabled,
                                  User* out, ErrorReport* report) {
    return db::db_write(db_, "create_user", ctx, [&](db::DbSession& s) {
        return users_.create_user(s, id, email, enabled, out);
    }, report);
}

Status AccessService::load_user(const RequestContext& ctx, const UserId& id, User* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return directory_.load_user(ctx, id, out, report);
}

Status AccessService::delete_user(const RequestContext& ctx, const UserId& id, ErrorReport* report) {
    std::vector<GroupIdentity> targets;
    const Status status = db::db_write(db_, "delete_user", ctx, [&](db::DbSession& s) {
        targets.clear();
        std::vector<GroupIdentity> affected;
        Status st = users_.delete_user(s, id, &affected);
        if (!is_ok(st)) {
            return st;
        }
        for (const GroupIdentity& g : affected) {
            st = collect_mirror_targets(s, g, &targets);
            if (!is_ok(st)) {
                return st;
            }
        }
        return ok_status();
    }, report);
    if (is_ok(status)) {
        dedupe(&targets);
        publish(ctx, targets, {Subject{id}});
    }
    return status;
}

Status AccessService::set_user_enabled(const RequestContext& ctx, const UserId& id, bool enabled,
                                       ErrorReport* report) {
    return db::db_write(db_, enabled ? "enable_user" : "disable_user", ctx, [&](db::DbSession& s) {
        return users_.set_enabled(s, id, enabled);
    }, report);
}

// ============================================================================
// Groups
// ============================================================================

Status AccessService::create_group(const RequestContext& ctx, const GroupName& name, const Email& email,
                                   const std::set<Subject>& members, Group* out, ErrorReport* report) {
    const Status status = db::db_write(db_, "create_group", ctx, [&](db::DbSession& s) {
        return groups_.create_group(s, name, email, members, out);
    }, report);
    if (is_ok(status) && !members.empty()) {
        publish(ctx, {GroupIdentity{name}}, std::vector<Subject>(members.begin(), members.end()));
    }
    return status;
}

Status AccessService::load_group(const RequestContext& ctx, const GroupIdentity& id, Group* out,
                                 ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "load_group", ctx, [&](db::DbSession& s) {
        return groups_.load_group(s, id, out);
    }, report);
}

Status AccessService::delete_group(const RequestContext& ctx, const GroupName& name, ErrorReport* report) {
    return db::db_write(db_, "delete_group", ctx, [&](db::DbSession& s) {
        return groups_.delete_group(s, name);
    }, report);
}

Status AccessService::add_member(const RequestContext& ctx, const GroupIdentity& group, const Subject& member,
                                 bool* added, ErrorReport* report) {
    bool changed = false;
    std::vector<GroupIdentity> targets;
    const Status status = db::db_write(db_, "add_member", ctx, [&](db::DbSession& s) {
        targets.clear();
        Status st = groups_.add_member(s, group, member, &changed);
        if (!is_ok(st) || !changed) {
            return st;
        }
        return collect_mirror_targets(s, group, &targets);
    }, report);
    if (added != nullptr) {
        *added = is_ok(status) && changed;
    }
    if (is_ok(status) && changed) {
        publish(ctx, targets, {member});
    }
    return status;
}

Status AccessService::remove_member(const RequestContext& ctx, const GroupIdentity& group, const Subject& member,
                                    bool* removed, ErrorReport* report) {
    bool changed = false;
    std::vector<GroupIdentity> targets;
    const Status status = db::db_write(db_, "remove_member", ctx, [&](db::DbSession& s) {
        targets.clear();
        Status st = groups_.remove_member(s, group, member, &changed);
        if (!is_ok(st) || !changed) {
            return st;
        }
        return collect_mirror_targets(s, group, &targets);
    }, report);
    if (removed != nullptr) {
        *removed = is_ok(status) && changed;
    }
    if (is_ok(status) && changed) {
        publish(ctx, targets, {member});
    }
    return status;
}

Status AccessService::is_member(const RequestContext& ctx, const GroupIdentity& group, const Subject& member,
                                bool* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "is_member", ctx, [&](db::DbSession& s) {
        return groups_.is_member(s, group, member, out);
    }, report);
}

Status AccessService::list_direct_memberships(const RequestContext& ctx, const Subject& subject,
                                              std::vector<GroupIdentity>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "list_direct_memberships", ctx, [&](db::DbSession& s) {
        return groups_.list_direct_memberships(s, subject, out);
    }, report);
}

Status AccessService::list_parent_groups(const RequestContext& ctx, const GroupIdentity& group,
                                         std::vector<GroupIdentity>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "list_parent_groups", ctx, [&](db::DbSession& s) {
        return groups_.list_parent_groups(s, group, out);
    }, report);
}

Status AccessService::list_ancestor_groups(const RequestContext& ctx, const Subject& subject,
                                           std::vector<GroupIdentity>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "list_ancestor_groups", ctx, [&](db::DbSession& s) {
        return groups_.list_ancestor_groups(s, subject, out);
    }, report);
}

Status AccessService::list_flattened_members(const RequestContext& ctx, const GroupIdentity& group,
                                             std::vector<UserId>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "list_flattened_members", ctx, [&](db::DbSession& s) {
        return groups_.list_flattened_members(s, group, out);
    }, report);
}

Status AccessService::intersect_groups(const RequestContext& ctx, const std::vector<GroupIdentity>& groups,
                                       std::vector<UserId>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "intersect_groups", ctx, [&](db::DbSession& s) {
        return groups_.intersect_groups(s, groups, out);
    }, report);
}

Status AccessService::load_group_email(const RequestContext& ctx, const GroupIdentity& group, Email* out,
                                       ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "load_group_email", ctx, [&](db::DbSession& s) {
        return groups_.load_email(s, group, out);
    }, report);
}

Status AccessService::load_subject_from_email(const RequestContext& ctx, const Email& email, Subject* out,
                                              ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "load_subject_from_email", ctx, [&](db::DbSession& s) {
        return groups_.load_subject_from_email(s, email, out);
    }, report);
}

// ============================================================================
// Mirror bookkeeping
// ============================================================================

Status AccessService::load_sync_state(const RequestContext& ctx, const GroupIdentity& group, SyncState* out,
                                      ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "load_sync_state", ctx, [&](db::DbSession& s) {
        return sync::load_sync_state(s, groups_, group, out);
    }, report);
}

Status AccessService::record_group_synchronized(const RequestContext& ctx, const GroupIdentity& group,
                                                i64 synced_version, bool* advanced, ErrorReport* report) {
    bool moved = false;
    const Status status = db::db_write(db_, "record_synchronized", ctx, [&](db::DbSession& s) {
        return sync::record_synchronized(s, groups_, group, synced_version, &moved);
    }, report);
    if (advanced != nullptr) {
        *advanced = is_ok(status) && moved;
    }
    return status;
}

Status AccessService::list_unsynchronized_groups(const RequestContext& ctx, u32 limit,
                                                 std::vector<GroupIdentity>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "list_unsynchronized_groups", ctx, [&](db::DbSession& s) {
        return sync::list_unsynchronized_groups(s, groups_, limit, out);
    }, report);
}

// ============================================================================
// Resources
// ============================================================================

Status AccessService::create_resource(const RequestContext& ctx, const FullyQualifiedResourceId& id,
                                      const UserId& caller, const std::optional<FullyQualifiedResourceId>& parent,
                                      const std::set<GroupName>& auth_domain, Resource* out, ErrorReport* report) {
    Status status = validate_type(id.type, report);
    if (!is_ok(status)) {
        return status;
    }
    status = require_enabled(ctx, caller, report);
    if (!is_ok(status)) {
        return status;
    }

    const PolicyId owner{id, PolicyName{types_.find(id.type)->owner_role.v}};
    std::vector<GroupIdentity> targets;
    status = db::db_write(db_, "create_resource", ctx, [&](db::DbSession& s) {
        targets.clear();
        if (parent) {
            const Status st = authorize(s, *parent, {ActionName{security::kActionAddChild}}, caller, true);
            if (!is_ok(st)) {
                return st;
            }
        }
        const Status st = resources_.create_resource(s, id, caller, parent, auth_domain, out);
        if (!is_ok(st)) {
            return st;
        }
        targets.push_back(owner);
        return ok_status();
    }, report);
    if (is_ok(status)) {
        log_info("resource %s created by %s [trace=%s]", to_string(id).c_str(), caller.v.c_str(),
                 ctx.trace_id.c_str());
        publish(ctx, targets, {Subject{caller}});
    }
    return status;
}

Status AccessService::load_resource(const RequestContext& ctx, const FullyQualifiedResourceId& id, Resource* out,
                                    ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "load_resource", ctx, [&](db::DbSession& s) {
        return resources_.load_resource(s, id, out);
    }, report);
}

Status AccessService::delete_resource(const RequestContext& ctx, const FullyQualifiedResourceId& id,
                                      const UserId& caller, ErrorReport* report) {
    bool enabled = false;
    Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    std::vector<PolicyId> deleted;
    status = db::db_write(db_, "delete_resource", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, id, {ActionName{security::kActionDelete}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.delete_resource(s, id, &deleted);
    }, report);
    if (is_ok(status)) {
        log_info("resource %s deleted with %zu policies [trace=%s]", to_string(id).c_str(), deleted.size(),
                 ctx.trace_id.c_str());
    }
    return status;
}

Status AccessService::set_parent(const RequestContext& ctx, const FullyQualifiedResourceId& child,
                                 const FullyQualifiedResourceId& parent, const UserId& caller, ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_write(db_, "set_parent", ctx, [&](db::DbSession& s) {
        Status st = authorize(s, child, {ActionName{security::kActionSetParent}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        std::optional<FullyQualifiedResourceId> current;
        st = resources_.get_parent(s, child, &current);
        if (!is_ok(st)) {
            return st;
        }
        st = authorize(s, parent, {ActionName{security::kActionAddChild}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        if (current && *current != parent) {
            st = authorize(s, *current, {ActionName{security::kActionRemoveChild}}, caller, enabled);
            if (!is_ok(st)) {
                return st;
            }
        }
        return resources_.set_parent(s, child, parent);
    }, report);
}

Status AccessService::get_parent(const RequestContext& ctx, const FullyQualifiedResourceId& child,
                                 const UserId& caller, std::optional<FullyQualifiedResourceId>* out,
                                 ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_read(db_, "get_parent", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, child, {ActionName{security::kActionGetParent}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.get_parent(s, child, out);
    }, report);
}

Status AccessService::delete_parent(const RequestContext& ctx, const FullyQualifiedResourceId& child,
                                    const UserId& caller, bool* removed, ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_write(db_, "delete_parent", ctx, [&](db::DbSession& s) {
        Status st = authorize(s, child, {ActionName{security::kActionSetParent}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        std::optional<FullyQualifiedResourceId> current;
        st = resources_.get_parent(s, child, &current);
        if (!is_ok(st)) {
            return st;
        }
        if (current) {
            st = authorize(s, *current, {ActionName{security::kActionRemoveChild}}, caller, enabled);
            if (!is_ok(st)) {
                return st;
            }
        }
        return resources_.delete_parent(s, child, removed);
    }, report);
}

Status AccessService::list_children(const RequestContext& ctx, const FullyQualifiedResourceId& id,
                                    const UserId& caller, std::vector<FullyQualifiedResourceId>* out,
                                    ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_read(db_, "list_children", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, id, {ActionName{security::kActionListChildren}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.list_children(s, id, out);
    }, report);
}

// ============================================================================
// Policies
// ============================================================================

Status AccessService::create_policy(const RequestContext& ctx, const PolicyId& id,
                                    const AccessPolicyMembership& spec, const UserId& caller, AccessPolicy* out,
                                    ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    const Status result = db::db_write(db_, "create_policy", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, id.resource, {ActionName{security::kActionAlterPolicies}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.create_policy(s, id, spec, out);
    }, report);
    if (is_ok(result) && !spec.members.empty()) {
        publish(ctx, {GroupIdentity{id}}, std::vector<Subject>(spec.members.begin(), spec.members.end()));
    }
    return result;
}

Status AccessService::overwrite_policy(const RequestContext& ctx, const PolicyId& id,
                                       const AccessPolicyMembership& spec, const UserId& caller, AccessPolicy* out,
                                       ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    const std::vector<ActionName> gate{ActionName{security::kActionAlterPolicies},
                                       ActionName{std::string(security::kActionSharePolicyPrefix) + id.name.v}};
    std::vector<Subject> changed;
    std::vector<GroupIdentity> targets;
    const Status result = db::db_write(db_, "overwrite_policy", ctx, [&](db::DbSession& s) {
        targets.clear();
        Status st = authorize(s, id.resource, gate, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        st = resources_.overwrite_policy(s, id, spec, out, &changed);
        if (!is_ok(st) || changed.empty()) {
            return st;
        }
        return collect_mirror_targets(s, id, &targets);
    }, report);
    if (is_ok(result) && !changed.empty()) {
        publish(ctx, targets, changed);
    }
    return result;
}

Status AccessService::delete_policy(const RequestContext& ctx, const PolicyId& id, const UserId& caller,
                                    ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_write(db_, "delete_policy", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, id.resource, {ActionName{security::kActionAlterPolicies}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.delete_policy(s, id);
    }, report);
}

Status AccessService::list_policies(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                    const UserId& caller, std::vector<AccessPolicy>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_read(db_, "list_policies", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, resource, {ActionName{security::kActionReadPolicies}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.list_policies(s, resource, out);
    }, report);
}

Status AccessService::set_policy_public(const RequestContext& ctx, const PolicyId& id, bool is_public,
                                        const UserId& caller, ErrorReport* report) {
    bool enabled = false;
    const Status status = caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_write(db_, "set_policy_public", ctx, [&](db::DbSession& s) {
        const Status st = authorize(s, id.resource, {ActionName{security::kActionAlterPolicies}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        return resources_.set_public(s, id, is_public);
    }, report);
}

Status AccessService::load_policy(const RequestContext& ctx, const PolicyId& id, AccessPolicy* out,
                                  ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    return db::db_read(db_, "load_policy", ctx, [&](db::DbSession& s) {
        return resources_.load_policy(s, id, out);
    }, report);
}

// ============================================================================
// Evaluation
// ============================================================================

Status AccessService::check_permission(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                       const ActionName& action, const UserId& user, bool* out,
                                       ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    *out = false;
    Status status = validate_type(resource.type, report);
    if (!is_ok(status)) {
        return status;
    }
    if (!types_.action_allowed(resource.type, action)) {
        status = svc_status(StatusCode::Invalid);
        report_error(report, status, "action '" + action.v + "' is not defined for " + resource.type.v);
        return status;
    }
    bool enabled = false;
    status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status) || !enabled) {
        return status;
    }
    return db::db_read(db_, "check_permission", ctx, [&](db::DbSession& s) {
        return evaluator_.has_permission(s, resource, action, user, out);
    }, report);
}

Status AccessService::require_action(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                     const ActionName& action, const UserId& user, ErrorReport* report) {
    Status status = validate_type(resource.type, report);
    if (!is_ok(status)) {
        return status;
    }
    bool enabled = false;
    status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    return db::db_read(db_, "require_action", ctx, [&](db::DbSession& s) {
        return authorize(s, resource, {action}, user, enabled);
    }, report);
}

Status AccessService::list_user_resource_actions(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                                 const UserId& user, std::set<ActionName>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    out->clear();
    bool enabled = false;
    const Status status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status) || !enabled) {
        return status;
    }
    return db::db_read(db_, "list_user_resource_actions", ctx, [&](db::DbSession& s) {
        return evaluator_.list_user_resource_actions(s, resource, user, out);
    }, report);
}

Status AccessService::list_user_resource_roles(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                               const UserId& user, std::set<RoleName>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    out->clear();
    bool enabled = false;
    const Status status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status) || !enabled) {
        return status;
    }
    return db::db_read(db_, "list_user_resource_roles", ctx, [&](db::DbSession& s) {
        return evaluator_.list_user_resource_roles(s, resource, user, out);
    }, report);
}

Status AccessService::list_user_policies(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                         const UserId& user, std::set<PolicyName>* out, ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    out->clear();
    bool enabled = false;
    const Status status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status) || !enabled) {
        return status;
    }
    return db::db_read(db_, "list_user_policies", ctx, [&](db::DbSession& s) {
        return evaluator_.list_user_policies(s, resource, user, out);
    }, report);
}

Status AccessService::list_resources_and_roles(const RequestContext& ctx, const ResourceTypeName& type,
                                               const UserId& user, std::map<ResourceId, std::set<RoleName>>* out,
                                               ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    out->clear();
    Status status = validate_type(type, report);
    if (!is_ok(status)) {
        return status;
    }
    bool enabled = false;
    status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status) || !enabled) {
        return status;
    }
    return db::db_read(db_, "list_resources_and_roles", ctx, [&](db::DbSession& s) {
        return evaluator_.list_resources_and_roles(s, type, user, out);
    }, report);
}

Status AccessService::list_filtered_resources(const RequestContext& ctx, const ResourceTypeName& type,
                                              const UserId& user, std::vector<FilteredResource>* out,
                                              ErrorReport* report) {
    if (out == nullptr) {
        return null_out(report);
    }
    out->clear();
    Status status = validate_type(type, report);
    if (!is_ok(status)) {
        return status;
    }
    bool enabled = false;
    status = caller_enabled(ctx, user, &enabled, report);
    if (!is_ok(status) || !enabled) {
        return status;
    }
    return db::db_read(db_, "list_filtered_resources", ctx, [&](db::DbSession& s) {
        return evaluator_.list_filtered_resources(s, type, user, out);
    }, report);
}

} // namespace warden::service
