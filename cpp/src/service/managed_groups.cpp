#include "warden/service/managed_groups.hpp"

#include <vector>

#include "warden/core/log.hpp"
#include "warden/core/validation.hpp"
#include "warden/security/actions.hpp"

namespace warden::service {

using namespace warden::core;

namespace {
    [[nodiscard]] FullyQualifiedResourceId managed_resource(const ResourceId& id) {
        return FullyQualifiedResourceId{ResourceTypeName{kManagedGroupType}, id};
    }
} // namespace

Status ManagedGroupService::create_managed_group(const RequestContext& ctx, const ResourceId& id,
                                                 const UserId& creator, Resource* out, ErrorReport* report) {
    const ResourceTypeName type{kManagedGroupType};
    const RoleName member_role{kManagedGroupMemberRole};
    if (access_.types().find(type) == nullptr) {
        const Status s = make_status(StatusDomain::Service, StatusCode::NotFound);
        report_error(report, s, std::string("resource type ") + kManagedGroupType + " is not configured");
        return s;
    }
    if (!access_.types().has_role(type, member_role)) {
        const Status s = make_status(StatusDomain::Service, StatusCode::Invalid);
        report_error(report, s, std::string(kManagedGroupType) + " has no " + kManagedGroupMemberRole + " role");
        return s;
    }
    if (!valid_group_name(id.v)) {
        const Status s = make_status(StatusDomain::Service, StatusCode::Invalid);
        report_error(report, s, "invalid managed group id '" + id.v + "'");
        return s;
    }

    Status status = access_.require_enabled(ctx, creator, report);
    if (!is_ok(status)) {
        return status;
    }

    const FullyQualifiedResourceId resource = managed_resource(id);
    status = db::db_write(access_.db(), "create_managed_group", ctx, [&](db::DbSession& s) {
        security::ResourceStore& resources = access_.resources();
        Status st = resources.create_resource(s, resource, creator, std::nullopt, {}, out);
        if (!is_ok(st)) {
            return st;
        }

        AccessPolicyMembership members_policy;
        members_policy.roles.insert(member_role);
        st = resources.create_policy(s, PolicyId{resource, PolicyName{kManagedGroupMemberRole}}, members_policy);
        if (!is_ok(st)) {
            return st;
        }

        std::vector<AccessPolicy> policies;
        st = resources.list_policies(s, resource, &policies);
        if (!is_ok(st)) {
            return st;
        }
        std::set<Subject> aggregate;
        for (const AccessPolicy& p : policies) {
            aggregate.insert(p.id);
        }
        return access_.groups().create_group(s, GroupName{id.v}, Email{id.v + "@" + access_.email_domain()},
                                             aggregate);
    }, report);
    if (is_ok(status)) {
        log_info("managed group %s created by %s [trace=%s]", id.v.c_str(), creator.v.c_str(),
                 ctx.trace_id.c_str());
    }
    return status;
}

Status ManagedGroupService::delete_managed_group(const RequestContext& ctx, const ResourceId& id,
                                                 const UserId& caller, ErrorReport* report) {
    bool enabled = false;
    const Status status = access_.caller_enabled(ctx, caller, &enabled, report);
    if (!is_ok(status)) {
        return status;
    }
    const FullyQualifiedResourceId resource = managed_resource(id);
    return db::db_write(access_.db(), "delete_managed_group", ctx, [&](db::DbSession& s) {
        Status st = access_.authorize(s, resource, {ActionName{security::kActionDelete}}, caller, enabled);
        if (!is_ok(st)) {
            return st;
        }
        st = access_.groups().delete_group(s, GroupName{id.v});
        if (!is_ok(st)) {
            return st;
        }
        return access_.resources().delete_resource(s, resource);
    }, report);
}

Status ManagedGroupService::load_managed_group(const RequestContext& ctx, const ResourceId& id, Group* out,
                                               ErrorReport* report) {
    return access_.load_group(ctx, GroupName{id.v}, out, report);
}

Status ManagedGroupService::list_managed_groups(const RequestContext& ctx, const UserId& user,
                                                std::map<ResourceId, std::set<RoleName>>* out, ErrorReport* report) {
    return access_.list_resources_and_roles(ctx, ResourceTypeName{kManagedGroupType}, user, out, report);
}

} // namespace warden::service
