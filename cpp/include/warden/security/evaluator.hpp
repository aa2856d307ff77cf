#pragma once

#include <functional>
#include <map>
#include <set>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/types.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/membership_index.hpp"
#include "warden/security/resource_store.hpp"
#include "warden/security/resource_types.hpp"

namespace warden::security {
    using warden::core::FilteredResource;
    using warden::core::PolicyName;
    using warden::core::ResourceId;

    // Grants one applicable policy contributes to a single target resource.
    // `depth` is 0 for a policy on the target itself, otherwise the number
    // of parent hops to the resource holding it.
    struct PolicyGrant {
        PolicyName policy;
        core::i64 depth{0};
        bool is_public{false};
        std::set<RoleName> roles;
        std::set<ActionName> actions;
    };

    // Read-only permission queries. Grants are additive across policies; a
    // policy applies when the user is in its flattened membership or it is
    // public. Policies on ancestors contribute only their descendant
    // permissions for the target's type.
    //
    // A missing resource is not an error here: it has no grants, so checks
    // answer false and listings come back empty.
    class PolicyEvaluator {
    public:
        PolicyEvaluator(const ResourceTypeRegistry& types, ResourceStore& resources,
                        const directory::MembershipIndex& index) noexcept
            : types_(types), resources_(resources), index_(index) {}

        Status has_permission(db::DbSession& s, const FullyQualifiedResourceId& resource, const ActionName& action,
                              const UserId& user, bool* out);
        // Union of direct actions and the actions of every granted role.
        Status list_user_resource_actions(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                          const UserId& user, std::set<ActionName>* out);
        Status list_user_resource_roles(db::DbSession& s, const FullyQualifiedResourceId& resource,
                                        const UserId& user, std::set<RoleName>* out);
        // Policies directly on `resource` that apply to the user.
        Status list_user_policies(db::DbSession& s, const FullyQualifiedResourceId& resource, const UserId& user,
                                  std::set<PolicyName>* out);

        Status list_resources_and_roles(db::DbSession& s, const ResourceTypeName& type, const UserId& user,
                                        std::map<ResourceId, std::set<RoleName>>* out);
        // One entry per resource of `type` where the user holds any policy
        // membership, directly or through a descendant grant; ascending by id.
        Status list_filtered_resources(db::DbSession& s, const ResourceTypeName& type, const UserId& user,
                                       std::vector<FilteredResource>* out);

    private:
        // Calls `visit` for each applicable policy nearest first; stops when
        // it returns false. `found` is false when the resource does not exist.
        Status visit_grants(db::DbSession& s, const FullyQualifiedResourceId& resource, const UserId& user,
                            const std::function<bool(const PolicyGrant&)>& visit, bool* found = nullptr);

        const ResourceTypeRegistry& types_;
        ResourceStore& resources_;
        const directory::MembershipIndex& index_;
    };

} // namespace warden::security
