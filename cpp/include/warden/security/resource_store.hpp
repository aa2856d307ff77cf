#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/types.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/group_store.hpp"
#include "warden/security/resource_types.hpp"

namespace warden::security {
    using warden::core::AccessPolicy;
    using warden::core::AccessPolicyMembership;
    using warden::core::FullyQualifiedResourceId;
    using warden::core::GroupKey;
    using warden::core::GroupName;
    using warden::core::PolicyId;
    using warden::core::Resource;
    using warden::core::ResourceKey;
    using warden::core::ResourceTypeKey;
    using warden::core::Subject;
    using warden::core::UserId;

    // Resources, their hierarchy and the policies attached to them.
    //
    // A policy is stored as a directory group (its members) plus a policy
    // row (its grants), so membership changes take the same path as any
    // other group and stay visible to the flattening index. Methods run
    // inside a caller-owned transaction.
    class ResourceStore {
    public:
        ResourceStore(const ResourceTypeRegistry& types, directory::GroupStore& groups, std::string email_domain);

        [[nodiscard]] const ResourceTypeRegistry& types() const noexcept { return types_; }
        [[nodiscard]] const std::string& email_domain() const noexcept { return email_domain_; }

        // Persists every registered type; safe to repeat.
        Status register_resource_types(db::DbSession& s);
        Status create_resource_type(db::DbSession& s, const ResourceType& type);

        // Creates the resource and its owner policy (named after the type's
        // owner role) holding `creator`.
        Status create_resource(db::DbSession& s, const FullyQualifiedResourceId& id, const UserId& creator,
                               const std::optional<FullyQualifiedResourceId>& parent,
                               const std::set<GroupName>& auth_domain, Resource* out = nullptr);
        Status load_resource(db::DbSession& s, const FullyQualifiedResourceId& id, Resource* out);
        // Removes the resource with all of its policies. ReferentialIntegrity
        // while it has children or one of its policies belongs to a group.
        Status delete_resource(db::DbSession& s, const FullyQualifiedResourceId& id,
                               std::vector<PolicyId>* deleted_policies = nullptr);

        // InvalidGraph when `parent` is `child` or one of its descendants.
        Status set_parent(db::DbSession& s, const FullyQualifiedResourceId& child,
                          const FullyQualifiedResourceId& parent);
        Status get_parent(db::DbSession& s, const FullyQualifiedResourceId& child,
                          std::optional<FullyQualifiedResourceId>* out);
        Status delete_parent(db::DbSession& s, const FullyQualifiedResourceId& child, bool* removed);
        Status list_children(db::DbSession& s, const FullyQualifiedResourceId& id,
                             std::vector<FullyQualifiedResourceId>* out);

        // Conflict if the policy exists. Roles, actions and descendant
        // permissions are validated against the resource types.
        Status create_policy(db::DbSession& s, const PolicyId& id, const AccessPolicyMembership& spec,
                             AccessPolicy* out = nullptr);
        // Replaces everything in one step, creating the policy if needed.
        // `changed` receives the members added or removed.
        Status overwrite_policy(db::DbSession& s, const PolicyId& id, const AccessPolicyMembership& spec,
                                AccessPolicy* out = nullptr, std::vector<Subject>* changed = nullptr);
        Status delete_policy(db::DbSession& s, const PolicyId& id);
        Status load_policy(db::DbSession& s, const PolicyId& id, AccessPolicy* out);
        Status list_policies(db::DbSession& s, const FullyQualifiedResourceId& resource,
                             std::vector<AccessPolicy>* out);
        Status set_public(db::DbSession& s, const PolicyId& id, bool is_public, bool* changed = nullptr);

        Status resolve_resource(db::DbSession& s, const FullyQualifiedResourceId& id, ResourceKey* out,
                                ResourceTypeKey* type = nullptr);
        Status resolve_type(db::DbSession& s, const ResourceTypeName& name, ResourceTypeKey* out);

    private:
        struct Grants {
            std::set<RoleName> roles;
            std::set<ActionName> actions;
            std::set<core::DescendantPermissions> descendant_permissions;
            bool is_public{false};
        };

        Status validate_spec(db::DbSession& s, const PolicyId& id, const AccessPolicyMembership& spec);
        Status load_grants(db::DbSession& s, core::PolicyKey policy, Grants* out);
        Status write_grants(db::DbSession& s, core::PolicyKey policy, ResourceTypeKey own_type,
                            const AccessPolicyMembership& spec);
        Status resolve_policy(db::DbSession& s, const PolicyId& id, core::PolicyKey* out, GroupKey* group);
        Status check_policy_unreferenced(db::DbSession& s, const PolicyId& id, GroupKey group);
        Status remove_policy(db::DbSession& s, const PolicyId& id, core::PolicyKey policy, GroupKey group);

        const ResourceTypeRegistry& types_;
        directory::GroupStore& groups_;
        std::string email_domain_;
    };

} // namespace warden::security
