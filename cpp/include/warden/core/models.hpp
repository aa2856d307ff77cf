#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "warden/core/types.hpp"

namespace warden::core {

    struct User {
        UserId id;
        Email email;
        bool enabled{false};
        Timestamp created_at{0};
        Timestamp updated_at{0};
    };

    struct Group {
        GroupName name;
        Email email;
        std::set<Subject> members;
        i64 version{1};
        std::optional<i64> last_synchronized_version;
        std::optional<Timestamp> synchronized_at;
        Timestamp updated_at{0};
    };

    struct ResourceRole {
        RoleName name;
        std::set<ActionName> actions;

        friend bool operator==(const ResourceRole&, const ResourceRole&) = default;
    };

    // Immutable after boot. Action patterns are regular expressions matched
    // against the whole action name.
    struct ResourceType {
        ResourceTypeName name;
        std::set<std::string> action_patterns;
        std::map<RoleName, ResourceRole> roles;
        RoleName owner_role;

        friend bool operator==(const ResourceType&, const ResourceType&) = default;
    };

    struct Resource {
        FullyQualifiedResourceId id;
        std::set<GroupName> auth_domain;
        std::optional<FullyQualifiedResourceId> parent;
        Timestamp created_at{0};
    };

    // Grants that apply to every descendant of type `resource_type`,
    // never to the resource holding the policy.
    struct DescendantPermissions {
        ResourceTypeName resource_type;
        std::set<RoleName> roles;
        std::set<ActionName> actions;

        friend bool operator==(const DescendantPermissions&, const DescendantPermissions&) = default;
        friend auto operator<=>(const DescendantPermissions&, const DescendantPermissions&) = default;
    };

    struct AccessPolicy {
        PolicyId id;
        std::set<Subject> members;
        Email email;
        std::set<RoleName> roles;
        std::set<ActionName> actions;
        std::set<DescendantPermissions> descendant_permissions;
        bool is_public{false};
        i64 version{1};
        std::optional<i64> last_synchronized_version;
    };

    // Replacement payload for policy create/overwrite. An unset public flag
    // keeps the current value (false for a new policy).
    struct AccessPolicyMembership {
        std::set<Subject> members;
        std::set<RoleName> roles;
        std::set<ActionName> actions;
        std::set<DescendantPermissions> descendant_permissions;
        std::optional<bool> is_public;
    };

    struct FilteredResource {
        FullyQualifiedResourceId resource;
        std::set<PolicyName> policies;
        std::set<RoleName> roles;
        std::set<ActionName> actions;
        bool is_public{false};
    };

    struct SyncState {
        i64 version{1};
        std::optional<i64> last_synchronized_version;
        std::optional<Timestamp> synchronized_at;
    };

} // namespace warden::core
