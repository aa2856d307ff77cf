#pragma once

namespace warden::security {

    // Actions the service checks before mutating a resource's policies or
    // its place in the hierarchy. Resource types opt in by listing them in
    // their action patterns.
    inline constexpr const char* kActionDelete = "delete";
    inline constexpr const char* kActionReadPolicies = "read_policies";
    inline constexpr const char* kActionAlterPolicies = "alter_policies";
    inline constexpr const char* kActionSharePolicyPrefix = "share_policy::";
    inline constexpr const char* kActionSetParent = "set_parent";
    inline constexpr const char* kActionAddChild = "add_child";
    inline constexpr const char* kActionRemoveChild = "remove_child";
    inline constexpr const char* kActionGetParent = "get_parent";
    inline constexpr const char* kActionListChildren = "list_children";

} // namespace warden::security
