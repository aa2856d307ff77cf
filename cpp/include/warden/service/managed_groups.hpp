#pragma once

#include <map>
#include <set>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/request_context.hpp"
#include "warden/service/access_service.hpp"

namespace warden::service {

    inline constexpr const char* kManagedGroupType = "managed-group";
    inline constexpr const char* kManagedGroupMemberRole = "member";

    // A group whose membership is administered through resource policies.
    //
    // Creating one makes a `managed-group` resource (its owner policy holds
    // the admins), a `member` policy, and a plain group named after the id
    // whose members are exactly those two policies. Anyone in either policy
    // is therefore a flattened member of the group.
    class ManagedGroupService {
    public:
        explicit ManagedGroupService(AccessService& access) noexcept : access_(access) {}

        // Invalid when the id is not a valid group name or the resource type
        // is not configured with a member role.
        Status create_managed_group(const RequestContext& ctx, const ResourceId& id, const UserId& creator,
                                    Resource* out = nullptr, ErrorReport* report = nullptr);
        // Needs `delete` on the resource.
        Status delete_managed_group(const RequestContext& ctx, const ResourceId& id, const UserId& caller,
                                    ErrorReport* report = nullptr);
        Status load_managed_group(const RequestContext& ctx, const ResourceId& id, Group* out,
                                  ErrorReport* report = nullptr);
        // Managed groups the user holds a role in, with those roles.
        Status list_managed_groups(const RequestContext& ctx, const UserId& user,
                                   std::map<ResourceId, std::set<RoleName>>* out, ErrorReport* report = nullptr);

    private:
        AccessService& access_;
    };

} // namespace warden::service
