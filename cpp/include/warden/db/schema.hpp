#pragma once

#include "warden/core/types.hpp"

namespace warden::db {
    using u32 = warden::core::u32;

    inline constexpr u32 kSchemaVersion = 1;

    enum class TableId : u32 {
        Users = 1,
        Groups = 2,
        GroupMembers = 3,
        GroupMembersFlat = 4,
        ResourceTypes = 5,
        ResourceTypeRoles = 6,
        ResourceRoleActions = 7,
        ResourceTypeActionPatterns = 8,
        Resources = 9,
        ResourceAuthDomains = 10,
        Policies = 11,
        PolicyRoles = 12,
        PolicyActions = 13,
    };

    [[nodiscard]] const char* table_name(TableId table) noexcept;

} // namespace warden::db
