#pragma once

#include <map>
#include <regex>
#include <set>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/types.hpp"

namespace warden::security {
    using warden::core::ActionName;
    using warden::core::ErrorReport;
    using warden::core::ResourceType;
    using warden::core::ResourceTypeName;
    using warden::core::RoleName;
    using warden::core::Status;

    // Boot-time catalogue of resource types. Read-only once the service
    // starts, so it is shared between threads without locking.
    class ResourceTypeRegistry {
    public:
        // Invalid when the name is empty, the owner role is not one of the
        // type's roles, or an action pattern does not compile. Conflict on a
        // duplicate name.
        Status add(const ResourceType& type, ErrorReport* report = nullptr);

        [[nodiscard]] const ResourceType* find(const ResourceTypeName& name) const noexcept;
        [[nodiscard]] bool has_role(const ResourceTypeName& type, const RoleName& role) const noexcept;
        // True when the action matches one of the type's patterns or is
        // granted by one of its roles.
        [[nodiscard]] bool action_allowed(const ResourceTypeName& type, const ActionName& action) const;
        // Union of the actions of `roles`; unknown roles contribute nothing.
        [[nodiscard]] std::set<ActionName> role_actions(const ResourceTypeName& type,
                                                        const std::set<RoleName>& roles) const;

        [[nodiscard]] std::vector<const ResourceType*> all() const;
        [[nodiscard]] std::size_t size() const noexcept { return types_.size(); }

    private:
        struct Entry {
            ResourceType type;
            std::vector<std::regex> patterns;
        };

        std::map<ResourceTypeName, Entry> types_;
    };

} // namespace warden::security
