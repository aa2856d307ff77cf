#pragma once

#include <optional>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/group_store.hpp"

namespace warden::directory {
    using warden::core::User;

    class UserStore {
    public:
        explicit UserStore(GroupStore& groups) noexcept : groups_(groups) {}

        // Conflict on a duplicate id or an e-mail used by any subject.
        Status create_user(db::DbSession& s, const UserId& id, const Email& email, bool enabled,
                           User* out = nullptr);
        Status load_user(db::DbSession& s, const UserId& id, User* out);
        // Empty when the user does not exist.
        Status find_user(db::DbSession& s, const UserId& id, std::optional<User>* out);
        // Drops every direct edge to the user; each group that lost it gets a
        // version bump and is listed in `affected`.
        Status delete_user(db::DbSession& s, const UserId& id, std::vector<GroupIdentity>* affected = nullptr);
        Status set_enabled(db::DbSession& s, const UserId& id, bool enabled);
        // False for unknown users.
        Status is_enabled(db::DbSession& s, const UserId& id, bool* out);

    private:
        GroupStore& groups_;
    };

} // namespace warden::directory
