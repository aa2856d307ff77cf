#pragma once

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/request_context.hpp"
#include "warden/db/db.hpp"
#include "warden/directory/user_store.hpp"

namespace warden::service {
    using warden::core::ErrorReport;
    using warden::core::RequestContext;
    using warden::core::Status;
    using warden::core::User;
    using warden::core::UserId;

    // Source of truth for whether a user may act at all. Permission checks
    // ask it before looking at the graph.
    class SubjectDirectory {
    public:
        virtual ~SubjectDirectory() = default;

        virtual Status load_user(const RequestContext& ctx, const UserId& id, User* out,
                                 ErrorReport* report = nullptr) = 0;
        // False for unknown users.
        virtual Status enabled(const RequestContext& ctx, const UserId& id, bool* out,
                               ErrorReport* report = nullptr) = 0;
    };

    // Reads the users table. Each call runs its own read transaction, so it
    // must not be called from inside another transaction.
    class DbSubjectDirectory final : public SubjectDirectory {
    public:
        DbSubjectDirectory(db::DbHandle db, directory::UserStore& users) noexcept : db_(db), users_(users) {}

        Status load_user(const RequestContext& ctx, const UserId& id, User* out,
                         ErrorReport* report = nullptr) override;
        Status enabled(const RequestContext& ctx, const UserId& id, bool* out,
                       ErrorReport* report = nullptr) override;

    private:
        db::DbHandle db_;
        directory::UserStore& users_;
    };

} // namespace warden::service
