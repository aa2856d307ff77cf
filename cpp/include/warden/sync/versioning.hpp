#pragma once

#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/group_store.hpp"

namespace warden::sync {
    using warden::core::GroupIdentity;
    using warden::core::Status;
    using warden::core::SyncState;
    using i64 = warden::core::i64;
    using u32 = warden::core::u32;

    Status load_sync_state(db::DbSession& s, directory::GroupStore& groups, const GroupIdentity& group,
                           SyncState* out);

    // Marks `synced_version` as mirrored. lastSynchronizedVersion only moves
    // forward and never past the current version; `advanced` reports whether
    // it moved. A version ahead of the group is Invalid.
    Status record_synchronized(db::DbSession& s, directory::GroupStore& groups, const GroupIdentity& group,
                               i64 synced_version, bool* advanced);

    // Groups whose version is ahead of their last synchronized version,
    // oldest update first.
    Status list_unsynchronized_groups(db::DbSession& s, directory::GroupStore& groups, u32 limit,
                                      std::vector<GroupIdentity>* out);

} // namespace warden::sync
