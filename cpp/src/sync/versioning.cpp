#include "warden/sync/versioning.hpp"

#include <string>
#include <utility>

namespace warden::sync {

using namespace warden::core;

namespace {
    [[nodiscard]] Status sync_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Sync, code);
    }
} // namespace

Status load_sync_state(db::DbSession& s, directory::GroupStore& groups, const GroupIdentity& group, SyncState* out) {
    if (out == nullptr) {
        return sync_status(StatusCode::Invalid);
    }
    GroupKey key{};
    const Status status = groups.resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }

    db::Statement st(s,
        "SELECT version, last_synchronized_version, synchronized_at FROM directory_groups WHERE id = ?");
    if (!st.ok()) {
        return st.error("sync state");
    }
    st.bind_int64(1, key.v);
    if (st.step() != db::StepResult::Row) {
        return st.error("sync state");
    }
    SyncState state;
    state.version = st.column_int64(0);
    if (!st.column_is_null(1)) {
        state.last_synchronized_version = st.column_int64(1);
    }
    if (!st.column_is_null(2)) {
        state.synchronized_at = st.column_int64(2);
    }
    *out = state;
    return ok_status();
}

Status record_synchronized(db::DbSession& s, directory::GroupStore& groups, const GroupIdentity& group,
                           i64 synced_version, bool* advanced) {
    if (advanced != nullptr) {
        *advanced = false;
    }
    if (synced_version < 1) {
        return s.fail(sync_status(StatusCode::Invalid),
                      "synchronized version must be positive, got " + std::to_string(synced_version));
    }

    SyncState state;
    Status status = load_sync_state(s, groups, group, &state);
    if (!is_ok(status)) {
        return status;
    }
    if (synced_version > state.version) {
        return s.fail(sync_status(StatusCode::Invalid),
                      "cannot mark " + to_string(group) + " synchronized at version " +
                          std::to_string(synced_version) + ": current version is " + std::to_string(state.version));
    }

    GroupKey key{};
    status = groups.resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }

    db::Statement st(s,
        "UPDATE directory_groups SET synchronized_at = ?1, last_synchronized_version = ?2 "
        "WHERE id = ?3 AND COALESCE(last_synchronized_version, 0) < ?2 AND ?2 <= version");
    if (!st.ok()) {
        return st.error("record sync");
    }
    st.bind_int64(1, s.now());
    st.bind_int64(2, synced_version);
    st.bind_int64(3, key.v);
    status = st.run("record sync");
    if (!is_ok(status)) {
        return status;
    }
    if (advanced != nullptr) {
        *advanced = s.changes() > 0;
    }
    return ok_status();
}

Status list_unsynchronized_groups(db::DbSession& s, directory::GroupStore& groups, u32 limit,
                                  std::vector<GroupIdentity>* out) {
    if (out == nullptr) {
        return sync_status(StatusCode::Invalid);
    }
    out->clear();
    db::Statement st(s,
        "SELECT id FROM directory_groups WHERE version > COALESCE(last_synchronized_version, 0) "
        "ORDER BY updated_at, id LIMIT ?");
    if (!st.ok()) {
        return st.error("unsynchronized groups");
    }
    st.bind_int64(1, limit == 0 ? -1 : static_cast<i64>(limit));

    std::vector<GroupKey> keys;
    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        keys.push_back(GroupKey{st.column_int64(0)});
    }
    if (r == db::StepResult::Error) {
        return st.error("unsynchronized groups");
    }
    for (GroupKey k : keys) {
        GroupIdentity id;
        const Status status = groups.identity_of(s, k, &id);
        if (!is_ok(status)) {
            return status;
        }
        out->push_back(std::move(id));
    }
    return ok_status();
}

} // namespace warden::sync
