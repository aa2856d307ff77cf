#include "warden/directory/membership_index.hpp"

#include <algorithm>
#include <string>

namespace warden::directory {

using namespace warden::core;

namespace {
    [[nodiscard]] Status invalid_arg() noexcept {
        return make_status(StatusDomain::Directory, StatusCode::Invalid);
    }

    // Binds a member as (user, group) pair; exactly one is non-null.
    void bind_member(db::Statement& st, int user_idx, int group_idx, const MemberKey& member) noexcept {
        if (const auto* user = std::get_if<UserId>(&member)) {
            st.bind_text(user_idx, user->v);
            st.bind_null(group_idx);
        } else {
            st.bind_null(user_idx);
            st.bind_int64(group_idx, std::get<GroupKey>(member).v);
        }
    }
} // namespace

// ============================================================================
// Maintenance
// ============================================================================

Status FlatTableIndex::on_member_added(db::DbSession& s, GroupKey group, const MemberKey& member) {
    const char* sql =
        "INSERT OR IGNORE INTO group_members_flat (group_id, member_user_id, member_group_id) "
        "SELECT a.gid, d.uid, d.gid "
        "FROM (SELECT ?1 AS gid "
        "      UNION SELECT group_id FROM group_members_flat WHERE member_group_id = ?1) AS a, "
        "     (SELECT ?2 AS uid, ?3 AS gid "
        "      UNION SELECT member_user_id, member_group_id FROM group_members_flat WHERE group_id = ?3) AS d";

    db::Statement st(s, sql);
    if (!st.ok()) {
        return st.error("flatten add");
    }
    st.bind_int64(1, group.v);
    bind_member(st, 2, 3, member);
    return st.run("flatten add");
}

Status FlatTableIndex::on_member_removed(db::DbSession& s, GroupKey group, const MemberKey& member) {
    (void)member;

    // Ancestors sit above `group`, so removing one of its edges leaves them
    // unchanged; collect them before touching any row.
    std::vector<GroupKey> affected;
    Status st = ancestor_groups(s, group, &affected);
    if (!is_ok(st)) {
        return st;
    }
    affected.push_back(group);

    for (GroupKey g : affected) {
        st = recompute_group(s, g);
        if (!is_ok(st)) {
            return st;
        }
    }
    return ok_status();
}

Status FlatTableIndex::recompute_group(db::DbSession& s, GroupKey group) const {
    {
        db::Statement del(s, "DELETE FROM group_members_flat WHERE group_id = ?");
        if (!del.ok()) {
            return del.error("flatten clear");
        }
        del.bind_int64(1, group.v);
        const Status st = del.run("flatten clear");
        if (!is_ok(st)) {
            return st;
        }
    }

    const char* sql =
        "WITH RECURSIVE reach(gid) AS ("
        "    SELECT ?1 "
        "    UNION "
        "    SELECT gm.member_group_id FROM group_members gm JOIN reach r ON gm.group_id = r.gid "
        "    WHERE gm.member_group_id IS NOT NULL) "
        "INSERT OR IGNORE INTO group_members_flat (group_id, member_user_id, member_group_id) "
        "SELECT DISTINCT ?1, gm.member_user_id, gm.member_group_id "
        "FROM group_members gm JOIN reach r ON gm.group_id = r.gid";

    db::Statement ins(s, sql);
    if (!ins.ok()) {
        return ins.error("flatten rebuild");
    }
    ins.bind_int64(1, group.v);
    return ins.run("flatten rebuild");
}

// ============================================================================
// Queries
// ============================================================================

Status FlatTableIndex::is_member(db::DbSession& s, GroupKey group, const MemberKey& member, bool* out) const {
    if (out == nullptr) {
        return invalid_arg();
    }
    const bool by_user = std::holds_alternative<UserId>(member);
    db::Statement st(s, by_user
        ? "SELECT 1 FROM group_members_flat WHERE group_id = ? AND member_user_id = ? LIMIT 1"
        : "SELECT 1 FROM group_members_flat WHERE group_id = ? AND member_group_id = ? LIMIT 1");
    if (!st.ok()) {
        return st.error("membership lookup");
    }
    st.bind_int64(1, group.v);
    if (by_user) {
        st.bind_text(2, std::get<UserId>(member).v);
    } else {
        st.bind_int64(2, std::get<GroupKey>(member).v);
    }
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("membership lookup");
    }
    *out = (r == db::StepResult::Row);
    return ok_status();
}

Status FlatTableIndex::ancestor_groups(db::DbSession& s, const MemberKey& member, std::vector<GroupKey>* out) const {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();
    const bool by_user = std::holds_alternative<UserId>(member);
    db::Statement st(s, by_user
        ? "SELECT group_id FROM group_members_flat WHERE member_user_id = ? ORDER BY group_id"
        : "SELECT group_id FROM group_members_flat WHERE member_group_id = ? ORDER BY group_id");
    if (!st.ok()) {
        return st.error("ancestor lookup");
    }
    if (by_user) {
        st.bind_text(1, std::get<UserId>(member).v);
    } else {
        st.bind_int64(1, std::get<GroupKey>(member).v);
    }
    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        out->push_back(GroupKey{st.column_int64(0)});
    }
    if (r == db::StepResult::Error) {
        return st.error("ancestor lookup");
    }
    return ok_status();
}

Status FlatTableIndex::flattened_users(db::DbSession& s, GroupKey group, std::vector<UserId>* out) const {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();
    db::Statement st(s,
        "SELECT member_user_id FROM group_members_flat "
        "WHERE group_id = ? AND member_user_id IS NOT NULL ORDER BY member_user_id");
    if (!st.ok()) {
        return st.error("flattened members");
    }
    st.bind_int64(1, group.v);
    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        out->push_back(UserId{st.column_text(0)});
    }
    if (r == db::StepResult::Error) {
        return st.error("flattened members");
    }
    return ok_status();
}

Status FlatTableIndex::intersect_users(db::DbSession& s, const std::vector<GroupKey>& groups,
                                       std::vector<UserId>* out) const {
    if (out == nullptr) {
        return invalid_arg();
    }
    out->clear();

    std::vector<GroupKey> distinct(groups);
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    if (distinct.empty()) {
        return ok_status();
    }

    std::string sql =
        "SELECT member_user_id FROM group_members_flat "
        "WHERE member_user_id IS NOT NULL AND group_id IN (";
    for (size_t i = 0; i < distinct.size(); ++i) {
        sql += (i == 0) ? "?" : ",?";
    }
    sql += ") GROUP BY member_user_id HAVING COUNT(DISTINCT group_id) = ? ORDER BY member_user_id";

    db::Statement st(s, sql.c_str());
    if (!st.ok()) {
        return st.error("intersect groups");
    }
    int idx = 1;
    for (GroupKey g : distinct) {
        st.bind_int64(idx++, g.v);
    }
    st.bind_int64(idx, static_cast<i64>(distinct.size()));

    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        out->push_back(UserId{st.column_text(0)});
    }
    if (r == db::StepResult::Error) {
        return st.error("intersect groups");
    }
    return ok_status();
}

} // namespace warden::directory
