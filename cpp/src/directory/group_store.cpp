#include "warden/directory/group_store.hpp"

#include <utility>

#include "warden/core/validation.hpp"

namespace warden::directory {

using namespace warden::core;

namespace {
    constexpr const char* kIdentityJoin =
        " LEFT JOIN policies p ON p.group_id = g.id"
        " LEFT JOIN resources r ON r.id = p.resource_id"
        " LEFT JOIN resource_types t ON t.id = r.resource_type_id";

    [[nodiscard]] Status dir_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Directory, code);
    }

    // Columns col..col+3 are g.name, p.name, r.name, t.name.
    [[nodiscard]] GroupIdentity decode_identity(const db::Statement& st, int col) {
        if (st.column_is_null(col + 1)) {
            return GroupName{st.column_text(col)};
        }
        return PolicyId{
            FullyQualifiedResourceId{ResourceTypeName{st.column_text(col + 3)}, ResourceId{st.column_text(col + 2)}},
            PolicyName{st.column_text(col + 1)},
        };
    }

    [[nodiscard]] std::string join_names(const std::vector<std::string>& names) {
        std::string out;
        for (const std::string& n : names) {
            if (!out.empty()) {
                out += ", ";
            }
            out += n;
        }
        return out;
    }
} // namespace

// ============================================================================
// Resolution
// ============================================================================

Status GroupStore::resolve(db::DbSession& s, const GroupIdentity& id, GroupKey* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }

    if (const auto* name = std::get_if<GroupName>(&id)) {
        if (!valid_group_name(name->v)) {
            return s.fail(dir_status(StatusCode::NotFound), "group " + name->v + " not found");
        }
        db::Statement st(s, "SELECT id FROM directory_groups WHERE name = ?");
        if (!st.ok()) {
            return st.error("resolve group");
        }
        st.bind_text(1, name->v);
        const db::StepResult r = st.step();
        if (r == db::StepResult::Error) {
            return st.error("resolve group");
        }
        if (r == db::StepResult::Done) {
            return s.fail(dir_status(StatusCode::NotFound), "group " + name->v + " not found");
        }
        *out = GroupKey{st.column_int64(0)};
        return ok_status();
    }

    const PolicyId& policy = std::get<PolicyId>(id);
    db::Statement st(s,
        "SELECT p.group_id FROM policies p "
        "JOIN resources r ON r.id = p.resource_id "
        "JOIN resource_types t ON t.id = r.resource_type_id "
        "WHERE t.name = ? AND r.name = ? AND p.name = ?");
    if (!st.ok()) {
        return st.error("resolve policy");
    }
    st.bind_text(1, policy.resource.type.v);
    st.bind_text(2, policy.resource.id.v);
    st.bind_text(3, policy.name.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("resolve policy");
    }
    if (r == db::StepResult::Done) {
        return s.fail(dir_status(StatusCode::NotFound), "policy " + to_string(policy) + " not found");
    }
    *out = GroupKey{st.column_int64(0)};
    return ok_status();
}

Status GroupStore::resolve_member(db::DbSession& s, const Subject& member, MemberKey* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    if (const auto* user = std::get_if<UserId>(&member)) {
        db::Statement st(s, "SELECT 1 FROM users WHERE id = ?");
        if (!st.ok()) {
            return st.error("resolve user");
        }
        st.bind_text(1, user->v);
        const db::StepResult r = st.step();
        if (r == db::StepResult::Error) {
            return st.error("resolve user");
        }
        if (r == db::StepResult::Done) {
            return s.fail(dir_status(StatusCode::NotFound), "user " + user->v + " not found");
        }
        *out = *user;
        return ok_status();
    }

    GroupKey key{};
    const Status st = resolve(s, *to_group_identity(member), &key);
    if (!is_ok(st)) {
        return st;
    }
    *out = key;
    return ok_status();
}

Status GroupStore::identity_of(db::DbSession& s, GroupKey key, GroupIdentity* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    std::string sql = "SELECT g.name, p.name, r.name, t.name FROM directory_groups g";
    sql += kIdentityJoin;
    sql += " WHERE g.id = ?";
    db::Statement st(s, sql.c_str());
    if (!st.ok()) {
        return st.error("group identity");
    }
    st.bind_int64(1, key.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("group identity");
    }
    if (r == db::StepResult::Done) {
        return s.fail(dir_status(StatusCode::NotFound), "group #" + std::to_string(key.v) + " not found");
    }
    *out = decode_identity(st, 0);
    return ok_status();
}

Status GroupStore::load_members(db::DbSession& s, GroupKey key, std::set<Subject>* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    out->clear();
    std::string sql =
        "SELECT gm.member_user_id, g.name, p.name, r.name, t.name FROM group_members gm "
        "LEFT JOIN directory_groups g ON g.id = gm.member_group_id";
    sql += kIdentityJoin;
    sql += " WHERE gm.group_id = ?";
    db::Statement st(s, sql.c_str());
    if (!st.ok()) {
        return st.error("load members");
    }
    st.bind_int64(1, key.v);
    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        if (!st.column_is_null(0)) {
            out->insert(UserId{st.column_text(0)});
        } else {
            out->insert(to_subject(decode_identity(st, 1)));
        }
    }
    if (r == db::StepResult::Error) {
        return st.error("load members");
    }
    return ok_status();
}

// ============================================================================
// Group lifecycle
// ============================================================================

Status GroupStore::check_email_free(db::DbSession& s, const Email& email) {
    db::Statement st(s,
        "SELECT 1 FROM users WHERE email = ?1 "
        "UNION ALL SELECT 1 FROM directory_groups WHERE email = ?1 COLLATE NOCASE LIMIT 1");
    if (!st.ok()) {
        return st.error("email lookup");
    }
    st.bind_text(1, email.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("email lookup");
    }
    if (r == db::StepResult::Row) {
        return s.fail(dir_status(StatusCode::Conflict), "email " + email.v + " is already in use");
    }
    return ok_status();
}

Status GroupStore::insert_group_row(db::DbSession& s, const std::string& name, const Email& email, GroupKey* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    Status status = check_email_free(s, email);
    if (!is_ok(status)) {
        return status;
    }
    db::Statement st(s, "INSERT INTO directory_groups (name, email, version, updated_at) VALUES (?, ?, 1, ?)");
    if (!st.ok()) {
        return st.error("insert group");
    }
    st.bind_text(1, name);
    st.bind_text(2, email.v);
    st.bind_int64(3, s.now());
    status = st.run("insert group " + name);
    if (!is_ok(status)) {
        if (status.code == StatusCode::Conflict) {
            return s.fail(dir_status(StatusCode::Conflict), "group " + name + " already exists");
        }
        return status;
    }
    *out = GroupKey{s.last_insert_rowid()};
    return ok_status();
}

Status GroupStore::create_group(db::DbSession& s, const GroupName& name, const Email& email,
                                const std::set<Subject>& members, Group* out) {
    if (!valid_group_name(name.v)) {
        return s.fail(dir_status(StatusCode::Invalid),
                      "invalid group name '" + name.v + "': use 1-60 characters of [A-Za-z0-9_-]");
    }
    if (!valid_email(email.v)) {
        return s.fail(dir_status(StatusCode::Invalid), "invalid email '" + email.v + "'");
    }

    {
        db::Statement dup(s, "SELECT 1 FROM directory_groups WHERE name = ?");
        if (!dup.ok()) {
            return dup.error("group lookup");
        }
        dup.bind_text(1, name.v);
        const db::StepResult r = dup.step();
        if (r == db::StepResult::Error) {
            return dup.error("group lookup");
        }
        if (r == db::StepResult::Row) {
            return s.fail(dir_status(StatusCode::Conflict), "group " + name.v + " already exists");
        }
    }

    GroupKey key{};
    Status st = insert_group_row(s, name.v, email, &key);
    if (!is_ok(st)) {
        return st;
    }
    for (const Subject& m : members) {
        bool added = false;
        st = link_member(s, key, m, &added);
        if (!is_ok(st)) {
            return st;
        }
    }
    if (out != nullptr) {
        return load_group(s, name, out);
    }
    return ok_status();
}

Status GroupStore::load_group(db::DbSession& s, const GroupIdentity& id, Group* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    GroupKey key{};
    Status status = resolve(s, id, &key);
    if (!is_ok(status)) {
        return status;
    }

    db::Statement st(s,
        "SELECT name, email, version, last_synchronized_version, synchronized_at, updated_at "
        "FROM directory_groups WHERE id = ?");
    if (!st.ok()) {
        return st.error("load group");
    }
    st.bind_int64(1, key.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("load group");
    }
    if (r == db::StepResult::Done) {
        return s.fail(dir_status(StatusCode::NotFound), "group " + to_string(id) + " not found");
    }

    Group g;
    g.name = GroupName{st.column_text(0)};
    g.email = Email{st.column_text(1)};
    g.version = st.column_int64(2);
    if (!st.column_is_null(3)) {
        g.last_synchronized_version = st.column_int64(3);
    }
    if (!st.column_is_null(4)) {
        g.synchronized_at = st.column_int64(4);
    }
    g.updated_at = st.column_int64(5);

    status = load_members(s, key, &g.members);
    if (!is_ok(status)) {
        return status;
    }
    *out = std::move(g);
    return ok_status();
}

Status GroupStore::delete_group_row(db::DbSession& s, GroupKey group) {
    GroupIdentity self;
    Status status = identity_of(s, group, &self);
    if (!is_ok(status)) {
        return status;
    }

    {
        std::string sql = "SELECT g.name, p.name, r.name, t.name FROM group_members gm "
                          "JOIN directory_groups g ON g.id = gm.group_id";
        sql += kIdentityJoin;
        sql += " WHERE gm.member_group_id = ? ORDER BY g.name";
        db::Statement st(s, sql.c_str());
        if (!st.ok()) {
            return st.error("parent lookup");
        }
        st.bind_int64(1, group.v);
        std::vector<std::string> parents;
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            parents.push_back(to_string(decode_identity(st, 0)));
        }
        if (r == db::StepResult::Error) {
            return st.error("parent lookup");
        }
        if (!parents.empty()) {
            return s.fail(dir_status(StatusCode::ReferentialIntegrity),
                          to_string(self) + " cannot be deleted: it is a member of " + join_names(parents));
        }
    }

    {
        db::Statement st(s,
            "SELECT t.name, r.name FROM resource_auth_domains ad "
            "JOIN resources r ON r.id = ad.resource_id "
            "JOIN resource_types t ON t.id = r.resource_type_id "
            "WHERE ad.group_id = ? ORDER BY t.name, r.name");
        if (!st.ok()) {
            return st.error("auth domain lookup");
        }
        st.bind_int64(1, group.v);
        std::vector<std::string> resources;
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            resources.push_back(st.column_text(0) + "/" + st.column_text(1));
        }
        if (r == db::StepResult::Error) {
            return st.error("auth domain lookup");
        }
        if (!resources.empty()) {
            return s.fail(dir_status(StatusCode::ReferentialIntegrity),
                          to_string(self) + " cannot be deleted: it is the authorization domain of " +
                              join_names(resources));
        }
    }

    db::Statement del(s, "DELETE FROM directory_groups WHERE id = ?");
    if (!del.ok()) {
        return del.error("delete group");
    }
    del.bind_int64(1, group.v);
    return del.run("delete group " + to_string(self));
}

Status GroupStore::delete_group(db::DbSession& s, const GroupName& name) {
    GroupKey key{};
    const Status status = resolve(s, name, &key);
    if (!is_ok(status)) {
        return status;
    }
    return delete_group_row(s, key);
}

// ============================================================================
// Edges
// ============================================================================

Status GroupStore::check_no_cycle(db::DbSession& s, GroupKey group, GroupKey member_group, const Subject& member) {
    GroupIdentity target;
    Status status = identity_of(s, group, &target);
    if (!is_ok(status)) {
        return status;
    }
    if (member_group == group) {
        return s.fail(dir_status(StatusCode::InvalidGraph), to_string(target) + " cannot be a member of itself");
    }

    bool contains = false;
    status = index_.is_member(s, member_group, group, &contains);
    if (!is_ok(status)) {
        return status;
    }
    if (!contains) {
        return ok_status();
    }

    db::Statement st(s, "SELECT email FROM directory_groups WHERE id = ?");
    if (!st.ok()) {
        return st.error("group email");
    }
    st.bind_int64(1, member_group.v);
    std::string email;
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("group email");
    }
    if (r == db::StepResult::Row) {
        email = st.column_text(0);
    }
    return s.fail(dir_status(StatusCode::InvalidGraph),
                  "Could not add " + to_string(member) + " <" + email + "> to " + to_string(target) +
                      ": it already contains " + to_string(target) + ", so the edge would create a cycle");
}

Status GroupStore::link_member(db::DbSession& s, GroupKey group, const Subject& member, bool* added) {
    MemberKey mk;
    Status status = resolve_member(s, member, &mk);
    if (!is_ok(status)) {
        return status;
    }
    if (const auto* g = std::get_if<GroupKey>(&mk)) {
        status = check_no_cycle(s, group, *g, member);
        if (!is_ok(status)) {
            return status;
        }
    }

    db::Statement st(s,
        "INSERT OR IGNORE INTO group_members (group_id, member_user_id, member_group_id) VALUES (?, ?, ?)");
    if (!st.ok()) {
        return st.error("insert edge");
    }
    st.bind_int64(1, group.v);
    if (const auto* u = std::get_if<UserId>(&mk)) {
        st.bind_text(2, u->v);
        st.bind_null(3);
    } else {
        st.bind_null(2);
        st.bind_int64(3, std::get<GroupKey>(mk).v);
    }
    status = st.run("insert edge");
    if (!is_ok(status)) {
        return status;
    }

    const bool inserted = s.changes() > 0;
    if (added != nullptr) {
        *added = inserted;
    }
    if (!inserted) {
        return ok_status();
    }
    return index_.on_member_added(s, group, mk);
}

Status GroupStore::unlink_member(db::DbSession& s, GroupKey group, const Subject& member, bool* removed) {
    if (removed != nullptr) {
        *removed = false;
    }
    MemberKey mk;
    Status status = resolve_member(s, member, &mk);
    if (status.code == StatusCode::NotFound) {
        // Something that does not exist is not a member of anything.
        return ok_status();
    }
    if (!is_ok(status)) {
        return status;
    }

    const bool by_user = std::holds_alternative<UserId>(mk);
    db::Statement st(s, by_user
        ? "DELETE FROM group_members WHERE group_id = ? AND member_user_id = ?"
        : "DELETE FROM group_members WHERE group_id = ? AND member_group_id = ?");
    if (!st.ok()) {
        return st.error("delete edge");
    }
    st.bind_int64(1, group.v);
    if (by_user) {
        st.bind_text(2, std::get<UserId>(mk).v);
    } else {
        st.bind_int64(2, std::get<GroupKey>(mk).v);
    }
    status = st.run("delete edge");
    if (!is_ok(status)) {
        return status;
    }
    if (s.changes() == 0) {
        return ok_status();
    }
    if (removed != nullptr) {
        *removed = true;
    }
    return index_.on_member_removed(s, group, mk);
}

Status GroupStore::bump_version(db::DbSession& s, GroupKey group) {
    db::Statement st(s, "UPDATE directory_groups SET version = version + 1, updated_at = ? WHERE id = ?");
    if (!st.ok()) {
        return st.error("bump version");
    }
    st.bind_int64(1, s.now());
    st.bind_int64(2, group.v);
    const Status status = st.run("bump version");
    if (!is_ok(status)) {
        return status;
    }
    if (s.changes() == 0) {
        return s.fail(dir_status(StatusCode::NotFound), "group #" + std::to_string(group.v) + " not found");
    }
    return ok_status();
}

Status GroupStore::add_member(db::DbSession& s, const GroupIdentity& group, const Subject& member, bool* added) {
    GroupKey key{};
    Status status = resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }
    bool inserted = false;
    status = link_member(s, key, member, &inserted);
    if (!is_ok(status)) {
        return status;
    }
    if (added != nullptr) {
        *added = inserted;
    }
    return inserted ? bump_version(s, key) : ok_status();
}

Status GroupStore::remove_member(db::DbSession& s, const GroupIdentity& group, const Subject& member, bool* removed) {
    GroupKey key{};
    Status status = resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }
    bool deleted = false;
    status = unlink_member(s, key, member, &deleted);
    if (!is_ok(status)) {
        return status;
    }
    if (removed != nullptr) {
        *removed = deleted;
    }
    return deleted ? bump_version(s, key) : ok_status();
}

// ============================================================================
// Queries
// ============================================================================

Status GroupStore::is_member(db::DbSession& s, const GroupIdentity& group, const Subject& member, bool* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    *out = false;
    GroupKey key{};
    Status status = resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }
    MemberKey mk;
    status = resolve_member(s, member, &mk);
    if (status.code == StatusCode::NotFound) {
        return ok_status();
    }
    if (!is_ok(status)) {
        return status;
    }
    return index_.is_member(s, key, mk, out);
}

Status GroupStore::list_direct_memberships(db::DbSession& s, const Subject& subject, std::vector<GroupIdentity>* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    out->clear();
    MemberKey mk;
    Status status = resolve_member(s, subject, &mk);
    if (!is_ok(status)) {
        return status;
    }

    const bool by_user = std::holds_alternative<UserId>(mk);
    std::string sql = "SELECT g.name, p.name, r.name, t.name FROM group_members gm "
                      "JOIN directory_groups g ON g.id = gm.group_id";
    sql += kIdentityJoin;
    sql += by_user ? " WHERE gm.member_user_id = ?" : " WHERE gm.member_group_id = ?";
    sql += " ORDER BY g.name";
    db::Statement st(s, sql.c_str());
    if (!st.ok()) {
        return st.error("direct memberships");
    }
    if (by_user) {
        st.bind_text(1, std::get<UserId>(mk).v);
    } else {
        st.bind_int64(1, std::get<GroupKey>(mk).v);
    }
    db::StepResult r;
    while ((r = st.step()) == db::StepResult::Row) {
        out->push_back(decode_identity(st, 0));
    }
    if (r == db::StepResult::Error) {
        return st.error("direct memberships");
    }
    return ok_status();
}

Status GroupStore::list_parent_groups(db::DbSession& s, const GroupIdentity& group, std::vector<GroupIdentity>* out) {
    return list_direct_memberships(s, to_subject(group), out);
}

Status GroupStore::list_ancestor_groups(db::DbSession& s, const Subject& subject, std::vector<GroupIdentity>* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    out->clear();
    MemberKey mk;
    Status status = resolve_member(s, subject, &mk);
    if (!is_ok(status)) {
        return status;
    }
    std::vector<GroupKey> keys;
    status = index_.ancestor_groups(s, mk, &keys);
    if (!is_ok(status)) {
        return status;
    }
    out->reserve(keys.size());
    for (GroupKey k : keys) {
        GroupIdentity id;
        status = identity_of(s, k, &id);
        if (!is_ok(status)) {
            return status;
        }
        out->push_back(std::move(id));
    }
    return ok_status();
}

Status GroupStore::list_flattened_members(db::DbSession& s, const GroupIdentity& group, std::vector<UserId>* out) {
    GroupKey key{};
    const Status status = resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }
    return index_.flattened_users(s, key, out);
}

Status GroupStore::intersect_groups(db::DbSession& s, const std::vector<GroupIdentity>& groups,
                                    std::vector<UserId>* out) {
    std::vector<GroupKey> keys;
    keys.reserve(groups.size());
    for (const GroupIdentity& g : groups) {
        GroupKey key{};
        const Status status = resolve(s, g, &key);
        if (!is_ok(status)) {
            return status;
        }
        keys.push_back(key);
    }
    return index_.intersect_users(s, keys, out);
}

Status GroupStore::load_email(db::DbSession& s, const GroupIdentity& group, Email* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    GroupKey key{};
    const Status status = resolve(s, group, &key);
    if (!is_ok(status)) {
        return status;
    }
    db::Statement st(s, "SELECT email FROM directory_groups WHERE id = ?");
    if (!st.ok()) {
        return st.error("group email");
    }
    st.bind_int64(1, key.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("group email");
    }
    if (r == db::StepResult::Done) {
        return s.fail(dir_status(StatusCode::NotFound), "group " + to_string(group) + " not found");
    }
    out->v = st.column_text(0);
    return ok_status();
}

Status GroupStore::load_subject_from_email(db::DbSession& s, const Email& email, Subject* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    {
        db::Statement st(s, "SELECT id FROM users WHERE email = ?");
        if (!st.ok()) {
            return st.error("user by email");
        }
        st.bind_text(1, email.v);
        const db::StepResult r = st.step();
        if (r == db::StepResult::Error) {
            return st.error("user by email");
        }
        if (r == db::StepResult::Row) {
            *out = UserId{st.column_text(0)};
            return ok_status();
        }
    }

    std::string sql = "SELECT g.name, p.name, r.name, t.name FROM directory_groups g";
    sql += kIdentityJoin;
    sql += " WHERE g.email = ? COLLATE NOCASE";
    db::Statement st(s, sql.c_str());
    if (!st.ok()) {
        return st.error("group by email");
    }
    st.bind_text(1, email.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("group by email");
    }
    if (r == db::StepResult::Done) {
        return s.fail(dir_status(StatusCode::NotFound), "no subject with email " + email.v);
    }
    *out = to_subject(decode_identity(st, 0));
    return ok_status();
}

} // namespace warden::directory
