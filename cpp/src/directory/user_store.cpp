#include "warden/directory/user_store.hpp"

#include <utility>

#include "warden/core/validation.hpp"

namespace warden::directory {

using namespace warden::core;

namespace {
    [[nodiscard]] Status dir_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Directory, code);
    }
} // namespace

Status UserStore::create_user(db::DbSession& s, const UserId& id, const Email& email, bool enabled, User* out) {
    if (!valid_identifier(id.v)) {
        return s.fail(dir_status(StatusCode::Invalid), "invalid user id '" + id.v + "'");
    }
    if (!valid_email(email.v)) {
        return s.fail(dir_status(StatusCode::Invalid), "invalid email '" + email.v + "'");
    }

    std::optional<User> existing;
    Status status = find_user(s, id, &existing);
    if (!is_ok(status)) {
        return status;
    }
    if (existing) {
        return s.fail(dir_status(StatusCode::Conflict), "user " + id.v + " already exists");
    }

    Subject holder;
    status = groups_.load_subject_from_email(s, email, &holder);
    if (is_ok(status)) {
        return s.fail(dir_status(StatusCode::Conflict),
                      "email " + email.v + " is already used by " + to_string(holder));
    }
    if (status.code != StatusCode::NotFound) {
        return status;
    }

    db::Statement st(s,
        "INSERT INTO users (id, email, enabled, created_at, updated_at) VALUES (?, ?, ?, ?, ?)");
    if (!st.ok()) {
        return st.error("insert user");
    }
    st.bind_text(1, id.v);
    st.bind_text(2, email.v);
    st.bind_int64(3, enabled ? 1 : 0);
    st.bind_int64(4, s.now());
    st.bind_int64(5, s.now());
    status = st.run("insert user " + id.v);
    if (!is_ok(status)) {
        return status;
    }

    if (out != nullptr) {
        out->id = id;
        out->email = email;
        out->enabled = enabled;
        out->created_at = s.now();
        out->updated_at = s.now();
    }
    return ok_status();
}

Status UserStore::find_user(db::DbSession& s, const UserId& id, std::optional<User>* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    out->reset();
    db::Statement st(s, "SELECT email, enabled, created_at, updated_at FROM users WHERE id = ?");
    if (!st.ok()) {
        return st.error("load user");
    }
    st.bind_text(1, id.v);
    const db::StepResult r = st.step();
    if (r == db::StepResult::Error) {
        return st.error("load user");
    }
    if (r == db::StepResult::Done) {
        return ok_status();
    }
    User u;
    u.id = id;
    u.email = Email{st.column_text(0)};
    u.enabled = st.column_int64(1) != 0;
    u.created_at = st.column_int64(2);
    u.updated_at = st.column_int64(3);
    *out = std::move(u);
    return ok_status();
}

Status UserStore::load_user(db::DbSession& s, const UserId& id, User* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    std::optional<User> found;
    const Status status = find_user(s, id, &found);
    if (!is_ok(status)) {
        return status;
    }
    if (!found) {
        return s.fail(dir_status(StatusCode::NotFound), "user " + id.v + " not found");
    }
    *out = std::move(*found);
    return ok_status();
}

Status UserStore::delete_user(db::DbSession& s, const UserId& id, std::vector<GroupIdentity>* affected) {
    if (affected != nullptr) {
        affected->clear();
    }
    std::optional<User> found;
    Status status = find_user(s, id, &found);
    if (!is_ok(status)) {
        return status;
    }
    if (!found) {
        return s.fail(dir_status(StatusCode::NotFound), "user " + id.v + " not found");
    }

    std::vector<GroupKey> parents;
    {
        db::Statement st(s, "SELECT group_id FROM group_members WHERE member_user_id = ? ORDER BY group_id");
        if (!st.ok()) {
            return st.error("user memberships");
        }
        st.bind_text(1, id.v);
        db::StepResult r;
        while ((r = st.step()) == db::StepResult::Row) {
            parents.push_back(GroupKey{st.column_int64(0)});
        }
        if (r == db::StepResult::Error) {
            return st.error("user memberships");
        }
    }

    for (GroupKey g : parents) {
        status = groups_.bump_version(s, g);
        if (!is_ok(status)) {
            return status;
        }
        if (affected != nullptr) {
            GroupIdentity gid;
            status = groups_.identity_of(s, g, &gid);
            if (!is_ok(status)) {
                return status;
            }
            affected->push_back(std::move(gid));
        }
    }

    // Direct edges and closure rows for the user cascade with the row.
    db::Statement del(s, "DELETE FROM users WHERE id = ?");
    if (!del.ok()) {
        return del.error("delete user");
    }
    del.bind_text(1, id.v);
    return del.run("delete user " + id.v);
}

Status UserStore::set_enabled(db::DbSession& s, const UserId& id, bool enabled) {
    db::Statement st(s, "UPDATE users SET enabled = ?, updated_at = ? WHERE id = ?");
    if (!st.ok()) {
        return st.error("update user");
    }
    st.bind_int64(1, enabled ? 1 : 0);
    st.bind_int64(2, s.now());
    st.bind_text(3, id.v);
    const Status status = st.run("update user " + id.v);
    if (!is_ok(status)) {
        return status;
    }
    if (s.changes() == 0) {
        return s.fail(dir_status(StatusCode::NotFound), "user " + id.v + " not found");
    }
    return ok_status();
}

Status UserStore::is_enabled(db::DbSession& s, const UserId& id, bool* out) {
    if (out == nullptr) {
        return dir_status(StatusCode::Invalid);
    }
    std::optional<User> found;
    const Status status = find_user(s, id, &found);
    if (!is_ok(status)) {
        return status;
    }
    *out = found.has_value() && found->enabled;
    return ok_status();
}

} // namespace warden::directory
