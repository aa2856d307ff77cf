#pragma once

#include <set>
#include <string>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/types.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/membership_index.hpp"

namespace warden::directory {
    using warden::core::Email;
    using warden::core::Group;
    using warden::core::GroupIdentity;
    using warden::core::GroupName;
    using warden::core::Subject;

    // Named groups and their direct edges. Every edge change goes through
    // here so the membership index and the version counter move with it.
    //
    // All methods run inside a caller-owned transaction (db::db_write /
    // db::db_read) and report failures through the session.
    class GroupStore {
    public:
        explicit GroupStore(MembershipIndex& index) noexcept : index_(index) {}

        [[nodiscard]] MembershipIndex& index() const noexcept { return index_; }

        // Conflict if the name or e-mail is taken; NotFound if an initial
        // member does not exist. The new group starts at version 1.
        Status create_group(db::DbSession& s, const GroupName& name, const Email& email,
                            const std::set<Subject>& members, Group* out = nullptr);
        Status load_group(db::DbSession& s, const GroupIdentity& id, Group* out);
        // ReferentialIntegrity while the group is a member of another group or
        // the authorization domain of a resource.
        Status delete_group(db::DbSession& s, const GroupName& name);

        // `added` is false when the edge already existed; the version only
        // moves when something changed.
        Status add_member(db::DbSession& s, const GroupIdentity& group, const Subject& member,
                          bool* added = nullptr);
        Status remove_member(db::DbSession& s, const GroupIdentity& group, const Subject& member,
                             bool* removed = nullptr);

        Status is_member(db::DbSession& s, const GroupIdentity& group, const Subject& member, bool* out);
        Status list_direct_memberships(db::DbSession& s, const Subject& subject, std::vector<GroupIdentity>* out);
        Status list_parent_groups(db::DbSession& s, const GroupIdentity& group, std::vector<GroupIdentity>* out);
        Status list_ancestor_groups(db::DbSession& s, const Subject& subject, std::vector<GroupIdentity>* out);
        Status list_flattened_members(db::DbSession& s, const GroupIdentity& group, std::vector<UserId>* out);
        Status intersect_groups(db::DbSession& s, const std::vector<GroupIdentity>& groups, std::vector<UserId>* out);

        Status load_email(db::DbSession& s, const GroupIdentity& group, Email* out);
        Status load_subject_from_email(db::DbSession& s, const Email& email, Subject* out);

        // ---- building blocks shared with the policy store ----

        Status resolve(db::DbSession& s, const GroupIdentity& id, GroupKey* out);
        Status resolve_member(db::DbSession& s, const Subject& member, MemberKey* out);
        Status identity_of(db::DbSession& s, GroupKey key, GroupIdentity* out);
        Status load_members(db::DbSession& s, GroupKey key, std::set<Subject>* out);

        // Inserts the row only; `name` is not validated so policies can use
        // a reserved form.
        Status insert_group_row(db::DbSession& s, const std::string& name, const Email& email, GroupKey* out);
        // Existence and cycle checks, edge insert and index update. No version bump.
        Status link_member(db::DbSession& s, GroupKey group, const Subject& member, bool* added);
        Status unlink_member(db::DbSession& s, GroupKey group, const Subject& member, bool* removed);
        Status bump_version(db::DbSession& s, GroupKey group);
        // Reference checks then row delete (edges and closure rows cascade).
        Status delete_group_row(db::DbSession& s, GroupKey group);

    private:
        Status check_email_free(db::DbSession& s, const Email& email);
        Status check_no_cycle(db::DbSession& s, GroupKey group, GroupKey member_group, const Subject& member);

        MembershipIndex& index_;
    };

} // namespace warden::directory
