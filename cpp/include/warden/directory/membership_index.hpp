#pragma once

#include <variant>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/types.hpp"
#include "warden/db/session.hpp"

namespace warden::directory {
    using warden::core::GroupKey;
    using warden::core::Status;
    using warden::core::UserId;

    // A resolved direct member: a user, or a group (policies included) by key.
    using MemberKey = std::variant<UserId, GroupKey>;

    // Transitive-closure index over the direct-edge group graph.
    //
    // For every group G it answers "is X a member of G, directly or through
    // any chain of nested groups" in one indexed lookup. Maintenance hooks run
    // inside the transaction that changed the direct edge, so the index is
    // never observable out of step with the edges.
    class MembershipIndex {
    public:
        virtual ~MembershipIndex() = default;

        // The direct edge (group, member) has just been inserted.
        virtual Status on_member_added(db::DbSession& s, GroupKey group, const MemberKey& member) = 0;
        // The direct edge (group, member) has just been deleted.
        virtual Status on_member_removed(db::DbSession& s, GroupKey group, const MemberKey& member) = 0;

        virtual Status is_member(db::DbSession& s, GroupKey group, const MemberKey& member, bool* out) const = 0;
        // Every group that contains `member` transitively, ascending by key.
        virtual Status ancestor_groups(db::DbSession& s, const MemberKey& member, std::vector<GroupKey>* out) const = 0;
        // Distinct users reachable from `group`, ascending.
        virtual Status flattened_users(db::DbSession& s, GroupKey group, std::vector<UserId>* out) const = 0;
        // Users that are flattened members of every listed group. Empty input
        // gives an empty result.
        virtual Status intersect_users(db::DbSession& s, const std::vector<GroupKey>& groups,
                                       std::vector<UserId>* out) const = 0;
    };

    // Materialized closure in group_members_flat, one row per
    // (ancestor, member) pair.
    //
    // Adding an edge P -> C inserts {P and its ancestors} x {C and its
    // flattened members}. Removing an edge recomputes the closure of P and of
    // each of its ancestors from the direct edges, since other paths may
    // still connect them to C's members.
    class FlatTableIndex final : public MembershipIndex {
    public:
        Status on_member_added(db::DbSession& s, GroupKey group, const MemberKey& member) override;
        Status on_member_removed(db::DbSession& s, GroupKey group, const MemberKey& member) override;

        Status is_member(db::DbSession& s, GroupKey group, const MemberKey& member, bool* out) const override;
        Status ancestor_groups(db::DbSession& s, const MemberKey& member, std::vector<GroupKey>* out) const override;
        Status flattened_users(db::DbSession& s, GroupKey group, std::vector<UserId>* out) const override;
        Status intersect_users(db::DbSession& s, const std::vector<GroupKey>& groups,
                               std::vector<UserId>* out) const override;

        // Rebuilds the closure of one group from the direct edges.
        Status recompute_group(db::DbSession& s, GroupKey group) const;
    };

} // namespace warden::directory
