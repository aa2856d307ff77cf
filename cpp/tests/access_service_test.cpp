#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "test_support.hpp"

using namespace warden;
using namespace warden::core;
using namespace warden::testing;

namespace {

// Answers from a fixed table instead of the users table.
class FixedDirectory final : public service::SubjectDirectory {
public:
    explicit FixedDirectory(std::map<std::string, bool> enabled) : enabled_(std::move(enabled)) {}

    Status load_user(const RequestContext&, const UserId& id, User* out, ErrorReport* report) override {
        const auto it = enabled_.find(id.v);
        if (it == enabled_.end()) {
            const Status s = make_status(StatusDomain::Service, StatusCode::NotFound);
            report_error(report, s, "user " + id.v + " not found");
            return s;
        }
        out->id = id;
        out->enabled = it->second;
        return ok_status();
    }

    Status enabled(const RequestContext&, const UserId& id, bool* out, ErrorReport*) override {
        const auto it = enabled_.find(id.v);
        *out = it != enabled_.end() && it->second;
        return ok_status();
    }

private:
    std::map<std::string, bool> enabled_;
};

class AccessServiceTest : public ServiceTest {
protected:
    void SetUp() override {
        ServiceTest::SetUp();
        add_user("alice");
        add_user("bob");
        add_user("carol");
        notifier_.take();
    }

    AccessPolicyMembership grant(const std::set<Subject>& members, std::set<RoleName> roles,
                                 std::set<ActionName> actions = {}) {
        AccessPolicyMembership spec;
        spec.members = members;
        spec.roles = std::move(roles);
        spec.actions = std::move(actions);
        return spec;
    }
};

} // namespace

//=============================================================================
// Evaluation entry points
//=============================================================================

TEST_F(AccessServiceTest, DisabledUsersHoldNothing) {
    add_resource(rid("document", "memo"), "alice");
    EXPECT_TRUE(can(rid("document", "memo"), "read", "alice"));

    ASSERT_TRUE(is_ok(service_->set_user_enabled(ctx_, user("alice"), false)));
    EXPECT_FALSE(can(rid("document", "memo"), "read", "alice"));

    std::set<ActionName> held;
    ASSERT_TRUE(is_ok(service_->list_user_resource_actions(ctx_, rid("document", "memo"), user("alice"), &held)));
    EXPECT_TRUE(held.empty());

    ASSERT_TRUE(is_ok(service_->set_user_enabled(ctx_, user("alice"), true)));
    EXPECT_TRUE(can(rid("document", "memo"), "read", "alice"));
}

TEST_F(AccessServiceTest, DisabledUsersCannotCreateResources) {
    add_user("mallory", false);
    notifier_.take();

    ErrorReport report;
    Status s = service_->create_resource(ctx_, rid("folder", "x"), user("mallory"), std::nullopt, {}, nullptr,
                                         &report);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(report.message, "user mallory is disabled or unknown");
    Resource res;
    EXPECT_EQ(service_->load_resource(ctx_, rid("folder", "x"), &res).code, StatusCode::NotFound);

    s = service_->create_resource(ctx_, rid("folder", "x"), user("nobody"), std::nullopt, {}, nullptr, &report);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_TRUE(notifier_.take().empty());

    ASSERT_TRUE(is_ok(service_->set_user_enabled(ctx_, user("mallory"), true)));
    add_resource(rid("folder", "x"), "mallory");
    EXPECT_TRUE(can(rid("folder", "x"), "read", "mallory"));
}

TEST_F(AccessServiceTest, CheckValidatesTypeAndAction) {
    add_resource(rid("document", "memo"), "alice");
    bool out = true;
    ErrorReport report;

    Status s = service_->check_permission(ctx_, rid("spaceship", "x"), ActionName{"read"}, user("alice"), &out,
                                          &report);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(report.message, "resource type spaceship not found");
    EXPECT_FALSE(out);

    s = service_->check_permission(ctx_, rid("document", "memo"), ActionName{"fly"}, user("alice"), &out, &report);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(report.message, "action 'fly' is not defined for document");

    // A missing resource of a known type is just a no.
    ASSERT_TRUE(is_ok(service_->check_permission(ctx_, rid("document", "ghost"), ActionName{"read"}, user("alice"),
                                                 &out, &report)));
    EXPECT_FALSE(out);
}

TEST_F(AccessServiceTest, DeletedResourceGrantsNothing) {
    add_resource(rid("document", "memo"), "alice");
    put_policy(pid("document", "memo", "readers"), grant({user("bob")}, {RoleName{"reader"}}), "alice");
    EXPECT_TRUE(can(rid("document", "memo"), "read", "bob"));

    ErrorReport report;
    ASSERT_TRUE(is_ok(service_->delete_resource(ctx_, rid("document", "memo"), user("alice"), &report)))
        << report.message;

    bool out = true;
    ASSERT_TRUE(is_ok(service_->check_permission(ctx_, rid("document", "memo"), ActionName{"read"}, user("alice"),
                                                 &out, &report)));
    EXPECT_FALSE(out);
    EXPECT_FALSE(can(rid("document", "memo"), "read", "bob"));

    std::set<ActionName> held{ActionName{"stale"}};
    ASSERT_TRUE(is_ok(service_->list_user_resource_actions(ctx_, rid("document", "memo"), user("alice"), &held)));
    EXPECT_TRUE(held.empty());

    EXPECT_EQ(service_->require_action(ctx_, rid("document", "memo"), ActionName{"read"}, user("alice"), &report)
                  .code,
              StatusCode::NotFound);
}

TEST_F(AccessServiceTest, RequireActionDistinguishesDeniedFromHidden) {
    add_resource(rid("document", "memo"), "alice");
    put_policy(pid("document", "memo", "readers"), grant({user("bob")}, {RoleName{"reader"}}), "alice");

    EXPECT_TRUE(is_ok(service_->require_action(ctx_, rid("document", "memo"), ActionName{"read"}, user("bob"))));

    ErrorReport report;
    Status s = service_->require_action(ctx_, rid("document", "memo"), ActionName{"write"}, user("bob"), &report);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(report.message, "user bob may not write on document/memo");

    s = service_->require_action(ctx_, rid("document", "memo"), ActionName{"read"}, user("carol"), &report);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(report.message, "resource document/memo not found");
}

//=============================================================================
// Gated mutations
//=============================================================================

TEST_F(AccessServiceTest, DeleteNeedsDeleteAction) {
    add_resource(rid("document", "memo"), "alice");
    put_policy(pid("document", "memo", "editors"), grant({user("bob")}, {RoleName{"editor"}}), "alice");

    ErrorReport report;
    EXPECT_EQ(service_->delete_resource(ctx_, rid("document", "memo"), user("bob"), &report).code,
              StatusCode::PermissionDenied);
    EXPECT_EQ(service_->delete_resource(ctx_, rid("document", "memo"), user("carol"), &report).code,
              StatusCode::NotFound);

    ASSERT_TRUE(is_ok(service_->set_user_enabled(ctx_, user("alice"), false)));
    EXPECT_EQ(service_->delete_resource(ctx_, rid("document", "memo"), user("alice"), &report).code,
              StatusCode::NotFound);
    ASSERT_TRUE(is_ok(service_->set_user_enabled(ctx_, user("alice"), true)));

    ASSERT_TRUE(is_ok(service_->delete_resource(ctx_, rid("document", "memo"), user("alice"), &report)))
        << report.message;
    Resource res;
    EXPECT_EQ(service_->load_resource(ctx_, rid("document", "memo"), &res).code, StatusCode::NotFound);
}

TEST_F(AccessServiceTest, ChildCreationNeedsAddChildOnParent) {
    add_resource(rid("folder", "root"), "alice");

    ErrorReport report;
    Status s = service_->create_resource(ctx_, rid("document", "memo"), user("bob"), rid("folder", "root"), {},
                                         nullptr, &report);
    EXPECT_EQ(s.code, StatusCode::NotFound);

    put_policy(pid("folder", "root", "writers"), grant({user("bob")}, {RoleName{"writer"}}), "alice");
    s = service_->create_resource(ctx_, rid("document", "memo"), user("bob"), rid("folder", "root"), {}, nullptr,
                                  &report);
    ASSERT_TRUE(is_ok(s)) << report.message;

    std::optional<FullyQualifiedResourceId> parent;
    ASSERT_TRUE(is_ok(service_->get_parent(ctx_, rid("document", "memo"), user("bob"), &parent)));
    EXPECT_EQ(parent, rid("folder", "root"));
}

TEST_F(AccessServiceTest, ReparentingNeedsAllThreeActions) {
    add_resource(rid("folder", "a"), "alice");
    add_resource(rid("folder", "b"), "carol");
    add_resource(rid("document", "memo"), "alice", rid("folder", "a"));

    ErrorReport report;
    // alice owns the document and folder a but has nothing on b.
    Status s = service_->set_parent(ctx_, rid("document", "memo"), rid("folder", "b"), user("alice"), &report);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(report.message, "resource folder/b not found");

    put_policy(pid("folder", "b", "writers"), grant({user("alice")}, {RoleName{"writer"}}), "carol");
    s = service_->set_parent(ctx_, rid("document", "memo"), rid("folder", "b"), user("alice"), &report);
    ASSERT_TRUE(is_ok(s)) << report.message;

    // carol owns b, so with set_parent on the document she may move it out.
    put_policy(pid("folder", "a", "writers"), grant({user("carol")}, {RoleName{"writer"}}), "alice");
    put_policy(pid("document", "memo", "movers"), grant({user("carol")}, {}, {ActionName{"set_parent"}}), "alice");
    s = service_->set_parent(ctx_, rid("document", "memo"), rid("folder", "a"), user("carol"), &report);
    ASSERT_TRUE(is_ok(s)) << report.message;
    s = service_->set_parent(ctx_, rid("document", "memo"), rid("folder", "b"), user("alice"), &report);
    ASSERT_TRUE(is_ok(s)) << report.message;
    s = service_->set_parent(ctx_, rid("document", "memo"), rid("folder", "a"), user("carol"), &report);
    ASSERT_TRUE(is_ok(s)) << report.message;

    bool removed = false;
    s = service_->delete_parent(ctx_, rid("document", "memo"), user("carol"), &removed, &report);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(report.message, "user carol may not remove_child on folder/a");
    ASSERT_TRUE(is_ok(service_->delete_parent(ctx_, rid("document", "memo"), user("alice"), &removed, &report)));
    EXPECT_TRUE(removed);
}

TEST_F(AccessServiceTest, SharePolicyActionGatesOnlyThatPolicy) {
    add_resource(rid("document", "memo"), "alice");
    put_policy(pid("document", "memo", "reviewers"),
               grant({user("bob")}, {RoleName{"reader"}}, {ActionName{"share_policy::reviewers"}}), "alice");

    AccessPolicy out;
    ErrorReport report;
    Status s = service_->overwrite_policy(ctx_, pid("document", "memo", "reviewers"),
                                          grant({user("bob"), user("carol")}, {RoleName{"reader"}},
                                                {ActionName{"share_policy::reviewers"}}),
                                          user("bob"), &out, &report);
    ASSERT_TRUE(is_ok(s)) << report.message;
    EXPECT_EQ(out.members, (std::set<Subject>{user("bob"), user("carol")}));
    EXPECT_TRUE(can(rid("document", "memo"), "read", "carol"));

    s = service_->overwrite_policy(ctx_, pid("document", "memo", "owner"), grant({user("bob")}, {RoleName{"owner"}}),
                                   user("bob"), nullptr, &report);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(report.message, "user bob may not alter_policies or share_policy::owner on document/memo");

    std::vector<AccessPolicy> listed;
    EXPECT_EQ(service_->list_policies(ctx_, rid("document", "memo"), user("bob"), &listed).code,
              StatusCode::PermissionDenied);
    ASSERT_TRUE(is_ok(service_->list_policies(ctx_, rid("document", "memo"), user("alice"), &listed)));
    EXPECT_EQ(listed.size(), 2u);
}

TEST_F(AccessServiceTest, PublicFlagAndPolicyDeletion) {
    add_resource(rid("document", "memo"), "alice");
    put_policy(pid("document", "memo", "everyone"), grant({}, {RoleName{"reader"}}), "alice");
    EXPECT_FALSE(can(rid("document", "memo"), "read", "carol"));

    ASSERT_TRUE(is_ok(service_->set_policy_public(ctx_, pid("document", "memo", "everyone"), true, user("alice"))));
    EXPECT_TRUE(can(rid("document", "memo"), "read", "carol"));

    // carol now holds read, so she is denied rather than hidden.
    EXPECT_EQ(service_->delete_policy(ctx_, pid("document", "memo", "everyone"), user("carol")).code,
              StatusCode::PermissionDenied);
    ASSERT_TRUE(is_ok(service_->delete_policy(ctx_, pid("document", "memo", "everyone"), user("alice"))));
    EXPECT_FALSE(can(rid("document", "memo"), "read", "carol"));
}

//=============================================================================
// Mirror notifications
//=============================================================================

TEST_F(AccessServiceTest, MembershipChangesNotifyTheGroupAndItsAncestors) {
    add_group("eng");
    add_group("all", {group("eng")});
    notifier_.take();

    bool added = false;
    ASSERT_TRUE(is_ok(service_->add_member(ctx_, group("eng"), user("alice"), &added)));
    EXPECT_TRUE(added);
    std::vector<sync::MirrorEvent> events = notifier_.take();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].group, GroupIdentity{group("eng")});
    EXPECT_EQ(events[1].group, GroupIdentity{group("all")});
    EXPECT_EQ(events[0].changed_members, (std::vector<Subject>{user("alice")}));
    EXPECT_EQ(events[0].trace_id, ctx_.trace_id);

    // No change, no event.
    ASSERT_TRUE(is_ok(service_->add_member(ctx_, group("eng"), user("alice"), &added)));
    EXPECT_FALSE(added);
    EXPECT_TRUE(notifier_.take().empty());

    // A rejected change is not published either.
    EXPECT_EQ(service_->add_member(ctx_, group("eng"), group("all")).code, StatusCode::InvalidGraph);
    EXPECT_TRUE(notifier_.take().empty());

    bool removed = false;
    ASSERT_TRUE(is_ok(service_->remove_member(ctx_, group("eng"), user("alice"), &removed)));
    EXPECT_TRUE(removed);
    EXPECT_EQ(notifier_.take().size(), 2u);
}

TEST_F(AccessServiceTest, PolicyChangesNotifyThePolicyGroup) {
    add_resource(rid("document", "memo"), "alice");
    std::vector<sync::MirrorEvent> events = notifier_.take();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].group, GroupIdentity{pid("document", "memo", "owner")});

    put_policy(pid("document", "memo", "readers"), grant({user("bob")}, {RoleName{"reader"}}), "alice");
    events = notifier_.take();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].group, GroupIdentity{pid("document", "memo", "readers")});

    // A grant-only change moves the version but has no members to announce.
    put_policy(pid("document", "memo", "readers"), grant({user("bob")}, {RoleName{"editor"}}), "alice");
    EXPECT_TRUE(notifier_.take().empty());
    SyncState state;
    ASSERT_TRUE(is_ok(service_->load_sync_state(ctx_, pid("document", "memo", "readers"), &state)));
    EXPECT_EQ(state.version, 2);
}

TEST_F(AccessServiceTest, DeletingAUserNotifiesEachAffectedGroupOnce) {
    add_group("eng", {user("alice")});
    add_group("all", {group("eng"), user("alice")});
    notifier_.take();

    ASSERT_TRUE(is_ok(service_->delete_user(ctx_, user("alice"))));
    const std::vector<sync::MirrorEvent> events = notifier_.take();
    ASSERT_EQ(events.size(), 2u);

    User u;
    EXPECT_EQ(service_->load_user(ctx_, user("alice"), &u).code, StatusCode::NotFound);
}

//=============================================================================
// Sync bookkeeping and directory seam
//=============================================================================

TEST_F(AccessServiceTest, SyncBookkeepingThroughTheService) {
    add_group("eng", {user("alice")});
    SyncState state;
    ASSERT_TRUE(is_ok(service_->load_sync_state(ctx_, group("eng"), &state)));

    bool advanced = false;
    ASSERT_TRUE(is_ok(service_->record_group_synchronized(ctx_, group("eng"), state.version, &advanced)));
    EXPECT_TRUE(advanced);

    std::vector<GroupIdentity> pending;
    ASSERT_TRUE(is_ok(service_->list_unsynchronized_groups(ctx_, 0, &pending)));
    EXPECT_EQ(std::count(pending.begin(), pending.end(), GroupIdentity{group("eng")}), 0);

    ErrorReport report;
    EXPECT_EQ(service_->record_group_synchronized(ctx_, group("eng"), state.version + 1, &advanced, &report).code,
              StatusCode::Invalid);
    EXPECT_FALSE(advanced);
}

TEST_F(AccessServiceTest, ExternalDirectoryDecidesWhoIsEnabled) {
    add_resource(rid("document", "memo"), "alice");
    FixedDirectory directory({{"alice", false}, {"bob", true}});
    service_ = std::make_unique<service::AccessService>(db_, registry_, "example.org", &directory, &notifier_);

    EXPECT_FALSE(can(rid("document", "memo"), "read", "alice"));

    User u;
    ASSERT_TRUE(is_ok(service_->load_user(ctx_, user("bob"), &u)));
    EXPECT_TRUE(u.enabled);
    EXPECT_EQ(service_->load_user(ctx_, user("carol"), &u).code, StatusCode::NotFound);
}

TEST_F(AccessServiceTest, GroupQueriesPassThrough) {
    add_group("eng", {user("alice"), user("bob")});
    add_group("ops", {user("bob")});

    std::vector<UserId> users;
    ASSERT_TRUE(is_ok(service_->intersect_groups(ctx_, {group("eng"), group("ops")}, &users)));
    EXPECT_EQ(users, (std::vector<UserId>{user("bob")}));

    bool member = false;
    ASSERT_TRUE(is_ok(service_->is_member(ctx_, group("eng"), user("alice"), &member)));
    EXPECT_TRUE(member);

    Email email;
    ASSERT_TRUE(is_ok(service_->load_group_email(ctx_, group("ops"), &email)));
    Subject subject;
    ASSERT_TRUE(is_ok(service_->load_subject_from_email(ctx_, email, &subject)));
    EXPECT_EQ(subject, Subject{group("ops")});

    EXPECT_EQ(service_->is_member(ctx_, group("eng"), user("alice"), nullptr).code, StatusCode::Invalid);
}
