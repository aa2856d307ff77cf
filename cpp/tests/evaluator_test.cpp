#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "warden/security/evaluator.hpp"

using namespace warden;
using namespace warden::core;
using namespace warden::testing;

namespace {

std::set<ActionName> actions(std::initializer_list<const char*> names) {
    std::set<ActionName> out;
    for (const char* n : names) {
        out.insert(ActionName{n});
    }
    return out;
}

class EvaluatorTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        for (const char* u : {"alice", "bob", "carol"}) {
            add_user(u);
        }
    }

    void create(const FullyQualifiedResourceId& id, const std::string& creator,
                const std::optional<FullyQualifiedResourceId>& parent = std::nullopt) {
        ErrorReport report;
        ASSERT_TRUE(is_ok(write([&](db::DbSession& s) {
            return resources_.create_resource(s, id, user(creator), parent, {});
        }, &report))) << report.message;
    }

    void put(const PolicyId& id, const AccessPolicyMembership& spec) {
        ErrorReport report;
        ASSERT_TRUE(is_ok(write([&](db::DbSession& s) { return resources_.overwrite_policy(s, id, spec); }, &report)))
            << report.message;
    }

    bool can(const FullyQualifiedResourceId& r, const char* action, const std::string& who) {
        bool out = false;
        EXPECT_TRUE(is_ok(read([&](db::DbSession& s) {
            return evaluator_.has_permission(s, r, ActionName{action}, user(who), &out);
        })));
        return out;
    }

    std::set<ActionName> held(const FullyQualifiedResourceId& r, const std::string& who) {
        std::set<ActionName> out;
        EXPECT_TRUE(is_ok(read([&](db::DbSession& s) {
            return evaluator_.list_user_resource_actions(s, r, user(who), &out);
        })));
        return out;
    }

    std::set<RoleName> roles(const FullyQualifiedResourceId& r, const std::string& who) {
        std::set<RoleName> out;
        EXPECT_TRUE(is_ok(read([&](db::DbSession& s) {
            return evaluator_.list_user_resource_roles(s, r, user(who), &out);
        })));
        return out;
    }

    std::vector<FilteredResource> filtered(const char* type, const std::string& who) {
        std::vector<FilteredResource> out;
        ErrorReport report;
        EXPECT_TRUE(is_ok(read([&](db::DbSession& s) {
            return evaluator_.list_filtered_resources(s, ResourceTypeName{type}, user(who), &out);
        }, &report))) << report.message;
        return out;
    }

    security::PolicyEvaluator evaluator_{registry_, resources_, index_};
};

} // namespace

//=============================================================================
// Single resource
//=============================================================================

TEST_F(EvaluatorTest, OwnerRoleExpandsToItsActions) {
    create(rid("document", "memo"), "alice");

    EXPECT_TRUE(can(rid("document", "memo"), "write", "alice"));
    EXPECT_TRUE(can(rid("document", "memo"), "alter_policies", "alice"));
    EXPECT_FALSE(can(rid("document", "memo"), "read", "bob"));
    EXPECT_EQ(held(rid("document", "memo"), "alice"),
              actions({"read", "write", "delete", "set_parent", "get_parent", "read_policies", "alter_policies"}));
    EXPECT_EQ(roles(rid("document", "memo"), "alice"), (std::set<RoleName>{RoleName{"owner"}}));
    EXPECT_TRUE(held(rid("document", "memo"), "bob").empty());
}

TEST_F(EvaluatorTest, GrantsAreAdditiveAcrossPolicies) {
    create(rid("document", "memo"), "alice");
    AccessPolicyMembership readers;
    readers.members = {user("bob")};
    readers.roles = {RoleName{"reader"}};
    put(pid("document", "memo", "readers"), readers);

    AccessPolicyMembership empty;
    empty.members = {user("bob")};
    put(pid("document", "memo", "watchers"), empty);

    EXPECT_TRUE(can(rid("document", "memo"), "read", "bob"));
    EXPECT_EQ(held(rid("document", "memo"), "bob"), actions({"read"}));

    ASSERT_TRUE(is_ok(remove_edge(pid("document", "memo", "readers"), user("bob"))));
    EXPECT_FALSE(can(rid("document", "memo"), "read", "bob"));
    EXPECT_TRUE(held(rid("document", "memo"), "bob").empty());
    EXPECT_TRUE(member_of(pid("document", "memo", "watchers"), user("bob")));
}

TEST_F(EvaluatorTest, DirectActionsWithoutRoles) {
    create(rid("document", "memo"), "alice");
    AccessPolicyMembership spec;
    spec.members = {user("bob")};
    spec.actions = {ActionName{"share_policy::reviewers"}};
    put(pid("document", "memo", "reviewers"), spec);

    EXPECT_TRUE(can(rid("document", "memo"), "share_policy::reviewers", "bob"));
    EXPECT_FALSE(can(rid("document", "memo"), "read", "bob"));
    EXPECT_TRUE(roles(rid("document", "memo"), "bob").empty());
}

TEST_F(EvaluatorTest, NestedGroupMembershipGrantsAccess) {
    create(rid("document", "memo"), "alice");
    add_group("writers", {user("carol")});
    add_group("staff", {group("writers")});

    AccessPolicyMembership spec;
    spec.members = {group("staff")};
    spec.roles = {RoleName{"editor"}};
    put(pid("document", "memo", "editors"), spec);

    EXPECT_TRUE(can(rid("document", "memo"), "write", "carol"));
    EXPECT_FALSE(can(rid("document", "memo"), "delete", "carol"));

    ASSERT_TRUE(is_ok(remove_edge(group("writers"), user("carol"))));
    EXPECT_FALSE(can(rid("document", "memo"), "write", "carol"));
}

TEST_F(EvaluatorTest, DescendantGrantsSkipTheHolder) {
    create(rid("folder", "root"), "alice");
    create(rid("folder", "sub"), "alice", rid("folder", "root"));
    create(rid("document", "memo"), "alice", rid("folder", "sub"));

    AccessPolicyMembership spec;
    spec.members = {user("bob")};
    spec.descendant_permissions = {
        DescendantPermissions{ResourceTypeName{"document"}, {RoleName{"editor"}}, {}},
        DescendantPermissions{ResourceTypeName{"folder"}, {}, {ActionName{"list_children"}}},
    };
    put(pid("folder", "root", "team"), spec);

    // Two levels down.
    EXPECT_TRUE(can(rid("document", "memo"), "write", "bob"));
    EXPECT_FALSE(can(rid("document", "memo"), "delete", "bob"));
    EXPECT_EQ(roles(rid("document", "memo"), "bob"), (std::set<RoleName>{RoleName{"editor"}}));

    EXPECT_TRUE(can(rid("folder", "sub"), "list_children", "bob"));
    EXPECT_FALSE(can(rid("folder", "root"), "list_children", "bob"));
    EXPECT_TRUE(held(rid("folder", "root"), "bob").empty());

    // The holder's own owner role is not inherited by its children.
    EXPECT_TRUE(can(rid("document", "memo"), "delete", "alice"));
    ASSERT_TRUE(is_ok(write([&](db::DbSession& s) { return resources_.delete_parent(s, rid("document", "memo"), nullptr); })));
    EXPECT_FALSE(can(rid("document", "memo"), "write", "bob"));
}

TEST_F(EvaluatorTest, PublicPolicyAppliesToEveryone) {
    create(rid("document", "memo"), "alice");
    AccessPolicyMembership spec;
    spec.roles = {RoleName{"reader"}};
    spec.is_public = true;
    put(pid("document", "memo", "everyone"), spec);

    EXPECT_TRUE(can(rid("document", "memo"), "read", "bob"));
    EXPECT_TRUE(can(rid("document", "memo"), "read", "stranger"));
    EXPECT_FALSE(can(rid("document", "memo"), "write", "bob"));

    ASSERT_TRUE(is_ok(write([&](db::DbSession& s) {
        return resources_.set_public(s, pid("document", "memo", "everyone"), false, nullptr);
    })));
    EXPECT_FALSE(can(rid("document", "memo"), "read", "bob"));
}

TEST_F(EvaluatorTest, MissingResourceHasNoGrants) {
    EXPECT_FALSE(can(rid("document", "ghost"), "read", "alice"));
    EXPECT_TRUE(held(rid("document", "ghost"), "alice").empty());

    std::set<PolicyName> policies;
    ASSERT_TRUE(is_ok(read([&](db::DbSession& s) {
        return evaluator_.list_user_policies(s, rid("document", "ghost"), user("alice"), &policies);
    })));
    EXPECT_TRUE(policies.empty());
}

TEST_F(EvaluatorTest, UserPoliciesAreOnlyThoseOnTheResource) {
    create(rid("folder", "root"), "alice");
    create(rid("folder", "sub"), "bob", rid("folder", "root"));

    AccessPolicyMembership spec;
    spec.members = {user("alice")};
    spec.descendant_permissions = {DescendantPermissions{ResourceTypeName{"folder"}, {RoleName{"reader"}}, {}}};
    put(pid("folder", "root", "inherit"), spec);

    std::set<PolicyName> policies;
    ASSERT_TRUE(is_ok(read([&](db::DbSession& s) {
        return evaluator_.list_user_policies(s, rid("folder", "sub"), user("alice"), &policies);
    })));
    EXPECT_TRUE(policies.empty());
    EXPECT_TRUE(can(rid("folder", "sub"), "read", "alice"));

    ASSERT_TRUE(is_ok(read([&](db::DbSession& s) {
        return evaluator_.list_user_policies(s, rid("folder", "root"), user("alice"), &policies);
    })));
    EXPECT_EQ(policies, (std::set<PolicyName>{PolicyName{"inherit"}, PolicyName{"owner"}}));
}

//=============================================================================
// Listings
//=============================================================================

TEST_F(EvaluatorTest, FilteredResourcesCombineDirectAndDescendantGrants) {
    create(rid("folder", "root"), "alice");
    create(rid("document", "a"), "bob", rid("folder", "root"));
    create(rid("document", "b"), "carol", rid("folder", "root"));
    create(rid("document", "c"), "carol");

    AccessPolicyMembership spec;
    spec.members = {user("bob")};
    spec.descendant_permissions = {DescendantPermissions{ResourceTypeName{"document"}, {RoleName{"reader"}}, {}}};
    put(pid("folder", "root", "browse"), spec);

    const std::vector<FilteredResource> docs = filtered("document", "bob");
    ASSERT_EQ(docs.size(), 2u);

    EXPECT_EQ(docs[0].resource, rid("document", "a"));
    EXPECT_EQ(docs[0].policies, (std::set<PolicyName>{PolicyName{"owner"}}));
    EXPECT_EQ(docs[0].roles, (std::set<RoleName>{RoleName{"owner"}, RoleName{"reader"}}));
    EXPECT_EQ(docs[0].actions.count(ActionName{"delete"}), 1u);
    EXPECT_FALSE(docs[0].is_public);

    EXPECT_EQ(docs[1].resource, rid("document", "b"));
    EXPECT_TRUE(docs[1].policies.empty());
    EXPECT_EQ(docs[1].roles, (std::set<RoleName>{RoleName{"reader"}}));
    EXPECT_EQ(docs[1].actions, actions({"read"}));

    std::map<ResourceId, std::set<RoleName>> by_id;
    ASSERT_TRUE(is_ok(read([&](db::DbSession& s) {
        return evaluator_.list_resources_and_roles(s, ResourceTypeName{"document"}, user("carol"), &by_id);
    })));
    EXPECT_EQ(by_id.size(), 2u);
    EXPECT_EQ(by_id[ResourceId{"c"}], (std::set<RoleName>{RoleName{"owner"}}));
}

TEST_F(EvaluatorTest, FilteredResourcesIncludePublicOnes) {
    create(rid("document", "notice"), "alice");
    AccessPolicyMembership spec;
    spec.roles = {RoleName{"reader"}};
    spec.is_public = true;
    put(pid("document", "notice", "public"), spec);

    const std::vector<FilteredResource> docs = filtered("document", "bob");
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_TRUE(docs[0].is_public);
    EXPECT_EQ(docs[0].policies, (std::set<PolicyName>{PolicyName{"public"}}));
}

TEST_F(EvaluatorTest, UnknownTypeListingIsNotFound) {
    std::vector<FilteredResource> out;
    EXPECT_EQ(read([&](db::DbSession& s) {
        return evaluator_.list_filtered_resources(s, ResourceTypeName{"spaceship"}, user("alice"), &out);
    }).code, StatusCode::NotFound);
}
