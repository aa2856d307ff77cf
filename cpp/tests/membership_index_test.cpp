#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "test_support.hpp"

using namespace warden;
using namespace warden::core;
using namespace warden::testing;

namespace {

// Direct edges kept alongside the store; closure answers are checked
// against a breadth-first walk over them.
struct ReferenceGraph {
    std::map<int, std::set<int>> child_groups;
    std::map<int, std::set<int>> users;

    std::set<int> reachable_groups(int g) const {
        std::set<int> seen;
        std::vector<int> frontier{g};
        while (!frontier.empty()) {
            const int cur = frontier.back();
            frontier.pop_back();
            const auto it = child_groups.find(cur);
            if (it == child_groups.end()) {
                continue;
            }
            for (int c : it->second) {
                if (seen.insert(c).second) {
                    frontier.push_back(c);
                }
            }
        }
        return seen;
    }

    std::set<int> reachable_users(int g) const {
        std::set<int> out;
        std::set<int> groups = reachable_groups(g);
        groups.insert(g);
        for (int x : groups) {
            const auto it = users.find(x);
            if (it != users.end()) {
                out.insert(it->second.begin(), it->second.end());
            }
        }
        return out;
    }
};

std::string group_name(int i) {
    return "g" + std::to_string(i);
}

std::string user_name(int i) {
    return "u" + std::to_string(i);
}

class MembershipIndexTest : public StoreTest {
protected:
    // Groups are layered; an edge always points to a deeper layer so the
    // graph stays acyclic.
    void build(std::mt19937& rng, int layers, int per_layer, int fanout, int user_count) {
        layers_ = layers;
        per_layer_ = per_layer;
        user_count_ = user_count;
        for (int u = 0; u < user_count; ++u) {
            add_user(user_name(u));
        }
        for (int g = 0; g < layers * per_layer; ++g) {
            add_group(group_name(g));
        }

        std::uniform_int_distribution<int> pick_user(0, user_count - 1);
        for (int layer = 0; layer < layers; ++layer) {
            for (int k = 0; k < per_layer; ++k) {
                const int g = layer * per_layer + k;
                for (int f = 0; f < fanout; ++f) {
                    if (layer + 1 < layers && f % 2 == 0) {
                        std::uniform_int_distribution<int> pick_child((layer + 1) * per_layer,
                                                                      layers * per_layer - 1);
                        link_group(g, pick_child(rng));
                    } else {
                        link_user(g, pick_user(rng));
                    }
                }
            }
        }
    }

    void link_group(int parent, int child) {
        ASSERT_TRUE(is_ok(add_edge(group(group_name(parent)), group(group_name(child)))));
        ref_.child_groups[parent].insert(child);
    }

    void link_user(int parent, int u) {
        ASSERT_TRUE(is_ok(add_edge(group(group_name(parent)), user(user_name(u)))));
        ref_.users[parent].insert(u);
    }

    // Removes a random existing edge; returns false when none are left.
    bool unlink_random(std::mt19937& rng) {
        std::vector<std::pair<int, int>> group_edges;
        std::vector<std::pair<int, int>> user_edges;
        for (const auto& [p, cs] : ref_.child_groups) {
            for (int c : cs) {
                group_edges.emplace_back(p, c);
            }
        }
        for (const auto& [p, us] : ref_.users) {
            for (int u : us) {
                user_edges.emplace_back(p, u);
            }
        }
        if (group_edges.empty() && user_edges.empty()) {
            return false;
        }
        std::uniform_int_distribution<std::size_t> pick(0, group_edges.size() + user_edges.size() - 1);
        const std::size_t i = pick(rng);
        if (i < group_edges.size()) {
            const auto [p, c] = group_edges[i];
            EXPECT_TRUE(is_ok(remove_edge(group(group_name(p)), group(group_name(c)))));
            ref_.child_groups[p].erase(c);
        } else {
            const auto [p, u] = user_edges[i - group_edges.size()];
            EXPECT_TRUE(is_ok(remove_edge(group(group_name(p)), user(user_name(u)))));
            ref_.users[p].erase(u);
        }
        return true;
    }

    void expect_matches_reference() {
        const int groups = layers_ * per_layer_;
        for (int g = 0; g < groups; ++g) {
            std::vector<UserId> expected;
            for (int u : ref_.reachable_users(g)) {
                expected.push_back(user(user_name(u)));
            }
            std::sort(expected.begin(), expected.end());
            EXPECT_EQ(flattened(group(group_name(g))), expected) << "flattened " << group_name(g);

            const std::set<int> nested = ref_.reachable_groups(g);
            for (int other = 0; other < groups; ++other) {
                EXPECT_EQ(member_of(group(group_name(g)), group(group_name(other))), nested.count(other) > 0)
                    << group_name(other) << " in " << group_name(g);
            }
        }
    }

    // Random subsets of one to three groups, compared against the set
    // intersection of their reference closures.
    void expect_intersections_match(std::mt19937& rng, int samples) {
        std::vector<int> all(layers_ * per_layer_);
        for (int g = 0; g < static_cast<int>(all.size()); ++g) {
            all[g] = g;
        }
        std::uniform_int_distribution<int> pick_size(1, 3);
        for (int i = 0; i < samples; ++i) {
            std::shuffle(all.begin(), all.end(), rng);
            const int size = pick_size(rng);

            std::vector<GroupIdentity> chosen;
            std::set<int> common = ref_.reachable_users(all[0]);
            std::string label;
            for (int k = 0; k < size; ++k) {
                chosen.push_back(group(group_name(all[k])));
                label += group_name(all[k]) + " ";
                std::set<int> next;
                const std::set<int> users = ref_.reachable_users(all[k]);
                std::set_intersection(common.begin(), common.end(), users.begin(), users.end(),
                                      std::inserter(next, next.begin()));
                common = std::move(next);
            }

            std::vector<UserId> expected;
            for (int u : common) {
                expected.push_back(user(user_name(u)));
            }
            std::sort(expected.begin(), expected.end());

            std::vector<UserId> got;
            ASSERT_TRUE(is_ok(read([&](db::DbSession& s) { return groups_.intersect_groups(s, chosen, &got); })));
            EXPECT_EQ(got, expected) << "intersect " << label;
        }
    }

    ReferenceGraph ref_;
    int layers_{0};
    int per_layer_{0};
    int user_count_{0};
};

} // namespace

class SeededMembershipIndexTest : public MembershipIndexTest, public ::testing::WithParamInterface<unsigned> {};

TEST_P(SeededMembershipIndexTest, MatchesBreadthFirstWalkAfterInserts) {
    std::mt19937 rng(GetParam());
    build(rng, 4, 4, 6, 12);
    expect_matches_reference();
}

TEST_P(SeededMembershipIndexTest, IntersectionMatchesReferenceClosures) {
    std::mt19937 rng(GetParam());
    build(rng, 4, 5, 10, 16);
    expect_intersections_match(rng, 30);

    for (int round = 0; round < 3; ++round) {
        for (int k = 0; k < 12; ++k) {
            ASSERT_TRUE(unlink_random(rng));
        }
        expect_intersections_match(rng, 20);
    }
}

INSTANTIATE_TEST_SUITE_P(Seeds, SeededMembershipIndexTest, ::testing::Values(1u, 7u, 42u));

TEST_F(MembershipIndexTest, MatchesBreadthFirstWalkWhileEdgesAreRemoved) {
    std::mt19937 rng(2024);
    build(rng, 3, 5, 5, 10);
    expect_matches_reference();

    int step = 0;
    while (unlink_random(rng)) {
        if (++step % 4 == 0) {
            expect_matches_reference();
        }
    }
    expect_matches_reference();
}

TEST_F(MembershipIndexTest, DiamondSurvivesRemovalOfOneBranch) {
    add_user("alice");
    add_group("bottom", {user("alice")});
    add_group("left", {group("bottom")});
    add_group("right", {group("bottom")});
    add_group("top", {group("left"), group("right")});

    ASSERT_TRUE(is_ok(remove_edge(group("top"), group("left"))));
    EXPECT_TRUE(member_of(group("top"), user("alice")));
    EXPECT_TRUE(member_of(group("top"), group("bottom")));
    EXPECT_FALSE(member_of(group("top"), group("left")));

    ASSERT_TRUE(is_ok(remove_edge(group("right"), group("bottom"))));
    EXPECT_FALSE(member_of(group("top"), user("alice")));
    EXPECT_TRUE(member_of(group("left"), user("alice")));
}

TEST_F(MembershipIndexTest, RecomputeReproducesTheMaintainedClosure) {
    add_user("alice");
    add_user("bob");
    add_group("inner", {user("alice")});
    add_group("outer", {group("inner"), user("bob")});

    const std::vector<UserId> before = flattened(group("outer"));
    ASSERT_TRUE(is_ok(write([&](db::DbSession& s) {
        GroupKey key{};
        const Status st = groups_.resolve(s, group("outer"), &key);
        if (!is_ok(st)) {
            return st;
        }
        return index_.recompute_group(s, key);
    })));
    EXPECT_EQ(flattened(group("outer")), before);
    EXPECT_EQ(before, (std::vector<UserId>{user("alice"), user("bob")}));
}
