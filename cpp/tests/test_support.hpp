#pragma once

#include <gtest/gtest.h>

#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/request_context.hpp"
#include "warden/db/db.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/group_store.hpp"
#include "warden/directory/membership_index.hpp"
#include "warden/directory/user_store.hpp"
#include "warden/security/resource_store.hpp"
#include "warden/security/resource_types.hpp"
#include "warden/service/access_service.hpp"
#include "warden/sync/mirror.hpp"

namespace warden::testing {
    using namespace warden::core;

    inline ResourceType make_type(const std::string& name, std::initializer_list<const char*> patterns,
                                  const std::string& owner,
                                  std::initializer_list<std::pair<const char*, std::vector<const char*>>> roles) {
        ResourceType t;
        t.name = ResourceTypeName{name};
        for (const char* p : patterns) {
            t.action_patterns.insert(p);
        }
        for (const auto& [role, actions] : roles) {
            ResourceRole r;
            r.name = RoleName{role};
            for (const char* a : actions) {
                r.actions.insert(ActionName{a});
            }
            t.roles.emplace(r.name, std::move(r));
        }
        t.owner_role = RoleName{owner};
        return t;
    }

    // folder, document and managed-group, the types every suite shares.
    inline void fill_registry(security::ResourceTypeRegistry* registry) {
        ASSERT_TRUE(is_ok(registry->add(make_type(
            "folder",
            {"read", "write", "delete", "add_child", "remove_child", "set_parent", "get_parent", "list_children",
             "read_policies", "alter_policies", "share_policy::.+"},
            "owner",
            {
                {"owner", {"read", "write", "delete", "add_child", "remove_child", "set_parent", "get_parent",
                           "list_children", "read_policies", "alter_policies"}},
                {"writer", {"read", "write", "add_child"}},
                {"reader", {"read", "get_parent", "list_children"}},
            }))));
        ASSERT_TRUE(is_ok(registry->add(make_type(
            "document",
            {"read", "write", "delete", "set_parent", "get_parent", "read_policies", "alter_policies",
             "share_policy::.+"},
            "owner",
            {
                {"owner", {"read", "write", "delete", "set_parent", "get_parent", "read_policies", "alter_policies"}},
                {"editor", {"read", "write"}},
                {"reader", {"read"}},
            }))));
        ASSERT_TRUE(is_ok(registry->add(make_type(
            "managed-group",
            {"delete", "read_policies", "alter_policies", "share_policy::member"},
            "admin",
            {
                {"admin", {"delete", "read_policies", "alter_policies"}},
                {"member", {}},
            }))));
    }

    inline FullyQualifiedResourceId rid(const std::string& type, const std::string& id) {
        return FullyQualifiedResourceId{ResourceTypeName{type}, ResourceId{id}};
    }

    inline PolicyId pid(const std::string& type, const std::string& id, const std::string& name) {
        return PolicyId{rid(type, id), PolicyName{name}};
    }

    inline UserId user(const std::string& id) {
        return UserId{id};
    }

    inline GroupName group(const std::string& name) {
        return GroupName{name};
    }

    class RecordingNotifier final : public sync::MirrorNotifier {
    public:
        void notify(const sync::MirrorEvent& event) noexcept override {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }

        std::vector<sync::MirrorEvent> take() {
            std::lock_guard<std::mutex> lock(mutex_);
            return std::exchange(events_, {});
        }

    private:
        std::mutex mutex_;
        std::vector<sync::MirrorEvent> events_;
    };

    // Fresh in-memory database per test.
    class DbTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_TRUE(is_ok(db::db_open(db::DbConfig{}, &db_)));
            ctx_.trace_id = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        }

        void TearDown() override {
            EXPECT_TRUE(is_ok(db::db_close(db_)));
        }

        Status write(const db::TxnBody& body, ErrorReport* report = nullptr) {
            return db::db_write(db_, "test", ctx_, body, report);
        }

        Status read(const db::TxnBody& body, ErrorReport* report = nullptr) {
            return db::db_read(db_, "test", ctx_, body, report);
        }

        db::DbHandle db_{};
        RequestContext ctx_;
    };

    // Group, user and resource stores over one database, without the
    // service's authorization layer.
    class StoreTest : public DbTest {
    protected:
        void SetUp() override {
            DbTest::SetUp();
            fill_registry(&registry_);
            ASSERT_TRUE(is_ok(write([&](db::DbSession& s) { return resources_.register_resource_types(s); })));
        }

        void add_user(const std::string& id) {
            ErrorReport report;
            ASSERT_TRUE(is_ok(write([&](db::DbSession& s) {
                return users_.create_user(s, UserId{id}, Email{id + "@example.org"}, true);
            }, &report))) << report.message;
        }

        void add_group(const std::string& name, const std::set<Subject>& members = {}) {
            ErrorReport report;
            ASSERT_TRUE(is_ok(write([&](db::DbSession& s) {
                return groups_.create_group(s, GroupName{name}, Email{name + "@groups.example.org"}, members);
            }, &report))) << report.message;
        }

        Status add_edge(const GroupIdentity& g, const Subject& member, ErrorReport* report = nullptr) {
            return write([&](db::DbSession& s) { return groups_.add_member(s, g, member); }, report);
        }

        Status remove_edge(const GroupIdentity& g, const Subject& member) {
            return write([&](db::DbSession& s) { return groups_.remove_member(s, g, member); });
        }

        bool member_of(const GroupIdentity& g, const Subject& member) {
            bool out = false;
            EXPECT_TRUE(is_ok(read([&](db::DbSession& s) { return groups_.is_member(s, g, member, &out); })));
            return out;
        }

        std::vector<UserId> flattened(const GroupIdentity& g) {
            std::vector<UserId> out;
            EXPECT_TRUE(is_ok(read([&](db::DbSession& s) { return groups_.list_flattened_members(s, g, &out); })));
            return out;
        }

        security::ResourceTypeRegistry registry_;
        directory::FlatTableIndex index_;
        directory::GroupStore groups_{index_};
        directory::UserStore users_{groups_};
        security::ResourceStore resources_{registry_, groups_, "example.org"};
    };

    // The full service with a recording mirror notifier.
    class ServiceTest : public DbTest {
    protected:
        void SetUp() override {
            DbTest::SetUp();
            fill_registry(&registry_);
            service_ = std::make_unique<service::AccessService>(db_, registry_, "example.org", nullptr, &notifier_);
            ASSERT_TRUE(is_ok(service_->init(ctx_)));
        }

        void TearDown() override {
            service_.reset();
            DbTest::TearDown();
        }

        void add_user(const std::string& id, bool enabled = true) {
            ErrorReport report;
            ASSERT_TRUE(is_ok(service_->create_user(ctx_, UserId{id}, Email{id + "@example.org"}, enabled,
                                                    nullptr, &report)))
                << report.message;
        }

        void add_group(const std::string& name, const std::set<Subject>& members = {}) {
            ErrorReport report;
            ASSERT_TRUE(is_ok(service_->create_group(ctx_, GroupName{name}, Email{name + "@groups.example.org"},
                                                     members, nullptr, &report)))
                << report.message;
        }

        void add_resource(const FullyQualifiedResourceId& id, const std::string& creator,
                          const std::optional<FullyQualifiedResourceId>& parent = std::nullopt) {
            ErrorReport report;
            ASSERT_TRUE(is_ok(service_->create_resource(ctx_, id, UserId{creator}, parent, {}, nullptr, &report)))
                << report.message;
        }

        void put_policy(const PolicyId& id, const AccessPolicyMembership& spec, const std::string& caller) {
            ErrorReport report;
            ASSERT_TRUE(is_ok(service_->overwrite_policy(ctx_, id, spec, UserId{caller}, nullptr, &report)))
                << report.message;
        }

        bool can(const FullyQualifiedResourceId& resource, const std::string& action, const std::string& who) {
            bool out = false;
            ErrorReport report;
            EXPECT_TRUE(is_ok(service_->check_permission(ctx_, resource, ActionName{action}, UserId{who}, &out,
                                                         &report)))
                << report.message;
            return out;
        }

        security::ResourceTypeRegistry registry_;
        RecordingNotifier notifier_;
        std::unique_ptr<service::AccessService> service_;
    };

} // namespace warden::testing
