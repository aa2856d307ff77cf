#include <cstdio>
#include <string>

#include <gtest/gtest.h>

#include "warden/core/errors.hpp"
#include "warden/core/log.hpp"
#include "warden/core/types.hpp"
#include "warden/core/validation.hpp"

using namespace warden::core;

TEST(Status, DefaultIsOk) {
    Status s{};
    EXPECT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(s.domain, StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(is_ok(s));
}

TEST(Status, OnlyBusyIsTransient) {
    EXPECT_TRUE(is_transient(make_status(StatusDomain::Db, StatusCode::Busy)));
    EXPECT_FALSE(is_transient(make_status(StatusDomain::Db, StatusCode::Conflict)));
    EXPECT_FALSE(is_transient(make_status(StatusDomain::Directory, StatusCode::InvalidGraph)));
}

TEST(Status, StableNames) {
    EXPECT_STREQ(status_code_name(StatusCode::InvalidGraph), "InvalidGraph");
    EXPECT_STREQ(status_code_name(StatusCode::ReferentialIntegrity), "ReferentialIntegrity");
    EXPECT_STREQ(status_code_name(StatusCode::PermissionDenied), "PermissionDenied");
    EXPECT_STREQ(status_domain_name(StatusDomain::Directory), "Directory");
    EXPECT_STREQ(status_domain_name(StatusDomain::Config), "Config");
}

TEST(ErrorReport, NullReportIsIgnored) {
    report_error(nullptr, make_status(StatusDomain::Core, StatusCode::Invalid), "dropped");

    ErrorReport report;
    report_error(&report, make_status(StatusDomain::Sync, StatusCode::Invalid), "kept");
    EXPECT_EQ(report.status.domain, StatusDomain::Sync);
    EXPECT_EQ(report.message, "kept");
}

TEST(Identifiers, ResourceIdRoundTripsThroughText) {
    FullyQualifiedResourceId r;
    ASSERT_TRUE(is_ok(parse_resource_id("folder/reports", &r)));
    EXPECT_EQ(r.type.v, "folder");
    EXPECT_EQ(r.id.v, "reports");
    EXPECT_EQ(to_string(r), "folder/reports");

    EXPECT_FALSE(is_ok(parse_resource_id("folder", &r)));
    EXPECT_FALSE(is_ok(parse_resource_id("/reports", &r)));
    EXPECT_FALSE(is_ok(parse_resource_id("folder/", &r)));
    EXPECT_FALSE(is_ok(parse_resource_id("folder/a/b", &r)));
}

TEST(Identifiers, PolicyIdSplitsOnLastSlash) {
    PolicyId p;
    ASSERT_TRUE(is_ok(parse_policy_id("document/design/editors", &p)));
    EXPECT_EQ(p.resource.type.v, "document");
    EXPECT_EQ(p.resource.id.v, "design");
    EXPECT_EQ(p.name.v, "editors");
    EXPECT_EQ(to_string(p), "document/design/editors");

    EXPECT_FALSE(is_ok(parse_policy_id("document/spec", &p)));
    EXPECT_FALSE(is_ok(parse_policy_id("document/spec/", &p)));
}

TEST(Identifiers, SubjectsCarryTheirKind) {
    Subject s;
    ASSERT_TRUE(is_ok(parse_subject("user:alice", &s)));
    EXPECT_EQ(subject_kind(s), SubjectKind::User);
    EXPECT_EQ(to_string(s), "user:alice");

    ASSERT_TRUE(is_ok(parse_subject("group:eng", &s)));
    EXPECT_EQ(subject_kind(s), SubjectKind::Group);
    ASSERT_TRUE(to_group_identity(s).has_value());

    ASSERT_TRUE(is_ok(parse_subject("policy:folder/root/owner", &s)));
    EXPECT_EQ(subject_kind(s), SubjectKind::Policy);
    EXPECT_EQ(to_string(s), "policy:folder/root/owner");

    EXPECT_FALSE(is_ok(parse_subject("robot:r2", &s)));
    EXPECT_FALSE(is_ok(parse_subject("alice", &s)));
    EXPECT_FALSE(is_ok(parse_subject("user:", &s)));
}

TEST(Identifiers, UsersAreNotGroups) {
    EXPECT_FALSE(to_group_identity(Subject{UserId{"alice"}}).has_value());
    const GroupIdentity g = GroupName{"eng"};
    EXPECT_EQ(to_subject(g), Subject{GroupName{"eng"}});
}

TEST(Validation, GroupNames) {
    EXPECT_TRUE(valid_group_name("eng-team_2"));
    EXPECT_TRUE(valid_group_name(std::string(60, 'a')));
    EXPECT_FALSE(valid_group_name(std::string(61, 'a')));
    EXPECT_FALSE(valid_group_name(""));
    EXPECT_FALSE(valid_group_name("has space"));
    EXPECT_FALSE(valid_group_name("dot.ted"));
}

TEST(Validation, ResourceIds) {
    EXPECT_TRUE(valid_resource_id("q3-report.pdf"));
    EXPECT_TRUE(valid_resource_id(std::string(100, 'x')));
    EXPECT_FALSE(valid_resource_id(std::string(101, 'x')));
    EXPECT_FALSE(valid_resource_id("a/b"));
    EXPECT_FALSE(valid_resource_id(""));
}

TEST(Validation, Emails) {
    EXPECT_TRUE(valid_email("alice@example.org"));
    EXPECT_FALSE(valid_email("alice"));
    EXPECT_FALSE(valid_email("@example.org"));
    EXPECT_FALSE(valid_email("alice@"));
    EXPECT_FALSE(valid_email("a@b@c"));
}

TEST(Log, ParsesLevelsCaseInsensitively) {
    LogLevel level = LogLevel::Off;
    ASSERT_TRUE(log_parse_level("DEBUG", &level));
    EXPECT_EQ(level, LogLevel::Debug);
    ASSERT_TRUE(log_parse_level("warning", &level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(log_parse_level("loud", &level));
    EXPECT_STREQ(log_level_name(LogLevel::Error), "error");
}

TEST(Log, SetLevelOverrides) {
    const LogLevel before = log_level();
    log_set_level(LogLevel::Error);
    EXPECT_EQ(log_level(), LogLevel::Error);
    log_set_level(before);
}

TEST(Log, ThresholdFiltersLines) {
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);
    const LogLevel before = log_level();
    log_set_output(out);

    log_set_level(LogLevel::Warn);
    log_debug("hidden %d", 1);
    log_info("hidden %s", "too");
    log_warn("kept %d", 2);
    log_error("kept %s", "also");
    log_write(LogLevel::Off, "never");
    log_set_level(LogLevel::Off);
    log_error("silenced");

    log_set_output(nullptr);
    log_set_level(before);

    std::string text;
    std::rewind(out);
    char buf[256];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), out)) > 0) {
        text.append(buf, n);
    }
    std::fclose(out);
    EXPECT_EQ(text, "warn: kept 2\nerror: kept also\n");
}
