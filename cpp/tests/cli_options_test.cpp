#include <array>
#include <initializer_list>
#include <vector>

#include <gtest/gtest.h>

#include "warden/cli/options.hpp"

namespace cli = warden::cli;
namespace core = warden::core;

TEST(CliOptions, ParsesLongAndShortAndStopsAtCommand) {
    const std::array<cli::OptionSpec, 4> specs = {{
        {cli::OptionId::Db, cli::OptionType::String, "db", 'd'},
        {cli::OptionId::As, cli::OptionType::String, "as", 'a'},
        {cli::OptionId::Limit, cli::OptionType::I64, "limit", 'n'},
        {cli::OptionId::Disabled, cli::OptionType::Flag, "disabled", '\0'},
    }};

    const char* argv[] = {"--disabled", "--db", "/tmp/w.db", "-a", "alice", "create-user", "bob"};
    const cli::CliArgs args{argv, 7};

    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const core::Status s = cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, cli::OptionId::Disabled);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, cli::OptionId::Db);
    EXPECT_STREQ(out.data[1].value.str, "/tmp/w.db");

    EXPECT_EQ(out.data[2].id, cli::OptionId::As);
    EXPECT_STREQ(out.data[2].value.str, "alice");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<cli::OptionSpec, 2> specs = {{
        {cli::OptionId::Parent, cli::OptionType::String, "parent", 'p'},
        {cli::OptionId::Limit, cli::OptionType::I64, "limit", 'n'},
    }};

    const char* argv[] = {"--parent=folder/root", "-n25"};
    const cli::CliArgs args{argv, 2};

    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const core::Status s = cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "folder/root");
    EXPECT_EQ(out.data[1].value.i64v, 25);
}

TEST(CliOptions, RepeatedOptionsAreAllKeptAndFindReturnsLast) {
    const std::array<cli::OptionSpec, 2> specs = {{
        {cli::OptionId::Member, cli::OptionType::String, "member", 'm'},
        {cli::OptionId::Role, cli::OptionType::String, "role", 'r'},
    }};

    const char* argv[] = {"-m", "user:alice", "--role", "reader", "--member=group:eng"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options({argv, 5}, specs.data(), specs.size(), &out, &consumed).code,
              core::StatusCode::Ok);
    ASSERT_EQ(out.len, 3u);

    const cli::ParsedOption* member = cli::find_option(out, cli::OptionId::Member);
    ASSERT_NE(member, nullptr);
    EXPECT_STREQ(member->value.str, "group:eng");
    EXPECT_EQ(cli::find_option(out, cli::OptionId::Public), nullptr);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<cli::OptionSpec, 2> specs = {{
        {cli::OptionId::As, cli::OptionType::String, "as", 'a'},
        {cli::OptionId::Public, cli::OptionType::Flag, "public", '\0'},
    }};

    const char* argv[] = {"--as", "alice", "--", "--public"};
    const cli::CliArgs args{argv, 4};

    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    const core::Status s = cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "alice");
}

TEST(CliOptions, InvalidOnUnknownMissingValueOrOverflow) {
    const std::array<cli::OptionSpec, 3> specs = {{
        {cli::OptionId::As, cli::OptionType::String, "as", 'a'},
        {cli::OptionId::Limit, cli::OptionType::I64, "limit", 'n'},
        {cli::OptionId::Public, cli::OptionType::Flag, "public", '\0'},
    }};

    const auto parse = [&](std::initializer_list<const char*> tokens, cli::u32 cap) {
        const std::vector<const char*> argv(tokens);
        cli::ParsedOption buf[4]{};
        cli::ParsedOptions out{buf, 0, cap};
        cli::u32 consumed = 0;
        return cli::parse_options({argv.data(), static_cast<cli::u32>(argv.size())}, specs.data(), specs.size(),
                                  &out, &consumed);
    };

    EXPECT_EQ(parse({"--nope"}, 4).code, core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--as"}, 4).code, core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--limit", "ten"}, 4).code, core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--public=yes"}, 4).code, core::StatusCode::Invalid);
    EXPECT_EQ(parse({"-a", "x", "-a", "y"}, 1).code, core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--nope"}, 4).domain, core::StatusDomain::Cli);
}
