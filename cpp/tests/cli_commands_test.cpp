#include <array>

#include <gtest/gtest.h>

#include "kairos/cli/commands.hpp"

namespace cli = kairos::cli;
using kairos::core::StatusCode;

namespace {
const std::array<cli::CommandSpec, 3> kSpecs = {{
    {cli::CommandId::Help, "help", "show usage"},
    {cli::CommandId::Event, "event", "attach a fact to an event"},
    {cli::CommandId::Infer, "infer", "infer relations"},
}};
}

TEST(CliCommands, MatchesAndReturnsRemainingArgs) {
    const char* argv[] = {"event", "--id", "3", "--at", "2024-01-01T09:00:00"};
    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    const auto s = cli::parse_command({argv, 5}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, cli::CommandId::Event);
    ASSERT_EQ(out.args.argc, 4u);
    EXPECT_STREQ(out.args.argv[0], "--id");
}

TEST(CliCommands, UnknownCommandIsNotFound) {
    const char* argv[] = {"frobnicate"};
    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    EXPECT_EQ(cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::NotFound);
    EXPECT_EQ(out.id, cli::CommandId::None);
}

TEST(CliCommands, MissingOrOptionLikeCommandIsInvalid) {
    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    EXPECT_EQ(cli::parse_command({nullptr, 0}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);
    const char* argv[] = {"--help"};
    EXPECT_EQ(cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);
}
