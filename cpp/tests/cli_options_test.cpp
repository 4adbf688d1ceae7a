#include <array>

#include <gtest/gtest.h>

#include "kairos/cli/options.hpp"

namespace cli = kairos::cli;
using kairos::core::StatusCode;

namespace {

const std::array<cli::OptionSpec, 5> kSpecs = {{
    {cli::OptionId::Db, cli::OptionType::String, "db", 'd'},
    {cli::OptionId::Scope, cli::OptionType::I64, "scope", 's'},
    {cli::OptionId::Confidence, cli::OptionType::F64, "confidence", '\0'},
    {cli::OptionId::Decision, cli::OptionType::Flag, "decision", '\0'},
    {cli::OptionId::Help, cli::OptionType::Flag, "help", 'h'},
}};

cli::u32 parse(const char* const* argv, cli::u32 argc, cli::ParsedOptions* out, StatusCode expect = StatusCode::Ok) {
    cli::u32 consumed = 0;
    const auto s = cli::parse_options({argv, argc}, kSpecs.data(), kSpecs.size(), out, &consumed);
    EXPECT_EQ(s.code, expect);
    return consumed;
}

} // namespace

TEST(CliOptions, StopsAtCommand) {
    const char* argv[] = {"--db", "timeline.db", "-s", "4", "--decision", "event", "--id", "1"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    EXPECT_EQ(parse(argv, 8, &out), 5u);
    ASSERT_EQ(out.len, 3u);
    EXPECT_STREQ(cli::find_option(out, cli::OptionId::Db)->value.str, "timeline.db");
    EXPECT_EQ(cli::find_option(out, cli::OptionId::Scope)->value.i64v, 4);
    EXPECT_TRUE(cli::has_flag(out, cli::OptionId::Decision));
    EXPECT_FALSE(cli::has_flag(out, cli::OptionId::Help));
}

TEST(CliOptions, EqualsAttachedAndFloat) {
    const char* argv[] = {"--scope=12", "-dfile.db", "--confidence", "0.75"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    EXPECT_EQ(parse(argv, 4, &out), 4u);
    EXPECT_EQ(cli::find_option(out, cli::OptionId::Scope)->value.i64v, 12);
    EXPECT_STREQ(cli::find_option(out, cli::OptionId::Db)->value.str, "file.db");
    EXPECT_DOUBLE_EQ(cli::find_option(out, cli::OptionId::Confidence)->value.f64v, 0.75);
}

TEST(CliOptions, LastOccurrenceWins) {
    const char* argv[] = {"-s", "1", "-s", "2"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    parse(argv, 4, &out);
    EXPECT_EQ(cli::find_option(out, cli::OptionId::Scope)->value.i64v, 2);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const char* argv[] = {"-s", "1", "--", "--help"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    EXPECT_EQ(parse(argv, 4, &out), 3u);
    EXPECT_EQ(out.len, 1u);
}

TEST(CliOptions, ErrorsCarryTokenIndex) {
    cli::ParsedOption buf[4]{};
    cli::ParsedOptions out{buf, 0, 4};
    cli::u32 consumed = 0;

    const char* unknown[] = {"-s", "1", "--nope"};
    auto s = cli::parse_options({unknown, 3}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.aux, 2u);

    const char* missing[] = {"--db"};
    EXPECT_EQ(cli::parse_options({missing, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);

    const char* not_int[] = {"--scope", "4x"};
    EXPECT_EQ(cli::parse_options({not_int, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);

    const char* flag_value[] = {"--decision=yes"};
    EXPECT_EQ(cli::parse_options({flag_value, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);
}

TEST(CliOptions, FullBufferIsUnavailable) {
    const char* argv[] = {"-s", "1", "-s", "2"};
    cli::ParsedOption buf[1]{};
    cli::ParsedOptions out{buf, 0, 1};
    parse(argv, 4, &out, StatusCode::Unavailable);
}
