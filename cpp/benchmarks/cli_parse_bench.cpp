#include <array>

#include <benchmark/benchmark.h>

#include "kairos/cli/commands.hpp"
#include "kairos/cli/options.hpp"

namespace cli = kairos::cli;

static void BM_CliParseOptions(benchmark::State& state) {
    const std::array<cli::OptionSpec, 4> specs = {{
        {cli::OptionId::Db, cli::OptionType::String, "db", 'd'},
        {cli::OptionId::Scope, cli::OptionType::I64, "scope", 's'},
        {cli::OptionId::Confidence, cli::OptionType::F64, "confidence", '\0'},
        {cli::OptionId::Decision, cli::OptionType::Flag, "decision", '\0'},
    }};

    const char* argv[] = {"--decision", "--db", "t.db", "--scope=3", "--confidence", "0.9", "--", "relate"};
    const cli::CliArgs args{argv, 8};
    for (auto _ : state) {
        cli::ParsedOption buf[8]{};
        cli::ParsedOptions out{buf, 0, 8};
        cli::u32 consumed = 0;
        const kairos::core::Status s = cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<kairos::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    const std::array<cli::CommandSpec, 5> specs = {{
        {cli::CommandId::Help, "help", nullptr},
        {cli::CommandId::Event, "event", nullptr},
        {cli::CommandId::Action, "action", nullptr},
        {cli::CommandId::Relate, "relate", nullptr},
        {cli::CommandId::Context, "context", nullptr},
    }};

    const char* argv[] = {"context", "--causal", "--confidence"};
    const cli::CliArgs args{argv, 3};
    for (auto _ : state) {
        cli::CommandInvocation out{};
        cli::u32 consumed = 0;
        const kairos::core::Status s = cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<kairos::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
