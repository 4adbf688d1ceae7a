#pragma once

#include <type_traits>

#include "kairos/core/errors.hpp"
#include "kairos/core/types.hpp"

namespace kairos::cli {
    using u8 = kairos::core::u8;
    using u32 = kairos::core::u32;
    using i64 = kairos::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
        F64 = 3,
    };

    enum class OptionId : u32 {
        None = 0,
        Db,
        Entities,
        Scope,
        LogLevel,
        Id,
        At,
        Duration,
        Decision,
        Granularity,
        From,
        To,
        Type,
        Kind,
        Limit,
        Start,
        End,
        Fact,
        Confidence,
        Causal,
        Strategy,
        Gap,
        Batch,
        Method,
        Path,
        Body,
        Help,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        double f64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options never allocates.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options ("--name value", "--name=value", "-x value",
    // "-xvalue") up to the first positional token or "--". On failure the
    // status aux holds the index of the offending token.
    kairos::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;
    [[nodiscard]] bool has_flag(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace kairos::cli
