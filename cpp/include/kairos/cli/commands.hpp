#pragma once

#include <type_traits>

#include "kairos/cli/options.hpp"
#include "kairos/core/errors.hpp"

namespace kairos::cli {
    using u32 = kairos::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help,
        Event,
        Action,
        Relate,
        Infer,
        Order,
        Timeline,
        Context,
        Sequence,
        Frame,
        Related,
        Segment,
        Request,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against the command table; the invocation's args are
    // the remaining tokens. NotFound for an unknown command name.
    kairos::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace kairos::cli
