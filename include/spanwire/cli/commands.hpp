#pragma once

#include <type_traits>

#include "spanwire/cli/options.hpp"
#include "spanwire/core/errors.hpp"

namespace spanwire::cli {
    using u32 = spanwire::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Encode = 2,
        Size = 3,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs; on success out->args holds the
    // remaining arguments.
    spanwire::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace spanwire::cli
