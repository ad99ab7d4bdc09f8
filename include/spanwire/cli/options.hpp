#pragma once

#include <type_traits>

#include "spanwire/core/errors.hpp"
#include "spanwire/core/types.hpp"

namespace spanwire::cli {
    using u8 = spanwire::core::u8;
    using u32 = spanwire::core::u32;
    using u64 = spanwire::core::u64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        U64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        TraceId,
        SpanId,
        ParentId,
        Kind,
        Name,
        Timestamp,
        Duration,
        LocalService,
        LocalIpv4,
        LocalIpv6,
        LocalPort,
        RemoteService,
        RemoteIpv4,
        RemoteIpv6,
        RemotePort,
        Annotation,
        Tag,
        Debug,
        Shared,
        List,
        Repeat,
        Output,
        Verbose,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        u64 u64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; options are appended in command line order, so a
    // repeated option appears once per occurrence.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options until the first positional argument or "--".
    // *consumed receives the number of argv entries used.
    spanwire::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace spanwire::cli
