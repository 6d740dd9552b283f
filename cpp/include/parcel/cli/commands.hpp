#pragma once

#include <type_traits>

#include "parcel/cli/options.hpp"
#include "parcel/core/errors.hpp"

namespace parcel::cli {
    using u32 = parcel::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Split = 2,
        Join = 3,
        Status = 4,
        Verify = 5,
        Merge = 6,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches args.argv[0] against specs; the invocation's args are the rest.
    parcel::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace parcel::cli
