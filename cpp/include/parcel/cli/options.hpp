#pragma once

#include <type_traits>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"

namespace parcel::cli {
    using u8 = parcel::core::u8;
    using u32 = parcel::core::u32;
    using u64 = parcel::core::u64;

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
        Size = 1,
        Bytes = 2,
        Chunk = 3,
        Output = 4,
        Log = 5,
        Inventory = 6,
        Hash = 7,
        Resume = 8,
        NoValidate = 9,
        Margin = 10,
        Help = 11,
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

    // Caller-owned storage: data points at cap slots.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options from args, stopping at the first positional
    // argument or after "--". Accepts --name, --name=value, --name value,
    // -x, -xVALUE and -x VALUE. On failure the status aux holds the argv
    // position of the offending token.
    parcel::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of id, or null.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace parcel::cli
