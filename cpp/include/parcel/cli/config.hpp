#pragma once

#include <string>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"
#include "parcel/storage/hashing.hpp"

namespace parcel::cli {
    using u64 = parcel::core::u64;

    inline constexpr u64 kDefaultChunkSizeMiB = 1000;
    inline constexpr u64 kDefaultSpaceMarginMiB = 16;

    // Returns the value of an environment variable, or null when unset.
    using EnvGetter = const char* (*)(const char* name);

    // Tool-wide defaults, from PARCEL_* environment variables. Command-line
    // options override every field.
    struct ToolConfig {
        u64 chunk_size_mib{kDefaultChunkSizeMiB};
        parcel::storage::HashAlgorithm algorithm{parcel::storage::kDefaultHashAlgorithm};
        // Empty: the log goes beside the inventory.
        std::string log_dir;
        u64 space_margin_mib{kDefaultSpaceMarginMiB};
    };

    // Reads PARCEL_CHUNK_SIZE_MB, PARCEL_HASH, PARCEL_LOG_DIR and
    // PARCEL_SPACE_MARGIN_MB through getenv_fn (std::getenv when null).
    // Unset or empty variables keep their defaults. A malformed value is
    // Invalid in the Cli domain; *bad_var, when non-null, names it.
    parcel::core::Status load_config(EnvGetter getenv_fn, ToolConfig* out, const char** bad_var) noexcept;

    // MiB to bytes; false on overflow.
    [[nodiscard]] bool mib_to_bytes(u64 mib, u64* out) noexcept;

} // namespace parcel::cli
