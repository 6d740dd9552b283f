#include "parcel/cli/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

namespace parcel::cli {
    namespace {
        const char* system_getenv(const char* name) {
            return std::getenv(name);
        }

        [[nodiscard]] bool parse_positive(const char* s, u64* out) noexcept {
            const char* end = s + std::strlen(s);
            u64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end || v == 0) {
                return false;
            }
            *out = v;
            return true;
        }
    } // namespace

    bool mib_to_bytes(u64 mib, u64* out) noexcept {
        constexpr u64 kMiB = u64{1} << 20;
        if (out == nullptr || mib > std::numeric_limits<u64>::max() / kMiB) {
            return false;
        }
        *out = mib * kMiB;
        return true;
    }

    parcel::core::Status load_config(EnvGetter getenv_fn, ToolConfig* out, const char** bad_var) noexcept {
        if (out == nullptr) {
            return parcel::core::make_status(parcel::core::StatusDomain::Cli, parcel::core::StatusCode::Invalid);
        }
        if (getenv_fn == nullptr) {
            getenv_fn = system_getenv;
        }
        if (bad_var != nullptr) {
            *bad_var = nullptr;
        }

        ToolConfig cfg;
        const char* failed = nullptr;
        u64 scratch = 0;

        const char* v = getenv_fn("PARCEL_CHUNK_SIZE_MB");
        if (v != nullptr && *v != '\0') {
            if (!parse_positive(v, &cfg.chunk_size_mib) || !mib_to_bytes(cfg.chunk_size_mib, &scratch)) {
                failed = "PARCEL_CHUNK_SIZE_MB";
            }
        }

        v = getenv_fn("PARCEL_HASH");
        if (failed == nullptr && v != nullptr && *v != '\0') {
            if (!parcel::storage::hash_algorithm_parse(v, &cfg.algorithm)) {
                failed = "PARCEL_HASH";
            }
        }

        v = getenv_fn("PARCEL_SPACE_MARGIN_MB");
        if (failed == nullptr && v != nullptr && *v != '\0') {
            // Zero is a valid margin.
            if (std::strcmp(v, "0") == 0) {
                cfg.space_margin_mib = 0;
            } else if (!parse_positive(v, &cfg.space_margin_mib) || !mib_to_bytes(cfg.space_margin_mib, &scratch)) {
                failed = "PARCEL_SPACE_MARGIN_MB";
            }
        }

        if (failed != nullptr) {
            if (bad_var != nullptr) {
                *bad_var = failed;
            }
            return parcel::core::make_status(parcel::core::StatusDomain::Cli, parcel::core::StatusCode::Invalid);
        }

        v = getenv_fn("PARCEL_LOG_DIR");
        if (v != nullptr) {
            cfg.log_dir = v;
        }

        *out = std::move(cfg);
        return parcel::core::ok_status();
    }
} // namespace parcel::cli
