#pragma once

#include <string>
#include <vector>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"
#include "parcel/inventory/inventory.hpp"
#include "parcel/log/event_log.hpp"
#include "parcel/storage/hashing.hpp"

namespace parcel::rebuild {
    using u8 = parcel::core::u8;
    using u32 = parcel::core::u32;
    using u64 = parcel::core::u64;

    enum class PlanIssue : u8 {
        None = 0,
        NotCompleted,
        Missing,
        SizeMismatch,
        HashMismatch,
    };

    enum class Verification : u8 {
        Skipped = 0,
        Passed,
        Failed,
    };

    struct PlanEntry {
        u32 index{0};
        std::string chunk_id;
        std::string artifact_path;
        u64 offset{0};
        u64 expected_size{0};
        // Size found on disk; 0 when the artifact is missing.
        u64 actual_size{0};
        PlanIssue issue{PlanIssue::None};
    };

    struct ReconstructionPlan {
        std::string chunk_dir;
        // One entry per index 1..total_chunks, ascending.
        std::vector<PlanEntry> entries;
        u32 not_completed{0};
        u32 missing{0};
        u32 size_mismatched{0};
        u32 hash_mismatched{0};
    };

    [[nodiscard]] inline bool plan_complete(const ReconstructionPlan& plan) noexcept {
        return plan.not_completed == 0 && plan.missing == 0 && plan.size_mismatched == 0 && plan.hash_mismatched == 0;
    }

    struct RebuildParams {
        // Any one chunk artifact; its directory holds the siblings.
        std::string chunk_path;
        // Empty means the current directory.
        std::string output_dir;
        // Empty means the inventory beside chunk_path.
        std::string inventory_path;
        bool validate{true};
    };

    struct RebuildResult {
        std::string inventory_path;
        std::string output_path;
        parcel::storage::HashAlgorithm algorithm{parcel::storage::kDefaultHashAlgorithm};
        u64 expected_size{0};
        u64 bytes_written{0};
        parcel::core::Hash256 expected_hash{};
        // Zero unless validation ran on the written output.
        parcel::core::Hash256 computed_hash{};
        Verification verification{Verification::Skipped};
        ReconstructionPlan plan;
        // Chunk ids of every failing plan entry, ascending by index.
        std::vector<std::string> blocked_chunks;
        // Parser message when the inventory could not be read.
        std::string inventory_error;
    };

    const char* plan_issue_name(PlanIssue issue) noexcept;
    const char* verification_name(Verification v) noexcept;

    // Checks every chunk of inv against the artifacts in chunk_dir. Problems
    // with individual chunks are recorded in the plan, not returned; only I/O
    // errors while probing or hashing fail the call.
    parcel::core::Status rebuild_plan(const parcel::inventory::Inventory& inv,
        const std::string& chunk_dir,
        bool validate,
        ReconstructionPlan* out) noexcept;

    // Writes <output_dir>/<original_filename> from a complete plan, then
    // checks the written size and, when validate is set, the whole-file hash.
    // The output is kept after a size or hash mismatch. log may be null.
    parcel::core::Status rebuild_assemble(const parcel::inventory::Inventory& inv,
        const ReconstructionPlan& plan,
        const std::string& output_dir,
        bool validate,
        parcel::log::EventLog* log,
        RebuildResult* out) noexcept;

    // Reassembles <output_dir>/<original_filename> from the chunks beside
    // params.chunk_path. Nothing is written unless the plan is complete, and
    // an existing output file is never replaced. out is filled as far as the
    // run got, including on error. log may be null.
    parcel::core::Status rebuild_file(const RebuildParams& params,
        parcel::log::EventLog* log,
        RebuildResult* out) noexcept;

} // namespace parcel::rebuild
