#pragma once

#include <string>
#include <vector>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"
#include "parcel/inventory/inventory.hpp"
#include "parcel/log/event_log.hpp"
#include "parcel/storage/fs.hpp"
#include "parcel/storage/hashing.hpp"

namespace parcel::chunker {
    using u32 = parcel::core::u32;
    using u64 = parcel::core::u64;

    inline constexpr u64 kBytesPerMiB = u64{1} << 20;
    inline constexpr u64 kDefaultSpaceMarginBytes = 16 * kBytesPerMiB;

    struct ChunkParams {
        std::string source_path;
        // Empty means the current directory.
        std::string output_dir;
        // Empty means output_dir.
        std::string inventory_dir;
        u64 chunk_size_bytes{0};
        // Invalid means every selected chunk; otherwise only this one.
        parcel::core::ChunkIndex target{parcel::core::ChunkIndex::invalid()};
        // Used only when a new inventory is created; an existing inventory keeps its own.
        parcel::storage::HashAlgorithm algorithm{parcel::storage::kDefaultHashAlgorithm};
        u64 space_margin_bytes{kDefaultSpaceMarginBytes};
        // Select only chunks that are not yet completed.
        bool resume_pending{false};
    };

    struct ChunkFailure {
        u32 index{0};
        // Always ChunkWriteFailed in the Chunker domain, aux = index.
        parcel::core::Status status{};
        // The I/O or hashing error that caused it.
        parcel::core::Status cause{};
    };

    struct ChunkSummary {
        std::string inventory_path;
        std::string output_dir;
        parcel::storage::HashAlgorithm algorithm{parcel::storage::kDefaultHashAlgorithm};
        u64 original_size{0};
        parcel::core::Hash256 original_hash{};
        u32 total_chunks{0};
        // Chunks attempted by this run.
        u32 processed{0};
        // Inventory-wide counts after the run.
        u32 completed{0};
        u32 remaining{0};
        std::vector<u32> selected;
        std::vector<ChunkFailure> failures;
        bool inventory_created{false};
        bool space_checked{false};
        parcel::storage::SpaceCheck space{};
    };

    // Splits params.source_path into chunk artifacts under output_dir and
    // keeps <stem>.inventory.json under inventory_dir current after every
    // chunk. A chunk that fails to write is marked failed and reported in
    // out->failures; the run continues with the next one and still returns Ok.
    // out is filled as far as the run got, including on error. log may be null.
    parcel::core::Status chunk_file(const ChunkParams& params,
        parcel::log::EventLog* log,
        ChunkSummary* out) noexcept;

    // Indices to process: {target} when valid, otherwise all (or only the
    // non-completed ones when resume_pending), ascending.
    parcel::core::Status chunk_select(const parcel::inventory::Inventory& inv,
        parcel::core::ChunkIndex target,
        bool resume_pending,
        std::vector<u32>* out) noexcept;

    // Copies [offset, offset + size) of src_fd into a fresh file at
    // artifact_path, hashing the bytes as they are written, then fsyncs it.
    parcel::core::Status chunk_write_artifact(int src_fd,
        const char* artifact_path,
        u64 offset,
        u64 size,
        parcel::storage::HashAlgorithm algorithm,
        parcel::core::Hash256* hash_out) noexcept;

} // namespace parcel::chunker
