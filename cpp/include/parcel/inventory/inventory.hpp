#pragma once

#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"
#include "parcel/storage/hashing.hpp"

namespace parcel::inventory {
    using u32 = parcel::core::u32;
    using u64 = parcel::core::u64;
    using parcel::core::ChunkIndex;
    using parcel::core::ChunkStatus;
    using parcel::core::Hash256;
    using parcel::core::Timestamp;

    inline constexpr u32 kInventoryFormatVersion = 1;

    struct OriginalFile {
        std::string name;
        u64 size_bytes{0};
        Hash256 hash{};
    };

    // hash, processing_time and completed_at are meaningful only while
    // status == Completed.
    struct ChunkSpec {
        ChunkIndex index{ChunkIndex::invalid()};
        std::string chunk_id;
        ChunkStatus status{ChunkStatus::Pending};
        u64 offset{0};
        u64 size_bytes{0};
        Hash256 hash{};
        double processing_time{0.0};
        Timestamp completed_at{0};
    };

    struct InventoryCounters {
        u32 total_processed{0};
        u32 chunks_remaining{0};
        friend constexpr bool operator==(InventoryCounters, InventoryCounters) noexcept = default;
    };

    struct Inventory {
        u32 format_version{kInventoryFormatVersion};
        OriginalFile original;
        parcel::storage::HashAlgorithm algorithm{parcel::storage::kDefaultHashAlgorithm};
        u64 chunk_size{0};
        u32 total_chunks{0};
        Timestamp creation_time{0};
        Timestamp last_updated{0};
        // Keyed by 1-based chunk index.
        std::map<u32, ChunkSpec> chunks;
        // Counters as read from disk; inventory_counters() derives the live ones.
        InventoryCounters recorded{};
        std::vector<std::string> merged_from;
    };

    const char* chunk_status_name(ChunkStatus status) noexcept;
    [[nodiscard]] bool chunk_status_parse(std::string_view text, ChunkStatus* out) noexcept;

    // Every chunk starts Pending. An empty original yields zero chunks.
    parcel::core::Status inventory_create(const OriginalFile& original,
        parcel::storage::HashAlgorithm algorithm,
        u64 chunk_size,
        Timestamp now,
        Inventory* out) noexcept;

    [[nodiscard]] const ChunkSpec* inventory_find(const Inventory& inv, ChunkIndex index) noexcept;

    [[nodiscard]] InventoryCounters inventory_counters(const Inventory& inv) noexcept;

    // Indices currently in the given status, ascending.
    std::vector<u32> inventory_indices_with_status(const Inventory& inv, ChunkStatus status);

    // The mark_* operations upsert the record for index, touch only that
    // record, and bump last_updated. Out-of-range indices are ChunkIndexOutOfRange.
    parcel::core::Status inventory_mark_completed(Inventory* inv,
        ChunkIndex index,
        const Hash256& hash,
        u64 size_bytes,
        double processing_time,
        Timestamp now) noexcept;

    parcel::core::Status inventory_mark_failed(Inventory* inv, ChunkIndex index, Timestamp now) noexcept;
    parcel::core::Status inventory_mark_pending(Inventory* inv, ChunkIndex index, Timestamp now) noexcept;

    // JSON document with 2-space indentation.
    parcel::core::Status inventory_to_json(const Inventory& inv, std::string* out) noexcept;

    // Anything that is not a well-formed inventory document is InventoryCorrupt;
    // error, when non-null, receives a description.
    parcel::core::Status inventory_from_json(std::string_view text, Inventory* out, std::string* error) noexcept;

    // A missing file is InventoryNotFound.
    parcel::core::Status inventory_load(const char* path, Inventory* out, std::string* error) noexcept;

    // Atomic replace: never leaves a half-written inventory at path.
    parcel::core::Status inventory_save(const char* path, const Inventory& inv) noexcept;

    // Like inventory_save, but for a path that must not exist yet:
    // OutputExists leaves the file at path untouched.
    parcel::core::Status inventory_save_new(const char* path, const Inventory& inv) noexcept;

    // Structural consistency of a loaded inventory. Appends one human-readable
    // line per problem to issues; returns true when none were found.
    bool inventory_check(const Inventory& inv, std::vector<std::string>* issues);

    // Combines the completed records of inventories describing the same
    // original. Later inputs win on overlapping indices. Inputs that disagree
    // on original identity, chunk size or algorithm are Conflict.
    parcel::core::Status inventory_merge(const std::vector<Inventory>& inputs,
        const std::vector<std::string>& source_paths,
        Timestamp now,
        Inventory* out) noexcept;

    static_assert(std::is_trivially_copyable_v<InventoryCounters>);

} // namespace parcel::inventory
