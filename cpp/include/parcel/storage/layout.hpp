#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "parcel/core/types.hpp"

namespace parcel::storage {
    using u32 = parcel::core::u32;
    using u64 = parcel::core::u64;

    // Chunk artifacts are named <stem>.chunk<NNN>.bin, the inventory
    // <stem>.inventory.json and the event log <stem>.log, where <stem> is the
    // original file name without its last extension.
    constexpr u32 kMinChunkIdDigits = 3;
    inline constexpr std::string_view kChunkMarker = ".chunk";
    inline constexpr std::string_view kChunkExtension = ".bin";
    inline constexpr std::string_view kInventorySuffix = ".inventory.json";
    inline constexpr std::string_view kLogSuffix = ".log";

    struct ChunkExtent {
        u64 offset{0};
        u64 size_bytes{0};
    };

    struct ChunkName {
        std::string stem;
        parcel::core::ChunkIndex index{parcel::core::ChunkIndex::invalid()};
    };

    // ceil(file_size / chunk_size); 0 for an empty file or chunk_size == 0.
    [[nodiscard]] constexpr u64 layout_total_chunks(u64 file_size, u64 chunk_size) noexcept {
        if (chunk_size == 0) {
            return 0;
        }
        return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    }

    // Extent of 1-based chunk i. Indices past the end yield an empty extent.
    [[nodiscard]] constexpr ChunkExtent layout_chunk_extent(u64 file_size, u64 chunk_size, parcel::core::ChunkIndex i) noexcept {
        if (chunk_size == 0 || !i.is_valid() || i.v == 0) {
            return ChunkExtent{};
        }
        const u64 offset = static_cast<u64>(i.v - 1) * chunk_size;
        if (offset >= file_size) {
            return ChunkExtent{};
        }
        const u64 remaining = file_size - offset;
        return ChunkExtent{offset, remaining < chunk_size ? remaining : chunk_size};
    }

    [[nodiscard]] u32 layout_chunk_id_digits(u32 total_chunks) noexcept;

    std::string layout_file_stem(std::string_view original_name);
    std::string layout_chunk_id(std::string_view stem, parcel::core::ChunkIndex index, u32 total_chunks);
    std::string layout_inventory_name(std::string_view stem);
    std::string layout_log_name(std::string_view stem);

    // Accepts any digit count, so chunk ids written with a wider padding still parse.
    [[nodiscard]] bool layout_parse_chunk_name(std::string_view file_name, ChunkName* out);

    // Directory part of path, "." when path has none.
    std::string layout_dirname(std::string_view path);
    std::string layout_basename(std::string_view path);
    std::string layout_join(std::string_view dir, std::string_view name);

    // True for a single path component: non-empty, no '/' or NUL, not "." or "..".
    [[nodiscard]] bool layout_is_plain_name(std::string_view name) noexcept;

    // Sibling inventory of a chunk artifact: same directory, stem-derived name.
    [[nodiscard]] bool layout_inventory_path_for_chunk(std::string_view chunk_path, std::string* out);

    static_assert(std::is_trivially_copyable_v<ChunkExtent>);
    static_assert(std::is_standard_layout_v<ChunkExtent>);

} // namespace parcel::storage
