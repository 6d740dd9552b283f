#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace parcel::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Seconds since the Unix epoch, UTC.
    using Timestamp = i64;

    // Both supported digests (BLAKE3 default output, SHA-256) are 32 bytes.
    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // 1-based chunk position within an inventory; 0 is never a valid chunk.
    struct ChunkIndexTag {};
    using ChunkIndex = Id<ChunkIndexTag, u32>;

    [[nodiscard]] constexpr bool chunk_index_in_range(ChunkIndex i, u32 total_chunks) noexcept {
        return i.is_valid() && i.v >= 1 && i.v <= total_chunks;
    }

    enum class ChunkStatus : u8 {
        Pending = 0,
        Completed = 1,
        Failed = 2,
    };

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<ChunkIndex>);
    static_assert(std::is_standard_layout_v<ChunkIndex>);

} // namespace parcel::core
