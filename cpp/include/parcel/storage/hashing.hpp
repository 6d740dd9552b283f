#pragma once

#include <memory>
#include <string>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"
#include "parcel/storage/buffer.hpp"

namespace parcel::storage {
    using u64 = parcel::core::u64;

    enum class HashAlgorithm : u8 {
        Blake3 = 0,
        Sha256 = 1,
    };

    inline constexpr HashAlgorithm kDefaultHashAlgorithm = HashAlgorithm::Blake3;

    // Streaming reads never hold more than this many bytes of input at once.
    inline constexpr u32 kHashReadBufferBytes = 1u << 20;

    inline constexpr size_t kHashHexChars = 64;

    // Sentinel length for hash_file_range: hash until end of file.
    inline constexpr u64 kToEndOfFile = ~u64{0};

    [[nodiscard]] constexpr bool hash_is_zero(const parcel::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    const char* hash_algorithm_name(HashAlgorithm algo) noexcept;
    [[nodiscard]] bool hash_algorithm_parse(const char* name, HashAlgorithm* out) noexcept;

    // Incremental digest over one of the supported algorithms. Not copyable;
    // init() may be called again to reuse the object for a new stream.
    class Hasher {
    public:
        Hasher() noexcept;
        ~Hasher();

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;
        Hasher(Hasher&&) noexcept;
        Hasher& operator=(Hasher&&) noexcept;

        parcel::core::Status init(HashAlgorithm algo) noexcept;
        parcel::core::Status update(BufferView data) noexcept;
        parcel::core::Status finalize(parcel::core::Hash256* out) noexcept;

        [[nodiscard]] HashAlgorithm algorithm() const noexcept { return algo_; }
        [[nodiscard]] const char* name() const noexcept { return hash_algorithm_name(algo_); }

    private:
        struct State;

        HashAlgorithm algo_{kDefaultHashAlgorithm};
        std::unique_ptr<State> state_;
    };

    parcel::core::Status hash_compute(HashAlgorithm algo, BufferView data, parcel::core::Hash256* out) noexcept;

    // Hashes [offset, offset + length) of the file at path. Fails with Io
    // (aux 0) if the file ends before the range does, unless length is
    // kToEndOfFile. bytes_out, when non-null, receives the number of bytes hashed.
    parcel::core::Status hash_file_range(HashAlgorithm algo,
        const char* path,
        u64 offset,
        u64 length,
        parcel::core::Hash256* out,
        u64* bytes_out) noexcept;

    void hash_to_hex(const parcel::core::Hash256& hash, char* out, size_t out_size) noexcept;
    std::string hash_hex(const parcel::core::Hash256& hash);
    [[nodiscard]] bool hash_from_hex(const char* hex, parcel::core::Hash256* out) noexcept;

} // namespace parcel::storage
