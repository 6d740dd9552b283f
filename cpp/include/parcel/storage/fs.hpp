#pragma once

#include <string>
#include <type_traits>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"
#include "parcel/storage/buffer.hpp"

namespace parcel::storage {
    using u64 = parcel::core::u64;

    // Owns a POSIX file descriptor; closes it on destruction.
    class UniqueFd {
    public:
        UniqueFd() noexcept = default;
        explicit UniqueFd(int fd) noexcept : fd_(fd) {}
        ~UniqueFd() { reset(); }

        UniqueFd(const UniqueFd&) = delete;
        UniqueFd& operator=(const UniqueFd&) = delete;

        UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
        UniqueFd& operator=(UniqueFd&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }

        [[nodiscard]] int get() const noexcept { return fd_; }
        [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

        int release() noexcept {
            const int fd = fd_;
            fd_ = -1;
            return fd;
        }

        void reset(int fd = -1) noexcept;

    private:
        int fd_{-1};
    };

    struct FileStat {
        bool exists{false};
        bool is_regular{false};
        bool is_directory{false};
        u64 size_bytes{0};
    };

    struct SpaceCheck {
        bool sufficient{false};
        u64 available_bytes{0};
        u64 required_bytes{0};
    };

    // A missing path is not an error: out->exists is false.
    parcel::core::Status fs_stat(const char* path, FileStat* out) noexcept;

    // mkdir -p. Succeeds when the directory already exists.
    parcel::core::Status fs_ensure_directory(const char* path) noexcept;

    parcel::core::Status fs_available_bytes(const char* path, u64* out) noexcept;

    // Point-in-time probe, not a reservation.
    parcel::core::Status fs_space_check(const char* path, u64 required_bytes, SpaceCheck* out) noexcept;

    parcel::core::Status fs_open_read(const char* path, UniqueFd* out) noexcept;

    // Creates or truncates. With exclusive=true an existing file is Conflict.
    parcel::core::Status fs_open_write(const char* path, bool exclusive, UniqueFd* out) noexcept;

    // Reads up to out.len bytes; *got is 0 only at end of file.
    parcel::core::Status fs_read_some(int fd, BufferMut out, u32* got) noexcept;

    // Reads exactly out.len bytes at offset; early end of file is Io with aux 0.
    parcel::core::Status fs_pread_exact(int fd, u64 offset, BufferMut out) noexcept;

    parcel::core::Status fs_write_all(int fd, BufferView data) noexcept;

    // fsync then close; the descriptor is released either way.
    parcel::core::Status fs_sync_close(UniqueFd* fd) noexcept;

    // fsync on a directory, so renames and creates inside it survive a crash.
    parcel::core::Status fs_sync_directory(const char* path) noexcept;

    // Writes path + ".tmp", syncs it, renames it over path, then syncs the
    // parent directory.
    parcel::core::Status fs_write_file_atomic(const char* path, const std::string& contents) noexcept;

    // Creates path with contents, never replacing an existing file (Conflict).
    // A partly written file is removed on error.
    parcel::core::Status fs_write_file_exclusive(const char* path, const std::string& contents) noexcept;

    parcel::core::Status fs_read_file(const char* path, std::string* out) noexcept;

    // A missing file is not an error.
    parcel::core::Status fs_remove_file(const char* path) noexcept;

    static_assert(std::is_trivially_copyable_v<FileStat>);
    static_assert(std::is_trivially_copyable_v<SpaceCheck>);

} // namespace parcel::storage
