#include "parcel/storage/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>

#include <new>
#include <string>

namespace parcel::storage {

using namespace parcel::core;

namespace {
    [[nodiscard]] Status io_error(int err) noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
    }

    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    // Directory holding path, "." for a bare name.
    std::string parent_of(const char* path) {
        const char* slash = std::strrchr(path, '/');
        if (slash == nullptr) {
            return ".";
        }
        if (slash == path) {
            return "/";
        }
        return std::string(path, static_cast<size_t>(slash - path));
    }

    Status write_contents(int fd, const std::string& contents) noexcept {
        size_t off = 0;
        while (off < contents.size()) {
            const size_t n = std::min<size_t>(contents.size() - off, 1u << 20);
            const Status s = fs_write_all(fd, BufferView{reinterpret_cast<const u8*>(contents.data() + off), static_cast<u32>(n)});
            if (!is_ok(s)) {
                return s;
            }
            off += n;
        }
        return ok_status();
    }
} // namespace

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

Status fs_stat(const char* path, FileStat* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return invalid();
    }
    *out = FileStat{};

    struct stat st{};
    if (::stat(path, &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return ok_status();
        }
        return io_error(errno);
    }

    out->exists = true;
    out->is_regular = S_ISREG(st.st_mode);
    out->is_directory = S_ISDIR(st.st_mode);
    out->size_bytes = out->is_regular ? static_cast<u64>(st.st_size) : 0;
    return ok_status();
}

Status fs_ensure_directory(const char* path) noexcept {
    if (path == nullptr || *path == '\0') {
        return invalid();
    }

    if (::mkdir(path, 0755) == 0) {
        return ok_status();
    }

    if (errno == EEXIST) {
        struct stat st{};
        if (::stat(path, &st) != 0) {
            return io_error(errno);
        }
        return S_ISDIR(st.st_mode) ? ok_status() : io_error(ENOTDIR);
    }

    if (errno != ENOENT) {
        return io_error(errno);
    }

    // Parent doesn't exist, create it first
    std::string parent(path);
    while (parent.size() > 1 && parent.back() == '/') {
        parent.pop_back();
    }
    const size_t slash = parent.rfind('/');
    if (slash == std::string::npos) {
        return io_error(ENOENT);
    }
    parent.resize(slash == 0 ? 1 : slash);

    Status s = fs_ensure_directory(parent.c_str());
    if (!is_ok(s)) {
        return s;
    }

    if (::mkdir(path, 0755) != 0 && errno != EEXIST) {
        return io_error(errno);
    }
    return ok_status();
}

Status fs_available_bytes(const char* path, u64* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return invalid();
    }
    struct statvfs vfs{};
    if (::statvfs(path, &vfs) != 0) {
        return io_error(errno);
    }
    *out = static_cast<u64>(vfs.f_bavail) * static_cast<u64>(vfs.f_frsize);
    return ok_status();
}

Status fs_space_check(const char* path, u64 required_bytes, SpaceCheck* out) noexcept {
    if (out == nullptr) {
        return invalid();
    }
    *out = SpaceCheck{};
    out->required_bytes = required_bytes;

    u64 available = 0;
    const Status s = fs_available_bytes(path, &available);
    if (!is_ok(s)) {
        return s;
    }
    out->available_bytes = available;
    out->sufficient = available >= required_bytes;
    return ok_status();
}

Status fs_open_read(const char* path, UniqueFd* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return invalid();
    }
    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        return io_error(errno);
    }
    out->reset(fd);
    return ok_status();
}

Status fs_open_write(const char* path, bool exclusive, UniqueFd* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return invalid();
    }
    const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (exclusive ? O_EXCL : O_TRUNC);
    const int fd = ::open(path, flags, 0644);
    if (fd < 0) {
        if (errno == EEXIST && exclusive) {
            return make_status(StatusDomain::Storage, StatusCode::Conflict);
        }
        return io_error(errno);
    }
    out->reset(fd);
    return ok_status();
}

Status fs_read_some(int fd, BufferMut out, u32* got) noexcept {
    if (got == nullptr || !buffer_ok(out)) {
        return invalid();
    }
    *got = 0;
    while (true) {
        const ssize_t n = ::read(fd, out.data, out.len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno);
        }
        *got = static_cast<u32>(n);
        return ok_status();
    }
}

Status fs_pread_exact(int fd, u64 offset, BufferMut out) noexcept {
    if (!buffer_ok(out)) {
        return invalid();
    }
    u64 done = 0;
    while (done < out.len) {
        const ssize_t n = ::pread(fd, out.data + done, out.len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno);
        }
        if (n == 0) {
            return io_error(0);  // EOF before the requested range ended
        }
        done += static_cast<u64>(n);
    }
    return ok_status();
}

Status fs_write_all(int fd, BufferView data) noexcept {
    if (!buffer_ok(data)) {
        return invalid();
    }
    u64 written = 0;
    while (written < data.len) {
        const ssize_t n = ::write(fd, data.data + written, data.len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno);
        }
        written += static_cast<u64>(n);
    }
    return ok_status();
}

Status fs_sync_close(UniqueFd* fd) noexcept {
    if (fd == nullptr || !fd->valid()) {
        return invalid();
    }
    const int raw = fd->release();
    if (::fsync(raw) != 0) {
        const int err = errno;
        ::close(raw);
        return io_error(err);
    }
    if (::close(raw) != 0) {
        return io_error(errno);
    }
    return ok_status();
}

Status fs_sync_directory(const char* path) noexcept {
    if (path == nullptr || *path == '\0') {
        return invalid();
    }
    UniqueFd dir;
    const int fd = ::open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        return io_error(errno);
    }
    dir.reset(fd);
    // Some filesystems cannot sync a directory and say so with EINVAL.
    if (::fsync(dir.get()) != 0 && errno != EINVAL) {
        return io_error(errno);
    }
    return ok_status();
}

Status fs_write_file_atomic(const char* path, const std::string& contents) noexcept {
    if (path == nullptr || *path == '\0') {
        return invalid();
    }
    std::string tmp_path;
    std::string dir;
    try {
        tmp_path = std::string(path) + ".tmp";
        dir = parent_of(path);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    UniqueFd fd;
    Status s = fs_open_write(tmp_path.c_str(), false, &fd);
    if (!is_ok(s)) {
        return s;
    }

    s = write_contents(fd.get(), contents);
    if (!is_ok(s)) {
        fd.reset();
        ::unlink(tmp_path.c_str());
        return s;
    }

    s = fs_sync_close(&fd);
    if (!is_ok(s)) {
        ::unlink(tmp_path.c_str());
        return s;
    }

    if (::rename(tmp_path.c_str(), path) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return io_error(err);
    }
    // The rename is durable only once the directory entry is.
    return fs_sync_directory(dir.c_str());
}

Status fs_write_file_exclusive(const char* path, const std::string& contents) noexcept {
    if (path == nullptr || *path == '\0') {
        return invalid();
    }
    std::string dir;
    try {
        dir = parent_of(path);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    UniqueFd fd;
    Status s = fs_open_write(path, true, &fd);
    if (!is_ok(s)) {
        return s;
    }

    s = write_contents(fd.get(), contents);
    if (!is_ok(s)) {
        fd.reset();
        ::unlink(path);
        return s;
    }
    s = fs_sync_close(&fd);
    if (!is_ok(s)) {
        ::unlink(path);
        return s;
    }
    return fs_sync_directory(dir.c_str());
}

Status fs_read_file(const char* path, std::string* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return invalid();
    }
    out->clear();

    UniqueFd fd;
    Status s = fs_open_read(path, &fd);
    if (!is_ok(s)) {
        return s;
    }

    u8 buf[64 * 1024];
    while (true) {
        u32 got = 0;
        s = fs_read_some(fd.get(), BufferMut{buf, static_cast<u32>(sizeof(buf))}, &got);
        if (!is_ok(s)) {
            return s;
        }
        if (got == 0) break;
        out->append(reinterpret_cast<const char*>(buf), got);
    }
    return ok_status();
}

Status fs_remove_file(const char* path) noexcept {
    if (path == nullptr) {
        return invalid();
    }
    if (::unlink(path) != 0 && errno != ENOENT) {
        return io_error(errno);
    }
    return ok_status();
}

} // namespace parcel::storage
