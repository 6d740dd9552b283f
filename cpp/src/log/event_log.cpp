#include "parcel/log/event_log.hpp"

#include <cerrno>
#include <ctime>

#include "parcel/inventory/inventory.hpp"
#include "parcel/storage/fs.hpp"
#include "parcel/storage/hashing.hpp"
#include "parcel/storage/layout.hpp"

namespace parcel::log {

using namespace parcel::core;

namespace {
    constexpr const char* kRule = "==================================================";
    constexpr double kBytesPerMiB = 1024.0 * 1024.0;

    // Local time with millisecond precision.
    void format_log_time(char* out, size_t out_size) noexcept {
        struct timespec ts{};
        ::clock_gettime(CLOCK_REALTIME, &ts);
        struct tm tm{};
        ::localtime_r(&ts.tv_sec, &tm);
        char base[32];
        std::strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(out, out_size, "%s.%03ld", base, static_cast<long>(ts.tv_nsec / 1000000));
    }
} // namespace

std::string session_id(std::chrono::system_clock::time_point t) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(t);
    struct tm tm{};
    ::localtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string(buf);
}

EventLog::~EventLog() {
    close();
}

Status EventLog::open(const char* path, const char* subject) noexcept {
    if (path == nullptr || *path == '\0') {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    close();

    const std::string dir = parcel::storage::layout_dirname(path);
    Status s = parcel::storage::fs_ensure_directory(dir.c_str());
    if (!is_ok(s)) {
        return s;
    }

    file_ = std::fopen(path, "a");
    if (file_ == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }
    path_ = path;
    started_ = std::chrono::steady_clock::now();

    char when[40];
    format_log_time(when, sizeof(when));
    char line[512];
    std::snprintf(line, sizeof(line), "=== Session Start: %s ===", session_id(std::chrono::system_clock::now()).c_str());
    write_raw(line);
    std::snprintf(line, sizeof(line), "Input File: %s", subject != nullptr ? subject : "-");
    write_raw(line);
    std::snprintf(line, sizeof(line), "Start Time: %s", when);
    write_raw(line);
    write_raw(kRule);
    return ok_status();
}

void EventLog::close() noexcept {
    if (file_ == nullptr) {
        return;
    }
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    char when[40];
    format_log_time(when, sizeof(when));
    char line[128];

    write_raw(kRule);
    std::snprintf(line, sizeof(line), "Session End: %s", when);
    write_raw(line);
    std::snprintf(line, sizeof(line), "Total Duration: %.2f seconds", secs);
    write_raw(line);
    write_raw(kRule);

    std::fclose(file_);
    file_ = nullptr;
}

void EventLog::step(const char* step, const char* status, const char* fmt, ...) noexcept {
    if (file_ == nullptr) {
        return;
    }
    char prefix[64];
    std::snprintf(prefix, sizeof(prefix), "%-15s | %-10s | ", step, status);
    va_list ap;
    va_start(ap, fmt);
    write_line(prefix, fmt, ap);
    va_end(ap);
}

void EventLog::info(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    write_line("INFO: ", fmt, ap);
    va_end(ap);
}

void EventLog::warn(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    write_line("WARN: ", fmt, ap);
    va_end(ap);
}

void EventLog::error(const char* fmt, ...) noexcept {
    va_list ap;
    va_start(ap, fmt);
    write_line("ERROR: ", fmt, ap);
    va_end(ap);
}

void EventLog::chunk(const ChunkEvent& event) noexcept {
    if (file_ == nullptr) {
        return;
    }
    char hex[parcel::storage::kHashHexChars + 1] = "-";
    if (event.hash != nullptr) {
        parcel::storage::hash_to_hex(*event.hash, hex, sizeof(hex));
    }
    char line[512];
    std::snprintf(line, sizeof(line),
        "Chunk: %.*s | Status: %s | Size: %.2fMB | Offset: %llu | Duration: %.2fs | Hash: %s",
        static_cast<int>(event.chunk_id.size()), event.chunk_id.data(),
        parcel::inventory::chunk_status_name(event.status),
        static_cast<double>(event.size_bytes) / kBytesPerMiB,
        static_cast<unsigned long long>(event.offset),
        event.duration_seconds,
        hex);
    write_raw(line);
}

void EventLog::write_line(const char* prefix, const char* fmt, va_list ap) noexcept {
    if (file_ == nullptr) {
        return;
    }
    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    char when[40];
    format_log_time(when, sizeof(when));
    std::fprintf(file_, "%s | %s%s\n", when, prefix, msg);
    std::fflush(file_);
}

void EventLog::write_raw(const char* text) noexcept {
    if (file_ == nullptr) {
        return;
    }
    char when[40];
    format_log_time(when, sizeof(when));
    std::fprintf(file_, "%s | %s\n", when, text);
    std::fflush(file_);
}

} // namespace parcel::log
