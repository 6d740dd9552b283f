#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <string_view>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"

namespace parcel::log {
    using u64 = parcel::core::u64;

    struct ChunkEvent {
        std::string_view chunk_id;
        parcel::core::ChunkStatus status{parcel::core::ChunkStatus::Pending};
        u64 size_bytes{0};
        u64 offset{0};
        double duration_seconds{0.0};
        // Null when the chunk has no digest (failed or pending).
        const parcel::core::Hash256* hash{nullptr};
    };

    // Append-only operation log. Every line is prefixed with a local
    // millisecond timestamp: "YYYY-MM-DD HH:MM:SS.mmm | <message>".
    // All writers are no-ops while no file is open, so callers may hold a
    // closed EventLog instead of checking for one.
    class EventLog {
    public:
        EventLog() noexcept = default;
        ~EventLog();

        EventLog(const EventLog&) = delete;
        EventLog& operator=(const EventLog&) = delete;

        // Opens path for appending (creating parent directories) and writes
        // the session header naming subject.
        parcel::core::Status open(const char* path, const char* subject) noexcept;

        // Writes the session footer with the total duration and closes.
        void close() noexcept;

        [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
        [[nodiscard]] const std::string& path() const noexcept { return path_; }

        // "<step> | <status> | <message>" with fixed-width step and status columns.
        void step(const char* step, const char* status, const char* fmt, ...) noexcept;

        void info(const char* fmt, ...) noexcept;
        void warn(const char* fmt, ...) noexcept;
        void error(const char* fmt, ...) noexcept;

        void chunk(const ChunkEvent& event) noexcept;

    private:
        void write_line(const char* prefix, const char* fmt, va_list ap) noexcept;
        void write_raw(const char* text) noexcept;

        std::FILE* file_{nullptr};
        std::string path_;
        std::chrono::steady_clock::time_point started_{};
    };

    // "20240131_235959" for the given local wall-clock time.
    std::string session_id(std::chrono::system_clock::time_point t);

} // namespace parcel::log
