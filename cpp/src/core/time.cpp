#include "parcel/core/time.hpp"

#include <cstdio>
#include <ctime>

namespace parcel::core {
    namespace {
        [[nodiscard]] bool read_digits(std::string_view s, size_t pos, size_t n, int* out) noexcept {
            if (pos + n > s.size()) {
                return false;
            }
            int v = 0;
            for (size_t i = pos; i < pos + n; ++i) {
                const char c = s[i];
                if (c < '0' || c > '9') {
                    return false;
                }
                v = v * 10 + (c - '0');
            }
            *out = v;
            return true;
        }
    } // namespace

    Timestamp now_utc() noexcept {
        return static_cast<Timestamp>(std::time(nullptr));
    }

    std::string format_iso8601(Timestamp t) {
        const std::time_t tt = static_cast<std::time_t>(t);
        std::tm tm_buf{};
        gmtime_r(&tt, &tm_buf);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                      tm_buf.tm_year + 1900,
                      tm_buf.tm_mon + 1,
                      tm_buf.tm_mday,
                      tm_buf.tm_hour,
                      tm_buf.tm_min,
                      tm_buf.tm_sec);
        return std::string(buf);
    }

    bool parse_iso8601(std::string_view text, Timestamp* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_digits(text, 0, 4, &year) || text.size() < 19 || text[4] != '-' ||
            !read_digits(text, 5, 2, &month) || text[7] != '-' ||
            !read_digits(text, 8, 2, &day) || (text[10] != 'T' && text[10] != ' ') ||
            !read_digits(text, 11, 2, &hour) || text[13] != ':' ||
            !read_digits(text, 14, 2, &minute) || text[16] != ':' ||
            !read_digits(text, 17, 2, &second)) {
            return false;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
            return false;
        }

        size_t pos = 19;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const size_t frac_start = pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                ++pos;
            }
            if (pos == frac_start) {
                return false;
            }
        }
        if (pos < text.size() && text[pos] == 'Z') {
            ++pos;
        }
        if (pos != text.size()) {
            return false;
        }

        std::tm tm_buf{};
        tm_buf.tm_year = year - 1900;
        tm_buf.tm_mon = month - 1;
        tm_buf.tm_mday = day;
        tm_buf.tm_hour = hour;
        tm_buf.tm_min = minute;
        tm_buf.tm_sec = second;
        *out = static_cast<Timestamp>(timegm(&tm_buf));
        return true;
    }
} // namespace parcel::core
