#pragma once

#include <string>
#include <string_view>

#include "parcel/core/types.hpp"

namespace parcel::core {
    [[nodiscard]] Timestamp now_utc() noexcept;

    // YYYY-MM-DDTHH:MM:SSZ
    std::string format_iso8601(Timestamp t);

    // Accepts YYYY-MM-DDTHH:MM:SS with an optional fractional part and an
    // optional trailing 'Z'. Values without a zone designator are read as UTC.
    [[nodiscard]] bool parse_iso8601(std::string_view text, Timestamp* out) noexcept;
} // namespace parcel::core
