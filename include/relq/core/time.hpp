#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace relq {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Build a Date from a proleptic Gregorian year/month/day.
[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> Date;

/// Format as YYYY-MM-DD.
[[nodiscard]] auto format_date(Date date) -> std::string;

}  // namespace relq
