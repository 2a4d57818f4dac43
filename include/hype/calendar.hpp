#pragma once

/// @file include/hype/calendar.hpp
/// @brief UTC calendar helpers for bucketing timestamps.
///
/// Timestamps throughout the engine are UTC unix seconds. These helpers map
/// them onto the year, `YYYY-MM` and `YYYY-MM-DD` keys the extractors bucket
/// by, and decode the ISO-8601 strings found in persisted records.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hype::calendar {

/// Calendar year of a unix timestamp.
[[nodiscard]] int year_of(std::int64_t unix_seconds) noexcept;

/// `YYYY-MM` bucket key of a unix timestamp.
[[nodiscard]] std::string month_key(std::int64_t unix_seconds);

/// `YYYY-MM-DD` of a unix timestamp.
[[nodiscard]] std::string format_date(std::int64_t unix_seconds);

/// Unix seconds at 00:00 UTC of a civil date, or `nullopt` if the date is
/// not valid.
[[nodiscard]] std::optional<std::int64_t> from_civil(int year, unsigned month, unsigned day) noexcept;

/// Parse `YYYY-MM-DD`.
[[nodiscard]] std::optional<std::int64_t> parse_date(std::string_view text) noexcept;

/// Parse `YYYY-MM-DD` or `YYYY-MM-DDTHH:MM:SS[.fraction][Z|±HH:MM]`.
/// A numeric offset is applied so the result is UTC.
[[nodiscard]] std::optional<std::int64_t> parse_iso8601(std::string_view text) noexcept;

}  // namespace hype::calendar
