/// @file src/toolkit/calendar.cpp
/// @brief UTC calendar conversions on top of <chrono> civil dates.

#include "hype/calendar.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <chrono>

namespace hype::calendar {

namespace {

using namespace std::chrono;

year_month_day civil_of(std::int64_t unix_seconds) noexcept {
    const sys_seconds tp{seconds{unix_seconds}};
    return year_month_day{floor<days>(tp)};
}

/// Parse exactly `width` ASCII digits at `pos`.
std::optional<int> digits(std::string_view s, std::size_t pos, std::size_t width) noexcept {
    if (pos + width > s.size()) return std::nullopt;
    int value = 0;
    const char* first = s.data() + pos;
    const char* last  = first + width;
    for (const char* p = first; p != last; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return std::nullopt;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // namespace

int year_of(std::int64_t unix_seconds) noexcept {
    return static_cast<int>(civil_of(unix_seconds).year());
}

std::string month_key(std::int64_t unix_seconds) {
    const auto ymd = civil_of(unix_seconds);
    return fmt::format("{:04d}-{:02d}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()));
}

std::string format_date(std::int64_t unix_seconds) {
    const auto ymd = civil_of(unix_seconds);
    return fmt::format("{:04d}-{:02d}-{:02d}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

std::optional<std::int64_t> from_civil(int y, unsigned m, unsigned d) noexcept {
    const year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok()) return std::nullopt;
    return static_cast<std::int64_t>(sys_days{ymd}.time_since_epoch() / seconds{1});
}

std::optional<std::int64_t> parse_date(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    const auto y = digits(text, 0, 4);
    const auto m = digits(text, 5, 2);
    const auto d = digits(text, 8, 2);
    if (!y || !m || !d) return std::nullopt;
    return from_civil(*y, static_cast<unsigned>(*m), static_cast<unsigned>(*d));
}

std::optional<std::int64_t> parse_iso8601(std::string_view text) noexcept {
    if (text.size() == 10) return parse_date(text);
    if (text.size() < 19 || (text[10] != 'T' && text[10] != ' ')) return std::nullopt;

    const auto date = parse_date(text.substr(0, 10));
    if (!date) return std::nullopt;
    if (text[13] != ':' || text[16] != ':') return std::nullopt;

    const auto hh = digits(text, 11, 2);
    const auto mi = digits(text, 14, 2);
    const auto ss = digits(text, 17, 2);
    if (!hh || !mi || !ss || *hh > 23 || *mi > 59 || *ss > 60) return std::nullopt;

    std::size_t pos = 19;
    // Fractional seconds are accepted and truncated.
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == start) return std::nullopt;
    }

    std::int64_t offset = 0;
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z' && pos + 1 == text.size()) {
            pos += 1;
        } else if ((sign == '+' || sign == '-') && pos + 6 == text.size() && text[pos + 3] == ':') {
            const auto oh = digits(text, pos + 1, 2);
            const auto om = digits(text, pos + 4, 2);
            if (!oh || !om || *oh > 23 || *om > 59) return std::nullopt;
            offset = (*oh * 3600 + *om * 60) * (sign == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }

    return *date + *hh * 3600 + *mi * 60 + *ss - offset;
}

}  // namespace hype::calendar
