#pragma once

/// @file src/metrics/extract_common.hpp
/// @brief Helpers shared by the stream extractors.

#include "hype/extractors.hpp"
#include "hype/toolkit.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hype::metrics::detail {

/// Throw `InsufficientDataError` when `found < required`.
void require_records(const char* stream, std::size_t found, std::size_t required);

/// Records in chronological order; records without a timestamp come first,
/// ties keep their input order.
template <typename Record, typename TimeFn>
[[nodiscard]] std::vector<const Record*>
chronological(std::span<const Record> records, TimeFn time_of) {
    std::vector<const Record*> out;
    out.reserve(records.size());
    for (const auto& r : records) out.push_back(&r);
    std::stable_sort(out.begin(), out.end(), [&](const Record* a, const Record* b) {
        const auto ta = time_of(*a);
        const auto tb = time_of(*b);
        if (!ta) return tb.has_value();
        if (!tb) return false;
        return *ta < *tb;
    });
    return out;
}

/// True when the optional holds a non-empty string.
[[nodiscard]] inline bool present(const std::optional<std::string>& s) noexcept {
    return s.has_value() && !s->empty();
}

/// True when the optional holds a string with a non-blank character.
[[nodiscard]] bool non_blank(const std::optional<std::string>& s) noexcept;

/// ASCII lowercase; also folds the Latin-1 capitals of two-byte UTF-8.
[[nodiscard]] std::string lowercase(std::string_view s);

/// Join the present parts with single spaces.
[[nodiscard]] std::string join_text(std::initializer_list<const std::optional<std::string>*> parts,
                                    std::string_view head = {});

/// `(late - early) / early · 100`, or 0 when `early` is 0.
[[nodiscard]] constexpr double growth_pct(double early, double late) noexcept {
    return early > 0.0 ? (late - early) / early * 100.0 : 0.0;
}

}  // namespace hype::metrics::detail
