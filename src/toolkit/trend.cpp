/// @file src/toolkit/trend.cpp
/// @brief Velocity summaries and the bucketed trend classifier.

#include "hype/toolkit.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <string>
#include <vector>

namespace hype::toolkit {

namespace {

double window_mean(std::span<const std::int64_t> xs) noexcept {
    if (xs.empty()) return 0.0;
    const auto sum = std::accumulate(xs.begin(), xs.end(), std::int64_t{0});
    return static_cast<double>(sum) / static_cast<double>(xs.size());
}

}  // namespace

// ─── classify_trend ───────────────────────────────────────────────────────────

std::optional<std::size_t>
peak_index(std::span<const std::int64_t> ordered_counts) noexcept {
    if (ordered_counts.empty()) return std::nullopt;
    // max_element returns the first of equal maxima.
    const auto it = std::max_element(ordered_counts.begin(), ordered_counts.end());
    return static_cast<std::size_t>(std::distance(ordered_counts.begin(), it));
}

Trend classify_trend(std::span<const std::int64_t> ordered_counts,
                     const TrendConfig& cfg) noexcept {
    const std::size_t k = cfg.window;
    if (k == 0 || ordered_counts.size() / 2 < k) {
        return Trend::InsufficientData;
    }

    const double early  = window_mean(ordered_counts.first(k));
    const double recent = window_mean(ordered_counts.last(k));

    if (recent > early * cfg.growth_factor) return Trend::Increasing;
    if (recent < early * cfg.decline_factor) return Trend::Decreasing;

    const auto peak = peak_index(ordered_counts);
    if (peak && *peak >= ordered_counts.size() - k) return Trend::PeakReached;
    return Trend::Stable;
}

// ─── VelocitySummary ──────────────────────────────────────────────────────────

template <typename Key>
double VelocitySummary<Key>::tail_average(std::size_t n) const noexcept {
    if (counts.empty() || n == 0) return 0.0;
    const std::size_t take = std::min(n, counts.size());
    std::int64_t sum = 0;
    auto it = counts.rbegin();
    for (std::size_t i = 0; i < take; ++i, ++it) {
        sum += it->second;
    }
    return static_cast<double>(sum) / static_cast<double>(take);
}

template <typename Key>
VelocitySummary<Key>
summarize_velocity(std::map<Key, std::int64_t> counts, const TrendConfig& cfg) {
    VelocitySummary<Key> out;

    std::vector<std::int64_t> ordered;
    ordered.reserve(counts.size());
    std::int64_t total = 0;
    for (const auto& [key, n] : counts) {
        ordered.push_back(n);
        total += n;
    }

    out.trend = classify_trend(ordered, cfg);
    if (const auto peak = peak_index(ordered)) {
        auto it = counts.begin();
        std::advance(it, static_cast<std::ptrdiff_t>(*peak));
        out.peak_bucket = it->first;
        out.peak_count  = it->second;
        out.average     = static_cast<double>(total) / static_cast<double>(counts.size());
    }
    out.counts = std::move(counts);
    return out;
}

template struct VelocitySummary<int>;
template struct VelocitySummary<std::string>;

template VelocitySummary<int>
summarize_velocity<int>(std::map<int, std::int64_t>, const TrendConfig&);
template VelocitySummary<std::string>
summarize_velocity<std::string>(std::map<std::string, std::int64_t>, const TrendConfig&);

}  // namespace hype::toolkit
