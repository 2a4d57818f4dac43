/// @file src/toolkit/statistics.cpp
/// @brief Descriptive statistics over finite samples.

#include "hype/toolkit.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace hype::toolkit {

std::optional<double> mean(std::span<const double> xs) noexcept {
    if (xs.empty()) return std::nullopt;
    const double sum = std::accumulate(xs.begin(), xs.end(), 0.0);
    return sum / static_cast<double>(xs.size());
}

std::optional<double> population_stddev(std::span<const double> xs) noexcept {
    const auto mu = mean(xs);
    if (!mu) return std::nullopt;
    double ss = 0.0;
    for (const double x : xs) {
        const double d = x - *mu;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(xs.size()));
}

std::optional<double> median(std::span<const double> xs) {
    return percentile(xs, 50.0);
}

std::optional<double> percentile(std::span<const double> xs, double q) {
    if (xs.empty() || !std::isfinite(q)) return std::nullopt;
    std::vector<double> sorted(xs.begin(), xs.end());
    std::sort(sorted.begin(), sorted.end());

    const double clamped = std::clamp(q, 0.0, 100.0);
    const double rank = clamped / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(rank));
    const auto hi = static_cast<std::size_t>(std::ceil(rank));
    const double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

}  // namespace hype::toolkit
