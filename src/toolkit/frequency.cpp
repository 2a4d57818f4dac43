/// @file src/toolkit/frequency.cpp
/// @brief Insertion-ordered frequency counting and HHI concentration.

#include "hype/toolkit.hpp"

#include <algorithm>

namespace hype::toolkit {

// ─── FrequencyCounter ─────────────────────────────────────────────────────────

void FrequencyCounter::add(std::string_view label, std::int64_t n) {
    auto it = index_.find(std::string(label));
    if (it == index_.end()) {
        index_.emplace(std::string(label), entries_.size());
        entries_.emplace_back(std::string(label), n);
    } else {
        entries_[it->second].second += n;
    }
    total_ += n;
}

std::int64_t FrequencyCounter::count(std::string_view label) const noexcept {
    const auto it = index_.find(std::string(label));
    return it == index_.end() ? 0 : entries_[it->second].second;
}

CountList FrequencyCounter::most_common(std::size_t n) const {
    CountList sorted = entries_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (sorted.size() > n) {
        sorted.resize(n);
    }
    return sorted;
}

// ─── HHI ──────────────────────────────────────────────────────────────────────

double hhi(std::span<const std::int64_t> counts) noexcept {
    std::int64_t total = 0;
    for (const auto c : counts) total += c;
    if (total <= 0) return 0.0;

    double sum = 0.0;
    for (const auto c : counts) {
        const double share = static_cast<double>(c) / static_cast<double>(total);
        sum += share * share;
    }
    return sum;
}

double hhi(const FrequencyCounter& counter) noexcept {
    if (counter.total() <= 0) return 0.0;
    double sum = 0.0;
    for (const auto& [label, c] : counter.entries()) {
        const double share = static_cast<double>(c) / static_cast<double>(counter.total());
        sum += share * share;
    }
    return sum;
}

CategoryBreakdown breakdown(const FrequencyCounter& counter, std::size_t top_n) {
    return CategoryBreakdown{
        .top    = counter.most_common(top_n),
        .unique = counter.unique(),
        .hhi    = hhi(counter),
    };
}

}  // namespace hype::toolkit
