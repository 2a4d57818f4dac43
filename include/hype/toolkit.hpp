#pragma once

/// @file include/hype/toolkit.hpp
/// @brief Concentration/trend toolkit shared by every metrics extractor.
///
/// # Module: Toolkit
///
/// ## Responsibility
/// The primitives each evidence stream is reduced with:
///   - time-bucketed velocity and its qualitative trend
///   - Herfindahl-Hirschman concentration of a categorical distribution
///   - insertion-ordered frequency counting and top-N breakdowns
///   - lexical keyword frequency and early/recent emergence
///   - descriptive statistics (mean, stdev, median, linear percentile)
///
/// ## Trend classification
/// With k = `TrendConfig::window` and at least 2k buckets:
///
///     recent = mean(last k)   early = mean(first k)
///     recent > growth · early   → increasing
///     recent < decline · early  → decreasing
///     peak bucket in last k     → peak_reached
///     otherwise                 → stable
///
/// Fewer than 2k buckets yields `insufficient_data`. The peak bucket is the
/// earliest bucket holding the maximum count.
///
/// ## Guarantees
/// - Pure functions; identical input gives identical output
/// - HHI ∈ [0, 1]; 0 for an empty distribution
/// - Frequency ties are broken by first occurrence
///
/// ## NOT Responsible For
/// - Record-specific field access (each extractor projects its records)

#include "hype/config.hpp"
#include "hype/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hype::toolkit {

// ─── Velocity & trend ─────────────────────────────────────────────────────────

/// Classify a chronologically ordered series of bucket counts.
[[nodiscard]] Trend classify_trend(std::span<const std::int64_t> ordered_counts,
                                   const TrendConfig& cfg = {}) noexcept;

/// Index of the earliest maximum; `nullopt` for an empty series.
[[nodiscard]] std::optional<std::size_t>
peak_index(std::span<const std::int64_t> ordered_counts) noexcept;

/// Bucketed record counts together with their trend and peak.
template <typename Key>
struct VelocitySummary {
    std::map<Key, std::int64_t> counts;
    Trend        trend      = Trend::InsufficientData;
    Key          peak_bucket{};
    std::int64_t peak_count = 0;
    double       average    = 0.0;   ///< records per bucket

    /// Mean count over the last `n` buckets (fewer if the series is shorter).
    [[nodiscard]] double tail_average(std::size_t n) const noexcept;
};

/// Summarize a bucket→count map. Instantiated for year (`int`) and
/// `YYYY-MM` (`std::string`) buckets.
template <typename Key>
[[nodiscard]] VelocitySummary<Key>
summarize_velocity(std::map<Key, std::int64_t> counts, const TrendConfig& cfg = {});

extern template struct VelocitySummary<int>;
extern template struct VelocitySummary<std::string>;

/// Count records per bucket. `project` maps a record to an optional key;
/// records projecting to `nullopt` are not counted.
template <typename Key, typename Record, typename Projection>
[[nodiscard]] std::map<Key, std::int64_t>
bucket_counts(std::span<const Record> records, Projection project) {
    std::map<Key, std::int64_t> counts;
    for (const auto& r : records) {
        if (auto key = project(r)) {
            ++counts[*key];
        }
    }
    return counts;
}

// ─── Frequency counting ───────────────────────────────────────────────────────

/// Label counter that remembers first-occurrence order for tie-breaking.
class FrequencyCounter {
public:
    void add(std::string_view label, std::int64_t n = 1);

    [[nodiscard]] std::int64_t count(std::string_view label) const noexcept;
    [[nodiscard]] std::size_t  unique() const noexcept { return entries_.size(); }
    [[nodiscard]] std::int64_t total() const noexcept { return total_; }
    [[nodiscard]] bool         empty() const noexcept { return entries_.empty(); }

    /// The `n` most frequent labels; equal counts keep insertion order.
    [[nodiscard]] CountList most_common(std::size_t n) const;

    /// All labels in first-occurrence order.
    [[nodiscard]] const CountList& entries() const noexcept { return entries_; }

private:
    CountList entries_;
    std::unordered_map<std::string, std::size_t> index_;
    std::int64_t total_ = 0;
};

// ─── Concentration ────────────────────────────────────────────────────────────

/// Herfindahl-Hirschman index: Σ (count_i / total)².
[[nodiscard]] double hhi(std::span<const std::int64_t> counts) noexcept;
[[nodiscard]] double hhi(const FrequencyCounter& counter) noexcept;

/// Top-N list, distinct label count and HHI of one categorical attribute.
struct CategoryBreakdown {
    CountList   top;
    std::size_t unique = 0;
    double      hhi    = 0.0;
};

[[nodiscard]] CategoryBreakdown breakdown(const FrequencyCounter& counter,
                                          std::size_t top_n);

// ─── Lexical analysis ─────────────────────────────────────────────────────────

enum class StopwordProfile {
    Base,     ///< Generic English function words
    Social,   ///< Base + forum chatter
    News,     ///< Base + reporting vocabulary
};

[[nodiscard]] const std::set<std::string, std::less<>>& stopwords(StopwordProfile profile);

/// Lowercase alphabetic tokens of at least `min_length` characters.
///
/// A token is a maximal run of word characters (ASCII letters, digits,
/// underscore, or any non-ASCII byte) that consists only of `a-z` after
/// ASCII lowercasing.
[[nodiscard]] std::vector<std::string>
tokenize(std::string_view text, std::size_t min_length = constants::MIN_TOKEN_LENGTH);

struct KeywordShift {
    std::vector<std::string> emerging;
    std::vector<std::string> declining;
};

/// Keyword frequency and emergence over a chronologically ordered corpus.
class LexicalAnalyzer {
public:
    LexicalAnalyzer(StopwordProfile profile, std::int64_t min_count);

    /// Most frequent non-stopword tokens across `texts`.
    [[nodiscard]] CountList top_keywords(std::span<const std::string> texts) const;

    /// Compare the early and recent halves of `texts` (chronological order,
    /// split at `size / 2`).
    [[nodiscard]] KeywordShift emergence(std::span<const std::string> texts) const;

private:
    [[nodiscard]] FrequencyCounter count_tokens(std::span<const std::string> texts) const;
    [[nodiscard]] std::vector<std::string>
    shifted(const FrequencyCounter& focus, const FrequencyCounter& other) const;

    const std::set<std::string, std::less<>>* stopwords_;
    std::int64_t min_count_;
};

// ─── Descriptive statistics ───────────────────────────────────────────────────

[[nodiscard]] std::optional<double> mean(std::span<const double> xs) noexcept;

/// Population standard deviation (divides by N).
[[nodiscard]] std::optional<double> population_stddev(std::span<const double> xs) noexcept;

[[nodiscard]] std::optional<double> median(std::span<const double> xs);

/// Linear-interpolation percentile, `q` in [0, 100].
[[nodiscard]] std::optional<double> percentile(std::span<const double> xs, double q);

/// `part / whole · 100`, or 0 when `whole` is 0.
[[nodiscard]] constexpr double percent(double part, double whole) noexcept {
    return whole > 0.0 ? part / whole * 100.0 : 0.0;
}

}  // namespace hype::toolkit
