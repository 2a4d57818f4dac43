#pragma once

/// @file include/hype/extractors.hpp
/// @brief Metrics extractors: evidence records → canonical snapshot.
///
/// # Module: Metrics Extractors
///
/// ## Responsibility
/// One extractor per evidence stream. Each composes independent
/// sub-calculations (velocity, quality/engagement, distribution, lexical,
/// temporal, data quality) over the shared toolkit and returns an immutable
/// snapshot.
///
/// ## Reference time
/// "Now" is injected at construction as UTC unix seconds. Temporal windows
/// (papers last year, posts last month, technology age...) are measured from
/// it, so identical input and reference time give identical output.
///
/// ## Guarantees
/// - `extract()` throws `InsufficientDataError` when the record count is
///   below the configured floor or no record carries a usable timestamp
/// - Degenerate input never throws; it yields `insufficient_data` labels
/// - Input records are never modified
///
/// ## NOT Responsible For
/// - Phase scoring (see `hype/rule_engine.hpp`)
/// - The caller-side analysis gate (see `hype/analysis.hpp`)

#include "hype/config.hpp"
#include "hype/records.hpp"
#include "hype/snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace hype {

// ─── Errors ───────────────────────────────────────────────────────────────────

/// Raised when a stream does not carry enough evidence to be analysed.
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(std::string stream, std::size_t found, std::size_t required);

    [[nodiscard]] const std::string& stream() const noexcept { return stream_; }
    [[nodiscard]] std::size_t found() const noexcept { return found_; }
    [[nodiscard]] std::size_t required() const noexcept { return required_; }

private:
    std::string stream_;
    std::size_t found_;
    std::size_t required_;
};

}  // namespace hype

namespace hype::metrics {

// ─── Papers ───────────────────────────────────────────────────────────────────

class PaperExtractor {
public:
    PaperExtractor(std::int64_t now_unix, PaperMetricsConfig config = {},
                   TrendConfig trend = {});

    /// Papers without a year are excluded from velocity and temporal fields
    /// but still count toward totals, research type and venues.
    [[nodiscard]] PaperSnapshot extract(std::span<const PaperRecord> papers) const;

    enum class ResearchType { Basic, Applied, Mixed };

    /// Lexicon-based classification of `title + " " + abstract`.
    [[nodiscard]] static ResearchType classify_research(const PaperRecord& paper);

private:
    int                current_year_;
    PaperMetricsConfig config_;
    TrendConfig        trend_;
};

// ─── Patents ──────────────────────────────────────────────────────────────────

class PatentExtractor {
public:
    PatentExtractor(std::int64_t now_unix, PatentMetricsConfig config = {},
                    TrendConfig trend = {});

    [[nodiscard]] PatentSnapshot extract(std::span<const PatentRecord> patents) const;

    enum class AssigneeType { Corporate, Academic, Individual };

    /// Display name of an assignee: organization, else the individual's
    /// name; empty when neither is present.
    [[nodiscard]] static std::string assignee_name(const Assignee& a);

    [[nodiscard]] static AssigneeType classify_assignee(const Assignee& a);

private:
    int                 current_year_;
    PatentMetricsConfig config_;
    TrendConfig         trend_;
};

// ─── Social discussion ────────────────────────────────────────────────────────

class SocialExtractor {
public:
    SocialExtractor(std::int64_t now_unix, SocialMetricsConfig config = {},
                    TrendConfig trend = {});

    [[nodiscard]] SocialSnapshot extract(std::span<const SocialPost> posts) const;

private:
    std::int64_t        now_;
    SocialMetricsConfig config_;
    TrendConfig         trend_;
};

// ─── News coverage ────────────────────────────────────────────────────────────

class NewsExtractor {
public:
    NewsExtractor(std::int64_t now_unix, NewsMetricsConfig config = {},
                  TrendConfig trend = {});

    [[nodiscard]] NewsSnapshot extract(std::span<const NewsArticle> articles) const;

private:
    std::int64_t      now_;
    NewsMetricsConfig config_;
    TrendConfig       trend_;
};

// ─── Market data ──────────────────────────────────────────────────────────────

class FinanceExtractor {
public:
    explicit FinanceExtractor(FinanceMetricsConfig config = {});

    /// `info` may be empty; fundamentals are then reported as absent.
    [[nodiscard]] FinanceSnapshot extract(std::span<const PriceBar> prices,
                                          std::span<const TickerInfo> info = {}) const;

    /// Running peak-to-trough decline of a price series, as a fraction.
    [[nodiscard]] static double max_drawdown(std::span<const double> prices) noexcept;

    /// Pearson correlation, `nullopt` when either series is constant.
    [[nodiscard]] static std::optional<double>
    correlation(std::span<const double> a, std::span<const double> b);

private:
    FinanceMetricsConfig config_;
};

}  // namespace hype::metrics
