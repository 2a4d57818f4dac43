#pragma once

/// @file include/hype/snapshot.hpp
/// @brief Canonical per-stream metrics snapshots.
///
/// # Module: Snapshots
///
/// ## Responsibility
/// Immutable feature sets produced by the extractors and consumed by the
/// rule engines. Each snapshot groups its fields as volume/velocity,
/// quality/engagement, distribution (top-N + HHI) and lexical.
///
/// ## Guarantees
/// - `peak_count` is the maximum value of the velocity map
/// - Counts are non-negative; percentages share their stated denominator
/// - Value semantics with defaulted equality (round-trip comparable)
///
/// ## NOT Responsible For
/// - Computing the fields (see `hype/extractors.hpp`)
/// - JSON encoding (see `hype/serialization.hpp`)

#include "hype/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hype {

// ─── Papers ───────────────────────────────────────────────────────────────────

struct PaperSnapshot {
    // Volume & velocity
    std::int64_t                total_papers = 0;
    std::map<int, std::int64_t> publication_velocity;   ///< year → papers
    Trend        velocity_trend      = Trend::InsufficientData;
    double       avg_papers_per_year = 0.0;
    int          peak_year           = 0;
    std::int64_t peak_count          = 0;
    double       recent_velocity     = 0.0;             ///< papers/year, last 3 calendar years

    // Citations (papers with a known count only)
    std::int64_t total_citations         = 0;
    double       avg_citations_per_paper = 0.0;
    double       median_citations        = 0.0;
    double       citation_growth_rate    = 0.0;         ///< % latest vs previous cited year
    std::int64_t highly_cited_count      = 0;

    // Research type
    double        basic_research_pct   = 0.0;
    double        applied_research_pct = 0.0;
    double        mixed_research_pct   = 0.0;
    ResearchDrift research_type_trend  = ResearchDrift::Stable;

    // Lexical
    CountList                top_keywords;
    std::vector<std::string> emerging_keywords;
    std::vector<std::string> declining_keywords;

    // Venues
    double    academic_venue_pct      = 0.0;
    double    industry_venue_pct      = 0.0;
    double    conference_pct          = 0.0;
    double    journal_pct             = 0.0;
    CountList top_venues;
    double    venue_concentration_hhi = 0.0;

    // Temporal
    std::int64_t papers_last_year          = 0;
    std::int64_t papers_last_2_years       = 0;
    std::int64_t papers_first_2_years      = 0;
    double       growth_rate_early_vs_late = 0.0;

    // Data quality
    std::int64_t papers_with_abstracts = 0;
    std::int64_t papers_with_pdf       = 0;
    double       coverage_pct          = 0.0;

    /// Latest year in the velocity map minus the peak year.
    [[nodiscard]] int years_since_peak() const noexcept;

    bool operator==(const PaperSnapshot&) const = default;
};

// ─── Patents ──────────────────────────────────────────────────────────────────

struct PatentSnapshot {
    // Volume & velocity
    std::int64_t                total_patents = 0;
    std::map<int, std::int64_t> patent_velocity;        ///< grant year → patents
    Trend        velocity_trend       = Trend::InsufficientData;
    double       avg_patents_per_year = 0.0;
    int          peak_year            = 0;
    std::int64_t peak_count           = 0;
    double       recent_velocity      = 0.0;

    // Citations
    std::int64_t total_forward_citations  = 0;
    std::int64_t total_backward_citations = 0;
    double       avg_forward_citations    = 0.0;
    double       avg_backward_citations   = 0.0;
    double       citation_ratio           = 0.0;        ///< forward / max(backward, 1)
    double       median_forward_citations = 0.0;
    std::int64_t highly_cited_count       = 0;

    // Assignees
    std::int64_t unique_assignees           = 0;
    CountList    top_assignees;
    double       assignee_concentration_hhi = 0.0;
    double       corporate_pct              = 0.0;
    double       academic_pct               = 0.0;
    double       individual_pct             = 0.0;
    std::map<int, std::int64_t> new_entrants_by_year;

    // Geography
    std::map<std::string, std::int64_t> country_distribution;
    std::int64_t unique_countries          = 0;
    CountList    top_countries;
    double       country_concentration_hhi = 0.0;

    // Patent types
    double utility_pct = 0.0;
    double design_pct  = 0.0;
    double other_pct   = 0.0;

    // Lexical
    CountList                top_keywords;
    std::vector<std::string> emerging_keywords;
    std::vector<std::string> declining_keywords;

    // Temporal
    int          first_patent_year     = 0;
    int          technology_age_years  = 0;
    std::int64_t patents_last_year     = 0;
    std::int64_t patents_last_2_years  = 0;

    // Data quality
    std::int64_t patents_with_abstract = 0;
    double       coverage_pct          = 0.0;

    [[nodiscard]] int years_since_peak() const noexcept;

    bool operator==(const PatentSnapshot&) const = default;
};

// ─── Social discussion ────────────────────────────────────────────────────────

struct SocialSnapshot {
    // Volume & velocity
    std::int64_t                        total_posts = 0;
    std::map<std::string, std::int64_t> post_velocity;  ///< YYYY-MM → posts
    Trend        velocity_trend       = Trend::InsufficientData;
    double       avg_posts_per_month  = 0.0;
    std::string  peak_month;
    std::int64_t peak_count           = 0;
    double       recent_velocity      = 0.0;             ///< posts/month, last 3 buckets

    // Engagement
    std::int64_t total_score          = 0;
    std::int64_t total_comments       = 0;
    double       avg_score_per_post   = 0.0;
    double       avg_comments_per_post = 0.0;
    double       median_score         = 0.0;
    double       median_comments      = 0.0;
    std::int64_t highly_engaged_count = 0;
    Trend        engagement_trend     = Trend::InsufficientData;

    // Communities & authors
    std::int64_t unique_subreddits              = 0;
    CountList    top_subreddits;
    double       subreddit_concentration_hhi    = 0.0;
    std::int64_t unique_authors                 = 0;
    CountList    top_authors;
    double       author_concentration_hhi       = 0.0;

    // Post types
    double self_post_pct = 0.0;
    double link_post_pct = 0.0;

    // Lexical
    CountList                top_keywords;
    std::vector<std::string> emerging_keywords;
    std::vector<std::string> declining_keywords;

    // Temporal
    std::string  first_post_date;                       ///< YYYY-MM-DD
    std::int64_t posts_last_month          = 0;
    std::int64_t posts_last_3_months       = 0;
    std::int64_t posts_first_3_months      = 0;
    double       growth_rate_early_vs_late = 0.0;

    // Data quality
    std::int64_t posts_with_body = 0;
    double       coverage_pct    = 0.0;

    bool operator==(const SocialSnapshot&) const = default;
};

// ─── News coverage ────────────────────────────────────────────────────────────

struct NewsSnapshot {
    // Volume & velocity
    std::int64_t                        total_articles = 0;
    std::map<std::string, std::int64_t> article_velocity;  ///< YYYY-MM → articles
    Trend        velocity_trend         = Trend::InsufficientData;
    double       avg_articles_per_month = 0.0;
    std::string  peak_month;
    std::int64_t peak_count             = 0;
    double       recent_velocity        = 0.0;

    // Sources
    std::int64_t unique_sources           = 0;
    CountList    top_sources;
    double       source_concentration_hhi = 0.0;

    // Authors
    std::int64_t unique_authors           = 0;
    CountList    top_authors;
    double       articles_without_author_pct = 0.0;
    double       author_concentration_hhi = 0.0;

    // Lexical
    CountList                top_keywords;
    std::vector<std::string> emerging_keywords;
    std::vector<std::string> declining_keywords;

    // Temporal
    std::string  first_article_date;                    ///< YYYY-MM-DD
    std::int64_t articles_last_month       = 0;
    std::int64_t articles_last_3_months    = 0;
    std::int64_t articles_first_3_months   = 0;
    double       growth_rate_early_vs_late = 0.0;

    // Data quality
    std::int64_t articles_with_content     = 0;
    std::int64_t articles_with_description = 0;
    double       coverage_pct              = 0.0;

    bool operator==(const NewsSnapshot&) const = default;
};

// ─── Market data ──────────────────────────────────────────────────────────────

/// Per-ticker return profile.
struct TickerPerformance {
    double       total_return_pct     = 0.0;
    double       avg_daily_return_pct = 0.0;
    double       volatility_pct       = 0.0;
    std::int64_t num_records          = 0;
    double       latest_price         = 0.0;

    bool operator==(const TickerPerformance&) const = default;
};

struct FinanceSnapshot {
    // Overview
    std::vector<std::string> tickers_analyzed;
    std::int64_t total_price_records = 0;
    std::string  date_range_start;
    std::string  date_range_end;

    // Returns & risk (percent)
    double avg_daily_return = 0.0;
    double volatility       = 0.0;   ///< population stdev of daily returns
    double sharpe_ratio     = 0.0;   ///< annualised
    double total_return     = 0.0;   ///< mean across tickers
    double max_drawdown     = 0.0;   ///< mean of per-ticker peak-to-trough

    // Price action
    double     price_change_last_month    = 0.0;
    double     price_change_last_3_months = 0.0;
    PriceTrend price_trend                = PriceTrend::Sideways;

    // Volume
    double avg_volume        = 0.0;
    double volume_change_pct = 0.0;
    Trend  volume_trend      = Trend::InsufficientData;

    std::map<std::string, TickerPerformance> ticker_performance;

    // Fundamentals
    std::optional<double>    avg_pe_ratio;
    std::optional<double>    avg_market_cap;
    std::vector<std::string> sectors;
    std::vector<std::string> industries;
    double                   sector_concentration_hhi = 0.0;

    std::optional<double> avg_correlation;

    // Data quality
    std::int64_t records_with_volume = 0;
    double       coverage_pct        = 0.0;

    bool operator==(const FinanceSnapshot&) const = default;
};

}  // namespace hype
