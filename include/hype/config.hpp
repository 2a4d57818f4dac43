#pragma once

/// @file include/hype/config.hpp
/// @brief Immutable configuration for extractors, rule engines and the analyzer.
///
/// # Module: Config
///
/// ## Responsibility
/// Hold every tunable that shapes a classification: trend-classifier
/// parameters, per-stream extraction settings, and the per-stream rule
/// thresholds. The defaults reproduce the calibrated production values; a
/// JSON overlay can be applied with `io::ConfigLoader`.
///
/// ## Guarantees
/// - Plain aggregates: copyable, comparable, no hidden global state
/// - Every literal cutoff used by a rule table has a named field here
///
/// ## NOT Responsible For
/// - Reading configuration files (see `hype/config_loader.hpp`)

#include "hype/constants.hpp"

#include <cstddef>
#include <cstdint>

namespace hype {

// ─── Shared toolkit settings ──────────────────────────────────────────────────

struct TrendConfig {
    std::size_t window        = constants::TREND_WINDOW;
    double      growth_factor  = constants::TREND_GROWTH_FACTOR;
    double      decline_factor = constants::TREND_DECLINE_FACTOR;

    bool operator==(const TrendConfig&) const = default;
};

// ─── Extraction settings ──────────────────────────────────────────────────────

struct PaperMetricsConfig {
    std::size_t  min_records        = 1;
    std::int64_t min_keyword_count  = constants::PAPER_MIN_KEYWORD_COUNT;
    /// Citation count that always qualifies as highly cited (p90 may raise it).
    double       highly_cited_floor = 100.0;
    /// Applied-share change (points) between halves that counts as drift.
    double       drift_points       = 10.0;

    bool operator==(const PaperMetricsConfig&) const = default;
};

struct PatentMetricsConfig {
    std::size_t  min_records        = constants::MIN_PATENTS_FOR_ANALYSIS;
    std::int64_t min_keyword_count  = constants::STREAM_MIN_KEYWORD_COUNT;
    double       highly_cited_floor = 50.0;

    bool operator==(const PatentMetricsConfig&) const = default;
};

struct SocialMetricsConfig {
    std::size_t  min_records           = constants::MIN_POSTS_FOR_ANALYSIS;
    std::int64_t min_keyword_count     = constants::STREAM_MIN_KEYWORD_COUNT;
    double       highly_engaged_floor  = 100.0;
    /// Second-half/first-half mean score ratios bounding a stable engagement.
    double       engagement_growth     = 1.2;
    double       engagement_decline    = 0.8;

    bool operator==(const SocialMetricsConfig&) const = default;
};

struct NewsMetricsConfig {
    std::size_t  min_records       = constants::MIN_ARTICLES_FOR_ANALYSIS;
    std::int64_t min_keyword_count = constants::STREAM_MIN_KEYWORD_COUNT;

    bool operator==(const NewsMetricsConfig&) const = default;
};

struct FinanceMetricsConfig {
    std::size_t min_records        = constants::MIN_PRICE_ROWS_FOR_ANALYSIS;
    /// Three-month change (%) beyond which the price trend is directional.
    double      trend_band_pct     = 10.0;
    /// Half-vs-half volume change (%) beyond which volume is trending.
    double      volume_band_pct    = 20.0;

    bool operator==(const FinanceMetricsConfig&) const = default;
};

// ─── Rule thresholds ──────────────────────────────────────────────────────────

struct PaperRuleThresholds {
    double early_growth_rate        = 50.0;  ///< % last-2y vs first-2y growth
    double basic_research_high      = 70.0;
    double low_avg_citations        = 20.0;
    double academic_venue_high      = 90.0;
    int    peak_recency_years       = 3;
    double citation_growth_high     = 30.0;
    double applied_transition_low   = 40.0;
    double applied_transition_high  = 60.0;
    double citation_growth_moderate = 10.0;
    double trough_peak_ratio        = 0.7;   ///< last year below this × peak
    double applied_research_high    = 60.0;
    double applied_research_very_high = 80.0;
    int    slope_peak_years_min     = 4;
    int    slope_peak_years_max     = 7;
    double high_avg_citations       = 50.0;
    double industry_venue_high      = 30.0;
    int    plateau_peak_years       = 8;

    bool operator==(const PaperRuleThresholds&) const = default;
};

struct PatentRuleThresholds {
    std::int64_t low_patent_count     = 50;
    double high_academic_pct          = 50.0;
    double low_forward_citations      = 2.0;
    int    young_technology_years     = 5;
    int    mature_technology_years    = 15;
    std::int64_t few_assignees        = 20;
    std::int64_t low_country_spread   = 5;
    std::int64_t high_country_spread  = 20;
    int    recent_peak_years          = 3;
    double corporate_transition_low   = 40.0;
    double corporate_transition_high  = 70.0;
    double low_hhi                    = 0.10;
    double high_hhi                   = 0.25;
    double recent_velocity_factor     = 1.2;
    int    trough_peak_years_max      = 5;
    double trough_peak_ratio          = 0.6;
    double low_citation_ratio         = 0.3;
    double high_citation_ratio        = 1.0;
    double entrant_decline_ratio      = 0.8;
    double corporate_industry_low     = 70.0;
    double corporate_industry_high    = 90.0;
    int    slope_peak_years_min       = 4;
    int    slope_peak_years_max       = 10;
    double high_corporate_pct         = 85.0;

    bool operator==(const PatentRuleThresholds&) const = default;
};

struct SocialRuleThresholds {
    std::int64_t low_post_count        = 50;
    std::int64_t high_post_count       = 500;
    std::int64_t low_subreddit_count   = 3;
    std::int64_t high_subreddit_count  = 15;
    double       low_avg_score         = 20.0;
    double       high_avg_score        = 100.0;
    std::int64_t few_authors           = 30;
    double       high_hhi              = 0.25;
    double       low_hhi               = 0.10;
    std::int64_t many_highly_engaged   = 10;
    double       decline_threshold     = -20.0;
    double       quarter_collapse_ratio = 0.5;
    double       link_share_low        = 30.0;
    double       link_share_high       = 60.0;
    double       mainstream_link_share = 40.0;
    double       good_coverage         = 50.0;

    bool operator==(const SocialRuleThresholds&) const = default;
};

struct NewsRuleThresholds {
    std::int64_t low_article_count      = 30;
    std::int64_t high_article_count     = 300;
    std::int64_t low_source_count       = 5;
    std::int64_t high_source_count      = 20;
    double       high_hhi               = 0.25;
    double       low_hhi                = 0.10;
    std::int64_t few_authors            = 20;
    double       missing_author_pct     = 40.0;
    double       recent_velocity_factor = 1.2;
    std::int64_t many_emerging_keywords = 5;
    double       decline_threshold      = -20.0;
    double       quarter_collapse_ratio = 0.5;
    double       good_coverage          = 60.0;
    double       high_coverage          = 70.0;

    bool operator==(const NewsRuleThresholds&) const = default;
};

struct FinanceRuleThresholds {
    double      high_volatility      = 3.0;   ///< % daily stdev
    double      low_volatility       = 1.0;
    std::size_t few_tickers          = 3;
    double      low_correlation      = 0.3;
    double      strong_bullish       = 30.0;  ///< % three-month change
    double      strong_bearish       = -20.0;
    double      high_return          = 50.0;  ///< % total return
    double      speculative_pe       = 50.0;
    double      severe_drawdown      = 40.0;  ///< %
    double      moderate_drawdown    = 20.0;
    double      moderate_return_low  = 5.0;
    double      moderate_return_high = 30.0;
    double      fair_pe_low          = 10.0;
    double      fair_pe_high         = 30.0;
    double      good_sharpe          = 1.0;

    bool operator==(const FinanceRuleThresholds&) const = default;
};

// ─── Analyzer ─────────────────────────────────────────────────────────────────

/// Minimum record counts enforced before an extractor is invoked.
struct AnalysisGates {
    std::size_t papers     = constants::MIN_PAPERS_FOR_ANALYSIS;
    std::size_t patents    = constants::MIN_PATENTS_FOR_ANALYSIS;
    std::size_t posts      = constants::MIN_POSTS_FOR_ANALYSIS;
    std::size_t articles   = constants::MIN_ARTICLES_FOR_ANALYSIS;
    std::size_t price_rows = constants::MIN_PRICE_ROWS_FOR_ANALYSIS;

    bool operator==(const AnalysisGates&) const = default;
};

/// Everything one analysis run depends on.
struct AnalysisConfig {
    TrendConfig           trend;
    AnalysisGates         gates;

    PaperMetricsConfig    paper;
    PatentMetricsConfig   patent;
    SocialMetricsConfig   social;
    NewsMetricsConfig     news;
    FinanceMetricsConfig  finance;

    PaperRuleThresholds   paper_rules;
    PatentRuleThresholds  patent_rules;
    SocialRuleThresholds  social_rules;
    NewsRuleThresholds    news_rules;
    FinanceRuleThresholds finance_rules;

    /// Trace pipeline steps to stderr.
    bool verbose = false;

    bool operator==(const AnalysisConfig&) const = default;
};

}  // namespace hype
