#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/hype/constants.hpp
/// @brief Default parameters shared by the extractors and rule engines.
///
/// Stream-specific rule cutoffs live in the thresholds structs of
/// `hype/config.hpp`; the values here are the structural defaults they and
/// the toolkit are seeded from.

namespace hype::constants {

// ─── Minimum record counts ────────────────────────────────────────────────────

/// Papers required before the analyzer will classify a technology.
static constexpr std::size_t MIN_PAPERS_FOR_ANALYSIS = 100;

/// Patents, posts and articles required by both extractor and analyzer.
static constexpr std::size_t MIN_PATENTS_FOR_ANALYSIS  = 10;
static constexpr std::size_t MIN_POSTS_FOR_ANALYSIS    = 10;
static constexpr std::size_t MIN_ARTICLES_FOR_ANALYSIS = 10;

/// Price rows (across all tickers) required for finance analysis.
static constexpr std::size_t MIN_PRICE_ROWS_FOR_ANALYSIS = 20;

// ─── Trend classifier ─────────────────────────────────────────────────────────

/// Number of buckets averaged at each end of a velocity series.
static constexpr std::size_t TREND_WINDOW = 3;

/// recent/early ratio above which a series is increasing.
static constexpr double TREND_GROWTH_FACTOR = 1.2;

/// recent/early ratio below which a series is decreasing.
static constexpr double TREND_DECLINE_FACTOR = 0.8;

// ─── Lexical analysis ─────────────────────────────────────────────────────────

static constexpr std::size_t MIN_TOKEN_LENGTH = 4;

/// Most frequent tokens of a half considered for emergence/decline.
static constexpr std::size_t EMERGENCE_CANDIDATES = 30;

/// Emerging and declining lists are truncated to this length.
static constexpr std::size_t EMERGENCE_LIMIT = 10;

/// Frequency pool scanned before stopword filtering of top keywords.
static constexpr std::size_t KEYWORD_POOL = 50;

static constexpr std::size_t TOP_KEYWORDS = 20;

/// Minimum half-corpus count for a paper token to be emerging/declining.
static constexpr std::int64_t PAPER_MIN_KEYWORD_COUNT = 10;

/// Same, for patents, posts and news.
static constexpr std::int64_t STREAM_MIN_KEYWORD_COUNT = 5;

// ─── Distributions ────────────────────────────────────────────────────────────

/// Length of top-N categorical breakdowns (assignees, sources, venues...).
static constexpr std::size_t TOP_CATEGORIES = 10;

/// Entries printed in a rationale context block.
static constexpr std::size_t RATIONALE_CONTEXT_ROWS = 5;

// ─── Market calendar ──────────────────────────────────────────────────────────

/// Trading days per year used to annualise return statistics.
static constexpr double ANNUALISATION_FACTOR = 252.0;

/// Rows looked back for the one- and three-month price change.
static constexpr std::size_t ONE_MONTH_ROWS   = 21;
static constexpr std::size_t THREE_MONTH_ROWS = 63;

/// Tickers need this many prices before contributing to the price trend.
static constexpr std::size_t MIN_PRICES_FOR_TREND = 5;

/// Common return dates required before a ticker pair is correlated.
static constexpr std::size_t MIN_COMMON_DATES_FOR_CORRELATION = 20;

// ─── Calendar windows ─────────────────────────────────────────────────────────

static constexpr std::int64_t SECONDS_PER_DAY = 86'400;

/// "Last month" and "last three months" windows for post/article streams.
static constexpr std::int64_t LAST_MONTH_DAYS   = 30;
static constexpr std::int64_t LAST_QUARTER_DAYS = 90;

}  // namespace hype::constants
