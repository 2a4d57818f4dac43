#pragma once

/// @file include/hype/analysis.hpp
/// @brief Analyzer — gate, extract, classify for each evidence stream.
///
/// # Module: Analyzer
///
/// ## Responsibility
/// The caller of the core pipeline:
///
///     records ──gate──▶ Extractor ──▶ Snapshot ──▶ PhaseRuleEngine ──▶ Verdict
///
/// `Analyzer` owns one immutable `AnalysisConfig` and a reference time, and
/// exposes one entry point per stream plus `analyze_technology`, which runs
/// every non-empty stream concurrently.
///
/// ## Guarantees
/// - Per-stream calls throw `InsufficientDataError` below the gate
/// - `analyze_technology` never throws for insufficient data; shortfalls
///   are reported in `TechnologyReport::shortfalls`
/// - Stream tasks share no mutable state
///
/// ## NOT Responsible For
/// - Loading records from disk (see `hype/record_loader.hpp`)
/// - Cross-stream aggregation into a single phase

#include "hype/config.hpp"
#include "hype/extractors.hpp"
#include "hype/records.hpp"
#include "hype/snapshot.hpp"
#include "hype/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hype::core {

// ─── Types ────────────────────────────────────────────────────────────────────

template <typename Snapshot>
struct StreamResult {
    Snapshot     snapshot;
    PhaseVerdict verdict;
};

/// All evidence collected for one technology. Any stream may be empty.
struct TechnologyEvidence {
    std::vector<PaperRecord>  papers;
    std::vector<PatentRecord> patents;
    std::vector<SocialPost>   posts;
    std::vector<NewsArticle>  articles;
    std::vector<PriceBar>     prices;
    std::vector<TickerInfo>   ticker_info;
};

/// Stream name and the shortfall message of a stream that was skipped.
struct Shortfall {
    std::string stream;
    std::string message;
};

struct TechnologyReport {
    std::optional<StreamResult<PaperSnapshot>>   paper;
    std::optional<StreamResult<PatentSnapshot>>  patent;
    std::optional<StreamResult<SocialSnapshot>>  social;
    std::optional<StreamResult<NewsSnapshot>>    news;
    std::optional<StreamResult<FinanceSnapshot>> finance;
    std::vector<Shortfall>                       shortfalls;

    /// Number of streams that produced a verdict.
    [[nodiscard]] std::size_t analysed() const noexcept;
};

// ─── Analyzer ─────────────────────────────────────────────────────────────────

class Analyzer {
public:
    Analyzer(AnalysisConfig config, std::int64_t now_unix);

    [[nodiscard]] StreamResult<PaperSnapshot>
    analyze_papers(std::span<const PaperRecord> papers) const;

    [[nodiscard]] StreamResult<PatentSnapshot>
    analyze_patents(std::span<const PatentRecord> patents) const;

    [[nodiscard]] StreamResult<SocialSnapshot>
    analyze_posts(std::span<const SocialPost> posts) const;

    [[nodiscard]] StreamResult<NewsSnapshot>
    analyze_articles(std::span<const NewsArticle> articles) const;

    [[nodiscard]] StreamResult<FinanceSnapshot>
    analyze_prices(std::span<const PriceBar> prices,
                   std::span<const TickerInfo> info = {}) const;

    /// Analyse every non-empty stream of `evidence` concurrently.
    [[nodiscard]] TechnologyReport analyze_technology(const TechnologyEvidence& evidence) const;

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::int64_t now() const noexcept { return now_; }

private:
    void require(const char* stream, std::size_t found, std::size_t gate) const;

    AnalysisConfig config_;
    std::int64_t   now_;
};

}  // namespace hype::core
