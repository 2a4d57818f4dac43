/// @file src/core/analysis.cpp
/// @brief Analyzer implementation.

#include "hype/analysis.hpp"
#include "hype/rule_tables.hpp"

#include "trace.hpp"

#include <future>

namespace hype::core {

using detail::trace;

// ─── TechnologyReport ─────────────────────────────────────────────────────────

std::size_t TechnologyReport::analysed() const noexcept {
    return static_cast<std::size_t>(paper.has_value()) + patent.has_value()
         + social.has_value() + news.has_value() + finance.has_value();
}

// ─── Analyzer ─────────────────────────────────────────────────────────────────

Analyzer::Analyzer(AnalysisConfig config, std::int64_t now_unix)
    : config_(std::move(config))
    , now_(now_unix)
{}

void Analyzer::require(const char* stream, std::size_t found, std::size_t gate) const {
    if (found < gate) {
        trace(config_.verbose, "{}: {} records below gate of {}", stream, found, gate);
        throw InsufficientDataError(stream, found, gate);
    }
}

StreamResult<PaperSnapshot>
Analyzer::analyze_papers(std::span<const PaperRecord> papers) const {
    require("paper", papers.size(), config_.gates.papers);

    const metrics::PaperExtractor extractor(now_, config_.paper, config_.trend);
    PaperSnapshot snapshot = extractor.extract(papers);
    trace(config_.verbose, "paper: {} papers, peak {} ({})",
          snapshot.total_papers, snapshot.peak_year, snapshot.peak_count);

    const rules::PaperRuleEngine engine(rules::paper_rule_table(config_.paper_rules));
    PhaseVerdict verdict = engine.determine_phase(snapshot);
    trace(config_.verbose, "paper: {} ({:.2f})", to_string(verdict.phase), verdict.confidence);
    return {std::move(snapshot), std::move(verdict)};
}

StreamResult<PatentSnapshot>
Analyzer::analyze_patents(std::span<const PatentRecord> patents) const {
    require("patent", patents.size(), config_.gates.patents);

    const metrics::PatentExtractor extractor(now_, config_.patent, config_.trend);
    PatentSnapshot snapshot = extractor.extract(patents);
    trace(config_.verbose, "patent: {} patents, {} assignees, peak {} ({})",
          snapshot.total_patents, snapshot.unique_assignees, snapshot.peak_year,
          snapshot.peak_count);

    const rules::PatentRuleEngine engine(rules::patent_rule_table(config_.patent_rules));
    PhaseVerdict verdict = engine.determine_phase(snapshot);
    trace(config_.verbose, "patent: {} ({:.2f})", to_string(verdict.phase), verdict.confidence);
    return {std::move(snapshot), std::move(verdict)};
}

StreamResult<SocialSnapshot>
Analyzer::analyze_posts(std::span<const SocialPost> posts) const {
    require("social", posts.size(), config_.gates.posts);

    const metrics::SocialExtractor extractor(now_, config_.social, config_.trend);
    SocialSnapshot snapshot = extractor.extract(posts);
    trace(config_.verbose, "social: {} posts across {} subreddits",
          snapshot.total_posts, snapshot.unique_subreddits);

    const rules::SocialRuleEngine engine(rules::social_rule_table(config_.social_rules));
    PhaseVerdict verdict = engine.determine_phase(snapshot);
    trace(config_.verbose, "social: {} ({:.2f})", to_string(verdict.phase), verdict.confidence);
    return {std::move(snapshot), std::move(verdict)};
}

StreamResult<NewsSnapshot>
Analyzer::analyze_articles(std::span<const NewsArticle> articles) const {
    require("news", articles.size(), config_.gates.articles);

    const metrics::NewsExtractor extractor(now_, config_.news, config_.trend);
    NewsSnapshot snapshot = extractor.extract(articles);
    trace(config_.verbose, "news: {} articles from {} sources",
          snapshot.total_articles, snapshot.unique_sources);

    const rules::NewsRuleEngine engine(rules::news_rule_table(config_.news_rules));
    PhaseVerdict verdict = engine.determine_phase(snapshot);
    trace(config_.verbose, "news: {} ({:.2f})", to_string(verdict.phase), verdict.confidence);
    return {std::move(snapshot), std::move(verdict)};
}

StreamResult<FinanceSnapshot>
Analyzer::analyze_prices(std::span<const PriceBar> prices,
                         std::span<const TickerInfo> info) const {
    require("price", prices.size(), config_.gates.price_rows);

    const metrics::FinanceExtractor extractor(config_.finance);
    FinanceSnapshot snapshot = extractor.extract(prices, info);
    trace(config_.verbose, "finance: {} rows over {} tickers, {} to {}",
          snapshot.total_price_records, snapshot.tickers_analyzed.size(),
          snapshot.date_range_start, snapshot.date_range_end);

    const rules::FinanceRuleEngine engine(rules::finance_rule_table(config_.finance_rules));
    PhaseVerdict verdict = engine.determine_phase(snapshot);
    trace(config_.verbose, "finance: {} ({:.2f})", to_string(verdict.phase), verdict.confidence);
    return {std::move(snapshot), std::move(verdict)};
}

// ─── Analyzer::analyze_technology ─────────────────────────────────────────────

namespace {

/// Collect a stream task: a verdict lands in `slot`, a shortfall in `report`.
template <typename Snapshot>
void collect(std::future<StreamResult<Snapshot>>& task, const char* stream,
             std::optional<StreamResult<Snapshot>>& slot, TechnologyReport& report) {
    if (!task.valid()) return;
    try {
        slot = task.get();
    } catch (const InsufficientDataError& e) {
        report.shortfalls.push_back(Shortfall{.stream = stream, .message = e.what()});
    }
}

}  // anonymous namespace

TechnologyReport Analyzer::analyze_technology(const TechnologyEvidence& evidence) const {
    // ── Step 1: Launch one task per non-empty stream ─────────────────────────
    std::future<StreamResult<PaperSnapshot>>   papers;
    std::future<StreamResult<PatentSnapshot>>  patents;
    std::future<StreamResult<SocialSnapshot>>  posts;
    std::future<StreamResult<NewsSnapshot>>    articles;
    std::future<StreamResult<FinanceSnapshot>> prices;

    if (!evidence.papers.empty()) {
        papers = std::async(std::launch::async, [this, &evidence] {
            return analyze_papers(evidence.papers);
        });
    }
    if (!evidence.patents.empty()) {
        patents = std::async(std::launch::async, [this, &evidence] {
            return analyze_patents(evidence.patents);
        });
    }
    if (!evidence.posts.empty()) {
        posts = std::async(std::launch::async, [this, &evidence] {
            return analyze_posts(evidence.posts);
        });
    }
    if (!evidence.articles.empty()) {
        articles = std::async(std::launch::async, [this, &evidence] {
            return analyze_articles(evidence.articles);
        });
    }
    if (!evidence.prices.empty()) {
        prices = std::async(std::launch::async, [this, &evidence] {
            return analyze_prices(evidence.prices, evidence.ticker_info);
        });
    }

    // ── Step 2: Join in canonical stream order ──────────────────────────────
    TechnologyReport report;
    collect(papers, "paper", report.paper, report);
    collect(patents, "patent", report.patent, report);
    collect(posts, "social", report.social, report);
    collect(articles, "news", report.news, report);
    collect(prices, "finance", report.finance, report);

    trace(config_.verbose, "technology: {} streams analysed, {} short",
          report.analysed(), report.shortfalls.size());
    return report;
}

}  // namespace hype::core
