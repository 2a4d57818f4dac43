/// @file src/metrics/news_extractor.cpp
/// @brief Press-coverage metrics: monthly velocity, sources, authors, keywords.

#include "hype/calendar.hpp"
#include "hype/extractors.hpp"
#include "hype/toolkit.hpp"

#include "extract_common.hpp"

#include <algorithm>
#include <vector>

namespace hype::metrics {

namespace {

std::optional<std::int64_t> published(const NewsArticle& a) noexcept { return a.published_utc; }

std::optional<std::string> month_of(const NewsArticle& a) {
    if (!a.published_utc) return std::nullopt;
    return calendar::month_key(*a.published_utc);
}

}  // namespace

// ─── NewsExtractor ────────────────────────────────────────────────────────────

NewsExtractor::NewsExtractor(std::int64_t now_unix, NewsMetricsConfig config,
                             TrendConfig trend)
    : now_(now_unix)
    , config_(config)
    , trend_(trend)
{}

NewsSnapshot NewsExtractor::extract(std::span<const NewsArticle> articles) const {
    detail::require_records("news", articles.size(), config_.min_records);

    const auto ordered = detail::chronological(articles, published);
    const auto n = static_cast<double>(articles.size());

    NewsSnapshot s;
    s.total_articles = static_cast<std::int64_t>(articles.size());

    // ── Step 1: Monthly velocity ─────────────────────────────────────────────
    auto velocity = toolkit::summarize_velocity(
        toolkit::bucket_counts<std::string>(articles, month_of), trend_);
    if (velocity.counts.empty()) {
        throw InsufficientDataError("dated news", 0, 1);
    }

    s.velocity_trend         = velocity.trend;
    s.avg_articles_per_month = n / static_cast<double>(velocity.counts.size());
    s.peak_month             = velocity.peak_bucket;
    s.peak_count             = velocity.peak_count;
    s.recent_velocity        = velocity.tail_average(trend_.window);
    s.article_velocity       = std::move(velocity.counts);

    // ── Step 2: Sources ──────────────────────────────────────────────────────
    {
        toolkit::FrequencyCounter sources;
        for (const auto& a : articles) {
            sources.add(detail::present(a.source_name) ? *a.source_name : "unknown");
        }
        auto b = toolkit::breakdown(sources, constants::TOP_CATEGORIES);
        s.unique_sources           = static_cast<std::int64_t>(b.unique);
        s.top_sources              = std::move(b.top);
        s.source_concentration_hhi = b.hhi;
    }

    // ── Step 3: Authors ──────────────────────────────────────────────────────
    {
        toolkit::FrequencyCounter authors;
        std::size_t anonymous = 0;
        for (const auto& a : articles) {
            if (detail::non_blank(a.author)) {
                authors.add(*a.author);
            } else {
                ++anonymous;
            }
        }
        auto b = toolkit::breakdown(authors, constants::TOP_CATEGORIES);
        s.unique_authors              = static_cast<std::int64_t>(b.unique);
        s.top_authors                 = std::move(b.top);
        s.author_concentration_hhi    = b.hhi;
        s.articles_without_author_pct = toolkit::percent(static_cast<double>(anonymous), n);
    }

    // ── Step 4: Keywords ─────────────────────────────────────────────────────
    {
        std::vector<std::string> all_text;
        std::vector<std::string> corpus;
        corpus.reserve(ordered.size());
        for (const auto* a : ordered) {
            if (!a->title.empty())              all_text.push_back(a->title);
            if (detail::present(a->description)) all_text.push_back(*a->description);
            if (detail::present(a->content))     all_text.push_back(*a->content);
            corpus.push_back(detail::join_text({&a->description}, a->title));
        }
        const toolkit::LexicalAnalyzer lexer(toolkit::StopwordProfile::News,
                                             config_.min_keyword_count);
        s.top_keywords = lexer.top_keywords(all_text);
        auto shift = lexer.emergence(corpus);
        s.emerging_keywords  = std::move(shift.emerging);
        s.declining_keywords = std::move(shift.declining);
    }

    // ── Step 5: Temporal comparison ──────────────────────────────────────────
    {
        std::vector<std::int64_t> stamps;
        for (const auto& a : articles) {
            if (a.published_utc) stamps.push_back(*a.published_utc);
        }
        const std::int64_t first = *std::min_element(stamps.begin(), stamps.end());
        const std::int64_t month_ago   = now_ - constants::LAST_MONTH_DAYS * constants::SECONDS_PER_DAY;
        const std::int64_t quarter_ago = now_ - constants::LAST_QUARTER_DAYS * constants::SECONDS_PER_DAY;
        const std::int64_t first_quarter_end =
            first + constants::LAST_QUARTER_DAYS * constants::SECONDS_PER_DAY;

        s.first_article_date = calendar::format_date(first);
        for (const auto t : stamps) {
            if (t >= month_ago)         ++s.articles_last_month;
            if (t >= quarter_ago)       ++s.articles_last_3_months;
            if (t <= first_quarter_end) ++s.articles_first_3_months;
        }
        s.growth_rate_early_vs_late = detail::growth_pct(
            static_cast<double>(s.articles_first_3_months),
            static_cast<double>(s.articles_last_3_months));
    }

    // ── Step 6: Data quality ─────────────────────────────────────────────────
    for (const auto& a : articles) {
        if (detail::present(a.content))     ++s.articles_with_content;
        if (detail::present(a.description)) ++s.articles_with_description;
    }
    s.coverage_pct = toolkit::percent(
        static_cast<double>(s.articles_with_content + s.articles_with_description), 2.0 * n);

    return s;
}

}  // namespace hype::metrics
