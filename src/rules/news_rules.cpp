/// @file src/rules/news_rules.cpp
/// @brief Press-coverage indicator table.

#include "hype/rule_tables.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace hype::rules {

namespace {

std::vector<std::string> news_key_metrics(Phase phase, const NewsSnapshot& m) {
    switch (phase) {
        case Phase::TechnologyTrigger:
            return {
                fmt::format("- Total articles: {} (limited coverage)", m.total_articles),
                fmt::format("- Unique sources: {} (niche media)", m.unique_sources),
                fmt::format("- Source HHI: {:.3f} (concentrated)", m.source_concentration_hhi),
                fmt::format("- Unique authors: {}", m.unique_authors),
            };
        case Phase::PeakInflatedExpectations:
            return {
                fmt::format("- Velocity trend: {} (media frenzy)", to_string(m.velocity_trend)),
                fmt::format("- Unique sources: {} (broad coverage)", m.unique_sources),
                fmt::format("- Source HHI: {:.3f} (diverse)", m.source_concentration_hhi),
                fmt::format("- Emerging keywords: {} (hype terms)", m.emerging_keywords.size()),
            };
        case Phase::TroughDisillusionment:
            return {
                fmt::format("- Velocity trend: {} (declining)", to_string(m.velocity_trend)),
                fmt::format("- Growth rate: {:.1f}%", m.growth_rate_early_vs_late),
                fmt::format("- Articles last 3 months: {}", m.articles_last_3_months),
                fmt::format("- Declining keywords: {}", m.declining_keywords.size()),
            };
        case Phase::SlopeEnlightenment:
            return {
                fmt::format("- Velocity trend: {} (stable)", to_string(m.velocity_trend)),
                fmt::format("- Unique sources: {}", m.unique_sources),
                fmt::format("- Source HHI: {:.3f}", m.source_concentration_hhi),
                fmt::format("- Data coverage: {:.1f}%", m.coverage_pct),
            };
        case Phase::PlateauProductivity:
            return {
                fmt::format("- Total articles: {} (established)", m.total_articles),
                fmt::format("- Velocity trend: {}", to_string(m.velocity_trend)),
                fmt::format("- Unique sources: {} (mainstream)", m.unique_sources),
                fmt::format("- Source HHI: {:.3f}", m.source_concentration_hhi),
            };
    }
    return {};
}

rationale::ContextBlock top_sources(const NewsSnapshot& m) {
    rationale::ContextBlock block{.heading = "Top news sources:", .lines = {}};
    const auto n = std::min(m.top_sources.size(), constants::RATIONALE_CONTEXT_ROWS);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& [name, count] = m.top_sources[i];
        block.lines.push_back(fmt::format("  - {}: {} articles", name, count));
    }
    return block;
}

}  // namespace

RuleTable<NewsSnapshot> news_rule_table(const NewsRuleThresholds& t) {
    RuleTable<NewsSnapshot> table;
    table.headings = {
        .title      = "News-based Phase",
        .indicators = "Key News indicators:",
        .scores     = "Phase scores (News-based):",
    };

    // ── Technology Trigger ──
    table.indicators[index_of(Phase::TechnologyTrigger)] = {
        {"few_articles", 0.30, [t](const NewsSnapshot& m) {
             return m.total_articles < t.low_article_count;
         }},
        {"few_sources", 0.25, [t](const NewsSnapshot& m) {
             return m.unique_sources < t.low_source_count;
         }},
        {"specialised_media", 0.20, [t](const NewsSnapshot& m) {
             return m.source_concentration_hhi > t.high_hhi;
         }},
        {"few_authors", 0.15, [t](const NewsSnapshot& m) {
             return m.unique_authors < t.few_authors;
         }},
        {"press_releases", 0.10, [t](const NewsSnapshot& m) {
             return m.articles_without_author_pct > t.missing_author_pct;
         }},
    };

    // ── Peak of Inflated Expectations ──
    table.indicators[index_of(Phase::PeakInflatedExpectations)] = {
        {"high_velocity", 0.30, [](const NewsSnapshot& m) {
             return m.velocity_trend == Trend::Increasing || m.velocity_trend == Trend::PeakReached;
         }},
        {"many_sources", 0.20, [t](const NewsSnapshot& m) {
             return m.unique_sources > t.low_source_count;
         }},
        {"broad_coverage", 0.20, [t](const NewsSnapshot& m) {
             return m.source_concentration_hhi < t.low_hhi;
         }},
        {"accelerating_coverage", 0.15, [t](const NewsSnapshot& m) {
             return m.recent_velocity > m.avg_articles_per_month * t.recent_velocity_factor;
         }},
        {"hype_terms", 0.15, [t](const NewsSnapshot& m) {
             return static_cast<std::int64_t>(m.emerging_keywords.size()) > t.many_emerging_keywords;
         }},
    };

    // ── Trough of Disillusionment ──
    table.indicators[index_of(Phase::TroughDisillusionment)] = {
        {"declining_velocity", 0.35, [](const NewsSnapshot& m) {
             return m.velocity_trend == Trend::Decreasing;
         }},
        {"negative_growth", 0.25, [t](const NewsSnapshot& m) {
             return m.growth_rate_early_vs_late < t.decline_threshold;
         }},
        {"quarter_collapse", 0.20, [t](const NewsSnapshot& m) {
             return static_cast<double>(m.articles_last_3_months) <
                    static_cast<double>(m.articles_first_3_months) * t.quarter_collapse_ratio;
         }},
        {"declining_topics", 0.10, [](const NewsSnapshot& m) {
             return m.declining_keywords.size() > m.emerging_keywords.size();
         }},
        {"narrowing_sources", 0.10, [t](const NewsSnapshot& m) {
             return m.source_concentration_hhi > t.low_hhi;
         }},
    };

    // ── Slope of Enlightenment ──
    table.indicators[index_of(Phase::SlopeEnlightenment)] = {
        {"stable_velocity", 0.30, [](const NewsSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"moderate_sources", 0.25, [t](const NewsSnapshot& m) {
             return m.unique_sources >= t.low_source_count && m.unique_sources <= t.high_source_count;
         }},
        {"established_coverage", 0.20, [t](const NewsSnapshot& m) {
             return m.source_concentration_hhi >= t.low_hhi && m.source_concentration_hhi <= t.high_hhi;
         }},
        {"topic_turnover", 0.15, [](const NewsSnapshot& m) {
             return !m.emerging_keywords.empty() && !m.declining_keywords.empty();
         }},
        {"good_coverage", 0.10, [t](const NewsSnapshot& m) {
             return m.coverage_pct > t.good_coverage;
         }},
    };

    // ── Plateau of Productivity ──
    table.indicators[index_of(Phase::PlateauProductivity)] = {
        {"established_volume", 0.25, [t](const NewsSnapshot& m) {
             return m.total_articles > t.high_article_count;
         }},
        {"stable_velocity", 0.25, [](const NewsSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"mainstream_sources", 0.20, [t](const NewsSnapshot& m) {
             return m.unique_sources > t.high_source_count;
         }},
        {"broad_coverage", 0.15, [t](const NewsSnapshot& m) {
             return m.source_concentration_hhi < t.low_hhi;
         }},
        {"high_coverage", 0.15, [t](const NewsSnapshot& m) {
             return m.coverage_pct > t.high_coverage;
         }},
    };

    table.key_metrics = news_key_metrics;
    table.context     = top_sources;
    return table;
}

}  // namespace hype::rules
