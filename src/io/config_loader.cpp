/// @file src/io/config_loader.cpp
/// @brief ConfigLoader implementation: section-wise overlay of `AnalysisConfig`.

#include "hype/config_loader.hpp"
#include "hype/serialization.hpp"

#include "json_fields.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace hype::io {

namespace {

// ─── Field lists ──────────────────────────────────────────────────────────────

template <typename S, typename V>
void visit_trend_settings(S& s, V& v) {
    v("window", s.window);
    v("growth_factor", s.growth_factor);
    v("decline_factor", s.decline_factor);
}

template <typename S, typename V>
void visit_gates_settings(S& s, V& v) {
    v("papers", s.papers);
    v("patents", s.patents);
    v("posts", s.posts);
    v("articles", s.articles);
    v("price_rows", s.price_rows);
}

template <typename S, typename V>
void visit_paper_settings(S& s, V& v) {
    v("min_records", s.min_records);
    v("min_keyword_count", s.min_keyword_count);
    v("highly_cited_floor", s.highly_cited_floor);
    v("drift_points", s.drift_points);
}

template <typename S, typename V>
void visit_patent_settings(S& s, V& v) {
    v("min_records", s.min_records);
    v("min_keyword_count", s.min_keyword_count);
    v("highly_cited_floor", s.highly_cited_floor);
}

template <typename S, typename V>
void visit_social_settings(S& s, V& v) {
    v("min_records", s.min_records);
    v("min_keyword_count", s.min_keyword_count);
    v("highly_engaged_floor", s.highly_engaged_floor);
    v("engagement_growth", s.engagement_growth);
    v("engagement_decline", s.engagement_decline);
}

template <typename S, typename V>
void visit_news_settings(S& s, V& v) {
    v("min_records", s.min_records);
    v("min_keyword_count", s.min_keyword_count);
}

template <typename S, typename V>
void visit_finance_settings(S& s, V& v) {
    v("min_records", s.min_records);
    v("trend_band_pct", s.trend_band_pct);
    v("volume_band_pct", s.volume_band_pct);
}

template <typename S, typename V>
void visit_paper_rules(S& s, V& v) {
    v("early_growth_rate", s.early_growth_rate);
    v("basic_research_high", s.basic_research_high);
    v("low_avg_citations", s.low_avg_citations);
    v("academic_venue_high", s.academic_venue_high);
    v("peak_recency_years", s.peak_recency_years);
    v("citation_growth_high", s.citation_growth_high);
    v("applied_transition_low", s.applied_transition_low);
    v("applied_transition_high", s.applied_transition_high);
    v("citation_growth_moderate", s.citation_growth_moderate);
    v("trough_peak_ratio", s.trough_peak_ratio);
    v("applied_research_high", s.applied_research_high);
    v("applied_research_very_high", s.applied_research_very_high);
    v("slope_peak_years_min", s.slope_peak_years_min);
    v("slope_peak_years_max", s.slope_peak_years_max);
    v("high_avg_citations", s.high_avg_citations);
    v("industry_venue_high", s.industry_venue_high);
    v("plateau_peak_years", s.plateau_peak_years);
}

template <typename S, typename V>
void visit_patent_rules(S& s, V& v) {
    v("low_patent_count", s.low_patent_count);
    v("high_academic_pct", s.high_academic_pct);
    v("low_forward_citations", s.low_forward_citations);
    v("young_technology_years", s.young_technology_years);
    v("mature_technology_years", s.mature_technology_years);
    v("few_assignees", s.few_assignees);
    v("low_country_spread", s.low_country_spread);
    v("high_country_spread", s.high_country_spread);
    v("recent_peak_years", s.recent_peak_years);
    v("corporate_transition_low", s.corporate_transition_low);
    v("corporate_transition_high", s.corporate_transition_high);
    v("low_hhi", s.low_hhi);
    v("high_hhi", s.high_hhi);
    v("recent_velocity_factor", s.recent_velocity_factor);
    v("trough_peak_years_max", s.trough_peak_years_max);
    v("trough_peak_ratio", s.trough_peak_ratio);
    v("low_citation_ratio", s.low_citation_ratio);
    v("high_citation_ratio", s.high_citation_ratio);
    v("entrant_decline_ratio", s.entrant_decline_ratio);
    v("corporate_industry_low", s.corporate_industry_low);
    v("corporate_industry_high", s.corporate_industry_high);
    v("slope_peak_years_min", s.slope_peak_years_min);
    v("slope_peak_years_max", s.slope_peak_years_max);
    v("high_corporate_pct", s.high_corporate_pct);
}

template <typename S, typename V>
void visit_social_rules(S& s, V& v) {
    v("low_post_count", s.low_post_count);
    v("high_post_count", s.high_post_count);
    v("low_subreddit_count", s.low_subreddit_count);
    v("high_subreddit_count", s.high_subreddit_count);
    v("low_avg_score", s.low_avg_score);
    v("high_avg_score", s.high_avg_score);
    v("few_authors", s.few_authors);
    v("high_hhi", s.high_hhi);
    v("low_hhi", s.low_hhi);
    v("many_highly_engaged", s.many_highly_engaged);
    v("decline_threshold", s.decline_threshold);
    v("quarter_collapse_ratio", s.quarter_collapse_ratio);
    v("link_share_low", s.link_share_low);
    v("link_share_high", s.link_share_high);
    v("mainstream_link_share", s.mainstream_link_share);
    v("good_coverage", s.good_coverage);
}

template <typename S, typename V>
void visit_news_rules(S& s, V& v) {
    v("low_article_count", s.low_article_count);
    v("high_article_count", s.high_article_count);
    v("low_source_count", s.low_source_count);
    v("high_source_count", s.high_source_count);
    v("high_hhi", s.high_hhi);
    v("low_hhi", s.low_hhi);
    v("few_authors", s.few_authors);
    v("missing_author_pct", s.missing_author_pct);
    v("recent_velocity_factor", s.recent_velocity_factor);
    v("many_emerging_keywords", s.many_emerging_keywords);
    v("decline_threshold", s.decline_threshold);
    v("quarter_collapse_ratio", s.quarter_collapse_ratio);
    v("good_coverage", s.good_coverage);
    v("high_coverage", s.high_coverage);
}

template <typename S, typename V>
void visit_finance_rules(S& s, V& v) {
    v("high_volatility", s.high_volatility);
    v("low_volatility", s.low_volatility);
    v("few_tickers", s.few_tickers);
    v("low_correlation", s.low_correlation);
    v("strong_bullish", s.strong_bullish);
    v("strong_bearish", s.strong_bearish);
    v("high_return", s.high_return);
    v("speculative_pe", s.speculative_pe);
    v("severe_drawdown", s.severe_drawdown);
    v("moderate_drawdown", s.moderate_drawdown);
    v("moderate_return_low", s.moderate_return_low);
    v("moderate_return_high", s.moderate_return_high);
    v("fair_pe_low", s.fair_pe_low);
    v("fair_pe_high", s.fair_pe_high);
    v("good_sharpe", s.good_sharpe);
}

/// Calls `f(section_name, section, field_list)` for every config section.
template <typename Config, typename F>
void for_each_section(Config& c, F&& f) {
    f("trend", c.trend, [](auto& s, auto& v) { visit_trend_settings(s, v); });
    f("gates", c.gates, [](auto& s, auto& v) { visit_gates_settings(s, v); });
    f("paper", c.paper, [](auto& s, auto& v) { visit_paper_settings(s, v); });
    f("patent", c.patent, [](auto& s, auto& v) { visit_patent_settings(s, v); });
    f("social", c.social, [](auto& s, auto& v) { visit_social_settings(s, v); });
    f("news", c.news, [](auto& s, auto& v) { visit_news_settings(s, v); });
    f("finance", c.finance, [](auto& s, auto& v) { visit_finance_settings(s, v); });
    f("paper_rules", c.paper_rules, [](auto& s, auto& v) { visit_paper_rules(s, v); });
    f("patent_rules", c.patent_rules, [](auto& s, auto& v) { visit_patent_rules(s, v); });
    f("social_rules", c.social_rules, [](auto& s, auto& v) { visit_social_rules(s, v); });
    f("news_rules", c.news_rules, [](auto& s, auto& v) { visit_news_rules(s, v); });
    f("finance_rules", c.finance_rules, [](auto& s, auto& v) { visit_finance_rules(s, v); });
}

}  // anonymous namespace

// ─── ConfigLoader ─────────────────────────────────────────────────────────────

std::optional<AnalysisConfig>
ConfigLoader::apply(const Json::Value& overlay, const AnalysisConfig& base) {
    if (!overlay.isObject()) return std::nullopt;

    AnalysisConfig config = base;
    bool ok = true;
    for_each_section(config, [&](const char* name, auto& section, auto fields) {
        if (!ok || !overlay.isMember(name)) return;
        const Json::Value& node = overlay[name];
        if (!node.isObject()) {
            ok = false;
            return;
        }
        detail::OverlayReader reader{node};
        fields(section, reader);
        ok = reader.ok;
    });
    if (ok && overlay.isMember("verbose")) ok = detail::decode(overlay["verbose"], config.verbose);

    if (!ok) return std::nullopt;
    // Both trend windows must fit in a series of size_t length.
    const std::size_t max_window = std::numeric_limits<std::size_t>::max() / 2;
    if (config.trend.window == 0 || config.trend.window > max_window) return std::nullopt;
    return config;
}

std::optional<AnalysisConfig>
ConfigLoader::load(const std::string& path, const AnalysisConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    std::ostringstream ss;
    ss << file.rdbuf();
    const auto doc = parse_json(ss.str());
    if (!doc) return std::nullopt;
    return apply(*doc, base);
}

Json::Value ConfigLoader::to_json(const AnalysisConfig& config) {
    Json::Value out(Json::objectValue);
    for_each_section(config, [&](const char* name, const auto& section, auto fields) {
        Json::Value node(Json::objectValue);
        detail::FieldWriter writer{node};
        fields(section, writer);
        out[name] = std::move(node);
    });
    out["verbose"] = config.verbose;
    return out;
}

}  // namespace hype::io
