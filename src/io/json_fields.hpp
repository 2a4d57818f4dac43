#pragma once

/// @file src/io/json_fields.hpp
/// @brief Field lists and the jsoncpp visitors that walk them.
///
/// Each `visit_*` template names every persisted member of one struct.
/// `FieldWriter` copies the members into a JSON object; `FieldReader` fills
/// them from one and records the first missing or mistyped key.

#include "hype/config.hpp"
#include "hype/snapshot.hpp"
#include "hype/types.hpp"

#include <json/json.h>

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace hype::io::detail {

inline Json::Value encode(const TickerPerformance& p);
inline Json::Value encode(const std::map<std::string, TickerPerformance>& xs);
inline bool decode(const Json::Value& j, TickerPerformance& out);
inline bool decode(const Json::Value& j, std::map<std::string, TickerPerformance>& out);

// ─── Field lists ──────────────────────────────────────────────────────────────

template <typename S, typename V>
void visit_paper(S& s, V& v) {
    v("total_papers", s.total_papers);
    v("publication_velocity", s.publication_velocity);
    v("velocity_trend", s.velocity_trend);
    v("avg_papers_per_year", s.avg_papers_per_year);
    v("peak_year", s.peak_year);
    v("peak_count", s.peak_count);
    v("recent_velocity", s.recent_velocity);
    v("total_citations", s.total_citations);
    v("avg_citations_per_paper", s.avg_citations_per_paper);
    v("median_citations", s.median_citations);
    v("citation_growth_rate", s.citation_growth_rate);
    v("highly_cited_count", s.highly_cited_count);
    v("basic_research_pct", s.basic_research_pct);
    v("applied_research_pct", s.applied_research_pct);
    v("mixed_research_pct", s.mixed_research_pct);
    v("research_type_trend", s.research_type_trend);
    v("top_keywords", s.top_keywords);
    v("emerging_keywords", s.emerging_keywords);
    v("declining_keywords", s.declining_keywords);
    v("academic_venue_pct", s.academic_venue_pct);
    v("industry_venue_pct", s.industry_venue_pct);
    v("conference_pct", s.conference_pct);
    v("journal_pct", s.journal_pct);
    v("top_venues", s.top_venues);
    v("venue_concentration_hhi", s.venue_concentration_hhi);
    v("papers_last_year", s.papers_last_year);
    v("papers_last_2_years", s.papers_last_2_years);
    v("papers_first_2_years", s.papers_first_2_years);
    v("growth_rate_early_vs_late", s.growth_rate_early_vs_late);
    v("papers_with_abstracts", s.papers_with_abstracts);
    v("papers_with_pdf", s.papers_with_pdf);
    v("coverage_pct", s.coverage_pct);
}

template <typename S, typename V>
void visit_patent(S& s, V& v) {
    v("total_patents", s.total_patents);
    v("patent_velocity", s.patent_velocity);
    v("velocity_trend", s.velocity_trend);
    v("avg_patents_per_year", s.avg_patents_per_year);
    v("peak_year", s.peak_year);
    v("peak_count", s.peak_count);
    v("recent_velocity", s.recent_velocity);
    v("total_forward_citations", s.total_forward_citations);
    v("total_backward_citations", s.total_backward_citations);
    v("avg_forward_citations", s.avg_forward_citations);
    v("avg_backward_citations", s.avg_backward_citations);
    v("citation_ratio", s.citation_ratio);
    v("median_forward_citations", s.median_forward_citations);
    v("highly_cited_count", s.highly_cited_count);
    v("unique_assignees", s.unique_assignees);
    v("top_assignees", s.top_assignees);
    v("assignee_concentration_hhi", s.assignee_concentration_hhi);
    v("corporate_pct", s.corporate_pct);
    v("academic_pct", s.academic_pct);
    v("individual_pct", s.individual_pct);
    v("new_entrants_by_year", s.new_entrants_by_year);
    v("country_distribution", s.country_distribution);
    v("unique_countries", s.unique_countries);
    v("top_countries", s.top_countries);
    v("country_concentration_hhi", s.country_concentration_hhi);
    v("utility_pct", s.utility_pct);
    v("design_pct", s.design_pct);
    v("other_pct", s.other_pct);
    v("top_keywords", s.top_keywords);
    v("emerging_keywords", s.emerging_keywords);
    v("declining_keywords", s.declining_keywords);
    v("first_patent_year", s.first_patent_year);
    v("technology_age_years", s.technology_age_years);
    v("patents_last_year", s.patents_last_year);
    v("patents_last_2_years", s.patents_last_2_years);
    v("patents_with_abstract", s.patents_with_abstract);
    v("coverage_pct", s.coverage_pct);
}

template <typename S, typename V>
void visit_social(S& s, V& v) {
    v("total_posts", s.total_posts);
    v("post_velocity", s.post_velocity);
    v("velocity_trend", s.velocity_trend);
    v("avg_posts_per_month", s.avg_posts_per_month);
    v("peak_month", s.peak_month);
    v("peak_count", s.peak_count);
    v("recent_velocity", s.recent_velocity);
    v("total_score", s.total_score);
    v("total_comments", s.total_comments);
    v("avg_score_per_post", s.avg_score_per_post);
    v("avg_comments_per_post", s.avg_comments_per_post);
    v("median_score", s.median_score);
    v("median_comments", s.median_comments);
    v("highly_engaged_count", s.highly_engaged_count);
    v("engagement_trend", s.engagement_trend);
    v("unique_subreddits", s.unique_subreddits);
    v("top_subreddits", s.top_subreddits);
    v("subreddit_concentration_hhi", s.subreddit_concentration_hhi);
    v("unique_authors", s.unique_authors);
    v("top_authors", s.top_authors);
    v("author_concentration_hhi", s.author_concentration_hhi);
    v("self_post_pct", s.self_post_pct);
    v("link_post_pct", s.link_post_pct);
    v("top_keywords", s.top_keywords);
    v("emerging_keywords", s.emerging_keywords);
    v("declining_keywords", s.declining_keywords);
    v("first_post_date", s.first_post_date);
    v("posts_last_month", s.posts_last_month);
    v("posts_last_3_months", s.posts_last_3_months);
    v("posts_first_3_months", s.posts_first_3_months);
    v("growth_rate_early_vs_late", s.growth_rate_early_vs_late);
    v("posts_with_body", s.posts_with_body);
    v("coverage_pct", s.coverage_pct);
}

template <typename S, typename V>
void visit_news(S& s, V& v) {
    v("total_articles", s.total_articles);
    v("article_velocity", s.article_velocity);
    v("velocity_trend", s.velocity_trend);
    v("avg_articles_per_month", s.avg_articles_per_month);
    v("peak_month", s.peak_month);
    v("peak_count", s.peak_count);
    v("recent_velocity", s.recent_velocity);
    v("unique_sources", s.unique_sources);
    v("top_sources", s.top_sources);
    v("source_concentration_hhi", s.source_concentration_hhi);
    v("unique_authors", s.unique_authors);
    v("top_authors", s.top_authors);
    v("articles_without_author_pct", s.articles_without_author_pct);
    v("author_concentration_hhi", s.author_concentration_hhi);
    v("top_keywords", s.top_keywords);
    v("emerging_keywords", s.emerging_keywords);
    v("declining_keywords", s.declining_keywords);
    v("first_article_date", s.first_article_date);
    v("articles_last_month", s.articles_last_month);
    v("articles_last_3_months", s.articles_last_3_months);
    v("articles_first_3_months", s.articles_first_3_months);
    v("growth_rate_early_vs_late", s.growth_rate_early_vs_late);
    v("articles_with_content", s.articles_with_content);
    v("articles_with_description", s.articles_with_description);
    v("coverage_pct", s.coverage_pct);
}

template <typename S, typename V>
void visit_ticker(S& s, V& v) {
    v("total_return_pct", s.total_return_pct);
    v("avg_daily_return_pct", s.avg_daily_return_pct);
    v("volatility_pct", s.volatility_pct);
    v("num_records", s.num_records);
    v("latest_price", s.latest_price);
}

template <typename S, typename V>
void visit_finance(S& s, V& v) {
    v("tickers_analyzed", s.tickers_analyzed);
    v("total_price_records", s.total_price_records);
    v("date_range_start", s.date_range_start);
    v("date_range_end", s.date_range_end);
    v("avg_daily_return", s.avg_daily_return);
    v("volatility", s.volatility);
    v("sharpe_ratio", s.sharpe_ratio);
    v("total_return", s.total_return);
    v("max_drawdown", s.max_drawdown);
    v("price_change_last_month", s.price_change_last_month);
    v("price_change_last_3_months", s.price_change_last_3_months);
    v("price_trend", s.price_trend);
    v("avg_volume", s.avg_volume);
    v("volume_change_pct", s.volume_change_pct);
    v("volume_trend", s.volume_trend);
    v("ticker_performance", s.ticker_performance);
    v("avg_pe_ratio", s.avg_pe_ratio);
    v("avg_market_cap", s.avg_market_cap);
    v("sectors", s.sectors);
    v("industries", s.industries);
    v("sector_concentration_hhi", s.sector_concentration_hhi);
    v("avg_correlation", s.avg_correlation);
    v("records_with_volume", s.records_with_volume);
    v("coverage_pct", s.coverage_pct);
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

inline Json::Value encode(std::int64_t x) { return Json::Value(static_cast<Json::Int64>(x)); }
inline Json::Value encode(int x) { return Json::Value(x); }
inline Json::Value encode(std::size_t x) { return Json::Value(static_cast<Json::UInt64>(x)); }
inline Json::Value encode(double x) { return Json::Value(x); }
inline Json::Value encode(bool x) { return Json::Value(x); }
inline Json::Value encode(const std::string& x) { return Json::Value(x); }
inline Json::Value encode(Trend t) { return Json::Value(std::string(to_string(t))); }
inline Json::Value encode(ResearchDrift d) { return Json::Value(std::string(to_string(d))); }
inline Json::Value encode(PriceTrend t) { return Json::Value(std::string(to_string(t))); }

inline Json::Value encode(const std::optional<double>& x) {
    return x ? Json::Value(*x) : Json::Value(Json::nullValue);
}

inline Json::Value encode(const CountList& xs) {
    Json::Value out(Json::arrayValue);
    for (const auto& [label, count] : xs) {
        Json::Value pair(Json::arrayValue);
        pair.append(Json::Value(label));
        pair.append(encode(count));
        out.append(std::move(pair));
    }
    return out;
}

inline Json::Value encode(const std::vector<std::string>& xs) {
    Json::Value out(Json::arrayValue);
    for (const auto& x : xs) out.append(Json::Value(x));
    return out;
}

template <typename Key>
Json::Value encode(const std::map<Key, std::int64_t>& xs) {
    Json::Value out(Json::objectValue);
    for (const auto& [key, count] : xs) {
        if constexpr (std::is_same_v<Key, std::string>) {
            out[key] = encode(count);
        } else {
            out[std::to_string(key)] = encode(count);
        }
    }
    return out;
}

struct FieldWriter {
    Json::Value& out;

    template <typename T>
    void operator()(const char* key, const T& value) { out[key] = encode(value); }
};

inline Json::Value encode(const TickerPerformance& p) {
    Json::Value out(Json::objectValue);
    FieldWriter w{out};
    visit_ticker(p, w);
    return out;
}

inline Json::Value encode(const std::map<std::string, TickerPerformance>& xs) {
    Json::Value out(Json::objectValue);
    for (const auto& [ticker, perf] : xs) out[ticker] = encode(perf);
    return out;
}

// ─── Decoding ─────────────────────────────────────────────────────────────────

inline bool decode(const Json::Value& j, std::int64_t& out) {
    if (!j.isInt64()) return false;
    out = j.asInt64();
    return true;
}

inline bool decode(const Json::Value& j, int& out) {
    if (!j.isInt()) return false;
    out = j.asInt();
    return true;
}

inline bool decode(const Json::Value& j, std::size_t& out) {
    if (!j.isUInt64()) return false;
    out = static_cast<std::size_t>(j.asUInt64());
    return true;
}

inline bool decode(const Json::Value& j, double& out) {
    if (!j.isNumeric() || j.isBool()) return false;
    out = j.asDouble();
    return true;
}

inline bool decode(const Json::Value& j, bool& out) {
    if (!j.isBool()) return false;
    out = j.asBool();
    return true;
}

inline bool decode(const Json::Value& j, std::string& out) {
    if (!j.isString()) return false;
    out = j.asString();
    return true;
}

template <typename Enum, typename Parse>
bool decode_label(const Json::Value& j, Enum& out, Parse parse) {
    if (!j.isString()) return false;
    const auto parsed = parse(j.asString());
    if (!parsed) return false;
    out = *parsed;
    return true;
}

inline bool decode(const Json::Value& j, Trend& out) { return decode_label(j, out, parse_trend); }
inline bool decode(const Json::Value& j, ResearchDrift& out) { return decode_label(j, out, parse_research_drift); }
inline bool decode(const Json::Value& j, PriceTrend& out) { return decode_label(j, out, parse_price_trend); }

inline bool decode(const Json::Value& j, std::optional<double>& out) {
    if (j.isNull()) {
        out.reset();
        return true;
    }
    double x = 0.0;
    if (!decode(j, x)) return false;
    out = x;
    return true;
}

inline bool decode(const Json::Value& j, CountList& out) {
    if (!j.isArray()) return false;
    CountList xs;
    for (const auto& pair : j) {
        if (!pair.isArray() || pair.size() != 2 || !pair[0].isString()) return false;
        std::int64_t count = 0;
        if (!decode(pair[1], count)) return false;
        xs.emplace_back(pair[0].asString(), count);
    }
    out = std::move(xs);
    return true;
}

inline bool decode(const Json::Value& j, std::vector<std::string>& out) {
    if (!j.isArray()) return false;
    std::vector<std::string> xs;
    for (const auto& x : j) {
        if (!x.isString()) return false;
        xs.push_back(x.asString());
    }
    out = std::move(xs);
    return true;
}

template <typename Key>
bool decode(const Json::Value& j, std::map<Key, std::int64_t>& out) {
    if (!j.isObject()) return false;
    std::map<Key, std::int64_t> xs;
    for (const auto& name : j.getMemberNames()) {
        std::int64_t count = 0;
        if (!decode(j[name], count)) return false;
        if constexpr (std::is_same_v<Key, std::string>) {
            xs.emplace(name, count);
        } else {
            Key key{};
            const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), key);
            if (ec != std::errc{} || ptr != name.data() + name.size()) return false;
            xs.emplace(key, count);
        }
    }
    out = std::move(xs);
    return true;
}

/// Strict reader: every visited key must be present with the right type.
struct FieldReader {
    const Json::Value& in;
    bool ok = true;

    template <typename T>
    void operator()(const char* key, T& value) {
        if (!ok) return;
        if (!in.isMember(key) || !decode(in[key], value)) ok = false;
    }
};

/// Overlay reader: absent keys keep their value; a mistyped key fails.
struct OverlayReader {
    const Json::Value& in;
    bool ok = true;

    template <typename T>
    void operator()(const char* key, T& value) {
        if (!ok || !in.isMember(key)) return;
        if (!decode(in[key], value)) ok = false;
    }
};

inline bool decode(const Json::Value& j, TickerPerformance& out) {
    if (!j.isObject()) return false;
    FieldReader r{j};
    visit_ticker(out, r);
    return r.ok;
}

inline bool decode(const Json::Value& j, std::map<std::string, TickerPerformance>& out) {
    if (!j.isObject()) return false;
    std::map<std::string, TickerPerformance> xs;
    for (const auto& name : j.getMemberNames()) {
        TickerPerformance perf;
        if (!decode(j[name], perf)) return false;
        xs.emplace(name, perf);
    }
    out = std::move(xs);
    return true;
}

}  // namespace hype::io::detail
