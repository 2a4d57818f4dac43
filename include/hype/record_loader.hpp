#pragma once

/// @file include/hype/record_loader.hpp
/// @brief Decode persisted evidence records from JSON arrays.
///
/// # Module: RecordLoader
///
/// ## Responsibility
/// Turn the JSON exported by the collectors into native records. This is
/// the only place serialized sub-structures (assignee lists, `source`
/// objects, ISO-8601 timestamps) are decoded.
///
/// ## Expected shape
/// A top-level array of objects. Field names follow the collectors:
///   - papers:  `paper_id, title, year, citation_count, abstract, venue, open_access_pdf`
///   - patents: `patent_id, patent_title, patent_abstract, patent_date, patent_year,
///               patent_type, patent_num_us_patents_cited,
///               patent_num_times_cited_by_us_patents, assignees[]`; each assignee has
///               `assignee_organization, assignee_individual_name_first,
///               assignee_individual_name_last, assignee_country`
///   - posts:   `post_id, title, selftext, score, num_comments, author, subreddit,
///               created_utc, post_type ("self" | "link")`
///   - news:    `article_id, title, description, content, published_at, author,
///               source { id, name }`
///   - tickers: `ticker, company_name, sector, industry, market_cap, pe_ratio`
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the document is unreadable or not
///   an array
/// - Skips individual malformed records rather than failing the load
/// - `null` and absent fields both decode to an empty optional
/// - Timestamps may be unix seconds or ISO-8601 strings

#include "hype/records.hpp"

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

namespace hype::io {

class RecordLoader {
public:
    [[nodiscard]] static std::optional<std::vector<PaperRecord>>
    load_papers(const std::string& path) noexcept;
    [[nodiscard]] static std::optional<std::vector<PatentRecord>>
    load_patents(const std::string& path) noexcept;
    [[nodiscard]] static std::optional<std::vector<SocialPost>>
    load_posts(const std::string& path) noexcept;
    [[nodiscard]] static std::optional<std::vector<NewsArticle>>
    load_articles(const std::string& path) noexcept;
    [[nodiscard]] static std::optional<std::vector<TickerInfo>>
    load_ticker_info(const std::string& path) noexcept;

    [[nodiscard]] static std::optional<std::vector<PaperRecord>>
    parse_papers(const Json::Value& doc) noexcept;
    [[nodiscard]] static std::optional<std::vector<PatentRecord>>
    parse_patents(const Json::Value& doc) noexcept;
    [[nodiscard]] static std::optional<std::vector<SocialPost>>
    parse_posts(const Json::Value& doc) noexcept;
    [[nodiscard]] static std::optional<std::vector<NewsArticle>>
    parse_articles(const Json::Value& doc) noexcept;
    [[nodiscard]] static std::optional<std::vector<TickerInfo>>
    parse_ticker_info(const Json::Value& doc) noexcept;

private:
    [[nodiscard]] static std::optional<Json::Value> read_document(const std::string& path) noexcept;
};

}  // namespace hype::io
