#pragma once

/// @file include/hype/records.hpp
/// @brief Evidence records consumed by the metrics extractors.
///
/// # Module: Records
///
/// ## Responsibility
/// Plain value types for the five evidence streams. Every attribute the
/// upstream collectors may omit is a `std::optional`; extractors treat an
/// empty optional as missing and never substitute zero in a ratio.
///
/// ## Guarantees
/// - Timestamps are UTC unix seconds; dates are `YYYY-MM-DD` strings
/// - Records are read-only inside the core
///
/// ## NOT Responsible For
/// - Decoding persisted records (see `hype/record_loader.hpp`)

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hype {

// ─── Scientific publications ──────────────────────────────────────────────────

struct PaperRecord {
    std::string                 paper_id;
    std::string                 title;
    std::optional<int>          year;
    std::optional<std::int64_t> citation_count;
    std::optional<std::string>  abstract;
    std::optional<std::string>  venue;
    std::optional<std::string>  open_access_pdf;   ///< URL
};

// ─── Patents ──────────────────────────────────────────────────────────────────

struct Assignee {
    std::optional<std::string> organization;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> country;
};

struct PatentRecord {
    std::string                 patent_id;
    std::string                 title;
    std::optional<std::string>  abstract;
    std::optional<std::string>  date;               ///< Grant date, YYYY-MM-DD
    std::optional<int>          year;               ///< Grant year
    std::optional<std::string>  type;               ///< "utility", "design", ...
    std::optional<std::int64_t> backward_citations; ///< US patents this one cites
    std::optional<std::int64_t> forward_citations;  ///< Times cited by US patents
    std::vector<Assignee>       assignees;
};

// ─── Social discussion ────────────────────────────────────────────────────────

struct SocialPost {
    std::string                 post_id;
    std::string                 title;
    std::optional<std::string>  body;
    std::optional<std::int64_t> score;
    std::optional<std::int64_t> num_comments;
    std::optional<std::string>  author;
    std::optional<std::string>  subreddit;
    std::optional<std::int64_t> created_utc;
    std::optional<bool>         is_self;
};

// ─── News coverage ────────────────────────────────────────────────────────────

struct NewsArticle {
    std::string                 article_id;
    std::string                 title;
    std::optional<std::string>  description;
    std::optional<std::string>  content;
    std::optional<std::int64_t> published_utc;
    std::optional<std::string>  author;
    std::optional<std::string>  source_name;
};

// ─── Market data ──────────────────────────────────────────────────────────────

/// One daily price row for one ticker.
struct PriceBar {
    std::string                 ticker;
    std::string                 date;   ///< YYYY-MM-DD
    std::optional<double>       open;
    std::optional<double>       high;
    std::optional<double>       low;
    std::optional<double>       close;
    std::optional<double>       adj_close;
    std::optional<std::int64_t> volume;
};

/// Company fundamentals for one ticker.
struct TickerInfo {
    std::string                 ticker;
    std::optional<std::string>  company_name;
    std::optional<std::string>  sector;
    std::optional<std::string>  industry;
    std::optional<std::int64_t> market_cap;
    std::optional<double>       pe_ratio;
};

}  // namespace hype
