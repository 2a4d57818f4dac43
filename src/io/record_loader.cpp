/// @file src/io/record_loader.cpp
/// @brief RecordLoader implementation.

#include "hype/record_loader.hpp"
#include "hype/calendar.hpp"
#include "hype/serialization.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>

namespace hype::io {

namespace {

// ─── Field readers ────────────────────────────────────────────────────────────
//
// Each reader returns an empty optional for absent or null members and for
// members of an unexpected JSON type.

std::optional<std::string> opt_string(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (!v.isString()) return std::nullopt;
    return v.asString();
}

std::optional<std::int64_t> opt_int(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (v.isBool() || !v.isInt64()) return std::nullopt;
    return v.asInt64();
}

std::optional<int> opt_year(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (v.isString()) {
        const auto parsed = calendar::parse_date(v.asString() + "-01-01");
        if (!parsed) return std::nullopt;
        return calendar::year_of(*parsed);
    }
    if (v.isBool() || !v.isInt()) return std::nullopt;
    return v.asInt();
}

std::optional<double> opt_double(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (v.isBool() || !v.isNumeric()) return std::nullopt;
    const double x = v.asDouble();
    if (!std::isfinite(x)) return std::nullopt;
    return x;
}

/// Whole part of `x`, or `nullopt` when it does not fit an int64.
std::optional<std::int64_t> whole(double x) {
    if (!std::isfinite(x)) return std::nullopt;
    const double w = std::floor(x);
    if (w < -9.2e18 || w > 9.2e18) return std::nullopt;
    return static_cast<std::int64_t>(w);
}

/// Unix seconds, or an ISO-8601 string.
std::optional<std::int64_t> opt_timestamp(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (v.isString()) return calendar::parse_iso8601(v.asString());
    if (v.isBool() || !v.isNumeric()) return std::nullopt;
    return whole(v.asDouble());
}

/// Identifier that may be exported as a string or a number.
std::string id_of(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (v.isString()) return v.asString();
    if (v.isIntegral() && !v.isBool()) return std::to_string(v.asLargestInt());
    return {};
}

// ─── Record decoders ──────────────────────────────────────────────────────────

std::optional<PaperRecord> paper_from(const Json::Value& j) {
    if (!j.isObject()) return std::nullopt;
    return PaperRecord{
        .paper_id        = id_of(j, "paper_id"),
        .title           = opt_string(j, "title").value_or(""),
        .year            = opt_year(j, "year"),
        .citation_count  = opt_int(j, "citation_count"),
        .abstract        = opt_string(j, "abstract"),
        .venue           = opt_string(j, "venue"),
        .open_access_pdf = opt_string(j, "open_access_pdf"),
    };
}

Assignee assignee_from(const Json::Value& j) {
    return Assignee{
        .organization = opt_string(j, "assignee_organization"),
        .first_name   = opt_string(j, "assignee_individual_name_first"),
        .last_name    = opt_string(j, "assignee_individual_name_last"),
        .country      = opt_string(j, "assignee_country"),
    };
}

std::optional<PatentRecord> patent_from(const Json::Value& j) {
    if (!j.isObject()) return std::nullopt;
    PatentRecord p{
        .patent_id          = id_of(j, "patent_id"),
        .title              = opt_string(j, "patent_title").value_or(""),
        .abstract           = opt_string(j, "patent_abstract"),
        .date               = opt_string(j, "patent_date"),
        .year               = opt_year(j, "patent_year"),
        .type               = opt_string(j, "patent_type"),
        .backward_citations = opt_int(j, "patent_num_us_patents_cited"),
        .forward_citations  = opt_int(j, "patent_num_times_cited_by_us_patents"),
        .assignees          = {},
    };
    const Json::Value& assignees = j["assignees"];
    if (assignees.isArray()) {
        for (const auto& a : assignees) {
            if (a.isObject()) p.assignees.push_back(assignee_from(a));
        }
    }
    return p;
}

std::optional<SocialPost> post_from(const Json::Value& j) {
    if (!j.isObject()) return std::nullopt;
    SocialPost p{
        .post_id      = id_of(j, "post_id"),
        .title        = opt_string(j, "title").value_or(""),
        .body         = opt_string(j, "selftext"),
        .score        = opt_int(j, "score"),
        .num_comments = opt_int(j, "num_comments"),
        .author       = opt_string(j, "author"),
        .subreddit    = opt_string(j, "subreddit"),
        .created_utc  = opt_timestamp(j, "created_utc"),
        .is_self      = std::nullopt,
    };
    if (const auto type = opt_string(j, "post_type")) {
        if (*type == "self") p.is_self = true;
        else if (*type == "link") p.is_self = false;
    }
    return p;
}

std::optional<NewsArticle> article_from(const Json::Value& j) {
    if (!j.isObject()) return std::nullopt;
    NewsArticle a{
        .article_id    = id_of(j, "article_id"),
        .title         = opt_string(j, "title").value_or(""),
        .description   = opt_string(j, "description"),
        .content       = opt_string(j, "content"),
        .published_utc = opt_timestamp(j, "published_at"),
        .author        = opt_string(j, "author"),
        .source_name   = std::nullopt,
    };
    const Json::Value& source = j["source"];
    if (source.isObject()) a.source_name = opt_string(source, "name");
    else if (source.isString()) a.source_name = source.asString();
    return a;
}

std::optional<TickerInfo> ticker_from(const Json::Value& j) {
    if (!j.isObject()) return std::nullopt;
    auto ticker = opt_string(j, "ticker");
    if (!ticker || ticker->empty()) return std::nullopt;

    std::optional<std::int64_t> cap = opt_int(j, "market_cap");
    if (!cap) {
        if (const auto d = opt_double(j, "market_cap")) cap = whole(*d);
    }
    return TickerInfo{
        .ticker       = std::move(*ticker),
        .company_name = opt_string(j, "company_name"),
        .sector       = opt_string(j, "sector"),
        .industry     = opt_string(j, "industry"),
        .market_cap   = cap,
        .pe_ratio     = opt_double(j, "pe_ratio"),
    };
}

/// Decode every element of a top-level array, skipping the malformed ones.
template <typename Record, typename Decode>
std::optional<std::vector<Record>> parse_array(const Json::Value& doc, Decode decode) noexcept {
    try {
        if (!doc.isArray()) return std::nullopt;
        std::vector<Record> out;
        out.reserve(doc.size());
        for (const auto& item : doc) {
            if (auto r = decode(item)) out.push_back(std::move(*r));
        }
        return out;
    } catch (const Json::Exception&) {
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // anonymous namespace

// ─── RecordLoader ─────────────────────────────────────────────────────────────

std::optional<Json::Value> RecordLoader::read_document(const std::string& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_json(ss.str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<PaperRecord>> RecordLoader::parse_papers(const Json::Value& doc) noexcept {
    return parse_array<PaperRecord>(doc, paper_from);
}

std::optional<std::vector<PatentRecord>> RecordLoader::parse_patents(const Json::Value& doc) noexcept {
    return parse_array<PatentRecord>(doc, patent_from);
}

std::optional<std::vector<SocialPost>> RecordLoader::parse_posts(const Json::Value& doc) noexcept {
    return parse_array<SocialPost>(doc, post_from);
}

std::optional<std::vector<NewsArticle>> RecordLoader::parse_articles(const Json::Value& doc) noexcept {
    return parse_array<NewsArticle>(doc, article_from);
}

std::optional<std::vector<TickerInfo>> RecordLoader::parse_ticker_info(const Json::Value& doc) noexcept {
    return parse_array<TickerInfo>(doc, ticker_from);
}

std::optional<std::vector<PaperRecord>> RecordLoader::load_papers(const std::string& path) noexcept {
    const auto doc = read_document(path);
    if (!doc) return std::nullopt;
    return parse_papers(*doc);
}

std::optional<std::vector<PatentRecord>> RecordLoader::load_patents(const std::string& path) noexcept {
    const auto doc = read_document(path);
    if (!doc) return std::nullopt;
    return parse_patents(*doc);
}

std::optional<std::vector<SocialPost>> RecordLoader::load_posts(const std::string& path) noexcept {
    const auto doc = read_document(path);
    if (!doc) return std::nullopt;
    return parse_posts(*doc);
}

std::optional<std::vector<NewsArticle>> RecordLoader::load_articles(const std::string& path) noexcept {
    const auto doc = read_document(path);
    if (!doc) return std::nullopt;
    return parse_articles(*doc);
}

std::optional<std::vector<TickerInfo>> RecordLoader::load_ticker_info(const std::string& path) noexcept {
    const auto doc = read_document(path);
    if (!doc) return std::nullopt;
    return parse_ticker_info(*doc);
}

}  // namespace hype::io
