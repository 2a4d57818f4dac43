#pragma once

/// @file tests/fixtures.hpp
/// @brief Record corpora shared by the extractor, rule and integration tests.

#include "hype/calendar.hpp"
#include "hype/records.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hype::test {

inline std::int64_t at(const char* date) {
    return *calendar::parse_date(date);
}

/// 150 papers, 2018–2025, 90% basic research, 5 citations each, academic
/// venue. Reference date 2026-06-01.
inline std::vector<PaperRecord> trigger_papers() {
    const int counts[] = {5, 8, 10, 14, 18, 24, 31, 40};
    std::vector<PaperRecord> out;
    int i = 0;
    for (int y = 0; y < 8; ++y) {
        for (int k = 0; k < counts[y]; ++k, ++i) {
            PaperRecord p{
                .paper_id       = "p" + std::to_string(i),
                .title          = "Graphene study",
                .year           = 2018 + y,
                .citation_count = 5,
                .abstract       = "fundamental mechanism of molecular pathway",
                .venue          = "Journal of Physics",
            };
            if (i % 10 == 0) {
                p.title = "Observations on graphene sheets";
                p.abstract.reset();
            }
            out.push_back(std::move(p));
        }
    }
    return out;
}

inline Assignee org(const char* name, const char* country) {
    return Assignee{.organization = name, .country = country};
}

/// `n` utility patents granted in `year` by `assignee`.
inline std::vector<PatentRecord> patents_in(int year, int n, const Assignee& assignee,
                                            std::int64_t forward = 1, std::int64_t backward = 4) {
    std::vector<PatentRecord> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(PatentRecord{
            .patent_id          = std::to_string(year) + "-" + std::to_string(i),
            .title              = "Method for storing energy",
            .abstract           = "A battery electrode",
            .date               = std::nullopt,
            .year               = year,
            .type               = "utility",
            .backward_citations = backward,
            .forward_citations  = forward,
            .assignees          = {assignee},
        });
    }
    return out;
}

inline SocialPost post(std::int64_t when, std::int64_t score, const char* subreddit,
                       const char* author, bool is_self = true) {
    return SocialPost{
        .post_id      = std::to_string(when),
        .title        = "Thoughts on solid state batteries",
        .body         = is_self ? std::optional<std::string>("Long discussion") : std::nullopt,
        .score        = score,
        .num_comments = score / 2,
        .author       = author,
        .subreddit    = subreddit,
        .created_utc  = when,
        .is_self      = is_self,
    };
}

inline NewsArticle article(std::int64_t when, const char* source,
                           std::optional<std::string> author) {
    return NewsArticle{
        .article_id    = std::to_string(when),
        .title         = "Battery startup raises funding",
        .description   = "A new round for the battery maker",
        .content       = std::nullopt,
        .published_utc = when,
        .author        = std::move(author),
        .source_name   = source,
    };
}

/// One ticker over 100 trading days: a rally to 120, a 45% collapse to 66,
/// then a partial recovery to 90, with volume halving midway.
inline std::vector<PriceBar> trough_prices() {
    std::vector<PriceBar> out;
    const std::int64_t start = at("2024-01-01");
    for (int i = 0; i < 100; ++i) {
        double price = 0.0;
        if (i <= 37) {
            price = 100.0 + 20.0 * i / 37.0;
        } else if (i <= 70) {
            price = 120.0 - 54.0 * (i - 37) / 33.0;
        } else {
            price = 66.0 + 24.0 * (i - 70) / 29.0;
        }
        out.push_back(PriceBar{
            .ticker    = "SSB",
            .date      = calendar::format_date(start + i * 86'400),
            .open      = price,
            .high      = price * 1.01,
            .low       = price * 0.99,
            .close     = price,
            .adj_close = price,
            .volume    = i < 50 ? 2'000'000 : 1'000'000,
        });
    }
    return out;
}

}  // namespace hype::test
