#include <gtest/gtest.h>
#include "hype/extractors.hpp"
#include "hype/rule_tables.hpp"
#include "hype/serialization.hpp"

#include "../fixtures.hpp"

#include <string>
#include <vector>

using namespace hype;
using namespace hype::io;
using hype::test::at;

namespace {

PaperSnapshot paper_snapshot() {
    return metrics::PaperExtractor(at("2026-06-01")).extract(test::trigger_papers());
}

FinanceSnapshot finance_snapshot() {
    const std::vector<TickerInfo> info{
        {.ticker = "SSB", .sector = "Energy", .industry = "Batteries",
         .market_cap = 2'500'000'000, .pe_ratio = 35.5},
    };
    return metrics::FinanceExtractor().extract(test::trough_prices(), info);
}

PatentSnapshot patent_snapshot() {
    std::vector<PatentRecord> patents;
    const auto add = [&](std::vector<PatentRecord> more) {
        patents.insert(patents.end(), more.begin(), more.end());
    };
    add(test::patents_in(2019, 3, test::org("Stanford University", "US")));
    add(test::patents_in(2021, 5, test::org("Samsung Electronics Co., Ltd.", "KR"), 7, 2));
    add(test::patents_in(2023, 6, test::org("Toyota Motor Corp", "JP")));
    patents.back().forward_citations.reset();
    return metrics::PatentExtractor(at("2025-01-01")).extract(patents);
}

SocialSnapshot social_snapshot() {
    std::vector<SocialPost> posts;
    const char* const months[] = {"2024-01-10", "2024-02-10", "2024-03-10",
                                  "2024-04-10", "2024-05-10", "2024-06-10"};
    for (int m = 0; m < 6; ++m) {
        for (int k = 0; k <= m; ++k) {
            posts.push_back(test::post(at(months[m]) + k * 3600, 10 * (k + 1),
                                       k % 2 == 0 ? "batteries" : "energy",
                                       m < 3 ? "alice" : "bob", k % 3 != 0));
        }
    }
    return metrics::SocialExtractor(at("2024-07-01")).extract(posts);
}

NewsSnapshot news_snapshot() {
    std::vector<NewsArticle> articles;
    const char* const dates[] = {"2024-01-05", "2024-01-15", "2024-02-05", "2024-02-15",
                                 "2024-03-05", "2024-03-15", "2024-04-05", "2024-04-15",
                                 "2024-05-05", "2024-05-15", "2024-06-05", "2024-06-15"};
    for (int i = 0; i < 12; ++i) {
        articles.push_back(test::article(at(dates[i]), i < 6 ? "Reuters" : "Wired",
                                         i % 3 == 0 ? std::nullopt
                                                    : std::optional<std::string>("Jane Doe")));
    }
    return metrics::NewsExtractor(at("2024-07-01")).extract(articles);
}

template <typename T>
std::optional<T> through_text(const Json::Value& v) {
    const auto parsed = parse_json(write_json(v));
    if (!parsed) return std::nullopt;
    return from_json<T>(*parsed);
}

}  // namespace

// ─── Snapshot shape ───────────────────────────────────────────────────────────

TEST(Serialization, PaperSnapshotShape) {
    const Json::Value j = to_json(paper_snapshot());
    EXPECT_EQ(j["total_papers"].asInt64(), 150);
    EXPECT_EQ(j["velocity_trend"].asString(), "increasing");
    EXPECT_EQ(j["research_type_trend"].asString(), "stable");
    ASSERT_TRUE(j["publication_velocity"].isObject());
    EXPECT_EQ(j["publication_velocity"]["2025"].asInt64(), 40);
    ASSERT_TRUE(j["top_keywords"].isArray());
    EXPECT_EQ(j["top_keywords"][0][0].asString(), "graphene");
    EXPECT_EQ(j["top_keywords"][0][1].asInt64(), 150);
}

TEST(Serialization, FinanceOptionalsAndPerformance) {
    auto s = finance_snapshot();
    s.avg_correlation.reset();
    const Json::Value j = to_json(s);
    EXPECT_TRUE(j["avg_correlation"].isNull());
    EXPECT_DOUBLE_EQ(j["avg_pe_ratio"].asDouble(), 35.5);
    EXPECT_EQ(j["price_trend"].asString(), "bearish");
    ASSERT_TRUE(j["ticker_performance"].isObject());
    EXPECT_EQ(j["ticker_performance"]["SSB"]["num_records"].asInt64(), 100);
}

// ─── Round trips through text ─────────────────────────────────────────────────

TEST(Serialization, PaperSnapshotSurvivesText) {
    const auto s = paper_snapshot();
    const auto back = through_text<PaperSnapshot>(to_json(s));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, s);
}

TEST(Serialization, FinanceSnapshotSurvivesText) {
    const auto s = finance_snapshot();
    const auto back = through_text<FinanceSnapshot>(to_json(s));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, s);
}

TEST(Serialization, PatentSnapshotSurvivesText) {
    const auto s = patent_snapshot();
    ASSERT_FALSE(s.new_entrants_by_year.empty());
    ASSERT_FALSE(s.country_distribution.empty());
    const auto back = through_text<PatentSnapshot>(to_json(s));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->new_entrants_by_year, s.new_entrants_by_year);
    EXPECT_EQ(back->country_distribution, s.country_distribution);
    EXPECT_EQ(*back, s);
}

TEST(Serialization, SocialSnapshotSurvivesText) {
    const auto s = social_snapshot();
    ASSERT_FALSE(s.post_velocity.empty());
    const auto back = through_text<SocialSnapshot>(to_json(s));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, s);
}

TEST(Serialization, NewsSnapshotSurvivesText) {
    const auto s = news_snapshot();
    ASSERT_FALSE(s.top_sources.empty());
    const auto back = through_text<NewsSnapshot>(to_json(s));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, s);
}

TEST(Serialization, VerdictSurvivesText) {
    const rules::PaperRuleEngine engine(rules::paper_rule_table());
    const PhaseVerdict v = engine.determine_phase(paper_snapshot());
    const auto back = through_text<PhaseVerdict>(to_json(v));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, v);
}

TEST(Serialization, VerdictShape) {
    PhaseVerdict v;
    v.phase = Phase::SlopeEnlightenment;
    v.confidence = 0.55;
    v.scores[index_of(Phase::SlopeEnlightenment)] = 0.55;
    v.indicators[index_of(Phase::SlopeEnlightenment)] = {{"stable_volume", 0.20}, {"calming_volatility", 0.15}};
    v.rationale = "text";

    const Json::Value j = to_json(v);
    EXPECT_EQ(j["phase"].asString(), "slope_enlightenment");
    EXPECT_DOUBLE_EQ(j["scores"]["slope_enlightenment"].asDouble(), 0.55);
    EXPECT_DOUBLE_EQ(j["scores"]["technology_trigger"].asDouble(), 0.0);
    ASSERT_EQ(j["indicators"]["slope_enlightenment"].size(), 2u);
    EXPECT_EQ(j["indicators"]["slope_enlightenment"][1]["id"].asString(), "calming_volatility");
    EXPECT_TRUE(j["indicators"]["plateau_productivity"].isArray());
}

// ─── Rejections ───────────────────────────────────────────────────────────────

TEST(Serialization, MissingKeyRejected) {
    Json::Value j = to_json(paper_snapshot());
    j.removeMember("coverage_pct");
    EXPECT_FALSE(from_json<PaperSnapshot>(j).has_value());
}

TEST(Serialization, MistypedKeyRejected) {
    Json::Value j = to_json(paper_snapshot());
    j["total_papers"] = "150";
    EXPECT_FALSE(from_json<PaperSnapshot>(j).has_value());

    j = to_json(paper_snapshot());
    j["velocity_trend"] = "sideways";
    EXPECT_FALSE(from_json<PaperSnapshot>(j).has_value());

    j = to_json(paper_snapshot());
    j["publication_velocity"]["20x5"] = 3;
    EXPECT_FALSE(from_json<PaperSnapshot>(j).has_value());
}

TEST(Serialization, NonObjectRejected) {
    EXPECT_FALSE(from_json<NewsSnapshot>(Json::Value(Json::arrayValue)).has_value());
    EXPECT_FALSE(from_json<PhaseVerdict>(Json::Value("trough")).has_value());
}

TEST(Serialization, UnknownPhaseRejected) {
    Json::Value j = to_json(PhaseVerdict{});
    j["phase"] = "hype";
    EXPECT_FALSE(from_json<PhaseVerdict>(j).has_value());
}

// ─── Text ─────────────────────────────────────────────────────────────────────

TEST(Serialization, CompactWriterHasNoNewlines) {
    Json::Value j(Json::objectValue);
    j["a"] = 1;
    j["b"] = "two";
    const std::string text = write_json(j, false);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(*parse_json(text), j);
}

TEST(Serialization, ParseRejectsSyntaxErrors) {
    EXPECT_FALSE(parse_json("{\"a\": ").has_value());
    EXPECT_FALSE(parse_json("not json").has_value());
    EXPECT_TRUE(parse_json("[]").has_value());
}
