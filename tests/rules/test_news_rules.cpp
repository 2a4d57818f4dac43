#include <gtest/gtest.h>
#include "hype/rule_tables.hpp"

#include <string>

using namespace hype;
using namespace hype::rules;

namespace {

NewsSnapshot trade_press_only() {
    NewsSnapshot m;
    m.total_articles              = 12;
    m.unique_sources              = 3;
    m.top_sources                 = {{"Reuters", 6}, {"Wired", 4}, {"unknown", 2}};
    m.source_concentration_hhi    = 56.0 / 144.0;
    m.unique_authors              = 2;
    m.articles_without_author_pct = 100.0 / 3.0;
    return m;
}

NewsSnapshot steady_coverage() {
    NewsSnapshot m;
    m.total_articles           = 100;
    m.velocity_trend           = Trend::Stable;
    m.unique_sources           = 10;
    m.source_concentration_hhi = 0.15;
    m.unique_authors           = 40;
    m.emerging_keywords        = {"grid"};
    m.declining_keywords       = {"prototype"};
    m.coverage_pct             = 65.0;
    return m;
}

}  // namespace

TEST(NewsRules, TradePressIsTrigger) {
    const NewsRuleEngine engine(news_rule_table());
    const auto v = engine.determine_phase(trade_press_only());
    EXPECT_EQ(v.phase, Phase::TechnologyTrigger);
    EXPECT_NEAR(v.confidence, 0.90, 1e-12);
    EXPECT_FALSE(v.fired(Phase::TechnologyTrigger, "press_releases"));
    EXPECT_NEAR(v.score(Phase::TroughDisillusionment), 0.10, 1e-12);
}

TEST(NewsRules, PressReleasesRaiseTrigger) {
    auto m = trade_press_only();
    m.articles_without_author_pct = 60.0;
    const NewsRuleEngine engine(news_rule_table());
    EXPECT_NEAR(engine.determine_phase(m).confidence, 1.0, 1e-12);
}

TEST(NewsRules, SteadyCoverageIsSlope) {
    const NewsRuleEngine engine(news_rule_table());
    const auto v = engine.determine_phase(steady_coverage());
    EXPECT_EQ(v.phase, Phase::SlopeEnlightenment);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_NEAR(v.score(Phase::PlateauProductivity), 0.25, 1e-12);
    EXPECT_NEAR(v.score(Phase::PeakInflatedExpectations), 0.20, 1e-12);
    EXPECT_DOUBLE_EQ(v.score(Phase::TechnologyTrigger), 0.0);
}

TEST(NewsRules, ConfigurableSourceBand) {
    NewsRuleThresholds t;
    t.high_source_count = 8;
    const NewsRuleEngine engine(news_rule_table(t));
    const auto v = engine.determine_phase(steady_coverage());
    EXPECT_FALSE(v.fired(Phase::SlopeEnlightenment, "moderate_sources"));
    EXPECT_TRUE(v.fired(Phase::PlateauProductivity, "mainstream_sources"));
}

TEST(NewsRules, RationaleListsSources) {
    const NewsRuleEngine engine(news_rule_table());
    const auto v = engine.determine_phase(trade_press_only());
    EXPECT_EQ(v.rationale.rfind("News-based Phase: Technology Trigger", 0), 0u);
    EXPECT_NE(v.rationale.find("- Source HHI: 0.389 (concentrated)"), std::string::npos);
    EXPECT_NE(v.rationale.find("Top news sources:\n  - Reuters: 6 articles\n  - Wired: 4 articles"),
              std::string::npos);
}
