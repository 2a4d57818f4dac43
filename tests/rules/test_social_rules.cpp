#include <gtest/gtest.h>
#include "hype/rule_tables.hpp"

#include <string>

using namespace hype;
using namespace hype::rules;

namespace {

SocialSnapshot niche_community() {
    SocialSnapshot m;
    m.total_posts              = 20;
    m.unique_subreddits        = 2;
    m.top_subreddits           = {{"batteries", 12}, {"energy", 8}};
    m.avg_score_per_post       = 5.0;
    m.unique_authors           = 10;
    m.author_concentration_hhi = 0.4;
    return m;
}

SocialSnapshot fading_interest() {
    SocialSnapshot m;
    m.total_posts                 = 300;
    m.velocity_trend              = Trend::Decreasing;
    m.engagement_trend            = Trend::Decreasing;
    m.unique_subreddits           = 8;
    m.subreddit_concentration_hhi = 0.2;
    m.avg_score_per_post          = 50.0;
    m.unique_authors              = 100;
    m.author_concentration_hhi    = 0.05;
    m.growth_rate_early_vs_late   = -60.0;
    m.posts_first_3_months        = 10;
    m.posts_last_3_months         = 2;
    m.emerging_keywords           = {"recall"};
    m.declining_keywords          = {"breakthrough", "revolution", "disrupt"};
    return m;
}

SocialSnapshot mainstream() {
    SocialSnapshot m;
    m.total_posts        = 900;
    m.velocity_trend     = Trend::Stable;
    m.engagement_trend   = Trend::Stable;
    m.unique_subreddits  = 20;
    m.avg_score_per_post = 50.0;
    m.unique_authors     = 400;
    m.link_post_pct      = 45.0;
    m.coverage_pct       = 60.0;
    return m;
}

}  // namespace

TEST(SocialRules, NicheCommunityIsTrigger) {
    const SocialRuleEngine engine(social_rule_table());
    const auto v = engine.determine_phase(niche_community());
    EXPECT_EQ(v.phase, Phase::TechnologyTrigger);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_TRUE(v.fired(Phase::TechnologyTrigger, "evangelist_concentration"));
}

TEST(SocialRules, FadingInterestIsTrough) {
    const SocialRuleEngine engine(social_rule_table());
    const auto v = engine.determine_phase(fading_interest());
    EXPECT_EQ(v.phase, Phase::TroughDisillusionment);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_TRUE(v.fired(Phase::TroughDisillusionment, "quarter_collapse"));
    EXPECT_TRUE(v.fired(Phase::TroughDisillusionment, "declining_topics"));
    EXPECT_NEAR(v.score(Phase::SlopeEnlightenment), 0.40, 1e-12);
    EXPECT_DOUBLE_EQ(v.score(Phase::TechnologyTrigger), 0.0);
}

TEST(SocialRules, MainstreamIsPlateau) {
    const SocialRuleEngine engine(social_rule_table());
    const auto v = engine.determine_phase(mainstream());
    EXPECT_EQ(v.phase, Phase::PlateauProductivity);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_NEAR(v.score(Phase::SlopeEnlightenment), 0.60, 1e-12);
    EXPECT_NEAR(v.score(Phase::PeakInflatedExpectations), 0.30, 1e-12);
}

TEST(SocialRules, RationaleListsSubreddits) {
    const SocialRuleEngine engine(social_rule_table());
    const auto v = engine.determine_phase(niche_community());
    EXPECT_EQ(v.rationale.rfind("Reddit-based Phase: Technology Trigger", 0), 0u);
    EXPECT_NE(v.rationale.find("- Total posts: 20 (niche topic)"), std::string::npos);
    EXPECT_NE(v.rationale.find("Top subreddits:\n  - r/batteries: 12 posts\n  - r/energy: 8 posts"),
              std::string::npos);
}
