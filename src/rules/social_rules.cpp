/// @file src/rules/social_rules.cpp
/// @brief Discussion-stream indicator table.

#include "hype/rule_tables.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace hype::rules {

namespace {

std::vector<std::string> social_key_metrics(Phase phase, const SocialSnapshot& m) {
    switch (phase) {
        case Phase::TechnologyTrigger:
            return {
                fmt::format("- Total posts: {} (niche topic)", m.total_posts),
                fmt::format("- Unique subreddits: {} (concentrated)", m.unique_subreddits),
                fmt::format("- Avg score: {:.1f} (low mainstream interest)", m.avg_score_per_post),
                fmt::format("- Unique authors: {} (early community)", m.unique_authors),
            };
        case Phase::PeakInflatedExpectations:
            return {
                fmt::format("- Velocity trend: {} (high activity)", to_string(m.velocity_trend)),
                fmt::format("- Avg score: {:.1f} (high engagement)", m.avg_score_per_post),
                fmt::format("- Highly engaged posts: {}", m.highly_engaged_count),
                fmt::format("- Unique subreddits: {} (spreading)", m.unique_subreddits),
                fmt::format("- Engagement trend: {}", to_string(m.engagement_trend)),
            };
        case Phase::TroughDisillusionment:
            return {
                fmt::format("- Velocity trend: {} (declining)", to_string(m.velocity_trend)),
                fmt::format("- Engagement trend: {}", to_string(m.engagement_trend)),
                fmt::format("- Growth rate: {:.1f}%", m.growth_rate_early_vs_late),
                fmt::format("- Declining keywords: {}", m.declining_keywords.size()),
            };
        case Phase::SlopeEnlightenment:
            return {
                fmt::format("- Velocity trend: {} (stable)", to_string(m.velocity_trend)),
                fmt::format("- Engagement trend: {}", to_string(m.engagement_trend)),
                fmt::format("- Unique subreddits: {}", m.unique_subreddits),
                fmt::format("- Link posts: {:.1f}% (practical focus)", m.link_post_pct),
            };
        case Phase::PlateauProductivity:
            return {
                fmt::format("- Total posts: {} (mature topic)", m.total_posts),
                fmt::format("- Velocity trend: {}", to_string(m.velocity_trend)),
                fmt::format("- Unique subreddits: {} (mainstream)", m.unique_subreddits),
                fmt::format("- Link posts: {:.1f}%", m.link_post_pct),
            };
    }
    return {};
}

rationale::ContextBlock top_subreddits(const SocialSnapshot& m) {
    rationale::ContextBlock block{.heading = "Top subreddits:", .lines = {}};
    const auto n = std::min(m.top_subreddits.size(), constants::RATIONALE_CONTEXT_ROWS);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& [name, count] = m.top_subreddits[i];
        block.lines.push_back(fmt::format("  - r/{}: {} posts", name, count));
    }
    return block;
}

}  // namespace

RuleTable<SocialSnapshot> social_rule_table(const SocialRuleThresholds& t) {
    RuleTable<SocialSnapshot> table;
    table.headings = {
        .title      = "Reddit-based Phase",
        .indicators = "Key Reddit indicators:",
        .scores     = "Phase scores (Reddit-based):",
    };

    // ── Technology Trigger ──
    table.indicators[index_of(Phase::TechnologyTrigger)] = {
        {"few_posts", 0.25, [t](const SocialSnapshot& m) {
             return m.total_posts < t.low_post_count;
         }},
        {"niche_communities", 0.25, [t](const SocialSnapshot& m) {
             return m.unique_subreddits < t.low_subreddit_count;
         }},
        {"low_engagement", 0.20, [t](const SocialSnapshot& m) {
             return m.avg_score_per_post < t.low_avg_score;
         }},
        {"few_authors", 0.15, [t](const SocialSnapshot& m) {
             return m.unique_authors < t.few_authors;
         }},
        {"evangelist_concentration", 0.15, [t](const SocialSnapshot& m) {
             return m.author_concentration_hhi > t.high_hhi;
         }},
    };

    // ── Peak of Inflated Expectations ──
    table.indicators[index_of(Phase::PeakInflatedExpectations)] = {
        {"high_velocity", 0.25, [](const SocialSnapshot& m) {
             return m.velocity_trend == Trend::Increasing || m.velocity_trend == Trend::PeakReached;
         }},
        {"high_engagement", 0.20, [t](const SocialSnapshot& m) {
             return m.avg_score_per_post > t.high_avg_score;
         }},
        {"viral_posts", 0.15, [t](const SocialSnapshot& m) {
             return m.highly_engaged_count > t.many_highly_engaged;
         }},
        {"spreading_communities", 0.15, [t](const SocialSnapshot& m) {
             return m.unique_subreddits > t.low_subreddit_count;
         }},
        {"diverse_discussion", 0.15, [t](const SocialSnapshot& m) {
             return m.subreddit_concentration_hhi < t.low_hhi;
         }},
        {"rising_engagement", 0.10, [](const SocialSnapshot& m) {
             return m.engagement_trend == Trend::Increasing;
         }},
    };

    // ── Trough of Disillusionment ──
    table.indicators[index_of(Phase::TroughDisillusionment)] = {
        {"declining_velocity", 0.30, [](const SocialSnapshot& m) {
             return m.velocity_trend == Trend::Decreasing;
         }},
        {"declining_engagement", 0.25, [](const SocialSnapshot& m) {
             return m.engagement_trend == Trend::Decreasing;
         }},
        {"negative_growth", 0.20, [t](const SocialSnapshot& m) {
             return m.growth_rate_early_vs_late < t.decline_threshold;
         }},
        {"quarter_collapse", 0.15, [t](const SocialSnapshot& m) {
             return static_cast<double>(m.posts_last_3_months) <
                    static_cast<double>(m.posts_first_3_months) * t.quarter_collapse_ratio;
         }},
        {"declining_topics", 0.10, [](const SocialSnapshot& m) {
             return m.declining_keywords.size() > m.emerging_keywords.size();
         }},
    };

    // ── Slope of Enlightenment ──
    table.indicators[index_of(Phase::SlopeEnlightenment)] = {
        {"stable_velocity", 0.25, [](const SocialSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"stable_engagement", 0.20, [](const SocialSnapshot& m) {
             return m.engagement_trend == Trend::Stable;
         }},
        {"moderate_spread", 0.20, [t](const SocialSnapshot& m) {
             return m.unique_subreddits >= t.low_subreddit_count &&
                    m.unique_subreddits <= t.high_subreddit_count;
         }},
        {"practical_links", 0.15, [t](const SocialSnapshot& m) {
             return m.link_post_pct >= t.link_share_low && m.link_post_pct <= t.link_share_high;
         }},
        {"established_communities", 0.10, [t](const SocialSnapshot& m) {
             return m.subreddit_concentration_hhi >= t.low_hhi &&
                    m.subreddit_concentration_hhi <= t.high_hhi;
         }},
        {"topic_turnover", 0.10, [](const SocialSnapshot& m) {
             return !m.emerging_keywords.empty() && !m.declining_keywords.empty();
         }},
    };

    // ── Plateau of Productivity ──
    table.indicators[index_of(Phase::PlateauProductivity)] = {
        {"mature_volume", 0.25, [t](const SocialSnapshot& m) {
             return m.total_posts > t.high_post_count;
         }},
        {"stable_velocity", 0.20, [](const SocialSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"mainstream_spread", 0.20, [t](const SocialSnapshot& m) {
             return m.unique_subreddits > t.high_subreddit_count;
         }},
        {"stable_engagement", 0.15, [](const SocialSnapshot& m) {
             return m.engagement_trend == Trend::Stable;
         }},
        {"resource_links", 0.10, [t](const SocialSnapshot& m) {
             return m.link_post_pct > t.mainstream_link_share;
         }},
        {"good_coverage", 0.10, [t](const SocialSnapshot& m) {
             return m.coverage_pct > t.good_coverage;
         }},
    };

    table.key_metrics = social_key_metrics;
    table.context     = top_subreddits;
    return table;
}

}  // namespace hype::rules
