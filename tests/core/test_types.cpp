#include <gtest/gtest.h>
#include "hype/types.hpp"

#include <set>
#include <string>
#include <string_view>

using namespace hype;

// ─── Phase labels ─────────────────────────────────────────────────────────────

TEST(Types_Phase, IdsRoundTripThroughParse) {
    for (const Phase p : ALL_PHASES) {
        const auto parsed = parse_phase(to_string(p));
        ASSERT_TRUE(parsed.has_value()) << to_string(p);
        EXPECT_EQ(*parsed, p);
    }
    EXPECT_FALSE(parse_phase("Peak of Inflated Expectations").has_value());
    EXPECT_FALSE(parse_phase("").has_value());
}

TEST(Types_Phase, DisplayNames) {
    EXPECT_EQ(to_string(Phase::PeakInflatedExpectations), "peak_inflated_expectations");
    EXPECT_EQ(display_name(Phase::PeakInflatedExpectations), "Peak of Inflated Expectations");
    EXPECT_EQ(display_name(Phase::TroughDisillusionment), "Trough of Disillusionment");
}

TEST(Types_Phase, DescriptionsAreDistinctAndNonEmpty) {
    std::set<std::string_view> seen;
    for (const Phase p : ALL_PHASES) {
        EXPECT_FALSE(description(p).empty());
        seen.insert(description(p));
    }
    EXPECT_EQ(seen.size(), PHASE_COUNT);
    EXPECT_NE(description(Phase::PlateauProductivity).find("Mainstream adoption"),
              std::string_view::npos);
}

// ─── Other labels ─────────────────────────────────────────────────────────────

TEST(Types_Labels, TrendRoundTrip) {
    for (const Trend t : {Trend::Increasing, Trend::Decreasing, Trend::Stable,
                          Trend::PeakReached, Trend::InsufficientData}) {
        EXPECT_EQ(parse_trend(to_string(t)), t);
    }
    EXPECT_FALSE(parse_trend("rising").has_value());
}

TEST(Types_Labels, DriftAndPriceTrendRoundTrip) {
    for (const ResearchDrift d : {ResearchDrift::TowardApplied, ResearchDrift::TowardBasic,
                                  ResearchDrift::Stable}) {
        EXPECT_EQ(parse_research_drift(to_string(d)), d);
    }
    for (const PriceTrend t : {PriceTrend::Bullish, PriceTrend::Bearish, PriceTrend::Sideways}) {
        EXPECT_EQ(parse_price_trend(to_string(t)), t);
    }
}

// ─── PhaseVerdict ─────────────────────────────────────────────────────────────

TEST(Types_Verdict, FiredLooksUpIndicatorIds) {
    PhaseVerdict v;
    v.indicators[index_of(Phase::TroughDisillusionment)].push_back({"declining_velocity", 0.35});
    EXPECT_TRUE(v.fired(Phase::TroughDisillusionment, "declining_velocity"));
    EXPECT_FALSE(v.fired(Phase::PeakInflatedExpectations, "declining_velocity"));
    EXPECT_FALSE(v.fired(Phase::TroughDisillusionment, "recent_peak"));
}
