#include <gtest/gtest.h>
#include "hype/rule_tables.hpp"

#include <string>

using namespace hype;
using namespace hype::rules;

namespace {

FinanceSnapshot collapse() {
    FinanceSnapshot m;
    m.tickers_analyzed           = {"SSB"};
    m.price_trend                = PriceTrend::Bearish;
    m.max_drawdown               = 45.0;
    m.price_change_last_3_months = -25.0;
    m.volume_trend               = Trend::Decreasing;
    m.sharpe_ratio               = -1.2;
    m.volatility                 = 2.0;
    m.ticker_performance["SSB"]  = TickerPerformance{
        .total_return_pct     = -10.0,
        .avg_daily_return_pct = -0.1,
        .volatility_pct       = 2.5,
        .num_records          = 100,
        .latest_price         = 90.0,
    };
    return m;
}

FinanceSnapshot frenzy() {
    FinanceSnapshot m;
    m.tickers_analyzed           = {"ION"};
    m.price_trend                = PriceTrend::Bullish;
    m.price_change_last_3_months = 40.0;
    m.volume_trend               = Trend::Increasing;
    m.volatility                 = 4.0;
    m.total_return               = 80.0;
    m.avg_pe_ratio               = 60.0;
    return m;
}

FinanceSnapshot utility_stock() {
    FinanceSnapshot m;
    m.tickers_analyzed = {"A", "B", "C", "D"};
    m.price_trend      = PriceTrend::Sideways;
    m.volatility       = 0.5;
    m.volume_trend     = Trend::Stable;
    m.avg_pe_ratio     = 20.0;
    m.sharpe_ratio     = 1.5;
    m.sectors          = {"Energy", "Utilities"};
    return m;
}

}  // namespace

TEST(FinanceRules, CollapseIsTrough) {
    const FinanceRuleEngine engine(finance_rule_table());
    const auto v = engine.determine_phase(collapse());
    EXPECT_EQ(v.phase, Phase::TroughDisillusionment);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_NEAR(v.score(Phase::TechnologyTrigger), 0.60, 1e-12);
    EXPECT_TRUE(v.fired(Phase::TechnologyTrigger, "pre_revenue"));
    EXPECT_NEAR(v.score(Phase::SlopeEnlightenment), 0.15, 1e-12);
    EXPECT_TRUE(v.fired(Phase::SlopeEnlightenment, "calming_volatility"));
}

TEST(FinanceRules, FrenzyIsPeak) {
    const FinanceRuleEngine engine(finance_rule_table());
    const auto v = engine.determine_phase(frenzy());
    EXPECT_EQ(v.phase, Phase::PeakInflatedExpectations);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_NEAR(v.score(Phase::TechnologyTrigger), 0.50, 1e-12);
    EXPECT_FALSE(v.fired(Phase::TechnologyTrigger, "pre_revenue"));
}

TEST(FinanceRules, MatureStockIsPlateau) {
    const FinanceRuleEngine engine(finance_rule_table());
    const auto v = engine.determine_phase(utility_stock());
    EXPECT_EQ(v.phase, Phase::PlateauProductivity);
    EXPECT_NEAR(v.confidence, 1.0, 1e-12);
    EXPECT_NEAR(v.score(Phase::SlopeEnlightenment), 0.55, 1e-12);
    EXPECT_DOUBLE_EQ(v.score(Phase::TechnologyTrigger), 0.0);
    EXPECT_NE(v.rationale.find("- Avg P/E ratio: 20.0"), std::string::npos);
}

TEST(FinanceRules, UncorrelatedVolatileTickersAreTrigger) {
    FinanceSnapshot m;
    m.tickers_analyzed = {"A", "B"};
    m.volatility       = 5.0;
    m.avg_correlation  = 0.1;

    const FinanceRuleEngine engine(finance_rule_table());
    const auto v = engine.determine_phase(m);
    EXPECT_EQ(v.phase, Phase::TechnologyTrigger);
    EXPECT_NEAR(v.confidence, 0.80, 1e-12);
    EXPECT_TRUE(v.fired(Phase::TechnologyTrigger, "uncorrelated_tickers"));
    EXPECT_NE(v.rationale.find("- Avg P/E ratio: N/A"), std::string::npos);
    EXPECT_NE(v.rationale.find("- Volatility: 5.00% (high uncertainty)"), std::string::npos);
}

TEST(FinanceRules, RationaleListsTickerPerformance) {
    const FinanceRuleEngine engine(finance_rule_table());
    const auto v = engine.determine_phase(collapse());
    EXPECT_EQ(v.rationale.rfind("Finance-based Phase: Trough of Disillusionment", 0), 0u);
    EXPECT_NE(v.rationale.find("- Max drawdown: 45.0%"), std::string::npos);
    EXPECT_NE(v.rationale.find("Ticker performance:\n  - SSB: -10.0% return, 2.50% volatility"),
              std::string::npos);
}
