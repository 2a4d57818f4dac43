/// @file src/rules/finance_rules.cpp
/// @brief Market-data indicator table.

#include "hype/rule_tables.hpp"

#include <fmt/format.h>

namespace hype::rules {

namespace {

std::string pe_line(const FinanceSnapshot& m) {
    if (!m.avg_pe_ratio) return "- Avg P/E ratio: N/A";
    return fmt::format("- Avg P/E ratio: {:.1f}", *m.avg_pe_ratio);
}

std::vector<std::string> finance_key_metrics(Phase phase, const FinanceSnapshot& m) {
    switch (phase) {
        case Phase::TechnologyTrigger:
            return {
                fmt::format("- Volatility: {:.2f}% (high uncertainty)", m.volatility),
                fmt::format("- Tickers analyzed: {} (limited presence)", m.tickers_analyzed.size()),
                fmt::format("- Volume trend: {}", to_string(m.volume_trend)),
                pe_line(m),
            };
        case Phase::PeakInflatedExpectations:
            return {
                fmt::format("- Price trend: {} (rapid growth)", to_string(m.price_trend)),
                fmt::format("- 3-month change: {:.1f}%", m.price_change_last_3_months),
                fmt::format("- Volume trend: {} (buying frenzy)", to_string(m.volume_trend)),
                fmt::format("- Volatility: {:.2f}% (speculation)", m.volatility),
                fmt::format("- Total return: {:.1f}%", m.total_return),
            };
        case Phase::TroughDisillusionment:
            return {
                fmt::format("- Price trend: {} (decline)", to_string(m.price_trend)),
                fmt::format("- Max drawdown: {:.1f}%", m.max_drawdown),
                fmt::format("- 3-month change: {:.1f}%", m.price_change_last_3_months),
                fmt::format("- Volume trend: {}", to_string(m.volume_trend)),
                fmt::format("- Sharpe ratio: {:.2f}", m.sharpe_ratio),
            };
        case Phase::SlopeEnlightenment:
            return {
                fmt::format("- Price trend: {} (recovery)", to_string(m.price_trend)),
                fmt::format("- 3-month change: {:.1f}%", m.price_change_last_3_months),
                fmt::format("- Volatility: {:.2f}% (stabilizing)", m.volatility),
                fmt::format("- Volume trend: {}", to_string(m.volume_trend)),
                fmt::format("- Sharpe ratio: {:.2f}", m.sharpe_ratio),
            };
        case Phase::PlateauProductivity:
            return {
                fmt::format("- Price trend: {} (stable)", to_string(m.price_trend)),
                fmt::format("- Volatility: {:.2f}% (mature)", m.volatility),
                fmt::format("- Volume trend: {}", to_string(m.volume_trend)),
                pe_line(m),
                fmt::format("- Sharpe ratio: {:.2f}", m.sharpe_ratio),
            };
    }
    return {};
}

rationale::ContextBlock ticker_lines(const FinanceSnapshot& m) {
    rationale::ContextBlock block{.heading = "Ticker performance:", .lines = {}};
    for (const auto& [ticker, perf] : m.ticker_performance) {
        if (block.lines.size() == constants::RATIONALE_CONTEXT_ROWS) break;
        block.lines.push_back(fmt::format("  - {}: {:.1f}% return, {:.2f}% volatility",
                                          ticker, perf.total_return_pct, perf.volatility_pct));
    }
    return block;
}

}  // namespace

RuleTable<FinanceSnapshot> finance_rule_table(const FinanceRuleThresholds& t) {
    RuleTable<FinanceSnapshot> table;
    table.headings = {
        .title      = "Finance-based Phase",
        .indicators = "Key Finance indicators:",
        .scores     = "Phase scores (Finance-based):",
    };

    // ── Technology Trigger ──
    table.indicators[index_of(Phase::TechnologyTrigger)] = {
        {"high_volatility", 0.25, [t](const FinanceSnapshot& m) {
             return m.volatility > t.high_volatility;
         }},
        {"few_tickers", 0.25, [t](const FinanceSnapshot& m) {
             return m.tickers_analyzed.size() <= t.few_tickers;
         }},
        {"thin_volume", 0.20, [](const FinanceSnapshot& m) {
             return m.volume_trend == Trend::Decreasing;
         }},
        {"pre_revenue", 0.15, [](const FinanceSnapshot& m) {
             return !m.avg_pe_ratio.has_value();
         }},
        {"uncorrelated_tickers", 0.15, [t](const FinanceSnapshot& m) {
             return m.avg_correlation && *m.avg_correlation < t.low_correlation;
         }},
    };

    // ── Peak of Inflated Expectations ──
    table.indicators[index_of(Phase::PeakInflatedExpectations)] = {
        {"bullish_trend", 0.25, [](const FinanceSnapshot& m) {
             return m.price_trend == PriceTrend::Bullish;
         }},
        {"strong_rally", 0.20, [t](const FinanceSnapshot& m) {
             return m.price_change_last_3_months > t.strong_bullish;
         }},
        {"buying_frenzy", 0.20, [](const FinanceSnapshot& m) {
             return m.volume_trend == Trend::Increasing;
         }},
        {"speculative_volatility", 0.15, [t](const FinanceSnapshot& m) {
             return m.volatility > t.high_volatility;
         }},
        {"high_total_return", 0.10, [t](const FinanceSnapshot& m) {
             return m.total_return > t.high_return;
         }},
        {"rich_valuation", 0.10, [t](const FinanceSnapshot& m) {
             return m.avg_pe_ratio && *m.avg_pe_ratio > t.speculative_pe;
         }},
    };

    // ── Trough of Disillusionment ──
    table.indicators[index_of(Phase::TroughDisillusionment)] = {
        {"bearish_trend", 0.30, [](const FinanceSnapshot& m) {
             return m.price_trend == PriceTrend::Bearish;
         }},
        {"severe_drawdown", 0.25, [t](const FinanceSnapshot& m) {
             return m.max_drawdown > t.severe_drawdown;
         }},
        {"sharp_decline", 0.20, [t](const FinanceSnapshot& m) {
             return m.price_change_last_3_months < t.strong_bearish;
         }},
        {"fading_volume", 0.15, [](const FinanceSnapshot& m) {
             return m.volume_trend == Trend::Decreasing;
         }},
        {"negative_sharpe", 0.10, [](const FinanceSnapshot& m) {
             return m.sharpe_ratio < 0.0;
         }},
    };

    // ── Slope of Enlightenment ──
    table.indicators[index_of(Phase::SlopeEnlightenment)] = {
        {"moderate_recovery", 0.25, [t](const FinanceSnapshot& m) {
             return m.price_change_last_3_months >= t.moderate_return_low &&
                    m.price_change_last_3_months <= t.moderate_return_high;
         }},
        {"not_bearish", 0.20, [](const FinanceSnapshot& m) {
             return m.price_trend == PriceTrend::Sideways || m.price_trend == PriceTrend::Bullish;
         }},
        {"stable_volume", 0.20, [](const FinanceSnapshot& m) {
             return m.volume_trend == Trend::Stable;
         }},
        {"calming_volatility", 0.15, [t](const FinanceSnapshot& m) {
             return m.volatility < t.high_volatility;
         }},
        {"moderate_drawdown", 0.10, [t](const FinanceSnapshot& m) {
             return m.max_drawdown >= t.moderate_drawdown && m.max_drawdown < t.severe_drawdown;
         }},
        {"positive_sharpe", 0.10, [t](const FinanceSnapshot& m) {
             return m.sharpe_ratio > 0.0 && m.sharpe_ratio < t.good_sharpe;
         }},
    };

    // ── Plateau of Productivity ──
    table.indicators[index_of(Phase::PlateauProductivity)] = {
        {"sideways_trend", 0.25, [](const FinanceSnapshot& m) {
             return m.price_trend == PriceTrend::Sideways;
         }},
        {"low_volatility", 0.20, [t](const FinanceSnapshot& m) {
             return m.volatility < t.low_volatility;
         }},
        {"stable_volume", 0.20, [](const FinanceSnapshot& m) {
             return m.volume_trend == Trend::Stable;
         }},
        {"fair_valuation", 0.15, [t](const FinanceSnapshot& m) {
             return m.avg_pe_ratio && *m.avg_pe_ratio > t.fair_pe_low && *m.avg_pe_ratio < t.fair_pe_high;
         }},
        {"good_sharpe", 0.10, [t](const FinanceSnapshot& m) {
             return m.sharpe_ratio >= t.good_sharpe;
         }},
        {"diversified_sectors", 0.10, [](const FinanceSnapshot& m) {
             return m.sectors.size() > 1;
         }},
    };

    table.key_metrics = finance_key_metrics;
    table.context     = ticker_lines;
    return table;
}

}  // namespace hype::rules
