/// @file src/rules/paper_rules.cpp
/// @brief Publication-stream indicator table.

#include "hype/rule_tables.hpp"

#include <fmt/format.h>

#include <initializer_list>

namespace hype::rules {

namespace {

bool trend_in(Trend t, std::initializer_list<Trend> allowed) noexcept {
    for (const Trend a : allowed) {
        if (t == a) return true;
    }
    return false;
}

std::vector<std::string> paper_key_metrics(Phase phase, const PaperSnapshot& m) {
    switch (phase) {
        case Phase::TechnologyTrigger:
            return {
                fmt::format("- High basic research percentage: {:.1f}%", m.basic_research_pct),
                fmt::format("- Publication trend: {}", to_string(m.velocity_trend)),
                fmt::format("- Average citations: {:.1f} (low, indicating early stage)", m.avg_citations_per_paper),
                fmt::format("- Academic venue dominance: {:.1f}%", m.academic_venue_pct),
            };
        case Phase::PeakInflatedExpectations:
            return {
                fmt::format("- Peak publication year: {} ({} papers)", m.peak_year, m.peak_count),
                fmt::format("- Citation growth rate: {:.1f}% (rapid)", m.citation_growth_rate),
                fmt::format("- Applied research percentage: {:.1f}% (increasing)", m.applied_research_pct),
                fmt::format("- Research type trend: {}", to_string(m.research_type_trend)),
            };
        case Phase::TroughDisillusionment:
            return {
                fmt::format("- Publication velocity: {} (declining)", to_string(m.velocity_trend)),
                fmt::format("- Peak was in {}, now declining", m.peak_year),
                fmt::format("- Papers last year: {} (down from peak: {})", m.papers_last_year, m.peak_count),
                fmt::format("- Citation growth: {:.1f}% (stagnant)", m.citation_growth_rate),
            };
        case Phase::SlopeEnlightenment:
            return {
                fmt::format("- Applied research percentage: {:.1f}% (high)", m.applied_research_pct),
                fmt::format("- Publication trend: {} (stable/gradual growth)", to_string(m.velocity_trend)),
                fmt::format("- Citation growth: {:.1f}% (moderate)", m.citation_growth_rate),
                std::string("- Research focus: shifting to practical implementations"),
            };
        case Phase::PlateauProductivity:
            return {
                fmt::format("- Applied research percentage: {:.1f}% (very high)", m.applied_research_pct),
                fmt::format("- Publication velocity: {} (stable plateau)", to_string(m.velocity_trend)),
                fmt::format("- Average citations: {:.1f} (well-established)", m.avg_citations_per_paper),
                fmt::format("- Industry involvement: {:.1f}%", m.industry_venue_pct),
            };
    }
    return {};
}

}  // namespace

RuleTable<PaperSnapshot> paper_rule_table(const PaperRuleThresholds& t) {
    RuleTable<PaperSnapshot> table;
    table.headings = {
        .title      = "Phase determined",
        .indicators = "Key indicators:",
        .scores     = "Phase scores (for comparison):",
    };

    // ── Technology Trigger ──
    table.indicators[index_of(Phase::TechnologyTrigger)] = {
        {"early_growth", 0.30, [t](const PaperSnapshot& m) {
             return m.velocity_trend == Trend::Increasing && m.growth_rate_early_vs_late > t.early_growth_rate;
         }},
        {"basic_research", 0.25, [t](const PaperSnapshot& m) {
             return m.basic_research_pct > t.basic_research_high;
         }},
        {"low_citations", 0.20, [t](const PaperSnapshot& m) {
             return m.avg_citations_per_paper < t.low_avg_citations;
         }},
        {"academic_venues", 0.15, [t](const PaperSnapshot& m) {
             return m.academic_venue_pct > t.academic_venue_high;
         }},
        {"modest_recent_output", 0.10, [](const PaperSnapshot& m) {
             return !m.publication_velocity.empty() &&
                    static_cast<double>(m.papers_last_2_years) < 2.0 * m.avg_papers_per_year;
         }},
    };

    // ── Peak of Inflated Expectations ──
    table.indicators[index_of(Phase::PeakInflatedExpectations)] = {
        {"recent_peak", 0.30, [t](const PaperSnapshot& m) {
             return !m.publication_velocity.empty() && m.years_since_peak() <= t.peak_recency_years;
         }},
        {"rapid_citation_growth", 0.25, [t](const PaperSnapshot& m) {
             return m.citation_growth_rate > t.citation_growth_high;
         }},
        {"applied_transition", 0.25, [t](const PaperSnapshot& m) {
             return m.applied_research_pct >= t.applied_transition_low &&
                    m.applied_research_pct <= t.applied_transition_high &&
                    m.research_type_trend == ResearchDrift::TowardApplied;
         }},
        {"high_velocity", 0.20, [](const PaperSnapshot& m) {
             return trend_in(m.velocity_trend, {Trend::Increasing, Trend::PeakReached});
         }},
    };

    // ── Trough of Disillusionment ──
    table.indicators[index_of(Phase::TroughDisillusionment)] = {
        {"declining_velocity", 0.35, [](const PaperSnapshot& m) {
             return m.velocity_trend == Trend::Decreasing;
         }},
        {"post_peak_decline", 0.30, [](const PaperSnapshot& m) {
             const int y = m.years_since_peak();
             return !m.publication_velocity.empty() && y >= 1 && y <= 3;
         }},
        {"stagnant_citations", 0.20, [t](const PaperSnapshot& m) {
             return m.citation_growth_rate < t.citation_growth_moderate;
         }},
        {"output_below_peak", 0.15, [t](const PaperSnapshot& m) {
             return static_cast<double>(m.papers_last_year) <
                    static_cast<double>(m.peak_count) * t.trough_peak_ratio;
         }},
    };

    // ── Slope of Enlightenment ──
    table.indicators[index_of(Phase::SlopeEnlightenment)] = {
        {"applied_majority", 0.30, [t](const PaperSnapshot& m) {
             return m.applied_research_pct >= t.applied_research_high &&
                    m.applied_research_pct < t.applied_research_very_high;
         }},
        {"steady_growth", 0.25, [](const PaperSnapshot& m) {
             return trend_in(m.velocity_trend, {Trend::Stable, Trend::Increasing}) &&
                    m.growth_rate_early_vs_late > 0.0;
         }},
        {"moderate_citation_growth", 0.25, [t](const PaperSnapshot& m) {
             return m.citation_growth_rate >= t.citation_growth_moderate &&
                    m.citation_growth_rate < t.citation_growth_high;
         }},
        {"peak_behind", 0.20, [t](const PaperSnapshot& m) {
             const int y = m.years_since_peak();
             return !m.publication_velocity.empty() &&
                    y >= t.slope_peak_years_min && y <= t.slope_peak_years_max;
         }},
    };

    // ── Plateau of Productivity ──
    table.indicators[index_of(Phase::PlateauProductivity)] = {
        {"applied_dominant", 0.35, [t](const PaperSnapshot& m) {
             return m.applied_research_pct > t.applied_research_very_high;
         }},
        {"stable_velocity", 0.25, [](const PaperSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"high_citations", 0.20, [t](const PaperSnapshot& m) {
             return m.avg_citations_per_paper > t.high_avg_citations;
         }},
        {"industry_venues", 0.10, [t](const PaperSnapshot& m) {
             return m.industry_venue_pct > t.industry_venue_high;
         }},
        {"long_past_peak", 0.10, [t](const PaperSnapshot& m) {
             return !m.publication_velocity.empty() && m.years_since_peak() >= t.plateau_peak_years;
         }},
    };

    table.key_metrics = paper_key_metrics;
    return table;
}

}  // namespace hype::rules
