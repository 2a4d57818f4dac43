/// @file src/rules/patent_rules.cpp
/// @brief Patent-stream indicator table.

#include "hype/rule_tables.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace hype::rules {

namespace {

/// New entrants over the last two entry years fell below `ratio` × the
/// year before them. Looks at the latest three entry years only.
bool entrants_declining(const PatentSnapshot& m, double ratio) {
    const auto& by_year = m.new_entrants_by_year;
    if (by_year.size() < 3) return false;

    auto it = std::prev(by_year.end(), 3);
    const double earlier = static_cast<double>(it->second);
    const double recent  = static_cast<double>(std::next(it)->second + std::next(it, 2)->second);
    return recent < earlier * ratio;
}

std::vector<std::string> patent_key_metrics(Phase phase, const PatentSnapshot& m) {
    switch (phase) {
        case Phase::TechnologyTrigger:
            return {
                fmt::format("- Total patents: {} (early stage)", m.total_patents),
                fmt::format("- Academic percentage: {:.1f}% (research-driven)", m.academic_pct),
                fmt::format("- Technology age: {} years (young)", m.technology_age_years),
                fmt::format("- Avg forward citations: {:.1f} (low, patents too new)", m.avg_forward_citations),
                fmt::format("- Unique assignees: {} (few early players)", m.unique_assignees),
            };
        case Phase::PeakInflatedExpectations:
            return {
                fmt::format("- Peak year: {} (recent)", m.peak_year),
                fmt::format("- Velocity trend: {} (high activity)", to_string(m.velocity_trend)),
                fmt::format("- Corporate percentage: {:.1f}% (transitioning)", m.corporate_pct),
                fmt::format("- HHI concentration: {:.3f} (many competitors)", m.assignee_concentration_hhi),
                fmt::format("- Recent velocity: {:.1f} patents/year", m.recent_velocity),
            };
        case Phase::TroughDisillusionment:
            return {
                fmt::format("- Velocity trend: {} (declining)", to_string(m.velocity_trend)),
                fmt::format("- Peak was in {}, now declining", m.peak_year),
                fmt::format("- Patents last year: {} (down from peak: {})", m.patents_last_year, m.peak_count),
                fmt::format("- Citation ratio: {:.2f} (low impact)", m.citation_ratio),
                std::string("- New entrants declining (consolidation phase)"),
            };
        case Phase::SlopeEnlightenment:
            return {
                fmt::format("- Velocity trend: {} (stabilizing)", to_string(m.velocity_trend)),
                fmt::format("- Corporate percentage: {:.1f}% (industry-led)", m.corporate_pct),
                fmt::format("- HHI concentration: {:.3f} (established players)", m.assignee_concentration_hhi),
                fmt::format("- Geographic spread: {} countries", m.unique_countries),
                m.patent_velocity.empty()
                    ? std::string("- Years since peak: N/A")
                    : fmt::format("- Years since peak: {}", m.years_since_peak()),
            };
        case Phase::PlateauProductivity:
            return {
                fmt::format("- Velocity trend: {} (stable plateau)", to_string(m.velocity_trend)),
                fmt::format("- Corporate percentage: {:.1f}% (industry dominated)", m.corporate_pct),
                fmt::format("- HHI concentration: {:.3f} (consolidated)", m.assignee_concentration_hhi),
                fmt::format("- Technology age: {} years (mature)", m.technology_age_years),
                fmt::format("- Geographic spread: {} countries (global)", m.unique_countries),
            };
    }
    return {};
}

rationale::ContextBlock top_holders(const PatentSnapshot& m) {
    rationale::ContextBlock block{.heading = "Top patent holders:", .lines = {}};
    const auto n = std::min(m.top_assignees.size(), constants::RATIONALE_CONTEXT_ROWS);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& [name, count] = m.top_assignees[i];
        block.lines.push_back(fmt::format("  - {}: {} patents", name, count));
    }
    return block;
}

}  // namespace

RuleTable<PatentSnapshot> patent_rule_table(const PatentRuleThresholds& t) {
    RuleTable<PatentSnapshot> table;
    table.headings = {
        .title      = "Patent-based Phase",
        .indicators = "Key patent indicators:",
        .scores     = "Phase scores (patent-based):",
    };

    // ── Technology Trigger ──
    table.indicators[index_of(Phase::TechnologyTrigger)] = {
        {"few_patents", 0.25, [t](const PatentSnapshot& m) {
             return m.total_patents < t.low_patent_count;
         }},
        {"academic_led", 0.25, [t](const PatentSnapshot& m) {
             return m.academic_pct > t.high_academic_pct;
         }},
        {"low_forward_citations", 0.15, [t](const PatentSnapshot& m) {
             return m.avg_forward_citations < t.low_forward_citations;
         }},
        {"young_technology", 0.15, [t](const PatentSnapshot& m) {
             return m.technology_age_years < t.young_technology_years;
         }},
        {"few_assignees", 0.10, [t](const PatentSnapshot& m) {
             return m.unique_assignees < t.few_assignees;
         }},
        {"narrow_geography", 0.10, [t](const PatentSnapshot& m) {
             return m.unique_countries < t.low_country_spread;
         }},
    };

    // ── Peak of Inflated Expectations ──
    table.indicators[index_of(Phase::PeakInflatedExpectations)] = {
        {"recent_peak", 0.25, [t](const PatentSnapshot& m) {
             return !m.patent_velocity.empty() && m.years_since_peak() <= t.recent_peak_years;
         }},
        {"high_velocity", 0.25, [](const PatentSnapshot& m) {
             return m.velocity_trend == Trend::Increasing || m.velocity_trend == Trend::PeakReached;
         }},
        {"corporate_transition", 0.15, [t](const PatentSnapshot& m) {
             return m.corporate_pct >= t.corporate_transition_low &&
                    m.corporate_pct <= t.corporate_transition_high;
         }},
        {"fragmented_assignees", 0.15, [t](const PatentSnapshot& m) {
             return m.assignee_concentration_hhi < t.low_hhi;
         }},
        {"accelerating_filings", 0.10, [t](const PatentSnapshot& m) {
             return m.recent_velocity > m.avg_patents_per_year * t.recent_velocity_factor;
         }},
        {"spreading_geography", 0.10, [t](const PatentSnapshot& m) {
             return m.unique_countries > t.low_country_spread &&
                    m.unique_countries < t.high_country_spread;
         }},
    };

    // ── Trough of Disillusionment ──
    table.indicators[index_of(Phase::TroughDisillusionment)] = {
        {"declining_velocity", 0.30, [](const PatentSnapshot& m) {
             return m.velocity_trend == Trend::Decreasing;
         }},
        {"post_peak_decline", 0.25, [t](const PatentSnapshot& m) {
             const int y = m.years_since_peak();
             return !m.patent_velocity.empty() && y >= 1 && y <= t.trough_peak_years_max;
         }},
        {"output_below_peak", 0.15, [t](const PatentSnapshot& m) {
             return static_cast<double>(m.patents_last_year) <
                    static_cast<double>(m.peak_count) * t.trough_peak_ratio;
         }},
        {"low_citation_ratio", 0.15, [t](const PatentSnapshot& m) {
             return m.citation_ratio < t.low_citation_ratio;
         }},
        {"consolidating", 0.10, [t](const PatentSnapshot& m) {
             return m.assignee_concentration_hhi >= t.low_hhi &&
                    m.assignee_concentration_hhi <= t.high_hhi;
         }},
        {"entrants_declining", 0.05, [t](const PatentSnapshot& m) {
             return entrants_declining(m, t.entrant_decline_ratio);
         }},
    };

    // ── Slope of Enlightenment ──
    table.indicators[index_of(Phase::SlopeEnlightenment)] = {
        {"stable_velocity", 0.25, [](const PatentSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"industry_led", 0.20, [t](const PatentSnapshot& m) {
             return m.corporate_pct >= t.corporate_industry_low &&
                    m.corporate_pct < t.corporate_industry_high;
         }},
        {"peak_behind", 0.20, [t](const PatentSnapshot& m) {
             const int y = m.years_since_peak();
             return !m.patent_velocity.empty() &&
                    y >= t.slope_peak_years_min && y <= t.slope_peak_years_max;
         }},
        {"established_players", 0.15, [t](const PatentSnapshot& m) {
             return m.assignee_concentration_hhi >= t.low_hhi &&
                    m.assignee_concentration_hhi <= t.high_hhi;
         }},
        {"international", 0.10, [t](const PatentSnapshot& m) {
             return m.unique_countries >= t.low_country_spread;
         }},
        {"moderate_citation_ratio", 0.10, [t](const PatentSnapshot& m) {
             return m.citation_ratio >= t.low_citation_ratio &&
                    m.citation_ratio <= t.high_citation_ratio;
         }},
    };

    // ── Plateau of Productivity ──
    table.indicators[index_of(Phase::PlateauProductivity)] = {
        {"stable_velocity", 0.20, [](const PatentSnapshot& m) {
             return m.velocity_trend == Trend::Stable;
         }},
        {"corporate_dominant", 0.20, [t](const PatentSnapshot& m) {
             return m.corporate_pct > t.high_corporate_pct;
         }},
        {"concentrated_assignees", 0.15, [t](const PatentSnapshot& m) {
             return m.assignee_concentration_hhi > t.high_hhi;
         }},
        {"mature_technology", 0.15, [t](const PatentSnapshot& m) {
             return m.technology_age_years > t.mature_technology_years;
         }},
        {"global_geography", 0.10, [t](const PatentSnapshot& m) {
             return m.unique_countries >= t.high_country_spread;
         }},
        {"influential_patents", 0.10, [t](const PatentSnapshot& m) {
             return m.citation_ratio > t.high_citation_ratio;
         }},
        {"long_past_peak", 0.10, [t](const PatentSnapshot& m) {
             return !m.patent_velocity.empty() && m.years_since_peak() > t.slope_peak_years_max;
         }},
    };

    table.key_metrics = patent_key_metrics;
    table.context     = top_holders;
    return table;
}

}  // namespace hype::rules
