#pragma once

/// @file include/hype/rule_engine.hpp
/// @brief Generic weighted-indicator phase rule engine.
///
/// # Module: Phase Rule Engine
///
/// ## Responsibility
/// Score a metrics snapshot against the five lifecycle phases. Every stream
/// uses the same engine; what differs is its `RuleTable`:
///   - an ordered list of weighted indicators per phase
///   - the key metric lines narrated for the winning phase
///   - an optional context block (top assignees, subreddits, sources...)
///
/// ## Scoring
///
///     score(phase) = min(1, Σ weight_i · [indicator_i holds])
///     winner       = argmax score, ties → earliest in canonical order
///     confidence   = score(winner)
///
/// ## Guarantees
/// - `determine_phase` is pure and never throws
/// - Every score lies in [0, 1]
/// - The verdict records which indicators fired for each phase
///
/// ## NOT Responsible For
/// - Building snapshots (see `hype/extractors.hpp`)
/// - Per-stream indicator tables (see `hype/rule_tables.hpp`)

#include "hype/rationale.hpp"
#include "hype/types.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace hype::rules {

// ─── Types ────────────────────────────────────────────────────────────────────

template <typename Snapshot>
struct Indicator {
    std::string id;
    double      weight = 0.0;
    std::function<bool(const Snapshot&)> holds;
};

template <typename Snapshot>
struct RuleTable {
    rationale::Headings headings;
    std::array<std::vector<Indicator<Snapshot>>, PHASE_COUNT> indicators;
    std::function<std::vector<std::string>(Phase, const Snapshot&)> key_metrics;
    /// Optional; empty function means no context block.
    std::function<rationale::ContextBlock(const Snapshot&)> context;

    [[nodiscard]] const std::vector<Indicator<Snapshot>>& for_phase(Phase p) const noexcept {
        return indicators[index_of(p)];
    }
};

// ─── Engine ───────────────────────────────────────────────────────────────────

template <typename Snapshot>
class PhaseRuleEngine {
public:
    explicit PhaseRuleEngine(RuleTable<Snapshot> table)
        : table_(std::move(table))
    {}

    /// Score every phase and explain the winner.
    [[nodiscard]] PhaseVerdict determine_phase(const Snapshot& s) const noexcept {
        PhaseVerdict verdict;

        for (const Phase p : ALL_PHASES) {
            double total = 0.0;
            auto& hits = verdict.indicators[index_of(p)];
            for (const auto& ind : table_.for_phase(p)) {
                if (ind.holds(s)) {
                    total += ind.weight;
                    hits.push_back(IndicatorHit{ind.id, ind.weight});
                }
            }
            verdict.scores[index_of(p)] = std::min(total, 1.0);
        }

        // First maximum in canonical order wins.
        Phase best = Phase::TechnologyTrigger;
        for (const Phase p : ALL_PHASES) {
            if (verdict.scores[index_of(p)] > verdict.scores[index_of(best)]) {
                best = p;
            }
        }
        verdict.phase      = best;
        verdict.confidence = verdict.scores[index_of(best)];

        std::vector<std::string> lines;
        if (table_.key_metrics) {
            lines = table_.key_metrics(best, s);
        }
        if (table_.context) {
            const rationale::ContextBlock block = table_.context(s);
            verdict.rationale = rationale::format(table_.headings, best, verdict.scores,
                                                  lines, &block);
        } else {
            verdict.rationale = rationale::format(table_.headings, best, verdict.scores,
                                                  lines);
        }
        return verdict;
    }

    /// Score of a single phase.
    [[nodiscard]] double score(Phase p, const Snapshot& s) const {
        double total = 0.0;
        for (const auto& ind : table_.for_phase(p)) {
            if (ind.holds(s)) total += ind.weight;
        }
        return std::min(total, 1.0);
    }

    [[nodiscard]] const RuleTable<Snapshot>& table() const noexcept { return table_; }

private:
    RuleTable<Snapshot> table_;
};

}  // namespace hype::rules
