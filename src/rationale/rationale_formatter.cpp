/// @file src/rationale/rationale_formatter.cpp
/// @brief Plain-text explanation of a phase verdict.

#include "hype/rationale.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>

namespace hype::rationale {

std::string format(const Headings& headings,
                   Phase winner,
                   const PhaseScores& scores,
                   std::span<const std::string> key_metrics,
                   const ContextBlock* context) {
    std::vector<std::string> parts;
    parts.reserve(key_metrics.size() + PHASE_COUNT + 12);

    parts.push_back(fmt::format("{}: {}", headings.title, display_name(winner)));
    parts.push_back(fmt::format("Confidence score: {:.2f}", scores[index_of(winner)]));
    parts.emplace_back();
    parts.push_back(headings.indicators);
    parts.insert(parts.end(), key_metrics.begin(), key_metrics.end());

    if (context != nullptr) {
        parts.emplace_back();
        parts.push_back(context->heading);
        parts.insert(parts.end(), context->lines.begin(), context->lines.end());
    }

    // ── Scores, highest first; equal scores keep canonical order ──
    std::array<Phase, PHASE_COUNT> ranked = ALL_PHASES;
    std::stable_sort(ranked.begin(), ranked.end(), [&](Phase a, Phase b) {
        return scores[index_of(a)] > scores[index_of(b)];
    });

    parts.emplace_back();
    parts.push_back(headings.scores);
    for (const Phase p : ranked) {
        parts.push_back(fmt::format("  {}: {:.2f}", display_name(p), scores[index_of(p)]));
    }

    return fmt::format("{}", fmt::join(parts, "\n"));
}

}  // namespace hype::rationale
