#pragma once

/// @file include/hype/rationale.hpp
/// @brief Deterministic human-readable explanation of a phase verdict.
///
/// Layout:
///
///     <title>: <Phase name>
///     Confidence score: 0.xx
///
///     <indicator heading>
///     - key metric ...
///
///     <context heading>          (optional stream context block)
///       - entry ...
///
///     <scores heading>
///       <Phase name>: 0.xx         (all five, descending, ties canonical)

#include "hype/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace hype::rationale {

struct Headings {
    std::string title;        ///< e.g. "Patent-based Phase"
    std::string indicators;   ///< e.g. "Key patent indicators:"
    std::string scores;       ///< e.g. "Phase scores (patent-based):"
};

/// Stream context printed between the key metrics and the score table.
struct ContextBlock {
    std::string              heading;
    std::vector<std::string> lines;
};

[[nodiscard]] std::string format(const Headings& headings,
                                 Phase winner,
                                 const PhaseScores& scores,
                                 std::span<const std::string> key_metrics,
                                 const ContextBlock* context = nullptr);

}  // namespace hype::rationale
