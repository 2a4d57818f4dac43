#pragma once

/// @file include/hype/types.hpp
/// @brief Shared vocabulary types for the hype-cycle classification engine.
///
/// # Module: Types
///
/// ## Responsibility
/// Define the five canonical lifecycle phases, the qualitative trend labels
/// produced by the toolkit and extractors, and the `PhaseVerdict` returned by
/// every rule engine.
///
/// ## Guarantees
/// - Phase order is canonical: trigger, peak, trough, slope, plateau.
///   `PhaseScores` is indexed by that order and arg-max ties resolve to the
///   earliest phase in it.
/// - All string conversions are total; parsing returns `std::nullopt` for
///   unknown labels.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hype {

// ─── Phase ────────────────────────────────────────────────────────────────────

enum class Phase : std::size_t {
    TechnologyTrigger        = 0,
    PeakInflatedExpectations = 1,
    TroughDisillusionment    = 2,
    SlopeEnlightenment       = 3,
    PlateauProductivity      = 4,
};

inline constexpr std::size_t PHASE_COUNT = 5;

/// All phases in canonical order.
inline constexpr std::array<Phase, PHASE_COUNT> ALL_PHASES{
    Phase::TechnologyTrigger,
    Phase::PeakInflatedExpectations,
    Phase::TroughDisillusionment,
    Phase::SlopeEnlightenment,
    Phase::PlateauProductivity,
};

[[nodiscard]] constexpr std::size_t index_of(Phase p) noexcept {
    return static_cast<std::size_t>(p);
}

/// Wire identifier, e.g. `"peak_inflated_expectations"`.
[[nodiscard]] std::string_view to_string(Phase p) noexcept;

/// Human-readable name, e.g. `"Peak of Inflated Expectations"`.
[[nodiscard]] std::string_view display_name(Phase p) noexcept;

/// One-paragraph description of what the phase means.
[[nodiscard]] std::string_view description(Phase p) noexcept;

[[nodiscard]] std::optional<Phase> parse_phase(std::string_view id) noexcept;

// ─── Trend labels ─────────────────────────────────────────────────────────────

/// Direction of a bucketed count series.
enum class Trend {
    Increasing,
    Decreasing,
    Stable,
    PeakReached,
    InsufficientData,
};

[[nodiscard]] std::string_view to_string(Trend t) noexcept;
[[nodiscard]] std::optional<Trend> parse_trend(std::string_view id) noexcept;

/// Shift of the applied-research share between the two halves of a corpus.
enum class ResearchDrift {
    TowardApplied,
    TowardBasic,
    Stable,
};

[[nodiscard]] std::string_view to_string(ResearchDrift d) noexcept;
[[nodiscard]] std::optional<ResearchDrift> parse_research_drift(std::string_view id) noexcept;

/// Qualitative direction of recent price action.
enum class PriceTrend {
    Bullish,
    Bearish,
    Sideways,
};

[[nodiscard]] std::string_view to_string(PriceTrend t) noexcept;
[[nodiscard]] std::optional<PriceTrend> parse_price_trend(std::string_view id) noexcept;

// ─── Verdict ──────────────────────────────────────────────────────────────────

/// Score in [0, 1] for every phase, indexed by `index_of(Phase)`.
using PhaseScores = std::array<double, PHASE_COUNT>;

/// An indicator that fired while scoring a phase.
struct IndicatorHit {
    std::string id;
    double      weight = 0.0;

    bool operator==(const IndicatorHit&) const = default;
};

/// Output of a rule engine for one snapshot.
struct PhaseVerdict {
    Phase       phase      = Phase::TechnologyTrigger;
    double      confidence = 0.0;   ///< Score of `phase`; not normalised
    PhaseScores scores{};
    /// Satisfied indicators per phase, in evaluation order.
    std::array<std::vector<IndicatorHit>, PHASE_COUNT> indicators{};
    std::string rationale;

    [[nodiscard]] double score(Phase p) const noexcept { return scores[index_of(p)]; }

    [[nodiscard]] const std::vector<IndicatorHit>& hits(Phase p) const noexcept {
        return indicators[index_of(p)];
    }

    /// True when indicator `id` contributed to the score of `p`.
    [[nodiscard]] bool fired(Phase p, std::string_view id) const noexcept;

    bool operator==(const PhaseVerdict&) const = default;
};

/// Ordered (label, count) pairs, most frequent first.
using CountList = std::vector<std::pair<std::string, std::int64_t>>;

}  // namespace hype
