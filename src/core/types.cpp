/// @file src/core/types.cpp
/// @brief Phase metadata and label conversions.

#include "hype/types.hpp"

#include <algorithm>

namespace hype {

namespace {

struct PhaseInfo {
    std::string_view id;
    std::string_view name;
    std::string_view description;
};

constexpr std::array<PhaseInfo, PHASE_COUNT> PHASES{{
    {"technology_trigger", "Technology Trigger",
     "A potential technology breakthrough kicks things off. Early proof-of-concept "
     "stories and media interest trigger significant publicity. Often no usable "
     "products exist and commercial viability is unproven."},
    {"peak_inflated_expectations", "Peak of Inflated Expectations",
     "Early publicity produces a number of success stories, often accompanied by "
     "scores of failures. Some companies take action; most don't."},
    {"trough_disillusionment", "Trough of Disillusionment",
     "Interest wanes as experiments and implementations fail to deliver. Producers "
     "of the technology shake out or fail. Investment continues only if surviving "
     "providers improve their products."},
    {"slope_enlightenment", "Slope of Enlightenment",
     "More instances of how the technology can benefit the enterprise start to "
     "crystallize and become more widely understood. Second- and third-generation "
     "products appear."},
    {"plateau_productivity", "Plateau of Productivity",
     "Mainstream adoption starts to take off. Criteria for assessing provider "
     "viability are more clearly defined. The technology's broad market "
     "applicability and relevance are paying off."},
}};

constexpr std::array<std::pair<Trend, std::string_view>, 5> TRENDS{{
    {Trend::Increasing,       "increasing"},
    {Trend::Decreasing,       "decreasing"},
    {Trend::Stable,           "stable"},
    {Trend::PeakReached,      "peak_reached"},
    {Trend::InsufficientData, "insufficient_data"},
}};

constexpr std::array<std::pair<ResearchDrift, std::string_view>, 3> DRIFTS{{
    {ResearchDrift::TowardApplied, "toward_applied"},
    {ResearchDrift::TowardBasic,   "toward_basic"},
    {ResearchDrift::Stable,        "stable"},
}};

constexpr std::array<std::pair<PriceTrend, std::string_view>, 3> PRICE_TRENDS{{
    {PriceTrend::Bullish,  "bullish"},
    {PriceTrend::Bearish,  "bearish"},
    {PriceTrend::Sideways, "sideways"},
}};

template <typename E, std::size_t N>
std::string_view label_of(const std::array<std::pair<E, std::string_view>, N>& table,
                          E value) noexcept {
    for (const auto& [e, label] : table) {
        if (e == value) return label;
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> parse_label(const std::array<std::pair<E, std::string_view>, N>& table,
                             std::string_view id) noexcept {
    for (const auto& [e, label] : table) {
        if (label == id) return e;
    }
    return std::nullopt;
}

}  // namespace

// ─── Phase ────────────────────────────────────────────────────────────────────

std::string_view to_string(Phase p) noexcept {
    return PHASES[index_of(p)].id;
}

std::string_view display_name(Phase p) noexcept {
    return PHASES[index_of(p)].name;
}

std::string_view description(Phase p) noexcept {
    return PHASES[index_of(p)].description;
}

std::optional<Phase> parse_phase(std::string_view id) noexcept {
    for (const Phase p : ALL_PHASES) {
        if (PHASES[index_of(p)].id == id) return p;
    }
    return std::nullopt;
}

// ─── Labels ───────────────────────────────────────────────────────────────────

std::string_view to_string(Trend t) noexcept { return label_of(TRENDS, t); }
std::optional<Trend> parse_trend(std::string_view id) noexcept { return parse_label(TRENDS, id); }

std::string_view to_string(ResearchDrift d) noexcept { return label_of(DRIFTS, d); }
std::optional<ResearchDrift> parse_research_drift(std::string_view id) noexcept {
    return parse_label(DRIFTS, id);
}

std::string_view to_string(PriceTrend t) noexcept { return label_of(PRICE_TRENDS, t); }
std::optional<PriceTrend> parse_price_trend(std::string_view id) noexcept {
    return parse_label(PRICE_TRENDS, id);
}

// ─── PhaseVerdict ─────────────────────────────────────────────────────────────

bool PhaseVerdict::fired(Phase p, std::string_view id) const noexcept {
    const auto& list = indicators[index_of(p)];
    return std::any_of(list.begin(), list.end(),
                       [id](const IndicatorHit& h) { return h.id == id; });
}

}  // namespace hype
