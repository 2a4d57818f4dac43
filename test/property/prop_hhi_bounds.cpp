/**
 * @file  prop_hhi_bounds.cpp
 * @brief Property: ∀ positive counts c₁..cₙ: 1/n ≤ HHI(c) ≤ 1
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_hhi_bounds
 *
 * Mathematical basis:
 *   HHI = Σ sᵢ²  with  sᵢ = cᵢ / Σ c
 *
 *   Σ sᵢ = 1 and sᵢ ≥ 0, so Σ sᵢ² ≤ (Σ sᵢ)² = 1, and by Cauchy-Schwarz
 *   Σ sᵢ² ≥ (Σ sᵢ)² / n = 1/n.  Equality at the lower bound holds exactly
 *   when every share is equal; at the upper bound when n = 1.
 *
 * The rule tables read HHI values against fixed bands (0.15, 0.25, 0.3),
 * so a value outside [0, 1] would silently flip concentration indicators.
 */

#include <rapidcheck.h>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "hype/toolkit.hpp"

using namespace hype::toolkit;

int main() {
    // ── Property 1: 1/n ≤ HHI ≤ 1 for positive counts ──────────────────────
    rc::check(
        "hhi_bounds: 1/n <= hhi(counts) <= 1",
        [] {
            const auto counts = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<std::int64_t>>(
                    rc::gen::inRange<std::int64_t>(1, 100000)));

            const double h = hhi(counts);
            const double n = static_cast<double>(counts.size());
            RC_ASSERT(std::isfinite(h));
            RC_ASSERT(h >= 1.0 / n - 1e-12);
            RC_ASSERT(h <= 1.0 + 1e-12);
        }
    );

    // ── Property 2: equal shares hit the lower bound exactly ───────────────
    rc::check(
        "hhi_bounds: n equal counts give 1/n",
        [] {
            const auto n = *rc::gen::inRange<std::size_t>(1, 200);
            const auto c = *rc::gen::inRange<std::int64_t>(1, 1000);
            const std::vector<std::int64_t> counts(n, c);
            RC_ASSERT(std::abs(hhi(counts) - 1.0 / static_cast<double>(n)) < 1e-12);
        }
    );

    // ── Property 3: zero entries do not move the index ─────────────────────
    rc::check(
        "hhi_bounds: appending zeros leaves hhi unchanged",
        [] {
            auto counts = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<std::int64_t>>(
                    rc::gen::inRange<std::int64_t>(1, 1000)));
            const auto zeros = *rc::gen::inRange<std::size_t>(1, 20);

            const double before = hhi(counts);
            counts.insert(counts.end(), zeros, 0);
            RC_ASSERT(std::abs(hhi(counts) - before) < 1e-12);
        }
    );

    // ── Property 4: counter and span overloads agree ───────────────────────
    rc::check(
        "hhi_bounds: hhi(FrequencyCounter) == hhi(counts)",
        [] {
            const auto labels = *rc::gen::nonEmpty(
                rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 12)));

            FrequencyCounter counter;
            for (const int l : labels) counter.add("label" + std::to_string(l));

            std::vector<std::int64_t> counts;
            for (const auto& [label, n] : counter.entries()) counts.push_back(n);

            RC_ASSERT(std::abs(hhi(counter) - hhi(counts)) < 1e-12);
        }
    );

    return 0;
}
