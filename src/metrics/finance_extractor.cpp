/// @file src/metrics/finance_extractor.cpp
/// @brief Market metrics: returns, risk, price action, volume, fundamentals.
///
/// Rows are grouped by ticker and sorted by date. The price of a row is its
/// adjusted close, falling back to the close; rows with neither (or a zero
/// price) are skipped by the return calculations.

#include "hype/extractors.hpp"
#include "hype/toolkit.hpp"

#include "extract_common.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <vector>

namespace hype::metrics {

namespace {

using Series = std::vector<const PriceBar*>;

std::optional<double> price_of(const PriceBar& bar) noexcept {
    if (bar.adj_close && *bar.adj_close != 0.0) return bar.adj_close;
    if (bar.close && *bar.close != 0.0)         return bar.close;
    return std::nullopt;
}

std::vector<double> prices_of(const Series& rows) {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto* r : rows) {
        if (const auto p = price_of(*r)) out.push_back(*p);
    }
    return out;
}

/// Simple daily returns, skipping steps from a non-positive price.
std::vector<double> daily_returns(std::span<const double> prices) {
    std::vector<double> out;
    for (std::size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] > 0.0) {
            out.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
        }
    }
    return out;
}

struct ReturnStats {
    double mean   = 0.0;
    double stddev = 0.0;   ///< population
};

ReturnStats return_stats(const std::vector<double>& returns) {
    if (returns.empty()) return {};
    const Eigen::Map<const Eigen::ArrayXd> r(returns.data(),
                                             static_cast<Eigen::Index>(returns.size()));
    const double mean = r.mean();
    return ReturnStats{
        .mean   = mean,
        .stddev = std::sqrt((r - mean).square().mean()),
    };
}

double round_to(double x, int places) noexcept {
    const double scale = std::pow(10.0, places);
    return std::round(x * scale) / scale;
}

double band_change(double early, double late) noexcept {
    return early > 0.0 ? (late - early) / early * 100.0 : 0.0;
}

}  // namespace

// ─── FinanceExtractor ─────────────────────────────────────────────────────────

FinanceExtractor::FinanceExtractor(FinanceMetricsConfig config)
    : config_(config)
{}

double FinanceExtractor::max_drawdown(std::span<const double> prices) noexcept {
    if (prices.empty()) return 0.0;
    double peak  = prices.front();
    double worst = 0.0;
    for (const double p : prices) {
        peak = std::max(peak, p);
        const double dd = peak > 0.0 ? (peak - p) / peak : 0.0;
        worst = std::max(worst, dd);
    }
    return worst;
}

std::optional<double>
FinanceExtractor::correlation(std::span<const double> a, std::span<const double> b) {
    if (a.size() != b.size() || a.size() < 2) return std::nullopt;

    const auto n = static_cast<Eigen::Index>(a.size());
    const Eigen::Map<const Eigen::VectorXd> x(a.data(), n);
    const Eigen::Map<const Eigen::VectorXd> y(b.data(), n);

    const Eigen::VectorXd dx = (x.array() - x.mean()).matrix();
    const Eigen::VectorXd dy = (y.array() - y.mean()).matrix();
    const double denom = std::sqrt(dx.squaredNorm() * dy.squaredNorm());
    if (!(denom > 0.0) || !std::isfinite(denom)) return std::nullopt;

    const double r = dx.dot(dy) / denom;
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}

FinanceSnapshot FinanceExtractor::extract(std::span<const PriceBar> prices,
                                          std::span<const TickerInfo> info) const {
    detail::require_records("price", prices.size(), config_.min_records);

    std::map<std::string, Series> by_ticker;
    for (const auto& bar : prices) by_ticker[bar.ticker].push_back(&bar);
    for (auto& [ticker, rows] : by_ticker) {
        std::stable_sort(rows.begin(), rows.end(),
                         [](const PriceBar* a, const PriceBar* b) { return a->date < b->date; });
    }

    FinanceSnapshot s;

    // ── Step 1: Overview ─────────────────────────────────────────────────────
    s.total_price_records = static_cast<std::int64_t>(prices.size());
    for (const auto& [ticker, rows] : by_ticker) s.tickers_analyzed.push_back(ticker);
    for (const auto& bar : prices) {
        if (bar.date.empty()) continue;
        if (s.date_range_start.empty() || bar.date < s.date_range_start) s.date_range_start = bar.date;
        if (s.date_range_end.empty()   || bar.date > s.date_range_end)   s.date_range_end   = bar.date;
    }

    // ── Step 2: Returns, risk & per-ticker performance ───────────────────────
    {
        std::vector<double> all_returns;
        std::vector<double> total_returns;
        std::vector<double> drawdowns;

        for (const auto& [ticker, rows] : by_ticker) {
            if (rows.size() < 2) continue;
            const auto series = prices_of(rows);
            if (series.size() < 2) continue;

            const auto returns = daily_returns(series);
            all_returns.insert(all_returns.end(), returns.begin(), returns.end());

            const double first = series.front();
            const double last  = series.back();
            if (first > 0.0) total_returns.push_back((last - first) / first);
            drawdowns.push_back(max_drawdown(series));

            if (!returns.empty()) {
                const auto stats = return_stats(returns);
                s.ticker_performance.emplace(ticker, TickerPerformance{
                    .total_return_pct     = round_to(first > 0.0 ? (last - first) / first * 100.0 : 0.0, 2),
                    .avg_daily_return_pct = round_to(stats.mean * 100.0, 4),
                    .volatility_pct       = round_to(stats.stddev * 100.0, 2),
                    .num_records          = static_cast<std::int64_t>(rows.size()),
                    .latest_price         = last,
                });
            }
        }

        const auto stats = return_stats(all_returns);
        s.avg_daily_return = stats.mean * 100.0;
        s.volatility       = stats.stddev * 100.0;
        s.sharpe_ratio     = s.volatility > 0.0
            ? (s.avg_daily_return * constants::ANNUALISATION_FACTOR) /
              (s.volatility * std::sqrt(constants::ANNUALISATION_FACTOR))
            : 0.0;
        s.total_return = toolkit::mean(total_returns).value_or(0.0) * 100.0;
        s.max_drawdown = toolkit::mean(drawdowns).value_or(0.0) * 100.0;
    }

    // ── Step 3: Price action ─────────────────────────────────────────────────
    {
        std::vector<double> month_changes;
        std::vector<double> quarter_changes;
        for (const auto& [ticker, rows] : by_ticker) {
            if (rows.size() < constants::MIN_PRICES_FOR_TREND) continue;

            std::vector<double> series;
            for (const auto* r : rows) {
                const auto p = price_of(*r);
                if (p && !r->date.empty()) series.push_back(*p);
            }
            if (series.empty()) continue;

            const std::size_t n = series.size();
            const double last = series.back();
            const double month_ago   = series[n > constants::ONE_MONTH_ROWS ? n - constants::ONE_MONTH_ROWS : 0];
            const double quarter_ago = series[n > constants::THREE_MONTH_ROWS ? n - constants::THREE_MONTH_ROWS : 0];
            if (month_ago > 0.0)   month_changes.push_back((last - month_ago) / month_ago * 100.0);
            if (quarter_ago > 0.0) quarter_changes.push_back((last - quarter_ago) / quarter_ago * 100.0);
        }
        s.price_change_last_month    = toolkit::mean(month_changes).value_or(0.0);
        s.price_change_last_3_months = toolkit::mean(quarter_changes).value_or(0.0);

        if (s.price_change_last_3_months > config_.trend_band_pct) {
            s.price_trend = PriceTrend::Bullish;
        } else if (s.price_change_last_3_months < -config_.trend_band_pct) {
            s.price_trend = PriceTrend::Bearish;
        } else {
            s.price_trend = PriceTrend::Sideways;
        }
    }

    // ── Step 4: Volume ───────────────────────────────────────────────────────
    {
        std::vector<double> all, early, recent;
        for (const auto& [ticker, rows] : by_ticker) {
            std::vector<double> volumes;
            for (const auto* r : rows) {
                if (r->volume && *r->volume > 0) volumes.push_back(static_cast<double>(*r->volume));
            }
            const auto mid = static_cast<std::ptrdiff_t>(volumes.size() / 2);
            all.insert(all.end(), volumes.begin(), volumes.end());
            early.insert(early.end(), volumes.begin(), volumes.begin() + mid);
            recent.insert(recent.end(), volumes.begin() + mid, volumes.end());
        }
        s.avg_volume = toolkit::mean(all).value_or(0.0);

        if (!early.empty() && !recent.empty()) {
            s.volume_change_pct = band_change(toolkit::mean(early).value_or(0.0),
                                              toolkit::mean(recent).value_or(0.0));
            if (s.volume_change_pct > config_.volume_band_pct) {
                s.volume_trend = Trend::Increasing;
            } else if (s.volume_change_pct < -config_.volume_band_pct) {
                s.volume_trend = Trend::Decreasing;
            } else {
                s.volume_trend = Trend::Stable;
            }
        } else {
            s.volume_trend      = Trend::InsufficientData;
            s.volume_change_pct = 0.0;
        }
    }

    // ── Step 5: Fundamentals ─────────────────────────────────────────────────
    if (!info.empty()) {
        std::vector<double> pe, caps;
        std::set<std::string> sectors, industries;
        toolkit::FrequencyCounter sector_counts;
        for (const auto& t : info) {
            if (t.pe_ratio && *t.pe_ratio > 0.0) pe.push_back(*t.pe_ratio);
            if (t.market_cap && *t.market_cap > 0) caps.push_back(static_cast<double>(*t.market_cap));
            if (detail::present(t.sector)) {
                sectors.insert(*t.sector);
                sector_counts.add(*t.sector);
            }
            if (detail::present(t.industry)) industries.insert(*t.industry);
        }
        s.avg_pe_ratio             = toolkit::mean(pe);
        s.avg_market_cap           = toolkit::mean(caps);
        s.sectors.assign(sectors.begin(), sectors.end());
        s.industries.assign(industries.begin(), industries.end());
        s.sector_concentration_hhi = toolkit::hhi(sector_counts);
    }

    // ── Step 6: Cross-ticker correlation ─────────────────────────────────────
    if (by_ticker.size() >= 2) {
        std::vector<std::map<std::string, double>> returns_by_date;
        for (const auto& [ticker, rows] : by_ticker) {
            std::map<std::string, double> by_date;
            for (std::size_t i = 1; i < rows.size(); ++i) {
                const auto prev = price_of(*rows[i - 1]);
                const auto curr = price_of(*rows[i]);
                if (prev && curr && *prev > 0.0) {
                    by_date[rows[i]->date] = (*curr - *prev) / *prev;
                }
            }
            if (!by_date.empty()) returns_by_date.push_back(std::move(by_date));
        }

        std::vector<double> correlations;
        for (std::size_t i = 0; i < returns_by_date.size(); ++i) {
            for (std::size_t j = i + 1; j < returns_by_date.size(); ++j) {
                std::vector<double> a, b;
                for (const auto& [date, r] : returns_by_date[i]) {
                    if (const auto it = returns_by_date[j].find(date); it != returns_by_date[j].end()) {
                        a.push_back(r);
                        b.push_back(it->second);
                    }
                }
                if (a.size() < constants::MIN_COMMON_DATES_FOR_CORRELATION) continue;
                if (const auto c = correlation(a, b)) correlations.push_back(*c);
            }
        }
        s.avg_correlation = toolkit::mean(correlations);
    }

    // ── Step 7: Data quality ─────────────────────────────────────────────────
    s.records_with_volume = std::count_if(prices.begin(), prices.end(),
        [](const PriceBar& b) { return b.volume && *b.volume > 0; });
    s.coverage_pct = toolkit::percent(static_cast<double>(s.records_with_volume),
                                      static_cast<double>(prices.size()));

    return s;
}

}  // namespace hype::metrics
