/**
 * @file  bench/bench_extractors.cpp
 * @brief Google Benchmark suite for the stream extractors and rule engines.
 *
 * Benchmarks
 * ----------
 *   BM_Tokenize                 — lexical tokenizer over one abstract
 *   BM_PaperExtractor           — papers → PaperSnapshot
 *   BM_SocialExtractor          — posts  → SocialSnapshot
 *   BM_FinanceExtractor         — price rows → FinanceSnapshot (Eigen correlation)
 *   BM_PaperRuleEngine          — PaperSnapshot → PhaseVerdict
 *
 * Build (CMake):
 *   cmake -DHYPE_BENCH=ON ..
 *   cmake --build build --target bench_extractors
 *   ./build/bench_extractors --benchmark_format=json
 *
 * Throughput units: items/second (records processed).
 */

#include "benchmark/benchmark.h"

#include "hype/extractors.hpp"
#include "hype/rule_tables.hpp"
#include "hype/toolkit.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static constexpr std::int64_t BENCH_START = 1'704'067'200;   // 2024-01-01T00:00:00Z
static constexpr std::int64_t BENCH_NOW   = 1'735'689'600;   // 2025-01-01T00:00:00Z

static const char* const WORDS[] = {
    "battery", "lithium", "solid", "state", "electrolyte", "anode", "cathode",
    "commercial", "deployment", "theoretical", "framework", "prototype",
    "manufacturing", "scale", "novel", "market", "efficiency", "density",
};

/// Deterministic pseudo-sentence of `n` words.
static std::string make_text(std::size_t seed, std::size_t n) {
    std::string out;
    constexpr std::size_t kWords = sizeof(WORDS) / sizeof(WORDS[0]);
    for (std::size_t i = 0; i < n; ++i) {
        if (!out.empty()) out += ' ';
        out += WORDS[(seed * 7 + i * 3) % kWords];
    }
    return out;
}

static std::vector<hype::PaperRecord> make_papers(std::size_t n) {
    std::vector<hype::PaperRecord> papers;
    papers.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        papers.push_back(hype::PaperRecord{
            .paper_id        = "p" + std::to_string(i),
            .title           = make_text(i, 8),
            .year            = 2010 + static_cast<int>(i % 15),
            .citation_count  = static_cast<std::int64_t>((i * 37) % 400),
            .abstract        = make_text(i + 1, 60),
            .venue           = (i % 3 == 0) ? "Nature Energy" : "IEEE Conference on Power",
            .open_access_pdf = std::nullopt,
        });
    }
    return papers;
}

static std::vector<hype::SocialPost> make_posts(std::size_t n) {
    std::vector<hype::SocialPost> posts;
    posts.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        posts.push_back(hype::SocialPost{
            .post_id      = "s" + std::to_string(i),
            .title        = make_text(i, 10),
            .body         = make_text(i + 2, 40),
            .score        = static_cast<std::int64_t>((i * 13) % 900),
            .num_comments = static_cast<std::int64_t>((i * 5) % 120),
            .author       = "user" + std::to_string(i % 97),
            .subreddit    = (i % 4 == 0) ? "batteries" : "energy",
            .created_utc  = BENCH_START + static_cast<std::int64_t>(i) * 7 * 3600,
            .is_self      = (i % 3 != 0),
        });
    }
    return posts;
}

static std::vector<hype::PriceBar> make_prices(std::size_t days) {
    static const char* const TICKERS[] = {"QS", "SLDP", "ALB"};
    std::vector<hype::PriceBar> bars;
    bars.reserve(days * 3);
    for (std::size_t t = 0; t < 3; ++t) {
        for (std::size_t d = 0; d < days; ++d) {
            const double close = 50.0 + static_cast<double>(t) * 10.0 +
                                 static_cast<double>((d * 17 + t * 5) % 23) - 11.0;
            const int month = 1 + static_cast<int>((d / 28) % 12);
            const int day   = 1 + static_cast<int>(d % 28);
            bars.push_back(hype::PriceBar{
                .ticker    = TICKERS[t],
                .date      = std::to_string(2024 + static_cast<int>(d / 336)) + "-" +
                             (month < 10 ? "0" : "") + std::to_string(month) + "-" +
                             (day < 10 ? "0" : "") + std::to_string(day),
                .open      = close,
                .high      = close + 1.0,
                .low       = close - 1.0,
                .close     = close,
                .adj_close = std::nullopt,
                .volume    = static_cast<std::int64_t>(1'000'000 + d * 1'000),
            });
        }
    }
    return bars;
}

// ── Toolkit ────────────────────────────────────────────────────────────────────

static void BM_Tokenize(benchmark::State& state) {
    const std::string text = make_text(3, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto tokens = hype::toolkit::tokenize(text);
        benchmark::DoNotOptimize(tokens.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Tokenize)->RangeMultiplier(4)->Range(64, 4096);

// ── Extractors ─────────────────────────────────────────────────────────────────

static void BM_PaperExtractor(benchmark::State& state) {
    const auto papers = make_papers(static_cast<std::size_t>(state.range(0)));
    const hype::metrics::PaperExtractor extractor(BENCH_NOW);
    for (auto _ : state) {
        auto snapshot = extractor.extract(papers);
        benchmark::DoNotOptimize(snapshot.total_papers);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_PaperExtractor)->RangeMultiplier(4)->Range(128, 8192)->Unit(benchmark::kMicrosecond);

static void BM_SocialExtractor(benchmark::State& state) {
    const auto posts = make_posts(static_cast<std::size_t>(state.range(0)));
    const hype::metrics::SocialExtractor extractor(BENCH_NOW);
    for (auto _ : state) {
        auto snapshot = extractor.extract(posts);
        benchmark::DoNotOptimize(snapshot.total_posts);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_SocialExtractor)->RangeMultiplier(4)->Range(128, 8192)->Unit(benchmark::kMicrosecond);

static void BM_FinanceExtractor(benchmark::State& state) {
    const auto bars = make_prices(static_cast<std::size_t>(state.range(0)));
    const hype::metrics::FinanceExtractor extractor;
    for (auto _ : state) {
        auto snapshot = extractor.extract(bars);
        benchmark::DoNotOptimize(snapshot.volatility);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(bars.size()));
}
BENCHMARK(BM_FinanceExtractor)->RangeMultiplier(2)->Range(64, 1024)->Unit(benchmark::kMicrosecond);

// ── Rule engine ────────────────────────────────────────────────────────────────

static void BM_PaperRuleEngine(benchmark::State& state) {
    const hype::metrics::PaperExtractor extractor(BENCH_NOW);
    const auto snapshot = extractor.extract(make_papers(1024));
    const hype::rules::PaperRuleEngine engine(hype::rules::paper_rule_table());
    for (auto _ : state) {
        auto verdict = engine.determine_phase(snapshot);
        benchmark::DoNotOptimize(verdict.confidence);
    }
}
BENCHMARK(BM_PaperRuleEngine);

BENCHMARK_MAIN();
