/// @file tests/integration/test_analysis.cpp
/// @brief End-to-end tests of the Analyzer: records → snapshot → verdict.
///
/// These tests exercise the complete path for each stream:
///   records → gate → Extractor → Snapshot → PhaseRuleEngine → Verdict
/// and the concurrent `analyze_technology` fan-out with its shortfall report.

#include <gtest/gtest.h>
#include "hype/analysis.hpp"

#include "../fixtures.hpp"

#include <string>
#include <vector>

using namespace hype;
using namespace hype::core;
using hype::test::at;

namespace {

const std::int64_t NOW = at("2026-06-01");

std::vector<PatentRecord> few_patents() {
    return test::patents_in(2024, 8, test::org("Solid Power Inc", "US"));
}

}  // namespace

// ─── Single streams ───────────────────────────────────────────────────────────

TEST(Analyzer, PaperCorpusIsTechnologyTrigger) {
    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const auto papers = test::trigger_papers();
    const auto r = analyzer.analyze_papers(papers);

    EXPECT_EQ(r.snapshot.total_papers, 150);
    EXPECT_EQ(r.verdict.phase, Phase::TechnologyTrigger);
    EXPECT_NEAR(r.verdict.confidence, 0.90, 1e-12);
    for (const char* id : {"early_growth", "basic_research", "low_citations", "academic_venues"}) {
        EXPECT_TRUE(r.verdict.fired(Phase::TechnologyTrigger, id)) << id;
    }
    EXPECT_NEAR(r.verdict.score(Phase::PeakInflatedExpectations), 0.50, 1e-12);
    EXPECT_NEAR(r.verdict.score(Phase::TroughDisillusionment), 0.20, 1e-12);
    EXPECT_NEAR(r.verdict.score(Phase::SlopeEnlightenment), 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(r.verdict.score(Phase::PlateauProductivity), 0.0);
    EXPECT_EQ(r.verdict.rationale.rfind("Phase determined: Technology Trigger", 0), 0u);
}

TEST(Analyzer, PriceCollapseIsTrough) {
    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const auto prices = test::trough_prices();
    const auto r = analyzer.analyze_prices(prices);

    EXPECT_EQ(r.verdict.phase, Phase::TroughDisillusionment);
    EXPECT_NEAR(r.verdict.confidence, 1.0, 1e-9);
    EXPECT_NEAR(r.verdict.score(Phase::TechnologyTrigger), 0.60, 1e-12);
    EXPECT_TRUE(r.verdict.fired(Phase::TechnologyTrigger, "few_tickers"));
    EXPECT_TRUE(r.verdict.fired(Phase::TechnologyTrigger, "thin_volume"));
    EXPECT_TRUE(r.verdict.fired(Phase::TechnologyTrigger, "pre_revenue"));
    EXPECT_TRUE(r.verdict.fired(Phase::SlopeEnlightenment, "calming_volatility"));
    EXPECT_NE(r.verdict.rationale.find("Ticker performance:\n  - SSB: -10.0% return"),
              std::string::npos);
}

// ─── Gates ────────────────────────────────────────────────────────────────────

TEST(Analyzer, PatentsBelowGateThrow) {
    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const auto patents = few_patents();
    try {
        (void)analyzer.analyze_patents(patents);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_STREQ(e.what(), "insufficient patent records: found 8, need at least 10");
    }
}

TEST(Analyzer, PaperGateIsConfigurable) {
    auto papers = test::trigger_papers();
    papers.resize(60);

    const Analyzer strict(AnalysisConfig{}, NOW);
    EXPECT_THROW((void)strict.analyze_papers(papers), InsufficientDataError);

    AnalysisConfig cfg;
    cfg.gates.papers = 50;
    const Analyzer relaxed(cfg, NOW);
    EXPECT_EQ(relaxed.analyze_papers(papers).snapshot.total_papers, 60);
}

TEST(Analyzer, ThresholdsFlowIntoRules) {
    AnalysisConfig cfg;
    cfg.paper_rules.basic_research_high = 95.0;
    const Analyzer analyzer(cfg, NOW);
    const auto papers = test::trigger_papers();
    const auto r = analyzer.analyze_papers(papers);
    EXPECT_FALSE(r.verdict.fired(Phase::TechnologyTrigger, "basic_research"));
    EXPECT_NEAR(r.verdict.score(Phase::TechnologyTrigger), 0.65, 1e-12);
}

// ─── analyze_technology ──────────────────────────────────────────────────────

TEST(Analyzer, TechnologyReportCollectsVerdictsAndShortfalls) {
    TechnologyEvidence evidence;
    evidence.papers  = test::trigger_papers();
    evidence.patents = few_patents();
    evidence.prices  = test::trough_prices();

    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const TechnologyReport report = analyzer.analyze_technology(evidence);

    EXPECT_EQ(report.analysed(), 2u);
    ASSERT_TRUE(report.paper.has_value());
    ASSERT_TRUE(report.finance.has_value());
    EXPECT_FALSE(report.patent.has_value());
    EXPECT_FALSE(report.social.has_value());
    EXPECT_FALSE(report.news.has_value());

    EXPECT_EQ(report.paper->verdict.phase, Phase::TechnologyTrigger);
    EXPECT_EQ(report.finance->verdict.phase, Phase::TroughDisillusionment);

    // Empty streams are not attempted, so only the patent stream falls short.
    ASSERT_EQ(report.shortfalls.size(), 1u);
    EXPECT_EQ(report.shortfalls[0].stream, "patent");
    EXPECT_EQ(report.shortfalls[0].message, "insufficient patent records: found 8, need at least 10");
}

TEST(Analyzer, TechnologyReportMatchesSingleStreamCalls) {
    TechnologyEvidence evidence;
    evidence.papers = test::trigger_papers();
    evidence.prices = test::trough_prices();

    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const auto report = analyzer.analyze_technology(evidence);
    ASSERT_TRUE(report.paper.has_value());
    ASSERT_TRUE(report.finance.has_value());

    const auto paper = analyzer.analyze_papers(evidence.papers);
    const auto prices = analyzer.analyze_prices(evidence.prices);
    EXPECT_EQ(report.paper->snapshot, paper.snapshot);
    EXPECT_EQ(report.paper->verdict, paper.verdict);
    EXPECT_EQ(report.finance->snapshot, prices.snapshot);
    EXPECT_EQ(report.finance->verdict, prices.verdict);
}

TEST(Analyzer, EmptyEvidenceYieldsEmptyReport) {
    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const auto report = analyzer.analyze_technology(TechnologyEvidence{});
    EXPECT_EQ(report.analysed(), 0u);
    EXPECT_TRUE(report.shortfalls.empty());
}

TEST(Analyzer, ShortfallsFollowCanonicalStreamOrder) {
    TechnologyEvidence evidence;
    auto papers = test::trigger_papers();
    papers.resize(5);
    evidence.papers = papers;
    evidence.patents = few_patents();
    evidence.posts = {test::post(at("2026-01-01"), 3, "batteries", "a")};
    evidence.articles = {test::article(at("2026-01-01"), "Reuters", std::nullopt)};
    auto prices = test::trough_prices();
    prices.resize(10);
    evidence.prices = prices;

    const Analyzer analyzer(AnalysisConfig{}, NOW);
    const auto report = analyzer.analyze_technology(evidence);
    EXPECT_EQ(report.analysed(), 0u);
    ASSERT_EQ(report.shortfalls.size(), 5u);
    EXPECT_EQ(report.shortfalls[0].stream, "paper");
    EXPECT_EQ(report.shortfalls[1].stream, "patent");
    EXPECT_EQ(report.shortfalls[2].stream, "social");
    EXPECT_EQ(report.shortfalls[3].stream, "news");
    EXPECT_EQ(report.shortfalls[4].stream, "finance");
    EXPECT_EQ(report.shortfalls[4].message, "insufficient price records: found 10, need at least 20");
}
