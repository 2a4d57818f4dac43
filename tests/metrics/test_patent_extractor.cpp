#include <gtest/gtest.h>
#include "hype/extractors.hpp"

#include "../fixtures.hpp"

#include <string>
#include <vector>

using namespace hype;
using namespace hype::metrics;
using hype::test::at;
using hype::test::org;
using hype::test::patents_in;

namespace {

const std::int64_t NOW = at("2026-06-01");

void append(std::vector<PatentRecord>& out, std::vector<PatentRecord> more) {
    out.insert(out.end(), more.begin(), more.end());
}

/// 2019–2024, a university entering first and two companies joining later.
std::vector<PatentRecord> corpus() {
    std::vector<PatentRecord> out;
    append(out, patents_in(2019, 2, org("Stanford University", "US")));
    append(out, patents_in(2020, 3, org("Stanford University", "US")));
    append(out, patents_in(2021, 4, org("Samsung Electronics Co., Ltd.", "KR")));
    append(out, patents_in(2022, 6, org("Samsung Electronics Co., Ltd.", "KR")));
    append(out, patents_in(2023, 8, org("Toyota Motor Corp", "JP")));
    append(out, patents_in(2024, 7, org("Toyota Motor Corp", "JP")));
    return out;
}

}  // namespace

// ─── Assignee classification ──────────────────────────────────────────────────

TEST(PatentExtractor_Assignee, Classification) {
    using T = PatentExtractor::AssigneeType;
    EXPECT_EQ(PatentExtractor::classify_assignee(org("MIT Research Laboratory", "US")), T::Academic);
    EXPECT_EQ(PatentExtractor::classify_assignee(org("Acme Widgets Inc", "US")), T::Corporate);
    EXPECT_EQ(PatentExtractor::classify_assignee(org("Zyxw", "US")), T::Corporate);
    EXPECT_EQ(PatentExtractor::classify_assignee(Assignee{.first_name = "Ada", .last_name = "Lovelace"}),
              T::Individual);
    EXPECT_EQ(PatentExtractor::classify_assignee(Assignee{}), T::Individual);
}

TEST(PatentExtractor_Assignee, AccentedCapitalsAreAcademic) {
    using T = PatentExtractor::AssigneeType;
    EXPECT_EQ(PatentExtractor::classify_assignee(org("UNIVERSITÀ DEGLI STUDI DI MILANO", "IT")),
              T::Academic);
    EXPECT_EQ(PatentExtractor::classify_assignee(org("TECHNISCHE UNIVERSITÄT MÜNCHEN", "DE")),
              T::Academic);
    EXPECT_EQ(PatentExtractor::classify_assignee(org("Université Paris-Saclay", "FR")),
              T::Academic);
}

TEST(PatentExtractor_Assignee, DisplayName) {
    EXPECT_EQ(PatentExtractor::assignee_name(org("IBM", "US")), "IBM");
    EXPECT_EQ(PatentExtractor::assignee_name(Assignee{.first_name = "Ada", .last_name = "Lovelace"}),
              "Ada Lovelace");
    EXPECT_EQ(PatentExtractor::assignee_name(Assignee{.last_name = "Lovelace"}), "Lovelace");
    EXPECT_EQ(PatentExtractor::assignee_name(Assignee{}), "");
}

// ─── extract ──────────────────────────────────────────────────────────────────

TEST(PatentExtractor_Extract, VelocityAndAge) {
    const auto s = PatentExtractor(NOW).extract(corpus());
    EXPECT_EQ(s.total_patents, 30);
    EXPECT_EQ(s.patent_velocity.size(), 6u);
    EXPECT_EQ(s.peak_year, 2023);
    EXPECT_EQ(s.peak_count, 8);
    EXPECT_EQ(s.velocity_trend, Trend::Increasing);
    EXPECT_DOUBLE_EQ(s.avg_patents_per_year, 5.0);
    EXPECT_DOUBLE_EQ(s.recent_velocity, 7.0);   // only 2024 is within two years of 2026
    EXPECT_EQ(s.first_patent_year, 2019);
    EXPECT_EQ(s.technology_age_years, 7);
    EXPECT_EQ(s.patents_last_year, 0);
    EXPECT_EQ(s.patents_last_2_years, 7);
    EXPECT_EQ(s.years_since_peak(), 1);
}

TEST(PatentExtractor_Extract, Citations) {
    const auto s = PatentExtractor(NOW).extract(corpus());
    EXPECT_EQ(s.total_forward_citations, 30);
    EXPECT_EQ(s.total_backward_citations, 120);
    EXPECT_DOUBLE_EQ(s.avg_forward_citations, 1.0);
    EXPECT_DOUBLE_EQ(s.avg_backward_citations, 4.0);
    EXPECT_DOUBLE_EQ(s.citation_ratio, 0.25);
    EXPECT_EQ(s.highly_cited_count, 0);
}

TEST(PatentExtractor_Extract, MissingCitationsAreNotZero) {
    auto patents = corpus();
    for (auto& p : patents) p.forward_citations.reset();
    patents[0].forward_citations = 9;
    const auto s = PatentExtractor(NOW).extract(patents);
    EXPECT_DOUBLE_EQ(s.avg_forward_citations, 9.0);
    EXPECT_DOUBLE_EQ(s.median_forward_citations, 9.0);
}

TEST(PatentExtractor_Extract, AssigneesAndEntrants) {
    const auto s = PatentExtractor(NOW).extract(corpus());
    EXPECT_EQ(s.unique_assignees, 3);
    ASSERT_FALSE(s.top_assignees.empty());
    EXPECT_EQ(s.top_assignees[0].first, "Toyota Motor Corp");
    EXPECT_EQ(s.top_assignees[0].second, 15);
    EXPECT_NEAR(s.academic_pct, 5.0 / 30.0 * 100.0, 1e-9);
    EXPECT_NEAR(s.corporate_pct, 25.0 / 30.0 * 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(s.individual_pct, 0.0);
    EXPECT_NEAR(s.corporate_pct + s.academic_pct + s.individual_pct, 100.0, 1e-9);

    ASSERT_EQ(s.new_entrants_by_year.size(), 3u);
    EXPECT_EQ(s.new_entrants_by_year.at(2019), 1);
    EXPECT_EQ(s.new_entrants_by_year.at(2021), 1);
    EXPECT_EQ(s.new_entrants_by_year.at(2023), 1);

    const double hhi = (5.0 * 5 + 10.0 * 10 + 15.0 * 15) / (30.0 * 30);
    EXPECT_NEAR(s.assignee_concentration_hhi, hhi, 1e-12);
}

TEST(PatentExtractor_Extract, GeographyAndTypes) {
    auto patents = corpus();
    patents.back().type = "design";
    const auto s = PatentExtractor(NOW).extract(patents);
    EXPECT_EQ(s.unique_countries, 3);
    EXPECT_EQ(s.country_distribution.at("JP"), 15);
    EXPECT_EQ(s.country_distribution.at("US"), 5);
    EXPECT_NEAR(s.utility_pct, 29.0 / 30.0 * 100.0, 1e-9);
    EXPECT_NEAR(s.design_pct, 1.0 / 30.0 * 100.0, 1e-9);
    EXPECT_NEAR(s.other_pct, 0.0, 1e-9);
}

TEST(PatentExtractor_Extract, YearFromGrantDate) {
    auto patents = corpus();
    patents[0].year.reset();
    patents[0].date = "2018-07-04";
    const auto s = PatentExtractor(NOW).extract(patents);
    EXPECT_EQ(s.first_patent_year, 2018);
    EXPECT_EQ(s.patent_velocity.at(2018), 1);
}

TEST(PatentExtractor_Extract, Quality) {
    auto patents = corpus();
    for (int i = 0; i < 6; ++i) patents[static_cast<std::size_t>(i)].abstract.reset();
    const auto s = PatentExtractor(NOW).extract(patents);
    EXPECT_EQ(s.patents_with_abstract, 24);
    EXPECT_DOUBLE_EQ(s.coverage_pct, 80.0);
}

TEST(PatentExtractor_Errors, EightRecordsBelowMinimum) {
    const auto patents = patents_in(2022, 8, org("IBM", "US"));
    try {
        (void)PatentExtractor(NOW).extract(patents);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_EQ(e.found(), 8u);
        EXPECT_EQ(e.required(), 10u);
        EXPECT_NE(std::string(e.what()).find("found 8, need at least 10"), std::string::npos);
    }
}
