/// @file src/metrics/paper_extractor.cpp
/// @brief Publication metrics: velocity, citations, research type, venues.

#include "hype/calendar.hpp"
#include "hype/extractors.hpp"
#include "hype/toolkit.hpp"

#include "extract_common.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <map>
#include <string_view>
#include <vector>

namespace hype::metrics {

namespace {

constexpr std::array<std::string_view, 30> BASIC_SCIENCE_TERMS{
    "mechanism", "pathway", "fundamental", "theoretical", "discovery", "novel",
    "characterization", "identification", "isolation", "purification",
    "analysis of", "role of", "function of", "expression of", "regulation of",
    "molecular", "cellular", "biochemical", "genetics", "genomics", "proteomics",
    "metabolomics", "in vitro", "model system", "structure", "evolution",
    "phylogeny", "diversity", "morphology", "physiology",
};

constexpr std::array<std::string_view, 31> APPLIED_RESEARCH_TERMS{
    "application", "production", "optimization", "yield", "efficiency",
    "commercial", "industrial", "scalable", "scale-up", "process", "manufacturing",
    "product", "development", "implementation", "protocol", "method",
    "therapeutic", "treatment", "drug", "bioactive", "functional food",
    "bioreactor", "cultivation", "cost-effective", "sustainable production",
    "market", "industry", "economic", "practical", "clinical", "pilot scale",
};

constexpr std::array<std::string_view, 5> CONFERENCE_TERMS{
    "conference", "symposium", "workshop", "proceedings", "meeting",
};

constexpr std::array<std::string_view, 5> INDUSTRY_TERMS{
    "industrial", "applied", "engineering", "technology", "biotechnology",
};

template <std::size_t N>
std::size_t matches(std::string_view text, const std::array<std::string_view, N>& terms) noexcept {
    std::size_t n = 0;
    for (const auto term : terms) {
        if (text.find(term) != std::string_view::npos) ++n;
    }
    return n;
}

template <std::size_t N>
bool any_match(std::string_view text, const std::array<std::string_view, N>& terms) noexcept {
    return matches(text, terms) > 0;
}

}  // namespace

// ─── PaperExtractor ───────────────────────────────────────────────────────────

PaperExtractor::PaperExtractor(std::int64_t now_unix, PaperMetricsConfig config,
                               TrendConfig trend)
    : current_year_(calendar::year_of(now_unix))
    , config_(config)
    , trend_(trend)
{}

PaperExtractor::ResearchType PaperExtractor::classify_research(const PaperRecord& paper) {
    const std::string text = detail::lowercase(
        detail::join_text({&paper.abstract}, paper.title));

    const auto basic   = matches(text, BASIC_SCIENCE_TERMS);
    const auto applied = matches(text, APPLIED_RESEARCH_TERMS);

    if (basic > applied * 2) return ResearchType::Basic;
    if (applied > basic * 2) return ResearchType::Applied;
    return ResearchType::Mixed;
}

PaperSnapshot PaperExtractor::extract(std::span<const PaperRecord> papers) const {
    detail::require_records("paper", papers.size(), config_.min_records);

    const auto ordered = detail::chronological(papers, [](const PaperRecord& p) { return p.year; });
    const auto n = static_cast<double>(papers.size());

    PaperSnapshot s;
    s.total_papers = static_cast<std::int64_t>(papers.size());

    // ── Step 1: Publication velocity ─────────────────────────────────────────
    auto velocity = toolkit::summarize_velocity(
        toolkit::bucket_counts<int>(papers, [](const PaperRecord& p) { return p.year; }),
        trend_);
    if (velocity.counts.empty()) {
        throw InsufficientDataError("dated paper", 0, 1);
    }

    s.velocity_trend      = velocity.trend;
    s.avg_papers_per_year = n / static_cast<double>(velocity.counts.size());
    s.peak_year           = velocity.peak_bucket;
    s.peak_count          = velocity.peak_count;
    {
        std::int64_t recent = 0;
        std::size_t  years  = 0;
        for (const auto& [year, count] : velocity.counts) {
            if (year >= current_year_ - 2) {
                recent += count;
                ++years;
            }
        }
        s.recent_velocity = static_cast<double>(recent) / static_cast<double>(std::max<std::size_t>(years, 1));
    }
    s.publication_velocity = std::move(velocity.counts);

    // ── Step 2: Citations ────────────────────────────────────────────────────
    std::vector<double> citations;
    std::map<int, std::vector<double>> citations_by_year;
    for (const auto& p : papers) {
        if (!p.citation_count) continue;
        citations.push_back(static_cast<double>(*p.citation_count));
        s.total_citations += *p.citation_count;
        if (p.year) {
            citations_by_year[*p.year].push_back(static_cast<double>(*p.citation_count));
        }
    }
    if (!citations.empty()) {
        s.avg_citations_per_paper = toolkit::mean(citations).value_or(0.0);
        s.median_citations        = toolkit::median(citations).value_or(0.0);
        const double threshold = std::max(config_.highly_cited_floor,
                                          toolkit::percentile(citations, 90.0).value_or(0.0));
        s.highly_cited_count = std::count_if(citations.begin(), citations.end(),
                                             [threshold](double c) { return c >= threshold; });
    }
    if (citations_by_year.size() >= 2) {
        auto last = citations_by_year.rbegin();
        const double recent  = toolkit::mean(last->second).value_or(0.0);
        const double earlier = toolkit::mean(std::next(last)->second).value_or(0.0);
        s.citation_growth_rate = (recent - earlier) / std::max(earlier, 1.0) * 100.0;
    }

    // ── Step 3: Research type ────────────────────────────────────────────────
    std::vector<ResearchType> types;
    types.reserve(ordered.size());
    std::size_t basic = 0, applied = 0, mixed = 0;
    for (const auto* p : ordered) {
        const auto t = classify_research(*p);
        types.push_back(t);
        switch (t) {
            case ResearchType::Basic:   ++basic;   break;
            case ResearchType::Applied: ++applied; break;
            case ResearchType::Mixed:   ++mixed;   break;
        }
    }
    s.basic_research_pct   = toolkit::percent(static_cast<double>(basic), n);
    s.applied_research_pct = toolkit::percent(static_cast<double>(applied), n);
    s.mixed_research_pct   = toolkit::percent(static_cast<double>(mixed), n);
    {
        const std::size_t mid = types.size() / 2;
        const auto applied_share = [&](std::size_t from, std::size_t to) {
            const auto k = std::count(types.begin() + static_cast<std::ptrdiff_t>(from),
                                      types.begin() + static_cast<std::ptrdiff_t>(to),
                                      ResearchType::Applied);
            return toolkit::percent(static_cast<double>(k), static_cast<double>(to - from));
        };
        const double first  = applied_share(0, mid);
        const double second = applied_share(mid, types.size());
        if (second > first + config_.drift_points) {
            s.research_type_trend = ResearchDrift::TowardApplied;
        } else if (second < first - config_.drift_points) {
            s.research_type_trend = ResearchDrift::TowardBasic;
        } else {
            s.research_type_trend = ResearchDrift::Stable;
        }
    }

    // ── Step 4: Keywords ─────────────────────────────────────────────────────
    {
        std::vector<std::string> all_text;
        std::vector<std::string> corpus;
        corpus.reserve(ordered.size());
        for (const auto* p : ordered) {
            if (detail::present(p->abstract)) all_text.push_back(*p->abstract);
            if (!p->title.empty()) all_text.push_back(p->title);
            corpus.push_back(detail::join_text({&p->abstract}, p->title));
        }
        const toolkit::LexicalAnalyzer lexer(toolkit::StopwordProfile::Base,
                                             config_.min_keyword_count);
        s.top_keywords = lexer.top_keywords(all_text);
        auto shift = lexer.emergence(corpus);
        s.emerging_keywords  = std::move(shift.emerging);
        s.declining_keywords = std::move(shift.declining);
    }

    // ── Step 5: Venues ───────────────────────────────────────────────────────
    {
        std::size_t conference = 0, industry = 0;
        toolkit::FrequencyCounter venues;
        for (const auto& p : papers) {
            const std::string venue = detail::lowercase(p.venue.value_or(""));
            if (any_match(venue, CONFERENCE_TERMS)) ++conference;
            if (any_match(venue, INDUSTRY_TERMS)) ++industry;
            if (detail::non_blank(p.venue)) venues.add(*p.venue);
        }
        s.conference_pct     = toolkit::percent(static_cast<double>(conference), n);
        s.journal_pct        = 100.0 - s.conference_pct;
        s.industry_venue_pct = toolkit::percent(static_cast<double>(industry), n);
        s.academic_venue_pct = 100.0 - s.industry_venue_pct;

        auto b = toolkit::breakdown(venues, constants::TOP_CATEGORIES);
        s.top_venues              = std::move(b.top);
        s.venue_concentration_hhi = b.hhi;
    }

    // ── Step 6: Temporal comparison ──────────────────────────────────────────
    {
        const int earliest = s.publication_velocity.begin()->first;
        for (const auto& p : papers) {
            if (!p.year) continue;
            if (*p.year == current_year_ - 1) ++s.papers_last_year;
            if (*p.year >= current_year_ - 2) ++s.papers_last_2_years;
            if (*p.year <= earliest + 2)      ++s.papers_first_2_years;
        }
        s.growth_rate_early_vs_late = detail::growth_pct(
            static_cast<double>(s.papers_first_2_years),
            static_cast<double>(s.papers_last_2_years));
    }

    // ── Step 7: Data quality ─────────────────────────────────────────────────
    for (const auto& p : papers) {
        if (detail::present(p.abstract))        ++s.papers_with_abstracts;
        if (detail::present(p.open_access_pdf)) ++s.papers_with_pdf;
    }
    s.coverage_pct = toolkit::percent(
        static_cast<double>(s.papers_with_abstracts + s.papers_with_pdf), 2.0 * n);

    return s;
}

}  // namespace hype::metrics

namespace hype {

int PaperSnapshot::years_since_peak() const noexcept {
    if (publication_velocity.empty()) return 0;
    return publication_velocity.rbegin()->first - peak_year;
}

}  // namespace hype
