/// @file src/metrics/patent_extractor.cpp
/// @brief Patent metrics: velocity, citations, assignees, geography, types, keywords.

#include "hype/calendar.hpp"
#include "hype/extractors.hpp"
#include "hype/toolkit.hpp"

#include "extract_common.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <string_view>
#include <vector>

namespace hype::metrics {

namespace {

constexpr std::array<std::string_view, 25> ACADEMIC_TERMS{
    "university", "università", "universität", "universite", "université", "universidad",
    "college", "institute", "institut", "research", "laboratory", "lab",
    "national", "federal", "government", "hospital", "medical center",
    "school", "academy", "foundation", "council", "center for",
    "centre for", "dept", "department",
};

constexpr std::array<std::string_view, 27> CORPORATE_TERMS{
    "inc", "corp", "corporation", "ltd", "llc", "gmbh", "co.", "company",
    "technologies", "pharmaceuticals", "biotech", "systems", "solutions",
    "industries", "enterprises", "holdings", "group", "limited", "s.a.",
    "ag", "bv", "nv", "plc", "pty", "pvt", "srl", "spa",
};

template <std::size_t N>
bool contains_any(std::string_view text, const std::array<std::string_view, N>& terms) noexcept {
    return std::any_of(terms.begin(), terms.end(), [text](std::string_view t) {
        return text.find(t) != std::string_view::npos;
    });
}

/// Grant year, falling back to the year of the grant date.
std::optional<int> grant_year(const PatentRecord& p) noexcept {
    if (p.year) return p.year;
    if (p.date) {
        if (const auto t = calendar::parse_date(*p.date)) return calendar::year_of(*t);
    }
    return std::nullopt;
}

}  // namespace

// ─── PatentExtractor ──────────────────────────────────────────────────────────

PatentExtractor::PatentExtractor(std::int64_t now_unix, PatentMetricsConfig config,
                                 TrendConfig trend)
    : current_year_(calendar::year_of(now_unix))
    , config_(config)
    , trend_(trend)
{}

std::string PatentExtractor::assignee_name(const Assignee& a) {
    if (detail::present(a.organization)) return *a.organization;
    std::string name = a.first_name.value_or("");
    if (detail::present(a.last_name)) {
        if (!name.empty()) name += ' ';
        name += *a.last_name;
    }
    return name;
}

PatentExtractor::AssigneeType PatentExtractor::classify_assignee(const Assignee& a) {
    const std::string org = detail::lowercase(a.organization.value_or(""));

    if (org.empty() && (detail::present(a.first_name) || detail::present(a.last_name))) {
        return AssigneeType::Individual;
    }
    if (contains_any(org, ACADEMIC_TERMS))  return AssigneeType::Academic;
    if (contains_any(org, CORPORATE_TERMS)) return AssigneeType::Corporate;
    if (!org.empty())                       return AssigneeType::Corporate;
    return AssigneeType::Individual;
}

PatentSnapshot PatentExtractor::extract(std::span<const PatentRecord> patents) const {
    detail::require_records("patent", patents.size(), config_.min_records);

    const auto ordered = detail::chronological(patents, grant_year);
    const auto n = static_cast<double>(patents.size());

    PatentSnapshot s;
    s.total_patents = static_cast<std::int64_t>(patents.size());

    // ── Step 1: Filing velocity ──────────────────────────────────────────────
    auto velocity = toolkit::summarize_velocity(
        toolkit::bucket_counts<int>(patents, grant_year), trend_);
    if (velocity.counts.empty()) {
        throw InsufficientDataError("dated patent", 0, 1);
    }

    s.velocity_trend       = velocity.trend;
    s.avg_patents_per_year = n / static_cast<double>(velocity.counts.size());
    s.peak_year            = velocity.peak_bucket;
    s.peak_count           = velocity.peak_count;
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
    s.patent_velocity = std::move(velocity.counts);

    // ── Step 2: Citations (known counts only) ────────────────────────────────
    {
        std::vector<double> forward;
        std::size_t backward_known = 0;
        for (const auto& p : patents) {
            if (p.forward_citations) {
                forward.push_back(static_cast<double>(*p.forward_citations));
                s.total_forward_citations += *p.forward_citations;
            }
            if (p.backward_citations) {
                ++backward_known;
                s.total_backward_citations += *p.backward_citations;
            }
        }
        if (!forward.empty()) {
            s.avg_forward_citations    = toolkit::mean(forward).value_or(0.0);
            s.median_forward_citations = toolkit::median(forward).value_or(0.0);
            const double threshold = std::max(config_.highly_cited_floor,
                                              toolkit::percentile(forward, 90.0).value_or(0.0));
            s.highly_cited_count = std::count_if(forward.begin(), forward.end(),
                                                 [threshold](double c) { return c >= threshold; });
        }
        if (backward_known > 0) {
            s.avg_backward_citations = static_cast<double>(s.total_backward_citations) /
                                       static_cast<double>(backward_known);
        }
        s.citation_ratio = static_cast<double>(s.total_forward_citations) /
                           static_cast<double>(std::max<std::int64_t>(s.total_backward_citations, 1));
    }

    // ── Step 3: Assignees ────────────────────────────────────────────────────
    {
        toolkit::FrequencyCounter assignees;
        std::map<std::string, int> first_year;
        std::size_t corporate = 0, academic = 0, individual = 0;

        for (const auto* p : ordered) {
            const auto year = grant_year(*p);
            for (const auto& a : p->assignees) {
                const std::string name = assignee_name(a);
                if (name.empty()) continue;
                assignees.add(name);
                if (year && !first_year.contains(name)) {
                    first_year.emplace(name, *year);
                }
                switch (classify_assignee(a)) {
                    case AssigneeType::Corporate:  ++corporate;  break;
                    case AssigneeType::Academic:   ++academic;   break;
                    case AssigneeType::Individual: ++individual; break;
                }
            }
        }

        const auto entries = static_cast<double>(corporate + academic + individual);
        s.corporate_pct  = toolkit::percent(static_cast<double>(corporate), entries);
        s.academic_pct   = toolkit::percent(static_cast<double>(academic), entries);
        s.individual_pct = toolkit::percent(static_cast<double>(individual), entries);

        auto b = toolkit::breakdown(assignees, constants::TOP_CATEGORIES);
        s.unique_assignees           = static_cast<std::int64_t>(b.unique);
        s.top_assignees              = std::move(b.top);
        s.assignee_concentration_hhi = b.hhi;

        for (const auto& [name, year] : first_year) {
            ++s.new_entrants_by_year[year];
        }
    }

    // ── Step 4: Geography ────────────────────────────────────────────────────
    {
        toolkit::FrequencyCounter countries;
        for (const auto& p : patents) {
            for (const auto& a : p.assignees) {
                if (detail::present(a.country)) countries.add(*a.country);
            }
        }
        for (const auto& [country, count] : countries.entries()) {
            s.country_distribution.emplace(country, count);
        }
        auto b = toolkit::breakdown(countries, constants::TOP_CATEGORIES);
        s.unique_countries          = static_cast<std::int64_t>(b.unique);
        s.top_countries             = std::move(b.top);
        s.country_concentration_hhi = b.hhi;
    }

    // ── Step 5: Patent types ─────────────────────────────────────────────────
    {
        std::size_t utility = 0, design = 0;
        for (const auto& p : patents) {
            const std::string type = detail::lowercase(p.type.value_or("unknown"));
            if (type == "utility") ++utility;
            else if (type == "design") ++design;
        }
        s.utility_pct = toolkit::percent(static_cast<double>(utility), n);
        s.design_pct  = toolkit::percent(static_cast<double>(design), n);
        s.other_pct   = 100.0 - s.utility_pct - s.design_pct;
    }

    // ── Step 6: Keywords ─────────────────────────────────────────────────────
    {
        std::vector<std::string> corpus;
        corpus.reserve(ordered.size());
        for (const auto* p : ordered) {
            corpus.push_back(detail::join_text({&p->abstract}, p->title));
        }
        const toolkit::LexicalAnalyzer lexer(toolkit::StopwordProfile::Base,
                                             config_.min_keyword_count);
        s.top_keywords = lexer.top_keywords(corpus);
        auto shift = lexer.emergence(corpus);
        s.emerging_keywords  = std::move(shift.emerging);
        s.declining_keywords = std::move(shift.declining);
    }

    // ── Step 7: Temporal ─────────────────────────────────────────────────────
    s.first_patent_year    = s.patent_velocity.begin()->first;
    s.technology_age_years = current_year_ - s.first_patent_year;
    for (const auto& p : patents) {
        const auto year = grant_year(p);
        if (!year) continue;
        if (*year == current_year_ - 1) ++s.patents_last_year;
        if (*year >= current_year_ - 2) ++s.patents_last_2_years;
    }

    // ── Step 8: Data quality ─────────────────────────────────────────────────
    s.patents_with_abstract = std::count_if(patents.begin(), patents.end(),
        [](const PatentRecord& p) { return detail::present(p.abstract); });
    s.coverage_pct = toolkit::percent(static_cast<double>(s.patents_with_abstract), n);

    return s;
}

}  // namespace hype::metrics

namespace hype {

int PatentSnapshot::years_since_peak() const noexcept {
    if (patent_velocity.empty()) return 0;
    return patent_velocity.rbegin()->first - peak_year;
}

}  // namespace hype
