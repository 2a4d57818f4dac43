/// @file src/metrics/social_extractor.cpp
/// @brief Discussion metrics: monthly velocity, engagement, communities, authors.

#include "hype/calendar.hpp"
#include "hype/extractors.hpp"
#include "hype/toolkit.hpp"

#include "extract_common.hpp"

#include <algorithm>
#include <vector>

namespace hype::metrics {

namespace {

std::optional<std::int64_t> created(const SocialPost& p) noexcept { return p.created_utc; }

std::optional<std::string> month_of(const SocialPost& p) {
    if (!p.created_utc) return std::nullopt;
    return calendar::month_key(*p.created_utc);
}

Trend engagement_shift(std::span<const double> scores, const SocialMetricsConfig& cfg) noexcept {
    const std::size_t mid = scores.size() / 2;
    if (mid == 0) return Trend::InsufficientData;

    const double first  = toolkit::mean(scores.first(mid)).value_or(0.0);
    const double second = toolkit::mean(scores.subspan(mid)).value_or(0.0);
    if (second > first * cfg.engagement_growth)  return Trend::Increasing;
    if (second < first * cfg.engagement_decline) return Trend::Decreasing;
    return Trend::Stable;
}

}  // namespace

// ─── SocialExtractor ──────────────────────────────────────────────────────────

SocialExtractor::SocialExtractor(std::int64_t now_unix, SocialMetricsConfig config,
                                 TrendConfig trend)
    : now_(now_unix)
    , config_(config)
    , trend_(trend)
{}

SocialSnapshot SocialExtractor::extract(std::span<const SocialPost> posts) const {
    detail::require_records("social", posts.size(), config_.min_records);

    const auto ordered = detail::chronological(posts, created);
    const auto n = static_cast<double>(posts.size());

    SocialSnapshot s;
    s.total_posts = static_cast<std::int64_t>(posts.size());

    // ── Step 1: Monthly velocity ─────────────────────────────────────────────
    auto velocity = toolkit::summarize_velocity(
        toolkit::bucket_counts<std::string>(posts, month_of),
        trend_);
    if (velocity.counts.empty()) {
        throw InsufficientDataError("timestamped social", 0, 1);
    }

    s.velocity_trend      = velocity.trend;
    s.avg_posts_per_month = n / static_cast<double>(velocity.counts.size());
    s.peak_month          = velocity.peak_bucket;
    s.peak_count          = velocity.peak_count;
    s.recent_velocity     = velocity.tail_average(trend_.window);
    s.post_velocity       = std::move(velocity.counts);

    // ── Step 2: Engagement ───────────────────────────────────────────────────
    {
        std::vector<double> scores;
        std::vector<double> comments;
        for (const auto& p : posts) {
            if (p.score) {
                scores.push_back(static_cast<double>(*p.score));
                s.total_score += *p.score;
            }
            if (p.num_comments) {
                comments.push_back(static_cast<double>(*p.num_comments));
                s.total_comments += *p.num_comments;
            }
        }
        if (scores.empty())   scores.push_back(0.0);
        if (comments.empty()) comments.push_back(0.0);

        s.avg_score_per_post    = toolkit::mean(scores).value_or(0.0);
        s.median_score          = toolkit::median(scores).value_or(0.0);
        s.avg_comments_per_post = toolkit::mean(comments).value_or(0.0);
        s.median_comments       = toolkit::median(comments).value_or(0.0);

        const double threshold = scores.size() > 1
            ? std::max(config_.highly_engaged_floor, toolkit::percentile(scores, 90.0).value_or(0.0))
            : config_.highly_engaged_floor;
        s.highly_engaged_count = std::count_if(scores.begin(), scores.end(),
                                               [threshold](double x) { return x >= threshold; });

        std::vector<double> in_order;
        in_order.reserve(ordered.size());
        for (const auto* p : ordered) {
            in_order.push_back(static_cast<double>(p->score.value_or(0)));
        }
        s.engagement_trend = engagement_shift(in_order, config_);
    }

    // ── Step 3: Communities & authors ────────────────────────────────────────
    {
        toolkit::FrequencyCounter subreddits;
        toolkit::FrequencyCounter authors;
        for (const auto& p : posts) {
            subreddits.add(detail::present(p.subreddit) ? *p.subreddit : "unknown");
            authors.add(detail::present(p.author) ? *p.author : "[deleted]");
        }

        auto subs = toolkit::breakdown(subreddits, constants::TOP_CATEGORIES);
        s.unique_subreddits           = static_cast<std::int64_t>(subs.unique);
        s.top_subreddits              = std::move(subs.top);
        s.subreddit_concentration_hhi = subs.hhi;

        auto who = toolkit::breakdown(authors, constants::TOP_CATEGORIES);
        s.unique_authors           = static_cast<std::int64_t>(who.unique);
        s.top_authors              = std::move(who.top);
        s.author_concentration_hhi = who.hhi;
    }

    // ── Step 4: Post types ───────────────────────────────────────────────────
    {
        const auto self_posts = std::count_if(posts.begin(), posts.end(),
            [](const SocialPost& p) { return p.is_self == true; });
        const auto link_posts = std::count_if(posts.begin(), posts.end(),
            [](const SocialPost& p) { return p.is_self == false; });
        s.self_post_pct = toolkit::percent(static_cast<double>(self_posts), n);
        s.link_post_pct = toolkit::percent(static_cast<double>(link_posts), n);
    }

    // ── Step 5: Keywords ─────────────────────────────────────────────────────
    {
        std::vector<std::string> all_text;
        std::vector<std::string> corpus;
        corpus.reserve(ordered.size());
        for (const auto* p : ordered) {
            if (!p->title.empty())     all_text.push_back(p->title);
            if (detail::present(p->body)) all_text.push_back(*p->body);
            corpus.push_back(detail::join_text({&p->body}, p->title));
        }
        const toolkit::LexicalAnalyzer lexer(toolkit::StopwordProfile::Social,
                                             config_.min_keyword_count);
        s.top_keywords = lexer.top_keywords(all_text);
        auto shift = lexer.emergence(corpus);
        s.emerging_keywords  = std::move(shift.emerging);
        s.declining_keywords = std::move(shift.declining);
    }

    // ── Step 6: Temporal comparison ──────────────────────────────────────────
    {
        std::vector<std::int64_t> stamps;
        for (const auto& p : posts) {
            if (p.created_utc) stamps.push_back(*p.created_utc);
        }
        const std::int64_t first = *std::min_element(stamps.begin(), stamps.end());
        const std::int64_t month_ago   = now_ - constants::LAST_MONTH_DAYS * constants::SECONDS_PER_DAY;
        const std::int64_t quarter_ago = now_ - constants::LAST_QUARTER_DAYS * constants::SECONDS_PER_DAY;
        const std::int64_t first_quarter_end =
            first + constants::LAST_QUARTER_DAYS * constants::SECONDS_PER_DAY;

        s.first_post_date = calendar::format_date(first);
        for (const auto t : stamps) {
            if (t >= month_ago)          ++s.posts_last_month;
            if (t >= quarter_ago)        ++s.posts_last_3_months;
            if (t <= first_quarter_end)  ++s.posts_first_3_months;
        }
        s.growth_rate_early_vs_late = detail::growth_pct(
            static_cast<double>(s.posts_first_3_months),
            static_cast<double>(s.posts_last_3_months));
    }

    // ── Step 7: Data quality ─────────────────────────────────────────────────
    s.posts_with_body = std::count_if(posts.begin(), posts.end(),
        [](const SocialPost& p) { return detail::present(p.body); });
    s.coverage_pct = toolkit::percent(static_cast<double>(s.posts_with_body), n);

    return s;
}

}  // namespace hype::metrics
